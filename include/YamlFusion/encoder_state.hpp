#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

namespace YamlFusion {

namespace encoder_state {

// No pending decision
struct NothingInParticular {};
// A one-entry mapping was started but not emitted yet: its key may turn out to be a tag
struct CheckForTag {};
// A one-entry mapping was emitted while a tag was pending; a second tag is an error
struct CheckForDuplicateTag {};
// A variant name waits to be attached to the next emitted node
struct FoundTag {
    std::string name;
};
// The deferred mapping was consumed as a tag, so its end must not be emitted
struct AlreadyTagged {};

using State = std::variant<NothingInParticular, CheckForTag, CheckForDuplicateTag, FoundTag, AlreadyTagged>;

enum class MapBeginAction {
    EmitNow,                   // emit the mapping start immediately
    EmitNowAndGuardDuplicate,  // emit it (consuming the pending tag), then watch for a second tag
    Defer                      // hold it back until the first key shows what it is
};

struct MapEndAction {
    bool emit_deferred_start;
    bool emit_end;
};

enum class TagClaim {
    Accepted,
    NestedTag,   // another tag is already pending
    NotATag      // not in a state that looks for tags
};

// Tracks whether a one-entry mapping is a real mapping or the carrier of a tag
// (`{"!Variant": payload}` written through a display key).
class EncoderStateMachine {
public:
    constexpr const State & state() const {
        return state_;
    }

    template<class S>
    constexpr bool is() const {
        return std::holds_alternative<S>(state_);
    }

    constexpr MapBeginAction on_map_begin(bool single_entry) {
        if(!single_entry) {
            return MapBeginAction::EmitNow;
        }
        if(is<FoundTag>()) {
            return MapBeginAction::EmitNowAndGuardDuplicate;
        }
        state_ = CheckForTag{};
        return MapBeginAction::Defer;
    }

    // Called by the encoder after emitting the start of a duplicate-guarded mapping
    constexpr void guard_duplicate_tag() {
        state_ = CheckForDuplicateTag{};
    }

    // Before anything but a tag candidate is emitted: returns true if the deferred
    // mapping start must go out first
    constexpr bool flush_mapping_start() {
        if(is<CheckForTag>()) {
            state_ = NothingInParticular{};
            return true;
        }
        if(is<CheckForDuplicateTag>()) {
            state_ = NothingInParticular{};
        }
        return false;
    }

    // Pending variant name as a `!Name` tag; the state returns to NothingInParticular
    constexpr std::optional<std::string> take_tag() {
        if(auto * found = std::get_if<FoundTag>(&state_)) {
            std::string tag = std::move(found->name);
            state_ = NothingInParticular{};
            if(!tag.starts_with('!')) {
                tag.insert(tag.begin(), '!');
            }
            return tag;
        }
        return std::nullopt;
    }

    // A variant is about to be written with the given name
    constexpr TagClaim claim_variant(std::string_view name) {
        if(is<FoundTag>()) {
            return TagClaim::NestedTag;
        }
        state_ = FoundTag{std::string(name)};
        return TagClaim::Accepted;
    }

    constexpr bool checking_for_tag() const {
        return is<CheckForTag>() || is<CheckForDuplicateTag>();
    }

    // The first key of a deferred mapping was displayed as `!name`
    constexpr TagClaim claim_display_tag(std::string_view name) {
        if(is<CheckForDuplicateTag>()) {
            return TagClaim::NestedTag;
        }
        if(!is<CheckForTag>()) {
            return TagClaim::NotATag;
        }
        state_ = FoundTag{std::string(name)};
        return TagClaim::Accepted;
    }

    constexpr bool found_tag() const {
        return is<FoundTag>();
    }

    // value_was_tagged: the single value was written right after its key became a tag
    constexpr MapEndAction on_map_end(bool value_was_tagged) {
        if(value_was_tagged) {
            state_ = AlreadyTagged{};
        }
        MapEndAction action{is<CheckForTag>(), !is<AlreadyTagged>()};
        state_ = NothingInParticular{};
        return action;
    }

private:
    State state_ = NothingInParticular{};
};

} // namespace encoder_state

} // namespace YamlFusion
