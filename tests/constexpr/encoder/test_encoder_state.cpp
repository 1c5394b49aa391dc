#include <YamlFusion/encoder_state.hpp>

using namespace YamlFusion::encoder_state;

// ============================================================================
// Mapping begin
// ============================================================================

static_assert([] {
    EncoderStateMachine sm;
    return sm.on_map_begin(false) == MapBeginAction::EmitNow
        && sm.is<NothingInParticular>();
}());

static_assert([] {
    EncoderStateMachine sm;
    return sm.on_map_begin(true) == MapBeginAction::Defer
        && sm.is<CheckForTag>()
        && sm.checking_for_tag();
}());

// A one-entry mapping under a pending variant name starts at once and consumes the tag
static_assert([] {
    EncoderStateMachine sm;
    if(sm.claim_variant("Outer") != TagClaim::Accepted) return false;
    if(sm.on_map_begin(true) != MapBeginAction::EmitNowAndGuardDuplicate) return false;
    if(sm.take_tag() != "!Outer") return false;
    sm.guard_duplicate_tag();
    return sm.is<CheckForDuplicateTag>() && sm.checking_for_tag();
}());

// ============================================================================
// Tags
// ============================================================================

static_assert([] {
    EncoderStateMachine sm;
    if(sm.claim_variant("A") != TagClaim::Accepted) return false;
    return sm.claim_variant("B") == TagClaim::NestedTag;
}());

static_assert([] {
    EncoderStateMachine sm;
    sm.claim_variant("Newtype");
    auto tag = sm.take_tag();
    return tag == "!Newtype" && sm.is<NothingInParticular>() && !sm.take_tag().has_value();
}());

// Names that already carry the marker are not doubled
static_assert([] {
    EncoderStateMachine sm;
    sm.claim_variant("!local");
    return sm.take_tag() == "!local";
}());

static_assert([] {
    EncoderStateMachine sm;
    return sm.claim_display_tag("X") == TagClaim::NotATag && sm.is<NothingInParticular>();
}());

static_assert([] {
    EncoderStateMachine sm;
    sm.on_map_begin(true);
    return sm.claim_display_tag("X") == TagClaim::Accepted && sm.found_tag();
}());

static_assert([] {
    EncoderStateMachine sm;
    sm.guard_duplicate_tag();
    return sm.claim_display_tag("X") == TagClaim::NestedTag;
}());

// ============================================================================
// Flushing and mapping end
// ============================================================================

static_assert([] {
    EncoderStateMachine sm;
    sm.on_map_begin(true);
    return sm.flush_mapping_start() && sm.is<NothingInParticular>() && !sm.flush_mapping_start();
}());

static_assert([] {
    EncoderStateMachine sm;
    sm.guard_duplicate_tag();
    return !sm.flush_mapping_start() && sm.is<NothingInParticular>();
}());

// Empty one-entry mapping: the held-back start goes out together with the end
static_assert([] {
    EncoderStateMachine sm;
    sm.on_map_begin(true);
    auto action = sm.on_map_end(false);
    return action.emit_deferred_start && action.emit_end && sm.is<NothingInParticular>();
}());

// The key became a tag: nothing to close
static_assert([] {
    EncoderStateMachine sm;
    sm.on_map_begin(true);
    sm.claim_display_tag("T");
    sm.take_tag();
    auto action = sm.on_map_end(true);
    return !action.emit_deferred_start && !action.emit_end && sm.is<NothingInParticular>();
}());

static_assert([] {
    EncoderStateMachine sm;
    auto action = sm.on_map_end(false);
    return !action.emit_deferred_start && action.emit_end;
}());
