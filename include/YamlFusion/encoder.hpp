#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include "errors.hpp"
#include "events.hpp"
#include "number.hpp"
#include "scalar_style.hpp"
#include "document_bracket.hpp"
#include "encoder_state.hpp"

namespace YamlFusion {

struct EncoderConfig {
    // Unit variants become an empty scalar tagged `!Variant` instead of the bare name
    bool tag_unit_variants = false;
};

/*
 * Turns the writer protocol used by the serializer into YAML events.
 *
 * Enum variants are written as tags on their payload (`!Variant payload`). A one-entry
 * map is held back until its key is known, because a key displayed as `!Name` is a
 * tag for the single value, not a key.
 */
template<sink::EventSinkLike Sink>
class YamlEncoder {
public:
    using error_type = EncodeError;
    using sink_type = Sink;

    struct ArrayFrame {};
    struct MapFrame {
        bool is_struct = false;
        bool value_tagged = false;
    };
    struct VariantFrame {};

    constexpr explicit YamlEncoder(Sink s = Sink{}, EncoderConfig config = {}) :
        sink_(std::move(s)), config_(config)
    {}

    constexpr error_type getError() const {
        return err_;
    }
    constexpr typename Sink::error_type sinkError() const {
        return sink_.getError();
    }
    constexpr Sink & sink() {
        return sink_;
    }
    constexpr const Sink & sink() const {
        return sink_;
    }
    constexpr const EncoderConfig & config() const {
        return config_;
    }
    constexpr const encoder_state::EncoderStateMachine & state() const {
        return state_;
    }

    constexpr bool write_null() {
        return emit_scalar("null", ScalarStyle::Plain);
    }

    constexpr bool write_bool(bool b) {
        return emit_scalar(b ? "true" : "false", ScalarStyle::Plain);
    }

    // A float is written at its own precision: 0.1f is `0.1`
    template<class NumberT>
    constexpr bool write_number(const NumberT & v) {
        number_details::FormatBuffer buf{};
        std::size_t len = 0;
        if constexpr (std::is_same_v<NumberT, float>) {
            len = number_details::format_floating(v, buf.data());
        } else {
            len = Number(v).format(buf);
        }
        if(len == 0) {
            return fail(EncodeError::EMITTER_ERROR);
        }
        return emit_scalar(std::string_view(buf.data(), len), ScalarStyle::Plain);
    }

    constexpr bool write_char(char c) {
        return emit_scalar(std::string_view(&c, 1), ScalarStyle::SingleQuoted);
    }

    constexpr bool write_string(const char * data, std::size_t size, bool null_terminated = false) {
        std::string_view text(data, size);
        if(null_terminated) {
            text = text.substr(0, text.find('\0'));
        }
        return emit_scalar(text, classify_string_style(text));
    }

    // A `!Name` display in the key slot of a held-back one-entry map becomes the tag of its value
    constexpr bool write_display(std::string_view text) {
        if(!ensure_ok()) return false;
        if(state_.checking_for_tag()) {
            if(auto name = scalar::tag_name_of(text)) {
                switch(state_.claim_display_tag(*name)) {
                case encoder_state::TagClaim::Accepted: return true;
                case encoder_state::TagClaim::NestedTag: return fail(EncodeError::NESTED_ENUM_TAG);
                case encoder_state::TagClaim::NotATag: break;
                }
            }
        }
        return write_string(text.data(), text.size());
    }

    constexpr bool write_bytes(const std::uint8_t *, std::size_t) {
        return fail(EncodeError::UNSUPPORTED_CONSTRUCT);
    }

    constexpr bool write_unit_variant(std::string_view name) {
        if(!config_.tag_unit_variants) {
            return write_string(name.data(), name.size());
        }
        if(!claim_variant(name)) return false;
        return emit_scalar("", ScalarStyle::Plain);
    }

    constexpr bool write_variant_begin(std::string_view name, VariantFrame &) {
        return claim_variant(name);
    }

    constexpr bool write_variant_end(VariantFrame &) {
        return ensure_ok();
    }

    constexpr bool write_array_begin(const std::size_t &, ArrayFrame &) {
        return emit_sequence_start();
    }

    constexpr bool advance_after_value(ArrayFrame &) {
        return ensure_ok();
    }

    constexpr bool write_array_end(ArrayFrame &) {
        return emit_sequence_end();
    }

    constexpr bool write_map_begin(const std::size_t & size, MapFrame &) {
        if(!ensure_ok()) return false;
        switch(state_.on_map_begin(size == 1)) {
        case encoder_state::MapBeginAction::EmitNow:
            return emit_mapping_start();
        case encoder_state::MapBeginAction::EmitNowAndGuardDuplicate:
            if(!emit_mapping_start()) return false;
            state_.guard_duplicate_tag();
            return true;
        case encoder_state::MapBeginAction::Defer:
            return true;
        }
        return fail(EncodeError::INVALID_STATE);
    }

    constexpr bool write_struct_begin(const std::size_t &, MapFrame & fr) {
        fr.is_struct = true;
        return emit_mapping_start();
    }

    constexpr bool move_to_value(MapFrame & fr) {
        if(!ensure_ok()) return false;
        fr.value_tagged = state_.found_tag();
        return true;
    }

    constexpr bool advance_after_value(MapFrame &) {
        return ensure_ok();
    }

    constexpr bool write_map_end(MapFrame & fr) {
        if(!ensure_ok()) return false;
        if(fr.is_struct) {
            return emit_mapping_end();
        }
        const auto action = state_.on_map_end(fr.value_tagged);
        if(action.emit_deferred_start) {
            if(!emit_mapping_start()) return false;
        }
        if(action.emit_end) {
            return emit_mapping_end();
        }
        return true;
    }

    // Closes the stream; every opened value must have been closed
    constexpr bool finish() {
        if(!ensure_ok()) return false;
        if(bracket_.depth() != 0 || !state_.is<encoder_state::NothingInParticular>()) {
            return fail(EncodeError::INVALID_STATE);
        }
        if(!ensure_stream_started()) return false;
        if(stream_ended_) return true;
        stream_ended_ = true;
        return emit(Event{EventKind::StreamEnd});
    }

private:
    constexpr bool fail(EncodeError e) {
        if(err_ == EncodeError::NO_ERROR) {
            err_ = e;
        }
        return false;
    }

    constexpr bool ensure_ok() const {
        return err_ == EncodeError::NO_ERROR;
    }

    constexpr bool emit(const Event & ev) {
        if(!sink_.emit(ev)) {
            return fail(EncodeError::EMITTER_ERROR);
        }
        return true;
    }

    constexpr bool ensure_stream_started() {
        if(stream_started_) return true;
        if(stream_ended_) return fail(EncodeError::INVALID_STATE);
        stream_started_ = true;
        return emit(Event{EventKind::StreamStart});
    }

    constexpr bool value_start() {
        if(!ensure_stream_started()) return false;
        if(!bracket_.value_start(sink_)) {
            return fail(EncodeError::EMITTER_ERROR);
        }
        return true;
    }

    constexpr bool value_end() {
        if(!bracket_.value_end(sink_)) {
            return fail(EncodeError::EMITTER_ERROR);
        }
        return true;
    }

    constexpr bool claim_variant(std::string_view name) {
        if(!ensure_ok()) return false;
        if(state_.claim_variant(name) == encoder_state::TagClaim::NestedTag) {
            return fail(EncodeError::NESTED_ENUM_TAG);
        }
        return true;
    }

    constexpr bool flush_mapping_start() {
        if(state_.flush_mapping_start()) {
            return emit_mapping_start();
        }
        return true;
    }

    constexpr bool emit_scalar(std::string_view text, ScalarStyle style) {
        if(!ensure_ok()) return false;
        if(!flush_mapping_start()) return false;
        const std::optional<std::string> tag = state_.take_tag();
        if(!value_start()) return false;
        if(!emit(Event::scalar(text, style, tag ? std::string_view(*tag) : std::string_view{}))) return false;
        return value_end();
    }

    constexpr bool emit_sequence_start() {
        if(!ensure_ok()) return false;
        if(!flush_mapping_start()) return false;
        if(!value_start()) return false;
        const std::optional<std::string> tag = state_.take_tag();
        return emit(Event::sequence_start(tag ? std::string_view(*tag) : std::string_view{}));
    }

    constexpr bool emit_sequence_end() {
        if(!ensure_ok()) return false;
        if(!emit(Event{EventKind::SequenceEnd})) return false;
        return value_end();
    }

    constexpr bool emit_mapping_start() {
        if(!ensure_ok()) return false;
        if(!flush_mapping_start()) return false;
        if(!value_start()) return false;
        const std::optional<std::string> tag = state_.take_tag();
        return emit(Event::mapping_start(tag ? std::string_view(*tag) : std::string_view{}));
    }

    constexpr bool emit_mapping_end() {
        if(!ensure_ok()) return false;
        if(!emit(Event{EventKind::MappingEnd})) return false;
        return value_end();
    }

    Sink sink_;
    EncoderConfig config_;
    DocumentBracket bracket_;
    encoder_state::EncoderStateMachine state_;
    EncodeError err_ = EncodeError::NO_ERROR;
    bool stream_started_ = false;
    bool stream_ended_ = false;
};

} // namespace YamlFusion
