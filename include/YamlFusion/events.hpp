#pragma once

#include <concepts>
#include <string>
#include <string_view>
#include <vector>

#include "scalar_style.hpp"

namespace YamlFusion {

enum class EventKind {
    StreamStart,
    StreamEnd,
    DocumentStart,
    DocumentEnd,
    Scalar,
    SequenceStart,
    SequenceEnd,
    MappingStart,
    MappingEnd
};

// One YAML event. Strings are borrowed for the duration of the emit() call only.
// An empty tag means untagged; a present tag always starts with '!'.
struct Event {
    EventKind kind;
    std::string_view tag{};
    std::string_view value{};
    ScalarStyle style = ScalarStyle::Plain;

    static constexpr Event scalar(std::string_view value, ScalarStyle style, std::string_view tag = {}) {
        return Event{EventKind::Scalar, tag, value, style};
    }
    static constexpr Event sequence_start(std::string_view tag = {}) {
        return Event{EventKind::SequenceStart, tag};
    }
    static constexpr Event mapping_start(std::string_view tag = {}) {
        return Event{EventKind::MappingStart, tag};
    }
};

namespace sink {

template<typename S>
concept EventSinkLike = requires(S& s, const S& cs, const Event& ev) {
    typename S::error_type;
    { s.emit(ev) } -> std::same_as<bool>;
    { cs.getError() } -> std::same_as<typename S::error_type>;
};

// Keeps every event it receives; used to inspect the encoder output without an emitter
class EventRecorder {
public:
    enum class Error {
        NO_ERROR,
        EVENT_AFTER_STREAM_END
    };
    using error_type = Error;

    struct Recorded {
        EventKind kind;
        std::string tag;
        std::string value;
        ScalarStyle style = ScalarStyle::Plain;
        constexpr bool operator==(const Recorded&) const = default;
    };

    constexpr bool emit(const Event & ev) {
        if(closed_) {
            err_ = Error::EVENT_AFTER_STREAM_END;
            return false;
        }
        if(ev.kind == EventKind::StreamEnd) closed_ = true;
        events_.push_back(Recorded{ev.kind, std::string(ev.tag), std::string(ev.value), ev.style});
        return true;
    }

    constexpr error_type getError() const {
        return err_;
    }

    constexpr const std::vector<Recorded> & events() const {
        return events_;
    }

    // Compact one-line rendering in the spirit of the yaml-test-suite event notation:
    // +STR +DOC +MAP !Tag =VAL :plain =VAL 'quoted =VAL |literal -MAP -DOC -STR
    constexpr std::string to_string() const {
        std::string out;
        for(const auto & e : events_) {
            if(!out.empty()) out += ' ';
            switch(e.kind) {
            case EventKind::StreamStart: out += "+STR"; break;
            case EventKind::StreamEnd: out += "-STR"; break;
            case EventKind::DocumentStart: out += "+DOC"; break;
            case EventKind::DocumentEnd: out += "-DOC"; break;
            case EventKind::SequenceStart: out += "+SEQ"; append_tag(out, e.tag); break;
            case EventKind::SequenceEnd: out += "-SEQ"; break;
            case EventKind::MappingStart: out += "+MAP"; append_tag(out, e.tag); break;
            case EventKind::MappingEnd: out += "-MAP"; break;
            case EventKind::Scalar:
                out += "=VAL";
                append_tag(out, e.tag);
                out += ' ';
                switch(e.style) {
                case ScalarStyle::Plain: out += ':'; break;
                case ScalarStyle::SingleQuoted: out += '\''; break;
                case ScalarStyle::Literal: out += '|'; break;
                }
                out += e.value;
                break;
            }
        }
        return out;
    }

private:
    static constexpr void append_tag(std::string & out, const std::string & tag) {
        if(!tag.empty()) {
            out += ' ';
            out += tag;
        }
    }

    std::vector<Recorded> events_;
    bool closed_ = false;
    Error err_ = Error::NO_ERROR;
};

} // namespace sink

} // namespace YamlFusion
