#pragma once

#include <cstddef>

#include "events.hpp"

namespace YamlFusion {

// Opens a document when a top-level value starts and closes it when that value ends.
// Every value start/end pair nests inside it, so several top-level values in one
// stream become several documents.
class DocumentBracket {
public:
    template<sink::EventSinkLike Sink>
    constexpr bool value_start(Sink & sink) {
        if(depth_ == 0) {
            if(!sink.emit(Event{EventKind::DocumentStart})) return false;
        }
        ++depth_;
        return true;
    }

    // Saturates at zero: an unmatched end closes nothing
    template<sink::EventSinkLike Sink>
    constexpr bool value_end(Sink & sink) {
        if(depth_ == 0) return true;
        --depth_;
        if(depth_ == 0) {
            return sink.emit(Event{EventKind::DocumentEnd});
        }
        return true;
    }

    constexpr std::size_t depth() const {
        return depth_;
    }

private:
    std::size_t depth_ = 0;
};

} // namespace YamlFusion
