#include <YamlFusion/document_bracket.hpp>
#include <YamlFusion/events.hpp>

using namespace YamlFusion;
using YamlFusion::sink::EventRecorder;

static_assert([] {
    EventRecorder rec;
    DocumentBracket b;
    b.value_start(rec);
    b.value_start(rec);
    b.value_end(rec);
    if(b.depth() != 1) return false;
    b.value_end(rec);
    return b.depth() == 0 && rec.to_string() == "+DOC -DOC";
}());

// Two top-level values, two documents
static_assert([] {
    EventRecorder rec;
    DocumentBracket b;
    b.value_start(rec);
    b.value_end(rec);
    b.value_start(rec);
    b.value_end(rec);
    return rec.to_string() == "+DOC -DOC +DOC -DOC";
}());

// An unmatched end is ignored
static_assert([] {
    EventRecorder rec;
    DocumentBracket b;
    return b.value_end(rec) && b.depth() == 0 && rec.events().empty();
}());

// Sink failures are reported
static_assert([] {
    EventRecorder rec;
    rec.emit(Event{EventKind::StreamEnd});
    DocumentBracket b;
    return !b.value_start(rec) && rec.getError() == EventRecorder::Error::EVENT_AFTER_STREAM_END;
}());
