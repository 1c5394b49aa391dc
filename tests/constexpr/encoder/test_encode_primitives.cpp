#include "../test_helpers.hpp"
#include <optional>
#include <string>
#include <tuple>
#include <variant>
#include <vector>

using namespace TestHelpers;
using namespace YamlFusion;

// ============================================================================
// Scalars
// ============================================================================

static_assert(TestEvents(42, "+STR +DOC =VAL :42 -DOC -STR"));
static_assert(TestEvents(-7, "+STR +DOC =VAL :-7 -DOC -STR"));
static_assert(TestEvents(true, "+STR +DOC =VAL :true -DOC -STR"));
static_assert(TestEvents('x', "+STR +DOC =VAL 'x -DOC -STR"));
static_assert(TestEvents(std::monostate{}, "+STR +DOC =VAL :null -DOC -STR"));
static_assert(TestEvents(std::optional<int>{}, "+STR +DOC =VAL :null -DOC -STR"));
static_assert(TestEvents(std::optional<int>{3}, "+STR +DOC =VAL :3 -DOC -STR"));

// ============================================================================
// Strings pick the style that reads back as a string
// ============================================================================

static_assert(TestEvents(std::string("hello"), "+STR +DOC =VAL :hello -DOC -STR"));
static_assert(TestEvents(std::string("42"), "+STR +DOC =VAL '42 -DOC -STR"));
static_assert(TestEvents(std::string("yes"), "+STR +DOC =VAL 'yes -DOC -STR"));
static_assert(TestEvents(std::string(""), "+STR +DOC =VAL ' -DOC -STR"));
static_assert(TestEvents(std::string("a\nb"), "+STR +DOC =VAL |a\nb -DOC -STR"));

// ============================================================================
// Sequences and mappings
// ============================================================================

static_assert([] {
    std::vector<int> v{1, 2};
    return TestEvents(v, "+STR +DOC +SEQ =VAL :1 =VAL :2 -SEQ -DOC -STR");
}());

static_assert([] {
    std::vector<int> v;
    return TestEvents(v, "+STR +DOC +SEQ -SEQ -DOC -STR");
}());

static_assert([] {
    std::vector<std::vector<int>> v{{1}, {}};
    return TestEvents(v, "+STR +DOC +SEQ +SEQ =VAL :1 -SEQ +SEQ -SEQ -SEQ -DOC -STR");
}());

static_assert(TestEvents(std::tuple<int, bool>{1, false}, "+STR +DOC +SEQ =VAL :1 =VAL :false -SEQ -DOC -STR"));

struct Point {
    int x;
    int y;
};
static_assert(TestEvents(Point{1, 2}, "+STR +DOC +MAP =VAL :x =VAL :1 =VAL :y =VAL :2 -MAP -DOC -STR"));

// A struct with a single field is never mistaken for a tag carrier
struct Single {
    int v;
};
static_assert(TestEvents(Single{1}, "+STR +DOC +MAP =VAL :v =VAL :1 -MAP -DOC -STR"));

struct Nested {
    Point p;
    std::vector<int> list;
};
static_assert([] {
    Nested n{{1, 2}, {3}};
    return TestEvents(n,
        "+STR +DOC +MAP =VAL :p +MAP =VAL :x =VAL :1 =VAL :y =VAL :2 -MAP "
        "=VAL :list +SEQ =VAL :3 -SEQ -MAP -DOC -STR");
}());

// ============================================================================
// Errors and stream handling
// ============================================================================

static_assert([] {
    Bytes b{{1, 2, 3}};
    return EncodeFailsWith(b, EncodeError::UNSUPPORTED_CONSTRUCT);
}());

static_assert([] {
    std::vector<int> docs{1, 2};
    return TestDocumentEvents(docs, "+STR +DOC =VAL :1 -DOC +DOC =VAL :2 -DOC -STR");
}());

static_assert([] {
    std::vector<int> docs;
    return TestDocumentEvents(docs, "+STR -STR");
}());

// Unclosed containers cannot finish the stream
static_assert([] {
    Encoder enc;
    std::size_t n = 0;
    Encoder::ArrayFrame fr;
    enc.write_array_begin(n, fr);
    return !enc.finish() && enc.getError() == EncodeError::INVALID_STATE;
}());

// Nothing can follow the end of the stream
static_assert([] {
    Encoder enc;
    enc.write_number(1);
    if(!enc.finish()) return false;
    return !enc.write_number(2)
        && enc.getError() == EncodeError::EMITTER_ERROR
        && enc.sinkError() == Recorder::Error::EVENT_AFTER_STREAM_END;
}());

// finish() is idempotent
static_assert([] {
    Encoder enc;
    enc.write_bool(true);
    return enc.finish() && enc.finish() && enc.sink().to_string() == "+STR +DOC =VAL :true -DOC -STR";
}());
