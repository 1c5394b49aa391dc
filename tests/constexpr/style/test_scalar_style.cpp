#include <YamlFusion/scalar_style.hpp>

using namespace YamlFusion;

// Plain when nothing else could be read back
static_assert(classify_string_style("hello") == ScalarStyle::Plain);
static_assert(classify_string_style("hello world") == ScalarStyle::Plain);
static_assert(classify_string_style("Unit") == ScalarStyle::Plain);
static_assert(classify_string_style("a1") == ScalarStyle::Plain);

// Old-style booleans are quoted, whatever the case
static_assert(classify_string_style("y") == ScalarStyle::SingleQuoted);
static_assert(classify_string_style("Yes") == ScalarStyle::SingleQuoted);
static_assert(classify_string_style("NO") == ScalarStyle::SingleQuoted);
static_assert(classify_string_style("on") == ScalarStyle::SingleQuoted);
static_assert(classify_string_style("Off") == ScalarStyle::SingleQuoted);

// Multi-line text is literal
static_assert(classify_string_style("a\nb") == ScalarStyle::Literal);
static_assert(classify_string_style("line\n") == ScalarStyle::Literal);

// Would resolve to null, bool or a number
static_assert(classify_string_style("") == ScalarStyle::SingleQuoted);
static_assert(classify_string_style("~") == ScalarStyle::SingleQuoted);
static_assert(classify_string_style("null") == ScalarStyle::SingleQuoted);
static_assert(classify_string_style("NULL") == ScalarStyle::SingleQuoted);
static_assert(classify_string_style("true") == ScalarStyle::SingleQuoted);
static_assert(classify_string_style("tRUE") == ScalarStyle::SingleQuoted);
static_assert(classify_string_style("42") == ScalarStyle::SingleQuoted);
static_assert(classify_string_style("-1") == ScalarStyle::SingleQuoted);
static_assert(classify_string_style("+1") == ScalarStyle::SingleQuoted);
static_assert(classify_string_style(".inf") == ScalarStyle::SingleQuoted);
static_assert(classify_string_style("007") == ScalarStyle::SingleQuoted);
static_assert(classify_string_style("1.5e3") == ScalarStyle::SingleQuoted);

static_assert(style_to_string(ScalarStyle::Literal) == "Literal");
