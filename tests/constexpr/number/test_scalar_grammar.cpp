#include <YamlFusion/scalar_parse.hpp>
#include <cstdint>
#include <limits>

using namespace YamlFusion::scalar;

// ============================================================================
// Null and bool (core schema)
// ============================================================================

static_assert(parse_null("~"));
static_assert(parse_null("null"));
static_assert(parse_null("Null"));
static_assert(parse_null("NULL"));
static_assert(!parse_null("nUll"));
static_assert(!parse_null(""));

static_assert(parse_bool("true") == true);
static_assert(parse_bool("False") == false);
static_assert(parse_bool("TRUE") == true);
static_assert(!parse_bool("yes").has_value());
static_assert(!parse_bool("tRue").has_value());

// ============================================================================
// Unsigned integers
// ============================================================================

static_assert(parse_unsigned_int("0") == 0u);
static_assert(parse_unsigned_int("42") == 42u);
static_assert(parse_unsigned_int("+7") == 7u);
static_assert(parse_unsigned_int("0x1F") == 31u);
static_assert(parse_unsigned_int("0o17") == 15u);
static_assert(parse_unsigned_int("0b101") == 5u);
static_assert(parse_unsigned_int("18446744073709551615") == std::numeric_limits<std::uint64_t>::max());
static_assert(!parse_unsigned_int("18446744073709551616"));
static_assert(!parse_unsigned_int("007"));
static_assert(!parse_unsigned_int("-1"));
static_assert(!parse_unsigned_int("++1"));
static_assert(!parse_unsigned_int("0x-1"));
static_assert(!parse_unsigned_int("0x"));
static_assert(!parse_unsigned_int("1.5"));
static_assert(!parse_unsigned_int(""));

// ============================================================================
// Negative integers
// ============================================================================

static_assert(parse_negative_int("-1") == -1);
static_assert(parse_negative_int("-0x10") == -16);
static_assert(parse_negative_int("-9223372036854775808") == std::numeric_limits<std::int64_t>::min());
static_assert(!parse_negative_int("-9223372036854775809"));
static_assert(!parse_negative_int("5"));
static_assert(!parse_negative_int("--5"));
static_assert(!parse_negative_int("-007"));

static_assert(digits_but_not_number("007"));
static_assert(digits_but_not_number("-01"));
static_assert(!digits_but_not_number("0"));
static_assert(!digits_but_not_number("10"));
static_assert(!digits_but_not_number("0x1"));

// ============================================================================
// Tag displays
// ============================================================================

static_assert(tag_name_of("!Variant") == std::string_view("Variant"));
static_assert(!tag_name_of("!").has_value());
static_assert(!tag_name_of("Variant").has_value());
