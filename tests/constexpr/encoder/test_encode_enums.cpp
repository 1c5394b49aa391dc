#include "../test_helpers.hpp"
#include <optional>
#include <string>
#include <vector>

using namespace TestHelpers;
using namespace YamlFusion;

struct Inner {
    int value;
    constexpr bool operator==(const Inner&) const = default;
};

using E = Enum<
    Unit<"Unit">,
    Newtype<"Newtype", int>,
    Tuple<"Tuple", int, int>,
    Struct<"Struct", Inner>
>;

// ============================================================================
// Variants become tags on their payload
// ============================================================================

static_assert(TestEvents(E{Unit<"Unit">{}}, "+STR +DOC =VAL :Unit -DOC -STR"));
static_assert(TestEvents(E{Newtype<"Newtype", int>{42}}, "+STR +DOC =VAL !Newtype :42 -DOC -STR"));
static_assert(TestEvents(E{Tuple<"Tuple", int, int>{{1, 2}}},
                         "+STR +DOC +SEQ !Tuple =VAL :1 =VAL :2 -SEQ -DOC -STR"));
static_assert(TestEvents(E{Struct<"Struct", Inner>{{42}}},
                         "+STR +DOC +MAP !Struct =VAL :value =VAL :42 -MAP -DOC -STR"));

// Unit variants as an empty tagged scalar
static_assert(TestEventsTaggedUnits(E{Unit<"Unit">{}}, "+STR +DOC =VAL !Unit : -DOC -STR"));
static_assert(TestEventsTaggedUnits(E{Newtype<"Newtype", int>{1}}, "+STR +DOC =VAL !Newtype :1 -DOC -STR"));

// ============================================================================
// Enums inside containers
// ============================================================================

struct Holder {
    E field;
};
static_assert(TestEvents(Holder{Newtype<"Newtype", int>{5}},
                         "+STR +DOC +MAP =VAL :field =VAL !Newtype :5 -MAP -DOC -STR"));
static_assert(TestEvents(Holder{Unit<"Unit">{}},
                         "+STR +DOC +MAP =VAL :field =VAL :Unit -MAP -DOC -STR"));

static_assert([] {
    std::vector<E> v{Unit<"Unit">{}, Newtype<"Newtype", int>{1}};
    return TestEvents(v, "+STR +DOC +SEQ =VAL :Unit =VAL !Newtype :1 -SEQ -DOC -STR");
}());

static_assert(TestEvents(std::optional<E>{}, "+STR +DOC =VAL :null -DOC -STR"));
static_assert(TestEvents(std::optional<E>{Newtype<"Newtype", int>{3}}, "+STR +DOC =VAL !Newtype :3 -DOC -STR"));

// The tag is consumed by the sequence start, so enums inside the payload keep their own tags
using ListOfE = Enum<Newtype<"List", std::vector<E>>>;
static_assert([] {
    ListOfE l{Newtype<"List", std::vector<E>>{{Newtype<"Newtype", int>{1}, Unit<"Unit">{}}}};
    return TestEvents(l, "+STR +DOC +SEQ !List =VAL !Newtype :1 =VAL :Unit -SEQ -DOC -STR");
}());

// Strings that look like variant names are still plain strings
static_assert(TestEvents(std::string("Newtype"), "+STR +DOC =VAL :Newtype -DOC -STR"));

// ============================================================================
// A tag directly on a tag has no YAML form
// ============================================================================

using Outer = Enum<Newtype<"Outer", E>>;
static_assert(EncodeFailsWith(Outer{Newtype<"Outer", E>{E{Newtype<"Newtype", int>{1}}}}, EncodeError::NESTED_ENUM_TAG));
static_assert(EncodeFailsWith(Outer{Newtype<"Outer", E>{E{Unit<"Unit">{}}}}, EncodeError::NESTED_ENUM_TAG,
                              EncoderConfig{.tag_unit_variants = true}));

// Untagged unit payload under a tag is fine
static_assert(TestEvents(Outer{Newtype<"Outer", E>{E{Unit<"Unit">{}}}}, "+STR +DOC =VAL !Outer :Unit -DOC -STR"));
