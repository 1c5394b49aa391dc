#include "../test_helpers.hpp"
#include <optional>
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

using SM = Annotated<E, options::singleton_map>;

// ============================================================================
// Every variant shape as a one-entry mapping
// ============================================================================

static_assert(TestEvents(SM{E{Unit<"Unit">{}}}, "+STR +DOC =VAL :Unit -DOC -STR"));
static_assert(TestEvents(SM{E{Newtype<"Newtype", int>{42}}},
                         "+STR +DOC +MAP =VAL :Newtype =VAL :42 -MAP -DOC -STR"));
static_assert(TestEvents(SM{E{Tuple<"Tuple", int, int>{{1, 2}}}},
                         "+STR +DOC +MAP =VAL :Tuple +SEQ =VAL :1 =VAL :2 -SEQ -MAP -DOC -STR"));
static_assert(TestEvents(SM{E{Struct<"Struct", Inner>{{42}}}},
                         "+STR +DOC +MAP =VAL :Struct +MAP =VAL :value =VAL :42 -MAP -MAP -DOC -STR"));

// tag_unit_variants has no say once the representation is a singleton map
static_assert(TestEventsTaggedUnits(SM{E{Unit<"Unit">{}}}, "+STR +DOC =VAL :Unit -DOC -STR"));

// ============================================================================
// As a struct field
// ============================================================================

struct WithField {
    Annotated<E, options::singleton_map> e;
    E plain;
};

static_assert(TestEvents(WithField{Newtype<"Newtype", int>{1}, Newtype<"Newtype", int>{2}},
    "+STR +DOC +MAP =VAL :e +MAP =VAL :Newtype =VAL :1 -MAP =VAL :plain =VAL !Newtype :2 -MAP -DOC -STR"));

static_assert(TestEvents(WithField{Unit<"Unit">{}, Unit<"Unit">{}},
    "+STR +DOC +MAP =VAL :e =VAL :Unit =VAL :plain =VAL :Unit -MAP -DOC -STR"));

// ============================================================================
// Recursive and non-recursive
// ============================================================================

using Outer = Enum<Newtype<"Outer", E>, Unit<"Empty">>;

// Only the outer variant is rewritten; the payload keeps its tag
static_assert(TestEvents(Annotated<Outer, options::singleton_map>{Outer{Newtype<"Outer", E>{E{Newtype<"Newtype", int>{5}}}}},
    "+STR +DOC +MAP =VAL :Outer =VAL !Newtype :5 -MAP -DOC -STR"));

static_assert(TestEvents(Annotated<Outer, options::singleton_map_recursive>{Outer{Newtype<"Outer", E>{E{Newtype<"Newtype", int>{5}}}}},
    "+STR +DOC +MAP =VAL :Outer +MAP =VAL :Newtype =VAL :5 -MAP -MAP -DOC -STR"));

// nested_singleton_map names the recursive form
static_assert(TestEvents(Annotated<Outer, options::nested_singleton_map>{Outer{Unit<"Empty">{}}},
    "+STR +DOC =VAL :Empty -DOC -STR"));

// Sequence elements are below the annotated value
static_assert([] {
    Annotated<std::vector<E>, options::singleton_map> v{std::vector<E>{Unit<"Unit">{}, Newtype<"Newtype", int>{1}}};
    return TestEvents(v, "+STR +DOC +SEQ =VAL :Unit =VAL !Newtype :1 -SEQ -DOC -STR");
}());

static_assert([] {
    Annotated<std::vector<E>, options::singleton_map_recursive> v{std::vector<E>{Unit<"Unit">{}, Newtype<"Newtype", int>{1}}};
    return TestEvents(v, "+STR +DOC +SEQ =VAL :Unit +MAP =VAL :Newtype =VAL :1 -MAP -SEQ -DOC -STR");
}());

// Recursion reaches enums inside struct payloads
struct Deep {
    E inner;
};
using DeepEnum = Enum<Struct<"Deep", Deep>>;
static_assert(TestEvents(Annotated<DeepEnum, options::singleton_map_recursive>{DeepEnum{Struct<"Deep", Deep>{{E{Tuple<"Tuple", int, int>{{3, 4}}}}}}},
    "+STR +DOC +MAP =VAL :Deep +MAP =VAL :inner +MAP =VAL :Tuple +SEQ =VAL :3 =VAL :4 -SEQ -MAP -MAP -MAP -DOC -STR"));

// A recursive field inside a non-recursive one, and the other way round
struct Mixed {
    Annotated<E, options::singleton_map_recursive> r;
};
using MixedEnum = Enum<Struct<"Mixed", Mixed>>;
static_assert(TestEvents(Annotated<MixedEnum, options::singleton_map>{MixedEnum{Struct<"Mixed", Mixed>{{E{Newtype<"Newtype", int>{1}}}}}},
    "+STR +DOC +MAP =VAL :Mixed +MAP =VAL :r +MAP =VAL :Newtype =VAL :1 -MAP -MAP -MAP -DOC -STR"));

struct Flat {
    Annotated<E, options::singleton_map> f;
};
using FlatEnum = Enum<Struct<"Flat", Flat>>;
static_assert(TestEvents(Annotated<FlatEnum, options::singleton_map_recursive>{FlatEnum{Struct<"Flat", Flat>{{E{Newtype<"Newtype", int>{1}}}}}},
    "+STR +DOC +MAP =VAL :Flat +MAP =VAL :f +MAP =VAL :Newtype =VAL :1 -MAP -MAP -MAP -DOC -STR"));

// ============================================================================
// Optional
// ============================================================================

struct WithOptional {
    Annotated<std::optional<E>, options::singleton_map_optional> e;
};
static_assert(TestEvents(WithOptional{}, "+STR +DOC +MAP =VAL :e =VAL :null -MAP -DOC -STR"));
static_assert(TestEvents(WithOptional{std::optional<E>{Newtype<"Newtype", int>{3}}},
    "+STR +DOC +MAP =VAL :e +MAP =VAL :Newtype =VAL :3 -MAP -MAP -DOC -STR"));
