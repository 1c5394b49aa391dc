#include "../test_helpers.hpp"
#include <optional>
#include <string>

using namespace TestHelpers;
using namespace YamlFusion;
using namespace YamlFusion::options;

// ============================================================================
// key<> renames, exclude hides
// ============================================================================

struct Renamed {
    Annotated<int, key<"renamed">> a;
    Annotated<int, exclude> hidden;
    int b;
};
static_assert(TestEvents(Renamed{1, 99, 2}, "+STR +DOC +MAP =VAL :renamed =VAL :1 =VAL :b =VAL :2 -MAP -DOC -STR"));

// Keys go through the same style choice as values
struct OddKey {
    Annotated<int, key<"true">> t;
};
static_assert(TestEvents(OddKey{1}, "+STR +DOC +MAP =VAL 'true =VAL :1 -MAP -DOC -STR"));

static_assert(struct_fields_helper::FieldsHelper<Renamed>::fieldsCount == 2);
static_assert(struct_fields_helper::FieldsHelper<Renamed>::rawFieldsCount == 3);
static_assert(struct_fields_helper::FieldsHelper<Renamed>::find("renamed") == 0);
static_assert(struct_fields_helper::FieldsHelper<Renamed>::find("a") == struct_fields_helper::FieldsHelper<Renamed>::NotFound);
static_assert(struct_fields_helper::FieldsHelper<Renamed>::find("hidden") == struct_fields_helper::FieldsHelper<Renamed>::NotFound);

// ============================================================================
// skip_nulls
// ============================================================================

struct Sparse {
    int id;
    std::optional<int> maybe;
    std::optional<std::string> note;
};

static_assert(TestEvents(Sparse{1, std::nullopt, std::nullopt},
    "+STR +DOC +MAP =VAL :id =VAL :1 =VAL :maybe =VAL :null =VAL :note =VAL :null -MAP -DOC -STR"));

static_assert(TestEvents(Annotated<Sparse, skip_nulls>{Sparse{1, std::nullopt, std::nullopt}},
    "+STR +DOC +MAP =VAL :id =VAL :1 -MAP -DOC -STR"));

static_assert(TestEvents(Annotated<Sparse, skip_nulls>{Sparse{1, 2, std::nullopt}},
    "+STR +DOC +MAP =VAL :id =VAL :1 =VAL :maybe =VAL :2 -MAP -DOC -STR"));

struct Outer {
    Annotated<Sparse, skip_nulls> inner;
    std::optional<int> kept;
};
static_assert(TestEvents(Outer{Sparse{1, std::nullopt, std::string("n")}, std::nullopt},
    "+STR +DOC +MAP =VAL :inner +MAP =VAL :id =VAL :1 =VAL :note =VAL :n -MAP =VAL :kept =VAL :null -MAP -DOC -STR"));

// ============================================================================
// Option metadata
// ============================================================================

static_assert(singleton_map::to_string() == "singleton_map");
static_assert(singleton_map_recursive::to_string() == "singleton_map_recursive");
static_assert(singleton_map_optional::to_string() == "singleton_map_optional");
static_assert(std::is_same_v<singleton_map_with, singleton_map>);
static_assert(!singleton_map_optional::Recursive && singleton_map_optional::RequiresNullable);
