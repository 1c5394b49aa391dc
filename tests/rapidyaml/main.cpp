#define RYML_SINGLE_HDR_DEFINE_NOW
#include "YamlFusion/yaml.hpp"
#include "YamlFusion/error_formatting.hpp"
#include <cassert>
#include <cmath>
#include <cstring>
#include <iostream>
#include <limits>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace YamlFusion;

struct Inner {
    int value;
    bool operator==(const Inner&) const = default;
};

using E = Enum<
    Unit<"Unit">,
    Newtype<"Newtype", int>,
    Tuple<"Tuple", int, int>,
    Struct<"Struct", Inner>
>;

struct Holder {
    E field;
    bool operator==(const Holder&) const = default;
};

struct SingletonHolder {
    Annotated<E, options::singleton_map> field;
    bool operator==(const SingletonHolder&) const = default;
};

struct OptionalHolder {
    Annotated<std::optional<E>, options::singleton_map_optional> field;
    bool operator==(const OptionalHolder&) const = default;
};

using Outer = Enum<Newtype<"Outer", E>, Unit<"Empty">>;

struct RecursiveHolder {
    Annotated<Outer, options::singleton_map_recursive> outer;
    Annotated<std::vector<E>, options::singleton_map_recursive> list;
    bool operator==(const RecursiveHolder&) const = default;
};

struct Config {
    std::string name;
    int value;
    bool enabled;
    std::vector<int> items;
    std::optional<double> ratio;
    bool operator==(const Config&) const = default;
};

struct PointF {
    double x;
    double y;
};

struct Strict {
    int a;
    int b;
};

struct Lenient {
    int a;
};

template<class T>
static T RoundTrip(const T& in, EncoderConfig config = {}) {
    std::string text;
    auto sres = Serialize(in, text, config);
    assert(sres);
    T out{};
    auto pres = Parse(out, text);
    if(!pres) {
        std::cerr << ParseResultToString(pres) << "\nwhile reading:\n" << text << "\n";
    }
    assert(pres);
    return out;
}

template<class T>
static std::string ToYaml(const T& in, EncoderConfig config = {}) {
    std::string text;
    auto res = Serialize(in, text, config);
    assert(res);
    return text;
}

int main() {
    std::cout << "=== RapidYaml Encoder/Reader Tests ===\n\n";

    // Test 1: Default variant form
    {
        std::cout << "Test 1: Variants as tags... ";
        assert(ToYaml(E{Unit<"Unit">{}}) == "Unit\n");
        assert(ToYaml(E{Newtype<"Newtype", int>{42}}) == "!Newtype 42\n");
        std::cout << "PASSED\n";
    }

    // Test 2: Singleton map form
    {
        std::cout << "Test 2: Variants as singleton maps... ";
        using SM = Annotated<E, options::singleton_map>;
        assert(ToYaml(SM{E{Unit<"Unit">{}}}) == "Unit\n");
        assert(ToYaml(SM{E{Newtype<"Newtype", int>{42}}}) == "Newtype: 42\n");
        assert(ToYaml(SingletonHolder{E{Unit<"Unit">{}}}) == "field: Unit\n");
        assert(ToYaml(Annotated<std::optional<E>, options::singleton_map_optional>{}) == "null\n");
        std::cout << "PASSED\n";
    }

    // Test 3: Every variant shape reads back, both forms
    {
        std::cout << "Test 3: Variant round trips... ";
        const std::vector<E> all{
            Unit<"Unit">{},
            Newtype<"Newtype", int>{42},
            Tuple<"Tuple", int, int>{{1, 2}},
            Struct<"Struct", Inner>{{42}},
        };
        for(const auto& e : all) {
            assert(RoundTrip(Holder{e}) == Holder{e});
            assert(RoundTrip(SingletonHolder{e}) == SingletonHolder{e});
            assert(RoundTrip(Holder{e}, EncoderConfig{.tag_unit_variants = true}) == Holder{e});
        }
        assert(RoundTrip(all) == all);
        std::cout << "PASSED\n";
    }

    // Test 4: Optional and recursive singleton maps
    {
        std::cout << "Test 4: Optional and recursive singleton maps... ";
        assert(RoundTrip(OptionalHolder{}) == OptionalHolder{});
        OptionalHolder some{std::optional<E>{Tuple<"Tuple", int, int>{{3, 4}}}};
        assert(RoundTrip(some) == some);

        RecursiveHolder r{
            Outer{Newtype<"Outer", E>{E{Newtype<"Newtype", int>{5}}}},
            std::vector<E>{Unit<"Unit">{}, Struct<"Struct", Inner>{{1}}},
        };
        assert(RoundTrip(r) == r);
        std::cout << "PASSED\n";
    }

    // Test 4b: A variant whose payload is a bare unit variant of another enum
    {
        std::cout << "Test 4b: Unit payloads under a tag... ";
        Outer o{Newtype<"Outer", E>{E{Unit<"Unit">{}}}};
        assert(ToYaml(o) == "!Outer Unit\n");
        assert(RoundTrip(o) == o);

        Tagged<E> t{"t", E{Unit<"Unit">{}}};
        assert(ToYaml(t) == "!t Unit\n");
        assert(RoundTrip(t) == t);

        std::vector<Outer> list{o, Outer{Unit<"Empty">{}}};
        assert(RoundTrip(list) == list);
        std::cout << "PASSED\n";
    }

    // Test 5: Tagged unit variants
    {
        std::cout << "Test 5: Tagged unit variants... ";
        std::string text = ToYaml(E{Unit<"Unit">{}}, EncoderConfig{.tag_unit_variants = true});
        assert(text.starts_with("!Unit"));
        E e{Newtype<"Newtype", int>{1}};
        assert(Parse(e, text));
        assert(e.holds<Unit<"Unit">>());
        std::cout << "PASSED\n";
    }

    // Test 6: Explicit tags
    {
        std::cout << "Test 6: Tagged values... ";
        Tagged<int> t{"custom", 7};
        assert(ToYaml(t) == "!custom 7\n");
        assert(RoundTrip(t) == t);
        Tagged<std::optional<int>> none{"maybe", std::nullopt};
        assert(RoundTrip(none) == none);
        std::cout << "PASSED\n";
    }

    // Test 7: Strings that must stay strings
    {
        std::cout << "Test 7: String quoting... ";
        const std::vector<std::string> tricky{"42", "yes", "", "a\nb\n", "null", "~", "true", "-.inf", "007", "0x1F", "plain"};
        assert(RoundTrip(tricky) == tricky);
        std::map<std::string, std::string> m{{"true", "1"}, {"key", "no"}};
        assert(RoundTrip(m) == m);
        std::cout << "PASSED\n";
    }

    // Test 8: Special floats
    {
        std::cout << "Test 8: Special floats... ";
        assert(ToYaml(std::numeric_limits<double>::quiet_NaN()) == ".nan\n");
        assert(ToYaml(std::numeric_limits<double>::infinity()) == ".inf\n");
        assert(ToYaml(-std::numeric_limits<double>::infinity()) == "-.inf\n");
        assert(ToYaml(1.0) == "1.0\n");
        assert(ToYaml(0.1f) == "0.1\n");
        assert(RoundTrip(0.1f) == 0.1f);
        double d = 0;
        assert(Parse(d, ".NaN") && std::isnan(d));
        assert(Parse(d, "-.Inf") && std::isinf(d) && d < 0);
        assert(Parse(d, "2.5e3") && d == 2500.0);
        std::cout << "PASSED\n";
    }

    // Test 9: Structures
    {
        std::cout << "Test 9: Structures... ";
        Config cfg{"my config", 99, false, {5, 6, 7}, 0.5};
        assert(RoundTrip(cfg) == cfg);
        Config none{"n", 1, true, {}, std::nullopt};
        assert(RoundTrip(none) == none);
        assert(ToYaml(PointF{1.0, 2.0}) == "x: 1.0\n'y': 2.0\n");
        assert(ToYaml(std::vector<int>{}) == "[]\n");
        assert(ToYaml(std::map<std::string, int>{}) == "{}\n");
        assert(ToYaml(std::map<std::string, int>{{"a", 1}}) == "a: 1\n");
        std::cout << "PASSED\n";
    }

    // Test 10: Unknown variants and wrong shapes
    {
        std::cout << "Test 10: Variant errors... ";
        SingletonHolder sh{};
        auto r1 = Parse(sh, "field: InvalidYAML\n");
        assert(!r1 && r1.error() == ParseError::UNKNOWN_VARIANT);
        assert(r1.errorPath().to_string() == "$.field.InvalidYAML");

        auto r2 = Parse(sh, "field:\n  NotARealVariant: 123\n");
        assert(!r2 && r2.error() == ParseError::UNKNOWN_VARIANT);

        auto r3 = Parse(sh, "field:\n  Newtype: 1\n  Unit: ~\n");
        assert(!r3 && r3.error() == ParseError::SHAPE_MISMATCH);

        Holder h{};
        auto r4 = Parse(h, "field: Newtype\n");
        assert(!r4 && r4.error() == ParseError::SHAPE_MISMATCH);

        auto r5 = Parse(h, "field: !Bogus 1\n");
        assert(!r5 && r5.error() == ParseError::UNKNOWN_VARIANT);
        assert(r5.errorPath().to_string() == "$.field.Bogus");

        auto r6 = Parse(h, "field: !Unit 1\n");
        assert(!r6 && r6.error() == ParseError::SHAPE_MISMATCH);

        auto r7 = Parse(sh, "field: {}\n");
        assert(!r7 && r7.error() == ParseError::SHAPE_MISMATCH);
        std::cout << "PASSED\n";
    }

    // Test 11: Struct field errors
    {
        std::cout << "Test 11: Field errors... ";
        Strict s{};
        auto r1 = Parse(s, "a: 1\n");
        assert(!r1 && r1.error() == ParseError::MISSING_FIELD);
        assert(r1.errorPath().to_string() == "$.b");

        auto r2 = Parse(s, "a: 1\nb: 2\nc: 3\n");
        assert(!r2 && r2.error() == ParseError::EXCESS_FIELD);

        Annotated<Lenient, options::allow_excess_fields> l{};
        assert(Parse(l, "a: 1\nc: [1, 2]\n"));
        assert(l->a == 1);

        auto r3 = Parse(s, "a: 1\na: 2\nb: 3\n");
        assert(!r3 && r3.error() == ParseError::DUPLICATE_KEY_IN_MAP);

        std::vector<int> v;
        auto r4 = Parse(v, "[1, two, 3]");
        assert(!r4 && r4.error() == ParseError::NON_NUMERIC_IN_NUMERIC_STORAGE);
        assert(r4.errorPath().to_string() == "$[1]");
        std::cout << "PASSED\n";
    }

    // Test 12: Reader errors
    {
        std::cout << "Test 12: Reader errors... ";
        std::vector<int> v;
        auto r1 = Parse(v, "[1, 2");
        assert(!r1 && r1.error() == ParseError::READER_ERROR);
        assert(r1.readerError() == RapidYamlReader::ParseError::ILLFORMED_DOCUMENT);

        std::int8_t small = 0;
        auto r2 = Parse(small, "300");
        assert(!r2 && r2.readerError() == RapidYamlReader::ParseError::NUMERIC_VALUE_IS_OUT_OF_STORAGE_TYPE_RANGE);

        auto r3 = Parse(v, "- &a 1\n- *a\n");
        assert(!r3 && r3.readerError() == RapidYamlReader::ParseError::UNSUPPORTED_YAML_FEATURE);

        // malformed and valid inputs parsed side by side
        auto worker = [](bool malformed) {
            for(int i = 0; i < 200; i ++) {
                std::vector<int> out;
                auto r = Parse(out, malformed ? std::string_view("[1, 2") : std::string_view("[1, 2]"));
                if(malformed) {
                    assert(!r && r.readerError() == RapidYamlReader::ParseError::ILLFORMED_DOCUMENT);
                } else {
                    assert(r && (out == std::vector<int>{1, 2}));
                }
            }
        };
        std::thread a(worker, true);
        std::thread b(worker, true);
        std::thread c(worker, false);
        a.join();
        b.join();
        c.join();
        std::cout << "PASSED\n";
    }

    // Test 13: Multiple documents
    {
        std::cout << "Test 13: Multiple documents... ";
        std::string text;
        assert(SerializeDocuments(std::vector<int>{1, 2}, text));
        assert(text == "1\n---\n2\n");

        std::vector<int> docs;
        assert(ParseDocuments(docs, text));
        assert((docs == std::vector<int>{1, 2}));

        int single = 0;
        auto r = Parse(single, text);
        assert(!r && r.error() == ParseError::UNSUPPORTED_CONSTRUCT);
        std::cout << "PASSED\n";
    }

    // Test 14: Encoder errors and messages
    {
        std::cout << "Test 14: Error reporting... ";
        std::string text = "untouched";
        auto res = Serialize(Outer{Newtype<"Outer", E>{E{Newtype<"Newtype", int>{1}}}}, text);
        assert(!res && res.writerError() == EncodeError::NESTED_ENUM_TAG);
        assert(text.empty());
        assert(SerializeResultToString(res).find("serializing nested enums in YAML is not supported") != std::string::npos);

        Strict s{};
        auto pres = Parse(s, "a: 1\n");
        std::string msg = ParseResultToString(pres);
        assert(msg.find("MISSING_FIELD") != std::string::npos);
        assert(msg.find("$.b") != std::string::npos);

        auto bytes = Serialize(Bytes{{1, 2}}, text);
        assert(!bytes && bytes.writerError() == EncodeError::UNSUPPORTED_CONSTRUCT);

        std::string bad_utf8 = "\xC0\xAF";
        auto utf = Serialize(bad_utf8, text);
        assert(!utf && utf.error() == SerializeError::UTF8_ERROR);
        std::cout << "PASSED\n";
    }

    // Test 15: Stream output
    {
        std::cout << "Test 15: Stream output... ";
        std::ostringstream os;
        assert(Serialize(Annotated<E, options::singleton_map>{E{Newtype<"Newtype", int>{42}}}, os));
        assert(os.str() == "Newtype: 42\n");

        std::ostringstream broken;
        broken.setstate(std::ios::badbit);
        auto io = Serialize(1, broken);
        assert(!io && io.error() == SerializeError::IO_ERROR);
        assert((io.streamState() & std::ios::badbit) != 0);
        std::cout << "PASSED\n";
    }

    // Test 16: Reading a tree the caller parsed
    {
        std::cout << "Test 16: External tree... ";
        ryml::Tree tree = ryml::parse_in_arena(ryml::csubstr("name: ext\nvalue: 3\nenabled: true\nitems: [1]\n"));
        RapidYamlReader reader(tree.crootref());
        Config cfg{};
        auto r = ParseWithReader(cfg, reader);
        assert(r);
        assert((cfg == Config{"ext", 3, true, {1}, std::nullopt}));

        ryml::Tree anchored = ryml::parse_in_arena(ryml::csubstr("- &a 1\n- *a\n"));
        RapidYamlReader rejecting(anchored.crootref());
        assert(rejecting.getError() == RapidYamlReader::ParseError::UNSUPPORTED_YAML_FEATURE);
        std::cout << "PASSED\n";
    }

    std::cout << "\n=== All tests passed! ===\n";
    return 0;
}
