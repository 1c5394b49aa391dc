#pragma once
#include <cstdint>
#include <string_view>
#include <type_traits>
#include <optional>
#include <memory>
#include "annotated.hpp"
#include "const_string.hpp"
#include "struct_introspection.hpp"

namespace YamlFusion {


namespace options {

namespace detail {

struct exclude_tag{};
struct key_tag{};
struct allow_excess_fields_tag{};
struct skip_nulls_tag{};
struct singleton_map_tag{};
}

// Field is neither written nor read
struct exclude {
    using tag = detail::exclude_tag;
    static constexpr std::string_view to_string() {
        return "exclude";
    }
};

template<ConstString Desc>
struct key {
    static_assert(Desc.check(), "[[[ YamlFusion ]]] key contains control characters");
    using tag = detail::key_tag;
    static constexpr auto desc = Desc;
    static constexpr std::string_view to_string() {
        return "key";
    }
};

struct allow_excess_fields{
    using tag = detail::allow_excess_fields_tag;
    static constexpr std::string_view to_string() {
        return "allow_excess_fields";
    }
};

// Null optionals/pointers of a struct are omitted instead of written as `null`
struct skip_nulls {
    using tag = detail::skip_nulls_tag;
    static constexpr std::string_view to_string() {
        return "skip_nulls";
    }
};

/*
 * Enum representation switches. All of them share one tag, so a field carries at most one.
 *
 * singleton_map            - only the annotated value itself is written as `{Variant: payload}`
 * singleton_map_recursive  - every enum reachable from the annotated value is rewritten
 * singleton_map_optional   - like singleton_map, for nullable fields: an absent value stays `null`
 */
template<bool RecursiveV, bool RequiresNullableV = false>
struct singleton_map_representation {
    using tag = detail::singleton_map_tag;
    static constexpr bool Recursive = RecursiveV;
    static constexpr bool RequiresNullable = RequiresNullableV;
    static constexpr std::string_view to_string() {
        if constexpr (RequiresNullable) {
            return "singleton_map_optional";
        } else if constexpr (Recursive) {
            return "singleton_map_recursive";
        } else {
            return "singleton_map";
        }
    }
};

using singleton_map = singleton_map_representation<false>;
using singleton_map_with = singleton_map;
using singleton_map_optional = singleton_map_representation<false, true>;
using singleton_map_recursive = singleton_map_representation<true>;
using nested_singleton_map = singleton_map_recursive;

namespace detail {


template<class Opt, class Tag, class = void>
struct option_matches_tag : std::false_type {};

template<class Opt, class Tag>
struct option_matches_tag<Opt, Tag, std::void_t<typename Opt::tag>>
    : std::bool_constant<std::is_same_v<typename Opt::tag, Tag>> {};


template<class Tag, class... Opts>
struct find_option_by_tag;

template<class Tag>
struct find_option_by_tag<Tag> {
    using type = void;
};

template<class Tag, class First, class... Rest>
struct find_option_by_tag<Tag, First, Rest...> {
private:
    using next = typename find_option_by_tag<Tag, Rest...>::type;

public:
    using type = std::conditional_t<
        option_matches_tag<First, Tag>::value,
        First,
        next
        >;
};

template<class Tag, class... Opts>
inline constexpr std::size_t count_options_by_tag = (std::size_t{0} + ... + (option_matches_tag<Opts, Tag>::value ? 1 : 0));

struct no_options {
    template<class Tag>
    static constexpr bool has_option = false;

    template<class Tag>
    using get_option = void;
};

template<class OptPack> struct field_options;
template<class... Opts>
struct field_options<OptionsPack<Opts...>> {
    static_assert(count_options_by_tag<singleton_map_tag, Opts...> <= 1,
                  "[[[ YamlFusion ]]] A field may carry only one enum representation option");

    template<class Tag>
    using option_type = typename find_option_by_tag<Tag, Opts...>::type;

    template<class Tag>
    static constexpr bool has_option = !std::is_void_v<option_type<Tag>>;

    template<class Tag>
    using get_option = option_type<Tag>;

};

template<class Field>
struct annotation_meta{
    using value_t = Field;
    using options      = no_options;
    using OptionsP = OptionsPack<>;
    static constexpr decltype(auto) getRef(Field & f) {
        return (f);
    }
    static constexpr decltype(auto) getRef(const Field & f) {
        return (f);
    }
};

template<class T, class... Opts>
struct annotation_meta<std::optional<Annotated<T, Opts...>>> {
    static_assert(!sizeof(T), "[[[ YamlFusion ]]] Use Annotated<std::optional<T>, ...> instead of std::optional<Annotated<T, ...>>");
};

template<class T, class... Opts>
struct annotation_meta<std::unique_ptr<Annotated<T, Opts...>>> {
    static_assert(!sizeof(T), "[[[ YamlFusion ]]] Use Annotated<std::unique_ptr<T>, ...> instead of std::unique_ptr<Annotated<T, ...>>");
};

template<class T, class... Opts>
struct annotation_meta<Annotated<T, Opts...>> {
    using OptionsP = OptionsPack<Opts...>;

    using value_t = T;
    using options      = field_options<OptionsP>;

    static constexpr decltype(auto) getRef(Annotated<T, Opts...> & f) {
        return (f.value);
    }
    static constexpr decltype(auto) getRef(const Annotated<T, Opts...> & f) {
        return (f.value);
    }
};

// Entry point with decay
template<class Field>
struct annotation_meta_getter : annotation_meta<std::remove_cvref_t<Field>> {};

template<class AggregateT, std::size_t Index>
struct aggregate_field_opts {
    using Field   = introspection::structureElementTypeByIndex<Index, AggregateT>;
    using Meta = annotation_meta_getter<Field>;
    using options      = typename Meta::options;
};

template<class AggregateT, std::size_t Index>
using aggregate_field_opts_getter =  aggregate_field_opts<std::remove_cvref_t<AggregateT>, Index>::options;

} // namespace detail


} //namespace options


} // namespace YamlFusion
