#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "const_string.hpp"

namespace YamlFusion {

// Alternatives of an Enum. The name is the variant name used on the wire.

template<ConstString Name>
struct Unit {
    static_assert(Name.Length > 0 && Name.check(), "[[[ YamlFusion ]]] Variant name must be non-empty and printable");
    static constexpr std::string_view name = Name.toStringView();
    constexpr bool operator==(const Unit &) const = default;
};

template<ConstString Name, class T>
struct Newtype {
    static_assert(Name.Length > 0 && Name.check(), "[[[ YamlFusion ]]] Variant name must be non-empty and printable");
    static constexpr std::string_view name = Name.toStringView();
    using payload_type = T;
    T value{};
    constexpr bool operator==(const Newtype &) const = default;
};

template<ConstString Name, class... Ts>
struct Tuple {
    static_assert(Name.Length > 0 && Name.check(), "[[[ YamlFusion ]]] Variant name must be non-empty and printable");
    static constexpr std::string_view name = Name.toStringView();
    using payload_type = std::tuple<Ts...>;
    std::tuple<Ts...> values{};
    constexpr bool operator==(const Tuple &) const = default;
};

// Payload S is an aggregate whose fields are written as a mapping
template<ConstString Name, class S>
struct Struct {
    static_assert(Name.Length > 0 && Name.check(), "[[[ YamlFusion ]]] Variant name must be non-empty and printable");
    static_assert(std::is_aggregate_v<S>, "[[[ YamlFusion ]]] Struct variant payload must be an aggregate");
    static constexpr std::string_view name = Name.toStringView();
    using payload_type = S;
    S fields{};
    constexpr bool operator==(const Struct &) const = default;
};

namespace enum_details {

template<class T> struct is_unit_variant : std::false_type {};
template<ConstString N> struct is_unit_variant<Unit<N>> : std::true_type {};

template<class T> struct is_newtype_variant : std::false_type {};
template<ConstString N, class T> struct is_newtype_variant<Newtype<N, T>> : std::true_type {};

template<class T> struct is_tuple_variant : std::false_type {};
template<ConstString N, class... Ts> struct is_tuple_variant<Tuple<N, Ts...>> : std::true_type {};

template<class T> struct is_struct_variant : std::false_type {};
template<ConstString N, class S> struct is_struct_variant<Struct<N, S>> : std::true_type {};

template<class T>
concept VariantAlternative = is_unit_variant<T>::value || is_newtype_variant<T>::value
                             || is_tuple_variant<T>::value || is_struct_variant<T>::value;

template<class... Alts>
consteval bool names_are_unique() {
    constexpr std::string_view names[] = {Alts::name...};
    for(std::size_t i = 0; i < sizeof...(Alts); i ++) {
        for(std::size_t j = i + 1; j < sizeof...(Alts); j ++) {
            if(names[i] == names[j]) return false;
        }
    }
    return true;
}

}

// A sum type whose alternatives are named variants
template<enum_details::VariantAlternative... Alternatives>
struct Enum {
    static_assert(sizeof...(Alternatives) > 0, "[[[ YamlFusion ]]] Enum needs at least one variant");
    static_assert(enum_details::names_are_unique<Alternatives...>(), "[[[ YamlFusion ]]] Enum variant names must be unique");

    static constexpr std::size_t VariantCount = sizeof...(Alternatives);
    using variant_type = std::variant<Alternatives...>;

    variant_type value;

    constexpr Enum() = default;

    template<class Alt>
        requires (std::is_same_v<std::remove_cvref_t<Alt>, Alternatives> || ...)
    constexpr Enum(Alt && alt) : value(std::forward<Alt>(alt)) {}

    template<class Alt>
    constexpr bool holds() const {
        return std::holds_alternative<Alt>(value);
    }

    template<class Alt>
    constexpr const Alt & as() const {
        return std::get<Alt>(value);
    }

    constexpr std::string_view variant_name() const {
        return std::visit([](const auto & alt) { return std::remove_cvref_t<decltype(alt)>::name; }, value);
    }

    // Index of the alternative named `name`, VariantCount if none
    static constexpr std::size_t index_of(std::string_view name) {
        constexpr std::string_view names[] = {Alternatives::name...};
        for(std::size_t i = 0; i < VariantCount; i ++) {
            if(names[i] == name) return i;
        }
        return VariantCount;
    }

    constexpr bool operator==(const Enum &) const = default;
};

// Raw bytes have no YAML representation; writing them is an error
struct Bytes {
    std::vector<std::uint8_t> data;
    constexpr bool operator==(const Bytes &) const = default;
};

// A value carrying an explicit YAML tag: written as `!tag value`
template<class T>
struct Tagged {
    std::string tag;
    T value{};
    constexpr bool operator==(const Tagged &) const = default;
};

namespace enum_details {
template<class T> struct is_enum : std::false_type {};
template<class... Alts> struct is_enum<Enum<Alts...>> : std::true_type {};

template<class T> struct is_tagged : std::false_type {};
template<class T> struct is_tagged<Tagged<T>> : std::true_type {};
}

} // namespace YamlFusion
