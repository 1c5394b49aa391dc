#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <string_view>
#include <utility>

#include "options.hpp"
#include "static_schema.hpp"
#include "struct_introspection.hpp"

namespace YamlFusion {

namespace struct_fields_helper {

template<class T, std::size_t I>
static consteval bool fieldIsExcluded() {
    using Opts    = options::detail::aggregate_field_opts_getter<T, I>;
    return Opts::template has_option<options::detail::exclude_tag>;
}

struct FieldDescr {
    std::string_view name;
    std::size_t      originalIndex;
    bool             nullable;
};

template<class T>
struct FieldsHelper {
    static constexpr std::size_t NotFound = static_cast<std::size_t>(-1);

    static constexpr std::size_t rawFieldsCount = introspection::structureElementsCount<T>;

    // Fields that appear on the wire
    static constexpr std::size_t fieldsCount = []<std::size_t... I>(std::index_sequence<I...>) consteval{
        return (std::size_t{0} + ... + (!fieldIsExcluded<T, I>() ? 1: 0));
    }(std::make_index_sequence<rawFieldsCount>{});

    template<std::size_t I>
    static consteval std::string_view fieldName() {
        using Opts    = options::detail::aggregate_field_opts_getter<T, I>;
        if constexpr (Opts::template has_option<options::detail::key_tag>) {
            using KeyOpt = typename Opts::template get_option<options::detail::key_tag>;
            return KeyOpt::desc.toStringView();
        } else {
            return introspection::structureElementNameByIndex<I, T>;
        }
    }

    static constexpr std::array<FieldDescr, fieldsCount> fieldIndexesToFieldNames =
        []<std::size_t... I>(std::index_sequence<I...>) consteval {
            std::array<FieldDescr, fieldsCount> arr{};
            std::size_t index = 0;
            auto add_one = [&](auto ic) consteval {
                constexpr std::size_t J = decltype(ic)::value;
                if constexpr (!fieldIsExcluded<T, J>()) {
                    using Field = introspection::structureElementTypeByIndex<J, T>;
                    arr[index++] = FieldDescr{ fieldName<J>(), J,
                                               static_schema::YamlNullableParsableValue<Field> };
                }
            };
            (add_one(std::integral_constant<std::size_t, I>{}), ...);
            return arr;
        }(std::make_index_sequence<rawFieldsCount>{});

    static constexpr bool fieldsAreUnique = [](std::array<FieldDescr, fieldsCount> sortedArr) consteval{
        std::ranges::sort(sortedArr, {}, &FieldDescr::name);
        return std::ranges::adjacent_find(sortedArr, {}, &FieldDescr::name) == sortedArr.end();
    }(fieldIndexesToFieldNames);

    // Position in fieldIndexesToFieldNames, NotFound for unknown keys
    static constexpr std::size_t find(std::string_view name) {
        for(std::size_t i = 0; i < fieldsCount; i++) {
            if(fieldIndexesToFieldNames[i].name == name) {
                return i;
            }
        }
        return NotFound;
    }
};
}
}
