#pragma once

#include <cstddef>
#include <limits>
#include <string>
#include <string_view>
#include <vector>

namespace YamlFusion {
namespace path {

struct PathElement {
    static constexpr std::size_t NotAnIndex = std::numeric_limits<std::size_t>::max();

    std::size_t array_index = NotAnIndex;   // sequences and tuples
    std::string field_name;                 // struct fields, map keys, variant names

    constexpr bool is_index() const {
        return array_index != NotAnIndex;
    }
};

// Location of the value being processed, from the document root down
struct Path {
    std::vector<PathElement> storage;

    constexpr void push_index(std::size_t index) {
        storage.push_back(PathElement{index, {}});
    }
    constexpr void push_field(std::string_view name) {
        storage.push_back(PathElement{PathElement::NotAnIndex, std::string(name)});
    }
    constexpr void pop() {
        storage.pop_back();
    }
    constexpr std::size_t length() const {
        return storage.size();
    }

    // `$.field[3].Variant`
    std::string to_string() const {
        std::string out = "$";
        for(const auto & el : storage) {
            if(el.is_index()) {
                out += "[" + std::to_string(el.array_index) + "]";
            } else {
                out += "." + el.field_name;
            }
        }
        return out;
    }
};

} // namespace path
} // namespace YamlFusion
