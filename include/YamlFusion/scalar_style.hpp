#pragma once

#include <string_view>

#include "scalar_parse.hpp"

namespace YamlFusion {

enum class ScalarStyle {
    Plain,          // left to the emitter
    SingleQuoted,
    Literal
};

constexpr std::string_view style_to_string(ScalarStyle s) {
    switch(s) {
    case ScalarStyle::Plain: return "Plain"; break;
    case ScalarStyle::SingleQuoted: return "SingleQuoted"; break;
    case ScalarStyle::Literal: return "Literal"; break;
    }
    return "N/A";
}

// Picks the style a string value must be written with to read back as the same string.
// Any text an untagged plain scalar would resolve to null, bool, int or float gets quoted;
// every such number starts with a digit, sign or dot, which ambiguous_string already covers.
constexpr ScalarStyle classify_string_style(std::string_view value) {
    if(scalar::is_bool_like_token(value)) {
        return ScalarStyle::SingleQuoted;
    }
    if(value.find('\n') != std::string_view::npos) {
        return ScalarStyle::Literal;
    }
    if(scalar::parse_null(value) || scalar::parse_bool(value) || scalar::ambiguous_string(value)) {
        return ScalarStyle::SingleQuoted;
    }
    return ScalarStyle::Plain;
}

} // namespace YamlFusion
