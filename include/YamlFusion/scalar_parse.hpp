#pragma once

#include <charconv>
#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <string_view>
#include <system_error>

// Resolution of untagged plain scalars (YAML 1.2 core schema, plus the
// 0x/0o/0b integer prefixes). Shared by the reader and the string style chooser.

namespace YamlFusion {

namespace scalar {

namespace detail {

constexpr int digit_value(char c) {
    if(c >= '0' && c <= '9') return c - '0';
    if(c >= 'a' && c <= 'z') return c - 'a' + 10;
    if(c >= 'A' && c <= 'Z') return c - 'A' + 10;
    return -1;
}

constexpr bool starts_with_sign(std::string_view s) {
    return !s.empty() && (s.front() == '+' || s.front() == '-');
}

constexpr std::optional<std::uint64_t> parse_magnitude(std::string_view digits, unsigned radix) {
    if(digits.empty()) return std::nullopt;
    std::uint64_t v = 0;
    for(char c : digits) {
        const int d = digit_value(c);
        if(d < 0 || static_cast<unsigned>(d) >= radix) return std::nullopt;
        if(v > (std::numeric_limits<std::uint64_t>::max() - static_cast<std::uint64_t>(d)) / radix) {
            return std::nullopt;
        }
        v = v * radix + static_cast<std::uint64_t>(d);
    }
    return v;
}

struct RadixPrefix {
    std::string_view prefix;
    unsigned radix;
};

inline constexpr RadixPrefix radix_prefixes[] = {{"0x", 16}, {"0o", 8}, {"0b", 2}};

constexpr std::optional<std::int64_t> negate_magnitude(std::uint64_t m) {
    constexpr std::uint64_t limit = std::uint64_t(std::numeric_limits<std::int64_t>::max()) + 1;
    if(m > limit) return std::nullopt;
    if(m == limit) return std::numeric_limits<std::int64_t>::min();
    return -static_cast<std::int64_t>(m);
}

} // namespace detail

constexpr bool parse_null(std::string_view s) {
    return s == "~" || s == "null" || s == "Null" || s == "NULL";
}

constexpr std::optional<bool> parse_bool(std::string_view s) {
    if(s == "true" || s == "True" || s == "TRUE") return true;
    if(s == "false" || s == "False" || s == "FALSE") return false;
    return std::nullopt;
}

// Leading zero followed by more digits is a string in YAML 1.2, not an octal or decimal number
constexpr bool digits_but_not_number(std::string_view scalar) {
    if(detail::starts_with_sign(scalar)) scalar.remove_prefix(1);
    if(scalar.size() <= 1 || scalar.front() != '0') return false;
    for(char c : scalar.substr(1)) {
        if(c < '0' || c > '9') return false;
    }
    return true;
}

constexpr std::optional<std::uint64_t> parse_unsigned_int(std::string_view scalar) {
    std::string_view unpositive = scalar;
    if(unpositive.starts_with('+')) {
        unpositive.remove_prefix(1);
        if(detail::starts_with_sign(unpositive)) return std::nullopt;
    }
    for(const auto & p : detail::radix_prefixes) {
        if(unpositive.starts_with(p.prefix)) {
            std::string_view rest = unpositive.substr(p.prefix.size());
            if(detail::starts_with_sign(rest)) return std::nullopt;
            if(auto v = detail::parse_magnitude(rest, p.radix)) return v;
        }
    }
    if(detail::starts_with_sign(unpositive)) return std::nullopt;
    if(digits_but_not_number(scalar)) return std::nullopt;
    return detail::parse_magnitude(unpositive, 10);
}

// Only succeeds for values below zero; everything else is handled by parse_unsigned_int
constexpr std::optional<std::int64_t> parse_negative_int(std::string_view scalar) {
    if(!scalar.starts_with('-')) return std::nullopt;
    std::string_view unsigned_part = scalar.substr(1);
    if(detail::starts_with_sign(unsigned_part)) return std::nullopt;
    for(const auto & p : detail::radix_prefixes) {
        if(unsigned_part.starts_with(p.prefix)) {
            std::string_view rest = unsigned_part.substr(p.prefix.size());
            if(detail::starts_with_sign(rest)) return std::nullopt;
            if(auto m = detail::parse_magnitude(rest, p.radix)) return detail::negate_magnitude(*m);
        }
    }
    if(digits_but_not_number(scalar)) return std::nullopt;
    if(auto m = detail::parse_magnitude(unsigned_part, 10)) return detail::negate_magnitude(*m);
    return std::nullopt;
}

inline std::optional<double> parse_f64(std::string_view scalar) {
    std::string_view unpositive = scalar;
    if(unpositive.starts_with('+')) {
        unpositive.remove_prefix(1);
        if(detail::starts_with_sign(unpositive)) return std::nullopt;
    }
    if(unpositive == ".inf" || unpositive == ".Inf" || unpositive == ".INF") {
        return std::numeric_limits<double>::infinity();
    }
    if(scalar == "-.inf" || scalar == "-.Inf" || scalar == "-.INF") {
        return -std::numeric_limits<double>::infinity();
    }
    if(scalar == ".nan" || scalar == ".NaN" || scalar == ".NAN") {
        return std::numeric_limits<double>::quiet_NaN();
    }
    if(unpositive.empty()) return std::nullopt;
    double v = 0;
    const char * first = unpositive.data();
    const char * last = unpositive.data() + unpositive.size();
    auto [ptr, ec] = std::from_chars(first, last, v, std::chars_format::general);
    if(ec != std::errc() || ptr != last || !std::isfinite(v)) {
        return std::nullopt;
    }
    return v;
}

// Lowercase view of short tokens, enough for the keyword comparisons below
namespace detail {
constexpr bool iequals(std::string_view s, std::string_view lower) {
    if(s.size() != lower.size()) return false;
    for(std::size_t i = 0; i < s.size(); i ++) {
        char c = s[i];
        if(c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
        if(c != lower[i]) return false;
    }
    return true;
}
}

// Strings that a reader could mistake for another type if written plain
constexpr bool ambiguous_string(std::string_view s) {
    if(s.empty()) return true;
    if(detail::iequals(s, "true") || detail::iequals(s, "false") || detail::iequals(s, "null") || s == "~") {
        return true;
    }
    const char c = s.front();
    return (c >= '0' && c <= '9') || c == '-' || c == '+' || c == '.';
}

// The YAML 1.1 booleans that older parsers still resolve
constexpr bool is_bool_like_token(std::string_view s) {
    for(std::string_view token : {"y", "yes", "n", "no", "true", "false", "on", "off"}) {
        if(detail::iequals(s, token)) return true;
    }
    return false;
}

// Displayed text of the form `!Name` names a tag; returns `Name`
constexpr std::optional<std::string_view> tag_name_of(std::string_view text) {
    if(text.size() > 1 && text.front() == '!') return text.substr(1);
    return std::nullopt;
}

} // namespace scalar

} // namespace YamlFusion
