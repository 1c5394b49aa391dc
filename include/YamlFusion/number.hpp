#pragma once

#include <array>
#include <bit>
#include <charconv>
#include <compare>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

#include "errors.hpp"
#include "scalar_parse.hpp"

namespace YamlFusion {

namespace number_details {

inline constexpr double canonical_nan = std::bit_cast<double>(std::uint64_t{0x7ff8000000000000ull});

constexpr bool is_nan(double f) {
    return f != f;
}

// Enough for "-18446744073709551615" and for any shortest round-trip double
inline constexpr std::size_t MaxFormattedLength = 32;
using FormatBuffer = std::array<char, MaxFormattedLength>;

constexpr std::size_t format_unsigned(std::uint64_t v, char * out) {
    char tmp[20];
    std::size_t n = 0;
    do {
        tmp[n++] = static_cast<char>('0' + v % 10);
        v /= 10;
    } while(v != 0);
    for(std::size_t i = 0; i < n; i ++) {
        out[i] = tmp[n - 1 - i];
    }
    return n;
}

constexpr std::size_t format_signed(std::int64_t v, char * out) {
    if(v >= 0) {
        return format_unsigned(static_cast<std::uint64_t>(v), out);
    }
    out[0] = '-';
    const std::uint64_t magnitude = std::uint64_t(0) - static_cast<std::uint64_t>(v);
    return 1 + format_unsigned(magnitude, out + 1);
}

// YAML spelling for floats: .nan/.inf/-.inf, otherwise the shortest form that
// still reads back as a float of the same width ("1" becomes "1.0")
template<std::floating_point F>
std::size_t format_floating(F f, char * out) {
    std::string_view special;
    if(f != f) {
        special = ".nan";
    } else if(f == std::numeric_limits<F>::infinity()) {
        special = ".inf";
    } else if(f == -std::numeric_limits<F>::infinity()) {
        special = "-.inf";
    }
    if(!special.empty()) {
        for(std::size_t i = 0; i < special.size(); i ++) out[i] = special[i];
        return special.size();
    }
    auto [ptr, ec] = std::to_chars(out, out + MaxFormattedLength - 2, f);
    if(ec != std::errc()) {
        return 0;
    }
    std::size_t n = static_cast<std::size_t>(ptr - out);
    if(std::string_view(out, n).find_first_of(".e") == std::string_view::npos) {
        out[n++] = '.';
        out[n++] = '0';
    }
    return n;
}

inline std::size_t format_double(double f, char * out) {
    return format_floating(f, out);
}

template<class Int>
constexpr Int saturate_from_double(double f) {
    if(is_nan(f)) return 0;
    constexpr double upper = static_cast<double>(std::numeric_limits<Int>::max()) + 1.0;
    constexpr double lower = static_cast<double>(std::numeric_limits<Int>::min()) - 1.0;
    if(f >= upper) return std::numeric_limits<Int>::max();
    if(f <= lower) return std::numeric_limits<Int>::min();
    return static_cast<Int>(f);
}

} // namespace number_details

// A YAML number: an integer that is kept exact on either side of zero, or a double.
// NaN is stored as a single canonical positive quiet NaN.
class Number {
public:
    enum class Kind : std::uint8_t {
        PositiveInteger,
        NegativeInteger,
        Float
    };

    constexpr Number() = default;

    template<class T>
        requires (std::integral<T> && !std::same_as<T, bool>)
    constexpr Number(T v) {
        if constexpr (std::is_signed_v<T>) {
            if(v < 0) {
                kind_ = Kind::NegativeInteger;
                negative_ = static_cast<std::int64_t>(v);
                return;
            }
        }
        kind_ = Kind::PositiveInteger;
        positive_ = static_cast<std::uint64_t>(v);
    }

    template<std::floating_point F>
    constexpr Number(F f) :
        kind_(Kind::Float),
        float_(number_details::is_nan(static_cast<double>(f)) ? number_details::canonical_nan : static_cast<double>(f))
    {}

    static constexpr Number from_i64(std::int64_t v) { return Number(v); }
    static constexpr Number from_u64(std::uint64_t v) { return Number(v); }
    static constexpr Number from_f64(double v) { return Number(v); }

    constexpr Kind kind() const { return kind_; }

    constexpr bool is_i64() const {
        switch(kind_) {
        case Kind::PositiveInteger: return positive_ <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
        case Kind::NegativeInteger: return true;
        case Kind::Float: return false;
        }
        return false;
    }
    constexpr bool is_u64() const { return kind_ == Kind::PositiveInteger; }
    constexpr bool is_f64() const { return kind_ == Kind::Float; }

    constexpr std::optional<std::int64_t> as_i64() const {
        if(!is_i64()) return std::nullopt;
        return kind_ == Kind::PositiveInteger ? static_cast<std::int64_t>(positive_) : negative_;
    }
    constexpr std::optional<std::uint64_t> as_u64() const {
        if(!is_u64()) return std::nullopt;
        return positive_;
    }
    // Every number has a (possibly rounded) double value
    constexpr std::optional<double> as_f64() const {
        return to_f64();
    }

    constexpr bool is_nan() const {
        return kind_ == Kind::Float && number_details::is_nan(float_);
    }
    constexpr bool is_infinite() const {
        return kind_ == Kind::Float && !is_nan() &&
               (float_ == std::numeric_limits<double>::infinity() || float_ == -std::numeric_limits<double>::infinity());
    }
    constexpr bool is_finite() const {
        return kind_ != Kind::Float || (!is_nan() && !is_infinite());
    }

    constexpr std::int16_t to_i16() const { return to_signed_saturating<std::int16_t>(); }
    constexpr std::int32_t to_i32() const { return to_signed_saturating<std::int32_t>(); }

    constexpr std::uint32_t to_u32() const {
        constexpr std::uint32_t max = std::numeric_limits<std::uint32_t>::max();
        switch(kind_) {
        case Kind::PositiveInteger: return positive_ > max ? max : static_cast<std::uint32_t>(positive_);
        case Kind::NegativeInteger: return 0;
        case Kind::Float:
            if(number_details::is_nan(float_) || float_ < 0.0) return 0;
            if(float_ >= static_cast<double>(max) + 1.0) return max;
            return static_cast<std::uint32_t>(float_);
        }
        return 0;
    }

    constexpr double to_f64() const {
        switch(kind_) {
        case Kind::PositiveInteger: return static_cast<double>(positive_);
        case Kind::NegativeInteger: return static_cast<double>(negative_);
        case Kind::Float: return float_;
        }
        return 0;
    }
    constexpr float to_f32() const {
        return static_cast<float>(to_f64());
    }

    // Total order: negative integers < positive integers < floats.
    // Floats compare by value with NaN above everything; -0.0 and 0.0 are equivalent.
    constexpr std::weak_ordering total_cmp(const Number & other) const {
        if(kind_ != other.kind_) {
            return rank() <=> other.rank();
        }
        switch(kind_) {
        case Kind::PositiveInteger: return positive_ <=> other.positive_;
        case Kind::NegativeInteger: return negative_ <=> other.negative_;
        case Kind::Float: {
            const bool ln = number_details::is_nan(float_);
            const bool rn = number_details::is_nan(other.float_);
            if(ln || rn) {
                return ln == rn ? std::weak_ordering::equivalent
                                : (ln ? std::weak_ordering::greater : std::weak_ordering::less);
            }
            if(float_ < other.float_) return std::weak_ordering::less;
            if(float_ > other.float_) return std::weak_ordering::greater;
            return std::weak_ordering::equivalent;
        }
        }
        return std::weak_ordering::equivalent;
    }

    friend constexpr bool operator==(const Number & a, const Number & b) {
        if(a.kind_ != b.kind_) return false;
        switch(a.kind_) {
        case Kind::PositiveInteger: return a.positive_ == b.positive_;
        case Kind::NegativeInteger: return a.negative_ == b.negative_;
        case Kind::Float:
            if(a.is_nan() && b.is_nan()) return true;
            return a.float_ == b.float_;
        }
        return false;
    }

    // Float against float follows IEEE comparison (NaN against a number is unordered,
    // two NaNs are equivalent); every other pairing uses total_cmp.
    friend constexpr std::partial_ordering operator<=>(const Number & a, const Number & b) {
        if(a.kind_ == Kind::Float && b.kind_ == Kind::Float) {
            if(a.is_nan() && b.is_nan()) return std::partial_ordering::equivalent;
            return a.float_ <=> b.float_;
        }
        return a.total_cmp(b);
    }

    std::size_t hash() const {
        switch(kind_) {
        case Kind::PositiveInteger: return std::hash<std::uint64_t>{}(positive_);
        case Kind::NegativeInteger: return std::hash<std::int64_t>{}(negative_);
        case Kind::Float:
            // -0.0 == 0.0, so both must hash alike
            return std::hash<std::uint64_t>{}(std::bit_cast<std::uint64_t>(float_ == 0.0 ? 0.0 : float_));
        }
        return 0;
    }

    // Writes the YAML text of the number, returns its length (0 on formatting failure)
    constexpr std::size_t format(number_details::FormatBuffer & buf) const {
        switch(kind_) {
        case Kind::PositiveInteger: return number_details::format_unsigned(positive_, buf.data());
        case Kind::NegativeInteger: return number_details::format_signed(negative_, buf.data());
        case Kind::Float: return number_details::format_double(float_, buf.data());
        }
        return 0;
    }

    std::string to_string() const {
        number_details::FormatBuffer buf{};
        return std::string(buf.data(), format(buf));
    }

    // Integer grammar first (with radix prefixes), then the float grammar.
    // Zero-padded digit runs like "007" are strings, not numbers.
    static NumberParseError from_str(std::string_view text, Number & out) {
        if(auto u = scalar::parse_unsigned_int(text)) {
            out = Number(*u);
            return NumberParseError::NO_ERROR;
        }
        if(auto i = scalar::parse_negative_int(text)) {
            out = Number(*i);
            return NumberParseError::NO_ERROR;
        }
        if(scalar::digits_but_not_number(text)) {
            return NumberParseError::FAILED_TO_PARSE_NUMBER;
        }
        if(auto f = scalar::parse_f64(text)) {
            out = Number(*f);
            return NumberParseError::NO_ERROR;
        }
        return NumberParseError::FAILED_TO_PARSE_FLOAT;
    }

private:
    constexpr int rank() const {
        switch(kind_) {
        case Kind::NegativeInteger: return 0;
        case Kind::PositiveInteger: return 1;
        case Kind::Float: return 2;
        }
        return 0;
    }

    template<class Int>
    constexpr Int to_signed_saturating() const {
        constexpr std::int64_t max = std::numeric_limits<Int>::max();
        constexpr std::int64_t min = std::numeric_limits<Int>::min();
        switch(kind_) {
        case Kind::PositiveInteger:
            return positive_ > static_cast<std::uint64_t>(max) ? static_cast<Int>(max) : static_cast<Int>(positive_);
        case Kind::NegativeInteger:
            return negative_ < min ? static_cast<Int>(min) : static_cast<Int>(negative_);
        case Kind::Float:
            return number_details::saturate_from_double<Int>(float_);
        }
        return 0;
    }

    Kind kind_ = Kind::PositiveInteger;
    std::uint64_t positive_ = 0;
    std::int64_t negative_ = 0;
    double float_ = 0;
};

} // namespace YamlFusion

template<>
struct std::hash<YamlFusion::Number> {
    std::size_t operator()(const YamlFusion::Number & n) const {
        return n.hash();
    }
};
