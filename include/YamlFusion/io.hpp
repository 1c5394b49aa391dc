#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace YamlFusion {

namespace io {

// Strict UTF-8: no overlong forms, no surrogates, nothing above U+10FFFF
constexpr bool is_valid_utf8(std::string_view text) {
    std::size_t i = 0;
    const std::size_t n = text.size();
    while(i < n) {
        const auto c = static_cast<std::uint8_t>(text[i]);
        std::size_t extra;
        std::uint32_t cp;
        if(c < 0x80) {
            i ++;
            continue;
        } else if((c & 0xE0) == 0xC0) {
            extra = 1; cp = c & 0x1F;
        } else if((c & 0xF0) == 0xE0) {
            extra = 2; cp = c & 0x0F;
        } else if((c & 0xF8) == 0xF0) {
            extra = 3; cp = c & 0x07;
        } else {
            return false;
        }
        if(i + extra >= n) {
            return false;
        }
        for(std::size_t k = 1; k <= extra; k ++) {
            const auto cc = static_cast<std::uint8_t>(text[i + k]);
            if((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }
        constexpr std::uint32_t minimum[] = {0, 0x80, 0x800, 0x10000};
        if(cp < minimum[extra] || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            return false;
        }
        i += extra + 1;
    }
    return true;
}

static_assert(is_valid_utf8("plain ascii"));
static_assert(is_valid_utf8("\xC3\xA9t\xC3\xA9"));
static_assert(!is_valid_utf8("\xC3"));
static_assert(!is_valid_utf8("\xC0\xAF"));
static_assert(!is_valid_utf8("\xED\xA0\x80"));

} // namespace io

} // namespace YamlFusion
