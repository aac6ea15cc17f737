// include/frac/core/detail/digits.hpp — Digit glyphs and radix helpers shared by parse/format.

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace frac::core::detail {

    constexpr std::array<char, 36> make_digits() {
        std::array<char, 36> digits{};
        std::size_t index = 0;
        for (char value = '0'; value <= '9'; ++value) {
            digits[index++] = value;
        }
        for (char value = 'a'; value <= 'z'; ++value) {
            digits[index++] = value;
        }
        return digits;
    }

    constexpr std::array<char, 36> DIGITS = make_digits();

    constexpr int MIN_RADIX = 2;
    constexpr int MAX_RADIX = static_cast<int>(DIGITS.size());

    // Returned by digit_value for anything outside [0-9a-zA-Z] or past the radix.
    constexpr int NOT_A_DIGIT = -1;

    constexpr bool supports_radix(int radix) noexcept {
        return radix >= MIN_RADIX && radix <= MAX_RADIX;
    }

    constexpr char digit_char(int digit) noexcept { return DIGITS[static_cast<std::size_t>(digit)]; }

    constexpr int digit_value(char ch) noexcept {
        if (ch >= '0' && ch <= '9') {
            return ch - '0';
        }
        // ASCII upper and lower case differ only in bit 5.
        const char lower = static_cast<char>(ch | ('a' - 'A'));
        if (lower >= 'a' && lower <= 'z') {
            return 10 + (lower - 'a');
        }
        return NOT_A_DIGIT;
    }

    constexpr int digit_value(char ch, int radix) noexcept {
        const int digit = digit_value(ch);
        if (digit == NOT_A_DIGIT || digit >= radix) {
            return NOT_A_DIGIT;
        }
        return digit;
    }

    constexpr char32_t REPLACEMENT_CHARACTER = U'\uFFFD';

    // Decodes the UTF-8 sequence that starts at `index`. Truncated or malformed
    // sequences decode to U+FFFD so diagnostics never fail.
    inline char32_t codepoint_at(std::string_view text, std::size_t index) noexcept {
        if (index >= text.size()) {
            return U'\0';
        }
        const auto lead = static_cast<unsigned char>(text[index]);
        std::size_t length = 0;
        char32_t value = 0;
        if (lead < 0x80) {
            return lead;
        } else if ((lead & 0xE0) == 0xC0) {
            length = 2;
            value = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            length = 3;
            value = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            length = 4;
            value = lead & 0x07;
        } else {
            return REPLACEMENT_CHARACTER;
        }
        if (index + length > text.size()) {
            return REPLACEMENT_CHARACTER;
        }
        for (std::size_t offset = 1; offset < length; ++offset) {
            const auto next = static_cast<unsigned char>(text[index + offset]);
            if ((next & 0xC0) != 0x80) {
                return REPLACEMENT_CHARACTER;
            }
            value = (value << 6) | (next & 0x3F);
        }
        return value;
    }

} // namespace frac::core::detail
