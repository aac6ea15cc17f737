// include/frac/io/parse.hpp — Parsing fractional strings into scaled 64-bit integers.

#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

#include <frac/core/detail/digits.hpp>
#include <frac/core/error.hpp>

namespace frac::io {

    namespace detail {

        enum class parse_state {
            sign,
            mantissa_start,
            mantissa,
            fraction_start,
            fraction,
        };

        enum class parse_action {
            skip,  // structural character (sign or point), consumed without a digit
            digit, // character must be validated and accumulated as a digit
        };

        struct parse_step {
            parse_state state;
            parse_action action;
            bool negative = false;
        };

        // The single transition function of the parser. Digit validity against the
        // radix is checked by the caller for parse_action::digit, so a point outside
        // the mantissa state surfaces as an invalid digit.
        constexpr parse_step next_state(parse_state state, char ch) noexcept {
            switch (state) {
            case parse_state::sign:
                if (ch == '+') {
                    return {parse_state::mantissa_start, parse_action::skip};
                }
                if (ch == '-') {
                    return {parse_state::mantissa_start, parse_action::skip, true};
                }
                return {parse_state::mantissa, parse_action::digit};
            case parse_state::mantissa_start:
                return {parse_state::mantissa, parse_action::digit};
            case parse_state::mantissa:
                if (ch == '.') {
                    return {parse_state::fraction_start, parse_action::skip};
                }
                return {parse_state::mantissa, parse_action::digit};
            case parse_state::fraction_start:
            case parse_state::fraction:
                return {parse_state::fraction, parse_action::digit};
            }
            return {state, parse_action::digit};
        }

        constexpr bool is_accepting(parse_state state) noexcept {
            return state == parse_state::mantissa || state == parse_state::fraction;
        }

    } // namespace detail

    struct parse_result {
        std::int64_t value = 0;
        errc ec{};
        // Byte offset and decoded character of the first invalid digit.
        std::size_t position = 0;
        char32_t codepoint = U'\0';

        explicit operator bool() const noexcept { return ec == errc{}; }
    };

    /// Parses `text` as a number with an optional sign and fractional part into an
    /// integer scaled by `radix^frac`. For `frac = 2, radix = 10`, "123.45" becomes
    /// 12345 while "123.456" is rejected. Extra fractional digits are accepted only
    /// when they are zero, so "1.2300" parses to 123.
    parse_result try_parse(std::string_view text, unsigned frac, int radix) noexcept;

    /// Same as try_parse but throws frac::error.
    std::int64_t parse(std::string_view text, unsigned frac, int radix);

    inline std::string_view as_text(std::span<const std::byte> bytes) noexcept {
        return {reinterpret_cast<const char *>(bytes.data()), bytes.size()};
    }

    inline std::string_view as_text(std::span<const unsigned char> bytes) noexcept {
        return {reinterpret_cast<const char *>(bytes.data()), bytes.size()};
    }

    inline std::int64_t parse(std::span<const std::byte> bytes, unsigned frac, int radix) {
        return parse(as_text(bytes), frac, radix);
    }

    inline std::int64_t parse(std::span<const unsigned char> bytes, unsigned frac, int radix) {
        return parse(as_text(bytes), frac, radix);
    }

    inline parse_result try_parse(std::span<const std::byte> bytes, unsigned frac, int radix) noexcept {
        return try_parse(as_text(bytes), frac, radix);
    }

    inline parse_result try_parse(std::span<const unsigned char> bytes,
                                  unsigned frac,
                                  int radix) noexcept {
        return try_parse(as_text(bytes), frac, radix);
    }

    inline std::int64_t parse_bin(std::string_view text, unsigned frac) { return parse(text, frac, 2); }
    inline std::int64_t parse_oct(std::string_view text, unsigned frac) { return parse(text, frac, 8); }
    inline std::int64_t parse_dec(std::string_view text, unsigned frac) { return parse(text, frac, 10); }
    inline std::int64_t parse_hex(std::string_view text, unsigned frac) { return parse(text, frac, 16); }

    inline parse_result try_parse_bin(std::string_view text, unsigned frac) noexcept {
        return try_parse(text, frac, 2);
    }
    inline parse_result try_parse_oct(std::string_view text, unsigned frac) noexcept {
        return try_parse(text, frac, 8);
    }
    inline parse_result try_parse_dec(std::string_view text, unsigned frac) noexcept {
        return try_parse(text, frac, 10);
    }
    inline parse_result try_parse_hex(std::string_view text, unsigned frac) noexcept {
        return try_parse(text, frac, 16);
    }

} // namespace frac::io
