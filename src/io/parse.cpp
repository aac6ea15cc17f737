#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>

#include "frac/io/parse.hpp"
#include "frac/util/quote.hpp"

namespace frac::io {

    namespace {

        using detail::parse_action;
        using detail::parse_state;

        constexpr std::int64_t INT_MAX64 = std::numeric_limits<std::int64_t>::max();
        constexpr std::int64_t INT_MIN64 = std::numeric_limits<std::int64_t>::min();

        // Computes `num * radix +/- digit`, refusing to leave the int64 range.
        // The bounds are checked before multiplying, so no signed overflow occurs.
        errc accumulate(std::int64_t &num, int radix, bool negative, int digit) noexcept {
            const std::int64_t r = radix;
            if (negative) {
                if (num < (INT_MIN64 + digit) / r) {
                    return errc::underflow;
                }
                num = num * r - digit;
            } else {
                if (num > (INT_MAX64 - digit) / r) {
                    return errc::overflow;
                }
                num = num * r + digit;
            }
            return errc{};
        }

        parse_result failure(errc code, std::size_t position = 0, char32_t codepoint = U'\0') noexcept {
            parse_result result;
            result.ec = code;
            result.position = position;
            result.codepoint = codepoint;
            return result;
        }

        std::string describe(std::string_view text, unsigned frac, int radix) {
            return "can't parse " + util::quote(text) + " as number (radix " + std::to_string(radix) +
                   ", fraction " + std::to_string(frac) + ")";
        }

        std::string message_for(const parse_result &result,
                                std::string_view text,
                                unsigned frac,
                                int radix) {
            switch (result.ec) {
            case errc::empty_input:
                return "can't parse empty input as number";
            case errc::unsupported_radix:
                return "can't parse " + util::quote(text) + " as number: unsupported radix " +
                       std::to_string(radix);
            case errc::invalid_digit:
                return describe(text, frac, radix) + ": found non-digit character " +
                       util::quote_char(result.codepoint);
            case errc::precision_exceeded:
                return describe(text, frac, radix) + ": fraction exceeds allotted precision";
            case errc::overflow:
                return "can't parse " + util::quote(text) + " as number: overflow of int64";
            case errc::underflow:
                return "can't parse " + util::quote(text) + " as number: underflow of int64";
            case errc::unexpected_end:
                return describe(text, frac, radix) + ": unexpected end of input";
            default:
                return describe(text, frac, radix) + ": " + std::string(errc_name(result.ec));
            }
        }

    } // namespace

    parse_result try_parse(std::string_view text, unsigned frac, int radix) noexcept {
        if (text.empty()) {
            return failure(errc::empty_input);
        }
        if (!core::detail::supports_radix(radix)) {
            return failure(errc::unsupported_radix);
        }

        parse_state state = parse_state::sign;
        bool negative = false;
        unsigned fraction_digits = 0;
        std::int64_t num = 0;

        for (std::size_t index = 0; index < text.size(); ++index) {
            const char ch = text[index];
            const auto step = detail::next_state(state, ch);
            state = step.state;
            if (step.action == parse_action::skip) {
                negative = negative || step.negative;
                continue;
            }

            const int digit = core::detail::digit_value(ch, radix);
            if (digit == core::detail::NOT_A_DIGIT) {
                return failure(errc::invalid_digit, index, core::detail::codepoint_at(text, index));
            }

            if (state == parse_state::fraction) {
                ++fraction_digits;
                if (fraction_digits > frac) {
                    if (digit == 0) {
                        continue;
                    }
                    return failure(errc::precision_exceeded, index);
                }
            }

            if (const errc ec = accumulate(num, radix, negative, digit); ec != errc{}) {
                return failure(ec, index);
            }
        }

        if (!detail::is_accepting(state)) {
            return failure(errc::unexpected_end, text.size());
        }

        // Pad the missing fractional digits with zeros. Zero stays zero, and any
        // other value overflows within 64 steps, so huge `frac` values terminate.
        for (; fraction_digits < frac && num != 0; ++fraction_digits) {
            if (const errc ec = accumulate(num, radix, negative, 0); ec != errc{}) {
                return failure(ec, text.size());
            }
        }

        parse_result result;
        result.value = num;
        return result;
    }

    std::int64_t parse(std::string_view text, unsigned frac, int radix) {
        const parse_result result = try_parse(text, frac, radix);
        if (result.ec == errc::overflow || result.ec == errc::underflow) {
            throw range_error(result.ec,
                              message_for(result, text, frac, radix),
                              std::string(text),
                              frac,
                              radix,
                              result.position);
        }
        if (!result) {
            throw invalid_input(result.ec,
                                message_for(result, text, frac, radix),
                                std::string(text),
                                frac,
                                radix,
                                result.codepoint,
                                result.position);
        }
        return result.value;
    }

} // namespace frac::io
