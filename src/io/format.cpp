#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "frac/io/format.hpp"

namespace frac::io {

    namespace {

        // Every bit of the magnitude as a base-2 digit, plus the point and a leading zero.
        constexpr std::size_t LOCAL_CAPACITY = sizeof(std::int64_t) * 8 + 3;

        struct rendering {
            std::array<char, LOCAL_CAPACITY> local{};
            std::size_t begin = LOCAL_CAPACITY;
            bool negative = false;
            // When set, the text is "0." followed by this many zeros and then `local`.
            std::size_t zero_padding = 0;

            std::size_t size() const noexcept {
                std::size_t total = (LOCAL_CAPACITY - begin) + (negative ? 1 : 0);
                if (zero_padding != 0) {
                    total += 2 + zero_padding;
                }
                return total;
            }

            template <typename Out> Out copy(Out out) const {
                if (negative) {
                    *out++ = '-';
                }
                if (zero_padding != 0) {
                    *out++ = '0';
                    *out++ = '.';
                    out = std::fill_n(out, zero_padding, '0');
                }
                return std::copy(local.begin() + static_cast<std::ptrdiff_t>(begin), local.end(), out);
            }
        };

        // Emits digits least-significant first. Fractional zeros are skipped until the
        // first nonzero fractional digit; the radix must already be validated.
        rendering render(std::int64_t value, unsigned frac, int radix) noexcept {
            rendering result;
            std::size_t index = LOCAL_CAPACITY;

            std::uint64_t magnitude = static_cast<std::uint64_t>(value);
            if (value < 0) {
                result.negative = true;
                magnitude = 0 - magnitude;
            }

            const auto base = static_cast<std::uint64_t>(radix);
            bool trailing = true;

            while (frac > 0 && magnitude != 0) {
                --frac;
                const auto digit = magnitude % base;
                magnitude /= base;
                if (digit == 0 && trailing) {
                    continue;
                }
                trailing = false;
                result.local[--index] = core::detail::digit_char(static_cast<int>(digit));
                if (frac == 0) {
                    result.local[--index] = '.';
                }
            }

            if (frac > 0 && !trailing) {
                // Magnitude ran out with fractional positions left; they are all zero.
                result.zero_padding = frac;
                result.begin = index;
                return result;
            }

            while (magnitude >= base) {
                const auto digit = magnitude % base;
                magnitude /= base;
                result.local[--index] = core::detail::digit_char(static_cast<int>(digit));
            }
            result.local[--index] = core::detail::digit_char(static_cast<int>(magnitude));
            result.begin = index;
            return result;
        }

        [[noreturn]] void throw_unsupported_radix(std::int64_t value, unsigned frac, int radix) {
            throw invalid_input(errc::unsupported_radix,
                                "can't encode " + std::to_string(value) + ": unsupported radix " +
                                    std::to_string(radix),
                                std::to_string(value),
                                frac,
                                radix);
        }

        template <typename Buffer>
        Buffer &append_rendering(Buffer &buffer, std::int64_t value, unsigned frac, int radix) {
            if (!core::detail::supports_radix(radix)) {
                throw_unsupported_radix(value, frac, radix);
            }
            const rendering text = render(value, frac, radix);
            const std::size_t offset = buffer.size();
            buffer.resize(offset + text.size());
            text.copy(buffer.begin() + static_cast<std::ptrdiff_t>(offset));
            return buffer;
        }

    } // namespace

    std::size_t formatted_size(std::int64_t value, unsigned frac, int radix) noexcept {
        if (!core::detail::supports_radix(radix)) {
            return 0;
        }
        return render(value, frac, radix).size();
    }

    format_result format_to(char *first,
                            char *last,
                            std::int64_t value,
                            unsigned frac,
                            int radix) noexcept {
        if (!core::detail::supports_radix(radix)) {
            return {first, errc::unsupported_radix};
        }
        const rendering text = render(value, frac, radix);
        if (text.size() > static_cast<std::size_t>(last - first)) {
            return {last, errc::buffer_too_small};
        }
        return {text.copy(first), errc{}};
    }

    std::string &append_format(std::string &buffer, std::int64_t value, unsigned frac, int radix) {
        return append_rendering(buffer, value, frac, radix);
    }

    std::vector<unsigned char> &append_format(std::vector<unsigned char> &buffer,
                                              std::int64_t value,
                                              unsigned frac,
                                              int radix) {
        return append_rendering(buffer, value, frac, radix);
    }

} // namespace frac::io
