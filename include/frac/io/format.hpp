// include/frac/io/format.hpp — Formatting scaled 64-bit integers as fractional strings.

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include <frac/core/detail/digits.hpp>
#include <frac/core/error.hpp>

namespace frac::io {

    struct format_result {
        char *ptr = nullptr;
        errc ec{};

        explicit operator bool() const noexcept { return ec == errc{}; }
    };

    /// Number of characters format() produces, or 0 when the radix is unsupported.
    std::size_t formatted_size(std::int64_t value, unsigned frac, int radix) noexcept;

    /// Writes the text into [first, last) without allocating, like std::to_chars.
    /// On failure nothing is written: `ptr` is `first` for an unsupported radix and
    /// `last` with errc::buffer_too_small when the range is too short.
    format_result format_to(char *first,
                            char *last,
                            std::int64_t value,
                            unsigned frac,
                            int radix) noexcept;

    /// Formats `value` as a number virtually divided by `radix^frac`. Trailing zero
    /// fractional digits are dropped along with the point, so for `frac = 2,
    /// radix = 10` the value 12345 becomes "123.45" and 12300 becomes "123".
    /// Appends to `buffer`; on error throws frac::error and leaves it unchanged.
    std::string &append_format(std::string &buffer, std::int64_t value, unsigned frac, int radix);

    std::vector<unsigned char> &append_format(std::vector<unsigned char> &buffer,
                                              std::int64_t value,
                                              unsigned frac,
                                              int radix);

    inline std::string format(std::int64_t value, unsigned frac, int radix) {
        std::string output;
        append_format(output, value, frac, radix);
        return output;
    }

    inline std::string format_bin(std::int64_t value, unsigned frac) { return format(value, frac, 2); }
    inline std::string format_oct(std::int64_t value, unsigned frac) { return format(value, frac, 8); }
    inline std::string format_dec(std::int64_t value, unsigned frac) { return format(value, frac, 10); }
    inline std::string format_hex(std::int64_t value, unsigned frac) { return format(value, frac, 16); }

    inline std::string &append_bin(std::string &buffer, std::int64_t value, unsigned frac) {
        return append_format(buffer, value, frac, 2);
    }
    inline std::string &append_oct(std::string &buffer, std::int64_t value, unsigned frac) {
        return append_format(buffer, value, frac, 8);
    }
    inline std::string &append_dec(std::string &buffer, std::int64_t value, unsigned frac) {
        return append_format(buffer, value, frac, 10);
    }
    inline std::string &append_hex(std::string &buffer, std::int64_t value, unsigned frac) {
        return append_format(buffer, value, frac, 16);
    }

} // namespace frac::io
