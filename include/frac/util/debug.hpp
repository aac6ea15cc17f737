#pragma once

#include <cstdint>
#include <ostream>

#include <frac/core/error.hpp>
#include <frac/io/format.hpp>
#include <frac/io/parse.hpp>
#include <frac/util/quote.hpp>

namespace frac {

inline std::ostream& operator<<(std::ostream& os, errc code) {
    return os << errc_name(code);
}

namespace io {

inline std::ostream& operator<<(std::ostream& os, const parse_result& result) {
    if (result) {
        return os << "parse_result(" << result.value << ')';
    }
    os << "parse_result(" << result.ec;
    if (result.ec == errc::invalid_digit) {
        os << ' ' << util::quote_char(result.codepoint) << " at " << result.position;
    }
    return os << ')';
}

inline std::ostream& operator<<(std::ostream& os, const format_result& result) {
    return os << "format_result(" << result.ec << ')';
}

} // namespace io

namespace util {

// Writes `scaled(123.45 frac=2 radix=10 raw=12345)`, or the error kind when the
// radix is unsupported.
inline std::ostream& dump(std::ostream& os, std::int64_t value, unsigned frac, int radix) {
    os << "scaled(";
    if (core::detail::supports_radix(radix)) {
        os << io::format(value, frac, radix);
    } else {
        os << errc::unsupported_radix;
    }
    return os << " frac=" << frac << " radix=" << radix << " raw=" << value << ')';
}

inline std::ostream& dump(std::ostream& os, const error& failure) {
    os << "error(" << failure.code() << ' ' << quote(failure.text()) << " frac=" << failure.frac()
       << " radix=" << failure.radix();
    if (failure.code() == errc::invalid_digit) {
        os << " char=" << quote_char(failure.codepoint()) << " at " << failure.position();
    }
    return os << ')';
}

} // namespace util

} // namespace frac
