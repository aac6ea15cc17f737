// include/frac/fraclib.hpp — Umbrella header that exposes fraclib components.

#pragma once

// Umbrella header for fraclib.
// Users should generally include only this file.

#include <frac/core/detail/digits.hpp>
#include <frac/core/error.hpp>
#include <frac/io/format.hpp>
#include <frac/io/parse.hpp>
#include <frac/util/debug.hpp>
#include <frac/util/quote.hpp>

namespace frac {

    using io::append_bin;
    using io::append_dec;
    using io::append_format;
    using io::append_hex;
    using io::append_oct;
    using io::format;
    using io::format_bin;
    using io::format_dec;
    using io::format_hex;
    using io::format_oct;
    using io::format_result;
    using io::format_to;
    using io::formatted_size;
    using io::parse;
    using io::parse_bin;
    using io::parse_dec;
    using io::parse_hex;
    using io::parse_oct;
    using io::parse_result;
    using io::try_parse;
    using io::try_parse_bin;
    using io::try_parse_dec;
    using io::try_parse_hex;
    using io::try_parse_oct;

} // namespace frac
