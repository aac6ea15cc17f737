// include/frac/util/quote.hpp — Quoting helpers used when rendering diagnostics.

#pragma once

#include <cstdio>
#include <string>
#include <string_view>

namespace frac::util {

    namespace detail {

        inline void append_escaped(std::string &output, unsigned char ch, char quote) {
            switch (ch) {
            case '\\':
                output += "\\\\";
                return;
            case '\n':
                output += "\\n";
                return;
            case '\t':
                output += "\\t";
                return;
            case '\r':
                output += "\\r";
                return;
            default:
                break;
            }
            if (ch == static_cast<unsigned char>(quote)) {
                output.push_back('\\');
                output.push_back(quote);
                return;
            }
            if (ch < 0x20 || ch == 0x7F) {
                char buffer[8];
                std::snprintf(buffer, sizeof(buffer), "\\x%02x", static_cast<unsigned>(ch));
                output += buffer;
                return;
            }
            // Bytes >= 0x80 pass through so UTF-8 input stays readable.
            output.push_back(static_cast<char>(ch));
        }

    } // namespace detail

    // Double-quoted with C-style escapes, e.g. `"12\"x"`.
    inline std::string quote(std::string_view text) {
        std::string output;
        output.reserve(text.size() + 2);
        output.push_back('"');
        for (const char ch : text) {
            detail::append_escaped(output, static_cast<unsigned char>(ch), '"');
        }
        output.push_back('"');
        return output;
    }

    // Single-quoted ASCII character, or U+XXXX for anything else.
    inline std::string quote_char(char32_t codepoint) {
        if (codepoint < 0x80) {
            std::string output(1, '\'');
            detail::append_escaped(output, static_cast<unsigned char>(codepoint), '\'');
            output.push_back('\'');
            return output;
        }
        char buffer[16];
        std::snprintf(buffer, sizeof(buffer), "U+%04X", static_cast<unsigned>(codepoint));
        return buffer;
    }

} // namespace frac::util
