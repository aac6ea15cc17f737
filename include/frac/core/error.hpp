// include/frac/core/error.hpp — Error kinds and the exception thrown by parse/format.

#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace frac {

    // errc{} means success, mirroring std::errc in std::from_chars_result.
    enum class errc {
        empty_input = 1,
        unsupported_radix,
        invalid_digit,
        precision_exceeded,
        overflow,
        underflow,
        unexpected_end,
        buffer_too_small,
    };

    constexpr std::string_view errc_name(errc code) noexcept {
        if (code == errc{}) {
            return "ok";
        }
        switch (code) {
        case errc::empty_input:
            return "empty_input";
        case errc::unsupported_radix:
            return "unsupported_radix";
        case errc::invalid_digit:
            return "invalid_digit";
        case errc::precision_exceeded:
            return "precision_exceeded";
        case errc::overflow:
            return "overflow";
        case errc::underflow:
            return "underflow";
        case errc::unexpected_end:
            return "unexpected_end";
        case errc::buffer_too_small:
            return "buffer_too_small";
        }
        return "unknown";
    }

    // Common interface of every exception thrown by fraclib. Bad input is thrown as
    // invalid_input (a std::invalid_argument), overflow and underflow of int64 as
    // range_error (a std::overflow_error); both can be caught as frac::error.
    class error {
      public:
        virtual ~error() = default;

        virtual const char *what() const noexcept = 0;

        errc code() const noexcept { return code_; }
        // Input being parsed, or the decimal rendering of the value being formatted.
        const std::string &text() const noexcept { return text_; }
        unsigned frac() const noexcept { return frac_; }
        int radix() const noexcept { return radix_; }
        // Offending character and its byte offset; only set for errc::invalid_digit.
        char32_t codepoint() const noexcept { return codepoint_; }
        std::size_t position() const noexcept { return position_; }

      protected:
        error(errc code, std::string text, unsigned frac, int radix, char32_t codepoint, std::size_t position)
            : code_(code), text_(std::move(text)), frac_(frac), radix_(radix), codepoint_(codepoint),
              position_(position) {}
        error(const error &) = default;
        error &operator=(const error &) = default;

      private:
        errc code_;
        std::string text_;
        unsigned frac_;
        int radix_;
        char32_t codepoint_;
        std::size_t position_;
    };

    class invalid_input : public std::invalid_argument, public error {
      public:
        invalid_input(errc code,
                      const std::string &message,
                      std::string text,
                      unsigned frac,
                      int radix,
                      char32_t codepoint = U'\0',
                      std::size_t position = 0)
            : std::invalid_argument(message),
              error(code, std::move(text), frac, radix, codepoint, position) {}

        const char *what() const noexcept override { return std::invalid_argument::what(); }
    };

    class range_error : public std::overflow_error, public error {
      public:
        range_error(errc code,
                    const std::string &message,
                    std::string text,
                    unsigned frac,
                    int radix,
                    std::size_t position = 0)
            : std::overflow_error(message), error(code, std::move(text), frac, radix, U'\0', position) {}

        const char *what() const noexcept override { return std::overflow_error::what(); }
    };

} // namespace frac
