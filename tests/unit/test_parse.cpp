// tests/unit/test_parse.cpp — Unit tests for parsing fractional strings.

#include <cstdint>
#include <iostream>
#include <limits>
#include <string_view>

#include <frac/fraclib.hpp>

namespace {

constexpr std::int64_t MAX = std::numeric_limits<std::int64_t>::max();
constexpr std::int64_t MIN = std::numeric_limits<std::int64_t>::min();

struct accepted_case {
    std::string_view text;
    unsigned frac;
    int radix;
    std::int64_t expected;
};

struct rejected_case {
    std::string_view text;
    unsigned frac;
    int radix;
    frac::errc expected;
};

constexpr accepted_case ACCEPTED[] = {
    {"123.45", 2, 10, 12345},
    {"123", 2, 10, 12300},
    {"-123.4", 2, 10, -12340},
    {"+123.4", 2, 10, 12340},
    {"0", 0, 10, 0},
    {"0", 5, 10, 0},
    {"-0", 2, 10, 0},
    {"-0.0", 2, 10, 0},
    {"0.05", 2, 10, 5},
    {"-0.05", 2, 10, -5},
    {"007.5", 1, 10, 75},
    {"1.2300", 2, 10, 123},
    {"1.000000000000000000000000", 0, 10, 1},
    {"1", 18, 10, 1000000000000000000},
    {"1", 0, 16, 1},
    {"ff", 0, 16, 255},
    {"FF", 0, 16, 255},
    {"-f.8", 1, 16, -248},
    {"1e5", 0, 16, 485},
    {"101.1", 1, 2, 11},
    {"-0.01", 2, 2, -1},
    {"11111111", 0, 2, 255},
    {"17.4", 1, 8, 124},
    {"zz", 0, 36, 1295},
    {"Z.z", 1, 36, 1295},
    {"9223372036854775807", 0, 10, MAX},
    {"922337203685477580.7", 1, 10, MAX},
    {"-9223372036854775808", 0, 10, MIN},
    {"-922337203685477580.8", 1, 10, MIN},
    {"7fffffffffffffff", 0, 16, MAX},
    {"-8000000000000000", 0, 16, MIN},
    {"0", 4000000000u, 10, 0},
};

constexpr rejected_case REJECTED[] = {
    {"", 0, 10, frac::errc::empty_input},
    {"", 3, 10, frac::errc::empty_input},
    {"", 0, 1, frac::errc::empty_input},
    {"12", 0, 1, frac::errc::unsupported_radix},
    {"12", 0, 37, frac::errc::unsupported_radix},
    {"12", 0, 0, frac::errc::unsupported_radix},
    {"12", 0, -10, frac::errc::unsupported_radix},
    {"?", 2, 37, frac::errc::unsupported_radix},
    {"123.456", 2, 10, frac::errc::precision_exceeded},
    {"1.2301", 2, 10, frac::errc::precision_exceeded},
    {"0.1", 0, 10, frac::errc::precision_exceeded},
    {"12x", 2, 10, frac::errc::invalid_digit},
    {"19", 0, 8, frac::errc::invalid_digit},
    {"2", 0, 2, frac::errc::invalid_digit},
    {"g", 0, 16, frac::errc::invalid_digit},
    {".5", 1, 10, frac::errc::invalid_digit},
    {"-.5", 1, 10, frac::errc::invalid_digit},
    {"1.2.3", 3, 10, frac::errc::invalid_digit},
    {"+-1", 0, 10, frac::errc::invalid_digit},
    {" 1", 0, 10, frac::errc::invalid_digit},
    {"1 ", 0, 10, frac::errc::invalid_digit},
    {"1e5", 0, 10, frac::errc::invalid_digit},
    {"1,5", 1, 10, frac::errc::invalid_digit},
    {"-", 0, 10, frac::errc::unexpected_end},
    {"+", 2, 10, frac::errc::unexpected_end},
    {"1.", 2, 10, frac::errc::unexpected_end},
    {"-1.", 0, 10, frac::errc::unexpected_end},
    {"9223372036854775808", 0, 10, frac::errc::overflow},
    {"92233720368547758070", 0, 10, frac::errc::overflow},
    {"922337203685477580.8", 1, 10, frac::errc::overflow},
    {"922337203685477581", 1, 10, frac::errc::overflow},
    {"1", 19, 10, frac::errc::overflow},
    {"1", 4000000000u, 2, frac::errc::overflow},
    {"8000000000000000", 0, 16, frac::errc::overflow},
    {"-9223372036854775809", 0, 10, frac::errc::underflow},
    {"-922337203685477580.9", 1, 10, frac::errc::underflow},
    {"-1", 19, 10, frac::errc::underflow},
};

bool test_accepted() {
    bool ok = true;
    for (const auto& entry : ACCEPTED) {
        const auto result = frac::try_parse(entry.text, entry.frac, entry.radix);
        if (!result || result.value != entry.expected) {
            std::cerr << "parse(\"" << entry.text << "\", " << entry.frac << ", " << entry.radix
                      << ") gave " << result << ", expected " << entry.expected << '\n';
            ok = false;
        }
        try {
            if (frac::parse(entry.text, entry.frac, entry.radix) != entry.expected) {
                std::cerr << "throwing parse disagrees with try_parse for " << entry.text << '\n';
                ok = false;
            }
        } catch (const frac::error& failure) {
            std::cerr << "unexpected error: " << failure.what() << '\n';
            ok = false;
        }
    }
    return ok;
}

bool test_rejected() {
    bool ok = true;
    for (const auto& entry : REJECTED) {
        const auto result = frac::try_parse(entry.text, entry.frac, entry.radix);
        if (result.ec != entry.expected || result.value != 0) {
            std::cerr << "parse(\"" << entry.text << "\", " << entry.frac << ", " << entry.radix
                      << ") gave " << result << ", expected " << entry.expected << '\n';
            ok = false;
        }
        try {
            (void)frac::parse(entry.text, entry.frac, entry.radix);
            std::cerr << "parse(\"" << entry.text << "\") must throw\n";
            ok = false;
        } catch (const frac::error& failure) {
            if (failure.code() != entry.expected) {
                std::cerr << "thrown code " << failure.code() << " for " << entry.text << '\n';
                ok = false;
            }
        }
    }
    return ok;
}

bool test_invalid_digit_location() {
    const auto letter = frac::try_parse("12x", 2, 10);
    if (letter.position != 2 || letter.codepoint != U'x') {
        std::cerr << "invalid digit must report 'x' at 2, got " << letter << '\n';
        return false;
    }
    const auto octal = frac::try_parse("-19", 0, 8);
    if (octal.position != 2 || octal.codepoint != U'9') {
        std::cerr << "out-of-radix digit must report '9' at 2, got " << octal << '\n';
        return false;
    }
    const auto accented = frac::try_parse("1\xC3\xA9", 0, 10);
    if (accented.position != 1 || accented.codepoint != U'é') {
        std::cerr << "non-ASCII digit must report U+00E9 at 1, got " << accented << '\n';
        return false;
    }
    return true;
}

bool test_shortcuts() {
    if (frac::parse_bin("-10.1", 1) != -5 || frac::parse_oct("7.7", 1) != 63 ||
        frac::parse_dec("1.5", 2) != 150 || frac::parse_hex("A.b", 1) != 171) {
        std::cerr << "fixed-radix shortcuts" << '\n';
        return false;
    }
    if (frac::try_parse_bin("2", 0).ec != frac::errc::invalid_digit ||
        frac::try_parse_oct("8", 0).ec != frac::errc::invalid_digit ||
        frac::try_parse_dec("a", 0).ec != frac::errc::invalid_digit ||
        frac::try_parse_hex("g", 0).ec != frac::errc::invalid_digit) {
        std::cerr << "fixed-radix try_ shortcuts" << '\n';
        return false;
    }
    return true;
}

} // namespace

int main() {
    if (!test_accepted()) return 1;
    if (!test_rejected()) return 1;
    if (!test_invalid_digit_location()) return 1;
    if (!test_shortcuts()) return 1;
    std::cout << "parse tests passed\n";
    return 0;
}
