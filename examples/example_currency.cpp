#include <cstdint>
#include <iostream>
#include <string_view>

#include <frac/fraclib.hpp>

// Cents are stored as integers; text is only produced at the edges.
int main() {
    constexpr unsigned CENTS = 2;
    const std::string_view prices[] = {"19.99", "5", "0.5", "120.00", "-3.25"};

    std::int64_t total = 0;
    for (const auto price : prices) {
        const std::int64_t cents = frac::parse_dec(price, CENTS);
        total += cents;
        std::cout << price << " -> " << cents << " cents\n";
    }
    std::cout << "total: " << frac::format_dec(total, CENTS) << '\n';

    const auto rejected = frac::try_parse_dec("9.999", CENTS);
    std::cout << "9.999 is rejected: " << rejected << '\n';
    return 0;
}
