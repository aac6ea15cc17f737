#include <array>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <string_view>

#include <frac/fraclib.hpp>

int main() {
    // 0x1.8 with one hexadecimal fraction digit is 24 sixteenths.
    const std::int64_t value = frac::parse_hex("1.8", 1);
    std::cout << "hex 1.8 scaled by 16 = " << value << '\n';

    for (const int radix : {2, 8, 10, 16, 36}) {
        std::array<char, 80> buffer{};
        const auto result = frac::format_to(buffer.data(), buffer.data() + buffer.size(), value, 1, radix);
        if (!result) {
            std::cerr << "format_to failed: " << result << '\n';
            return 1;
        }
        std::cout << "radix " << radix << ": "
                  << std::string_view(buffer.data(), static_cast<std::size_t>(result.ptr - buffer.data()))
                  << '\n';
    }

    try {
        (void)frac::parse("12", 0, 37);
    } catch (const frac::error& failure) {
        frac::util::dump(std::cerr, failure) << '\n';
    }
    return 0;
}
