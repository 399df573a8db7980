#ifndef SPYTEXT_COLOR_HPP
#define SPYTEXT_COLOR_HPP

#include <cstdint>
#include <string>

namespace spytext {

struct Rgb {
    std::uint8_t r = 0;
    std::uint8_t g = 0;
    std::uint8_t b = 0;
};

inline bool operator==(const Rgb& lhs, const Rgb& rhs) {
    return lhs.r == rhs.r && lhs.g == rhs.g && lhs.b == rhs.b;
}

inline bool operator!=(const Rgb& lhs, const Rgb& rhs) {
    return !(lhs == rhs);
}

double srgb_to_linear(double channel);

double relative_luminance(const Rgb& color);

double contrast_ratio(const Rgb& foreground, const Rgb& background);

std::string to_string(const Rgb& color);

}  // namespace spytext

#endif  // SPYTEXT_COLOR_HPP
