#include "spytext/color.hpp"

#include <algorithm>
#include <cmath>

namespace spytext {

namespace {

constexpr double kLinearCutoff = 0.03928;
constexpr double kRedWeight = 0.2126;
constexpr double kGreenWeight = 0.7152;
constexpr double kBlueWeight = 0.0722;

double channel_luminance(std::uint8_t channel) {
    return srgb_to_linear(static_cast<double>(channel) / 255.0);
}

}  // namespace

double srgb_to_linear(double channel) {
    if (channel <= kLinearCutoff) {
        return channel / 12.92;
    }
    return std::pow((channel + 0.055) / 1.055, 2.4);
}

double relative_luminance(const Rgb& color) {
    return kRedWeight * channel_luminance(color.r) + kGreenWeight * channel_luminance(color.g) +
           kBlueWeight * channel_luminance(color.b);
}

double contrast_ratio(const Rgb& foreground, const Rgb& background) {
    const double first = relative_luminance(foreground);
    const double second = relative_luminance(background);
    const double lighter = std::max(first, second);
    const double darker = std::min(first, second);
    return (lighter + 0.05) / (darker + 0.05);
}

std::string to_string(const Rgb& color) {
    return "rgb(" + std::to_string(color.r) + "," + std::to_string(color.g) + "," + std::to_string(color.b) + ")";
}

}  // namespace spytext
