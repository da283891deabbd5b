#include "gfuse/plot_utils/color_palette.hpp"
#include <algorithm>

namespace gfuse::plot_utils {

namespace {

// matplot++ uses ARGB format: {Alpha, Red, Green, Blue} where Alpha=0 is opaque
constexpr Color kCurvePalette[kPaletteSize] = {
    {0.0f, 0.0000f, 0.0000f, 1.0000f},  // blue
    {0.0f, 1.0000f, 0.0000f, 0.0000f},  // red
    {0.0f, 0.0000f, 1.0000f, 0.0000f},  // green
    {0.0f, 1.0000f, 0.6471f, 0.0000f},  // orange
    {0.0f, 0.5020f, 0.0000f, 0.5020f},  // purple
    {0.0f, 1.0000f, 0.7529f, 0.7961f},  // pink
};

} // anonymous namespace

std::vector<Color> curve_colors(int n) {
    std::vector<Color> colors(std::max(n, 0));
    for (int i = 0; i < n; ++i) {
        colors[i] = kCurvePalette[i % kPaletteSize];
    }
    return colors;
}

Color curve_color(int index) {
    return kCurvePalette[((index % kPaletteSize) + kPaletteSize) % kPaletteSize];
}

Color with_opacity(const Color& c, double opacity) {
    const double clamped = std::clamp(opacity, 0.0, 1.0);
    return {static_cast<float>(1.0 - clamped), c[1], c[2], c[3]};
}

} // namespace gfuse::plot_utils
