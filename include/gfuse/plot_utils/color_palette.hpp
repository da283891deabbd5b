#pragma once

#include "gfuse/plot_utils/plot_options.hpp"
#include <vector>

namespace gfuse::plot_utils {

/// Number of entries in the curve palette.
inline constexpr int kPaletteSize = 6;

/// Generate n colors cycling through the curve palette
/// (blue, red, green, orange, purple, pink).
std::vector<Color> curve_colors(int n);

/// Get a single palette color (0-indexed, wraps).
Color curve_color(int index);

/// Same color with the given opacity in [0, 1].
Color with_opacity(const Color& c, double opacity);

} // namespace gfuse::plot_utils
