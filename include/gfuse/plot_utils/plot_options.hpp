#pragma once

#include <array>
#include <string>

namespace gfuse::plot_utils {

/// ARGB color (each component in [0, 1]).  matplot++ uses Alpha/Red/Green/Blue
/// where Alpha=0 is opaque and Alpha=1 is fully transparent.
using Color = std::array<float, 4>;

/// Display switches saved with a snapshot.
struct DisplayFlags {
    bool show_shading = true;       ///< Fill the area under each curve
    double shading_opacity = 0.3;   ///< Fill opacity in [0, 1]
    bool show_std_markers = true;   ///< Dashed lines at mean +/- k*std_dev

    bool operator==(const DisplayFlags&) const = default;
};

/// Options controlling plot appearance and output.
struct PlotOptions {
    DisplayFlags display;
    int num_points = 300;             ///< Samples per curve
    std::string output_file;          ///< If non-empty, save figure to this path
    std::string title = "Probability Density Functions";
    int width = 1200;                 ///< Figure width in pixels
    int height = 800;                 ///< Figure height in pixels
};

} // namespace gfuse::plot_utils
