#pragma once

#include <gfuse/distributions/gaussian.hpp>
#include <gfuse/graph/distribution_graph.hpp>
#include <optional>
#include <vector>

namespace gfuse::plot_utils {

/// Axis-aligned display window.
struct Bounds {
    double x_min = -6.0;
    double x_max = 6.0;
    double y_min = 0.0;
    double y_max = 0.0;

    bool operator==(const Bounds&) const = default;
};

/// Which node sizes the y-axis in auto_fit().
enum class PeakHeight {
    WidestNode,     ///< Peak of the largest std_dev (lowest peak among nodes)
    NarrowestNode,  ///< Peak of the smallest std_dev (tallest peak among nodes)
};

/// Window shown when nothing has been fitted: x in [-6, 6], y up to 1.1x the
/// standard normal peak.
Bounds default_bounds();

/// x: [min mean - 4 * max std_dev, max mean + 4 * max std_dev].
/// y: [0, 1.1 * peak], with peak chosen by `peak`.
/// Returns nullopt for no nodes.
std::optional<Bounds> auto_fit(const std::vector<const distributions::Gaussian*>& nodes,
                               PeakHeight peak = PeakHeight::WidestNode);

/// auto_fit() over every node in the graph.
std::optional<Bounds> auto_fit(const graph::DistributionGraph& graph,
                               PeakHeight peak = PeakHeight::WidestNode);

} // namespace gfuse::plot_utils
