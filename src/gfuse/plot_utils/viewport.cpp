#include "gfuse/plot_utils/viewport.hpp"
#include "gfuse/plot_utils/math_utils.hpp"
#include <algorithm>
#include <limits>

namespace gfuse::plot_utils {

namespace {
constexpr double kMarginStdDevs = 4.0;
constexpr double kHeadroom = 1.1;
} // namespace

Bounds default_bounds() {
    return {-6.0, 6.0, 0.0, normpdf(0.0) * kHeadroom};
}

std::optional<Bounds> auto_fit(const std::vector<const distributions::Gaussian*>& nodes,
                               PeakHeight peak) {
    if (nodes.empty()) return std::nullopt;

    double min_mean = std::numeric_limits<double>::infinity();
    double max_mean = -std::numeric_limits<double>::infinity();
    double max_std = 0.0;
    double min_std = std::numeric_limits<double>::infinity();

    for (const auto* g : nodes) {
        min_mean = std::min(min_mean, g->mean());
        max_mean = std::max(max_mean, g->mean());
        max_std = std::max(max_std, g->std_dev());
        min_std = std::min(min_std, g->std_dev());
    }

    const double margin = kMarginStdDevs * max_std;
    const double sigma = peak == PeakHeight::WidestNode ? max_std : min_std;

    return Bounds{min_mean - margin, max_mean + margin, 0.0, normpdf(0.0, 0.0, sigma) * kHeadroom};
}

std::optional<Bounds> auto_fit(const graph::DistributionGraph& graph, PeakHeight peak) {
    std::vector<const distributions::Gaussian*> nodes;
    nodes.reserve(graph.size());
    for (const auto& [id, g] : graph.nodes()) nodes.push_back(&g);
    return auto_fit(nodes, peak);
}

} // namespace gfuse::plot_utils
