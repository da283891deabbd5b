#pragma once

#include "gfuse/plot_utils/plot_options.hpp"
#include "gfuse/plot_utils/viewport.hpp"
#include <gfuse/distributions/gaussian.hpp>
#include <gfuse/graph/distribution_graph.hpp>
#include <gfuse/session.hpp>
#include <matplot/matplot.h>
#include <string>

namespace gfuse::plot_utils {

/// Draw one node over bounds.x_min..bounds.x_max: optional shading, the curve,
/// and optional dashed std markers (mean marker drawn thicker).
void plot_distribution(matplot::axes_handle ax,
                       const distributions::Gaussian& g,
                       const Bounds& bounds,
                       const Color& color,
                       const PlotOptions& opts);

/// Draw every node of the graph in id order, cycling the curve palette,
/// and set the axes limits to bounds.
void plot_graph(matplot::axes_handle ax,
                const graph::DistributionGraph& graph,
                const Bounds& bounds,
                const PlotOptions& opts);

/// Convenience: create figure, plot, save if output_file set.
void plot_graph(const graph::DistributionGraph& graph,
                const Bounds& bounds,
                const PlotOptions& opts);

/// Plot a session with its own display flags and view (default bounds if unset).
/// opts.display is overridden by the session's flags.
void plot_session(const Session& session, PlotOptions opts);

/// Save a figure to file, creating the parent directory if needed.
void save_figure(matplot::figure_handle fig, const std::string& filename);

} // namespace gfuse::plot_utils
