#include "gfuse/plot_utils/plot_graph.hpp"
#include "gfuse/plot_utils/color_palette.hpp"
#include "gfuse/plot_utils/math_utils.hpp"
#include "gfuse/plot_utils/sampling.hpp"
#include <chrono>
#include <filesystem>
#include <thread>
#include <vector>

namespace gfuse::plot_utils {

void plot_distribution(matplot::axes_handle ax,
                       const distributions::Gaussian& g,
                       const Bounds& bounds,
                       const Color& color,
                       const PlotOptions& opts) {
    ax->hold(true);

    if (opts.display.show_shading) {
        const Eigen::MatrixXd poly = fill_polygon(g, bounds.x_min, bounds.x_max, opts.num_points);
        auto fill_h = ax->fill(eigen_to_vec(poly.col(0)), eigen_to_vec(poly.col(1)));
        fill_h->color(with_opacity(color, opts.display.shading_opacity));
        fill_h->line_width(0.5f);
    }

    const Eigen::MatrixXd pts = curve_points(g, bounds.x_min, bounds.x_max, opts.num_points);
    auto line = ax->plot(eigen_to_vec(pts.col(0)), eigen_to_vec(pts.col(1)));
    line->color(color);
    line->line_width(1.5f);

    if (opts.display.show_std_markers) {
        for (const StdMarker& m : visible_std_markers(g, bounds.x_min, bounds.x_max)) {
            std::vector<double> mx = {m.x, m.x};
            std::vector<double> my = {bounds.y_min, bounds.y_max};
            auto marker = ax->plot(mx, my, "--");
            if (m.is_mean()) {
                marker->color(color);
                marker->line_width(2.0f);
            } else {
                marker->color(with_opacity(color, 0.7));
                marker->line_width(1.0f);
            }
        }
    }
}

void plot_graph(matplot::axes_handle ax,
                const graph::DistributionGraph& graph,
                const Bounds& bounds,
                const PlotOptions& opts) {
    ax->hold(true);

    int idx = 0;
    for (const auto& [id, g] : graph.nodes()) {
        plot_distribution(ax, g, bounds, curve_color(idx++), opts);
    }

    ax->xlim({bounds.x_min, bounds.x_max});
    ax->ylim({bounds.y_min, bounds.y_max});
    ax->title(opts.title);
}

void plot_graph(const graph::DistributionGraph& graph,
                const Bounds& bounds,
                const PlotOptions& opts) {
    auto fig = matplot::figure(true);
    fig->width(opts.width);
    fig->height(opts.height);
    auto ax = fig->current_axes();

    plot_graph(ax, graph, bounds, opts);

    if (!opts.output_file.empty()) {
        save_figure(fig, opts.output_file);
    }
}

void plot_session(const Session& session, PlotOptions opts) {
    opts.display = session.display();
    const Bounds bounds = session.view().value_or(default_bounds());
    plot_graph(session.graph(), bounds, opts);
}

void save_figure(matplot::figure_handle fig, const std::string& filename) {
    if (filename.empty()) return;

    auto parent = std::filesystem::path(filename).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }

    fig->save(filename);

    // gnuplot renders asynchronously through a pipe; wait up to 2 seconds
    // for the output file to appear.
    using namespace std::chrono;
    auto deadline = steady_clock::now() + seconds(2);
    while (steady_clock::now() < deadline) {
        if (std::filesystem::exists(filename) &&
            std::filesystem::file_size(filename) > 0) {
            return;
        }
        std::this_thread::sleep_for(milliseconds(10));
    }
}

} // namespace gfuse::plot_utils
