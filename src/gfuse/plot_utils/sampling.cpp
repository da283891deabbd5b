#include "gfuse/plot_utils/sampling.hpp"
#include "gfuse/plot_utils/math_utils.hpp"

namespace gfuse::plot_utils {

namespace {

Eigen::MatrixXd sample_at(const distributions::Gaussian& g, const std::vector<double>& xs) {
    Eigen::MatrixXd pts(static_cast<Eigen::Index>(xs.size()), 2);
    for (std::size_t i = 0; i < xs.size(); ++i) {
        const auto row = static_cast<Eigen::Index>(i);
        pts(row, 0) = xs[i];
        pts(row, 1) = g.evaluate(xs[i]);
    }
    return pts;
}

} // anonymous namespace

Eigen::MatrixXd curve_points(const distributions::Gaussian& g,
                             double x_min, double x_max, int n) {
    return sample_at(g, linspace(x_min, x_max, n));
}

Eigen::MatrixXd fill_polygon(const distributions::Gaussian& g,
                             double x_min, double x_max, int n) {
    const Eigen::MatrixXd interior = sample_at(g, interior_linspace(x_min, x_max, n));

    Eigen::MatrixXd pts(interior.rows() + 2, 2);
    pts(0, 0) = x_min;
    pts(0, 1) = 0.0;
    pts.middleRows(1, interior.rows()) = interior;
    pts(pts.rows() - 1, 0) = x_max;
    pts(pts.rows() - 1, 1) = 0.0;
    return pts;
}

std::vector<StdMarker> visible_std_markers(const distributions::Gaussian& g,
                                           double x_min, double x_max) {
    std::vector<StdMarker> out;
    const auto markers = g.std_markers();
    for (int i = 0; i < static_cast<int>(markers.size()); ++i) {
        if (markers[i] >= x_min && markers[i] <= x_max) {
            out.push_back({markers[i], i - 3});
        }
    }
    return out;
}

} // namespace gfuse::plot_utils
