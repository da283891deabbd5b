#pragma once

#include <gfuse/distributions/gaussian.hpp>
#include <Eigen/Dense>
#include <vector>

namespace gfuse::plot_utils {

/// n points (x, y) on the density curve with x evenly spaced over
/// [x_min, x_max], both ends included. Returns an n x 2 matrix.
/// Throws InvalidSampleCount if n < 2.
Eigen::MatrixXd curve_points(const distributions::Gaussian& g,
                             double x_min, double x_max, int n);

/// Closed area under the curve as an (n + 2) x 2 vertex matrix:
/// (x_min, 0), n curve samples strictly inside (x_min, x_max), (x_max, 0).
/// Interior samples sit at x_min + (x_max - x_min) * i / (n + 1), i = 1..n,
/// or at the midpoint when n == 1. The polygon closes from the last vertex
/// back to the first. Throws InvalidSampleCount if n < 0.
Eigen::MatrixXd fill_polygon(const distributions::Gaussian& g,
                             double x_min, double x_max, int n);

/// A standard-deviation marker position.
struct StdMarker {
    double x = 0.0;
    int offset = 0;          ///< Multiple of std_dev from the mean, -3..3
    bool is_mean() const { return offset == 0; }
};

/// The seven std markers that fall inside [x_min, x_max], ascending.
std::vector<StdMarker> visible_std_markers(const distributions::Gaussian& g,
                                           double x_min, double x_max);

} // namespace gfuse::plot_utils
