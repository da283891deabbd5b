#pragma once

#include <Eigen/Dense>
#include <vector>

namespace gfuse::plot_utils {

/// Normal PDF: (1/sqrt(2*pi*sigma^2)) * exp(-0.5*((x-mu)/sigma)^2)
/// Throws InvalidParameter unless sigma > 0.
double normpdf(double x, double mu = 0.0, double sigma = 1.0);

/// Throws InvalidParameter unless sigma is strictly positive and finite.
void require_valid_sigma(double sigma, const char* where);

/// n evenly spaced values from start to stop, both inclusive:
/// start + (stop - start) * i / (n - 1). Throws InvalidSampleCount if n < 2.
std::vector<double> linspace(double start, double stop, int n);

/// n values strictly inside (start, stop):
/// start + (stop - start) * i / (n + 1) for i = 1..n.
/// n == 1 yields the midpoint; n == 0 yields nothing.
std::vector<double> interior_linspace(double start, double stop, int n);

/// Convert Eigen vector to std::vector<double>.
std::vector<double> eigen_to_vec(const Eigen::VectorXd& v);

} // namespace gfuse::plot_utils
