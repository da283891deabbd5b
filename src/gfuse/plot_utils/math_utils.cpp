#include "gfuse/plot_utils/math_utils.hpp"
#include "gfuse/errors.hpp"
#include <cmath>
#include <numbers>
#include <string>

namespace gfuse::plot_utils {

void require_valid_sigma(double sigma, const char* where) {
    if (!(sigma > 0.0) || !std::isfinite(sigma)) {
        throw InvalidParameter(std::string(where) + ": std_dev must be positive and finite, got "
                               + std::to_string(sigma));
    }
}

double normpdf(double x, double mu, double sigma) {
    require_valid_sigma(sigma, "normpdf");
    constexpr double inv_sqrt_2pi = 1.0 / std::numbers::sqrt2 * std::numbers::inv_sqrtpi;
    const double z = (x - mu) / sigma;
    return (inv_sqrt_2pi / sigma) * std::exp(-0.5 * z * z);
}

std::vector<double> linspace(double start, double stop, int n) {
    if (n < 2) {
        throw InvalidSampleCount("linspace: n must be at least 2, got " + std::to_string(n));
    }
    std::vector<double> result(n);
    const double span = stop - start;
    const double denom = static_cast<double>(n - 1);
    for (int i = 0; i < n; ++i) {
        result[i] = start + span * static_cast<double>(i) / denom;
    }
    return result;
}

std::vector<double> interior_linspace(double start, double stop, int n) {
    if (n < 0) {
        throw InvalidSampleCount("interior_linspace: n must be non-negative, got " + std::to_string(n));
    }
    std::vector<double> result;
    if (n == 0) return result;
    if (n == 1) {
        result.push_back((start + stop) / 2.0);
        return result;
    }
    result.reserve(n);
    const double span = stop - start;
    const double denom = static_cast<double>(n + 1);
    for (int i = 1; i <= n; ++i) {
        result.push_back(start + span * static_cast<double>(i) / denom);
    }
    return result;
}

std::vector<double> eigen_to_vec(const Eigen::VectorXd& v) {
    return std::vector<double>(v.data(), v.data() + v.size());
}

} // namespace gfuse::plot_utils
