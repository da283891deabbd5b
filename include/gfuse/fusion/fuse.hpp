#pragma once

#include "gfuse/distributions/gaussian.hpp"
#include <Eigen/Dense>
#include <cmath>
#include <string>
#include <vector>

namespace gfuse::fusion {

/// Mean and variance of a fused Gaussian.
struct FusionResult {
    double mean = 0.0;
    double variance = 1.0;

    [[nodiscard]] double std_dev() const { return std::sqrt(variance); }
};

/// Precision-weighted fusion (normalized product of independent Gaussian PDFs).
///   mean = sum(mu_i / sigma_i^2) / sum(1 / sigma_i^2),  variance = 1 / sum(1 / sigma_i^2)
/// Empty input yields {0, 1}. Throws InvalidParameter if a std_dev is not
/// positive, or if the precisions overflow (std_dev below about 1e-154).
FusionResult fuse(const Eigen::VectorXd& means, const Eigen::VectorXd& std_devs);

/// Same as above over distribution nodes. Null entries are not allowed.
FusionResult fuse(const std::vector<const distributions::Gaussian*>& parents);

/// Build a product node from its parents' current values.
/// parent_ids is stored verbatim: order and duplicates are kept.
distributions::Gaussian make_product(distributions::NodeId id,
                                     std::string name,
                                     std::vector<distributions::NodeId> parent_ids,
                                     const std::vector<const distributions::Gaussian*>& parents);

} // namespace gfuse::fusion
