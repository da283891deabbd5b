#include "gfuse/fusion/fuse.hpp"
#include "gfuse/errors.hpp"
#include "gfuse/plot_utils/math_utils.hpp"
#include <cmath>
#include <stdexcept>
#include <utility>

namespace gfuse::fusion {

FusionResult fuse(const Eigen::VectorXd& means, const Eigen::VectorXd& std_devs) {
    if (means.size() != std_devs.size()) {
        throw std::invalid_argument("fuse: means and std_devs must have the same length");
    }
    if (means.size() == 0) return {};

    for (Eigen::Index i = 0; i < std_devs.size(); ++i) {
        plot_utils::require_valid_sigma(std_devs(i), "fuse");
    }

    const Eigen::ArrayXd precision = std_devs.array().square().inverse();
    const double precision_sum = precision.sum();
    const double weighted_mean_sum = (means.array() * precision).sum();

    const FusionResult fused{weighted_mean_sum / precision_sum, 1.0 / precision_sum};
    if (!(fused.variance > 0.0) || !std::isfinite(fused.variance) || !std::isfinite(fused.mean)) {
        throw InvalidParameter("fuse: parent precisions overflow, fused std_dev is not representable");
    }
    return fused;
}

FusionResult fuse(const std::vector<const distributions::Gaussian*>& parents) {
    const auto n = static_cast<Eigen::Index>(parents.size());
    Eigen::VectorXd means(n);
    Eigen::VectorXd std_devs(n);
    for (Eigen::Index i = 0; i < n; ++i) {
        const auto* g = parents[static_cast<std::size_t>(i)];
        if (g == nullptr) {
            throw std::invalid_argument("fuse: null parent");
        }
        means(i) = g->mean();
        std_devs(i) = g->std_dev();
    }
    return fuse(means, std_devs);
}

distributions::Gaussian make_product(distributions::NodeId id,
                                     std::string name,
                                     std::vector<distributions::NodeId> parent_ids,
                                     const std::vector<const distributions::Gaussian*>& parents) {
    const FusionResult fused = fuse(parents);
    return distributions::Gaussian::product(id, std::move(name), std::move(parent_ids),
                                            fused.mean, fused.std_dev());
}

} // namespace gfuse::fusion
