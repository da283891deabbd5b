#include "gfuse/distributions/gaussian.hpp"
#include "gfuse/plot_utils/math_utils.hpp"
#include <stdexcept>
#include <utility>

namespace gfuse::distributions {

Gaussian::Gaussian(NodeId id, std::string name, double mean, double std_dev)
    : Gaussian(id, std::move(name), Leaf{}, mean, std_dev) {}

Gaussian::Gaussian(NodeId id, std::string name, Source source, double mean, double std_dev)
    : id_(id), name_(std::move(name)), source_(std::move(source)), mean_(mean), std_dev_(std_dev) {
    plot_utils::require_valid_sigma(std_dev_, "Gaussian");
}

Gaussian Gaussian::product(NodeId id, std::string name, std::vector<NodeId> parent_ids,
                           double mean, double std_dev) {
    return Gaussian(id, std::move(name), Product{std::move(parent_ids)}, mean, std_dev);
}

const std::vector<NodeId>& Gaussian::parent_ids() const {
    static const std::vector<NodeId> kNoParents;
    if (const auto* p = std::get_if<Product>(&source_)) {
        return p->parent_ids;
    }
    return kNoParents;
}

void Gaussian::set_parameters(double mean, double std_dev) {
    if (is_product()) {
        throw std::logic_error("Gaussian::set_parameters: product parameters are derived");
    }
    plot_utils::require_valid_sigma(std_dev, "Gaussian::set_parameters");
    mean_ = mean;
    std_dev_ = std_dev;
}

void Gaussian::refresh(double mean, double std_dev) {
    if (!is_product()) {
        throw std::logic_error("Gaussian::refresh: only product nodes are recomputed");
    }
    plot_utils::require_valid_sigma(std_dev, "Gaussian::refresh");
    mean_ = mean;
    std_dev_ = std_dev;
}

double Gaussian::evaluate(double x) const {
    return plot_utils::normpdf(x, mean_, std_dev_);
}

double Gaussian::peak() const {
    return plot_utils::normpdf(mean_, mean_, std_dev_);
}

std::array<double, 7> Gaussian::std_markers() const {
    std::array<double, 7> markers{};
    for (int k = -3; k <= 3; ++k) {
        markers[k + 3] = mean_ + k * std_dev_;
    }
    return markers;
}

} // namespace gfuse::distributions
