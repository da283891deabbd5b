#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace gfuse::distributions {

/// Stable node identifier. Allocated once by the graph and never reused.
using NodeId = std::uint32_t;

/// Marks a node whose parameters are set directly by a caller.
struct Leaf {
    bool operator==(const Leaf&) const = default;
};

/// Marks a node derived by fusing its parents. Order is preserved and
/// duplicates are kept (they count twice in the fusion).
struct Product {
    std::vector<NodeId> parent_ids;

    bool operator==(const Product&) const = default;
};

/// One-dimensional Gaussian node of a distribution graph.
///
/// The source variant decides whether the node is editable. mean() and
/// std_dev() hold the current value: the caller's parameters for a leaf,
/// the last fused result for a product.
class Gaussian {
public:
    using Source = std::variant<Leaf, Product>;

    /// Leaf node. Throws InvalidParameter unless std_dev > 0.
    Gaussian(NodeId id, std::string name, double mean, double std_dev);

    /// Product node carrying its already fused value.
    [[nodiscard]] static Gaussian product(NodeId id, std::string name,
                                          std::vector<NodeId> parent_ids,
                                          double mean, double std_dev);

    // ---- Data access ----
    [[nodiscard]] NodeId id() const { return id_; }
    [[nodiscard]] const std::string& name() const { return name_; }
    [[nodiscard]] double mean() const { return mean_; }
    [[nodiscard]] double std_dev() const { return std_dev_; }
    [[nodiscard]] double variance() const { return std_dev_ * std_dev_; }

    [[nodiscard]] const Source& source() const { return source_; }
    [[nodiscard]] bool is_product() const { return std::holds_alternative<Product>(source_); }
    [[nodiscard]] bool is_leaf() const { return std::holds_alternative<Leaf>(source_); }

    /// Parent edges; empty for a leaf.
    [[nodiscard]] const std::vector<NodeId>& parent_ids() const;

    // ---- Mutation ----

    /// Overwrite a leaf's parameters. Throws std::logic_error on a product.
    void set_parameters(double mean, double std_dev);

    /// Overwrite a product's cached value. Throws std::logic_error on a leaf.
    void refresh(double mean, double std_dev);

    // ---- Evaluation ----

    /// Probability density at x.
    [[nodiscard]] double evaluate(double x) const;

    /// Density at the mean, 1 / (sigma * sqrt(2 pi)).
    [[nodiscard]] double peak() const;

    /// mean + k * std_dev for k = -3..3, ascending; index 3 is the mean.
    [[nodiscard]] std::array<double, 7> std_markers() const;

    bool operator==(const Gaussian&) const = default;

private:
    Gaussian(NodeId id, std::string name, Source source, double mean, double std_dev);

    NodeId id_ = 0;
    std::string name_;
    Source source_;
    double mean_ = 0.0;
    double std_dev_ = 1.0;
};

} // namespace gfuse::distributions
