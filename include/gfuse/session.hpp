#pragma once

#include "gfuse/graph/distribution_graph.hpp"
#include "gfuse/plot_utils/plot_options.hpp"
#include "gfuse/plot_utils/viewport.hpp"
#include <Eigen/Dense>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace gfuse {

/// Ranges a caller may set leaf parameters to.
struct LeafLimits {
    double mean_min = -10.0;
    double mean_max = 10.0;
    double std_dev_min = 0.1;
    double std_dev_max = 5.0;
};

/// Graph plus the state an interactive front end keeps around it: the
/// selection awaiting fusion, display switches and the current view.
///
/// Every mutating call recomputes products before returning, so values read
/// back are always consistent with their parents.
class Session {
public:
    using NodeId = distributions::NodeId;

    Session() = default;
    explicit Session(LeafLimits limits) : limits_(limits) {}

    // ---- Nodes ----

    /// Add N(0, 1) with the default name.
    NodeId add_leaf();

    /// Add a leaf; parameters are clamped to the leaf limits.
    NodeId add_leaf(std::string name, double mean, double std_dev);

    /// Add a default leaf if the graph is empty.
    void ensure_initial_distribution();

    /// Set a leaf's mean (clamped). Returns false for a missing id or a product.
    bool set_mean(NodeId id, double mean);

    /// Set a leaf's std_dev (clamped). Returns false for a missing id or a product.
    bool set_std_dev(NodeId id, double std_dev);

    /// Delete a node and drop it from the selection. Returns false if absent.
    bool remove(NodeId id);

    // ---- Fusion selection ----

    void select(NodeId id);
    void deselect(NodeId id);
    void toggle(NodeId id);
    void clear_selection() { selection_.clear(); }
    [[nodiscard]] bool is_selected(NodeId id) const;
    [[nodiscard]] const std::vector<NodeId>& selection() const { return selection_; }

    /// Fuse the selected nodes in selection order and clear the selection.
    /// Throws InsufficientParents (selection kept) if fewer than two resolve.
    NodeId fuse_selection();

    // ---- Sampling ----

    /// num_points curve samples of a node over the current plot range.
    /// curve and shading throw UnknownId for an id not in the graph.
    [[nodiscard]] Eigen::MatrixXd curve(NodeId id, int num_points = 300) const;

    /// Shading polygon of a node over the current plot range.
    [[nodiscard]] Eigen::MatrixXd shading(NodeId id, int num_points = 300) const;

    // ---- View ----

    /// Fit the view to every node. No-op on an empty graph.
    void auto_fit_view(plot_utils::PeakHeight peak = plot_utils::PeakHeight::WidestNode);
    void reset_view() { view_.reset(); }
    [[nodiscard]] const std::optional<plot_utils::Bounds>& view() const { return view_; }

    /// x-range of the stored view, or [-6, 6] when none is set.
    [[nodiscard]] std::pair<double, double> plot_range() const;

    // ---- Persistence ----

    /// Snapshot text of the graph and display flags.
    [[nodiscard]] std::string save() const;

    /// Replace graph and display flags from snapshot text and clear the selection.
    /// Throws DecodeError and leaves the session untouched on malformed input.
    void load(const std::string& text);

    // ---- Access ----

    [[nodiscard]] const graph::DistributionGraph& graph() const { return graph_; }
    [[nodiscard]] const plot_utils::DisplayFlags& display() const { return display_; }
    [[nodiscard]] plot_utils::DisplayFlags& display() { return display_; }
    [[nodiscard]] const LeafLimits& limits() const { return limits_; }

private:
    [[nodiscard]] const distributions::Gaussian& node(NodeId id) const;
    [[nodiscard]] double clamp_mean(double mean) const;
    [[nodiscard]] double clamp_std_dev(double std_dev) const;

    graph::DistributionGraph graph_;
    std::vector<NodeId> selection_;
    plot_utils::DisplayFlags display_;
    std::optional<plot_utils::Bounds> view_;
    LeafLimits limits_;
};

} // namespace gfuse
