#include "gfuse/session.hpp"
#include "gfuse/debug_log.hpp"
#include "gfuse/errors.hpp"
#include "gfuse/plot_utils/sampling.hpp"
#include "gfuse/serialization/snapshot_json.hpp"
#include <algorithm>
#include <string>

namespace gfuse {

Session::NodeId Session::add_leaf() {
    const NodeId id = graph_.add_leaf();
    graph_.recompute_products();
    return id;
}

Session::NodeId Session::add_leaf(std::string name, double mean, double std_dev) {
    const NodeId id = graph_.add_leaf(std::move(name), clamp_mean(mean), clamp_std_dev(std_dev));
    graph_.recompute_products();
    return id;
}

void Session::ensure_initial_distribution() {
    if (graph_.empty()) add_leaf();
}

bool Session::set_mean(NodeId id, double mean) {
    const auto* node = graph_.find(id);
    if (node == nullptr) return false;
    if (!graph_.set_leaf(id, clamp_mean(mean), node->std_dev())) return false;
    graph_.recompute_products();
    return true;
}

bool Session::set_std_dev(NodeId id, double std_dev) {
    const auto* node = graph_.find(id);
    if (node == nullptr) return false;
    if (!graph_.set_leaf(id, node->mean(), clamp_std_dev(std_dev))) return false;
    graph_.recompute_products();
    return true;
}

bool Session::remove(NodeId id) {
    deselect(id);
    if (!graph_.remove(id)) return false;
    graph_.recompute_products();
    return true;
}

void Session::select(NodeId id) {
    if (!is_selected(id)) selection_.push_back(id);
}

void Session::deselect(NodeId id) {
    selection_.erase(std::remove(selection_.begin(), selection_.end(), id), selection_.end());
}

void Session::toggle(NodeId id) {
    if (is_selected(id)) {
        deselect(id);
    } else {
        select(id);
    }
}

bool Session::is_selected(NodeId id) const {
    return std::find(selection_.begin(), selection_.end(), id) != selection_.end();
}

Session::NodeId Session::fuse_selection() {
    const NodeId id = graph_.fuse(selection_);
    selection_.clear();
    graph_.recompute_products();
    return id;
}

const distributions::Gaussian& Session::node(NodeId id) const {
    const distributions::Gaussian* g = graph_.find(id);
    if (g == nullptr) {
        throw UnknownId("Session: no distribution with id " + std::to_string(id));
    }
    return *g;
}

Eigen::MatrixXd Session::curve(NodeId id, int num_points) const {
    const auto [x_min, x_max] = plot_range();
    return plot_utils::curve_points(node(id), x_min, x_max, num_points);
}

Eigen::MatrixXd Session::shading(NodeId id, int num_points) const {
    const auto [x_min, x_max] = plot_range();
    return plot_utils::fill_polygon(node(id), x_min, x_max, num_points);
}

void Session::auto_fit_view(plot_utils::PeakHeight peak) {
    if (auto fitted = plot_utils::auto_fit(graph_, peak)) {
        view_ = *fitted;
    }
}

std::pair<double, double> Session::plot_range() const {
    const plot_utils::Bounds b = view_.value_or(plot_utils::default_bounds());
    return {b.x_min, b.x_max};
}

std::string Session::save() const {
    return serialization::encode(graph_, display_);
}

void Session::load(const std::string& text) {
    serialization::Snapshot snapshot;
    try {
        snapshot = serialization::decode(text);
    } catch (const DecodeError& e) {
        GFUSE_DEBUG_LOG("rejected snapshot: %s", e.what());
        throw;
    }
    graph_ = std::move(snapshot.graph);
    display_ = snapshot.display;
    selection_.clear();
}

double Session::clamp_mean(double mean) const {
    return std::clamp(mean, limits_.mean_min, limits_.mean_max);
}

double Session::clamp_std_dev(double std_dev) const {
    return std::clamp(std_dev, limits_.std_dev_min, limits_.std_dev_max);
}

} // namespace gfuse
