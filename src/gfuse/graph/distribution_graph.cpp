#include "gfuse/graph/distribution_graph.hpp"
#include "gfuse/debug_log.hpp"
#include "gfuse/errors.hpp"
#include "gfuse/fusion/fuse.hpp"
#include <algorithm>
#include <limits>
#include <set>
#include <stdexcept>
#include <utility>

namespace gfuse::graph {

namespace {

int rank_of(const std::map<NodeId, Gaussian>& nodes, NodeId id,
            std::map<NodeId, int>& ranks, std::set<NodeId>& on_path) {
    const auto it = nodes.find(id);
    if (it == nodes.end() || !it->second.is_product()) return 0;

    if (const auto done = ranks.find(id); done != ranks.end()) return done->second;

    if (on_path.count(id) != 0) {
        GFUSE_DEBUG_LOG("product %u is part of a parent cycle", static_cast<unsigned>(id));
        return 0;
    }

    on_path.insert(id);
    int deepest = 0;
    for (NodeId parent : it->second.parent_ids()) {
        deepest = std::max(deepest, rank_of(nodes, parent, ranks, on_path));
    }
    on_path.erase(id);

    ranks[id] = deepest + 1;
    return deepest + 1;
}

std::vector<const Gaussian*> resolve_in(const std::map<NodeId, Gaussian>& nodes,
                                        const std::vector<NodeId>& ids) {
    std::vector<const Gaussian*> out;
    out.reserve(ids.size());
    for (NodeId id : ids) {
        if (const auto it = nodes.find(id); it != nodes.end()) out.push_back(&it->second);
    }
    return out;
}

} // anonymous namespace

DistributionGraph::DistributionGraph(std::map<NodeId, Gaussian> nodes, NodeId next_id)
    : nodes_(std::move(nodes)), next_id_(next_id) {
    if (!nodes_.empty() && next_id_ <= nodes_.rbegin()->first) {
        throw std::invalid_argument("DistributionGraph: next_id " + std::to_string(next_id_)
                                    + " would reuse a stored id");
    }
}

void DistributionGraph::require_free_id() const {
    // The largest id stays unused: next_id_ cannot move past it.
    if (next_id_ == std::numeric_limits<NodeId>::max()) {
        throw std::overflow_error("DistributionGraph: node ids exhausted");
    }
}

NodeId DistributionGraph::insert_new(Gaussian node) {
    require_free_id();
    const NodeId id = next_id_;
    if (!nodes_.emplace(id, std::move(node)).second) {
        throw std::logic_error("DistributionGraph: id " + std::to_string(id) + " already in use");
    }
    ++next_id_;
    return id;
}

NodeId DistributionGraph::add_leaf(std::string name, double mean, double std_dev) {
    require_free_id();
    // Build before inserting so a rejected std_dev does not consume an id.
    return insert_new(Gaussian(next_id_, std::move(name), mean, std_dev));
}

NodeId DistributionGraph::add_leaf() {
    return add_leaf("Gaussian " + std::to_string(next_id_ + 1), 0.0, 1.0);
}

NodeId DistributionGraph::fuse(const std::vector<NodeId>& ids, std::string name) {
    const auto parents = resolve(ids);
    if (parents.size() < 2) {
        throw InsufficientParents("fuse: need at least 2 valid parents, got "
                                  + std::to_string(parents.size()));
    }

    require_free_id();
    return insert_new(fusion::make_product(next_id_, std::move(name), ids, parents));
}

NodeId DistributionGraph::fuse(const std::vector<NodeId>& ids) {
    return fuse(ids, "Product " + std::to_string(next_id_ + 1));
}

bool DistributionGraph::remove(NodeId id) {
    return nodes_.erase(id) != 0;
}

bool DistributionGraph::set_leaf(NodeId id, double mean, double std_dev) {
    const auto it = nodes_.find(id);
    if (it == nodes_.end() || it->second.is_product()) return false;
    it->second.set_parameters(mean, std_dev);
    return true;
}

void DistributionGraph::recompute_products() {
    // Work on a copy so a failing fusion leaves every node as it was.
    std::map<NodeId, Gaussian> updated = nodes_;
    for (NodeId id : recompute_order()) {
        Gaussian& node = updated.at(id);
        const auto& parent_ids = node.parent_ids();
        if (parent_ids.empty()) continue;

        const auto parents = resolve_in(updated, parent_ids);
        if (parents.size() != parent_ids.size()) {
            GFUSE_DEBUG_LOG("product %u has a missing parent, keeping stale value",
                            static_cast<unsigned>(id));
            continue;
        }

        const fusion::FusionResult fused = fusion::fuse(parents);
        node.refresh(fused.mean, fused.std_dev());
    }
    nodes_.swap(updated);
}

const Gaussian* DistributionGraph::find(NodeId id) const {
    const auto it = nodes_.find(id);
    return it == nodes_.end() ? nullptr : &it->second;
}

std::vector<const Gaussian*> DistributionGraph::resolve(const std::vector<NodeId>& ids) const {
    return resolve_in(nodes_, ids);
}

std::map<NodeId, int> DistributionGraph::product_ranks() const {
    std::map<NodeId, int> ranks;
    std::set<NodeId> on_path;
    for (const auto& [id, node] : nodes_) {
        if (node.is_product()) rank_of(nodes_, id, ranks, on_path);
    }
    return ranks;
}

std::vector<NodeId> DistributionGraph::recompute_order() const {
    const auto ranks = product_ranks();
    std::vector<std::pair<int, NodeId>> ranked;
    ranked.reserve(ranks.size());
    for (const auto& [id, rank] : ranks) ranked.emplace_back(rank, id);
    std::sort(ranked.begin(), ranked.end());

    std::vector<NodeId> order;
    order.reserve(ranked.size());
    for (const auto& entry : ranked) order.push_back(entry.second);
    return order;
}

} // namespace gfuse::graph
