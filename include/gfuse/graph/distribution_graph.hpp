#pragma once

#include "gfuse/distributions/gaussian.hpp"
#include <map>
#include <string>
#include <vector>

namespace gfuse::graph {

using distributions::Gaussian;
using distributions::NodeId;

/// Store of Gaussian nodes keyed by id, where product nodes reference other
/// nodes as parents.
///
/// Ids come from a counter that only grows, so a deleted id is never handed
/// out again. Edges are not edited when a node is deleted: a product whose
/// parent is gone keeps its last value (a dangling edge is valid state).
/// Callers run recompute_products() after each mutation before reading values.
class DistributionGraph {
public:
    DistributionGraph() = default;

    /// Rebuild a graph from stored nodes (used by the snapshot codec).
    /// Node values are taken as-is, products are not recomputed.
    /// Throws std::invalid_argument if next_id is not above every stored id.
    DistributionGraph(std::map<NodeId, Gaussian> nodes, NodeId next_id);

    // ---- Mutation ----

    /// Insert a leaf and return its id. Throws InvalidParameter unless std_dev > 0.
    /// Throws std::overflow_error once every id has been handed out.
    NodeId add_leaf(std::string name, double mean, double std_dev);

    /// Insert N(0, 1) named "Gaussian <id+1>".
    NodeId add_leaf();

    /// Insert the fusion of the given nodes and return its id.
    /// Throws InsufficientParents (graph unchanged) if fewer than two ids resolve.
    /// The requested id list is stored verbatim as the product's parent edges.
    NodeId fuse(const std::vector<NodeId>& ids, std::string name);

    /// fuse() with the product named "Product <id+1>".
    NodeId fuse(const std::vector<NodeId>& ids);

    /// Remove a node. Returns false if absent. Dependents keep their edges.
    bool remove(NodeId id);

    /// Set a leaf's parameters. Returns false (no change) if the id is absent
    /// or names a product. Throws InvalidParameter unless std_dev > 0.
    bool set_leaf(NodeId id, double mean, double std_dev);

    /// Refresh every product from its parents' current values, ancestors first,
    /// so chains of products converge in one call. Products with a missing
    /// parent or no parents keep their stored values.
    /// If a fusion fails (InvalidParameter when parent precisions overflow)
    /// no node is changed.
    void recompute_products();

    // ---- Queries ----

    [[nodiscard]] bool contains(NodeId id) const { return nodes_.count(id) != 0; }
    [[nodiscard]] const Gaussian* find(NodeId id) const;
    [[nodiscard]] const Gaussian& at(NodeId id) const { return nodes_.at(id); }

    [[nodiscard]] std::size_t size() const { return nodes_.size(); }
    [[nodiscard]] bool empty() const { return nodes_.empty(); }
    [[nodiscard]] NodeId next_id() const { return next_id_; }
    [[nodiscard]] const std::map<NodeId, Gaussian>& nodes() const { return nodes_; }

    /// Resolve ids to nodes, skipping ids that are absent.
    [[nodiscard]] std::vector<const Gaussian*> resolve(const std::vector<NodeId>& ids) const;

    /// Parent-chain depth of every product: 1 + the largest rank among its
    /// parents, where leaves and missing ids rank 0. A parent that closes a
    /// cycle also counts as 0.
    [[nodiscard]] std::map<NodeId, int> product_ranks() const;

    /// Product ids in ascending rank (ties by id): the order recompute_products() uses.
    [[nodiscard]] std::vector<NodeId> recompute_order() const;

    bool operator==(const DistributionGraph&) const = default;

private:
    /// Check that next_id_ is still free to hand out.
    void require_free_id() const;

    /// Insert a node built with id next_id_ and advance the counter.
    NodeId insert_new(Gaussian node);

    std::map<NodeId, Gaussian> nodes_;
    NodeId next_id_ = 0;
};

} // namespace gfuse::graph
