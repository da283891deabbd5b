#pragma once

#include <nlohmann/json.hpp>

#include "gfuse/distributions/gaussian.hpp"
#include "gfuse/errors.hpp"
#include "gfuse/graph/distribution_graph.hpp"
#include "gfuse/plot_utils/plot_options.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace gfuse::serialization {

using json = nlohmann::json;

/// Everything a session persists: the graph plus its display switches.
struct Snapshot {
    graph::DistributionGraph graph;
    plot_utils::DisplayFlags display;

    bool operator==(const Snapshot&) const = default;
};

// ============================================================
// Gaussian node
// ============================================================

/// Read a node id. Throws DecodeError unless j is a non-negative integer
/// that fits in NodeId.
inline distributions::NodeId node_id_from_json(const json& j, const char* field) {
    if (!j.is_number_unsigned()
        || j.get<std::uint64_t>() > std::numeric_limits<distributions::NodeId>::max()) {
        throw DecodeError(std::string("snapshot: ") + field + " must be an id in [0, "
                          + std::to_string(std::numeric_limits<distributions::NodeId>::max())
                          + "], got " + j.dump());
    }
    return static_cast<distributions::NodeId>(j.get<std::uint64_t>());
}

inline json to_json(const distributions::Gaussian& g) {
    json j;
    j["id"] = g.id();
    j["name"] = g.name();
    j["mean"] = g.mean();
    j["std_dev"] = g.std_dev();
    j["parent_ids"] = g.parent_ids();
    j["is_product"] = g.is_product();
    return j;
}

/// Throws DecodeError on std_dev <= 0 or an out-of-range id. A leaf that
/// lists parents is read as a plain leaf and the parent ids are dropped.
/// Type mismatches surface as nlohmann::json::exception.
inline distributions::Gaussian gaussian_from_json(const json& j) {
    const auto id = node_id_from_json(j.at("id"), "id");
    auto name = j.at("name").get<std::string>();
    const double mean = j.at("mean").get<double>();
    const double std_dev = j.at("std_dev").get<double>();
    const json& parents = j.at("parent_ids");
    if (!parents.is_array()) {
        throw DecodeError("snapshot: parent_ids of distribution " + std::to_string(id)
                          + " must be an array");
    }
    std::vector<distributions::NodeId> parent_ids;
    parent_ids.reserve(parents.size());
    for (const auto& p : parents) {
        parent_ids.push_back(node_id_from_json(p, "parent_ids"));
    }
    const bool is_product = j.at("is_product").get<bool>();

    if (!(std_dev > 0.0) || !std::isfinite(std_dev)) {
        throw DecodeError("snapshot: distribution " + std::to_string(id)
                          + " has a non-positive std_dev");
    }
    if (is_product) {
        return distributions::Gaussian::product(id, std::move(name), std::move(parent_ids),
                                                mean, std_dev);
    }
    return distributions::Gaussian(id, std::move(name), mean, std_dev);
}

// ============================================================
// Snapshot
// ============================================================

inline json snapshot_to_json(const graph::DistributionGraph& g,
                             const plot_utils::DisplayFlags& display) {
    json dists = json::object();
    for (const auto& [id, node] : g.nodes()) {
        dists[std::to_string(id)] = to_json(node);
    }

    json j;
    j["distributions"] = std::move(dists);
    j["next_id"] = g.next_id();
    j["show_shading"] = display.show_shading;
    j["shading_opacity"] = display.shading_opacity;
    j["show_std_markers"] = display.show_std_markers;
    return j;
}

inline json snapshot_to_json(const Snapshot& s) {
    return snapshot_to_json(s.graph, s.display);
}

/// Throws DecodeError on missing fields, wrong types or inconsistent content.
inline Snapshot snapshot_from_json(const json& j) {
    try {
        std::map<distributions::NodeId, distributions::Gaussian> nodes;
        for (const auto& item : j.at("distributions").items()) {
            auto node = gaussian_from_json(item.value());
            if (item.key() != std::to_string(node.id())) {
                throw DecodeError("snapshot: key '" + item.key() + "' does not match id "
                                  + std::to_string(node.id()));
            }
            const auto id = node.id();
            nodes.emplace(id, std::move(node));
        }

        const auto next_id = node_id_from_json(j.at("next_id"), "next_id");
        if (!nodes.empty() && next_id <= nodes.rbegin()->first) {
            throw DecodeError("snapshot: next_id " + std::to_string(next_id)
                              + " would reuse a stored id");
        }

        Snapshot s;
        s.display.show_shading = j.at("show_shading").get<bool>();
        s.display.shading_opacity = j.at("shading_opacity").get<double>();
        s.display.show_std_markers = j.at("show_std_markers").get<bool>();
        if (!(s.display.shading_opacity >= 0.0 && s.display.shading_opacity <= 1.0)) {
            throw DecodeError("snapshot: shading_opacity must be in [0, 1]");
        }
        s.graph = graph::DistributionGraph(std::move(nodes), next_id);
        return s;
    } catch (const json::exception& e) {
        throw DecodeError(std::string("snapshot: ") + e.what());
    }
}

// ============================================================
// Text form
// ============================================================

inline std::string encode(const graph::DistributionGraph& g,
                          const plot_utils::DisplayFlags& display) {
    return snapshot_to_json(g, display).dump(2);
}

inline std::string encode(const Snapshot& s) {
    return encode(s.graph, s.display);
}

/// Parse snapshot text. Throws DecodeError with a readable message.
inline Snapshot decode(const std::string& text) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        throw DecodeError(std::string("snapshot: failed to parse: ") + e.what());
    }
    if (!j.is_object()) {
        throw DecodeError("snapshot: top level must be an object");
    }
    return snapshot_from_json(j);
}

} // namespace gfuse::serialization
