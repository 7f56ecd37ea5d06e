#pragma once

#include <cstddef>
#include <facsforge/channel.hpp>
#include <facsforge/gate.hpp>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace facsforge
{

// Nodes live in an arena and refer to each other by index.
using NodeId = size_t;

inline constexpr NodeId INVALID_NODE = static_cast<NodeId>(-1);

// Keeps events whose raw value on `channel` is above (positive) or at or
// below (negative) the channel's automatic threshold for the event matrix.
struct MarkerRule
{
    std::string channel;
    bool        positive = true;

    bool operator==(const MarkerRule&) const = default;
};

struct GateNode
{
    NodeId                  id = INVALID_NODE;
    std::string             name;      // empty when the source document had none
    std::optional<Gate>     gate;      // a non-root node has a gate, marker rules, or both
    std::vector<MarkerRule> markers;   // applied after the gate, in order
    NodeId                  parent = INVALID_NODE;
    std::vector<NodeId>     children;
    size_t                  sibling_index = 0;
};

// ─── GateHierarchy ──────────────────────────────────────────────────────────
// Single-rooted, acyclic, read-only once built. Node 0 is the root.
// Use GateHierarchyBuilder or build_hierarchy() to create one.
class GateHierarchy
{
   public:
    GateHierarchy() = default;

    bool   empty() const { return nodes_.empty(); }
    size_t size() const { return nodes_.size(); }
    NodeId root() const { return nodes_.empty() ? INVALID_NODE : 0; }

    // Throws std::out_of_range for an unknown id.
    const GateNode& node(NodeId id) const;

    NodeId                  parent(NodeId id) const { return node(id).parent; }
    std::span<const NodeId> children(NodeId id) const { return node(id).children; }

    // Pre-order walk from the root; children in source order.
    std::vector<NodeId> depth_first() const;

    // Human-readable name, or "Population<k>" from the 1-based sibling
    // position when the node is unnamed.
    std::string display_name(NodeId id) const;

    // Display names from the root down to id, inclusive.
    std::vector<std::string> path(NodeId id) const;

    size_t depth(NodeId id) const;

    // First node (pre-order) whose display name matches.
    std::optional<NodeId> find(std::string_view name) const;

    // Every channel referenced by any gate or marker rule, sorted, without
    // duplicates.
    std::vector<std::string> referenced_channels() const;

    // Channels named by marker rules, sorted, without duplicates.
    std::vector<std::string> marker_channels() const;

   private:
    friend class GateHierarchyBuilder;

    std::vector<GateNode> nodes_;
};

// ─── Builder ────────────────────────────────────────────────────────────────

class GateHierarchyBuilder
{
   public:
    // The root is node 0. It may carry a gate (evaluated against all events).
    NodeId add_root(std::string name, std::optional<Gate> gate = std::nullopt);

    NodeId add_child(NodeId parent, std::string name, std::optional<Gate> gate,
                     std::vector<MarkerRule> markers = {});

    // Validate and hand over the tree. Throws ImportError on any structural
    // problem. The builder is empty afterwards.
    GateHierarchy build();

   private:
    std::vector<GateNode> nodes_;
};

// Flat definition with the parent referenced by name (config / importer
// intermediate form). An empty parent means "child of the root".
struct GateDefinition
{
    std::string             name;
    std::string             parent;
    std::optional<Gate>     gate;
    std::vector<MarkerRule> markers;
};

// Resolve flat definitions into a tree under an ungated root. Sibling order
// follows definition order. Throws ImportError on duplicate names, unknown
// parents, or parent cycles.
GateHierarchy build_hierarchy(const std::vector<GateDefinition>& definitions,
                              const std::string& root_name = "All Events");

// Throws ChannelNotFoundError naming the first gate or marker rule whose
// channel is not in the declared set.
void check_declared_channels(const GateHierarchy& hierarchy, const std::vector<Channel>& channels);

}   // namespace facsforge
