#include <facsforge/error.hpp>
#include <facsforge/hierarchy.hpp>
#include <facsforge/logger.hpp>

#include <algorithm>
#include <stdexcept>
#include <unordered_map>

namespace facsforge
{

// ─── GateHierarchy queries ──────────────────────────────────────────────────

const GateNode& GateHierarchy::node(NodeId id) const
{
    if (id >= nodes_.size())
        throw std::out_of_range("GateHierarchy: node id " + std::to_string(id) + " out of range");
    return nodes_[id];
}

std::vector<NodeId> GateHierarchy::depth_first() const
{
    std::vector<NodeId> order;
    if (nodes_.empty())
        return order;
    order.reserve(nodes_.size());

    std::vector<NodeId> stack{0};
    while (!stack.empty())
    {
        const NodeId id = stack.back();
        stack.pop_back();
        order.push_back(id);
        const auto& kids = nodes_[id].children;
        for (auto it = kids.rbegin(); it != kids.rend(); ++it)
            stack.push_back(*it);
    }
    return order;
}

std::string GateHierarchy::display_name(NodeId id) const
{
    const auto& n = node(id);
    if (!n.name.empty())
        return n.name;
    return "Population" + std::to_string(n.sibling_index + 1);
}

std::vector<std::string> GateHierarchy::path(NodeId id) const
{
    std::vector<std::string> out;
    for (NodeId cur = id; cur != INVALID_NODE; cur = node(cur).parent)
        out.push_back(display_name(cur));
    std::reverse(out.begin(), out.end());
    return out;
}

size_t GateHierarchy::depth(NodeId id) const
{
    size_t d = 0;
    for (NodeId cur = node(id).parent; cur != INVALID_NODE; cur = node(cur).parent)
        ++d;
    return d;
}

std::optional<NodeId> GateHierarchy::find(std::string_view name) const
{
    for (NodeId id : depth_first())
    {
        if (display_name(id) == name)
            return id;
    }
    return std::nullopt;
}

namespace
{

void sort_unique(std::vector<std::string>& v)
{
    std::sort(v.begin(), v.end());
    v.erase(std::unique(v.begin(), v.end()), v.end());
}

}   // namespace

std::vector<std::string> GateHierarchy::referenced_channels() const
{
    std::vector<std::string> out = marker_channels();
    for (const auto& n : nodes_)
    {
        if (!n.gate)
            continue;
        out.push_back(n.gate->x_channel);
        if (!n.gate->is_range())
            out.push_back(n.gate->y_channel);
    }
    sort_unique(out);
    return out;
}

std::vector<std::string> GateHierarchy::marker_channels() const
{
    std::vector<std::string> out;
    for (const auto& n : nodes_)
    {
        for (const auto& rule : n.markers)
            out.push_back(rule.channel);
    }
    sort_unique(out);
    return out;
}

// ─── Builder ────────────────────────────────────────────────────────────────

NodeId GateHierarchyBuilder::add_root(std::string name, std::optional<Gate> gate)
{
    if (!nodes_.empty())
        throw ImportError("gate hierarchy already has a root");

    GateNode root;
    root.id = 0;
    root.name = std::move(name);
    root.gate = std::move(gate);
    nodes_.push_back(std::move(root));
    return 0;
}

NodeId GateHierarchyBuilder::add_child(NodeId parent, std::string name, std::optional<Gate> gate,
                                       std::vector<MarkerRule> markers)
{
    if (parent >= nodes_.size())
        throw ImportError("population '" + name + "' references non-existent parent node "
                          + std::to_string(parent));

    GateNode child;
    child.id = nodes_.size();
    child.name = std::move(name);
    child.gate = std::move(gate);
    child.markers = std::move(markers);
    child.parent = parent;
    child.sibling_index = nodes_[parent].children.size();

    nodes_[parent].children.push_back(child.id);
    nodes_.push_back(std::move(child));
    return nodes_.back().id;
}

GateHierarchy GateHierarchyBuilder::build()
{
    if (nodes_.empty())
        throw ImportError("gate hierarchy has no root");

    const size_t n = nodes_.size();
    std::vector<size_t> owner_count(n, 0);

    for (const auto& node : nodes_)
    {
        const std::string label = node.name.empty() ? "node " + std::to_string(node.id) : node.name;

        if (node.id == 0)
        {
            if (node.parent != INVALID_NODE)
                throw ImportError("root '" + label + "' must not have a parent");
        }
        else
        {
            if (node.parent >= n || node.parent == node.id)
                throw ImportError("population '" + label + "' has an invalid parent link");
            if (!node.gate && node.markers.empty())
                throw ImportError("population '" + label + "' has neither a gate nor marker rules");
        }

        // Walking up must reach the root in fewer than n steps.
        size_t steps = 0;
        for (NodeId cur = node.parent; cur != INVALID_NODE; cur = nodes_[cur].parent)
        {
            if (++steps > n)
                throw ImportError("population '" + label + "' is part of a parent cycle");
        }

        for (NodeId child : node.children)
        {
            if (child >= n || nodes_[child].parent != node.id)
                throw ImportError("population '" + label + "' lists an inconsistent child link");
            ++owner_count[child];
        }

        if (node.gate)
            validate_gate(*node.gate, "population '" + label + "'");
        for (const auto& rule : node.markers)
        {
            if (rule.channel.empty())
                throw ImportError("population '" + label + "' has a marker rule without a channel");
        }
    }

    for (size_t i = 1; i < n; ++i)
    {
        if (owner_count[i] != 1)
            throw ImportError("node " + std::to_string(i) + " is owned by "
                              + std::to_string(owner_count[i]) + " parents");
    }

    GateHierarchy tree;
    tree.nodes_ = std::move(nodes_);
    nodes_.clear();

    FACSFORGE_LOG_DEBUG("hierarchy", "built gate hierarchy with {} nodes", tree.size());
    return tree;
}

// ─── Flat definitions ───────────────────────────────────────────────────────

GateHierarchy build_hierarchy(const std::vector<GateDefinition>& definitions,
                              const std::string& root_name)
{
    constexpr size_t ROOT = static_cast<size_t>(-1);

    std::unordered_map<std::string, size_t> index;
    for (size_t i = 0; i < definitions.size(); ++i)
    {
        const auto& name = definitions[i].name;
        if (name.empty())
            throw ImportError("population #" + std::to_string(i + 1) + " has an empty name");
        if (name == root_name)
            throw ImportError("population name '" + name + "' collides with the root");
        if (!index.emplace(name, i).second)
            throw ImportError("duplicate population name '" + name + "'");
    }

    std::vector<size_t> parent_of(definitions.size(), ROOT);
    std::vector<std::vector<size_t>> children_of(definitions.size());
    std::vector<size_t> top_level;

    for (size_t i = 0; i < definitions.size(); ++i)
    {
        const auto& def = definitions[i];
        if (def.parent.empty() || def.parent == root_name)
        {
            top_level.push_back(i);
            continue;
        }
        auto it = index.find(def.parent);
        if (it == index.end())
            throw ImportError("population '" + def.name + "' references non-existent parent '"
                              + def.parent + "'");
        parent_of[i] = it->second;
        children_of[it->second].push_back(i);
    }

    for (size_t i = 0; i < definitions.size(); ++i)
    {
        size_t steps = 0;
        for (size_t cur = parent_of[i]; cur != ROOT; cur = parent_of[cur])
        {
            if (++steps > definitions.size())
                throw ImportError("population '" + definitions[i].name
                                  + "' is part of a parent cycle");
        }
    }

    GateHierarchyBuilder builder;
    const NodeId root = builder.add_root(root_name);

    // Pre-order insertion keeps node ids in depth-first order.
    struct Pending
    {
        size_t def;
        NodeId parent;
    };
    std::vector<Pending> stack;
    for (auto it = top_level.rbegin(); it != top_level.rend(); ++it)
        stack.push_back({*it, root});

    while (!stack.empty())
    {
        const Pending p = stack.back();
        stack.pop_back();
        const auto& def = definitions[p.def];
        const NodeId id = builder.add_child(p.parent, def.name, def.gate, def.markers);
        const auto& kids = children_of[p.def];
        for (auto it = kids.rbegin(); it != kids.rend(); ++it)
            stack.push_back({*it, id});
    }

    return builder.build();
}

void check_declared_channels(const GateHierarchy& hierarchy, const std::vector<Channel>& channels)
{
    for (NodeId id : hierarchy.depth_first())
    {
        const auto& n = hierarchy.node(id);
        if (n.gate)
        {
            for (const auto* ch : {&n.gate->x_channel, &n.gate->y_channel})
            {
                if (ch->empty() && n.gate->is_range())
                    continue;
                if (!find_channel(channels, *ch))
                    throw ChannelNotFoundError(*ch,
                                               "gate '" + hierarchy.display_name(id)
                                                   + "' references an undeclared channel");
            }
        }
        for (const auto& rule : n.markers)
        {
            if (!find_channel(channels, rule.channel))
                throw ChannelNotFoundError(rule.channel, "marker rule of '" + hierarchy.display_name(id)
                                                             + "' references an undeclared channel");
        }
    }
}

}   // namespace facsforge
