#include <facsforge/error.hpp>
#include <facsforge/logger.hpp>
#include <facsforge/workspace.hpp>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <set>

#include "csv_reader.hpp"
#include "xml_reader.hpp"

namespace facsforge
{

namespace
{

std::string trim_copy(std::string_view s)
{
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
        ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
        --e;
    return std::string(s.substr(b, e - b));
}

// Numeric attribute by local name; nullopt when absent, ImportError when
// present but not a number.
std::optional<double> number_attr(const XmlElement& e, std::string_view local)
{
    const std::string* raw = e.attribute(local);
    if (!raw)
        return std::nullopt;
    double v = 0.0;
    if (!try_parse_double(trim_copy(*raw), v))
        throw ImportError("line " + std::to_string(e.line) + ": <" + e.name + "> attribute '"
                          + std::string(local) + "' is not a number: '" + *raw + "'");
    return v;
}

// Channel named by a <data-type:parameter data-type:name="..."/> (or
// fcs-dimension) child.
std::string parameter_channel(const XmlElement& e)
{
    for (const char* tag : {"parameter", "fcs-dimension"})
    {
        if (const auto* p = e.find_first(tag))
        {
            if (const auto* n = p->attribute("name"))
                return trim_copy(*n);
        }
    }
    if (const auto* n = e.attribute("parameter"))
        return trim_copy(*n);
    return {};
}

// ─── Channels ───────────────────────────────────────────────────────────────

std::vector<Channel> read_channels(const XmlElement& root)
{
    std::vector<Channel> channels;
    for (const auto* p : root.find_all("Parameter"))
    {
        std::string name;
        for (const char* key : {"name", "shortName", "longName"})
        {
            if (const auto* v = p->attribute(key); v && !trim_copy(*v).empty())
            {
                name = trim_copy(*v);
                break;
            }
        }
        if (name.empty() || find_channel(channels, name))
            continue;

        Channel ch;
        ch.name = name;
        ch.role = default_role_for(name);
        if (const auto* det = p->child("Detector"))
            ch.fluor = trim_copy(det->text);
        channels.push_back(std::move(ch));
    }
    return channels;
}

// ─── Transforms ─────────────────────────────────────────────────────────────

// A channel may be declared more than once (one <Transformations> block per
// sample) but every declaration has to agree.
void set_transform(TransformSet& out, const std::string& channel, ChannelTransform transform,
                   const XmlElement& at)
{
    if (out.contains(channel) && !(out.get(channel) == transform))
        throw ImportError("line " + std::to_string(at.line) + ": conflicting transforms for channel '"
                          + channel + "' (" + out.get(channel).description() + " vs "
                          + transform.description() + ")");
    out.set(channel, std::move(transform));
}

void read_transforms(const XmlElement& scope, std::vector<Channel>& channels, TransformSet& out)
{
    for (const auto* e : scope.find_all("logicle"))
    {
        const std::string channel = parameter_channel(*e);
        if (channel.empty())
            throw ImportError("line " + std::to_string(e->line)
                              + ": logicle transform names no channel");

        LogicleParams params;
        if (auto v = number_attr(*e, "T"))
            params.T = *v;
        if (auto v = number_attr(*e, "W"))
            params.W = *v;
        else if (auto w = number_attr(*e, "w"))
            params.W = *w;
        if (auto v = number_attr(*e, "M"))
            params.M = *v;
        if (auto v = number_attr(*e, "A"))
            params.A = *v;

        std::optional<LogicleTransform> logicle;
        try
        {
            logicle.emplace(params);
        }
        catch (const TransformParameterError& err)
        {
            throw TransformParameterError("channel '" + channel + "': " + err.what());
        }
        set_transform(out, channel, *logicle, *e);

        auto it = std::find_if(channels.begin(), channels.end(),
                               [&](const Channel& c) { return c.name == channel; });
        if (it != channels.end())
            it->role = ChannelRole::FluorescenceLogicle;
        else
            FACSFORGE_LOG_WARN("import", "logicle transform for undeclared channel '{}'", channel);

        FACSFORGE_LOG_DEBUG("import", "{}: logicle T={} W={} M={} A={}", channel, params.T,
                            params.W, params.M, params.A);
    }

    for (const auto* e : scope.find_all("linear"))
    {
        const std::string channel = parameter_channel(*e);
        if (channel.empty() || (out.contains(channel) && out.get(channel).as_logicle()))
            continue;

        auto lo = number_attr(*e, "minRange");
        auto hi = number_attr(*e, "maxRange");
        if (!lo)
            lo = number_attr(*e, "min");
        if (!hi)
            hi = number_attr(*e, "max");

        if (lo && hi)
        {
            if (!(*lo < *hi))
                throw TransformParameterError("channel '" + channel + "': linear range ["
                                              + std::to_string(*lo) + ", " + std::to_string(*hi)
                                              + "] is empty");
            set_transform(out, channel, LinearTransform(*lo, *hi), *e);
        }
        else
            set_transform(out, channel, LinearTransform(), *e);
    }
}

// ─── Gates ──────────────────────────────────────────────────────────────────

std::vector<std::string> dimension_channels(const XmlElement& shape)
{
    std::vector<std::string> out;
    for (const auto* dim : shape.children_named("dimension"))
    {
        std::string ch = parameter_channel(*dim);
        if (ch.empty())
            throw ImportError("line " + std::to_string(dim->line) + ": gate dimension names no channel");
        out.push_back(std::move(ch));
    }
    return out;
}

// Bounds of one rectangle dimension: min/max on the <dimension>, an
// <interval> nested in it, or the sibling <interval> at the same position.
struct Bounds
{
    std::optional<double> lo;
    std::optional<double> hi;
};

Bounds dimension_bounds(const XmlElement& dim, const XmlElement* sibling_interval)
{
    Bounds b{number_attr(dim, "min"), number_attr(dim, "max")};
    for (const XmlElement* iv : {dim.child("interval"), sibling_interval})
    {
        if (!iv)
            continue;
        if (!b.lo)
            b.lo = number_attr(*iv, "low");
        if (!b.hi)
            b.hi = number_attr(*iv, "high");
    }
    return b;
}

Gate read_shape(const XmlElement& shape, const std::string& population, const TransformSet& transforms)
{
    const auto kind = shape.local_name();
    if (kind != "PolygonGate" && kind != "RectangleGate")
        throw ImportError("population '" + population + "': unsupported gate kind '"
                          + std::string(kind) + "'");

    const auto channels = dimension_channels(shape);
    if (channels.size() != 2)
        throw ImportError("population '" + population + "': " + std::string(kind) + " has "
                          + std::to_string(channels.size()) + " dimensions, expected 2");

    Gate gate;
    gate.x_channel = channels[0];
    gate.y_channel = channels[1];
    const auto& tx = transforms.get(gate.x_channel);
    const auto& ty = transforms.get(gate.y_channel);

    if (kind == "PolygonGate")
    {
        PolygonGate poly;
        for (const auto* vertex : shape.children_named("vertex"))
        {
            const auto coords = vertex->children_named("coordinate");
            if (coords.size() != 2)
                throw ImportError("population '" + population + "': vertex at line "
                                  + std::to_string(vertex->line) + " has "
                                  + std::to_string(coords.size()) + " coordinates");
            auto x = number_attr(*coords[0], "value");
            auto y = number_attr(*coords[1], "value");
            if (!x || !y)
                throw ImportError("population '" + population + "': vertex at line "
                                  + std::to_string(vertex->line) + " is missing a value");
            poly.vertices.push_back({tx.to_display(*x), ty.to_display(*y)});
        }
        gate.shape = std::move(poly);
    }
    else
    {
        const auto dims      = shape.children_named("dimension");
        const auto intervals = shape.children_named("interval");
        if (!intervals.empty() && intervals.size() != dims.size())
            throw ImportError("population '" + population + "': RectangleGate has "
                              + std::to_string(intervals.size()) + " intervals for "
                              + std::to_string(dims.size()) + " dimensions");
        const Bounds x = dimension_bounds(*dims[0], intervals.empty() ? nullptr : intervals[0]);
        const Bounds y = dimension_bounds(*dims[1], intervals.empty() ? nullptr : intervals[1]);
        if (!x.lo || !x.hi || !y.lo || !y.hi)
            throw ImportError("population '" + population
                              + "': open-ended rectangle gates are not supported");
        gate.shape = RectangleGate{tx.to_display(*x.lo), tx.to_display(*x.hi),
                                   ty.to_display(*y.lo), ty.to_display(*y.hi)};
    }

    validate_gate(gate, "population '" + population + "'");
    return gate;
}

// The shape element inside a population's <Gate> wrapper.
const XmlElement& gate_shape_element(const XmlElement& population, const std::string& name)
{
    const XmlElement* wrapper = population.child("Gate");
    if (!wrapper)
        throw ImportError("population '" + name + "' at line " + std::to_string(population.line)
                          + " has no <Gate>");
    for (const auto& c : wrapper->children)
    {
        const auto local = c.local_name();
        if (local.size() > 4 && local.substr(local.size() - 4) == "Gate")
            return c;
    }
    throw ImportError("population '" + name + "' has an empty <Gate>");
}

class PopulationWalker
{
   public:
    PopulationWalker(const std::vector<Channel>& channels, const TransformSet& transforms)
        : channels_(channels), transforms_(transforms)
    {
    }

    GateHierarchy walk(const XmlElement& scope)
    {
        const NodeId root = builder_.add_root(WORKSPACE_ROOT_NAME);
        descend(scope, root, std::string());
        return builder_.build();
    }

   private:
    // Visit children of `e`; populations found attach to `parent`.
    void descend(const XmlElement& e, NodeId parent, const std::string& parent_gate_id)
    {
        for (const auto& c : e.children)
        {
            if (c.local_name() == "Population")
                visit_population(c, parent, parent_gate_id);
            else
                descend(c, parent, parent_gate_id);
        }
    }

    void visit_population(const XmlElement& pop, NodeId parent, const std::string& parent_gate_id)
    {
        const std::string* name_attr = pop.attribute("name");
        const std::string name = name_attr ? trim_copy(*name_attr) : std::string();
        const std::string label = name.empty() ? "<unnamed, line " + std::to_string(pop.line) + ">" : name;

        const XmlElement& shape = gate_shape_element(pop, label);
        Gate gate = read_shape(shape, label, transforms_);

        for (const auto* ch : {&gate.x_channel, &gate.y_channel})
        {
            if (!find_channel(channels_, *ch))
                throw ChannelNotFoundError(*ch, "population '" + label
                                                    + "' gates on a channel the workspace does not declare");
        }

        // gating:id / gating:parent_id must agree with nesting.
        std::string id;
        if (const auto* v = shape.attribute("id"))
            id = trim_copy(*v);
        if (const auto* pid = shape.attribute("parent_id"))
        {
            const std::string p = trim_copy(*pid);
            if (!p.empty() && !ids_.count(p))
                throw ImportError("population '" + label + "' references non-existent parent gate '" + p + "'");
            if (!p.empty() && p != parent_gate_id)
                throw ImportError("population '" + label + "' declares parent gate '" + p
                                  + "' but is nested under '"
                                  + (parent_gate_id.empty() ? std::string(WORKSPACE_ROOT_NAME) : parent_gate_id)
                                  + "'");
        }
        if (!id.empty() && !ids_.insert(id).second)
            throw ImportError("duplicate gate id '" + id + "' (population '" + label + "')");

        const NodeId node = builder_.add_child(parent, name, std::move(gate));
        FACSFORGE_LOG_DEBUG("import", "population '{}' -> node {} (parent {})", label, node, parent);
        descend(pop, node, id);
    }

    const std::vector<Channel>& channels_;
    const TransformSet&         transforms_;
    GateHierarchyBuilder        builder_;
    std::set<std::string>       ids_;
};

// Where the gating tree comes from. `sample` is the <Sample> owning the tree
// (null when the document has no <Sample> wrapper around it); `tree` is the
// subtree holding its populations.
struct GatingSource
{
    const XmlElement* sample = nullptr;
    const XmlElement* tree   = nullptr;
};

// The first sample with populations, or the whole document.
GatingSource gating_source(const XmlElement& root)
{
    GatingSource src;
    const auto samples = root.find_all("Sample");
    for (const auto* s : samples)
    {
        if (s->find_first("Population"))
        {
            src.sample = s;
            const XmlElement* node = s->find_first("SampleNode");
            src.tree = node && node->find_first("Population") ? node : s;
            break;
        }
    }

    size_t candidates = samples.size();
    if (!src.tree)
    {
        const auto nodes = root.find_all("SampleNode");
        candidates = nodes.size();
        for (const auto* n : nodes)
        {
            if (n->find_first("Population"))
            {
                src.tree = n;
                break;
            }
        }
    }
    if (!src.tree)
    {
        src.tree = &root;
        return src;
    }

    if (candidates > 1)
    {
        const XmlElement* named = src.tree->attribute("name") ? src.tree : src.sample;
        const std::string* name = named ? named->attribute("name") : nullptr;
        FACSFORGE_LOG_INFO("import", "workspace has {} samples; using the gating tree of '{}'",
                           candidates, name ? *name : std::string("sample 1"));
    }
    return src;
}

// Transforms apply to the sample that owns the gating tree. Workspaces that
// keep them outside the samples are read whole; conflicting declarations
// are then rejected by set_transform.
const XmlElement& transform_scope(const XmlElement& root, const GatingSource& src)
{
    if (src.sample && (src.sample->find_first("logicle") || src.sample->find_first("linear")))
        return *src.sample;
    return root;
}

std::optional<std::string> compensation_reference(const XmlElement& root)
{
    for (const char* tag : {"CompensationMatrix", "spilloverMatrix"})
    {
        if (const auto* m = root.find_first(tag))
        {
            for (const char* key : {"name", "id"})
            {
                if (const auto* v = m->attribute(key); v && !v->empty())
                    return *v;
            }
        }
    }
    return std::nullopt;
}

bool declares_v10(const XmlElement& root)
{
    if (const auto* v = root.attribute("flowJoVersion"); v && trim_copy(*v).starts_with("10"))
        return true;
    if (root.local_name() == "Workspace")
    {
        if (const auto* v = root.attribute("version"))
        {
            double ver = 0.0;
            if (try_parse_double(trim_copy(*v), ver) && ver >= 2.0)
                return true;
        }
    }
    return false;
}

}   // namespace

bool is_flowjo10_workspace(std::string_view content)
{
    if (content.substr(0, 4) == std::string_view("PK\x03\x04", 4))
        return true;
    try
    {
        return declares_v10(parse_xml(content));
    }
    catch (const ImportError&)
    {
        return false;
    }
}

WorkspaceImport import_flowjo9_text(std::string_view xml, const std::string& source)
{
    if (xml.substr(0, 4) == std::string_view("PK\x03\x04", 4))
        throw UnsupportedFormatError(source + ": FlowJo v10 workspace archives are not supported");

    XmlElement root = parse_xml(xml);
    if (declares_v10(root))
        throw UnsupportedFormatError(source + ": FlowJo v10 workspaces are not supported; export as v9 XML");

    WorkspaceImport out;
    out.source = source;
    out.channels = read_channels(root);

    const GatingSource src = gating_source(root);
    read_transforms(transform_scope(root, src), out.channels, out.transforms);

    PopulationWalker walker(out.channels, out.transforms);
    out.hierarchy = walker.walk(*src.tree);
    out.compensation_ref = compensation_reference(root);

    FACSFORGE_LOG_INFO("import", "{}: {} channels, {} transforms, {} populations", source,
                       out.channels.size(), out.transforms.size(), out.hierarchy.size() - 1);
    return out;
}

WorkspaceImport import_flowjo9_file(const std::string& path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open())
        throw IoError("Cannot open file: " + path);
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    return import_flowjo9_text(text, path);
}

void import_flowjo10(const std::string& path)
{
    throw UnsupportedFormatError(path + ": FlowJo v10 workspace import is not implemented");
}

}   // namespace facsforge
