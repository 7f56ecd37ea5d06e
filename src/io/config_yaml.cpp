#include <facsforge/config.hpp>
#include <facsforge/error.hpp>
#include <facsforge/logger.hpp>
#include <facsforge/workspace.hpp>

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iterator>
#include <map>
#include <set>

namespace facsforge
{

namespace
{

using Path = std::vector<std::string>;

std::string format_path(const Path& path)
{
    if (path.empty())
        return "<root>";
    std::string out;
    for (const auto& p : path)
    {
        if (!out.empty())
            out += " → ";
        out += p;
    }
    return out;
}

std::string violation(const Path& path, const std::string& message)
{
    return "at '" + format_path(path) + "': " + message;
}

Path child_path(const Path& path, const std::string& key)
{
    Path p = path;
    p.push_back(key);
    return p;
}

const char* transform_kind_name(TransformKind kind)
{
    return kind == TransformKind::Logicle ? "logicle" : "linear";
}

// ─── Structural reader ──────────────────────────────────────────────────────
// Reads the YAML tree into typed structs, recording every structural problem
// instead of stopping at the first.

class ConfigReader
{
   public:
    ExperimentConfig read(const YAML::Node& root)
    {
        ExperimentConfig cfg;
        if (!root.IsMap())
        {
            fail({}, "expected a mapping at the top level");
            return cfg;
        }

        static const std::set<std::string> known = {"metadata", "panel", "compensation",
                                                    "celltypes", "celltypes_of_interest"};
        for (auto it = root.begin(); it != root.end(); ++it)
        {
            const std::string key = key_string(it->first, {});
            if (!key.empty() && !known.count(key))
                FACSFORGE_LOG_WARN("config", "ignoring unknown top-level key '{}'", key);
        }

        for (const char* key : {"metadata", "panel", "celltypes"})
        {
            if (!root[key])
                fail({}, std::string("missing required key '") + key + "'");
        }

        if (root["metadata"])
            read_metadata(root["metadata"], {"metadata"}, cfg.metadata);
        if (root["panel"])
            read_panel(root["panel"], {"panel"}, cfg.panel);
        if (root["compensation"])
            read_compensation(root["compensation"], {"compensation"}, cfg.compensation);
        if (root["celltypes"])
            read_celltypes(root["celltypes"], {"celltypes"}, cfg.celltypes);
        if (root["celltypes_of_interest"])
            cfg.celltypes_of_interest =
                string_list(root["celltypes_of_interest"], {"celltypes_of_interest"});
        return cfg;
    }

    const std::vector<std::string>& violations() const { return violations_; }

   private:
    void fail(const Path& path, const std::string& message)
    {
        violations_.push_back(violation(path, message));
    }

    std::string key_string(const YAML::Node& key, const Path& path)
    {
        if (!key.IsScalar())
        {
            fail(path, "mapping keys must be scalars");
            return {};
        }
        return key.Scalar();
    }

    // Null or absent -> empty string.
    std::string optional_string(const YAML::Node& node, const Path& path)
    {
        if (!node || node.IsNull())
            return {};
        if (!node.IsScalar())
        {
            fail(path, "expected a string");
            return {};
        }
        return node.Scalar();
    }

    std::optional<double> number(const YAML::Node& node, const Path& path)
    {
        if (!node.IsScalar())
        {
            fail(path, "expected a number");
            return std::nullopt;
        }
        try
        {
            double v = node.as<double>();
            if (!std::isfinite(v))
            {
                fail(path, "expected a finite number, got '" + node.Scalar() + "'");
                return std::nullopt;
            }
            return v;
        }
        catch (const YAML::BadConversion&)
        {
            fail(path, "expected a number, got '" + node.Scalar() + "'");
            return std::nullopt;
        }
    }

    bool boolean(const YAML::Node& node, const Path& path, bool fallback)
    {
        if (!node || node.IsNull())
            return fallback;
        try
        {
            return node.as<bool>();
        }
        catch (const YAML::BadConversion&)
        {
            fail(path, "expected true or false");
            return fallback;
        }
    }

    std::vector<std::string> string_list(const YAML::Node& node, const Path& path)
    {
        std::vector<std::string> out;
        if (node.IsNull())
            return out;
        if (!node.IsSequence())
        {
            fail(path, "expected a list of strings");
            return out;
        }
        for (size_t i = 0; i < node.size(); ++i)
        {
            const auto item = node[i];
            if (!item.IsScalar())
                fail(child_path(path, std::to_string(i)), "expected a string");
            else
                out.push_back(item.Scalar());
        }
        return out;
    }

    bool expect_map(const YAML::Node& node, const Path& path)
    {
        if (node.IsMap())
            return true;
        fail(path, "expected a mapping");
        return false;
    }

    void read_metadata(const YAML::Node& node, const Path& path, ExperimentMetadata& out)
    {
        if (!expect_map(node, path))
            return;
        if (!node["experiment_name"])
            fail(path, "missing required key 'experiment_name'");
        out.experiment_name = optional_string(node["experiment_name"], child_path(path, "experiment_name"));
        out.operator_name = optional_string(node["operator"], child_path(path, "operator"));
        out.date = optional_string(node["date"], child_path(path, "date"));
        out.notes = optional_string(node["notes"], child_path(path, "notes"));
    }

    void read_panel(const YAML::Node& node,
                    const Path& path,
                    std::vector<std::pair<std::string, PanelEntry>>& out)
    {
        if (node.IsNull())
            return;
        if (!expect_map(node, path))
            return;

        for (auto it = node.begin(); it != node.end(); ++it)
        {
            const std::string channel = key_string(it->first, path);
            if (channel.empty())
                continue;
            const Path here = child_path(path, channel);
            const YAML::Node value = it->second;

            PanelEntry entry;
            entry.scale = default_role_for(channel);
            if (value.IsNull())
            {
                out.emplace_back(channel, std::move(entry));
                continue;
            }
            if (!expect_map(value, here))
                continue;

            entry.fluor = optional_string(value["fluor"], child_path(here, "fluor"));
            entry.role = optional_string(value["role"], child_path(here, "role"));
            entry.ignore = boolean(value["ignore"], child_path(here, "ignore"), false);

            if (value["transform"])
                entry.transform = read_transform(value["transform"], child_path(here, "transform"));
            if (entry.transform && entry.transform->type == TransformKind::Logicle)
                entry.scale = ChannelRole::FluorescenceLogicle;

            if (value["scale"] && !value["scale"].IsNull())
            {
                const std::string s = optional_string(value["scale"], child_path(here, "scale"));
                if (auto role = parse_channel_role(s))
                    entry.scale = *role;
                else
                    fail(child_path(here, "scale"),
                         "'" + s + "' is not one of scatter-linear, time-linear, fluorescence-logicle");
            }
            out.emplace_back(channel, std::move(entry));
        }
    }

    std::optional<TransformConfig> read_transform(const YAML::Node& node, const Path& path)
    {
        if (!expect_map(node, path))
            return std::nullopt;

        TransformConfig t;
        const std::string type = optional_string(node["type"], child_path(path, "type"));
        if (type == "logicle")
        {
            t.type = TransformKind::Logicle;
            auto take = [&](const char* key, double& dst)
            {
                if (node[key])
                {
                    if (auto v = number(node[key], child_path(path, key)))
                        dst = *v;
                }
            };
            take("T", t.logicle.T);
            take("W", t.logicle.W);
            take("M", t.logicle.M);
            take("A", t.logicle.A);
        }
        else if (type == "linear")
        {
            t.type = TransformKind::Linear;
            if (node["min"])
                t.min = number(node["min"], child_path(path, "min"));
            if (node["max"])
                t.max = number(node["max"], child_path(path, "max"));
            if (t.min.has_value() != t.max.has_value())
                fail(path, "linear range needs both 'min' and 'max'");
        }
        else if (type.empty())
        {
            fail(path, "missing required key 'type'");
            return std::nullopt;
        }
        else
        {
            fail(child_path(path, "type"), "'" + type + "' is not one of linear, logicle");
            return std::nullopt;
        }
        return t;
    }

    void read_compensation(const YAML::Node& node, const Path& path, CompensationConfig& out)
    {
        if (node.IsNull())
            return;
        if (!expect_map(node, path))
            return;
        if (node["source"])
            out.source = optional_string(node["source"], child_path(path, "source"));
        out.path = optional_string(node["path"], child_path(path, "path"));
        out.reference = optional_string(node["reference"], child_path(path, "reference"));
    }

    void read_celltypes(const YAML::Node& node, const Path& path, std::vector<CelltypeConfig>& out)
    {
        if (node.IsNull())
            return;
        if (!expect_map(node, path))
            return;

        for (auto it = node.begin(); it != node.end(); ++it)
        {
            CelltypeConfig ct;
            ct.name = key_string(it->first, path);
            if (ct.name.empty())
                continue;
            const Path here = child_path(path, ct.name);
            const YAML::Node value = it->second;
            if (!expect_map(value, here))
                continue;

            static const std::set<std::string> known = {"parent", "gate_path", "gate", "positive",
                                                        "negative"};
            for (auto f = value.begin(); f != value.end(); ++f)
            {
                const std::string key = f->first.IsScalar() ? f->first.Scalar() : std::string();
                if (!known.count(key))
                    fail(child_path(here, key), "unknown celltype key");
            }

            ct.parent = optional_string(value["parent"], child_path(here, "parent"));
            if (value["gate_path"])
                ct.gate_path = string_list(value["gate_path"], child_path(here, "gate_path"));
            if (value["positive"])
                ct.positive = string_list(value["positive"], child_path(here, "positive"));
            if (value["negative"])
                ct.negative = string_list(value["negative"], child_path(here, "negative"));
            if (value["gate"] && !value["gate"].IsNull())
            {
                Gate gate;
                if (read_gate(value["gate"], child_path(here, "gate"), gate))
                    ct.gate = std::move(gate);
            }
            else if (ct.positive.empty() && ct.negative.empty())
                fail(here, "needs a 'gate' or marker rules ('positive' / 'negative')");
            out.push_back(std::move(ct));
        }
    }

    // False when the gate is unusable; the problem has been recorded.
    bool read_gate(const YAML::Node& node, const Path& path, Gate& out)
    {
        if (!expect_map(node, path))
            return false;

        const std::string type = optional_string(node["type"], child_path(path, "type"));
        if (type == "threshold")
            return read_threshold(node, path, out);
        if (type != "polygon" && type != "rectangle")
        {
            fail(child_path(path, "type"),
                 type.empty() ? std::string("missing gate type")
                              : "'" + type + "' is not one of polygon, rectangle, threshold");
            return false;
        }

        const auto channels = node["channels"] ? string_list(node["channels"], child_path(path, "channels"))
                                               : std::vector<std::string>{};
        if (channels.size() != 2)
            fail(child_path(path, "channels"), "expected exactly 2 channels");
        else
        {
            out.x_channel = channels[0];
            out.y_channel = channels[1];
        }

        std::vector<Vertex> vertices;
        const YAML::Node vnode = node["vertices"];
        const Path vpath = child_path(path, "vertices");
        if (!vnode || !vnode.IsSequence())
        {
            fail(vpath, "expected a list of [x, y] pairs");
            return false;
        }
        for (size_t i = 0; i < vnode.size(); ++i)
        {
            const auto pair = vnode[i];
            const Path ipath = child_path(vpath, std::to_string(i));
            if (!pair.IsSequence() || pair.size() != 2)
            {
                fail(ipath, "expected an [x, y] pair");
                continue;
            }
            auto x = number(pair[0], ipath);
            auto y = number(pair[1], ipath);
            if (x && y)
                vertices.push_back({*x, *y});
        }

        if (type == "polygon")
        {
            if (vertices.size() < 3)
                fail(vpath, "a polygon needs at least 3 vertices, got " + std::to_string(vertices.size()));
            out.shape = PolygonGate{std::move(vertices)};
        }
        else
        {
            if (vertices.size() != 2)
            {
                fail(vpath, "a rectangle takes exactly 2 corner points, got "
                                + std::to_string(vertices.size()));
                return false;
            }
            out.shape = RectangleGate{std::min(vertices[0].x, vertices[1].x),
                                      std::max(vertices[0].x, vertices[1].x),
                                      std::min(vertices[0].y, vertices[1].y),
                                      std::max(vertices[0].y, vertices[1].y)};
        }
        return true;
    }

    // type: threshold, channel: <name> (or a one-element channels list),
    // min and/or max.
    bool read_threshold(const YAML::Node& node, const Path& path, Gate& out)
    {
        if (node["channel"])
            out.x_channel = optional_string(node["channel"], child_path(path, "channel"));
        else if (node["channels"])
        {
            const auto channels = string_list(node["channels"], child_path(path, "channels"));
            if (channels.size() == 1)
                out.x_channel = channels[0];
            else
                fail(child_path(path, "channels"), "a threshold gate takes exactly 1 channel");
        }
        if (out.x_channel.empty())
        {
            fail(child_path(path, "channel"), "missing threshold channel");
            return false;
        }

        RangeGate range;
        bool ok = true;
        for (const char* key : {"min", "max"})
        {
            if (!node[key] || node[key].IsNull())
                continue;
            auto v = number(node[key], child_path(path, key));
            if (!v)
                ok = false;
            else
                (std::string(key) == "min" ? range.min : range.max) = *v;
        }
        if (!node["min"] && !node["max"])
        {
            fail(path, "a threshold gate needs 'min', 'max' or both");
            return false;
        }
        out.shape = range;
        return ok;
    }

    std::vector<std::string> violations_;
};

// ─── Emitter helpers ────────────────────────────────────────────────────────

void emit_string_or_null(YAML::Emitter& out, const std::string& value)
{
    if (value.empty())
        out << YAML::Null;
    else
        out << value;
}

void emit_gate(YAML::Emitter& out, const Gate& gate)
{
    out << YAML::BeginMap;
    out << YAML::Key << "type" << YAML::Value << gate_type_name(gate.shape);

    if (const auto* range = std::get_if<RangeGate>(&gate.shape))
    {
        out << YAML::Key << "channel" << YAML::Value << gate.x_channel;
        if (std::isfinite(range->min))
            out << YAML::Key << "min" << YAML::Value << range->min;
        if (std::isfinite(range->max))
            out << YAML::Key << "max" << YAML::Value << range->max;
        out << YAML::EndMap;
        return;
    }
    out << YAML::Key << "channels" << YAML::Value << YAML::Flow << YAML::BeginSeq << gate.x_channel
        << gate.y_channel << YAML::EndSeq;
    out << YAML::Key << "vertices" << YAML::Value << YAML::BeginSeq;

    std::vector<Vertex> points;
    if (const auto* rect = std::get_if<RectangleGate>(&gate.shape))
        points = {{rect->x_min, rect->y_min}, {rect->x_max, rect->y_max}};
    else
        points = std::get<PolygonGate>(gate.shape).vertices;
    for (const auto& v : points)
        out << YAML::Flow << YAML::BeginSeq << v.x << v.y << YAML::EndSeq;

    out << YAML::EndSeq;
    out << YAML::EndMap;
}

ChannelTransform make_transform(const std::string& channel, const TransformConfig& t)
{
    try
    {
        if (t.type == TransformKind::Logicle)
            return LogicleTransform(t.logicle);
        if (t.min && t.max)
            return LinearTransform(*t.min, *t.max);
        return LinearTransform();
    }
    catch (const TransformParameterError& e)
    {
        throw TransformParameterError("channel '" + channel + "': " + e.what());
    }
    catch (const std::invalid_argument& e)
    {
        throw TransformParameterError("channel '" + channel + "': " + e.what());
    }
}

}   // namespace

// ─── ExperimentConfig ───────────────────────────────────────────────────────

const PanelEntry* ExperimentConfig::panel_entry(std::string_view channel) const
{
    for (const auto& [name, entry] : panel)
    {
        if (name == channel)
            return &entry;
    }
    return nullptr;
}

PanelEntry* ExperimentConfig::panel_entry(std::string_view channel)
{
    for (auto& [name, entry] : panel)
    {
        if (name == channel)
            return &entry;
    }
    return nullptr;
}

std::vector<MarkerRule> CelltypeConfig::marker_rules() const
{
    std::vector<MarkerRule> rules;
    rules.reserve(positive.size() + negative.size());
    for (const auto& ch : positive)
        rules.push_back({ch, true});
    for (const auto& ch : negative)
        rules.push_back({ch, false});
    return rules;
}

const CelltypeConfig* ExperimentConfig::celltype(std::string_view name) const
{
    for (const auto& ct : celltypes)
    {
        if (ct.name == name)
            return &ct;
    }
    return nullptr;
}

std::vector<std::string> ExperimentConfig::ignored_channels() const
{
    std::vector<std::string> out;
    for (const auto& [name, entry] : panel)
    {
        if (entry.ignore)
            out.push_back(name);
    }
    return out;
}

// ─── YAML I/O ───────────────────────────────────────────────────────────────

ExperimentConfig parse_config(const std::string& yaml_text, const std::string& source)
{
    YAML::Node root;
    try
    {
        root = YAML::Load(yaml_text);
    }
    catch (const YAML::Exception& e)
    {
        throw SchemaValidationError({violation({}, source + " is not valid YAML: " + e.what())});
    }

    ConfigReader reader;
    ExperimentConfig cfg = reader.read(root);
    if (!reader.violations().empty())
        throw SchemaValidationError(reader.violations());

    require_valid_config(cfg);
    FACSFORGE_LOG_DEBUG("config", "{}: {} panel channels, {} celltypes", source, cfg.panel.size(),
                        cfg.celltypes.size());
    return cfg;
}

ExperimentConfig load_config(const std::string& path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open())
        throw IoError("Cannot open file: " + path);
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    return parse_config(text, path);
}

std::string config_to_yaml(const ExperimentConfig& config)
{
    YAML::Emitter out;
    out.SetDoublePrecision(17);

    out << YAML::BeginMap;

    out << YAML::Key << "metadata" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "experiment_name" << YAML::Value << config.metadata.experiment_name;
    out << YAML::Key << "operator" << YAML::Value;
    emit_string_or_null(out, config.metadata.operator_name);
    out << YAML::Key << "date" << YAML::Value;
    emit_string_or_null(out, config.metadata.date);
    out << YAML::Key << "notes" << YAML::Value << config.metadata.notes;
    out << YAML::EndMap;

    out << YAML::Key << "panel" << YAML::Value << YAML::BeginMap;
    for (const auto& [channel, entry] : config.panel)
    {
        out << YAML::Key << channel << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "fluor" << YAML::Value;
        emit_string_or_null(out, entry.fluor);
        out << YAML::Key << "role" << YAML::Value;
        emit_string_or_null(out, entry.role);
        out << YAML::Key << "ignore" << YAML::Value << entry.ignore;
        out << YAML::Key << "scale" << YAML::Value << channel_role_name(entry.scale);
        if (entry.transform)
        {
            const auto& t = *entry.transform;
            out << YAML::Key << "transform" << YAML::Value << YAML::Flow << YAML::BeginMap;
            out << YAML::Key << "type" << YAML::Value << transform_kind_name(t.type);
            if (t.type == TransformKind::Logicle)
            {
                out << YAML::Key << "T" << YAML::Value << t.logicle.T;
                out << YAML::Key << "W" << YAML::Value << t.logicle.W;
                out << YAML::Key << "M" << YAML::Value << t.logicle.M;
                out << YAML::Key << "A" << YAML::Value << t.logicle.A;
            }
            else if (t.min && t.max)
            {
                out << YAML::Key << "min" << YAML::Value << *t.min;
                out << YAML::Key << "max" << YAML::Value << *t.max;
            }
            out << YAML::EndMap;
        }
        out << YAML::EndMap;
    }
    out << YAML::EndMap;

    out << YAML::Key << "compensation" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "source" << YAML::Value << config.compensation.source;
    out << YAML::Key << "path" << YAML::Value;
    emit_string_or_null(out, config.compensation.path);
    out << YAML::Key << "reference" << YAML::Value;
    emit_string_or_null(out, config.compensation.reference);
    out << YAML::EndMap;

    out << YAML::Key << "celltypes" << YAML::Value << YAML::BeginMap;
    for (const auto& ct : config.celltypes)
    {
        out << YAML::Key << ct.name << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "parent" << YAML::Value;
        emit_string_or_null(out, ct.parent);
        out << YAML::Key << "gate_path" << YAML::Value << YAML::Flow << ct.gate_path;
        if (ct.gate)
        {
            out << YAML::Key << "gate" << YAML::Value;
            emit_gate(out, *ct.gate);
        }
        if (!ct.positive.empty())
            out << YAML::Key << "positive" << YAML::Value << YAML::Flow << ct.positive;
        if (!ct.negative.empty())
            out << YAML::Key << "negative" << YAML::Value << YAML::Flow << ct.negative;
        out << YAML::EndMap;
    }
    out << YAML::EndMap;

    out << YAML::Key << "celltypes_of_interest" << YAML::Value << YAML::Flow
        << config.celltypes_of_interest;

    out << YAML::EndMap;

    if (!out.good())
        throw IoError(std::string("YAML emitter error: ") + out.GetLastError());
    return std::string(out.c_str()) + "\n";
}

void save_config(const ExperimentConfig& config, const std::string& path)
{
    const std::string text = config_to_yaml(config);
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open())
        throw IoError("Cannot write file: " + path);
    file << text;
    if (!file.good())
        throw IoError("Write failed: " + path);
    FACSFORGE_LOG_INFO("config", "wrote {}", path);
}

// ─── Validation ─────────────────────────────────────────────────────────────

namespace
{

void validate_celltype_gate(const Gate&                  gate,
                            const Path&                  gate_path,
                            const std::set<std::string>& channels,
                            std::vector<std::string>&    out)
{
    std::vector<const std::string*> named{&gate.x_channel};
    if (!gate.is_range())
        named.push_back(&gate.y_channel);
    for (const auto* ch : named)
    {
        if (ch->empty())
            out.push_back(violation(gate_path, "gate channels must not be empty"));
        else if (!channels.count(*ch))
            out.push_back(violation(gate_path, "channel '" + *ch + "' is not in the panel"));
    }

    if (const auto* poly = std::get_if<PolygonGate>(&gate.shape))
    {
        if (poly->vertices.size() < 3)
            out.push_back(violation(gate_path, "a polygon needs at least 3 vertices"));
        for (const auto& v : poly->vertices)
        {
            if (!std::isfinite(v.x) || !std::isfinite(v.y))
            {
                out.push_back(violation(gate_path, "vertices must be finite"));
                break;
            }
        }
    }
    else if (const auto* r = std::get_if<RectangleGate>(&gate.shape))
    {
        if (!(r->x_min <= r->x_max) || !(r->y_min <= r->y_max))
            out.push_back(violation(gate_path, "rectangle corners are inverted"));
    }
    else
    {
        const auto& range = std::get<RangeGate>(gate.shape);
        if (!(range.min <= range.max))
            out.push_back(violation(gate_path, "threshold 'min' must not exceed 'max'"));
    }
}

// Marker rules need a thresholded channel: in the panel, not ignored, and
// not a scatter channel.
void validate_marker_rules(const ExperimentConfig&   config,
                           const CelltypeConfig&     ct,
                           const Path&               here,
                           std::vector<std::string>& out)
{
    std::set<std::string> seen;
    for (const auto& rule : ct.marker_rules())
    {
        const Path where = child_path(here, rule.positive ? "positive" : "negative");
        const auto* entry = config.panel_entry(rule.channel);
        if (!entry)
            out.push_back(violation(where, "marker '" + rule.channel + "' is not in the panel"));
        else if (entry->ignore)
            out.push_back(violation(where, "marker '" + rule.channel + "' is ignored in the panel"));
        else if (rule.channel.starts_with("FSC") || rule.channel.starts_with("SSC"))
            out.push_back(violation(where, "scatter channel '" + rule.channel
                                               + "' has no automatic threshold"));
        if (!seen.insert(rule.channel).second)
            out.push_back(violation(where, "marker '" + rule.channel + "' is listed more than once"));
    }
}

}   // namespace

std::vector<std::string> validate_config(const ExperimentConfig& config)
{
    std::vector<std::string> out;

    if (config.metadata.experiment_name.empty())
        out.push_back(violation({"metadata", "experiment_name"}, "must not be empty"));

    // Panel
    std::set<std::string> channels;
    std::map<std::string, std::string> fluors;
    for (const auto& [channel, entry] : config.panel)
    {
        const Path here{"panel", channel};
        if (!channels.insert(channel).second)
            out.push_back(violation(here, "duplicate panel channel"));
        if (!entry.fluor.empty())
        {
            auto [it, inserted] = fluors.emplace(entry.fluor, channel);
            if (!inserted)
                out.push_back(violation(child_path(here, "fluor"),
                                        "fluorochrome '" + entry.fluor + "' is already used by '"
                                            + it->second + "'"));
        }
        if (entry.transform && entry.transform->type == TransformKind::Linear && entry.transform->min
            && entry.transform->max && !(*entry.transform->min < *entry.transform->max))
            out.push_back(violation(child_path(here, "transform"), "'min' must be below 'max'"));
    }

    // Compensation
    const auto& comp = config.compensation;
    if (comp.source != "none" && comp.source != "fcs" && comp.source != "file")
        out.push_back(violation({"compensation", "source"},
                                "'" + comp.source + "' is not one of none, fcs, file"));
    if (comp.source == "file" && comp.path.empty())
        out.push_back(violation({"compensation", "path"}, "required when source is 'file'"));

    // Celltypes
    std::map<std::string, const CelltypeConfig*> by_name;
    for (const auto& ct : config.celltypes)
    {
        const Path here{"celltypes", ct.name};
        if (ct.name.empty())
            out.push_back(violation({"celltypes"}, "celltype names must not be empty"));
        else if (ct.name == WORKSPACE_ROOT_NAME)
            out.push_back(violation(here, "name is reserved for the root population"));
        if (!by_name.emplace(ct.name, &ct).second)
            out.push_back(violation(here, "duplicate celltype name"));

        if (!ct.gate && ct.positive.empty() && ct.negative.empty())
            out.push_back(violation(here, "needs a gate or marker rules"));
        if (ct.gate)
            validate_celltype_gate(*ct.gate, child_path(here, "gate"), channels, out);
        validate_marker_rules(config, ct, here, out);

        if (!ct.gate_path.empty())
        {
            if (ct.gate_path.back() != ct.name)
                out.push_back(violation(child_path(here, "gate_path"), "must end with '" + ct.name + "'"));
            else if (!ct.parent.empty()
                     && (ct.gate_path.size() < 2 || ct.gate_path[ct.gate_path.size() - 2] != ct.parent))
                out.push_back(violation(child_path(here, "gate_path"),
                                        "does not pass through parent '" + ct.parent + "'"));
        }
    }

    for (const auto& ct : config.celltypes)
    {
        if (!ct.parent.empty() && !by_name.count(ct.parent))
            out.push_back(violation({"celltypes", ct.name, "parent"},
                                    "parent '" + ct.parent + "' is not a celltype"));
    }

    // Parent cycles: follow each chain at most N steps.
    for (const auto& ct : config.celltypes)
    {
        const CelltypeConfig* cur = &ct;
        size_t steps = 0;
        while (cur && !cur->parent.empty() && steps <= config.celltypes.size())
        {
            auto it = by_name.find(cur->parent);
            cur = it == by_name.end() ? nullptr : it->second;
            ++steps;
        }
        if (steps > config.celltypes.size())
        {
            out.push_back(violation({"celltypes", ct.name, "parent"}, "parent links form a cycle"));
        }
    }

    for (size_t i = 0; i < config.celltypes_of_interest.size(); ++i)
    {
        const auto& name = config.celltypes_of_interest[i];
        if (!by_name.count(name))
            out.push_back(violation({"celltypes_of_interest", std::to_string(i)},
                                    "'" + name + "' is not a celltype"));
    }

    return out;
}

void require_valid_config(const ExperimentConfig& config)
{
    auto violations = validate_config(config);
    if (!violations.empty())
        throw SchemaValidationError(std::move(violations));
}

// ─── Generation / merge ─────────────────────────────────────────────────────

ExperimentConfig config_from_workspace(const WorkspaceImport& workspace,
                                       const std::string& experiment_name)
{
    ExperimentConfig cfg;
    cfg.metadata.experiment_name = experiment_name;

    for (const auto& ch : workspace.channels)
    {
        PanelEntry entry;
        entry.fluor = ch.fluor;
        entry.scale = ch.role;
        if (workspace.transforms.contains(ch.name))
        {
            const auto& t = workspace.transforms.get(ch.name);
            TransformConfig tc;
            tc.type = t.kind();
            if (const auto* log = t.as_logicle())
                tc.logicle = log->params();
            else if (const auto* lin = t.as_linear(); lin && lin->has_range())
            {
                tc.min = lin->range_min();
                tc.max = lin->range_max();
            }
            entry.transform = tc;
        }
        cfg.panel.emplace_back(ch.name, std::move(entry));
    }

    if (workspace.compensation_ref)
        cfg.compensation.reference = *workspace.compensation_ref;

    // Celltype names must be unique; a repeated population name is qualified
    // with its path.
    const auto& tree = workspace.hierarchy;
    std::vector<std::string> names(tree.size());
    std::set<std::string> used;
    for (NodeId id : tree.depth_first())
    {
        if (id == tree.root())
            continue;
        std::string name = tree.display_name(id);
        if (used.count(name))
        {
            auto path = tree.path(id);
            name.clear();
            for (size_t i = 1; i < path.size(); ++i)
                name += (i > 1 ? "/" : "") + path[i];
            FACSFORGE_LOG_WARN("config", "population name '{}' repeats; stored as '{}'",
                               tree.display_name(id), name);
        }
        used.insert(name);
        names[id] = name;

        const GateNode& node = tree.node(id);
        CelltypeConfig ct;
        ct.name = name;
        ct.parent = node.parent == tree.root() ? std::string() : names[node.parent];
        for (NodeId a = id; a != tree.root(); a = tree.parent(a))
            ct.gate_path.insert(ct.gate_path.begin(), names[a]);
        ct.gate = node.gate;
        for (const auto& rule : node.markers)
            (rule.positive ? ct.positive : ct.negative).push_back(rule.channel);
        cfg.celltypes.push_back(std::move(ct));
    }
    return cfg;
}

ExperimentConfig merge_configs(const ExperimentConfig& existing, const ExperimentConfig& generated)
{
    ExperimentConfig out = existing;

    auto take = [](std::string& dst, const std::string& src)
    {
        if (!src.empty())
            dst = src;
    };
    take(out.metadata.experiment_name, generated.metadata.experiment_name);
    take(out.metadata.operator_name, generated.metadata.operator_name);
    take(out.metadata.date, generated.metadata.date);
    take(out.metadata.notes, generated.metadata.notes);

    for (const auto& [channel, entry] : generated.panel)
    {
        if (!out.panel_entry(channel))
            out.panel.emplace_back(channel, entry);
    }

    // A generated "none" carries no information; only an explicit source
    // overrides the user's choice.
    if (generated.compensation.source != "none")
        out.compensation.source = generated.compensation.source;
    take(out.compensation.path, generated.compensation.path);
    take(out.compensation.reference, generated.compensation.reference);

    if (!generated.celltypes.empty())
        out.celltypes = generated.celltypes;
    if (!generated.celltypes_of_interest.empty())
        out.celltypes_of_interest = generated.celltypes_of_interest;

    // Interest entries that no longer name a celltype would fail validation.
    std::erase_if(out.celltypes_of_interest,
                  [&](const std::string& name) { return out.celltype(name) == nullptr; });
    return out;
}

// ─── Analysis setup ─────────────────────────────────────────────────────────

AnalysisPlan build_analysis(const ExperimentConfig& config)
{
    require_valid_config(config);

    AnalysisPlan plan;
    for (const auto& [name, entry] : config.panel)
    {
        if (entry.ignore)
        {
            plan.ignored.push_back(name);
            continue;
        }
        plan.channels.push_back(Channel{name, entry.scale, entry.fluor});
        if (entry.transform)
            plan.transforms.set(name, make_transform(name, *entry.transform));
    }

    std::vector<GateDefinition> defs;
    defs.reserve(config.celltypes.size());
    for (const auto& ct : config.celltypes)
        defs.push_back(GateDefinition{ct.name, ct.parent, ct.gate, ct.marker_rules()});
    plan.hierarchy = build_hierarchy(defs, WORKSPACE_ROOT_NAME);

    FACSFORGE_LOG_INFO("config", "analysis: {} channels ({} ignored), {} transforms, {} populations",
                       plan.channels.size(), plan.ignored.size(), plan.transforms.size(),
                       plan.hierarchy.size());
    return plan;
}

EventMatrix drop_ignored(const AnalysisPlan& plan, const EventMatrix& events)
{
    std::vector<std::string> present;
    for (const auto& ch : plan.ignored)
    {
        if (events.has_channel(ch))
            present.push_back(ch);
    }
    if (present.empty())
        return events;

    std::string joined;
    for (const auto& ch : present)
        joined += (joined.empty() ? "" : ", ") + ch;
    FACSFORGE_LOG_WARN("config", "dropping ignored channels: {}", joined);
    return events.without_channels(present);
}

}   // namespace facsforge
