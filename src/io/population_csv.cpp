#include <facsforge/export.hpp>
#include <facsforge/logger.hpp>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <fstream>
#include <map>
#include <optional>
#include <sstream>

namespace facsforge
{

namespace
{

std::string fmt_value(double v)
{
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.10g", v);
    return buf;
}

std::string fmt_percent(double v)
{
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.4f", v);
    return buf;
}

// Quote a cell when it contains a delimiter, quote or newline.
std::string csv_cell(const std::string& s)
{
    if (s.find_first_of(",\"\n\r") == std::string::npos)
        return s;
    std::string out = "\"";
    for (char c : s)
    {
        if (c == '"')
            out += '"';
        out += c;
    }
    out += '"';
    return out;
}

std::string join_path(const std::vector<std::string>& path, const char* sep)
{
    std::string out;
    for (const auto& p : path)
    {
        if (!out.empty())
            out += sep;
        out += p;
    }
    return out;
}

std::string sanitize(const std::string& s)
{
    std::string out;
    out.reserve(s.size());
    for (char c : s)
    {
        const auto u = static_cast<unsigned char>(c);
        if (std::isalnum(u) || c == '-' || c == '_' || c == '+' || c == '.')
            out += c;
        else
            out += '_';
    }
    return out.empty() ? std::string("_") : out;
}

// Member rows of `node`. `columns[c]` is the event column of output column c,
// or nullopt for an empty cell. `trailing` is appended to every row.
void write_member_rows(std::ostringstream&                       out,
                       const EventMatrix&                        events,
                       const EvaluationResult&                   result,
                       NodeId                                    node,
                       const std::vector<std::optional<size_t>>& columns,
                       ValueSpace                                space,
                       const TransformSet&                       transforms,
                       const std::string&                        trailing)
{
    // Per-channel converters resolved once.
    std::vector<const ChannelTransform*> tx(columns.size(), nullptr);
    if (space == ValueSpace::Display)
    {
        for (size_t c = 0; c < columns.size(); ++c)
        {
            if (columns[c])
                tx[c] = &transforms.get(events.channels()[*columns[c]]);
        }
    }

    for (size_t r : result.member_indices(node))
    {
        for (size_t c = 0; c < columns.size(); ++c)
        {
            if (c)
                out << ",";
            if (!columns[c])
                continue;
            double v = events.value(r, *columns[c]);
            if (tx[c])
                v = tx[c]->to_display(v);
            out << fmt_value(v);
        }
        out << trailing << "\n";
    }
}

void write_stats_rows(std::ostringstream&                   out,
                      const std::vector<PopulationSummary>& summaries,
                      const std::string&                    leading)
{
    for (const auto& s : summaries)
    {
        out << leading << csv_cell(s.name) << "," << csv_cell(join_path(s.path, "/")) << ","
            << csv_cell(s.parent_name) << "," << s.count << "," << s.parent_count << ","
            << fmt_percent(s.percent_of_parent) << "," << fmt_percent(s.percent_of_total) << "\n";
    }
}

const char* STATS_HEADER = "population,path,parent,count,parent_count,percent_of_parent,percent_of_total";

bool write_text(const std::string& path, const std::string& content)
{
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open())
    {
        FACSFORGE_LOG_ERROR("export", "cannot open '{}' for writing", path);
        return false;
    }
    file << content;
    return file.good();
}

}   // namespace

// ─── File naming ────────────────────────────────────────────────────────────

std::string population_file_stem(const GateHierarchy& hierarchy, NodeId node)
{
    auto path = hierarchy.path(node);
    if (path.size() > 1)
        path.erase(path.begin());   // drop the root
    std::vector<std::string> parts;
    parts.reserve(path.size());
    for (const auto& p : path)
        parts.push_back(sanitize(p));
    return join_path(parts, "__");
}

std::vector<std::string> population_file_stems(const GateHierarchy& hierarchy)
{
    std::vector<std::string> stems(hierarchy.size());
    std::map<std::string, NodeId> taken;
    for (NodeId id : hierarchy.depth_first())
    {
        std::string stem = population_file_stem(hierarchy, id);
        while (taken.count(stem) || stem == STATS_FILE_STEM)
            stem += "_" + std::to_string(id);
        taken.emplace(stem, id);
        stems[id] = std::move(stem);
    }
    return stems;
}

// ─── CSV ────────────────────────────────────────────────────────────────────

std::string population_csv(const EventMatrix&      events,
                           const EvaluationResult& result,
                           NodeId                  node,
                           ValueSpace              space,
                           const TransformSet&     transforms)
{
    const auto& channels = events.channels();
    std::vector<std::optional<size_t>> columns(channels.size());
    for (size_t c = 0; c < channels.size(); ++c)
        columns[c] = c;

    std::ostringstream out;
    for (size_t c = 0; c < channels.size(); ++c)
        out << (c ? "," : "") << csv_cell(channels[c]);
    out << "\n";
    write_member_rows(out, events, result, node, columns, space, transforms, "");
    return out.str();
}

std::string population_stats_csv(const std::vector<PopulationSummary>& summaries)
{
    std::ostringstream out;
    out << STATS_HEADER << "\n";
    write_stats_rows(out, summaries, "");
    return out.str();
}

std::string merged_population_csv(const std::vector<SampleView>& samples,
                                  NodeId                         node,
                                  ValueSpace                     space,
                                  const TransformSet&            transforms)
{
    std::vector<std::string> channels;
    for (const auto& s : samples)
    {
        for (const auto& ch : s.events->channels())
        {
            if (std::find(channels.begin(), channels.end(), ch) == channels.end())
                channels.push_back(ch);
        }
    }

    std::ostringstream out;
    for (const auto& ch : channels)
        out << csv_cell(ch) << ",";
    out << "sample_id\n";

    for (const auto& s : samples)
    {
        std::vector<std::optional<size_t>> columns;
        columns.reserve(channels.size());
        for (const auto& ch : channels)
            columns.push_back(s.events->channel_index(ch));
        // A sample without channels still yields its sample_id column.
        const std::string trailing = (channels.empty() ? "" : ",") + csv_cell(s.sample_id);
        write_member_rows(out, *s.events, *s.result, node, columns, space, transforms, trailing);
    }
    return out.str();
}

std::string merged_stats_csv(const std::vector<std::string>&                    sample_ids,
                             const std::vector<std::vector<PopulationSummary>>& summaries)
{
    std::ostringstream out;
    out << "sample_id," << STATS_HEADER << "\n";
    for (size_t i = 0; i < sample_ids.size() && i < summaries.size(); ++i)
        write_stats_rows(out, summaries[i], csv_cell(sample_ids[i]) + ",");
    return out.str();
}

std::string overlay_csv(const OverlayResult& overlay)
{
    std::ostringstream out;
    out << "label,x,y,event_index\n";
    for (const auto& p : overlay.points)
    {
        out << csv_cell(p.label) << "," << fmt_value(p.x) << "," << fmt_value(p.y) << ","
            << p.event_index << "\n";
    }
    return out.str();
}

bool write_population_csv(const std::string&      path,
                          const EventMatrix&      events,
                          const EvaluationResult& result,
                          NodeId                  node,
                          ValueSpace              space,
                          const TransformSet&     transforms)
{
    return write_text(path, population_csv(events, result, node, space, transforms));
}

bool write_population_stats_csv(const std::string& path, const std::vector<PopulationSummary>& summaries)
{
    return write_text(path, population_stats_csv(summaries));
}

bool write_overlay_csv(const std::string& path, const OverlayResult& overlay)
{
    return write_text(path, overlay_csv(overlay));
}

bool write_merged_population_csv(const std::string&             path,
                                 const std::vector<SampleView>& samples,
                                 NodeId                         node,
                                 ValueSpace                     space,
                                 const TransformSet&            transforms)
{
    return write_text(path, merged_population_csv(samples, node, space, transforms));
}

bool write_merged_stats_csv(const std::string&                                 path,
                            const std::vector<std::string>&                    sample_ids,
                            const std::vector<std::vector<PopulationSummary>>& summaries)
{
    return write_text(path, merged_stats_csv(sample_ids, summaries));
}

}   // namespace facsforge
