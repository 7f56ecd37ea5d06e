#include <facsforge/error.hpp>
#include <facsforge/logger.hpp>
#include <facsforge/overlay.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <iterator>
#include <limits>
#include <stdexcept>
#include <unordered_map>

#include "../io/csv_reader.hpp"

namespace facsforge
{

namespace
{

bool is_well_column(const std::string& normalized)
{
    return normalized == "well";
}

bool is_event_column(const std::string& normalized)
{
    return normalized == "event" || normalized == "eventid" || normalized == "eventindex";
}

bool is_zero_row(const IndexRow& row)
{
    if (row.event_id && *row.event_id != 0)
        return false;
    for (double v : row.values)
    {
        if (!std::isnan(v) && v != 0.0)
            return false;
    }
    return true;
}

// Integral values representable as long; anything else is not an id.
std::optional<long> to_event_id(double v)
{
    constexpr double lo = static_cast<double>(std::numeric_limits<long>::min());
    if (!std::isfinite(v) || std::trunc(v) != v || v < lo || v >= -lo)
        return std::nullopt;
    return static_cast<long>(v);
}

// Event row for an index EventID.
class EventIdLookup
{
   public:
    explicit EventIdLookup(const EventMatrix& events) : rows_(events.rows())
    {
        for (size_t c = 0; c < events.channel_count(); ++c)
        {
            if (!is_event_column(normalize_column_name(events.channels()[c])))
                continue;
            column_ = events.channels()[c];
            const auto ids = events.column(c);
            for (size_t r = 0; r < ids.size(); ++r)
            {
                if (auto id = to_event_id(ids[r]))
                    by_id_.emplace(*id, r);
            }
            break;
        }
    }

    std::optional<size_t> find(long id) const
    {
        if (!column_.empty())
        {
            auto it = by_id_.find(id);
            if (it == by_id_.end())
                return std::nullopt;
            return it->second;
        }
        if (id < 0 || static_cast<unsigned long>(id) >= rows_)
            return std::nullopt;
        return static_cast<size_t>(id);
    }

    // Empty when ids are row numbers.
    const std::string& column() const { return column_; }

   private:
    size_t                             rows_ = 0;
    std::string                        column_;
    std::unordered_map<long, size_t>   by_id_;
};

bool within(double event_value, double index_value, const OverlayOptions& opt)
{
    const double scale = std::max(std::abs(index_value), opt.floor);
    return std::abs(event_value - index_value) <= opt.tolerance * scale;
}

}   // namespace

// ─── IndexTable ─────────────────────────────────────────────────────────────

std::string normalize_column_name(std::string_view name)
{
    std::string out;
    out.reserve(name.size());
    for (char c : name)
    {
        if (std::isspace(static_cast<unsigned char>(c)))
            continue;
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

IndexTable::IndexTable(std::vector<std::string> columns, std::vector<IndexRow> rows, bool has_wells)
    : columns_(std::move(columns)), rows_(std::move(rows)), has_wells_(has_wells)
{
    normalized_.reserve(columns_.size());
    for (const auto& c : columns_)
        normalized_.push_back(normalize_column_name(c));

    for (const auto& r : rows_)
    {
        if (r.values.size() != columns_.size())
            throw std::invalid_argument("IndexTable: row width does not match column count");
    }
}

std::optional<size_t> IndexTable::column_index(std::string_view name) const
{
    const auto key = normalize_column_name(name);
    for (size_t i = 0; i < normalized_.size(); ++i)
    {
        if (normalized_[i] == key)
            return i;
    }
    return std::nullopt;
}

std::vector<std::string> IndexTable::well_conflicts() const
{
    std::unordered_map<std::string, size_t> seen;
    std::vector<std::string> order;
    for (const auto& r : rows_)
    {
        if (r.well.empty())
            continue;
        if (seen[r.well]++ == 1)
            order.push_back(r.well);
    }
    return order;
}

void IndexTable::append(const IndexTable& other)
{
    // Map the other table's columns onto ours, adding new ones at the end.
    std::vector<size_t> mapping;
    mapping.reserve(other.columns_.size());
    for (size_t i = 0; i < other.columns_.size(); ++i)
    {
        auto idx = column_index(other.columns_[i]);
        if (!idx)
        {
            columns_.push_back(other.columns_[i]);
            normalized_.push_back(other.normalized_[i]);
            for (auto& r : rows_)
                r.values.push_back(std::numeric_limits<double>::quiet_NaN());
            idx = columns_.size() - 1;
        }
        mapping.push_back(*idx);
    }

    for (const auto& src : other.rows_)
    {
        IndexRow row;
        row.well = src.well;
        row.event_id = src.event_id;
        row.values.assign(columns_.size(), std::numeric_limits<double>::quiet_NaN());
        for (size_t i = 0; i < mapping.size(); ++i)
            row.values[mapping[i]] = src.values[i];
        rows_.push_back(std::move(row));
    }

    has_wells_ = has_wells_ || other.has_wells_;
    removed_zero_rows_ += other.removed_zero_rows_;
}

IndexTable parse_index_csv(const std::string& text, const std::string& source)
{
    CsvTable csv = parse_csv_text(text, "Well,");
    if (!csv.error.empty())
        throw IoError(source + ": " + csv.error);

    int well_col = -1;
    int event_col = -1;
    std::vector<std::string> columns;
    std::vector<size_t> value_cols;
    for (size_t c = 0; c < csv.headers.size(); ++c)
    {
        const auto norm = normalize_column_name(csv.headers[c]);
        if (well_col < 0 && is_well_column(norm))
            well_col = static_cast<int>(c);
        else if (event_col < 0 && is_event_column(norm))
            event_col = static_cast<int>(c);
        else
        {
            columns.push_back(csv.headers[c]);
            value_cols.push_back(c);
        }
    }

    std::vector<IndexRow> rows;
    rows.reserve(csv.rows.size());
    size_t removed = 0;
    size_t bad_ids = 0;
    for (const auto& cells : csv.rows)
    {
        IndexRow row;
        if (well_col >= 0)
            row.well = cells[static_cast<size_t>(well_col)];
        if (event_col >= 0)
        {
            const auto& cell = cells[static_cast<size_t>(event_col)];
            double id = 0.0;
            if (try_parse_double(cell, id))
                row.event_id = to_event_id(id);
            if (!row.event_id && !cell.empty())
                ++bad_ids;
        }
        row.values.reserve(value_cols.size());
        for (size_t c : value_cols)
        {
            double v = 0.0;
            row.values.push_back(try_parse_double(cells[c], v)
                                     ? v
                                     : std::numeric_limits<double>::quiet_NaN());
        }

        if (is_zero_row(row))
        {
            ++removed;
            continue;
        }
        rows.push_back(std::move(row));
    }

    IndexTable table(std::move(columns), std::move(rows), well_col >= 0);
    table.set_removed_zero_rows(removed);

    FACSFORGE_LOG_INFO("overlay", "loaded index table {}: {} rows, removed {} zero rows", source,
                       table.size(), removed);
    if (bad_ids > 0)
        FACSFORGE_LOG_WARN("overlay", "{}: {} event ids are not integers in range and were ignored",
                           source, bad_ids);

    const auto conflicts = table.well_conflicts();
    if (!conflicts.empty())
    {
        std::string joined;
        for (const auto& w : conflicts)
            joined += (joined.empty() ? "" : ", ") + w;
        FACSFORGE_LOG_WARN("overlay", "{}: well conflicts detected: {}", source, joined);
    }
    return table;
}

IndexTable load_index_csv(const std::string& path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open())
        throw IoError("Cannot open file: " + path);
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    return parse_index_csv(text, path);
}

// ─── Matching ───────────────────────────────────────────────────────────────

const char* overlay_policy_name(OverlayPolicy policy)
{
    switch (policy)
    {
        case OverlayPolicy::ChannelNearest:
            return "channel-nearest";
        case OverlayPolicy::EventId:
            return "event-id";
        case OverlayPolicy::Positional:
            return "positional";
    }
    return "unknown";
}

OverlayResult match_overlay(const IndexTable&       index,
                            const EventMatrix&      events,
                            const EvaluationResult& result,
                            NodeId                  node,
                            const std::string&      x_channel,
                            const std::string&      y_channel,
                            const OverlayOptions&   options)
{
    OverlayResult out;
    out.has_labels = index.has_wells();
    out.x_channel = x_channel;
    out.y_channel = y_channel;

    const auto xs_display = result.display_column(x_channel);
    const auto ys_display = result.display_column(y_channel);
    const auto members = result.member_indices(node);

    const auto ix = index.column_index(x_channel);
    const auto iy = index.column_index(y_channel);

    auto emit = [&](size_t row, size_t event)
    {
        OverlayPoint p;
        p.label = index.rows()[row].well;
        p.x = xs_display[event];
        p.y = ys_display[event];
        p.event_index = event;
        p.index_row = row;
        out.points.push_back(std::move(p));
    };

    if (ix && iy)
    {
        out.policy = OverlayPolicy::ChannelNearest;
        const auto xs_raw = events.column(x_channel);
        const auto ys_raw = events.column(y_channel);
        std::vector<unsigned char> claimed(events.rows(), 0);

        for (size_t r = 0; r < index.size(); ++r)
        {
            const double xi = index.rows()[r].values[*ix];
            const double yi = index.rows()[r].values[*iy];
            if (!std::isfinite(xi) || !std::isfinite(yi))
            {
                ++out.unmatched;
                continue;
            }

            const double sx = std::max(std::abs(xi), options.floor);
            const double sy = std::max(std::abs(yi), options.floor);
            size_t best = events.rows();
            double best_dist = std::numeric_limits<double>::infinity();
            for (size_t e : members)
            {
                if (claimed[e] || !within(xs_raw[e], xi, options) || !within(ys_raw[e], yi, options))
                    continue;
                const double dx = (xs_raw[e] - xi) / sx;
                const double dy = (ys_raw[e] - yi) / sy;
                const double d = dx * dx + dy * dy;
                if (d < best_dist)
                {
                    best_dist = d;
                    best = e;
                }
            }

            if (best == events.rows())
            {
                ++out.unmatched;
                continue;
            }
            claimed[best] = 1;
            emit(r, best);
        }

        FACSFORGE_LOG_INFO("overlay", "matched {} of {} index rows on {}/{} ({} unmatched)",
                           out.points.size(), index.size(), x_channel, y_channel, out.unmatched);
        return out;
    }

    out.notice = "index table shares no gating channel columns with the events ('" + x_channel
                 + "', '" + y_channel + "'); ";
    const bool by_id = std::any_of(index.rows().begin(), index.rows().end(),
                                   [](const IndexRow& r) { return r.event_id.has_value(); });
    if (by_id)
    {
        out.policy = OverlayPolicy::EventId;
        const EventIdLookup lookup(events);
        const auto& mask = result.membership(node).mask;
        std::vector<unsigned char> claimed(events.rows(), 0);
        for (size_t r = 0; r < index.size(); ++r)
        {
            const auto& id = index.rows()[r].event_id;
            const auto e = id ? lookup.find(*id) : std::nullopt;
            if (!e || !mask[*e] || claimed[*e])
            {
                ++out.unmatched;
                continue;
            }
            claimed[*e] = 1;
            emit(r, *e);
        }
        out.notice += "rows were paired with events by EventID ("
                      + (lookup.column().empty() ? std::string("event row number")
                                                 : "event column '" + lookup.column() + "'")
                      + ")";
    }
    else
    {
        out.policy = OverlayPolicy::Positional;
        const size_t n = std::min(index.size(), members.size());
        for (size_t r = 0; r < n; ++r)
            emit(r, members[r]);
        out.unmatched = index.size() - n;
        out.notice += "rows were paired with population members by order";
    }

    FACSFORGE_LOG_WARN("overlay", "{}", out.notice);
    return out;
}

OverlayResult match_overlay(const IndexTable&       index,
                            const EventMatrix&      events,
                            const GateHierarchy&    hierarchy,
                            const EvaluationResult& result,
                            NodeId                  node,
                            const OverlayOptions&   options)
{
    const auto& gate = hierarchy.node(node).gate;
    if (!gate || gate->is_range())
        throw std::invalid_argument("match_overlay: population '" + hierarchy.display_name(node)
                                    + "' has no 2-D gate to take channels from");
    return match_overlay(index, events, result, node, gate->x_channel, gate->y_channel, options);
}

}   // namespace facsforge
