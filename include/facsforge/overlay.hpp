#pragma once

#include <cstddef>
#include <facsforge/evaluation.hpp>
#include <facsforge/event_matrix.hpp>
#include <facsforge/hierarchy.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace facsforge
{

// ─── Index sort table ───────────────────────────────────────────────────────

struct IndexRow
{
    std::string           well;       // empty when the table has no Well column
    std::optional<long>   event_id;   // EventID / Event / EventIndex; integral values only
    std::vector<double>   values;     // one per IndexTable::columns(); NaN if not numeric
};

// Per-cell metadata written by an index-sorting instrument.
class IndexTable
{
   public:
    IndexTable() = default;
    IndexTable(std::vector<std::string> columns, std::vector<IndexRow> rows, bool has_wells);

    // Numeric column names as spelled in the file (Well and EventID excluded).
    const std::vector<std::string>& columns() const { return columns_; }

    // Lookup with spaces removed and case ignored.
    std::optional<size_t> column_index(std::string_view name) const;
    bool has_column(std::string_view name) const { return column_index(name).has_value(); }

    const std::vector<IndexRow>& rows() const { return rows_; }
    size_t size() const { return rows_.size(); }
    bool   empty() const { return rows_.empty(); }
    bool   has_wells() const { return has_wells_; }

    // All-zero placeholder rows dropped while loading.
    size_t removed_zero_rows() const { return removed_zero_rows_; }
    void   set_removed_zero_rows(size_t n) { removed_zero_rows_ = n; }

    // Well identifiers that occur more than once, in first-seen order.
    std::vector<std::string> well_conflicts() const;

    // Append another table's rows. Columns are unioned by normalized name.
    void append(const IndexTable& other);

   private:
    std::vector<std::string> columns_;
    std::vector<std::string> normalized_;
    std::vector<IndexRow>    rows_;
    bool                     has_wells_         = false;
    size_t                   removed_zero_rows_ = 0;
};

// "FSC-A Max" -> "fsc-amax"
std::string normalize_column_name(std::string_view name);

// Parse index CSV text. The header is the first line starting with "Well,";
// without one, the first non-empty line. Throws IoError on an empty table.
IndexTable parse_index_csv(const std::string& text, const std::string& source = "<memory>");

// Throws IoError when the file cannot be read.
IndexTable load_index_csv(const std::string& path);

// ─── Overlay matching ───────────────────────────────────────────────────────

enum class OverlayPolicy
{
    ChannelNearest,   // matched on shared gating-channel values
    EventId,          // index EventID <-> event with that id (or row number)
    Positional,       // n-th index row <-> n-th population member
};

const char* overlay_policy_name(OverlayPolicy policy);

struct OverlayOptions
{
    double tolerance = 0.01;   // relative, per axis, raw units
    double floor     = 1.0;    // lower bound of the relative scale
};

struct OverlayPoint
{
    std::string label;         // well identifier, or empty
    double      x           = 0.0;   // display units
    double      y           = 0.0;
    size_t      event_index = 0;     // row in the event matrix
    size_t      index_row   = 0;     // row in the index table
};

struct OverlayResult
{
    OverlayPolicy             policy = OverlayPolicy::ChannelNearest;
    std::string               notice;       // non-empty when the fallback was taken
    bool                      has_labels = false;
    std::string               x_channel;
    std::string               y_channel;
    std::vector<OverlayPoint> points;
    size_t                    unmatched = 0;

    bool used_fallback() const { return policy != OverlayPolicy::ChannelNearest; }
};

// Associate index rows with member events of `node` and emit their display
// coordinates on the x/y channel pair. Each event is claimed at most once.
// Without shared channel columns, rows carrying an EventID are paired with
// the event of that id: the value of the matrix's own EventID column when it
// has one, otherwise the 0-based row number. Ids outside the population are
// unmatched. Tables without EventIDs fall back to positional pairing.
// The channels must be gating channels of this run (ChannelNotFoundError
// otherwise).
OverlayResult match_overlay(const IndexTable&       index,
                            const EventMatrix&      events,
                            const EvaluationResult& result,
                            NodeId                  node,
                            const std::string&      x_channel,
                            const std::string&      y_channel,
                            const OverlayOptions&   options = {});

// Same, on the channel pair of the node's own gate. Throws
// std::invalid_argument for a node without a 2-D gate.
OverlayResult match_overlay(const IndexTable&       index,
                            const EventMatrix&      events,
                            const GateHierarchy&    hierarchy,
                            const EvaluationResult& result,
                            NodeId                  node,
                            const OverlayOptions&   options = {});

}   // namespace facsforge
