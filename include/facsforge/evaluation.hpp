#pragma once

#include <cstddef>
#include <facsforge/event_matrix.hpp>
#include <facsforge/hierarchy.hpp>
#include <facsforge/transform.hpp>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace facsforge
{

// One byte per event row: 1 = member, 0 = not.
using Mask = std::vector<unsigned char>;

struct MembershipResult
{
    NodeId node  = INVALID_NODE;
    Mask   mask;
    size_t count = 0;
};

// Output of one analysis run. Produced by evaluate(), never mutated after.
class EvaluationResult
{
   public:
    size_t total_events() const { return total_events_; }
    size_t node_count() const { return memberships_.size(); }

    const MembershipResult& membership(NodeId node) const { return memberships_.at(node); }
    size_t count(NodeId node) const { return membership(node).count; }

    // Row indices of member events, ascending.
    std::vector<size_t> member_indices(NodeId node) const;

    // Display-space values of a gating channel, one per event row.
    // Throws ChannelNotFoundError for a channel no gate uses.
    std::span<const double> display_column(std::string_view channel) const;

    const std::vector<MembershipResult>& memberships() const { return memberships_; }

    // Automatic threshold (raw units) of a marker-rule channel.
    std::optional<double> threshold(std::string_view channel) const;
    const std::map<std::string, double, std::less<>>& thresholds() const { return thresholds_; }

   private:
    friend EvaluationResult evaluate(const GateHierarchy&, const TransformSet&, const EventMatrix&);

    size_t                                                total_events_ = 0;
    std::vector<MembershipResult>                         memberships_;
    std::map<std::string, std::vector<double>, std::less<>> display_;
    std::map<std::string, double, std::less<>>              thresholds_;
};

// Marker threshold from raw values. A 200-bin histogram spans the value
// range; the result is the left edge of the first bin whose count is below
// the 20th percentile of all bin counts, or the 95th percentile of the
// values when no bin is. Non-finite values are skipped; NaN when none remain.
double auto_threshold(std::span<const double> values);

// Evaluate every node depth-first. A child's candidates are its parent's
// members; the root sees every event (tested against its gate if it has
// one). Marker rules then filter a node's members against thresholds
// computed once per event matrix. Throws ChannelNotFoundError before any
// work when a gate or marker channel is missing from the events.
EvaluationResult evaluate(const GateHierarchy& hierarchy,
                          const TransformSet&  transforms,
                          const EventMatrix&   events);

// Evaluate independent event matrices concurrently, one task per matrix,
// at most max_parallel at a time (0 = hardware concurrency). Results are in
// input order. The first failure is rethrown once every task has finished.
std::vector<EvaluationResult> evaluate_batch(const GateHierarchy&        hierarchy,
                                             const TransformSet&         transforms,
                                             std::span<const EventMatrix> batches,
                                             size_t                      max_parallel = 0);

// ─── Statistics ─────────────────────────────────────────────────────────────

struct PopulationSummary
{
    NodeId                   node = INVALID_NODE;
    std::string              name;
    std::vector<std::string> path;
    std::string              parent_name;   // empty for the root
    std::string              x_channel;     // empty when ungated
    std::string              y_channel;
    size_t                   count        = 0;
    size_t                   parent_count = 0;
    double                   percent_of_parent = 0.0;
    double                   percent_of_total  = 0.0;
    double                   median_x = 0.0;   // display units; NaN when empty/ungated
    double                   median_y = 0.0;   // NaN for range gates too
};

// One summary per node in depth-first order.
std::vector<PopulationSummary> summarize(const GateHierarchy& hierarchy,
                                         const EvaluationResult& result);

}   // namespace facsforge
