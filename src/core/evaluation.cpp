#include <facsforge/error.hpp>
#include <facsforge/evaluation.hpp>
#include <facsforge/logger.hpp>

#include <algorithm>
#include <cmath>
#include <exception>
#include <future>
#include <limits>
#include <thread>

namespace facsforge
{

namespace
{

// Test the candidate rows of `parent_mask` against a gate, writing into `out`.
size_t apply_gate(const Gate&              gate,
                  std::span<const double>  xs,
                  std::span<const double>  ys,
                  const Mask*              parent_mask,
                  Mask&                    out)
{
    const size_t n = xs.size();
    out.assign(n, 0);
    size_t count = 0;

    std::visit(
        [&](const auto& shape)
        {
            for (size_t i = 0; i < n; ++i)
            {
                if (parent_mask && !(*parent_mask)[i])
                    continue;
                if (contains(shape, xs[i], ys[i]))
                {
                    out[i] = 1;
                    ++count;
                }
            }
        },
        gate.shape);

    return count;
}

// Median via nth_element; averages the two middle values for even sizes.
double median_of(std::vector<double>& values)
{
    if (values.empty())
        return std::numeric_limits<double>::quiet_NaN();
    const size_t mid = values.size() / 2;
    std::nth_element(values.begin(), values.begin() + static_cast<std::ptrdiff_t>(mid), values.end());
    double hi = values[mid];
    if (values.size() % 2 == 1)
        return hi;
    double lo = *std::max_element(values.begin(), values.begin() + static_cast<std::ptrdiff_t>(mid));
    return 0.5 * (lo + hi);
}

double median_of_members(std::span<const double> column, const Mask& mask)
{
    std::vector<double> values;
    for (size_t i = 0; i < mask.size(); ++i)
    {
        if (mask[i])
            values.push_back(column[i]);
    }
    return median_of(values);
}

// Linear interpolation between closest ranks of sorted values, q in [0, 1].
double percentile_sorted(const std::vector<double>& sorted, double q)
{
    const double pos = q * static_cast<double>(sorted.size() - 1);
    const size_t lo = static_cast<size_t>(pos);
    const size_t hi = std::min(lo + 1, sorted.size() - 1);
    return sorted[lo] + (pos - static_cast<double>(lo)) * (sorted[hi] - sorted[lo]);
}

// Clear members that fail the node's marker rules; returns the new count.
size_t apply_markers(const std::vector<MarkerRule>&                    rules,
                     const EventMatrix&                                events,
                     const std::map<std::string, double, std::less<>>& thresholds,
                     Mask&                                             mask,
                     size_t                                            count)
{
    for (const auto& rule : rules)
    {
        const double threshold = thresholds.find(rule.channel)->second;
        const auto raw = events.column(rule.channel);
        for (size_t i = 0; i < mask.size(); ++i)
        {
            if (!mask[i])
                continue;
            const bool keep = rule.positive ? raw[i] > threshold : raw[i] <= threshold;
            if (!keep)
            {
                mask[i] = 0;
                --count;
            }
        }
    }
    return count;
}

double percent(size_t part, size_t whole)
{
    return whole == 0 ? 0.0 : 100.0 * static_cast<double>(part) / static_cast<double>(whole);
}

}   // namespace

// ─── EvaluationResult ───────────────────────────────────────────────────────

std::vector<size_t> EvaluationResult::member_indices(NodeId node) const
{
    const auto& m = membership(node);
    std::vector<size_t> out;
    out.reserve(m.count);
    for (size_t i = 0; i < m.mask.size(); ++i)
    {
        if (m.mask[i])
            out.push_back(i);
    }
    return out;
}

std::span<const double> EvaluationResult::display_column(std::string_view channel) const
{
    auto it = display_.find(channel);
    if (it == display_.end())
        throw ChannelNotFoundError(std::string(channel), "not used by any gate in this run");
    return it->second;
}

std::optional<double> EvaluationResult::threshold(std::string_view channel) const
{
    auto it = thresholds_.find(channel);
    if (it == thresholds_.end())
        return std::nullopt;
    return it->second;
}

// ─── Thresholds ─────────────────────────────────────────────────────────────

double auto_threshold(std::span<const double> values)
{
    constexpr size_t BINS = 200;

    std::vector<double> finite;
    finite.reserve(values.size());
    for (double v : values)
    {
        if (std::isfinite(v))
            finite.push_back(v);
    }
    if (finite.empty())
        return std::numeric_limits<double>::quiet_NaN();

    std::sort(finite.begin(), finite.end());
    double lo = finite.front();
    double hi = finite.back();
    if (lo == hi)
    {
        lo -= 0.5;
        hi += 0.5;
    }

    std::vector<double> counts(BINS, 0.0);
    const double width = (hi - lo) / static_cast<double>(BINS);
    for (double v : finite)
    {
        auto bin = static_cast<size_t>((v - lo) / width);
        counts[std::min(bin, BINS - 1)] += 1.0;
    }

    std::vector<double> sorted_counts = counts;
    std::sort(sorted_counts.begin(), sorted_counts.end());
    const double cutoff = percentile_sorted(sorted_counts, 0.20);

    for (size_t b = 0; b < BINS; ++b)
    {
        if (counts[b] < cutoff)
            return lo + width * static_cast<double>(b);
    }
    return percentile_sorted(finite, 0.95);
}

// ─── Evaluation ─────────────────────────────────────────────────────────────

EvaluationResult evaluate(const GateHierarchy& hierarchy,
                          const TransformSet&  transforms,
                          const EventMatrix&   events)
{
    EvaluationResult result;
    result.total_events_ = events.rows();

    if (hierarchy.empty())
        return result;

    // Fail before doing any work: a missing channel must never turn into a
    // smaller, plausible-looking population.
    const auto channels = hierarchy.referenced_channels();
    for (const auto& ch : channels)
    {
        if (!events.has_channel(ch))
            throw ChannelNotFoundError(ch, "referenced by a gate but absent from the event data");
    }

    for (const auto& ch : channels)
        result.display_.emplace(ch, transforms.get(ch).to_display(events.column(ch)));

    for (const auto& ch : hierarchy.marker_channels())
    {
        const double t = auto_threshold(events.column(ch));
        result.thresholds_.emplace(ch, t);
        if (std::isnan(t))
            FACSFORGE_LOG_WARN("eval", "{}: no finite values, marker rules on it match nothing", ch);
        else
            FACSFORGE_LOG_DEBUG("eval", "{}: automatic threshold {}", ch, t);
    }

    result.memberships_.resize(hierarchy.size());

    for (NodeId id : hierarchy.depth_first())
    {
        const GateNode& node = hierarchy.node(id);
        MembershipResult& out = result.memberships_[id];
        out.node = id;

        const Mask* parent_mask =
            node.parent == INVALID_NODE ? nullptr : &result.memberships_[node.parent].mask;

        if (node.gate)
        {
            const auto xs = result.display_column(node.gate->x_channel);
            const auto ys = node.gate->is_range() ? xs : result.display_column(node.gate->y_channel);
            out.count = apply_gate(*node.gate, xs, ys, parent_mask, out.mask);
        }
        else if (parent_mask)
        {
            // Marker rules only: start from the parent's members.
            out.mask = *parent_mask;
            out.count = result.memberships_[node.parent].count;
        }
        else
        {
            // Ungated root: every event.
            out.mask.assign(events.rows(), 1);
            out.count = events.rows();
        }

        if (!node.markers.empty())
            out.count = apply_markers(node.markers, events, result.thresholds_, out.mask, out.count);

        FACSFORGE_LOG_DEBUG("eval",
                            "{}: {} of {} events",
                            hierarchy.display_name(id),
                            out.count,
                            parent_mask ? result.memberships_[node.parent].count : events.rows());
    }

    FACSFORGE_LOG_INFO("eval",
                       "evaluated {} populations over {} events",
                       hierarchy.size(),
                       events.rows());
    return result;
}

std::vector<EvaluationResult> evaluate_batch(const GateHierarchy&         hierarchy,
                                             const TransformSet&          transforms,
                                             std::span<const EventMatrix> batches,
                                             size_t                       max_parallel)
{
    if (max_parallel == 0)
        max_parallel = std::max<size_t>(1, std::thread::hardware_concurrency());

    std::vector<EvaluationResult> results(batches.size());
    std::exception_ptr first_error;

    for (size_t start = 0; start < batches.size(); start += max_parallel)
    {
        const size_t end = std::min(batches.size(), start + max_parallel);

        std::vector<std::future<EvaluationResult>> wave;
        wave.reserve(end - start);
        for (size_t i = start; i < end; ++i)
        {
            wave.push_back(std::async(std::launch::async,
                                      [&hierarchy, &transforms, &batches, i]
                                      { return evaluate(hierarchy, transforms, batches[i]); }));
        }

        for (size_t k = 0; k < wave.size(); ++k)
        {
            try
            {
                results[start + k] = wave[k].get();
            }
            catch (...)
            {
                if (!first_error)
                    first_error = std::current_exception();
            }
        }
    }

    if (first_error)
        std::rethrow_exception(first_error);
    return results;
}

// ─── Statistics ─────────────────────────────────────────────────────────────

std::vector<PopulationSummary> summarize(const GateHierarchy& hierarchy,
                                         const EvaluationResult& result)
{
    std::vector<PopulationSummary> out;
    out.reserve(hierarchy.size());

    const double nan = std::numeric_limits<double>::quiet_NaN();

    for (NodeId id : hierarchy.depth_first())
    {
        const GateNode& node = hierarchy.node(id);
        const MembershipResult& m = result.membership(id);

        PopulationSummary s;
        s.node = id;
        s.name = hierarchy.display_name(id);
        s.path = hierarchy.path(id);
        s.count = m.count;
        s.parent_count =
            node.parent == INVALID_NODE ? result.total_events() : result.count(node.parent);
        if (node.parent != INVALID_NODE)
            s.parent_name = hierarchy.display_name(node.parent);
        s.percent_of_parent = percent(s.count, s.parent_count);
        s.percent_of_total = percent(s.count, result.total_events());
        s.median_x = nan;
        s.median_y = nan;

        if (node.gate)
        {
            s.x_channel = node.gate->x_channel;
            s.y_channel = node.gate->y_channel;
            s.median_x = median_of_members(result.display_column(s.x_channel), m.mask);
            if (!s.y_channel.empty())
                s.median_y = median_of_members(result.display_column(s.y_channel), m.mask);
        }
        out.push_back(std::move(s));
    }
    return out;
}

}   // namespace facsforge
