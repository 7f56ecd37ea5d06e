#pragma once

#include <cstdint>
#include <facsforge/evaluation.hpp>
#include <facsforge/event_matrix.hpp>
#include <facsforge/hierarchy.hpp>
#include <facsforge/overlay.hpp>
#include <facsforge/transform.hpp>
#include <string>
#include <vector>

namespace facsforge
{

// ─── File naming ────────────────────────────────────────────────────────────

// Per-sample statistics are written to "<STATS_FILE_STEM>.csv" beside the
// population files; no population stem takes this name.
inline constexpr const char* STATS_FILE_STEM = "populations";

// Filesystem-safe stem from the population path ("Lymphocytes/CD4+" ->
// "Lymphocytes__CD4+"). The root keeps its own name.
std::string population_file_stem(const GateHierarchy& hierarchy, NodeId node);

// Stems for every node, indexed by NodeId. A stem that would collide with an
// earlier node or with STATS_FILE_STEM gets "_<id>" appended (repeatedly,
// until unique). Stable for a given tree.
std::vector<std::string> population_file_stems(const GateHierarchy& hierarchy);

// ─── CSV ────────────────────────────────────────────────────────────────────

enum class ValueSpace
{
    Raw,
    Display,
};

// One row per member event, one column per channel of `events`.
std::string population_csv(const EventMatrix&      events,
                           const EvaluationResult& result,
                           NodeId                  node,
                           ValueSpace              space,
                           const TransformSet&     transforms);

// population,path,parent,count,parent_count,percent_of_parent,percent_of_total
std::string population_stats_csv(const std::vector<PopulationSummary>& summaries);

// label,x,y,event_index
std::string overlay_csv(const OverlayResult& overlay);

// ─── Merged samples ─────────────────────────────────────────────────────────

// One evaluated sample. Pointers are borrowed for the duration of a call.
struct SampleView
{
    std::string             sample_id;
    const EventMatrix*      events = nullptr;
    const EvaluationResult* result = nullptr;
};

// Members of `node` from every sample, sample order. Columns are the union of
// the samples' channels in first-seen order followed by sample_id; a channel
// a sample lacks is left empty.
std::string merged_population_csv(const std::vector<SampleView>& samples,
                                  NodeId                         node,
                                  ValueSpace                     space,
                                  const TransformSet&            transforms);

// sample_id followed by the population_stats_csv columns, one block of rows
// per sample. `summaries[i]` belongs to `sample_ids[i]`.
std::string merged_stats_csv(const std::vector<std::string>&                    sample_ids,
                             const std::vector<std::vector<PopulationSummary>>& summaries);

// File variants. Return false when the file cannot be written.
bool write_population_csv(const std::string&      path,
                          const EventMatrix&      events,
                          const EvaluationResult& result,
                          NodeId                  node,
                          ValueSpace              space,
                          const TransformSet&     transforms);
bool write_population_stats_csv(const std::string& path, const std::vector<PopulationSummary>& summaries);
bool write_overlay_csv(const std::string& path, const OverlayResult& overlay);
bool write_merged_population_csv(const std::string&             path,
                                 const std::vector<SampleView>& samples,
                                 NodeId                         node,
                                 ValueSpace                     space,
                                 const TransformSet&            transforms);
bool write_merged_stats_csv(const std::string&                                 path,
                            const std::vector<std::string>&                    sample_ids,
                            const std::vector<std::vector<PopulationSummary>>& summaries);

// ─── SVG population plot ────────────────────────────────────────────────────

struct PlotStyle
{
    uint32_t width        = 520;
    uint32_t height       = 480;
    float    point_radius = 1.2f;
    size_t   max_points   = 20000;   // parent events drawn; evenly strided above this
};

// Scatter of a gated population's parent events on the gate's channel pair
// (display units), members highlighted, gate outline on top, optional
// index-sort overlay with well labels.
class SvgPopulationPlot
{
   public:
    // Throws std::invalid_argument for a node without a 2-D gate.
    SvgPopulationPlot(const GateHierarchy& hierarchy, const EvaluationResult& result, NodeId node);

    void set_overlay(const OverlayResult* overlay) { overlay_ = overlay; }
    void set_style(const PlotStyle& style) { style_ = style; }
    const PlotStyle& style() const { return style_; }

    std::string to_string() const;

    // Returns false on failure.
    bool write_svg(const std::string& path) const;

   private:
    const GateHierarchy&    hierarchy_;
    const EvaluationResult& result_;
    NodeId                  node_;
    const OverlayResult*    overlay_ = nullptr;
    PlotStyle               style_;
};

}   // namespace facsforge
