#pragma once

#include <facsforge/channel.hpp>
#include <facsforge/event_matrix.hpp>
#include <facsforge/gate.hpp>
#include <facsforge/hierarchy.hpp>
#include <facsforge/transform.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace facsforge
{

struct WorkspaceImport;

// ─── Experiment configuration ───────────────────────────────────────────────
// In-memory form of the experiment YAML. Field order mirrors the document.

struct ExperimentMetadata
{
    std::string experiment_name;
    std::string operator_name;   // YAML key "operator"
    std::string date;            // ISO yyyy-mm-dd
    std::string notes;

    bool operator==(const ExperimentMetadata&) const = default;
};

// Panel-level transform declaration. Logicle parameters are solved only when
// the analysis is built.
struct TransformConfig
{
    TransformKind         type = TransformKind::Linear;
    LogicleParams         logicle;
    std::optional<double> min;   // linear display range
    std::optional<double> max;

    bool operator==(const TransformConfig&) const = default;
};

struct PanelEntry
{
    std::string                    fluor;
    std::string                    role;    // free-form marker role, may be empty
    bool                           ignore = false;
    ChannelRole                    scale  = ChannelRole::ScatterLinear;
    std::optional<TransformConfig> transform;

    bool operator==(const PanelEntry&) const = default;
};

struct CompensationConfig
{
    std::string source = "none";   // none | fcs | file
    std::string path;
    std::string reference;

    bool operator==(const CompensationConfig&) const = default;
};

struct CelltypeConfig
{
    std::string              name;
    std::string              parent;   // empty: child of the root
    std::vector<std::string> gate_path;
    std::optional<Gate>      gate;     // vertices and bounds in display units
    std::vector<std::string> positive;   // marker rules, see MarkerRule
    std::vector<std::string> negative;

    // positive then negative, in document order.
    std::vector<MarkerRule> marker_rules() const;

    bool operator==(const CelltypeConfig&) const = default;
};

struct ExperimentConfig
{
    ExperimentMetadata                               metadata;
    std::vector<std::pair<std::string, PanelEntry>>  panel;   // channel -> entry, document order
    CompensationConfig                               compensation;
    std::vector<CelltypeConfig>                      celltypes;   // depth-first order
    std::vector<std::string>                         celltypes_of_interest;

    const PanelEntry*     panel_entry(std::string_view channel) const;
    PanelEntry*           panel_entry(std::string_view channel);
    const CelltypeConfig* celltype(std::string_view name) const;

    // Channels marked `ignore: true`, panel order.
    std::vector<std::string> ignored_channels() const;

    bool operator==(const ExperimentConfig&) const = default;
};

// ─── YAML I/O ───────────────────────────────────────────────────────────────

// Parse YAML text. Structural problems (missing keys, wrong types, unknown
// enum values, malformed vertices) and semantic problems (see
// validate_config) are collected and thrown together as one
// SchemaValidationError.
ExperimentConfig parse_config(const std::string& yaml_text, const std::string& source = "<memory>");

// IoError when unreadable, otherwise as parse_config().
ExperimentConfig load_config(const std::string& path);

// Emit in the document layout parse_config() reads.
std::string config_to_yaml(const ExperimentConfig& config);

// IoError when the file cannot be written.
void save_config(const ExperimentConfig& config, const std::string& path);

// ─── Validation ─────────────────────────────────────────────────────────────

// Semantic checks on a typed config. Returns every violation, formatted as
// "at 'celltypes → CD4 → gate': message"; empty when valid.
std::vector<std::string> validate_config(const ExperimentConfig& config);

// Throws SchemaValidationError when validate_config() reports anything.
void require_valid_config(const ExperimentConfig& config);

// ─── Generation / merge ─────────────────────────────────────────────────────

// Config equivalent of an imported workspace: every declared channel in the
// panel, every population as a celltype with its gate path.
ExperimentConfig config_from_workspace(const WorkspaceImport& workspace,
                                       const std::string& experiment_name);

// Merge a freshly generated config into an existing one. Generated scalars
// win when non-empty; existing panel entries are kept and only new channels
// are appended; a non-empty generated celltype set replaces the old one.
ExperimentConfig merge_configs(const ExperimentConfig& existing, const ExperimentConfig& generated);

// ─── Analysis setup ─────────────────────────────────────────────────────────

struct AnalysisPlan
{
    std::vector<Channel>     channels;   // non-ignored panel channels
    TransformSet             transforms;
    GateHierarchy            hierarchy;  // ungated "All Events" root
    std::vector<std::string> ignored;
};

// Validate, solve transforms and build the gate tree. Throws
// SchemaValidationError, TransformParameterError or ImportError.
AnalysisPlan build_analysis(const ExperimentConfig& config);

// Remove ignored panel channels from an event matrix (logged at Warning).
EventMatrix drop_ignored(const AnalysisPlan& plan, const EventMatrix& events);

}   // namespace facsforge
