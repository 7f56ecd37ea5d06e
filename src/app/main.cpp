// facsforge command-line front end.

#include <facsforge/facsforge.hpp>

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace
{

// Bad command line. Reported like a facsforge::Error (exit 1).
class UsageError : public std::runtime_error
{
   public:
    using std::runtime_error::runtime_error;
};

constexpr const char* USAGE =
    "usage: facsforge <command> [options]\n"
    "\n"
    "commands:\n"
    "  flowjo9-to-config <workspace.wsp> [-o out.yaml] [--name NAME]\n"
    "  flowjo10-to-config <workspace.wsp>\n"
    "  validate-config <config.yaml>\n"
    "  analyze <config.yaml> <events.csv>... [-o outdir] [--index idx.csv]...\n"
    "          [--population NAME] [--transformed] [--svg] [--jobs N]\n"
    "\n"
    "options:\n"
    "  --log-level trace|debug|info|warn|error   (default: info)\n"
    "  --log-file PATH                           also log to PATH\n"
    "  -h, --help                                show this help\n";

struct Options
{
    std::string              command;
    std::vector<std::string> positionals;
    std::string              output;
    std::string              name;
    std::vector<std::string> index_files;
    std::string              population;
    bool                     transformed = false;
    bool                     svg         = false;
    size_t                   jobs        = 0;
    std::string              log_level   = "info";
    std::string              log_file;
    bool                     help = false;
};

Options parse_args(int argc, char* argv[])
{
    Options opt;
    auto value_of = [&](int& i, const std::string& flag) -> std::string
    {
        if (i + 1 >= argc)
            throw UsageError("option " + flag + " needs a value");
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i)
    {
        const std::string arg = argv[i];
        if (arg == "-h" || arg == "--help")
            opt.help = true;
        else if (arg == "-o" || arg == "--output")
            opt.output = value_of(i, arg);
        else if (arg == "--name")
            opt.name = value_of(i, arg);
        else if (arg == "--index")
            opt.index_files.push_back(value_of(i, arg));
        else if (arg == "--population")
            opt.population = value_of(i, arg);
        else if (arg == "--transformed")
            opt.transformed = true;
        else if (arg == "--svg")
            opt.svg = true;
        else if (arg == "--jobs")
        {
            const std::string v = value_of(i, arg);
            char* end = nullptr;
            long n = std::strtol(v.c_str(), &end, 10);
            if (v.empty() || *end != '\0' || n < 0)
                throw UsageError("--jobs expects a non-negative integer, got '" + v + "'");
            opt.jobs = static_cast<size_t>(n);
        }
        else if (arg == "--log-level")
            opt.log_level = value_of(i, arg);
        else if (arg == "--log-file")
            opt.log_file = value_of(i, arg);
        else if (arg.size() > 1 && arg[0] == '-')
            throw UsageError("unknown option '" + arg + "'");
        else if (opt.command.empty())
            opt.command = arg;
        else
            opt.positionals.push_back(arg);
    }
    return opt;
}

void setup_logging(const Options& opt)
{
    auto level = facsforge::parse_log_level(opt.log_level);
    if (!level)
        throw UsageError("unknown log level '" + opt.log_level + "'");

    auto& logger = facsforge::Logger::instance();
    logger.clear_sinks();
    logger.reset_counts();
    logger.set_level(*level);
    logger.add_sink(facsforge::sinks::stderr_sink());
    if (!opt.log_file.empty())
        logger.add_sink(facsforge::sinks::file_sink(opt.log_file));
}

void require_positionals(const Options& opt, size_t min, size_t max)
{
    if (opt.positionals.size() < min)
        throw UsageError(opt.command + ": missing argument");
    if (opt.positionals.size() > max)
        throw UsageError(opt.command + ": unexpected argument '" + opt.positionals[max] + "'");
}

std::string today_iso()
{
    const std::time_t t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[16];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d", &tm);
    return buf;
}

// ─── Commands ───────────────────────────────────────────────────────────────

int cmd_flowjo9_to_config(const Options& opt)
{
    require_positionals(opt, 1, 1);
    const fs::path wsp = opt.positionals[0];
    const std::string out = opt.output.empty() ? fs::path(wsp).replace_extension(".yaml").string() : opt.output;
    const std::string name = opt.name.empty() ? wsp.stem().string() : opt.name;

    auto workspace = facsforge::import_flowjo9_file(wsp.string());
    auto config = facsforge::config_from_workspace(workspace, name);

    if (fs::exists(out))
    {
        FACSFORGE_LOG_INFO("cli", "merging into existing {}", out);
        config = facsforge::merge_configs(facsforge::load_config(out), config);
    }
    if (config.metadata.date.empty())
        config.metadata.date = today_iso();

    const std::string yaml = facsforge::config_to_yaml(config);
    FACSFORGE_LOG_DEBUG("cli", "intermediate configuration:\n{}", yaml);

    auto violations = facsforge::validate_config(config);
    if (!violations.empty())
    {
        std::cerr << "intermediate configuration:\n" << yaml << "\n";
        throw facsforge::SchemaValidationError(std::move(violations));
    }

    facsforge::save_config(config, out);
    std::cout << "Wrote " << out << " (" << config.panel.size() << " channels, "
              << config.celltypes.size() << " celltypes)\n";
    return 0;
}

int cmd_flowjo10_to_config(const Options& opt)
{
    require_positionals(opt, 1, 1);
    facsforge::import_flowjo10(opt.positionals[0]);
}

int cmd_validate_config(const Options& opt)
{
    require_positionals(opt, 1, 1);
    auto config = facsforge::load_config(opt.positionals[0]);
    std::cout << opt.positionals[0] << ": OK (" << config.panel.size() << " channels, "
              << config.celltypes.size() << " celltypes)\n";
    return 0;
}

// Results of more than one sample are also combined under this directory.
constexpr const char* MERGED_DIR = "merged";

std::string stats_file_name()
{
    return std::string(facsforge::STATS_FILE_STEM) + ".csv";
}

void make_directory(const fs::path& dir)
{
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec)
        throw facsforge::IoError("cannot create '" + dir.string() + "': " + ec.message());
}

std::vector<facsforge::NodeId> nodes_to_export(const facsforge::GateHierarchy& tree,
                                               const std::string&              population)
{
    if (population.empty())
        return tree.depth_first();
    auto id = tree.find(population);
    if (!id)
        throw UsageError("--population: no population named '" + population + "'");
    return {*id};
}

int cmd_analyze(const Options& opt)
{
    if (opt.positionals.size() < 2)
        throw UsageError("analyze: needs a config file and at least one events file");

    const auto config = facsforge::load_config(opt.positionals[0]);
    const auto plan = facsforge::build_analysis(config);
    const fs::path outdir = opt.output.empty() ? fs::path("facsforge_out") : fs::path(opt.output);

    std::vector<std::string> samples;
    for (size_t i = 1; i < opt.positionals.size(); ++i)
    {
        std::string sample = fs::path(opt.positionals[i]).stem().string();
        if (std::find(samples.begin(), samples.end(), sample) != samples.end())
            throw UsageError("two events files share the sample name '" + sample + "'");
        samples.push_back(std::move(sample));
    }
    const bool merged = samples.size() > 1;
    if (merged && std::find(samples.begin(), samples.end(), MERGED_DIR) != samples.end())
        throw UsageError(std::string("sample name '") + MERGED_DIR + "' is reserved for merged output");

    std::vector<facsforge::EventMatrix> matrices;
    for (size_t i = 1; i < opt.positionals.size(); ++i)
        matrices.push_back(facsforge::drop_ignored(plan, facsforge::load_events_csv(opt.positionals[i])));

    std::optional<facsforge::IndexTable> index;
    for (const auto& path : opt.index_files)
    {
        auto table = facsforge::load_index_csv(path);
        if (!index)
            index = std::move(table);
        else
            index->append(table);
    }

    const auto results = facsforge::evaluate_batch(plan.hierarchy, plan.transforms, matrices, opt.jobs);

    const auto& tree = plan.hierarchy;
    const auto stems = facsforge::population_file_stems(tree);
    const auto nodes = nodes_to_export(tree, opt.population);
    const auto space = opt.transformed ? facsforge::ValueSpace::Display : facsforge::ValueSpace::Raw;

    // Overlays and plots need a 2-D gate.
    auto has_plane = [&](facsforge::NodeId id)
    {
        const auto& gate = tree.node(id).gate;
        return gate && !gate->is_range();
    };
    auto wants_overlay = [&](facsforge::NodeId id)
    {
        if (!index || !has_plane(id))
            return false;
        const auto& interest = config.celltypes_of_interest;
        return interest.empty()
               || std::find(interest.begin(), interest.end(), tree.display_name(id)) != interest.end();
    };

    std::vector<std::vector<facsforge::PopulationSummary>> all_summaries;
    for (size_t s = 0; s < samples.size(); ++s)
    {
        const fs::path dir = outdir / samples[s];
        make_directory(dir);

        const auto& result = results[s];
        const auto& summaries = all_summaries.emplace_back(facsforge::summarize(tree, result));

        const std::string stats_path = (dir / stats_file_name()).string();
        if (!facsforge::write_population_stats_csv(stats_path, summaries))
            throw facsforge::IoError("cannot write " + stats_path);

        for (auto id : nodes)
        {
            const std::string base = (dir / stems[id]).string();
            if (!facsforge::write_population_csv(base + ".csv", matrices[s], result, id, space,
                                                 plan.transforms))
                throw facsforge::IoError("cannot write " + base + ".csv");

            std::optional<facsforge::OverlayResult> overlay;
            if (wants_overlay(id))
            {
                overlay = facsforge::match_overlay(*index, matrices[s], tree, result, id);
                if (!overlay->notice.empty())
                    std::cerr << "warning: " << samples[s] << "/" << tree.display_name(id) << " ("
                              << facsforge::overlay_policy_name(overlay->policy)
                              << "): " << overlay->notice << "\n";
                if (!facsforge::write_overlay_csv(base + ".overlay.csv", *overlay))
                    throw facsforge::IoError("cannot write " + base + ".overlay.csv");
            }

            if (opt.svg && has_plane(id))
            {
                facsforge::SvgPopulationPlot plot(tree, result, id);
                plot.set_overlay(overlay ? &*overlay : nullptr);
                if (!plot.write_svg(base + ".svg"))
                    throw facsforge::IoError("cannot write " + base + ".svg");
            }
        }

        std::cout << samples[s] << ": " << result.total_events() << " events\n";
        for (const auto& sum : summaries)
        {
            char pct[32];
            std::snprintf(pct, sizeof(pct), "%.2f", sum.percent_of_parent);
            std::cout << "  " << std::string(2 * (sum.path.size() - 1), ' ') << sum.name << ": "
                      << sum.count << " (" << pct << "% of parent)\n";
        }
    }

    if (merged)
    {
        const fs::path dir = outdir / MERGED_DIR;
        make_directory(dir);

        std::vector<facsforge::SampleView> views;
        for (size_t s = 0; s < samples.size(); ++s)
            views.push_back({samples[s], &matrices[s], &results[s]});

        const std::string stats_path = (dir / stats_file_name()).string();
        if (!facsforge::write_merged_stats_csv(stats_path, samples, all_summaries))
            throw facsforge::IoError("cannot write " + stats_path);
        for (auto id : nodes)
        {
            const std::string path = (dir / (stems[id] + ".csv")).string();
            if (!facsforge::write_merged_population_csv(path, views, id, space, plan.transforms))
                throw facsforge::IoError("cannot write " + path);
        }
        std::cout << "merged: " << samples.size() << " samples in " << dir.string() << "\n";
    }

    const auto& logger = facsforge::Logger::instance();
    const size_t warnings = logger.count(facsforge::LogLevel::Warning);
    FACSFORGE_LOG_INFO("cli", "results written to {} ({} warnings)", outdir.string(), warnings);
    return 0;
}

}   // namespace

int main(int argc, char* argv[])
{
    try
    {
        const Options opt = parse_args(argc, argv);
        if (opt.help)
        {
            std::cout << USAGE;
            return 0;
        }
        if (opt.command.empty())
            throw UsageError("no command given");
        setup_logging(opt);

        if (opt.command == "flowjo9-to-config")
            return cmd_flowjo9_to_config(opt);
        if (opt.command == "flowjo10-to-config")
            return cmd_flowjo10_to_config(opt);
        if (opt.command == "validate-config")
            return cmd_validate_config(opt);
        if (opt.command == "analyze")
            return cmd_analyze(opt);
        throw UsageError("unknown command '" + opt.command + "'");
    }
    catch (const facsforge::Error& e)
    {
        std::cerr << "error: " << facsforge::error_kind_name(e.kind()) << ": " << e.what() << "\n";
        return 1;
    }
    catch (const UsageError& e)
    {
        std::cerr << "error: usage: " << e.what() << "\n\n" << USAGE;
        return 1;
    }
    catch (const std::exception& e)
    {
        std::cerr << "error: " << e.what() << "\n";
        return 2;
    }
}
