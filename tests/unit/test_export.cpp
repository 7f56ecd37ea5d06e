#include <cstdio>
#include <facsforge/evaluation.hpp>
#include <facsforge/export.hpp>
#include <facsforge/overlay.hpp>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <stdexcept>
#include <string>

namespace facsforge
{
namespace
{

// ─── Helper ─────────────────────────────────────────────────────────────────

GateHierarchy export_tree()
{
    GateHierarchyBuilder b;
    auto root = b.add_root("All Events");
    auto lymph = b.add_child(root, "Lymphocytes", Gate{"FSC-A", "SSC-A", RectangleGate{0, 100, 0, 100}});
    b.add_child(lymph, "CD4 hi", Gate{"CD4", "SSC-A", RectangleGate{0.5, 1.0, 0, 100}});
    b.add_child(lymph, "CD4_hi", Gate{"CD4", "SSC-A", RectangleGate{0.0, 0.5, 0, 100}});
    return b.build();
}

TransformSet export_transforms()
{
    TransformSet tx;
    tx.set("CD4", LogicleTransform({.T = 262144.0, .W = 0.5, .M = 4.5, .A = 0.0}));
    return tx;
}

EventMatrix export_events()
{
    return EventMatrix::from_rows({"FSC-A", "SSC-A", "CD4"}, {{10.0, 20.0, 50000.0},
                                                              {30.0, 40.0, 5.0},
                                                              {500.0, 500.0, 50000.0},
                                                              {60.0, 70.0, 20000.0}});
}

size_t count_of(const std::string& haystack, const std::string& needle)
{
    size_t n = 0;
    for (auto pos = haystack.find(needle); pos != std::string::npos; pos = haystack.find(needle, pos + 1))
        ++n;
    return n;
}

std::string g10(double v)
{
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.10g", v);
    return buf;
}

std::string read_file(const std::string& path)
{
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

// ═══════════════════════════════════════════════════════════════════════════
// File naming
// ═══════════════════════════════════════════════════════════════════════════

TEST(PopulationFileStem, PathJoinedWithoutRoot)
{
    auto tree = export_tree();
    EXPECT_EQ(population_file_stem(tree, 0), "All_Events");
    EXPECT_EQ(population_file_stem(tree, 1), "Lymphocytes");
    EXPECT_EQ(population_file_stem(tree, 2), "Lymphocytes__CD4_hi");
}

TEST(PopulationFileStem, CollisionsGetNodeSuffix)
{
    auto stems = population_file_stems(export_tree());
    ASSERT_EQ(stems.size(), 4u);
    EXPECT_EQ(stems[2], "Lymphocytes__CD4_hi");
    EXPECT_EQ(stems[3], "Lymphocytes__CD4_hi_3");
}

// ═══════════════════════════════════════════════════════════════════════════
// CSV
// ═══════════════════════════════════════════════════════════════════════════

TEST(PopulationCsv, RawValuesOfMembers)
{
    auto tree = export_tree();
    auto tx = export_transforms();
    auto events = export_events();
    auto result = evaluate(tree, tx, events);

    auto csv = population_csv(events, result, 1, ValueSpace::Raw, tx);
    EXPECT_EQ(csv, "FSC-A,SSC-A,CD4\n10,20,50000\n30,40,5\n60,70,20000\n");
}

TEST(PopulationCsv, DisplayValuesUseTransforms)
{
    auto tree = export_tree();
    auto tx = export_transforms();
    auto events = export_events();
    auto result = evaluate(tree, tx, events);

    auto csv = population_csv(events, result, 2, ValueSpace::Display, tx);
    EXPECT_EQ(csv, "FSC-A,SSC-A,CD4\n10,20," + g10(tx.to_display("CD4", 50000.0)) + "\n60,70,"
                       + g10(tx.to_display("CD4", 20000.0)) + "\n");
}

TEST(PopulationCsv, EmptyPopulationHasHeaderOnly)
{
    GateHierarchyBuilder b;
    auto root = b.add_root("All Events");
    b.add_child(root, "None", Gate{"FSC-A", "SSC-A", RectangleGate{1000, 2000, 1000, 2000}});
    auto tree = b.build();
    auto events = export_events();
    auto result = evaluate(tree, TransformSet{}, events);
    EXPECT_EQ(population_csv(events, result, 1, ValueSpace::Raw, TransformSet{}), "FSC-A,SSC-A,CD4\n");
}

TEST(PopulationStatsCsv, HeaderAndRows)
{
    auto tree = export_tree();
    auto tx = export_transforms();
    auto result = evaluate(tree, tx, export_events());
    auto csv = population_stats_csv(summarize(tree, result));

    std::istringstream in(csv);
    std::string line;
    std::getline(in, line);
    EXPECT_EQ(line, "population,path,parent,count,parent_count,percent_of_parent,percent_of_total");
    std::getline(in, line);
    EXPECT_EQ(line, "All Events,All Events,,4,4,100.0000,100.0000");
    std::getline(in, line);
    EXPECT_EQ(line, "Lymphocytes,All Events/Lymphocytes,All Events,3,4,75.0000,75.0000");
    std::getline(in, line);
    EXPECT_EQ(line, "CD4 hi,All Events/Lymphocytes/CD4 hi,Lymphocytes,2,3,66.6667,50.0000");
}

TEST(PopulationStatsCsv, CellsWithCommasQuoted)
{
    PopulationSummary s;
    s.name = "CD4+, CD8-";
    s.path = {"All Events", "CD4+, CD8-"};
    s.parent_name = "All Events";
    auto csv = population_stats_csv({s});
    EXPECT_NE(csv.find("\"CD4+, CD8-\",\"All Events/CD4+, CD8-\",All Events,0,0,0.0000,0.0000"),
              std::string::npos);
}

TEST(OverlayCsv, OnePointPerLine)
{
    OverlayResult ov;
    ov.has_labels = true;
    ov.points.push_back({"A1", 0.25, 0.5, 12, 0});
    ov.points.push_back({"B2", 1.0 / 3.0, 2.0, 40, 1});
    EXPECT_EQ(overlay_csv(ov), "label,x,y,event_index\nA1,0.25,0.5,12\nB2,0.3333333333,2,40\n");
}

TEST(ExportFiles, WriteAndUnwritablePath)
{
    OverlayResult ov;
    ov.points.push_back({"", 1.0, 2.0, 3, 0});
    auto path = (std::filesystem::temp_directory_path() / "facsforge_overlay.csv").string();
    ASSERT_TRUE(write_overlay_csv(path, ov));
    EXPECT_EQ(read_file(path), "label,x,y,event_index\n,1,2,3\n");
    std::filesystem::remove(path);

    EXPECT_FALSE(write_overlay_csv("/nonexistent/facsforge/overlay.csv", ov));
    EXPECT_FALSE(write_population_stats_csv("/nonexistent/facsforge/stats.csv", {}));
}

// ═══════════════════════════════════════════════════════════════════════════
// Merged samples
// ═══════════════════════════════════════════════════════════════════════════

TEST(PopulationFileStem, StatsStemReserved)
{
    GateHierarchyBuilder b;
    auto root = b.add_root("All Events");
    b.add_child(root, "populations", Gate{"FSC-A", "SSC-A", RectangleGate{0, 100, 0, 100}});
    b.add_child(root, "populations_1", Gate{"FSC-A", "SSC-A", RectangleGate{0, 50, 0, 50}});
    auto stems = population_file_stems(b.build());
    ASSERT_EQ(stems.size(), 3u);
    EXPECT_EQ(stems[1], "populations_1");
    EXPECT_EQ(stems[2], "populations_1_2");
    for (const auto& stem : stems)
        EXPECT_NE(stem, STATS_FILE_STEM);
}

TEST(MergedPopulationCsv, RowsTaggedWithSampleId)
{
    auto tree = export_tree();
    auto a = export_events();
    auto b = EventMatrix::from_rows({"FSC-A", "SSC-A", "CD4", "CD8"}, {{1.0, 2.0, 50000.0, 7.0}});
    auto ra = evaluate(tree, TransformSet{}, a);
    auto rb = evaluate(tree, TransformSet{}, b);

    std::vector<SampleView> samples = {{"day1", &a, &ra}, {"day 2, rerun", &b, &rb}};
    auto csv = merged_population_csv(samples, 1, ValueSpace::Raw, TransformSet{});
    EXPECT_EQ(csv,
              "FSC-A,SSC-A,CD4,CD8,sample_id\n"
              "10,20,50000,,day1\n"
              "30,40,5,,day1\n"
              "60,70,20000,,day1\n"
              "1,2,50000,7,\"day 2, rerun\"\n");
}

TEST(MergedPopulationCsv, DisplayValuesPerChannel)
{
    auto tree = export_tree();
    auto tx = export_transforms();
    auto a = export_events();
    auto ra = evaluate(tree, tx, a);
    auto csv = merged_population_csv({{"s1", &a, &ra}}, 2, ValueSpace::Display, tx);
    const double display = tx.to_display("CD4", 50000.0);
    EXPECT_NE(csv.find("10,20," + g10(display) + ",s1\n"), std::string::npos) << csv;
}

TEST(MergedStatsCsv, OneBlockPerSample)
{
    auto tree = export_tree();
    auto a = export_events();
    auto ra = evaluate(tree, TransformSet{}, a);
    auto sums = summarize(tree, ra);

    auto csv = merged_stats_csv({"s1", "s2"}, {sums, sums});
    std::istringstream in(csv);
    std::string line;
    std::getline(in, line);
    EXPECT_EQ(line,
              "sample_id,population,path,parent,count,parent_count,percent_of_parent,percent_of_total");
    std::getline(in, line);
    EXPECT_EQ(line, "s1,All Events,All Events,,4,4,100.0000,100.0000");
    EXPECT_EQ(count_of(csv, "\ns2,"), sums.size());
    EXPECT_EQ(count_of(csv, "\n"), 1 + 2 * sums.size());
}

// ═══════════════════════════════════════════════════════════════════════════
// SVG
// ═══════════════════════════════════════════════════════════════════════════

TEST(SvgPopulationPlot, DrawsParentMembersAndGate)
{
    auto tree = export_tree();
    auto tx = export_transforms();
    auto result = evaluate(tree, tx, export_events());

    SvgPopulationPlot plot(tree, result, 2);
    auto svg = plot.to_string();

    EXPECT_EQ(svg.rfind("<?xml", 0), 0u);
    EXPECT_NE(svg.find("<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"520\" height=\"480\""),
              std::string::npos);
    EXPECT_NE(svg.find("class=\"gate\""), std::string::npos);
    EXPECT_NE(svg.find("class=\"members\""), std::string::npos);
    EXPECT_EQ(svg.find("class=\"overlay\""), std::string::npos);
    EXPECT_NE(svg.find("All Events / Lymphocytes / CD4 hi (2 events)"), std::string::npos);

    // Parent population has three events: two members, one not.
    EXPECT_EQ(count_of(svg, "<circle "), 3u);
    EXPECT_NE(svg.find(">CD4</text>"), std::string::npos);
    EXPECT_NE(svg.find(">SSC-A</text>"), std::string::npos);
    EXPECT_NE(svg.rfind("</svg>\n"), std::string::npos);
}

TEST(SvgPopulationPlot, OverlayWithEscapedLabels)
{
    auto tree = export_tree();
    auto result = evaluate(tree, export_transforms(), export_events());

    OverlayResult ov;
    ov.has_labels = true;
    ov.points.push_back({"A<1>", 0.8, 20.0, 0, 0});

    SvgPopulationPlot plot(tree, result, 2);
    plot.set_overlay(&ov);
    auto svg = plot.to_string();
    EXPECT_NE(svg.find("class=\"overlay\""), std::string::npos);
    EXPECT_NE(svg.find(">A&lt;1&gt;</text>"), std::string::npos);
}

TEST(SvgPopulationPlot, StyleControlsSizeAndDecimation)
{
    auto tree = export_tree();
    auto result = evaluate(tree, export_transforms(), export_events());

    SvgPopulationPlot plot(tree, result, 1);
    PlotStyle style;
    style.width = 300;
    style.height = 200;
    style.max_points = 2;
    plot.set_style(style);
    auto svg = plot.to_string();

    EXPECT_NE(svg.find("width=\"300\" height=\"200\""), std::string::npos);
    // Four parent events with a stride of two.
    EXPECT_EQ(count_of(svg, "<circle "), 2u);
}

TEST(SvgPopulationPlot, UngatedNodeRejected)
{
    auto tree = export_tree();
    auto result = evaluate(tree, export_transforms(), export_events());
    EXPECT_THROW((void)SvgPopulationPlot(tree, result, tree.root()), std::invalid_argument);
}

TEST(SvgPopulationPlot, WriteSvg)
{
    auto tree = export_tree();
    auto result = evaluate(tree, export_transforms(), export_events());
    SvgPopulationPlot plot(tree, result, 1);

    auto path = (std::filesystem::temp_directory_path() / "facsforge_plot.svg").string();
    ASSERT_TRUE(plot.write_svg(path));
    EXPECT_EQ(read_file(path), plot.to_string());
    std::filesystem::remove(path);
    EXPECT_FALSE(plot.write_svg("/nonexistent/facsforge/plot.svg"));
}

}   // namespace
}   // namespace facsforge
