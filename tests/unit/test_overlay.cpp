#include <cmath>
#include <facsforge/error.hpp>
#include <facsforge/evaluation.hpp>
#include <facsforge/overlay.hpp>
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <vector>

namespace facsforge
{
namespace
{

// ─── Helper ─────────────────────────────────────────────────────────────────

// Six events; rows 0..3 fall inside the [0,100] scatter box.
EventMatrix sorted_events()
{
    return EventMatrix::from_rows({"FSC-A", "SSC-A", "CD4"}, {{10.0, 20.0, 1.0},
                                                              {50.0, 60.0, 2.0},
                                                              {50.3, 60.2, 3.0},
                                                              {90.0, 15.0, 4.0},
                                                              {500.0, 500.0, 5.0},
                                                              {50.1, 60.1, 6.0}});
}

GateHierarchy scatter_tree()
{
    GateHierarchyBuilder b;
    auto root = b.add_root("All Events");
    b.add_child(root, "Cells", Gate{"FSC-A", "SSC-A", RectangleGate{0, 100, 0, 100}});
    return b.build();
}

// ═══════════════════════════════════════════════════════════════════════════
// Index CSV parsing
// ═══════════════════════════════════════════════════════════════════════════

TEST(IndexCsv, NormalizedColumnNames)
{
    EXPECT_EQ(normalize_column_name("FSC-A Max"), "fsc-amax");
    EXPECT_EQ(normalize_column_name(" Well "), "well");
}

TEST(IndexCsv, HeaderFoundAfterPreamble)
{
    auto t = parse_index_csv("Index sort report\nSorter: S3\nWell,EventID,FSC-A,SSC-A\nA1,17,50,60\nA2,18,90,15\n");
    EXPECT_TRUE(t.has_wells());
    EXPECT_EQ(t.columns(), (std::vector<std::string>{"FSC-A", "SSC-A"}));
    ASSERT_EQ(t.size(), 2u);
    EXPECT_EQ(t.rows()[0].well, "A1");
    ASSERT_TRUE(t.rows()[0].event_id.has_value());
    EXPECT_EQ(*t.rows()[0].event_id, 17);
    EXPECT_DOUBLE_EQ(t.rows()[1].values[1], 15.0);
}

TEST(IndexCsv, ColumnLookupIgnoresCaseAndSpaces)
{
    auto t = parse_index_csv("Well,FSC-A Max,ssc-a\nA1,1,2\n");
    EXPECT_EQ(t.column_index("fsc-amax").value_or(99), 0u);
    EXPECT_EQ(t.column_index("SSC-A").value_or(99), 1u);
    EXPECT_FALSE(t.has_column("CD4"));
}

TEST(IndexCsv, ZeroRowsRemoved)
{
    auto t = parse_index_csv("Well,FSC-A,SSC-A\nA1,5,6\nA2,0,0\nA3,0,\nA4,1,0\n");
    EXPECT_EQ(t.size(), 2u);
    EXPECT_EQ(t.removed_zero_rows(), 2u);
    EXPECT_EQ(t.rows()[1].well, "A4");
}

TEST(IndexCsv, NonNumericCellsBecomeNan)
{
    auto t = parse_index_csv("Well,FSC-A,Note\nA1,5,bright\n");
    ASSERT_EQ(t.size(), 1u);
    EXPECT_TRUE(std::isnan(t.rows()[0].values[1]));
}

TEST(IndexCsv, WellConflictsReportedOnce)
{
    auto t = parse_index_csv("Well,FSC-A\nA1,1\nB2,2\nA1,3\nA1,4\nB2,5\nC3,6\n");
    EXPECT_EQ(t.size(), 6u);
    EXPECT_EQ(t.well_conflicts(), (std::vector<std::string>{"A1", "B2"}));
}

TEST(IndexCsv, TableWithoutWells)
{
    auto t = parse_index_csv("FSC-A,SSC-A\n1,2\n");
    EXPECT_FALSE(t.has_wells());
    EXPECT_TRUE(t.rows()[0].well.empty());
    EXPECT_TRUE(t.well_conflicts().empty());
}

TEST(IndexCsv, EventIdsOutOfRangeIgnored)
{
    auto t = parse_index_csv("Well,EventID,FSC-A\nA1,1e30,5\nA2,-1e30,6\nA3,12.5,7\nA4,42,8\nA5,abc,9\n");
    ASSERT_EQ(t.size(), 5u);
    EXPECT_FALSE(t.rows()[0].event_id.has_value());
    EXPECT_FALSE(t.rows()[1].event_id.has_value());
    EXPECT_FALSE(t.rows()[2].event_id.has_value());
    EXPECT_EQ(t.rows()[3].event_id.value_or(-1), 42);
    EXPECT_FALSE(t.rows()[4].event_id.has_value());
}

TEST(IndexCsv, EmptyTextIsIoError)
{
    EXPECT_THROW(parse_index_csv(""), IoError);
    EXPECT_THROW(load_index_csv("/nonexistent/facsforge/index.csv"), IoError);
}

TEST(IndexCsv, AppendUnionsColumns)
{
    auto a = parse_index_csv("Well,FSC-A,SSC-A\nA1,1,2\nA2,0,0\n");
    auto b = parse_index_csv("Well,ssc-a,CD4\nB1,3,4\n");
    a.append(b);

    EXPECT_EQ(a.columns(), (std::vector<std::string>{"FSC-A", "SSC-A", "CD4"}));
    ASSERT_EQ(a.size(), 2u);
    EXPECT_TRUE(std::isnan(a.rows()[0].values[2]));
    EXPECT_TRUE(std::isnan(a.rows()[1].values[0]));
    EXPECT_DOUBLE_EQ(a.rows()[1].values[1], 3.0);
    EXPECT_DOUBLE_EQ(a.rows()[1].values[2], 4.0);
    EXPECT_EQ(a.removed_zero_rows(), 1u);
}

TEST(IndexCsv, RowWidthChecked)
{
    EXPECT_THROW(IndexTable({"FSC-A", "SSC-A"}, {IndexRow{"A1", std::nullopt, {1.0}}}, true),
                 std::invalid_argument);
}

// ═══════════════════════════════════════════════════════════════════════════
// Matching
// ═══════════════════════════════════════════════════════════════════════════

TEST(MatchOverlay, NearestMemberWithinTolerance)
{
    auto tree = scatter_tree();
    auto events = sorted_events();
    auto result = evaluate(tree, TransformSet{}, events);
    auto index = parse_index_csv("Well,FSC-A,SSC-A\nA1,50.08,60.08\nA2,90,15\n");

    auto ov = match_overlay(index, events, tree, result, 1);
    EXPECT_EQ(ov.policy, OverlayPolicy::ChannelNearest);
    EXPECT_FALSE(ov.used_fallback());
    EXPECT_TRUE(ov.notice.empty());
    EXPECT_TRUE(ov.has_labels);
    EXPECT_EQ(ov.x_channel, "FSC-A");
    EXPECT_EQ(ov.unmatched, 0u);

    ASSERT_EQ(ov.points.size(), 2u);
    // Row 5 (50.1, 60.1) is closer than rows 1 and 2.
    EXPECT_EQ(ov.points[0].label, "A1");
    EXPECT_EQ(ov.points[0].event_index, 5u);
    EXPECT_DOUBLE_EQ(ov.points[0].x, 50.1);
    EXPECT_DOUBLE_EQ(ov.points[0].y, 60.1);
    EXPECT_EQ(ov.points[1].event_index, 3u);
    EXPECT_EQ(ov.points[1].index_row, 1u);
}

TEST(MatchOverlay, EachEventClaimedOnce)
{
    auto tree = scatter_tree();
    auto events = sorted_events();
    auto result = evaluate(tree, TransformSet{}, events);
    auto index = parse_index_csv("Well,FSC-A,SSC-A\nA1,50.1,60.1\nA2,50.1,60.1\nA3,50.1,60.1\nA4,50.1,60.1\n");

    auto ov = match_overlay(index, events, tree, result, 1);
    // Three members lie within 1% of (50.1, 60.1): rows 1, 2 and 5.
    ASSERT_EQ(ov.points.size(), 3u);
    EXPECT_EQ(ov.points[0].event_index, 5u);
    EXPECT_NE(ov.points[1].event_index, ov.points[2].event_index);
    EXPECT_EQ(ov.unmatched, 1u);
}

TEST(MatchOverlay, OnlyPopulationMembersMatch)
{
    auto tree = scatter_tree();
    auto events = sorted_events();
    auto result = evaluate(tree, TransformSet{}, events);
    // Row 4 (500, 500) is outside the gate.
    auto index = parse_index_csv("Well,FSC-A,SSC-A\nA1,500,500\nA2,7000,7000\n");

    auto ov = match_overlay(index, events, tree, result, 1);
    EXPECT_TRUE(ov.points.empty());
    EXPECT_EQ(ov.unmatched, 2u);
}

TEST(MatchOverlay, PositionalFallbackIsReported)
{
    auto tree = scatter_tree();
    auto events = sorted_events();
    auto result = evaluate(tree, TransformSet{}, events);
    auto index = parse_index_csv("Well,Sort Gate,Plate\nA1,1,1\nA2,1,1\nA3,1,1\nA4,1,1\nA5,1,1\n");

    auto ov = match_overlay(index, events, tree, result, 1);
    EXPECT_EQ(ov.policy, OverlayPolicy::Positional);
    EXPECT_TRUE(ov.used_fallback());
    EXPECT_FALSE(ov.notice.empty());
    EXPECT_STREQ(overlay_policy_name(ov.policy), "positional");

    // Members are rows 0, 1, 2, 3, 5.
    ASSERT_EQ(ov.points.size(), 5u);
    EXPECT_EQ(ov.points[0].event_index, 0u);
    EXPECT_EQ(ov.points[4].event_index, 5u);
    EXPECT_EQ(ov.points[4].label, "A5");
    EXPECT_EQ(ov.unmatched, 0u);
}

TEST(MatchOverlay, EventIdPairsWithRowNumber)
{
    auto tree = scatter_tree();
    auto events = sorted_events();
    auto result = evaluate(tree, TransformSet{}, events);
    // Row 4 is outside the gate, row 9 does not exist, row 3 is claimed twice.
    auto index = parse_index_csv("Well,EventID,Plate\nA1,3,1\nA2,4,1\nA3,9,1\nA4,3,1\nA5,,1\nA6,1,1\n");

    auto ov = match_overlay(index, events, tree, result, 1);
    EXPECT_EQ(ov.policy, OverlayPolicy::EventId);
    EXPECT_TRUE(ov.used_fallback());
    EXPECT_NE(ov.notice.find("EventID (event row number)"), std::string::npos) << ov.notice;
    EXPECT_STREQ(overlay_policy_name(ov.policy), "event-id");

    ASSERT_EQ(ov.points.size(), 2u);
    EXPECT_EQ(ov.points[0].label, "A1");
    EXPECT_EQ(ov.points[0].event_index, 3u);
    EXPECT_DOUBLE_EQ(ov.points[0].x, 90.0);
    EXPECT_EQ(ov.points[1].label, "A6");
    EXPECT_EQ(ov.points[1].event_index, 1u);
    EXPECT_EQ(ov.unmatched, 4u);
}

TEST(MatchOverlay, EventIdPairsWithEventColumn)
{
    GateHierarchyBuilder b;
    auto root = b.add_root("All Events");
    b.add_child(root, "Cells", Gate{"FSC-A", "SSC-A", RectangleGate{0, 100, 0, 100}});
    auto tree = b.build();
    auto events = EventMatrix::from_rows({"FSC-A", "SSC-A", "EventID"}, {{10.0, 20.0, 1001.0},
                                                                         {30.0, 40.0, 1002.0},
                                                                         {500.0, 500.0, 1003.0}});
    auto result = evaluate(tree, TransformSet{}, events);
    auto index = parse_index_csv("Well,Event,Plate\nA1,1002,1\nA2,1003,1\nA3,0,1\n");

    auto ov = match_overlay(index, events, tree, result, 1);
    EXPECT_EQ(ov.policy, OverlayPolicy::EventId);
    EXPECT_NE(ov.notice.find("event column 'EventID'"), std::string::npos) << ov.notice;
    ASSERT_EQ(ov.points.size(), 1u);
    EXPECT_EQ(ov.points[0].label, "A1");
    EXPECT_EQ(ov.points[0].event_index, 1u);
    EXPECT_DOUBLE_EQ(ov.points[0].y, 40.0);
    EXPECT_EQ(ov.unmatched, 2u);
}

TEST(MatchOverlay, FallbackCountsSurplusRows)
{
    auto tree = scatter_tree();
    auto events = sorted_events();
    auto result = evaluate(tree, TransformSet{}, events);
    auto index = parse_index_csv("Plate,Row\n1,1\n1,2\n1,3\n1,4\n1,5\n1,6\n1,7\n");

    auto ov = match_overlay(index, events, tree, result, 1);
    EXPECT_FALSE(ov.has_labels);
    EXPECT_EQ(ov.points.size(), 5u);
    EXPECT_EQ(ov.unmatched, 2u);
}

TEST(MatchOverlay, CoordinatesInDisplayUnits)
{
    LogicleTransform lg({.T = 262144.0, .W = 0.5, .M = 4.5, .A = 0.0});
    TransformSet tx;
    tx.set("CD4", lg);

    GateHierarchyBuilder b;
    auto root = b.add_root("All Events");
    b.add_child(root, "Any", Gate{"FSC-A", "CD4", RectangleGate{0, 1000, 0, 1}});
    auto tree = b.build();
    auto events = EventMatrix::from_rows({"FSC-A", "CD4"}, {{100.0, 5000.0}});
    auto result = evaluate(tree, tx, events);
    auto index = parse_index_csv("Well,FSC-A,CD4\nA1,100,5000\n");

    auto ov = match_overlay(index, events, tree, result, 1);
    ASSERT_EQ(ov.points.size(), 1u);
    EXPECT_DOUBLE_EQ(ov.points[0].x, 100.0);
    EXPECT_DOUBLE_EQ(ov.points[0].y, lg.to_display(5000.0));
}

TEST(MatchOverlay, UngatedNodeRejected)
{
    auto tree = scatter_tree();
    auto events = sorted_events();
    auto result = evaluate(tree, TransformSet{}, events);
    auto index = parse_index_csv("Well,FSC-A,SSC-A\nA1,1,1\n");
    EXPECT_THROW(match_overlay(index, events, tree, result, tree.root()), std::invalid_argument);
}

TEST(MatchOverlay, NonGatingChannelRejected)
{
    auto tree = scatter_tree();
    auto events = sorted_events();
    auto result = evaluate(tree, TransformSet{}, events);
    auto index = parse_index_csv("Well,FSC-A,CD4\nA1,1,1\n");
    EXPECT_THROW(match_overlay(index, events, result, 1, "FSC-A", "CD4"), ChannelNotFoundError);
}

}   // namespace
}   // namespace facsforge
