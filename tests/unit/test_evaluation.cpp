#include <cmath>
#include <facsforge/error.hpp>
#include <facsforge/evaluation.hpp>
#include <gtest/gtest.h>
#include <limits>
#include <vector>

namespace facsforge
{
namespace
{

Gate square(const std::string& x, const std::string& y, double lo, double hi)
{
    return Gate{x, y, PolygonGate{{{lo, lo}, {hi, lo}, {hi, hi}, {lo, hi}}}};
}

// 1000 events. Rows 0..99 sit inside the scatter square [0,10]; rows 0..39
// also sit inside the marker square [0,4]. Rows 100..199 sit inside the
// marker square but outside the scatter square.
EventMatrix synthetic_events()
{
    const size_t n = 1000;
    std::vector<double> fsc(n), ssc(n), cd4(n), cd8(n);
    for (size_t i = 0; i < n; ++i)
    {
        const bool scatter_in = i < 100;
        fsc[i] = scatter_in ? 5.0 + 0.01 * static_cast<double>(i % 10) : 50.0 + static_cast<double>(i % 7);
        ssc[i] = scatter_in ? 6.0 : 60.0;
        const bool marker_in = i < 40 || (i >= 100 && i < 200);
        cd4[i] = marker_in ? 1.0 + 0.01 * static_cast<double>(i % 5) : 8.0;
        cd8[i] = marker_in ? 2.0 : 9.0;
    }
    return EventMatrix({"FSC-A", "SSC-A", "CD4", "CD8"}, {fsc, ssc, cd4, cd8});
}

GateHierarchy two_level_tree()
{
    GateHierarchyBuilder b;
    auto root = b.add_root("All Events");
    auto lymph = b.add_child(root, "Lymphocytes", square("FSC-A", "SSC-A", 0, 10));
    b.add_child(lymph, "CD4+", square("CD4", "CD8", 0, 4));
    return b.build();
}

bool is_subset(const Mask& child, const Mask& parent)
{
    for (size_t i = 0; i < child.size(); ++i)
    {
        if (child[i] && !parent[i])
            return false;
    }
    return true;
}

// ═══════════════════════════════════════════════════════════════════════════
// Membership
// ═══════════════════════════════════════════════════════════════════════════

TEST(Evaluate, GatedRootOnLinearChannels)
{
    GateHierarchyBuilder b;
    b.add_root("Square", Gate{"X", "Y", PolygonGate{{{0, 0}, {10, 0}, {10, 10}, {0, 10}}}});
    auto tree = b.build();
    auto events = EventMatrix::from_rows({"X", "Y"}, {{5, 5}, {15, 15}, {0, 0}});

    auto result = evaluate(tree, TransformSet{}, events);
    const auto& m = result.membership(0);
    EXPECT_EQ(m.mask, (Mask{1, 0, 1}));
    EXPECT_EQ(m.count, 2u);
    EXPECT_EQ(result.total_events(), 3u);
}

TEST(Evaluate, TwoLevelCounts)
{
    auto tree = two_level_tree();
    auto result = evaluate(tree, TransformSet{}, synthetic_events());
    EXPECT_EQ(result.count(0), 1000u);
    EXPECT_EQ(result.count(1), 100u);
    EXPECT_EQ(result.count(2), 40u);
    EXPECT_TRUE(is_subset(result.membership(2).mask, result.membership(1).mask));
}

TEST(Evaluate, ChildOnlySeesParentMembers)
{
    // Rows 100..199 fall inside the CD4+ polygon but not inside Lymphocytes.
    auto tree = two_level_tree();
    auto result = evaluate(tree, TransformSet{}, synthetic_events());
    auto members = result.member_indices(2);
    ASSERT_EQ(members.size(), 40u);
    EXPECT_EQ(members.front(), 0u);
    EXPECT_EQ(members.back(), 39u);
}

TEST(Evaluate, EveryChildIsSubsetOfParent)
{
    auto tree = two_level_tree();
    auto result = evaluate(tree, TransformSet{}, synthetic_events());
    for (NodeId id : tree.depth_first())
    {
        const NodeId parent = tree.parent(id);
        if (parent == INVALID_NODE)
            continue;
        EXPECT_TRUE(is_subset(result.membership(id).mask, result.membership(parent).mask));
        EXPECT_LE(result.count(id), result.count(parent));
    }
}

TEST(Evaluate, Deterministic)
{
    auto tree = two_level_tree();
    auto events = synthetic_events();
    auto a = evaluate(tree, TransformSet{}, events);
    auto b = evaluate(tree, TransformSet{}, events);
    for (NodeId id = 0; id < tree.size(); ++id)
        EXPECT_EQ(a.membership(id).mask, b.membership(id).mask);
}

TEST(Evaluate, GatesTestedInDisplaySpace)
{
    // Raw 10000 displays near 0.69; raw 1 sits near x1.
    LogicleTransform lg({.T = 262144.0, .W = 0.5, .M = 4.5, .A = 0.0});
    TransformSet tx;
    tx.set("CD4", lg);
    tx.set("CD8", lg);

    GateHierarchyBuilder b;
    auto root = b.add_root("All Events");
    b.add_child(root, "Bright", Gate{"CD4", "CD8", RectangleGate{0.5, 1.0, 0.0, 1.0}});
    auto tree = b.build();

    auto events = EventMatrix::from_rows({"CD4", "CD8"}, {{10000.0, 10.0}, {1.0, 10.0}, {-40.0, 10.0}});
    auto result = evaluate(tree, tx, events);
    EXPECT_EQ(result.membership(1).mask, (Mask{1, 0, 0}));

    auto cd4 = result.display_column("CD4");
    ASSERT_EQ(cd4.size(), 3u);
    EXPECT_DOUBLE_EQ(cd4[0], lg.to_display(10000.0));
    EXPECT_LT(cd4[2], lg.coefficients().x1);
}

TEST(Evaluate, MissingChannelFailsBeforeWork)
{
    auto tree = two_level_tree();
    auto events = EventMatrix::from_rows({"FSC-A", "SSC-A", "CD4"}, {{1, 2, 3}});
    try
    {
        evaluate(tree, TransformSet{}, events);
        FAIL() << "expected ChannelNotFoundError";
    }
    catch (const ChannelNotFoundError& e)
    {
        EXPECT_EQ(e.channel(), "CD8");
    }
}

TEST(Evaluate, DisplayColumnsOnlyForGatingChannels)
{
    auto tree = two_level_tree();
    auto events = EventMatrix::from_rows({"FSC-A", "SSC-A", "CD4", "CD8", "Time"}, {{1, 2, 3, 4, 5}});
    auto result = evaluate(tree, TransformSet{}, events);
    EXPECT_NO_THROW((void)result.display_column("FSC-A"));
    EXPECT_THROW((void)result.display_column("Time"), ChannelNotFoundError);
}

TEST(Evaluate, EmptyEventMatrix)
{
    auto tree = two_level_tree();
    EventMatrix events({"FSC-A", "SSC-A", "CD4", "CD8"}, {{}, {}, {}, {}});
    auto result = evaluate(tree, TransformSet{}, events);
    EXPECT_EQ(result.total_events(), 0u);
    EXPECT_EQ(result.count(0), 0u);
    EXPECT_EQ(result.count(2), 0u);
}

TEST(Evaluate, EmptyHierarchy)
{
    auto result = evaluate(GateHierarchy{}, TransformSet{}, synthetic_events());
    EXPECT_EQ(result.node_count(), 0u);
    EXPECT_EQ(result.total_events(), 1000u);
}

// ═══════════════════════════════════════════════════════════════════════════
// Batch
// ═══════════════════════════════════════════════════════════════════════════

TEST(EvaluateBatch, ResultsInInputOrder)
{
    auto tree = two_level_tree();
    std::vector<EventMatrix> batches;
    batches.push_back(synthetic_events());
    batches.push_back(synthetic_events().select_rows(Mask(1000, 0)));
    batches.push_back(EventMatrix::from_rows({"FSC-A", "SSC-A", "CD4", "CD8"}, {{5, 5, 1, 1}}));

    auto results = evaluate_batch(tree, TransformSet{}, batches, 2);
    ASSERT_EQ(results.size(), 3u);
    EXPECT_EQ(results[0].count(2), 40u);
    EXPECT_EQ(results[1].total_events(), 0u);
    EXPECT_EQ(results[2].count(2), 1u);
}

TEST(EvaluateBatch, FailureRethrownAfterAllTasks)
{
    auto tree = two_level_tree();
    std::vector<EventMatrix> batches;
    batches.push_back(synthetic_events());
    batches.push_back(EventMatrix::from_rows({"FSC-A"}, {{1.0}}));
    EXPECT_THROW(evaluate_batch(tree, TransformSet{}, batches), ChannelNotFoundError);
}

TEST(EvaluateBatch, EmptyBatch)
{
    auto tree = two_level_tree();
    std::vector<EventMatrix> none;
    EXPECT_TRUE(evaluate_batch(tree, TransformSet{}, none).empty());
}

// ═══════════════════════════════════════════════════════════════════════════
// Summaries
// ═══════════════════════════════════════════════════════════════════════════

TEST(Summarize, CountsAndPercentages)
{
    auto tree = two_level_tree();
    auto result = evaluate(tree, TransformSet{}, synthetic_events());
    auto sums = summarize(tree, result);
    ASSERT_EQ(sums.size(), 3u);

    EXPECT_EQ(sums[0].name, "All Events");
    EXPECT_TRUE(sums[0].parent_name.empty());
    EXPECT_DOUBLE_EQ(sums[0].percent_of_parent, 100.0);
    EXPECT_TRUE(std::isnan(sums[0].median_x));

    EXPECT_EQ(sums[1].parent_count, 1000u);
    EXPECT_DOUBLE_EQ(sums[1].percent_of_parent, 10.0);

    EXPECT_EQ(sums[2].name, "CD4+");
    EXPECT_EQ(sums[2].parent_name, "Lymphocytes");
    EXPECT_EQ(sums[2].parent_count, 100u);
    EXPECT_DOUBLE_EQ(sums[2].percent_of_parent, 40.0);
    EXPECT_DOUBLE_EQ(sums[2].percent_of_total, 4.0);
    EXPECT_EQ(sums[2].x_channel, "CD4");
    EXPECT_DOUBLE_EQ(sums[2].median_y, 2.0);
}

TEST(Summarize, MedianOfEvenCount)
{
    GateHierarchyBuilder b;
    auto root = b.add_root("All Events");
    b.add_child(root, "Box", Gate{"X", "Y", RectangleGate{0, 100, 0, 100}});
    auto tree = b.build();
    auto events = EventMatrix::from_rows({"X", "Y"}, {{1, 10}, {3, 20}, {200, 0}, {7, 40}, {5, 30}});
    auto sums = summarize(tree, evaluate(tree, TransformSet{}, events));
    EXPECT_DOUBLE_EQ(sums[1].median_x, 4.0);
    EXPECT_DOUBLE_EQ(sums[1].median_y, 25.0);
}

TEST(Summarize, EmptyPopulationHasNanMedian)
{
    GateHierarchyBuilder b;
    auto root = b.add_root("All Events");
    b.add_child(root, "Nothing", Gate{"X", "Y", RectangleGate{500, 600, 500, 600}});
    auto tree = b.build();
    auto events = EventMatrix::from_rows({"X", "Y"}, {{1, 1}});
    auto sums = summarize(tree, evaluate(tree, TransformSet{}, events));
    EXPECT_EQ(sums[1].count, 0u);
    EXPECT_DOUBLE_EQ(sums[1].percent_of_parent, 0.0);
    EXPECT_TRUE(std::isnan(sums[1].median_x));
}

// ═══════════════════════════════════════════════════════════════════════════
// Thresholds and marker rules
// ═══════════════════════════════════════════════════════════════════════════

// ─── Helper ─────────────────────────────────────────────────────────────────

// Values spanning [0, 200] with one value per unit bin center: 10 per bin
// below 80, 2 per bin in the valley [80, 120), 10 per bin above.
std::vector<double> bimodal_values()
{
    std::vector<double> v = {0.0, 200.0};
    for (int k = 0; k < 200; ++k)
    {
        const int per_bin = (k >= 80 && k < 120) ? 2 : 10;
        for (int i = 0; i < per_bin; ++i)
            v.push_back(k + 0.5);
    }
    return v;
}

TEST(AutoThreshold, FirstSparseBinOfBimodalData)
{
    auto v = bimodal_values();
    EXPECT_DOUBLE_EQ(auto_threshold(v), 80.0);
}

TEST(AutoThreshold, ConstantFallsBackToPercentile)
{
    std::vector<double> v(500, 5.0);
    EXPECT_DOUBLE_EQ(auto_threshold(v), 5.0);
}

TEST(AutoThreshold, NonFiniteSkipped)
{
    const double nan = std::numeric_limits<double>::quiet_NaN();
    EXPECT_TRUE(std::isnan(auto_threshold(std::vector<double>{})));
    EXPECT_TRUE(std::isnan(auto_threshold(std::vector<double>{nan, nan})));

    auto v = bimodal_values();
    v.push_back(nan);
    v.push_back(std::numeric_limits<double>::infinity());
    EXPECT_DOUBLE_EQ(auto_threshold(v), 80.0);
}

TEST(Evaluate, PositiveAndNegativeMarkersSplitParent)
{
    GateHierarchyBuilder b;
    auto root = b.add_root("All Events");
    auto pos = b.add_child(root, "X+", std::nullopt, {{"X", true}});
    auto neg = b.add_child(root, "X-", std::nullopt, {{"X", false}});
    auto tree = b.build();

    auto values = bimodal_values();
    EventMatrix events({"X"}, {values});
    auto result = evaluate(tree, TransformSet{}, events);

    ASSERT_TRUE(result.threshold("X").has_value());
    EXPECT_DOUBLE_EQ(*result.threshold("X"), 80.0);
    EXPECT_FALSE(result.threshold("Y").has_value());

    EXPECT_EQ(result.count(pos), 881u);
    EXPECT_EQ(result.count(neg), 801u);
    EXPECT_EQ(result.count(pos) + result.count(neg), result.total_events());
    for (size_t i : result.member_indices(pos))
        EXPECT_GT(values[i], 80.0);
}

TEST(Evaluate, MarkersFilterGatedMembers)
{
    GateHierarchyBuilder b;
    auto root = b.add_root("All Events");
    auto lymph = b.add_child(root, "Lymphocytes", square("FSC-A", "SSC-A", 0, 10));
    auto low = b.add_child(lymph, "X low", std::nullopt, {{"X", false}});
    auto tree = b.build();

    // Even rows fall in the scatter gate.
    auto x = bimodal_values();
    std::vector<double> fsc(x.size()), ssc(x.size(), 5.0);
    for (size_t i = 0; i < x.size(); ++i)
        fsc[i] = i % 2 == 0 ? 5.0 : 50.0;
    EventMatrix events({"FSC-A", "SSC-A", "X"}, {fsc, ssc, x});

    auto result = evaluate(tree, TransformSet{}, events);
    EXPECT_DOUBLE_EQ(*result.threshold("X"), 80.0);
    EXPECT_TRUE(is_subset(result.membership(low).mask, result.membership(lymph).mask));
    // Row 0 (0.0) plus the even rows among the 800 values below 80.
    EXPECT_EQ(result.count(low), 401u);
}

TEST(Evaluate, ThresholdGateOnOneChannel)
{
    GateHierarchyBuilder b;
    auto root = b.add_root("All Events");
    auto band = b.add_child(root, "Band", Gate{"X", "", RangeGate{10.0, 50.0}});
    auto tree = b.build();

    EventMatrix events({"X"}, {bimodal_values()});
    auto result = evaluate(tree, TransformSet{}, events);
    EXPECT_EQ(result.count(band), 400u);
    EXPECT_TRUE(result.thresholds().empty());

    auto sums = summarize(tree, result);
    EXPECT_EQ(sums[1].x_channel, "X");
    EXPECT_DOUBLE_EQ(sums[1].median_x, 30.0);
    EXPECT_TRUE(std::isnan(sums[1].median_y));
}

}   // namespace
}   // namespace facsforge
