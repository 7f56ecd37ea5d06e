#include <facsforge/channel.hpp>
#include <facsforge/transform.hpp>
#include <gtest/gtest.h>
#include <stdexcept>
#include <vector>

namespace facsforge
{
namespace
{

// ═══════════════════════════════════════════════════════════════════════════
// Linear
// ═══════════════════════════════════════════════════════════════════════════

TEST(LinearTransform, IdentityBothWays)
{
    LinearTransform t;
    EXPECT_DOUBLE_EQ(t.to_display(-123.5), -123.5);
    EXPECT_DOUBLE_EQ(t.to_raw(262144.0), 262144.0);
    EXPECT_FALSE(t.has_range());
}

TEST(LinearTransform, RangeKept)
{
    LinearTransform t(0.0, 262144.0);
    ASSERT_TRUE(t.has_range());
    EXPECT_DOUBLE_EQ(t.range_min(), 0.0);
    EXPECT_DOUBLE_EQ(t.range_max(), 262144.0);
    EXPECT_DOUBLE_EQ(t.to_display(5.0), 5.0);
}

TEST(LinearTransform, InvertedRangeRejected)
{
    EXPECT_THROW(LinearTransform(10.0, 10.0), std::invalid_argument);
    EXPECT_THROW(LinearTransform(10.0, 1.0), std::invalid_argument);
}

// ═══════════════════════════════════════════════════════════════════════════
// ChannelTransform
// ═══════════════════════════════════════════════════════════════════════════

TEST(ChannelTransform, DefaultIsLinear)
{
    ChannelTransform t;
    EXPECT_EQ(t.kind(), TransformKind::Linear);
    EXPECT_NE(t.as_linear(), nullptr);
    EXPECT_EQ(t.as_logicle(), nullptr);
    EXPECT_DOUBLE_EQ(t.to_display(42.0), 42.0);
}

TEST(ChannelTransform, LogicleDispatch)
{
    LogicleTransform lg({.T = 262144.0, .W = 0.5, .M = 4.5, .A = 0.0});
    ChannelTransform t(lg);
    EXPECT_EQ(t.kind(), TransformKind::Logicle);
    ASSERT_NE(t.as_logicle(), nullptr);
    EXPECT_DOUBLE_EQ(t.to_display(1000.0), lg.to_display(1000.0));
    EXPECT_DOUBLE_EQ(t.to_raw(0.5), lg.to_raw(0.5));
}

TEST(ChannelTransform, ColumnMatchesScalar)
{
    ChannelTransform t(LogicleTransform({.T = 10000.0, .W = 0.5, .M = 4.5, .A = 0.0}));
    std::vector<double> raw = {-50.0, 0.0, 12.0, 9000.0};
    auto out = t.to_display(std::span<const double>(raw));
    ASSERT_EQ(out.size(), raw.size());
    for (size_t i = 0; i < raw.size(); ++i)
        EXPECT_DOUBLE_EQ(out[i], t.to_display(raw[i]));
}

TEST(ChannelTransform, Description)
{
    EXPECT_EQ(ChannelTransform(LinearTransform{}).description(), "linear");
    EXPECT_EQ(ChannelTransform(LinearTransform(0, 1024)).description(), "linear[0, 1024]");
    ChannelTransform lg(LogicleTransform({.T = 10000.0, .W = 0.5, .M = 4.5, .A = 0.0}));
    EXPECT_EQ(lg.description(), "logicle(T=10000, W=0.5, M=4.5, A=0)");
}

// ═══════════════════════════════════════════════════════════════════════════
// TransformSet
// ═══════════════════════════════════════════════════════════════════════════

TEST(TransformSet, MissingChannelIsLinear)
{
    TransformSet set;
    EXPECT_FALSE(set.contains("FSC-A"));
    EXPECT_EQ(set.get("FSC-A").kind(), TransformKind::Linear);
    EXPECT_DOUBLE_EQ(set.to_display("FSC-A", 5000.0), 5000.0);
}

TEST(TransformSet, SetReplacesEntry)
{
    TransformSet set;
    set.set("CD4", LinearTransform{});
    set.set("CD4", LogicleTransform({.T = 262144.0, .W = 0.5, .M = 4.5, .A = 0.0}));
    EXPECT_EQ(set.size(), 1u);
    EXPECT_EQ(set.get("CD4").kind(), TransformKind::Logicle);
    EXPECT_NEAR(set.to_raw("CD4", set.to_display("CD4", -75.0)), -75.0, 1e-7);
}

// ═══════════════════════════════════════════════════════════════════════════
// Channel roles
// ═══════════════════════════════════════════════════════════════════════════

TEST(ChannelRole, NamesRoundTrip)
{
    for (auto role : {ChannelRole::ScatterLinear, ChannelRole::TimeLinear,
                      ChannelRole::FluorescenceLogicle})
        EXPECT_EQ(parse_channel_role(channel_role_name(role)), role);
    EXPECT_FALSE(parse_channel_role("log").has_value());
}

TEST(ChannelRole, DefaultRoleByName)
{
    EXPECT_EQ(default_role_for("Time"), ChannelRole::TimeLinear);
    EXPECT_EQ(default_role_for("FSC-A"), ChannelRole::ScatterLinear);
    EXPECT_EQ(default_role_for("CD4"), ChannelRole::ScatterLinear);
}

TEST(ChannelRole, FindChannel)
{
    std::vector<Channel> channels = {{"FSC-A", ChannelRole::ScatterLinear, ""},
                                     {"CD4", ChannelRole::FluorescenceLogicle, "FITC"}};
    const Channel* ch = find_channel(channels, "CD4");
    ASSERT_NE(ch, nullptr);
    EXPECT_EQ(ch->fluor, "FITC");
    EXPECT_EQ(find_channel(channels, "CD8"), nullptr);
}

}   // namespace
}   // namespace facsforge
