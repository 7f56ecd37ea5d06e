#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace facsforge
{

// Declared scaling role of an acquisition channel.
enum class ChannelRole
{
    ScatterLinear,         // FSC / SSC
    TimeLinear,            // Time
    FluorescenceLogicle,   // compensated fluorescence, may go negative
};

struct Channel
{
    std::string name;
    ChannelRole role = ChannelRole::ScatterLinear;
    std::string fluor;   // detector / fluorochrome label, may be empty

    bool operator==(const Channel&) const = default;
};

// "scatter-linear", "time-linear", "fluorescence-logicle"
const char*                channel_role_name(ChannelRole role);
std::optional<ChannelRole> parse_channel_role(std::string_view name);

// Role a channel gets when the source declares no fluorescence transform.
ChannelRole default_role_for(std::string_view channel_name);

// Linear lookup; channel sets are small (tens of entries).
const Channel* find_channel(const std::vector<Channel>& channels, std::string_view name);

}   // namespace facsforge
