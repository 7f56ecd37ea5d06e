#include <facsforge/channel.hpp>

namespace facsforge
{

const char* channel_role_name(ChannelRole role)
{
    switch (role)
    {
        case ChannelRole::ScatterLinear:
            return "scatter-linear";
        case ChannelRole::TimeLinear:
            return "time-linear";
        case ChannelRole::FluorescenceLogicle:
            return "fluorescence-logicle";
    }
    return "scatter-linear";
}

std::optional<ChannelRole> parse_channel_role(std::string_view name)
{
    if (name == "scatter-linear")
        return ChannelRole::ScatterLinear;
    if (name == "time-linear")
        return ChannelRole::TimeLinear;
    if (name == "fluorescence-logicle")
        return ChannelRole::FluorescenceLogicle;
    return std::nullopt;
}

ChannelRole default_role_for(std::string_view channel_name)
{
    if (channel_name.starts_with("Time") || channel_name.starts_with("TIME"))
        return ChannelRole::TimeLinear;
    return ChannelRole::ScatterLinear;
}

const Channel* find_channel(const std::vector<Channel>& channels, std::string_view name)
{
    for (const auto& ch : channels)
    {
        if (ch.name == name)
            return &ch;
    }
    return nullptr;
}

}   // namespace facsforge
