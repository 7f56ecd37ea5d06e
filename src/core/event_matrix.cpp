#include <facsforge/error.hpp>
#include <facsforge/event_matrix.hpp>

#include <algorithm>
#include <stdexcept>
#include <unordered_set>

namespace facsforge
{

EventMatrix::EventMatrix(std::vector<std::string> channels, std::vector<std::vector<double>> columns)
    : channels_(std::move(channels)), columns_(std::move(columns))
{
    if (channels_.size() != columns_.size())
        throw std::invalid_argument("EventMatrix: " + std::to_string(channels_.size())
                                    + " channels but " + std::to_string(columns_.size())
                                    + " columns");

    std::unordered_set<std::string> seen;
    for (const auto& ch : channels_)
    {
        if (!seen.insert(ch).second)
            throw std::invalid_argument("EventMatrix: duplicate channel '" + ch + "'");
    }

    rows_ = columns_.empty() ? 0 : columns_.front().size();
    for (size_t i = 0; i < columns_.size(); ++i)
    {
        if (columns_[i].size() != rows_)
            throw std::invalid_argument("EventMatrix: column '" + channels_[i] + "' has "
                                        + std::to_string(columns_[i].size()) + " rows, expected "
                                        + std::to_string(rows_));
    }
}

EventMatrix EventMatrix::from_rows(std::vector<std::string> channels,
                                   const std::vector<std::vector<double>>& rows)
{
    std::vector<std::vector<double>> columns(channels.size());
    for (auto& col : columns)
        col.reserve(rows.size());

    for (size_t r = 0; r < rows.size(); ++r)
    {
        if (rows[r].size() != channels.size())
            throw std::invalid_argument("EventMatrix: row " + std::to_string(r) + " has "
                                        + std::to_string(rows[r].size()) + " values, expected "
                                        + std::to_string(channels.size()));
        for (size_t c = 0; c < channels.size(); ++c)
            columns[c].push_back(rows[r][c]);
    }
    return EventMatrix(std::move(channels), std::move(columns));
}

std::optional<size_t> EventMatrix::channel_index(std::string_view channel) const
{
    for (size_t i = 0; i < channels_.size(); ++i)
    {
        if (channels_[i] == channel)
            return i;
    }
    return std::nullopt;
}

std::span<const double> EventMatrix::column(std::string_view channel) const
{
    auto idx = channel_index(channel);
    if (!idx)
        throw ChannelNotFoundError(std::string(channel), "not present in the event data");
    return columns_[*idx];
}

EventMatrix EventMatrix::without_channels(const std::vector<std::string>& drop) const
{
    std::vector<std::string> keep_names;
    std::vector<std::vector<double>> keep_cols;
    for (size_t i = 0; i < channels_.size(); ++i)
    {
        if (std::find(drop.begin(), drop.end(), channels_[i]) != drop.end())
            continue;
        keep_names.push_back(channels_[i]);
        keep_cols.push_back(columns_[i]);
    }
    return EventMatrix(std::move(keep_names), std::move(keep_cols));
}

EventMatrix EventMatrix::select_rows(std::span<const unsigned char> mask) const
{
    if (mask.size() != rows_)
        throw std::invalid_argument("EventMatrix: mask length does not match row count");

    std::vector<std::vector<double>> out(columns_.size());
    const auto kept = static_cast<size_t>(std::count_if(mask.begin(), mask.end(),
                                                        [](unsigned char m) { return m != 0; }));
    for (size_t c = 0; c < columns_.size(); ++c)
    {
        out[c].reserve(kept);
        for (size_t r = 0; r < rows_; ++r)
        {
            if (mask[r])
                out[c].push_back(columns_[c][r]);
        }
    }
    return EventMatrix(channels_, std::move(out));
}

}   // namespace facsforge
