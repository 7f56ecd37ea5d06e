#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace facsforge
{

// Raw (untransformed, already compensated) events, stored column-major:
// one column per channel, all columns the same length. Immutable once built.
class EventMatrix
{
   public:
    EventMatrix() = default;

    // Throws std::invalid_argument on ragged columns, a channel/column count
    // mismatch, or duplicate channel names.
    EventMatrix(std::vector<std::string> channels, std::vector<std::vector<double>> columns);

    // Row-major convenience constructor.
    static EventMatrix from_rows(std::vector<std::string> channels,
                                 const std::vector<std::vector<double>>& rows);

    size_t rows() const { return rows_; }
    size_t channel_count() const { return channels_.size(); }
    bool   empty() const { return rows_ == 0; }

    const std::vector<std::string>& channels() const { return channels_; }

    std::optional<size_t> channel_index(std::string_view channel) const;
    bool has_channel(std::string_view channel) const { return channel_index(channel).has_value(); }

    // Throws ChannelNotFoundError when the channel is absent.
    std::span<const double> column(std::string_view channel) const;
    std::span<const double> column(size_t index) const { return columns_.at(index); }

    double value(size_t row, size_t col) const { return columns_[col][row]; }

    // Copy without the named channels (names not present are ignored).
    EventMatrix without_channels(const std::vector<std::string>& drop) const;

    // Copy keeping only rows where mask[row] != 0.
    EventMatrix select_rows(std::span<const unsigned char> mask) const;

   private:
    std::vector<std::string>         channels_;
    std::vector<std::vector<double>> columns_;
    size_t                           rows_ = 0;
};

// Load a numeric CSV with a header row (one column per channel). Stands in
// for the FCS reader. Throws IoError when the file cannot be read or a data
// cell is not numeric.
EventMatrix load_events_csv(const std::string& path);

}   // namespace facsforge
