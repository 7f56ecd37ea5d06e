#pragma once

#include <array>
#include <cstddef>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace facsforge
{

// ─── Logicle parameters ─────────────────────────────────────────────────────

// Parks/Moore logicle parameters.
//   T: top of scale (raw units), > 0
//   W: width of the linearization region in decades, >= 0
//   M: decades spanned by the full display, > 0
//   A: additional negative decades, >= 0
struct LogicleParams
{
    double T = 262144.0;
    double W = 0.5;
    double M = 4.5;
    double A = 0.0;

    bool operator==(const LogicleParams&) const = default;
};

// Solved biexponential S^-1(x) = a*e^(b*x) - c*e^(-d*x) + f on display
// coordinate x in [0, 1], plus the transition points the solver derives.
struct LogicleCoefficients
{
    static constexpr size_t TAYLOR_LENGTH = 16;

    double a = 0.0;
    double b = 0.0;
    double c = 0.0;
    double d = 0.0;
    double f = 0.0;
    double w = 0.0;    // W / (M + A)
    double x0 = 0.0;   // x2 + 2w
    double x1 = 0.0;   // display position of raw zero
    double x2 = 0.0;   // A / (M + A)

    double                              x_taylor = 0.0;
    std::array<double, TAYLOR_LENGTH>   taylor{};
};

// Maximum root-finder iterations when solving for d.
inline constexpr int LOGICLE_MAX_SOLVE_ITERATIONS = 100;

// Documented round-trip bound: |to_raw(to_display(x)) - x| <= tol * max(|x|, 1).
inline constexpr double LOGICLE_ROUND_TRIP_TOLERANCE = 1e-9;

// Validate params and solve for the coefficients. Pure and deterministic.
// Throws TransformParameterError on invalid or non-convergent input.
LogicleCoefficients solve_logicle(const LogicleParams& params);

// ─── Channel transforms ─────────────────────────────────────────────────────

// Identity scaling. The optional display range only drives axis extents.
class LinearTransform
{
   public:
    LinearTransform() = default;
    LinearTransform(double display_min, double display_max);

    double to_display(double raw) const { return raw; }
    double to_raw(double display) const { return display; }

    bool has_range() const { return range_.has_value(); }
    double range_min() const { return range_ ? range_->first : 0.0; }
    double range_max() const { return range_ ? range_->second : 0.0; }

    bool operator==(const LinearTransform&) const = default;

   private:
    std::optional<std::pair<double, double>> range_;
};

// Logicle scaling. Coefficients are solved once in the constructor; the
// object is an immutable value afterwards.
class LogicleTransform
{
   public:
    explicit LogicleTransform(const LogicleParams& params);

    // Raw value -> display coordinate (x1 at raw zero, 1.0 at raw T).
    double to_display(double raw) const;

    // Display coordinate -> raw value. Closed form, defined everywhere.
    double to_raw(double display) const;

    // d(raw)/d(display) at a display coordinate; always positive.
    double raw_slope(double display) const;

    const LogicleParams& params() const { return params_; }
    const LogicleCoefficients& coefficients() const { return coef_; }

    bool operator==(const LogicleTransform& other) const { return params_ == other.params_; }

   private:
    double series_biexponential(double scale) const;
    double bisect_display(double raw) const;

    LogicleParams params_;
    LogicleCoefficients coef_;
};

enum class TransformKind
{
    Linear,
    Logicle,
};

// Tagged variant over the supported scalings.
class ChannelTransform
{
   public:
    ChannelTransform() = default;
    ChannelTransform(LinearTransform t) : impl_(std::move(t)) {}
    ChannelTransform(LogicleTransform t) : impl_(std::move(t)) {}

    TransformKind kind() const;

    double to_display(double raw) const;
    double to_raw(double display) const;

    // Transform a whole column.
    std::vector<double> to_display(std::span<const double> raw) const;

    const LinearTransform* as_linear() const { return std::get_if<LinearTransform>(&impl_); }
    const LogicleTransform* as_logicle() const { return std::get_if<LogicleTransform>(&impl_); }

    std::string description() const;

    bool operator==(const ChannelTransform&) const = default;

   private:
    std::variant<LinearTransform, LogicleTransform> impl_;
};

// Per-channel transforms for one analysis run. Channels without an entry
// scale linearly.
class TransformSet
{
   public:
    void set(const std::string& channel, ChannelTransform transform);

    bool contains(std::string_view channel) const;

    // Linear identity when the channel has no entry.
    const ChannelTransform& get(std::string_view channel) const;

    double to_display(std::string_view channel, double raw) const
    {
        return get(channel).to_display(raw);
    }
    double to_raw(std::string_view channel, double display) const
    {
        return get(channel).to_raw(display);
    }

    size_t size() const { return transforms_.size(); }
    const std::map<std::string, ChannelTransform, std::less<>>& entries() const
    {
        return transforms_;
    }

   private:
    std::map<std::string, ChannelTransform, std::less<>> transforms_;
};

}   // namespace facsforge
