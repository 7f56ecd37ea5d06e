#include <facsforge/error.hpp>
#include <facsforge/logger.hpp>
#include <facsforge/transform.hpp>

#include <cfloat>
#include <cmath>
#include <limits>
#include <sstream>

namespace facsforge
{

// ─── Solver internals ───────────────────────────────────────────────────────

namespace
{

std::string describe(const LogicleParams& p)
{
    std::ostringstream os;
    os << "logicle(T=" << p.T << ", W=" << p.W << ", M=" << p.M << ", A=" << p.A << ")";
    return os.str();
}

// Solve 2*ln(d) + w*d = 2*ln(b) - w*b for d in (0, b].
// Safeguarded Newton: falls back to bisection whenever the Newton step
// would leave the bracket or is not shrinking fast enough.
double solve_d(double b, double w, const LogicleParams& params)
{
    if (w == 0.0)
        return b;

    const double tolerance = 2.0 * b * DBL_EPSILON;

    double d_lo = 0.0;
    double d_hi = b;

    double d = (d_lo + d_hi) / 2.0;
    double last_delta = d_hi - d_lo;
    double delta = 0.0;

    const double f_b = -2.0 * std::log(b) + w * b;
    double f = 2.0 * std::log(d) + w * d + f_b;
    double last_f = std::numeric_limits<double>::quiet_NaN();

    for (int i = 1; i <= LOGICLE_MAX_SOLVE_ITERATIONS; ++i)
    {
        const double df = 2.0 / d + w;

        if (((d - d_hi) * df - f) * ((d - d_lo) * df - f) >= 0.0
            || std::abs(1.9 * f) > std::abs(last_delta * df))
        {
            delta = (d_hi - d_lo) / 2.0;
            d = d_lo + delta;
            if (d == d_lo)
                return d;
        }
        else
        {
            delta = f / df;
            const double t = d;
            d -= delta;
            if (d == t)
                return d;
        }

        if (std::abs(delta) < tolerance)
            return d;
        last_delta = delta;

        f = 2.0 * std::log(d) + w * d + f_b;
        if (f == 0.0 || f == last_f)
            return d;
        last_f = f;

        if (f < 0.0)
            d_lo = d;
        else
            d_hi = d;
    }

    throw TransformParameterError(describe(params) + ": root finder for d did not converge within "
                                  + std::to_string(LOGICLE_MAX_SOLVE_ITERATIONS) + " iterations");
}

bool all_finite(const LogicleCoefficients& c)
{
    return std::isfinite(c.a) && std::isfinite(c.b) && std::isfinite(c.c) && std::isfinite(c.d)
           && std::isfinite(c.f);
}

}   // namespace

LogicleCoefficients solve_logicle(const LogicleParams& params)
{
    const auto& [T, W, M, A] = params;

    if (!std::isfinite(T) || !std::isfinite(W) || !std::isfinite(M) || !std::isfinite(A))
        throw TransformParameterError(describe(params) + ": parameters must be finite");
    if (T <= 0.0)
        throw TransformParameterError(describe(params) + ": T must be positive");
    if (W < 0.0)
        throw TransformParameterError(describe(params) + ": W must not be negative");
    if (M <= 0.0)
        throw TransformParameterError(describe(params) + ": M must be positive");
    if (A < 0.0)
        throw TransformParameterError(describe(params) + ": A must not be negative");

    if (2.0 * W > M)
        FACSFORGE_LOG_WARN("transform", "{}: W exceeds M/2, display will be mostly linear",
                           describe(params));

    LogicleCoefficients c;
    c.w = W / (M + A);
    c.x2 = A / (M + A);
    c.x1 = c.x2 + c.w;
    c.x0 = c.x2 + 2.0 * c.w;
    c.b = (M + A) * std::log(10.0);
    c.d = solve_d(c.b, c.w, params);

    const double c_a = std::exp(c.x0 * (c.b + c.d));
    const double mf_a = std::exp(c.b * c.x1) - c_a / std::exp(c.d * c.x1);
    c.a = T / ((std::exp(c.b) - mf_a) - c_a / std::exp(c.d));
    c.c = c_a * c.a;
    c.f = -mf_a * c.a;

    // Taylor series around x1 for the near-zero region, where the exponential
    // form loses precision to cancellation.
    c.x_taylor = c.x1 + c.w / 4.0;
    double pos_coef = c.a * std::exp(c.b * c.x1);
    double neg_coef = -c.c / std::exp(c.d * c.x1);
    for (size_t i = 0; i < LogicleCoefficients::TAYLOR_LENGTH; ++i)
    {
        pos_coef *= c.b / static_cast<double>(i + 1);
        neg_coef *= -c.d / static_cast<double>(i + 1);
        c.taylor[i] = pos_coef + neg_coef;
    }
    // Exact by the logicle condition (second derivative vanishes at x1).
    c.taylor[1] = 0.0;

    if (!all_finite(c) || c.a <= 0.0 || c.b <= 0.0 || c.d <= 0.0)
        throw TransformParameterError(describe(params) + ": degenerate coefficients");

    FACSFORGE_LOG_DEBUG("transform",
                        "{} solved: a={} b={} c={} d={} f={}",
                        describe(params),
                        c.a,
                        c.b,
                        c.c,
                        c.d,
                        c.f);
    return c;
}

// ─── LogicleTransform ───────────────────────────────────────────────────────

LogicleTransform::LogicleTransform(const LogicleParams& params)
    : params_(params), coef_(solve_logicle(params))
{
    // Top of scale must land on 1.0; anything else means the solve went wrong.
    const double top = to_raw(1.0);
    if (!std::isfinite(top) || std::abs(top - params_.T) > 1e-6 * params_.T)
        throw TransformParameterError("logicle: solved coefficients do not reproduce T");
}

double LogicleTransform::series_biexponential(double scale) const
{
    // Taylor series is around x1; taylor[1] is identically zero.
    const double x = scale - coef_.x1;
    const auto& t = coef_.taylor;
    double sum = t[LogicleCoefficients::TAYLOR_LENGTH - 1] * x;
    for (size_t i = LogicleCoefficients::TAYLOR_LENGTH - 2; i >= 2; --i)
        sum = (sum + t[i]) * x;
    return (sum * x + t[0]) * x;
}

double LogicleTransform::to_raw(double display) const
{
    if (std::isnan(display))
        return display;

    const bool negative = display < coef_.x1;
    if (negative)
        display = 2.0 * coef_.x1 - display;

    double inverse;
    if (display < coef_.x_taylor)
        inverse = series_biexponential(display);
    else
        inverse = (coef_.a * std::exp(coef_.b * display) + coef_.f)
                  - coef_.c / std::exp(coef_.d * display);

    return negative ? -inverse : inverse;
}

double LogicleTransform::raw_slope(double display) const
{
    if (display < coef_.x1)
        display = 2.0 * coef_.x1 - display;
    return coef_.a * coef_.b * std::exp(coef_.b * display)
           + coef_.c * coef_.d / std::exp(coef_.d * display);
}

double LogicleTransform::to_display(double raw) const
{
    if (raw == 0.0)
        return coef_.x1;
    if (std::isnan(raw))
        return raw;
    if (std::isinf(raw))
        return raw;

    const bool negative = raw < 0.0;
    const double value = negative ? -raw : raw;

    // Initial guess: linear near zero, ordinary logarithm elsewhere.
    double x;
    if (value < coef_.f)
        x = coef_.x1 + value / coef_.taylor[0];
    else
        x = std::log(value / coef_.a) / coef_.b;

    double tolerance = 3.0 * DBL_EPSILON;
    if (x > 1.0)
        tolerance = 3.0 * x * DBL_EPSILON;

    // Halley iterations, cubic convergence.
    for (int i = 0; i < 20; ++i)
    {
        const double ae2bx = coef_.a * std::exp(coef_.b * x);
        const double ce2mdx = coef_.c / std::exp(coef_.d * x);
        double y;
        if (x < coef_.x_taylor)
            y = series_biexponential(x) - value;
        else
            y = (ae2bx + coef_.f) - (ce2mdx + value);
        const double abe2bx = coef_.b * ae2bx;
        const double cde2mdx = coef_.d * ce2mdx;
        const double dy = abe2bx + cde2mdx;
        const double ddy = coef_.b * abe2bx - coef_.d * cde2mdx;

        const double delta = y / (dy * (1.0 - y * ddy / (2.0 * dy * dy)));
        x -= delta;

        if (!std::isfinite(x))
            break;
        if (std::abs(delta) < tolerance)
            return negative ? 2.0 * coef_.x1 - x : x;
    }

    const double x_b = bisect_display(value);
    return negative ? 2.0 * coef_.x1 - x_b : x_b;
}

// Fallback for the rare value where Halley stalls: the inverse is strictly
// increasing on [x1, inf), so bisection on it always converges.
double LogicleTransform::bisect_display(double value) const
{
    double lo = coef_.x1;
    double hi = 1.0;
    for (int i = 0; i < 64 && to_raw(hi) < value; ++i)
        hi = coef_.x1 + 2.0 * (hi - coef_.x1);

    for (int i = 0; i < 200; ++i)
    {
        const double mid = 0.5 * (lo + hi);
        if (mid == lo || mid == hi)
            break;
        if (to_raw(mid) < value)
            lo = mid;
        else
            hi = mid;
    }
    return 0.5 * (lo + hi);
}

}   // namespace facsforge
