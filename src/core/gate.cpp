#include <facsforge/error.hpp>
#include <facsforge/gate.hpp>

#include <algorithm>
#include <cmath>
#include <string>

namespace facsforge
{

namespace
{

// Edge tolerance relative to the polygon's extent so that boundary
// inclusion behaves the same for linear (1e5-scale) and logicle (0..1) axes.
constexpr double EDGE_TOLERANCE = 1e-12;

struct Bounds
{
    double x_min, x_max, y_min, y_max;
};

Bounds bounds_of(const std::vector<Vertex>& vertices)
{
    Bounds b{vertices[0].x, vertices[0].x, vertices[0].y, vertices[0].y};
    for (const auto& v : vertices)
    {
        b.x_min = std::min(b.x_min, v.x);
        b.x_max = std::max(b.x_max, v.x);
        b.y_min = std::min(b.y_min, v.y);
        b.y_max = std::max(b.y_max, v.y);
    }
    return b;
}

// True when (x, y) lies on segment a-b within eps.
bool on_segment(const Vertex& a, const Vertex& b, double x, double y, double eps)
{
    if (x < std::min(a.x, b.x) - eps || x > std::max(a.x, b.x) + eps)
        return false;
    if (y < std::min(a.y, b.y) - eps || y > std::max(a.y, b.y) + eps)
        return false;

    const double dx = b.x - a.x;
    const double dy = b.y - a.y;
    const double len = std::hypot(dx, dy);
    if (len == 0.0)
        return std::hypot(x - a.x, y - a.y) <= eps;

    // Perpendicular distance from the point to the line through a-b.
    const double cross = dx * (y - a.y) - dy * (x - a.x);
    return std::abs(cross) <= eps * len;
}

}   // namespace

const char* gate_type_name(const GateShape& shape)
{
    if (std::holds_alternative<PolygonGate>(shape))
        return "polygon";
    return std::holds_alternative<RectangleGate>(shape) ? "rectangle" : "threshold";
}

bool contains(const PolygonGate& polygon, double x, double y)
{
    const auto& v = polygon.vertices;
    const size_t n = v.size();
    if (n < 3)
        return false;

    const Bounds b = bounds_of(v);
    const double extent = std::max({b.x_max - b.x_min, b.y_max - b.y_min, 1e-300});
    const double eps = EDGE_TOLERANCE * std::max(extent, std::max(std::abs(x), std::abs(y)));

    if (x < b.x_min - eps || x > b.x_max + eps || y < b.y_min - eps || y > b.y_max + eps)
        return false;

    for (size_t i = 0, j = n - 1; i < n; j = i++)
    {
        if (on_segment(v[j], v[i], x, y, eps))
            return true;
    }

    // Even-odd ray cast towards +x.
    bool inside = false;
    for (size_t i = 0, j = n - 1; i < n; j = i++)
    {
        const Vertex& a = v[i];
        const Vertex& c = v[j];
        if ((a.y > y) != (c.y > y))
        {
            const double x_cross = (c.x - a.x) * (y - a.y) / (c.y - a.y) + a.x;
            if (x < x_cross)
                inside = !inside;
        }
    }
    return inside;
}

bool contains(const RectangleGate& rect, double x, double y)
{
    return x >= rect.x_min && x <= rect.x_max && y >= rect.y_min && y <= rect.y_max;
}

bool contains(const RangeGate& range, double x, double /*y*/)
{
    return x >= range.min && x <= range.max;
}

bool gate_contains(const GateShape& shape, double x, double y)
{
    return std::visit([x, y](const auto& s) { return contains(s, x, y); }, shape);
}

std::vector<Vertex> gate_outline(const GateShape& shape)
{
    if (const auto* poly = std::get_if<PolygonGate>(&shape))
        return poly->vertices;
    if (const auto* r = std::get_if<RectangleGate>(&shape))
        return {{r->x_min, r->y_min}, {r->x_max, r->y_min}, {r->x_max, r->y_max}, {r->x_min, r->y_max}};
    return {};
}

void validate_gate(const Gate& gate, std::string_view context)
{
    const std::string where(context);

    if (const auto* range = std::get_if<RangeGate>(&gate.shape))
    {
        if (gate.x_channel.empty() || !gate.y_channel.empty())
            throw ImportError(where + ": threshold gate must name exactly one channel");
        if (std::isnan(range->min) || std::isnan(range->max))
            throw ImportError(where + ": threshold bound is not a number");
        if (range->min > range->max)
            throw ImportError(where + ": threshold bounds are inverted");
        return;
    }

    if (gate.x_channel.empty() || gate.y_channel.empty())
        throw ImportError(where + ": gate must name two channels");

    if (const auto* poly = std::get_if<PolygonGate>(&gate.shape))
    {
        if (poly->vertices.size() < 3)
            throw ImportError(where + ": polygon has " + std::to_string(poly->vertices.size())
                              + " vertices, at least 3 are required");
        for (const auto& v : poly->vertices)
        {
            if (!std::isfinite(v.x) || !std::isfinite(v.y))
                throw ImportError(where + ": polygon vertex is not finite");
        }
        return;
    }

    const auto& r = std::get<RectangleGate>(gate.shape);
    if (!std::isfinite(r.x_min) || !std::isfinite(r.x_max) || !std::isfinite(r.y_min)
        || !std::isfinite(r.y_max))
        throw ImportError(where + ": rectangle bound is not finite");
    if (r.x_min > r.x_max || r.y_min > r.y_max)
        throw ImportError(where + ": rectangle bounds are inverted");
}

}   // namespace facsforge
