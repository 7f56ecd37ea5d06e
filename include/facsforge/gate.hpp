#pragma once

#include <limits>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace facsforge
{

// A polygon vertex / point in display (transformed) coordinates.
struct Vertex
{
    double x = 0.0;
    double y = 0.0;

    bool operator==(const Vertex&) const = default;
};

// ─── Gate shapes ────────────────────────────────────────────────────────────
// All shapes live in the display space of their channels. New shapes are
// added to GateShape; the evaluation engine only calls gate_contains().

// Implicitly closed: the last vertex connects back to the first.
struct PolygonGate
{
    std::vector<Vertex> vertices;

    bool operator==(const PolygonGate&) const = default;
};

// Axis-aligned, inclusive on all four sides.
struct RectangleGate
{
    double x_min = 0.0;
    double x_max = 0.0;
    double y_min = 0.0;
    double y_max = 0.0;

    bool operator==(const RectangleGate&) const = default;
};

// Threshold on a single channel, inclusive. A missing bound is infinite.
struct RangeGate
{
    double min = -std::numeric_limits<double>::infinity();
    double max = std::numeric_limits<double>::infinity();

    bool operator==(const RangeGate&) const = default;
};

using GateShape = std::variant<PolygonGate, RectangleGate, RangeGate>;

// A shape plus the channels it is drawn on. Range gates use x_channel only
// and leave y_channel empty.
struct Gate
{
    std::string x_channel;
    std::string y_channel;
    GateShape   shape;

    bool is_range() const { return std::holds_alternative<RangeGate>(shape); }

    bool operator==(const Gate&) const = default;
};

// "polygon" / "rectangle" / "threshold"
const char* gate_type_name(const GateShape& shape);

// Point-in-shape tests. Points on an edge or vertex are inside. Range gates
// ignore y.
bool contains(const PolygonGate& polygon, double x, double y);
bool contains(const RectangleGate& rect, double x, double y);
bool contains(const RangeGate& range, double x, double y);
bool gate_contains(const GateShape& shape, double x, double y);

// Closed outline for drawing (rectangles expand to 4 corners). Empty for
// range gates.
std::vector<Vertex> gate_outline(const GateShape& shape);

// Throws ImportError (prefixed with context) when the shape is structurally
// invalid: fewer than 3 polygon vertices, non-finite coordinates, an
// inverted rectangle or range, or a channel count that does not fit the
// shape.
void validate_gate(const Gate& gate, std::string_view context);

}   // namespace facsforge
