#include <facsforge/export.hpp>
#include <facsforge/logger.hpp>

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace facsforge
{

// ─── SVG Helpers ────────────────────────────────────────────────────────────

namespace
{

constexpr const char* PARENT_COLOR  = "rgb(160,160,160)";
constexpr const char* MEMBER_COLOR  = "rgb(31,119,180)";
constexpr const char* GATE_COLOR    = "rgb(0,0,0)";
constexpr const char* OVERLAY_COLOR = "rgb(214,39,40)";

// Convert a double to a compact string (no trailing zeros)
std::string fmt(double v)
{
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.4g", v);
    return buf;
}

// XML-escape a string for safe embedding in SVG attributes/text content
std::string xml_escape(const std::string& s)
{
    std::string out;
    out.reserve(s.size());
    for (char c : s)
    {
        switch (c)
        {
            case '&':
                out += "&amp;";
                break;
            case '<':
                out += "&lt;";
                break;
            case '>':
                out += "&gt;";
                break;
            case '"':
                out += "&quot;";
                break;
            case '\'':
                out += "&apos;";
                break;
            default:
                out += c;
                break;
        }
    }
    return out;
}

// Map display coordinates to SVG pixel coordinates within a viewport.
// SVG has Y-down, data has Y-up, so we flip Y.
struct DataToSvg
{
    double vp_x, vp_y, vp_w, vp_h;
    double x_min, x_max, y_min, y_max;

    double map_x(double data_x) const
    {
        double range = x_max - x_min;
        if (range == 0.0)
            range = 1.0;
        return vp_x + (data_x - x_min) / range * vp_w;
    }

    double map_y(double data_y) const
    {
        double range = y_max - y_min;
        if (range == 0.0)
            range = 1.0;
        return vp_y + (1.0 - (data_y - y_min) / range) * vp_h;
    }
};

struct Extent
{
    double min = std::numeric_limits<double>::infinity();
    double max = -std::numeric_limits<double>::infinity();

    void add(double v)
    {
        if (!std::isfinite(v))
            return;
        min = std::min(min, v);
        max = std::max(max, v);
    }

    // 5% margin; a degenerate range becomes [v - 0.5, v + 0.5].
    void pad()
    {
        if (!(min <= max))
        {
            min = 0.0;
            max = 1.0;
            return;
        }
        double span = max - min;
        if (span == 0.0)
        {
            min -= 0.5;
            max += 0.5;
            return;
        }
        min -= span * 0.05;
        max += span * 0.05;
    }
};

// Emit axis border (box around plot area)
void emit_border(std::ostringstream& svg, const DataToSvg& m)
{
    svg << "    <rect x=\"" << fmt(m.vp_x) << "\" y=\"" << fmt(m.vp_y) << "\" width=\""
        << fmt(m.vp_w) << "\" height=\"" << fmt(m.vp_h)
        << "\" fill=\"none\" stroke=\"#000\" stroke-width=\"1\"/>\n";
}

// Five evenly spaced ticks per axis
void emit_ticks(std::ostringstream& svg, const DataToSvg& m)
{
    constexpr int    tick_count   = 5;
    constexpr double tick_len     = 5.0;
    constexpr double label_offset = 14.0;

    svg << "    <g class=\"tick-labels\" font-family=\"sans-serif\" font-size=\"10\" fill=\"#333\">\n";
    for (int i = 0; i < tick_count; ++i)
    {
        double t = static_cast<double>(i) / (tick_count - 1);

        double xv = m.x_min + t * (m.x_max - m.x_min);
        double sx = m.map_x(xv);
        double bottom = m.vp_y + m.vp_h;
        svg << "      <line x1=\"" << fmt(sx) << "\" y1=\"" << fmt(bottom) << "\" x2=\"" << fmt(sx)
            << "\" y2=\"" << fmt(bottom + tick_len) << "\" stroke=\"#000\" stroke-width=\"1\"/>\n";
        svg << "      <text x=\"" << fmt(sx) << "\" y=\"" << fmt(bottom + label_offset)
            << "\" text-anchor=\"middle\">" << fmt(xv) << "</text>\n";

        double yv = m.y_min + t * (m.y_max - m.y_min);
        double sy = m.map_y(yv);
        svg << "      <line x1=\"" << fmt(m.vp_x - tick_len) << "\" y1=\"" << fmt(sy) << "\" x2=\""
            << fmt(m.vp_x) << "\" y2=\"" << fmt(sy) << "\" stroke=\"#000\" stroke-width=\"1\"/>\n";
        svg << "      <text x=\"" << fmt(m.vp_x - tick_len - 3.0) << "\" y=\"" << fmt(sy + 3.5)
            << "\" text-anchor=\"end\">" << fmt(yv) << "</text>\n";
    }
    svg << "    </g>\n";
}

// Emit axis labels and title
void emit_labels(std::ostringstream& svg,
                 const std::string&  title,
                 const std::string&  xlabel,
                 const std::string&  ylabel,
                 const DataToSvg&    m)
{
    double cx = m.vp_x + m.vp_w * 0.5;
    svg << "    <text x=\"" << fmt(cx) << "\" y=\"" << fmt(m.vp_y - 10.0)
        << "\" text-anchor=\"middle\" font-family=\"sans-serif\" font-size=\"14\" "
           "font-weight=\"bold\" fill=\"#000\">"
        << xml_escape(title) << "</text>\n";

    svg << "    <text x=\"" << fmt(cx) << "\" y=\"" << fmt(m.vp_y + m.vp_h + 35.0)
        << "\" text-anchor=\"middle\" font-family=\"sans-serif\" font-size=\"12\" fill=\"#333\">"
        << xml_escape(xlabel) << "</text>\n";

    double cy = m.vp_y + m.vp_h * 0.5;
    double lx = m.vp_x - 45.0;
    svg << "    <text x=\"" << fmt(lx) << "\" y=\"" << fmt(cy)
        << "\" text-anchor=\"middle\" font-family=\"sans-serif\" font-size=\"12\" fill=\"#333\" "
           "transform=\"rotate(-90,"
        << fmt(lx) << "," << fmt(cy) << ")\">" << xml_escape(ylabel) << "</text>\n";
}

}   // anonymous namespace

// ─── SvgPopulationPlot ──────────────────────────────────────────────────────

SvgPopulationPlot::SvgPopulationPlot(const GateHierarchy&    hierarchy,
                                     const EvaluationResult& result,
                                     NodeId                  node)
    : hierarchy_(hierarchy), result_(result), node_(node)
{
    const auto& gate = hierarchy_.node(node_).gate;
    if (!gate || gate->is_range())
        throw std::invalid_argument("SvgPopulationPlot: population '"
                                    + hierarchy_.display_name(node_) + "' has no 2-D gate to draw");
}

std::string SvgPopulationPlot::to_string() const
{
    const GateNode& node = hierarchy_.node(node_);
    const Gate&     gate = *node.gate;

    const auto xs = result_.display_column(gate.x_channel);
    const auto ys = result_.display_column(gate.y_channel);
    const Mask& members = result_.membership(node_).mask;
    const Mask* parent = node.parent == INVALID_NODE ? nullptr : &result_.membership(node.parent).mask;

    // Candidate rows: the parent population (everything for the root).
    std::vector<size_t> rows;
    for (size_t i = 0; i < xs.size(); ++i)
    {
        if (!parent || (*parent)[i])
            rows.push_back(i);
    }
    size_t stride = 1;
    if (style_.max_points > 0 && rows.size() > style_.max_points)
        stride = (rows.size() + style_.max_points - 1) / style_.max_points;

    const auto outline = gate_outline(gate.shape);

    Extent ex, ey;
    for (size_t k = 0; k < rows.size(); k += stride)
    {
        ex.add(xs[rows[k]]);
        ey.add(ys[rows[k]]);
    }
    for (const auto& v : outline)
    {
        ex.add(v.x);
        ey.add(v.y);
    }
    ex.pad();
    ey.pad();

    const double w = style_.width;
    const double h = style_.height;

    DataToSvg m;
    m.vp_x  = 70.0;
    m.vp_y  = 40.0;
    m.vp_w  = w - 90.0;
    m.vp_h  = h - 100.0;
    m.x_min = ex.min;
    m.x_max = ex.max;
    m.y_min = ey.min;
    m.y_max = ey.max;

    std::ostringstream svg;
    svg << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
    svg << "<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"" << style_.width << "\" height=\""
        << style_.height << "\" viewBox=\"0 0 " << style_.width << " " << style_.height << "\">\n";
    svg << "  <rect width=\"100%\" height=\"100%\" fill=\"white\"/>\n";

    svg << "  <g class=\"axes\">\n";
    svg << "    <defs>\n";
    svg << "      <clipPath id=\"plot-area\">\n";
    svg << "        <rect x=\"" << fmt(m.vp_x) << "\" y=\"" << fmt(m.vp_y) << "\" width=\""
        << fmt(m.vp_w) << "\" height=\"" << fmt(m.vp_h) << "\"/>\n";
    svg << "      </clipPath>\n";
    svg << "    </defs>\n";

    emit_border(svg, m);

    svg << "    <g clip-path=\"url(#plot-area)\">\n";

    // Events: non-members grey, members coloured
    for (int pass = 0; pass < 2; ++pass)
    {
        const bool member_pass = pass == 1;
        svg << "      <g class=\"" << (member_pass ? "members" : "parent") << "\" fill=\""
            << (member_pass ? MEMBER_COLOR : PARENT_COLOR) << "\">\n";
        for (size_t k = 0; k < rows.size(); k += stride)
        {
            const size_t i = rows[k];
            if ((members[i] != 0) != member_pass)
                continue;
            if (!std::isfinite(xs[i]) || !std::isfinite(ys[i]))
                continue;
            svg << "        <circle cx=\"" << fmt(m.map_x(xs[i])) << "\" cy=\"" << fmt(m.map_y(ys[i]))
                << "\" r=\"" << fmt(style_.point_radius) << "\"/>\n";
        }
        svg << "      </g>\n";
    }

    // Gate outline
    svg << "      <polygon class=\"gate\" fill=\"none\" stroke=\"" << GATE_COLOR
        << "\" stroke-width=\"1.5\" points=\"";
    for (size_t i = 0; i < outline.size(); ++i)
    {
        if (i > 0)
            svg << " ";
        svg << fmt(m.map_x(outline[i].x)) << "," << fmt(m.map_y(outline[i].y));
    }
    svg << "\"/>\n";

    // Index-sort overlay
    if (overlay_ && !overlay_->points.empty())
    {
        svg << "      <g class=\"overlay\" fill=\"" << OVERLAY_COLOR
            << "\" font-family=\"sans-serif\" font-size=\"9\">\n";
        for (const auto& p : overlay_->points)
        {
            const double px = m.map_x(p.x);
            const double py = m.map_y(p.y);
            svg << "        <circle cx=\"" << fmt(px) << "\" cy=\"" << fmt(py) << "\" r=\"3\"/>\n";
            if (overlay_->has_labels && !p.label.empty())
                svg << "        <text x=\"" << fmt(px + 4.0) << "\" y=\"" << fmt(py - 4.0) << "\">"
                    << xml_escape(p.label) << "</text>\n";
        }
        svg << "      </g>\n";
    }

    svg << "    </g>\n";

    emit_ticks(svg, m);

    std::string title;
    for (const auto& part : hierarchy_.path(node_))
        title += (title.empty() ? "" : " / ") + part;
    char counts[64];
    std::snprintf(counts, sizeof(counts), " (%zu events)", result_.count(node_));
    emit_labels(svg, title + counts, gate.x_channel, gate.y_channel, m);

    svg << "  </g>\n";
    svg << "</svg>\n";
    return svg.str();
}

bool SvgPopulationPlot::write_svg(const std::string& path) const
{
    std::string content = to_string();

    std::ofstream file(path);
    if (!file.is_open())
    {
        FACSFORGE_LOG_ERROR("export", "cannot open '{}' for writing", path);
        return false;
    }

    file << content;
    return file.good();
}

}   // namespace facsforge
