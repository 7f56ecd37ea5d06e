#include <facsforge/transform.hpp>

#include <sstream>
#include <stdexcept>

namespace facsforge
{

LinearTransform::LinearTransform(double display_min, double display_max)
{
    if (!(display_min < display_max))
        throw std::invalid_argument("LinearTransform: display range must satisfy min < max");
    range_ = std::make_pair(display_min, display_max);
}

// ─── ChannelTransform ───────────────────────────────────────────────────────

TransformKind ChannelTransform::kind() const
{
    return std::holds_alternative<LogicleTransform>(impl_) ? TransformKind::Logicle
                                                           : TransformKind::Linear;
}

double ChannelTransform::to_display(double raw) const
{
    return std::visit([raw](const auto& t) { return t.to_display(raw); }, impl_);
}

double ChannelTransform::to_raw(double display) const
{
    return std::visit([display](const auto& t) { return t.to_raw(display); }, impl_);
}

std::vector<double> ChannelTransform::to_display(std::span<const double> raw) const
{
    if (kind() == TransformKind::Linear)
        return {raw.begin(), raw.end()};

    std::vector<double> out(raw.size());
    const auto& logicle = std::get<LogicleTransform>(impl_);
    for (size_t i = 0; i < raw.size(); ++i)
        out[i] = logicle.to_display(raw[i]);
    return out;
}

std::string ChannelTransform::description() const
{
    std::ostringstream os;
    if (const auto* lin = as_linear())
    {
        os << "linear";
        if (lin->has_range())
            os << "[" << lin->range_min() << ", " << lin->range_max() << "]";
    }
    else if (const auto* lg = as_logicle())
    {
        const auto& p = lg->params();
        os << "logicle(T=" << p.T << ", W=" << p.W << ", M=" << p.M << ", A=" << p.A << ")";
    }
    return os.str();
}

// ─── TransformSet ───────────────────────────────────────────────────────────

void TransformSet::set(const std::string& channel, ChannelTransform transform)
{
    transforms_.insert_or_assign(channel, std::move(transform));
}

bool TransformSet::contains(std::string_view channel) const
{
    return transforms_.find(channel) != transforms_.end();
}

const ChannelTransform& TransformSet::get(std::string_view channel) const
{
    static const ChannelTransform identity{LinearTransform{}};
    auto it = transforms_.find(channel);
    return it != transforms_.end() ? it->second : identity;
}

}   // namespace facsforge
