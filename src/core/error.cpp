#include <facsforge/error.hpp>

namespace facsforge
{

const char* error_kind_name(ErrorKind kind)
{
    switch (kind)
    {
        case ErrorKind::Import:
            return "ImportError";
        case ErrorKind::UnsupportedFormat:
            return "UnsupportedFormatError";
        case ErrorKind::TransformParameter:
            return "TransformParameterError";
        case ErrorKind::ChannelNotFound:
            return "ChannelNotFoundError";
        case ErrorKind::SchemaValidation:
            return "SchemaValidationError";
        case ErrorKind::Io:
            return "IoError";
    }
    return "Error";
}

std::string SchemaValidationError::join(const std::vector<std::string>& violations)
{
    std::string out = "configuration does not match schema";
    if (violations.empty())
        return out;
    out += ":";
    for (const auto& v : violations)
    {
        out += "\n  ";
        out += v;
    }
    return out;
}

}   // namespace facsforge
