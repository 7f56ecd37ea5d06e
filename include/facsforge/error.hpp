#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace facsforge
{

// Every failure here is fatal to the current analysis run. Callers catch
// facsforge::Error at the process boundary and report kind() + what().
enum class ErrorKind
{
    Import,
    UnsupportedFormat,
    TransformParameter,
    ChannelNotFound,
    SchemaValidation,
    Io,
};

const char* error_kind_name(ErrorKind kind);

class Error : public std::runtime_error
{
   public:
    Error(ErrorKind kind, const std::string& message) : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

   private:
    ErrorKind kind_;
};

// Malformed or internally inconsistent workspace / gate tree.
class ImportError : public Error
{
   public:
    explicit ImportError(const std::string& message) : Error(ErrorKind::Import, message) {}
};

// Recognized input that this build deliberately does not read (FlowJo v10).
class UnsupportedFormatError : public Error
{
   public:
    explicit UnsupportedFormatError(const std::string& message)
        : Error(ErrorKind::UnsupportedFormat, message)
    {
    }
};

class TransformParameterError : public Error
{
   public:
    explicit TransformParameterError(const std::string& message)
        : Error(ErrorKind::TransformParameter, message)
    {
    }
};

class ChannelNotFoundError : public Error
{
   public:
    ChannelNotFoundError(const std::string& channel, const std::string& context)
        : Error(ErrorKind::ChannelNotFound,
                "channel '" + channel + "' not found" + (context.empty() ? "" : " (" + context + ")")),
          channel_(channel)
    {
    }

    const std::string& channel() const noexcept { return channel_; }

   private:
    std::string channel_;
};

class SchemaValidationError : public Error
{
   public:
    explicit SchemaValidationError(std::vector<std::string> violations)
        : Error(ErrorKind::SchemaValidation, join(violations)), violations_(std::move(violations))
    {
    }

    const std::vector<std::string>& violations() const noexcept { return violations_; }

   private:
    static std::string join(const std::vector<std::string>& violations);

    std::vector<std::string> violations_;
};

class IoError : public Error
{
   public:
    explicit IoError(const std::string& message) : Error(ErrorKind::Io, message) {}
};

}   // namespace facsforge
