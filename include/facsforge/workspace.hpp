#pragma once

#include <facsforge/channel.hpp>
#include <facsforge/hierarchy.hpp>
#include <facsforge/transform.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace facsforge
{

// Everything a FlowJo workspace contributes to an analysis. Gate vertices in
// `hierarchy` are already in display units of `transforms`.
struct WorkspaceImport
{
    std::string                source;            // file path or "<memory>"
    std::vector<Channel>       channels;          // declared order
    TransformSet               transforms;        // only channels that declare one
    GateHierarchy              hierarchy;         // ungated "All Events" root
    std::optional<std::string> compensation_ref;  // opaque, passed through
};

// Name of the synthetic root every imported tree hangs from.
inline constexpr const char* WORKSPACE_ROOT_NAME = "All Events";

// True for v10 archives and XML declaring a v10 workspace.
bool is_flowjo10_workspace(std::string_view content);

// Translate a FlowJo v9 workspace document. Nothing is returned unless the
// whole tree is valid.
//   ImportError             malformed XML, unsupported gate kind, <3 vertices,
//                           inconsistent gating:id/parent_id linkage
//   ChannelNotFoundError    a gate uses a channel no <Parameter> declares
//   TransformParameterError invalid logicle declaration
//   UnsupportedFormatError  the document is a v10 workspace
WorkspaceImport import_flowjo9_text(std::string_view xml, const std::string& source = "<memory>");

// Reads the file, then import_flowjo9_text(). IoError when unreadable.
WorkspaceImport import_flowjo9_file(const std::string& path);

// v10 (.wsp archive) import is not implemented; always throws
// UnsupportedFormatError.
[[noreturn]] void import_flowjo10(const std::string& path);

}   // namespace facsforge
