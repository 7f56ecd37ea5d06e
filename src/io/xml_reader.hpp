#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace facsforge
{

// Minimal XML DOM for workspace documents. Elements, attributes, character
// data and CDATA are kept; comments, processing instructions and DOCTYPE are
// skipped. Namespaces are not resolved: lookups match on the local name
// (the part after the prefix), so "gating:vertex" and "vertex" are the same.
struct XmlElement
{
    std::string                                      name;   // as written, prefix included
    std::vector<std::pair<std::string, std::string>> attributes;
    std::string                                      text;   // concatenated character data
    std::vector<XmlElement>                          children;
    size_t                                           line = 0;

    std::string_view local_name() const;

    // Attribute by local name; nullptr when absent.
    const std::string* attribute(std::string_view local) const;

    // First direct child by local name; nullptr when absent.
    const XmlElement* child(std::string_view local) const;

    // Direct children by local name, document order.
    std::vector<const XmlElement*> children_named(std::string_view local) const;

    // First descendant (pre-order, excluding this) by local name.
    const XmlElement* find_first(std::string_view local) const;

    // All descendants (pre-order, excluding this) by local name.
    std::vector<const XmlElement*> find_all(std::string_view local) const;
};

// Strip a "prefix:" if present.
std::string_view xml_local_name(std::string_view qualified);

// Parse a complete document. Throws ImportError ("line N: ...") when the
// text is not well-formed.
XmlElement parse_xml(std::string_view text);

}   // namespace facsforge
