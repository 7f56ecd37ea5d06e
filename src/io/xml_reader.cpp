#include "xml_reader.hpp"

#include <facsforge/error.hpp>

#include <algorithm>
#include <cstdint>
#include <cstdlib>

namespace facsforge
{

std::string_view xml_local_name(std::string_view qualified)
{
    auto colon = qualified.rfind(':');
    return colon == std::string_view::npos ? qualified : qualified.substr(colon + 1);
}

// ─── XmlElement queries ─────────────────────────────────────────────────────

std::string_view XmlElement::local_name() const
{
    return xml_local_name(name);
}

const std::string* XmlElement::attribute(std::string_view local) const
{
    for (const auto& [key, value] : attributes)
    {
        if (xml_local_name(key) == local)
            return &value;
    }
    return nullptr;
}

const XmlElement* XmlElement::child(std::string_view local) const
{
    for (const auto& c : children)
    {
        if (c.local_name() == local)
            return &c;
    }
    return nullptr;
}

std::vector<const XmlElement*> XmlElement::children_named(std::string_view local) const
{
    std::vector<const XmlElement*> out;
    for (const auto& c : children)
    {
        if (c.local_name() == local)
            out.push_back(&c);
    }
    return out;
}

const XmlElement* XmlElement::find_first(std::string_view local) const
{
    for (const auto& c : children)
    {
        if (c.local_name() == local)
            return &c;
        if (const auto* hit = c.find_first(local))
            return hit;
    }
    return nullptr;
}

std::vector<const XmlElement*> XmlElement::find_all(std::string_view local) const
{
    std::vector<const XmlElement*> out;
    std::vector<const XmlElement*> stack;
    for (auto it = children.rbegin(); it != children.rend(); ++it)
        stack.push_back(&*it);
    while (!stack.empty())
    {
        const XmlElement* e = stack.back();
        stack.pop_back();
        if (e->local_name() == local)
            out.push_back(e);
        for (auto it = e->children.rbegin(); it != e->children.rend(); ++it)
            stack.push_back(&*it);
    }
    return out;
}

// ─── Parser ─────────────────────────────────────────────────────────────────

namespace
{

// Nesting beyond this is treated as malformed input.
constexpr size_t MAX_DEPTH = 512;

bool is_name_start(char c)
{
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || c == '_' || c == ':'
           || static_cast<unsigned char>(c) >= 0x80;
}

bool is_name_char(char c)
{
    return is_name_start(c) || (c >= '0' && c <= '9') || c == '-' || c == '.';
}

bool is_space(char c)
{
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

void append_utf8(std::string& out, uint32_t cp)
{
    if (cp < 0x80)
        out += static_cast<char>(cp);
    else if (cp < 0x800)
    {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
    else if (cp < 0x10000)
    {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
    else
    {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

class XmlParser
{
   public:
    explicit XmlParser(std::string_view text) : s_(text) {}

    XmlElement parse_document()
    {
        // UTF-8 byte order mark
        if (s_.substr(0, 3) == "\xEF\xBB\xBF")
            pos_ = 3;

        skip_misc();
        if (at_end() || peek() != '<')
            fail("expected a root element");

        XmlElement root;
        parse_element(root, 0);

        skip_misc();
        if (!at_end())
            fail("unexpected content after the root element");
        return root;
    }

   private:
    [[noreturn]] void fail(const std::string& what) const
    {
        throw ImportError("malformed XML at line " + std::to_string(line_at(pos_)) + ": " + what);
    }

    // Line of `pos`. Positions are queried in increasing order while parsing,
    // so newlines are counted from the last queried position onwards.
    size_t line_at(size_t pos) const
    {
        pos = std::min(pos, s_.size());
        if (pos < line_pos_)
        {
            line_pos_ = 0;
            line_     = 1;
        }
        line_ += static_cast<size_t>(std::count(s_.begin() + static_cast<std::ptrdiff_t>(line_pos_),
                                                s_.begin() + static_cast<std::ptrdiff_t>(pos), '\n'));
        line_pos_ = pos;
        return line_;
    }

    bool at_end() const { return pos_ >= s_.size(); }
    char peek() const { return s_[pos_]; }
    bool starts_with(std::string_view tok) const { return s_.substr(pos_, tok.size()) == tok; }

    void skip_space()
    {
        while (!at_end() && is_space(peek()))
            ++pos_;
    }

    void expect(std::string_view tok)
    {
        if (!starts_with(tok))
            fail("expected '" + std::string(tok) + "'");
        pos_ += tok.size();
    }

    // Advance past the next occurrence of `terminator`.
    void skip_past(std::string_view terminator, const char* what)
    {
        auto end = s_.find(terminator, pos_);
        if (end == std::string_view::npos)
            fail(std::string("unterminated ") + what);
        pos_ = end + terminator.size();
    }

    // Whitespace, comments, processing instructions and DOCTYPE outside the root.
    void skip_misc()
    {
        for (;;)
        {
            skip_space();
            if (starts_with("<?"))
                skip_past("?>", "processing instruction");
            else if (starts_with("<!--"))
                skip_past("-->", "comment");
            else if (starts_with("<!DOCTYPE"))
                skip_doctype();
            else
                return;
        }
    }

    void skip_doctype()
    {
        int bracket = 0;
        for (; !at_end(); ++pos_)
        {
            char c = peek();
            if (c == '[')
                ++bracket;
            else if (c == ']')
                --bracket;
            else if (c == '>' && bracket <= 0)
            {
                ++pos_;
                return;
            }
        }
        fail("unterminated DOCTYPE");
    }

    std::string parse_name()
    {
        if (at_end() || !is_name_start(peek()))
            fail("expected a name");
        size_t start = pos_;
        while (!at_end() && is_name_char(peek()))
            ++pos_;
        return std::string(s_.substr(start, pos_ - start));
    }

    // Decode one entity starting at '&'.
    void parse_reference(std::string& out)
    {
        auto semi = s_.find(';', pos_);
        if (semi == std::string_view::npos || semi - pos_ > 12)
            fail("unterminated entity reference");
        std::string_view ent = s_.substr(pos_ + 1, semi - pos_ - 1);

        if (ent == "lt")
            out += '<';
        else if (ent == "gt")
            out += '>';
        else if (ent == "amp")
            out += '&';
        else if (ent == "quot")
            out += '"';
        else if (ent == "apos")
            out += '\'';
        else if (!ent.empty() && ent[0] == '#')
        {
            std::string digits(ent.substr(1));
            int base = 10;
            if (!digits.empty() && (digits[0] == 'x' || digits[0] == 'X'))
            {
                base = 16;
                digits.erase(0, 1);
            }
            char* end = nullptr;
            unsigned long cp = std::strtoul(digits.c_str(), &end, base);
            if (digits.empty() || *end != '\0' || cp == 0 || cp > 0x10FFFF)
                fail("bad character reference '&" + std::string(ent) + ";'");
            append_utf8(out, static_cast<uint32_t>(cp));
        }
        else
            fail("unknown entity '&" + std::string(ent) + ";'");

        pos_ = semi + 1;
    }

    std::string parse_attribute_value()
    {
        if (at_end() || (peek() != '"' && peek() != '\''))
            fail("expected a quoted attribute value");
        const char quote = peek();
        ++pos_;
        std::string value;
        while (!at_end() && peek() != quote)
        {
            if (peek() == '<')
                fail("'<' in attribute value");
            if (peek() == '&')
                parse_reference(value);
            else
                value += s_[pos_++];
        }
        if (at_end())
            fail("unterminated attribute value");
        ++pos_;
        return value;
    }

    void parse_element(XmlElement& elem, size_t depth)
    {
        if (depth > MAX_DEPTH)
            fail("elements nested too deeply");

        elem.line = line_at(pos_);
        expect("<");
        elem.name = parse_name();

        // Attributes
        for (;;)
        {
            bool had_space = !at_end() && is_space(peek());
            skip_space();
            if (at_end())
                fail("unterminated start tag <" + elem.name + ">");
            if (starts_with("/>"))
            {
                pos_ += 2;
                return;
            }
            if (peek() == '>')
            {
                ++pos_;
                break;
            }
            if (!had_space)
                fail("expected whitespace before attribute in <" + elem.name + ">");
            std::string key = parse_name();
            skip_space();
            expect("=");
            skip_space();
            std::string value = parse_attribute_value();
            if (std::any_of(elem.attributes.begin(), elem.attributes.end(),
                            [&](const auto& a) { return a.first == key; }))
                fail("duplicate attribute '" + key + "' in <" + elem.name + ">");
            elem.attributes.emplace_back(std::move(key), std::move(value));
        }

        // Content
        for (;;)
        {
            if (at_end())
                fail("missing end tag </" + elem.name + ">");

            if (starts_with("</"))
            {
                pos_ += 2;
                std::string closing = parse_name();
                if (closing != elem.name)
                    fail("mismatched end tag </" + closing + ">, expected </" + elem.name + ">");
                skip_space();
                expect(">");
                return;
            }
            if (starts_with("<!--"))
                skip_past("-->", "comment");
            else if (starts_with("<![CDATA["))
            {
                pos_ += 9;
                auto end = s_.find("]]>", pos_);
                if (end == std::string_view::npos)
                    fail("unterminated CDATA section");
                elem.text.append(s_.substr(pos_, end - pos_));
                pos_ = end + 3;
            }
            else if (starts_with("<?"))
                skip_past("?>", "processing instruction");
            else if (peek() == '<')
            {
                elem.children.emplace_back();
                parse_element(elem.children.back(), depth + 1);
            }
            else if (peek() == '&')
                parse_reference(elem.text);
            else
                elem.text += s_[pos_++];
        }
    }

    std::string_view s_;
    size_t           pos_ = 0;
    mutable size_t   line_pos_ = 0;
    mutable size_t   line_     = 1;
};

}   // namespace

XmlElement parse_xml(std::string_view text)
{
    return XmlParser(text).parse_document();
}

}   // namespace facsforge
