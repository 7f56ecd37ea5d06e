#include "csv_reader.hpp"

#include <facsforge/error.hpp>
#include <facsforge/event_matrix.hpp>
#include <facsforge/logger.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace facsforge
{

namespace
{

// Detect delimiter by scanning the header line.
char detect_delimiter(const std::string& line)
{
    int commas = 0, semicolons = 0, tabs = 0;
    for (char c : line)
    {
        if (c == ',')
            ++commas;
        else if (c == ';')
            ++semicolons;
        else if (c == '\t')
            ++tabs;
    }
    if (tabs > commas && tabs >= semicolons)
        return '\t';
    if (semicolons > commas)
        return ';';
    return ',';
}

std::string trim(const std::string& s)
{
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
        ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
        --e;
    return s.substr(b, e - b);
}

// Split a line by delimiter, respecting quoted fields ("" is a literal quote).
std::vector<std::string> split_line(const std::string& line, char delim)
{
    std::vector<std::string> fields;
    std::string field;
    bool in_quotes = false;

    for (size_t i = 0; i < line.size(); ++i)
    {
        char c = line[i];
        if (c == '"')
        {
            if (in_quotes && i + 1 < line.size() && line[i + 1] == '"')
            {
                field += '"';
                ++i;
            }
            else
            {
                in_quotes = !in_quotes;
            }
        }
        else if (c == delim && !in_quotes)
        {
            fields.push_back(trim(field));
            field.clear();
        }
        else
        {
            field += c;
        }
    }
    fields.push_back(trim(field));
    return fields;
}

bool is_blank(const std::string& line)
{
    return std::all_of(line.begin(), line.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

}   // namespace

bool try_parse_double(const std::string& s, double& out)
{
    if (s.empty())
        return false;
    char* end = nullptr;
    double val = std::strtod(s.c_str(), &end);
    while (end && *end && std::isspace(static_cast<unsigned char>(*end)))
        ++end;
    if (end == s.c_str() || (end && *end != '\0'))
        return false;
    out = val;
    return true;
}

CsvTable parse_csv_text(const std::string& text, std::string_view header_prefix)
{
    CsvTable result;

    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line))
    {
        // Strip trailing \r (Windows line endings)
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        lines.push_back(line);
    }

    size_t header_line = lines.size();
    if (!header_prefix.empty())
    {
        for (size_t i = 0; i < lines.size(); ++i)
        {
            if (std::string_view(lines[i]).starts_with(header_prefix))
            {
                header_line = i;
                break;
            }
        }
    }
    if (header_line == lines.size())
    {
        for (size_t i = 0; i < lines.size(); ++i)
        {
            if (!is_blank(lines[i]))
            {
                header_line = i;
                break;
            }
        }
    }

    if (header_line == lines.size())
    {
        result.error = "File is empty";
        return result;
    }

    result.preamble_lines = header_line;
    result.delimiter = detect_delimiter(lines[header_line]);
    result.headers = split_line(lines[header_line], result.delimiter);

    for (size_t i = header_line + 1; i < lines.size(); ++i)
    {
        if (is_blank(lines[i]))
            continue;
        auto fields = split_line(lines[i], result.delimiter);
        fields.resize(result.headers.size());
        result.rows.push_back(std::move(fields));
    }
    return result;
}

CsvTable read_csv_file(const std::string& path, std::string_view header_prefix)
{
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open())
    {
        CsvTable result;
        result.error = "Cannot open file: " + path;
        return result;
    }
    std::ostringstream buf;
    buf << file.rdbuf();
    return parse_csv_text(buf.str(), header_prefix);
}

// ─── Event matrix loader ────────────────────────────────────────────────────

EventMatrix load_events_csv(const std::string& path)
{
    CsvTable table = read_csv_file(path);
    if (!table.error.empty())
        throw IoError(path + ": " + table.error);

    std::vector<std::vector<double>> columns(table.headers.size());
    for (auto& col : columns)
        col.reserve(table.rows.size());

    for (size_t r = 0; r < table.rows.size(); ++r)
    {
        for (size_t c = 0; c < table.headers.size(); ++c)
        {
            double v = 0.0;
            if (!try_parse_double(table.rows[r][c], v))
                throw IoError(path + ": row " + std::to_string(r + 1) + ", column '"
                              + table.headers[c] + "' is not numeric: '" + table.rows[r][c] + "'");
            columns[c].push_back(v);
        }
    }

    try
    {
        EventMatrix m(table.headers, std::move(columns));
        FACSFORGE_LOG_INFO("io", "loaded {} events x {} channels from {}", m.rows(),
                           m.channel_count(), path);
        return m;
    }
    catch (const std::invalid_argument& e)
    {
        throw IoError(path + ": " + e.what());
    }
}

}   // namespace facsforge
