#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace facsforge
{

// Lightweight delimited-text reader.
// Supports comma, semicolon, and tab delimiters (detected from the header
// line) and double-quoted fields. Cells are kept as trimmed text.
struct CsvTable
{
    std::vector<std::string>              headers;
    std::vector<std::vector<std::string>> rows;   // row-major, padded to headers.size()
    size_t                                preamble_lines = 0;   // lines skipped before the header
    char                                  delimiter = ',';
    std::string                           error;   // Non-empty on failure
};

// When header_prefix is non-empty the header is the first line starting with
// it (instrument exports put free-form metadata above the table); if no line
// matches, or the prefix is empty, the first non-empty line is the header.
CsvTable parse_csv_text(const std::string& text, std::string_view header_prefix = {});

// Read and parse a file from disk.
CsvTable read_csv_file(const std::string& path, std::string_view header_prefix = {});

// Strict numeric parse: the whole (trimmed) cell must be a number.
bool try_parse_double(const std::string& s, double& out);

}   // namespace facsforge
