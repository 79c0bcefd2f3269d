/**
 * ============================================================================
 * SOFTWARE: Tally: Statement Ingestion Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: csv_reader.cpp
 * ============================================================================
 */

#include "csv_reader.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace tally {
namespace profiles {

namespace {

const std::string kUtf8Bom = "\xEF\xBB\xBF";

char sniff_delimiter(const std::string& text, size_t start) {
    size_t counts[3] = {0, 0, 0};
    const char candidates[3] = {',', ';', '\t'};
    bool quoted = false;
    for (size_t i = start; i < text.size(); ++i) {
        char c = text[i];
        if (c == '"') quoted = !quoted;
        if (!quoted && (c == '\n' || c == '\r')) break;
        if (quoted) continue;
        for (int k = 0; k < 3; ++k) {
            if (c == candidates[k]) counts[k]++;
        }
    }
    int best = 0;
    for (int k = 1; k < 3; ++k) {
        if (counts[k] > counts[best]) best = k;
    }
    return candidates[best];
}

bool all_blank(const std::vector<std::string>& fields) {
    return std::all_of(fields.begin(), fields.end(), [](const std::string& f) {
        return std::all_of(f.begin(), f.end(), [](unsigned char c) { return std::isspace(c) != 0; });
    });
}

} // namespace

CsvTable parse_csv(const std::string& text, char delimiter) {
    CsvTable table;
    size_t pos = text.compare(0, kUtf8Bom.size(), kUtf8Bom) == 0 ? kUtf8Bom.size() : 0;
    table.delimiter = delimiter ? delimiter : sniff_delimiter(text, pos);

    std::vector<std::vector<std::string>> records;
    std::vector<size_t> record_lines;

    std::vector<std::string> fields;
    std::string field;
    bool quoted = false;
    bool in_record = false;
    size_t line = 1;
    size_t record_line = 1;

    auto end_record = [&]() {
        fields.push_back(field);
        field.clear();
        if (!all_blank(fields)) {
            records.push_back(fields);
            record_lines.push_back(record_line);
        }
        fields.clear();
        in_record = false;
    };

    for (; pos < text.size(); ++pos) {
        char c = text[pos];
        if (!in_record) {
            in_record = true;
            record_line = line;
        }
        if (quoted) {
            if (c == '"') {
                if (pos + 1 < text.size() && text[pos + 1] == '"') {
                    field.push_back('"');
                    ++pos;
                } else {
                    quoted = false;
                }
            } else {
                if (c == '\n') ++line;
                field.push_back(c);
            }
            continue;
        }
        if (c == '"') {
            quoted = true;
        } else if (c == table.delimiter) {
            fields.push_back(field);
            field.clear();
        } else if (c == '\r') {
            if (pos + 1 < text.size() && text[pos + 1] == '\n') ++pos;
            end_record();
            ++line;
        } else if (c == '\n') {
            end_record();
            ++line;
        } else {
            field.push_back(c);
        }
    }
    if (in_record) end_record();

    if (records.empty()) return table;

    table.header = records.front();
    for (size_t i = 1; i < records.size(); ++i) {
        CsvRow row;
        row.line = record_lines[i];
        row.fields = std::move(records[i]);
        table.rows.push_back(std::move(row));
    }
    return table;
}

std::string read_file(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        throw FileError(FileError::Reason::Unreadable, "File not found or not a regular file: " + path);
    }
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw FileError(FileError::Reason::Unreadable, "Failed to open " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw FileError(FileError::Reason::Unreadable, "Read error on " + path);
    }
    return buffer.str();
}

char delimiter_for_path(const std::string& path) {
    std::string ext = std::filesystem::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return std::tolower(c); });
    return ext == ".tsv" ? '\t' : 0;
}

} // namespace profiles
} // namespace tally
