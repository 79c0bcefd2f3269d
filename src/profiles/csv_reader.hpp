/**
 * ============================================================================
 * SOFTWARE: Tally: Statement Ingestion Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: csv_reader.hpp
 * ============================================================================
 */

#ifndef TALLY_CSV_READER_HPP
#define TALLY_CSV_READER_HPP

#include <string>
#include <vector>

namespace tally {
namespace profiles {

    struct CsvRow {
        size_t line = 0;                 // 1-based physical line where the record starts
        std::vector<std::string> fields;
    };

    struct CsvTable {
        char delimiter = ',';
        std::vector<std::string> header;
        std::vector<CsvRow> rows;
    };

    /**
     * @brief Parses delimited text with RFC 4180 quoting.
     * A leading UTF-8 byte-order mark is skipped, CRLF and LF both end a
     * record, and records whose fields are all blank are dropped.
     * @param delimiter 0 = sniff from the header line (',', ';' or '\t').
     */
    CsvTable parse_csv(const std::string& text, char delimiter = 0);

    /**
     * @brief Reads a whole file. Throws FileError(Unreadable) when the file
     * cannot be opened or read.
     */
    std::string read_file(const std::string& path);

    // Delimiter implied by the file extension, 0 when it should be sniffed.
    char delimiter_for_path(const std::string& path);

} // namespace profiles
} // namespace tally

#endif // TALLY_CSV_READER_HPP
