/**
 * ============================================================================
 * SOFTWARE: Tally: Statement Ingestion Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: mapper.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Translates one raw export row into a canonical TransactionDraft using the
 * data in its BankProfile. Stateless: a row never depends on another row.
 * ============================================================================
 */

#ifndef TALLY_MAPPER_HPP
#define TALLY_MAPPER_HPP

#include <map>
#include <optional>
#include <string>
#include <vector>
#include "bank_profile.hpp"
#include "csv_reader.hpp"
#include "core/model.hpp"

namespace tally {
namespace profiles {

    /**
     * @brief Column positions of one file's header, keyed by normalized name.
     */
    class HeaderIndex {
    public:
        explicit HeaderIndex(const std::vector<std::string>& header);

        // Position of the column, or std::nullopt when the header lacks it.
        std::optional<size_t> position(const std::string& column) const;

    private:
        std::map<std::string, size_t> positions_;
    };

    struct MapResult {
        std::optional<TransactionDraft> draft;
        std::optional<RowError> error;

        bool ok() const { return draft.has_value(); }
    };

    /**
     * @brief Maps a row. On failure the result carries a Mapping RowError
     * (missing_column, bad_date or bad_amount) and no draft.
     * The draft's account is referenced by name; fingerprint and account id
     * are filled in later by the pipeline.
     */
    MapResult map_row(const CsvRow& row, const HeaderIndex& index, const BankProfile& profile);

    // Tries each strptime pattern; the whole trimmed value must be consumed.
    std::optional<Date> parse_date(const std::string& value, const std::vector<std::string>& formats);

} // namespace profiles
} // namespace tally

#endif // TALLY_MAPPER_HPP
