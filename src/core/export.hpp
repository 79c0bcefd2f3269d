/**
 * ============================================================================
 * SOFTWARE: Tally: Statement Ingestion Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: export.hpp
 * ============================================================================
 */

#ifndef TALLY_EXPORT_HPP
#define TALLY_EXPORT_HPP

#include <string>
#include "store.hpp"

namespace tally {

    /**
     * @brief Renders the filtered transactions as CSV with the header
     * Date,Account,Description,Amount,Category, in list_transactions order.
     * Amounts are signed decimals; unknown account ids export as their number.
     */
    std::string export_transactions(LedgerStore& store, const TransactionFilter& filter);

    // Quotes a CSV field when it contains a delimiter, quote or line break.
    std::string csv_escape(const std::string& field);

} // namespace tally

#endif // TALLY_EXPORT_HPP
