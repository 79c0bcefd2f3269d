/**
 * ============================================================================
 * SOFTWARE: Tally: Statement Ingestion Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: export.cpp
 * ============================================================================
 */

#include "export.hpp"
#include "money.hpp"
#include <map>
#include <sstream>

namespace tally {

std::string csv_escape(const std::string& field) {
    if (field.find_first_of(",\"\r\n") == std::string::npos) return field;
    std::string quoted = "\"";
    for (char c : field) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

std::string export_transactions(LedgerStore& store, const TransactionFilter& filter) {
    std::map<int64_t, std::string> account_names;
    for (const auto& account : store.list_accounts()) {
        account_names[account.id] = account.name;
    }

    std::ostringstream out;
    out << "Date,Account,Description,Amount,Category\r\n";
    for (const auto& t : store.list_transactions(filter)) {
        auto name = account_names.find(t.account_id);
        out << t.posted.to_iso() << ','
            << csv_escape(name != account_names.end() ? name->second : std::to_string(t.account_id)) << ','
            << csv_escape(t.description) << ','
            << format_money(t.amount) << ','
            << csv_escape(t.category.value_or("")) << "\r\n";
    }
    return out.str();
}

} // namespace tally
