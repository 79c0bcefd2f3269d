/**
 * ============================================================================
 * SOFTWARE: Tally: Statement Ingestion Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: mapper.cpp
 * ============================================================================
 */

#include "mapper.hpp"
#include "ProfileRegistry.hpp"
#include "core/money.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>

namespace tally {
namespace profiles {

namespace {

std::string trim(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(begin, end - begin);
}

MapResult fail(size_t line, RowErrorCode code, const std::string& detail) {
    MapResult result;
    result.error = RowError{line, code, detail};
    return result;
}

// Looks up a column the row must provide.
// Returns false when the header lacks it or the row is too short.
bool required_field(const CsvRow& row, const HeaderIndex& index,
                    const std::string& column, std::string& out) {
    auto pos = index.position(column);
    if (!pos || *pos >= row.fields.size()) return false;
    out = trim(row.fields[*pos]);
    return true;
}

std::string optional_field(const CsvRow& row, const HeaderIndex& index, const std::string& column) {
    if (column.empty()) return std::string();
    auto pos = index.position(column);
    if (!pos || *pos >= row.fields.size()) return std::string();
    return trim(row.fields[*pos]);
}

money_micro magnitude(money_micro v) {
    return v < 0 ? -v : v;
}

} // namespace

HeaderIndex::HeaderIndex(const std::vector<std::string>& header) {
    for (size_t i = 0; i < header.size(); ++i) {
        // First occurrence wins on repeated header names.
        positions_.emplace(normalize_header(header[i]), i);
    }
}

std::optional<size_t> HeaderIndex::position(const std::string& column) const {
    auto it = positions_.find(normalize_header(column));
    if (it == positions_.end()) return std::nullopt;
    return it->second;
}

std::optional<Date> parse_date(const std::string& value, const std::vector<std::string>& formats) {
    std::string text = trim(value);
    if (text.empty()) return std::nullopt;

    for (const auto& format : formats) {
        std::tm tm{};
        const char* end = strptime(text.c_str(), format.c_str(), &tm);
        if (end == nullptr || *end != '\0') continue;

        Date d;
        d.year = tm.tm_year + 1900;
        d.month = tm.tm_mon + 1;
        d.day = tm.tm_mday;
        if (d.is_valid()) return d;
    }
    return std::nullopt;
}

MapResult map_row(const CsvRow& row, const HeaderIndex& index, const BankProfile& profile) {
    const ColumnMap& cols = profile.columns;

    std::string date_text;
    if (!required_field(row, index, cols.date, date_text)) {
        return fail(row.line, RowErrorCode::MissingColumn, "missing column '" + cols.date + "'");
    }
    std::string description;
    if (!required_field(row, index, cols.description, description)) {
        return fail(row.line, RowErrorCode::MissingColumn, "missing column '" + cols.description + "'");
    }

    auto posted = parse_date(date_text, profile.date_formats);
    if (!posted) {
        return fail(row.line, RowErrorCode::BadDate, "unparseable date '" + date_text + "'");
    }

    money_micro amount = 0;
    switch (profile.sign) {
    case SignConvention::Signed: {
        std::string text;
        if (!required_field(row, index, cols.amount, text)) {
            return fail(row.line, RowErrorCode::MissingColumn, "missing column '" + cols.amount + "'");
        }
        auto parsed = parse_money(text, profile.decimal_separator);
        if (!parsed) return fail(row.line, RowErrorCode::BadAmount, "unparseable amount '" + text + "'");
        amount = *parsed;
        break;
    }
    case SignConvention::DebitCredit: {
        std::string debit_text;
        std::string credit_text;
        if (!required_field(row, index, cols.debit, debit_text)) {
            return fail(row.line, RowErrorCode::MissingColumn, "missing column '" + cols.debit + "'");
        }
        if (!required_field(row, index, cols.credit, credit_text)) {
            return fail(row.line, RowErrorCode::MissingColumn, "missing column '" + cols.credit + "'");
        }
        if (debit_text.empty() && credit_text.empty()) {
            return fail(row.line, RowErrorCode::BadAmount, "both debit and credit are empty");
        }
        std::optional<money_micro> debit;
        std::optional<money_micro> credit;
        if (!debit_text.empty()) {
            debit = parse_money(debit_text, profile.decimal_separator);
            if (!debit) return fail(row.line, RowErrorCode::BadAmount, "unparseable debit '" + debit_text + "'");
        }
        if (!credit_text.empty()) {
            credit = parse_money(credit_text, profile.decimal_separator);
            if (!credit) return fail(row.line, RowErrorCode::BadAmount, "unparseable credit '" + credit_text + "'");
        }
        if (debit && *debit != 0) {
            amount = -magnitude(*debit);
        } else if (credit) {
            amount = magnitude(*credit);
        }
        break;
    }
    case SignConvention::TypeColumn: {
        std::string text;
        std::string type;
        if (!required_field(row, index, cols.amount, text)) {
            return fail(row.line, RowErrorCode::MissingColumn, "missing column '" + cols.amount + "'");
        }
        if (!required_field(row, index, cols.type, type)) {
            return fail(row.line, RowErrorCode::MissingColumn, "missing column '" + cols.type + "'");
        }
        auto parsed = parse_money(text, profile.decimal_separator);
        if (!parsed) return fail(row.line, RowErrorCode::BadAmount, "unparseable amount '" + text + "'");

        std::string type_key = normalize_header(type);
        bool is_debit = std::any_of(profile.debit_types.begin(), profile.debit_types.end(),
                                    [&](const std::string& t) { return normalize_header(t) == type_key; });
        // Other types (fees, adjustments, returns) keep the sign the bank printed.
        amount = is_debit ? -magnitude(*parsed) : *parsed;
        break;
    }
    }

    if (profile.combine_memo) {
        std::string memo = optional_field(row, index, cols.memo);
        if (!memo.empty() && memo != description) {
            description = description + " - " + memo;
        }
    }

    TransactionDraft draft;
    draft.line = row.line;
    draft.posted = *posted;
    draft.amount = amount;
    draft.description = description;

    std::string category = optional_field(row, index, cols.category);
    if (!category.empty()) draft.category = category;

    std::string account = optional_field(row, index, cols.account);
    draft.account_name = account.empty() ? profile.account_name : account;

    MapResult result;
    result.draft = std::move(draft);
    return result;
}

} // namespace profiles
} // namespace tally
