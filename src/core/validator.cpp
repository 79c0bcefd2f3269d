/**
 * ============================================================================
 * SOFTWARE: Tally: Statement Ingestion Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: validator.cpp
 * ============================================================================
 * * DESCRIPTION:
 * Structural and semantic checks on a canonical draft. A failed check
 * rejects the row only; the file carries on.
 * ============================================================================
 */

#include "validator.hpp"
#include "money.hpp"
#include <algorithm>
#include <cctype>

namespace tally {

namespace {

RowError reject(const TransactionDraft& draft, RowErrorCode code, const std::string& detail) {
    return RowError{draft.line, code, detail};
}

} // namespace

DraftValidator::DraftValidator(const ValidationConfig& config, const Date& today)
    : config_(config), today_(today) {}

std::optional<RowError> DraftValidator::validate(const TransactionDraft& draft) const {
    if (!draft.posted.is_valid()) {
        return reject(draft, RowErrorCode::DateOutOfRange,
                      "date " + draft.posted.to_iso() + " is not a calendar date");
    }
    if (draft.posted.year < config_.earliest_year) {
        return reject(draft, RowErrorCode::DateOutOfRange,
                      "date " + draft.posted.to_iso() + " is before " + std::to_string(config_.earliest_year));
    }

    Date latest = Date::from_days(today_.to_days() + config_.future_tolerance_days);
    if (latest < draft.posted) {
        return reject(draft, RowErrorCode::FutureDate, "date " + draft.posted.to_iso() + " is in the future");
    }

    if (draft.amount == 0) {
        return reject(draft, RowErrorCode::ZeroAmount, "amount is zero");
    }

    money_micro magnitude = draft.amount < 0 ? -draft.amount : draft.amount;
    if (magnitude > config_.max_abs_amount) {
        return reject(draft, RowErrorCode::AmountTooLarge,
                      "amount " + format_money(draft.amount) + " exceeds " + format_money(config_.max_abs_amount));
    }

    bool blank = std::all_of(draft.description.begin(), draft.description.end(),
                             [](unsigned char c) { return std::isspace(c) != 0; });
    if (blank) {
        return reject(draft, RowErrorCode::EmptyDescription, "description is empty");
    }

    if (draft.account_id == 0 && !draft.new_account) {
        return reject(draft, RowErrorCode::UnknownAccount, "unknown account '" + draft.account_name + "'");
    }

    return std::nullopt;
}

} // namespace tally
