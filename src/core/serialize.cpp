/**
 * ============================================================================
 * SOFTWARE: Tally: Statement Ingestion Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: serialize.cpp
 * ============================================================================
 */

#include "serialize.hpp"
#include "money.hpp"
#include <stdexcept>

using json = nlohmann::json;

namespace tally {

namespace {

RowErrorCode code_from_string(const std::string& text) {
    static const RowErrorCode all[] = {
        RowErrorCode::MissingColumn, RowErrorCode::BadDate, RowErrorCode::BadAmount,
        RowErrorCode::DateOutOfRange, RowErrorCode::FutureDate, RowErrorCode::ZeroAmount,
        RowErrorCode::AmountTooLarge, RowErrorCode::EmptyDescription, RowErrorCode::UnknownAccount,
        RowErrorCode::DuplicateInFile, RowErrorCode::DuplicateStored
    };
    for (RowErrorCode c : all) {
        if (text == to_string(c)) return c;
    }
    throw std::invalid_argument("Unknown row error code: " + text);
}

const char* kind_name(RowErrorKind kind) {
    switch (kind) {
    case RowErrorKind::Mapping:    return "mapping";
    case RowErrorKind::Validation: return "validation";
    case RowErrorKind::Duplicate:  return "duplicate";
    }
    return "mapping";
}

} // namespace

void to_json(json& j, const Account& a) {
    j = json{
        {"id", a.id},
        {"name", a.name},
        {"institution", a.institution},
        {"balance", format_money(a.balance)},
        {"balance_micros", a.balance},
        {"created_at", a.created_at}
    };
}

void to_json(json& j, const Transaction& t) {
    j = json{
        {"id", t.id},
        {"account_id", t.account_id},
        {"date", t.posted.to_iso()},
        {"amount", format_money(t.amount)},
        {"amount_micros", t.amount},
        {"description", t.description},
        {"category", t.category ? json(*t.category) : json(nullptr)},
        {"fingerprint", t.fingerprint},
        {"import_run_id", t.import_run_id}
    };
}

void to_json(json& j, const RowError& e) {
    j = json{
        {"line", e.line},
        {"kind", kind_name(kind_of(e.code))},
        {"code", to_string(e.code)},
        {"detail", e.detail}
    };
}

void from_json(const json& j, RowError& e) {
    j.at("line").get_to(e.line);
    e.code = code_from_string(j.at("code").get<std::string>());
    e.detail = j.value("detail", std::string());
}

void to_json(json& j, const ImportRun& r) {
    j = json{
        {"id", r.id},
        {"source_path", r.source_path},
        {"profile", r.profile_id},
        {"started_at", r.started_at},
        {"completed_at", r.completed_at},
        {"outcome", to_string(r.outcome)},
        {"stage", to_string(r.stage)},
        {"failure", to_string(r.failure)},
        {"error", r.error},
        {"rows_seen", r.rows_seen},
        {"rows_imported", r.rows_imported},
        {"rows_duplicate", r.rows_duplicate},
        {"rows_invalid", r.rows_invalid},
        {"archive_path", r.archive_path},
        {"archive_warning", r.archive_warning},
        {"row_errors", r.row_errors}
    };
    if (r.outcome == ImportOutcome::Failed) {
        j["failed_stage"] = to_string(r.failed_stage);
    }
}

} // namespace tally
