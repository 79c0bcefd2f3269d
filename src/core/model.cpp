/**
 * ============================================================================
 * SOFTWARE: Tally: Statement Ingestion Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: model.cpp
 * ============================================================================
 */

#include "model.hpp"
#include <chrono>
#include <ctime>
#include <cstdio>
#include <stdexcept>

namespace tally {

namespace {

bool is_leap(int y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

int days_in_month(int y, int m) {
    static const int table[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m == 2 && is_leap(y)) return 29;
    return table[m - 1];
}

} // namespace

bool Date::is_valid() const {
    if (year < 1 || year > 9999) return false;
    if (month < 1 || month > 12) return false;
    return day >= 1 && day <= days_in_month(year, month);
}

// Civil-from-days / days-from-civil after H. Hinnant's date algorithms.
int64_t Date::to_days() const {
    int64_t y = year;
    const int64_t m = month;
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const int64_t yoe = y - era * 400;
    const int64_t doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + day - 1;
    const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

Date Date::from_days(int64_t z) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const int64_t doe = z - era * 146097;
    const int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const int64_t mp = (5 * doy + 2) / 153;
    Date d;
    d.day = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    d.month = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    d.year = static_cast<int>(yoe + era * 400 + (d.month <= 2));
    return d;
}

std::string Date::to_iso() const {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", year, month, day);
    return buf;
}

std::optional<Date> Date::parse_iso(const std::string& text) {
    Date d;
    char tail = 0;
    if (std::sscanf(text.c_str(), "%4d-%2d-%2d%c", &d.year, &d.month, &d.day, &tail) != 3) {
        return std::nullopt;
    }
    if (!d.is_valid()) return std::nullopt;
    return d;
}

Date Date::today() {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&now, &local);
    Date d;
    d.year = local.tm_year + 1900;
    d.month = local.tm_mon + 1;
    d.day = local.tm_mday;
    return d;
}

bool operator==(const Date& a, const Date& b) {
    return a.year == b.year && a.month == b.month && a.day == b.day;
}
bool operator!=(const Date& a, const Date& b) { return !(a == b); }
bool operator<(const Date& a, const Date& b) { return a.to_days() < b.to_days(); }
bool operator<=(const Date& a, const Date& b) { return !(b < a); }

const char* to_string(RowErrorCode code) {
    switch (code) {
    case RowErrorCode::MissingColumn:    return "missing_column";
    case RowErrorCode::BadDate:          return "bad_date";
    case RowErrorCode::BadAmount:        return "bad_amount";
    case RowErrorCode::DateOutOfRange:   return "date_out_of_range";
    case RowErrorCode::FutureDate:       return "future_date";
    case RowErrorCode::ZeroAmount:       return "zero_amount";
    case RowErrorCode::AmountTooLarge:   return "amount_too_large";
    case RowErrorCode::EmptyDescription: return "empty_description";
    case RowErrorCode::UnknownAccount:   return "unknown_account";
    case RowErrorCode::DuplicateInFile:  return "duplicate_in_file";
    case RowErrorCode::DuplicateStored:  return "duplicate_stored";
    }
    return "unknown";
}

RowErrorKind kind_of(RowErrorCode code) {
    switch (code) {
    case RowErrorCode::MissingColumn:
    case RowErrorCode::BadDate:
    case RowErrorCode::BadAmount:
        return RowErrorKind::Mapping;
    case RowErrorCode::DuplicateInFile:
    case RowErrorCode::DuplicateStored:
        return RowErrorKind::Duplicate;
    default:
        return RowErrorKind::Validation;
    }
}

const char* to_string(ImportStage stage) {
    switch (stage) {
    case ImportStage::Detecting:     return "detecting";
    case ImportStage::Mapping:       return "mapping";
    case ImportStage::Validating:    return "validating";
    case ImportStage::Deduplicating: return "deduplicating";
    case ImportStage::Persisting:    return "persisting";
    case ImportStage::Archiving:     return "archiving";
    case ImportStage::Done:          return "done";
    case ImportStage::Failed:        return "failed";
    }
    return "failed";
}

const char* to_string(ImportOutcome outcome) {
    switch (outcome) {
    case ImportOutcome::Succeeded:          return "succeeded";
    case ImportOutcome::PartiallySucceeded: return "partially_succeeded";
    case ImportOutcome::Failed:             return "failed";
    }
    return "failed";
}

const char* to_string(FailureKind kind) {
    switch (kind) {
    case FailureKind::None:              return "none";
    case FailureKind::FileUnreadable:    return "file_unreadable";
    case FailureKind::UnsupportedFormat: return "unsupported_format";
    case FailureKind::Storage:           return "storage";
    case FailureKind::Timeout:           return "timeout";
    case FailureKind::Cancelled:         return "cancelled";
    }
    return "none";
}

ImportOutcome outcome_from_string(const std::string& text) {
    if (text == "succeeded") return ImportOutcome::Succeeded;
    if (text == "partially_succeeded") return ImportOutcome::PartiallySucceeded;
    if (text == "failed") return ImportOutcome::Failed;
    throw std::invalid_argument("Unknown import outcome: " + text);
}

ImportStage stage_from_string(const std::string& text) {
    static const ImportStage all[] = {
        ImportStage::Detecting, ImportStage::Mapping, ImportStage::Validating,
        ImportStage::Deduplicating, ImportStage::Persisting, ImportStage::Archiving,
        ImportStage::Done, ImportStage::Failed
    };
    for (ImportStage s : all) {
        if (text == to_string(s)) return s;
    }
    throw std::invalid_argument("Unknown import stage: " + text);
}

FailureKind failure_from_string(const std::string& text) {
    static const FailureKind all[] = {
        FailureKind::None, FailureKind::FileUnreadable, FailureKind::UnsupportedFormat,
        FailureKind::Storage, FailureKind::Timeout, FailureKind::Cancelled
    };
    for (FailureKind k : all) {
        if (text == to_string(k)) return k;
    }
    throw std::invalid_argument("Unknown failure kind: " + text);
}

std::string utc_timestamp() {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm utc{};
    gmtime_r(&now, &utc);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return buf;
}

} // namespace tally
