/**
 * ============================================================================
 * SOFTWARE: Tally: Statement Ingestion Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: model.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Canonical records shared by the import pipeline, the persistence layer and
 * the HTTP service. Everything downstream of a bank profile speaks in these
 * types only.
 * ============================================================================
 */

#ifndef TALLY_MODEL_HPP
#define TALLY_MODEL_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <optional>

namespace tally {

    // money_micro: $1.00 = 1,000,000.
    // Negative amounts are debits.
    typedef int64_t money_micro;

    /**
     * @brief Calendar date without a time component.
     */
    struct Date {
        int year = 0;
        int month = 0;
        int day = 0;

        bool is_valid() const;
        // Days since 1970-01-01 (proleptic Gregorian).
        int64_t to_days() const;
        static Date from_days(int64_t days);
        std::string to_iso() const;
        static std::optional<Date> parse_iso(const std::string& text);
        static Date today();
    };

    bool operator==(const Date& a, const Date& b);
    bool operator!=(const Date& a, const Date& b);
    bool operator<(const Date& a, const Date& b);
    bool operator<=(const Date& a, const Date& b);

    struct Account {
        int64_t id = 0;
        std::string name;
        std::string institution;
        money_micro balance = 0;
        std::string created_at;
    };

    struct Transaction {
        int64_t id = 0;
        int64_t account_id = 0;
        Date posted;
        money_micro amount = 0;
        std::string description;
        std::optional<std::string> category;
        std::string fingerprint;
        int64_t import_run_id = 0;
    };

    /**
     * @brief A mapped row that has not been validated or persisted yet.
     * The account is still referenced by name; the orchestrator resolves it.
     */
    struct TransactionDraft {
        size_t line = 0;
        std::string account_name;
        int64_t account_id = 0;
        bool new_account = false;   // account_name does not exist yet; the commit creates it
        Date posted;
        money_micro amount = 0;
        std::string description;
        std::optional<std::string> category;
        std::string fingerprint;
    };

    struct TransactionFilter {
        std::optional<int64_t> account_id;
        std::optional<Date> from;
        std::optional<Date> to;
        std::optional<std::string> category;
    };

    // ------------------------------------------------------------------------
    // Row-level errors. These never fail a file; they are counted on the run.
    // ------------------------------------------------------------------------
    enum class RowErrorKind { Mapping, Validation, Duplicate };

    enum class RowErrorCode {
        MissingColumn,
        BadDate,
        BadAmount,
        DateOutOfRange,
        FutureDate,
        ZeroAmount,
        AmountTooLarge,
        EmptyDescription,
        UnknownAccount,
        DuplicateInFile,
        DuplicateStored
    };

    const char* to_string(RowErrorCode code);
    RowErrorKind kind_of(RowErrorCode code);

    struct RowError {
        size_t line = 0;
        RowErrorCode code = RowErrorCode::MissingColumn;
        std::string detail;
    };

    // ------------------------------------------------------------------------
    // Import run bookkeeping
    // ------------------------------------------------------------------------
    enum class ImportStage {
        Detecting,
        Mapping,
        Validating,
        Deduplicating,
        Persisting,
        Archiving,
        Done,
        Failed
    };

    enum class ImportOutcome { Succeeded, PartiallySucceeded, Failed };

    enum class FailureKind { None, FileUnreadable, UnsupportedFormat, Storage, Timeout, Cancelled };

    const char* to_string(ImportStage stage);
    const char* to_string(ImportOutcome outcome);
    const char* to_string(FailureKind kind);
    ImportOutcome outcome_from_string(const std::string& text);
    ImportStage stage_from_string(const std::string& text);
    FailureKind failure_from_string(const std::string& text);

    struct ImportRun {
        int64_t id = 0;
        std::string source_path;
        std::string profile_id;
        std::string started_at;
        std::string completed_at;
        ImportOutcome outcome = ImportOutcome::Failed;
        ImportStage stage = ImportStage::Detecting;
        // Stage the file was in when it failed; meaningless unless outcome is Failed.
        ImportStage failed_stage = ImportStage::Detecting;
        FailureKind failure = FailureKind::None;
        std::string error;

        size_t rows_seen = 0;
        size_t rows_imported = 0;
        size_t rows_duplicate = 0;
        size_t rows_invalid = 0;

        std::string archive_path;
        std::string archive_warning;
        std::vector<RowError> row_errors;
    };

    // Current UTC time as "YYYY-MM-DDTHH:MM:SSZ".
    std::string utc_timestamp();

} // namespace tally

#endif // TALLY_MODEL_HPP
