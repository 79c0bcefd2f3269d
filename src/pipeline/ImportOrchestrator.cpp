/**
 * ============================================================================
 * SOFTWARE: Tally: Statement Ingestion Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: ImportOrchestrator.cpp
 * ============================================================================
 */

#include "ImportOrchestrator.hpp"
#include "dedup.hpp"
#include "core/errors.hpp"
#include "core/log.hpp"
#include "profiles/csv_reader.hpp"
#include "profiles/mapper.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <thread>

namespace fs = std::filesystem;

namespace tally {

namespace {

// Thrown between stages when a file runs out of time or the batch is cancelled.
class StageInterrupted : public std::runtime_error {
public:
    StageInterrupted(FailureKind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    FailureKind kind() const { return kind_; }

private:
    FailureKind kind_;
};

std::string lower_extension(const std::string& path) {
    std::string ext = fs::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

bool is_workbook(const std::string& ext) {
    return ext == ".xlsx" || ext == ".xls";
}

bool is_candidate(const std::string& ext) {
    return ext == ".csv" || ext == ".tsv" || ext == ".txt" || is_workbook(ext);
}

void fail(ImportRun& run, FailureKind kind, const std::string& message) {
    run.failed_stage = run.stage;
    run.stage = ImportStage::Failed;
    run.outcome = ImportOutcome::Failed;
    run.failure = kind;
    run.error = message;
}

void reject_row(ImportRun& run, const RowError& error) {
    if (kind_of(error.code) == RowErrorKind::Duplicate) {
        run.rows_duplicate++;
    } else {
        run.rows_invalid++;
    }
    run.row_errors.push_back(error);
}

} // namespace

ImportOrchestrator::ImportOrchestrator(const TallyConfig& config,
                                       const profiles::ProfileRegistry& registry,
                                       LedgerStore& store)
    : config_(config),
      registry_(registry),
      store_(store),
      archiver_(config.import.archive_dir, config.import.archive_attempts) {}

void ImportOrchestrator::cancel() {
    std::lock_guard<std::mutex> lock(batches_mutex_);
    for (const auto& token : active_batches_) *token = true;
    tally_log("WARN", "Import cancellation requested for " + std::to_string(active_batches_.size()) +
              " batch(es) in flight.");
}

bool ImportOrchestrator::cancelled() const {
    std::lock_guard<std::mutex> lock(batches_mutex_);
    for (const auto& token : active_batches_) {
        if (*token) return true;
    }
    return false;
}

// ----------------------------------------------------------------------------
// import_files
// Workers pull the next unprocessed index; results land in their input slot
// so the caller sees them in input order.
// ----------------------------------------------------------------------------
std::vector<ImportRun> ImportOrchestrator::import_files(const std::vector<std::string>& paths) {
    std::vector<ImportRun> runs(paths.size());
    if (paths.empty()) return runs;

    CancelToken token = std::make_shared<std::atomic<bool>>(false);
    {
        std::lock_guard<std::mutex> lock(batches_mutex_);
        active_batches_.insert(token);
    }

    const Date today = Date::today();
    std::atomic<size_t> next(0);
    auto worker = [&]() {
        for (size_t i = next++; i < paths.size(); i = next++) {
            runs[i] = import_one(paths[i], today, *token);
        }
    };

    size_t workers = std::min(paths.size(), static_cast<size_t>(config_.import.max_parallel_files));
    tally_log("INFO", "Importing " + std::to_string(paths.size()) + " file(s) with " +
              std::to_string(workers) + " worker(s).");

    std::vector<std::thread> pool;
    for (size_t w = 1; w < workers; ++w) pool.emplace_back(worker);
    worker();
    for (auto& t : pool) t.join();

    {
        std::lock_guard<std::mutex> lock(batches_mutex_);
        active_batches_.erase(token);
    }
    return runs;
}

std::vector<std::string> ImportOrchestrator::pending_files() const {
    std::vector<std::string> files;
    std::error_code ec;
    fs::directory_iterator it(config_.import.watch_dir, ec);
    if (ec) {
        tally_log("WARN", "Watch directory " + config_.import.watch_dir + " unreadable: " + ec.message());
        return files;
    }
    for (const auto& entry : it) {
        if (!entry.is_regular_file(ec)) continue;
        if (is_candidate(lower_extension(entry.path().string()))) {
            files.push_back(entry.path().string());
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

std::vector<ImportRun> ImportOrchestrator::import_pending() {
    return import_files(pending_files());
}

std::string ImportOrchestrator::restore_archived_file(int64_t run_id) {
    auto run = store_.find_import_run(run_id);
    if (!run) {
        throw ArchiveError("Import run " + std::to_string(run_id) + " does not exist");
    }
    if (run->archive_path.empty()) {
        throw ArchiveError("Import run " + std::to_string(run_id) + " has no archived file");
    }
    return archiver_.restore(run->archive_path, config_.import.watch_dir).string();
}

void ImportOrchestrator::check_interrupted(std::chrono::steady_clock::time_point deadline,
                                           const std::atomic<bool>& cancelled) const {
    if (cancelled) {
        throw StageInterrupted(FailureKind::Cancelled, "batch cancelled");
    }
    if (std::chrono::steady_clock::now() > deadline) {
        throw StageInterrupted(FailureKind::Timeout,
                               "processing exceeded " + std::to_string(config_.import.file_timeout_ms) + " ms");
    }
}

std::optional<int64_t> ImportOrchestrator::lookup_account(
        const std::string& name, std::map<std::string, std::optional<int64_t>>& cache) {
    auto cached = cache.find(name);
    if (cached != cache.end()) return cached->second;

    std::optional<int64_t> id;
    if (auto existing = store_.find_account_by_name(name)) id = existing->id;
    cache[name] = id;
    return id;
}

// ----------------------------------------------------------------------------
// import_one
// The per-file state machine. Every exception is turned into the run's
// outcome here; nothing escapes to the worker.
// ----------------------------------------------------------------------------
ImportRun ImportOrchestrator::import_one(const std::string& path, const Date& today,
                                        const std::atomic<bool>& cancelled) {
    ImportRun run;
    run.source_path = path;
    run.started_at = utc_timestamp();
    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::milliseconds(config_.import.file_timeout_ms);
    bool audit_open = false;

    try {
        run.id = store_.begin_import_run(path, run.started_at);
        audit_open = true;

        // --- Detecting ---
        run.stage = ImportStage::Detecting;
        check_interrupted(deadline, cancelled);
        std::string ext = lower_extension(path);
        if (is_workbook(ext)) {
            throw FileError(FileError::Reason::Unsupported,
                            "Spreadsheet workbooks are not read directly; export the sheet as CSV");
        }
        profiles::CsvTable table = profiles::parse_csv(profiles::read_file(path),
                                                       profiles::delimiter_for_path(path));
        if (table.header.empty()) {
            throw FileError(FileError::Reason::Unreadable, "File is empty: " + path);
        }
        const profiles::BankProfile* profile = registry_.Detect(path, table.header);
        if (profile == nullptr) {
            throw FileError(FileError::Reason::Unsupported, "Format unrecognized: " + path);
        }
        run.profile_id = profile->id;
        run.rows_seen = table.rows.size();

        // --- Mapping ---
        run.stage = ImportStage::Mapping;
        check_interrupted(deadline, cancelled);
        profiles::HeaderIndex index(table.header);
        std::vector<TransactionDraft> drafts;
        for (const auto& row : table.rows) {
            profiles::MapResult mapped = profiles::map_row(row, index, *profile);
            if (mapped.ok()) {
                drafts.push_back(std::move(*mapped.draft));
            } else {
                reject_row(run, *mapped.error);
            }
        }

        // --- Validating ---
        run.stage = ImportStage::Validating;
        check_interrupted(deadline, cancelled);
        DraftValidator validator(config_.validation, today);
        const bool auto_create = config_.import.account_policy == AccountPolicy::AutoCreate;
        std::map<std::string, std::optional<int64_t>> account_ids;
        std::vector<TransactionDraft> valid;
        for (auto& draft : drafts) {
            if (auto id = lookup_account(draft.account_name, account_ids)) {
                draft.account_id = *id;
            } else {
                // Created by the commit, and only if rows for it survive.
                draft.new_account = auto_create;
            }
            if (auto error = validator.validate(draft)) {
                reject_row(run, *error);
            } else {
                valid.push_back(std::move(draft));
            }
        }

        // --- Deduplicating ---
        run.stage = ImportStage::Deduplicating;
        check_interrupted(deadline, cancelled);
        DuplicateDetector detector(store_);
        CommitBatch batch;
        batch.import_run_id = run.id;
        std::vector<size_t> batch_lines;
        std::set<std::string> new_accounts;
        for (auto& draft : valid) {
            if (auto duplicate = detector.check(draft)) {
                reject_row(run, *duplicate);
                continue;
            }
            NewTransaction t;
            t.account_id = draft.account_id;
            if (draft.new_account) {
                t.new_account = draft.account_name;
                if (new_accounts.insert(draft.account_name).second) {
                    batch.new_accounts.push_back(NewAccount{draft.account_name, profile->institution});
                }
            }
            t.posted = draft.posted;
            t.amount = draft.amount;
            t.description = draft.description;
            t.category = draft.category;
            t.fingerprint = draft.fingerprint;
            batch.rows.push_back(std::move(t));
            batch_lines.push_back(draft.line);
        }

        // --- Persisting ---
        run.stage = ImportStage::Persisting;
        check_interrupted(deadline, cancelled);
        if (!batch.rows.empty()) {
            CommitResult committed = store_.commit_batch(batch, [&cancelled]() { return cancelled.load(); });
            run.rows_imported = committed.inserted;
            for (size_t i : committed.duplicate_rows) {
                reject_row(run, RowError{batch_lines[i], RowErrorCode::DuplicateStored,
                                         "committed by a concurrent import"});
            }
        }

        // --- Archiving ---
        run.stage = ImportStage::Archiving;
        try {
            run.archive_path = archiver_.archive(path, today).string();
        } catch (const ArchiveError& e) {
            run.archive_warning = e.what();
            tally_log("WARN", "Imported but not archived: " + std::string(e.what()));
        }

        run.stage = ImportStage::Done;
        run.outcome = run.rows_invalid > 0 ? ImportOutcome::PartiallySucceeded : ImportOutcome::Succeeded;
    } catch (const FileError& e) {
        fail(run, e.reason() == FileError::Reason::Unsupported ? FailureKind::UnsupportedFormat
                                                               : FailureKind::FileUnreadable, e.what());
    } catch (const CommitAborted& e) {
        fail(run, FailureKind::Cancelled, e.what());
    } catch (const StorageError& e) {
        fail(run, FailureKind::Storage, e.what());
    } catch (const StageInterrupted& e) {
        fail(run, e.kind(), e.what());
    } catch (const std::exception& e) {
        fail(run, run.stage == ImportStage::Persisting ? FailureKind::Storage : FailureKind::FileUnreadable,
             std::string("Unexpected error: ") + e.what());
    }

    if (run.outcome == ImportOutcome::Failed) {
        // Nothing of a failed file is persisted; its rows count as neither imported nor rejected.
        run.rows_imported = 0;
    }
    run.completed_at = utc_timestamp();

    if (audit_open) {
        try {
            store_.finalize_import_run(run);
        } catch (const StorageError& e) {
            tally_log("ERROR", "Import run " + std::to_string(run.id) + " could not be finalized: " + e.what());
            if (run.error.empty()) run.error = std::string("Audit record not finalized: ") + e.what();
        }
    }

    if (run.outcome == ImportOutcome::Failed) {
        tally_log("ERROR", "Import of " + path + " failed at " + to_string(run.failed_stage) +
                  " (" + to_string(run.failure) + "): " + run.error);
    } else {
        tally_log("INFO", "Imported " + path + " as " + run.profile_id + ": seen " +
                  std::to_string(run.rows_seen) + ", imported " + std::to_string(run.rows_imported) +
                  ", duplicate " + std::to_string(run.rows_duplicate) + ", invalid " +
                  std::to_string(run.rows_invalid) + ".");
    }
    return run;
}

} // namespace tally
