/**
 * ============================================================================
 * SOFTWARE: Tally: Statement Ingestion Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: ImportOrchestrator.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Drives each statement file through
 *   Detecting -> Mapping -> Validating -> Deduplicating -> Persisting
 *   -> Archiving -> Done
 * with Failed reachable from any stage. Every input path yields exactly one
 * ImportRun, whatever goes wrong.
 * * FILE VS ROW FAILURES:
 * Mapping, validation and duplicate problems reject single rows and are
 * counted on the run. Unreadable or unrecognized files, storage errors,
 * timeouts and cancellation fail the whole file. A failed file never leaves
 * rows behind: its surviving rows are committed in one atomic batch or not
 * at all.
 * * ARCHIVING:
 * Only after a successful commit. A file that committed but could not be
 * archived stays Done and carries an archive warning.
 * ============================================================================
 */

#ifndef TALLY_IMPORT_ORCHESTRATOR_HPP
#define TALLY_IMPORT_ORCHESTRATOR_HPP

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "archiver.hpp"
#include "core/config.hpp"
#include "core/model.hpp"
#include "core/store.hpp"
#include "core/validator.hpp"
#include "profiles/ProfileRegistry.hpp"

namespace tally {

class ImportOrchestrator {
public:
    ImportOrchestrator(const TallyConfig& config,
                       const profiles::ProfileRegistry& registry,
                       LedgerStore& store);

    /**
     * @brief Imports a batch with up to import.max_parallel_files workers.
     * @return One run per path, in input order.
     */
    std::vector<ImportRun> import_files(const std::vector<std::string>& paths);

    // Imports every candidate file currently in the watch directory.
    std::vector<ImportRun> import_pending();

    // Statement-like files in the watch directory (non-recursive), sorted.
    std::vector<std::string> pending_files() const;

    /**
     * @brief Cancels every batch in flight. Files whose commit has not
     * completed end as Failed (cancelled). Batches started afterwards are
     * unaffected.
     */
    void cancel();
    // True while some batch in flight has been cancelled.
    bool cancelled() const;

    /**
     * @brief Moves the archived source file of a run back to the watch
     * directory. Throws ArchiveError when the run has no archived file.
     */
    std::string restore_archived_file(int64_t run_id);

private:
    typedef std::shared_ptr<std::atomic<bool>> CancelToken;

    ImportRun import_one(const std::string& path, const Date& today, const std::atomic<bool>& cancelled);

    // Id of an existing account; std::nullopt when the name is not known yet.
    std::optional<int64_t> lookup_account(const std::string& name,
                                          std::map<std::string, std::optional<int64_t>>& cache);

    void check_interrupted(std::chrono::steady_clock::time_point deadline,
                           const std::atomic<bool>& cancelled) const;

    const TallyConfig& config_;
    const profiles::ProfileRegistry& registry_;
    LedgerStore& store_;
    Archiver archiver_;
    // One token per batch in flight; cancel() flags all of them.
    mutable std::mutex batches_mutex_;
    std::set<CancelToken> active_batches_;
};

} // namespace tally

#endif // TALLY_IMPORT_ORCHESTRATOR_HPP
