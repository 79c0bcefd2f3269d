/**
 * ============================================================================
 * SOFTWARE: Tally: Statement Ingestion Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: dedup.hpp
 * ============================================================================
 */

#ifndef TALLY_DEDUP_HPP
#define TALLY_DEDUP_HPP

#include <map>
#include <optional>
#include <string>
#include <unordered_set>
#include "core/model.hpp"
#include "core/store.hpp"

namespace tally {

/**
 * @brief Duplicate detection for one file.
 * Knows the fingerprints already stored for every account the file touches
 * (loaded once per account) plus those accepted earlier in the same file.
 * Create a fresh detector per file.
 */
class DuplicateDetector {
public:
    explicit DuplicateDetector(LedgerStore& store);

    /**
     * check
     * Computes and stores draft.fingerprint, then reports a Duplicate RowError
     * if it was seen before. The first occurrence within the file is accepted.
     * Throws StorageError when the stored fingerprints cannot be loaded.
     */
    std::optional<RowError> check(TransactionDraft& draft);

private:
    LedgerStore& store_;
    std::map<int64_t, std::unordered_set<std::string>> stored_;
    std::unordered_set<std::string> accepted_;
};

} // namespace tally

#endif // TALLY_DEDUP_HPP
