/**
 * ============================================================================
 * SOFTWARE: Tally: Statement Ingestion Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: dedup.cpp
 * ============================================================================
 */

#include "dedup.hpp"
#include "core/crypto.hpp"

namespace tally {

DuplicateDetector::DuplicateDetector(LedgerStore& store) : store_(store) {}

std::optional<RowError> DuplicateDetector::check(TransactionDraft& draft) {
    draft.fingerprint = TallyCrypto::calculate_fingerprint(
        draft.account_id, draft.posted, draft.amount, draft.description);

    // An account the commit will create has nothing stored yet, and its
    // provisional fingerprint (account id 0) is told apart by name.
    std::string key = draft.fingerprint;
    if (draft.new_account) {
        key = draft.account_name + "|" + draft.fingerprint;
    } else {
        auto it = stored_.find(draft.account_id);
        if (it == stored_.end()) {
            it = stored_.emplace(draft.account_id, store_.fingerprints_for_account(draft.account_id)).first;
        }
        if (it->second.count(draft.fingerprint) > 0) {
            return RowError{draft.line, RowErrorCode::DuplicateStored,
                            "already imported into '" + draft.account_name + "'"};
        }
    }
    // Fingerprints embed the account id, so one set serves every account in the file.
    if (!accepted_.insert(key).second) {
        return RowError{draft.line, RowErrorCode::DuplicateInFile, "same transaction appears earlier in this file"};
    }
    return std::nullopt;
}

} // namespace tally
