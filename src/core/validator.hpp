/**
 * ============================================================================
 * SOFTWARE: Tally: Statement Ingestion Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: validator.hpp
 * ============================================================================
 */

#ifndef TALLY_VALIDATOR_HPP
#define TALLY_VALIDATOR_HPP

#include <optional>
#include "config.hpp"
#include "model.hpp"

namespace tally {

class DraftValidator {
public:
    // today is injected so a run validates against one fixed date.
    DraftValidator(const ValidationConfig& config, const Date& today);

    /**
     * validate
     * Checks a mapped draft before it may be persisted. Returns the first
     * failing check as a Validation RowError, or std::nullopt when the draft
     * is eligible. A draft whose account_id is still 0 and that is not
     * marked new_account did not resolve to an account.
     */
    std::optional<RowError> validate(const TransactionDraft& draft) const;

private:
    ValidationConfig config_;
    Date today_;
};

} // namespace tally

#endif // TALLY_VALIDATOR_HPP
