/**
 * ============================================================================
 * SOFTWARE: Tally: Statement Ingestion Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: crypto.hpp
 * ============================================================================
 * * DESCRIPTION:
 * SHA-256 hashing and the transaction fingerprint used as the duplicate
 * detection key.
 * ============================================================================
 */

#ifndef TALLY_CRYPTO_HPP
#define TALLY_CRYPTO_HPP

#include <string>
#include "model.hpp"

namespace tally {

class TallyCrypto {
public:
    // Lower-case hex digest of str.
    static std::string generate_sha256(const std::string& str);

    /**
     * normalize_description
     * Trims, collapses whitespace runs to a single space and lower-cases
     * ASCII letters. Non-ASCII bytes pass through untouched.
     */
    static std::string normalize_description(const std::string& description);

    /**
     * calculate_fingerprint
     * Hash over (account id, posted date, amount, normalized description).
     * Two exports of the same statement line produce the same fingerprint even
     * when column order or whitespace differ.
     */
    static std::string calculate_fingerprint(int64_t account_id, const Date& posted,
                                             money_micro amount, const std::string& description);
};

} // namespace tally

#endif
