/**
 * ============================================================================
 * SOFTWARE: Tally: Statement Ingestion Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: ProfileRegistry.hpp
 * ============================================================================
 * * DESCRIPTION:
 * The registry owns every BankProfile known to the process and acts as the
 * format detector: given a file name and its header row, it answers which
 * institution produced the export.
 * * The registry is filled once at startup and only read afterwards, so a
 * const reference can be shared freely between import workers.
 * ============================================================================
 */

#ifndef TALLY_PROFILE_REGISTRY_HPP
#define TALLY_PROFILE_REGISTRY_HPP

#include <string>
#include <vector>
#include "bank_profile.hpp"

namespace tally {
namespace profiles {

    class ProfileRegistry {
    public:
        /**
         * @brief Adds a profile after the ones already registered.
         * Detection tries profiles in registration order, so register the
         * more specific layouts first.
         * @return false on an ID conflict.
         */
        bool RegisterProfile(const BankProfile& def);

        /**
         * @brief The format detector.
         * A profile matches when every signature column appears in the header
         * in the same relative order (trimmed, case-insensitive) and, if the
         * profile has a filename hint, the file name contains it.
         * @return The first matching profile, or nullptr for "format unrecognized".
         */
        const BankProfile* Detect(const std::string& path,
                                  const std::vector<std::string>& header) const;

        const BankProfile* Find(const std::string& id) const;

        const std::vector<BankProfile>& Profiles() const { return registry_; }

    private:
        // A vector rather than a map: registration order is detection order.
        std::vector<BankProfile> registry_;
    };

    // Trimmed, lower-cased header cell.
    std::string normalize_header(const std::string& name);

    /**
     * @brief Layouts of the institutions supported out of the box:
     * Chase (two cards, told apart by file name), Capital One, PNC, and a
     * generic Date,Description,Amount layout posting into default_account.
     */
    std::vector<BankProfile> builtin_profiles(const std::string& default_account);

} // namespace profiles
} // namespace tally

#endif // TALLY_PROFILE_REGISTRY_HPP
