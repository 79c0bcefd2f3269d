/**
 * ============================================================================
 * SOFTWARE: Tally: Statement Ingestion Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: ProfileRegistry.cpp
 * ============================================================================
 * * DESCRIPTION:
 * Registration and header-signature detection of bank export layouts.
 * ============================================================================
 */

#include "ProfileRegistry.hpp"
#include "core/log.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>

namespace tally {
namespace profiles {

std::string normalize_header(const std::string& name) {
    size_t begin = 0;
    size_t end = name.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(name[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(name[end - 1]))) --end;

    std::string out = name.substr(begin, end - begin);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

// ----------------------------------------------------------------------------
// RegisterProfile
// Rejects a second profile with the same ID instead of silently replacing it.
// ----------------------------------------------------------------------------
bool ProfileRegistry::RegisterProfile(const BankProfile& def) {
    if (Find(def.id) != nullptr) {
        tally_log("ERROR", "Bank profile ID conflict: " + def.id);
        return false;
    }

    registry_.push_back(def);
    tally_log("DEBUG", "Registered bank profile: " + def.institution + " (" + def.id + ")");
    return true;
}

// ----------------------------------------------------------------------------
// Detect
// Pure inspection. An unknown layout is an ordinary answer (nullptr), the
// caller decides how to report it.
// ----------------------------------------------------------------------------
const BankProfile* ProfileRegistry::Detect(const std::string& path,
                                           const std::vector<std::string>& header) const {
    std::vector<std::string> columns;
    columns.reserve(header.size());
    for (const auto& h : header) columns.push_back(normalize_header(h));

    std::string file_name = normalize_header(std::filesystem::path(path).filename().string());

    for (const auto& profile : registry_) {
        if (!profile.filename_hint.empty() &&
            file_name.find(normalize_header(profile.filename_hint)) == std::string::npos) {
            continue;
        }

        // Ordered subsequence match of the signature within the header.
        auto cursor = columns.begin();
        bool matched = true;
        for (const auto& wanted : profile.signature) {
            cursor = std::find(cursor, columns.end(), normalize_header(wanted));
            if (cursor == columns.end()) {
                matched = false;
                break;
            }
            ++cursor;
        }
        if (matched) return &profile;
    }
    return nullptr;
}

const BankProfile* ProfileRegistry::Find(const std::string& id) const {
    for (const auto& profile : registry_) {
        if (profile.id == id) return &profile;
    }
    return nullptr;
}

} // namespace profiles
} // namespace tally
