/**
 * ============================================================================
 * SOFTWARE: Tally: Statement Ingestion Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: archiver.cpp
 * ============================================================================
 */

#include "archiver.hpp"
#include "core/errors.hpp"
#include "core/log.hpp"
#include <chrono>
#include <thread>

namespace fs = std::filesystem;

namespace tally {

Archiver::Archiver(fs::path archive_root, int attempts)
    : root_(std::move(archive_root)), attempts_(attempts < 1 ? 1 : attempts) {}

fs::path Archiver::collision_free(const fs::path& dir, const std::string& filename) {
    fs::path candidate = dir / filename;
    if (!fs::exists(candidate)) return candidate;

    fs::path name(filename);
    std::string stem = name.stem().string();
    std::string ext = name.extension().string();
    for (int n = 1;; ++n) {
        candidate = dir / (stem + "_" + std::to_string(n) + ext);
        if (!fs::exists(candidate)) return candidate;
    }
}

// rename() first; across devices fall back to copy then remove, and never
// remove the source unless the copy landed.
void Archiver::move_file(const fs::path& from, const fs::path& to) const {
    std::error_code ec;
    fs::rename(from, to, ec);
    if (!ec) return;
    if (ec != std::errc::cross_device_link) {
        throw fs::filesystem_error("rename failed", from, to, ec);
    }
    fs::copy_file(from, to, fs::copy_options::none);
    fs::remove(from);
}

fs::path Archiver::archive(const fs::path& source, const Date& day) const {
    fs::path partition = root_ / day.to_iso();
    std::string last_error;

    for (int attempt = 1; attempt <= attempts_; ++attempt) {
        try {
            std::lock_guard<std::mutex> lock(mutex_);
            fs::create_directories(partition);
            fs::path target = collision_free(partition, source.filename().string());
            move_file(source, target);
            return target;
        } catch (const fs::filesystem_error& e) {
            last_error = e.what();
            tally_log("WARN", "Archive attempt " + std::to_string(attempt) + " for " +
                      source.string() + " failed: " + last_error);
        }
        if (attempt < attempts_) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50 * attempt));
        }
    }
    throw ArchiveError("Could not archive " + source.string() + ": " + last_error);
}

fs::path Archiver::restore(const fs::path& archived, const fs::path& dest_dir) const {
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!fs::is_regular_file(archived)) {
            throw ArchiveError("Archived file not found: " + archived.string());
        }
        fs::create_directories(dest_dir);
        fs::path target = collision_free(dest_dir, archived.filename().string());
        move_file(archived, target);
        tally_log("INFO", "Restored " + archived.filename().string() + " to " + dest_dir.string());
        return target;
    } catch (const fs::filesystem_error& e) {
        throw ArchiveError("Could not restore " + archived.string() + ": " + e.what());
    }
}

} // namespace tally
