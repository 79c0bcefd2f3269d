/**
 * ============================================================================
 * SOFTWARE: Tally: Statement Ingestion Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: archiver.hpp
 * ============================================================================
 */

#ifndef TALLY_ARCHIVER_HPP
#define TALLY_ARCHIVER_HPP

#include <filesystem>
#include <mutex>
#include <string>
#include "core/model.hpp"

namespace tally {

// Moves consumed statement files under <root>/<YYYY-MM-DD>/, never overwriting.
class Archiver {
public:
    Archiver(std::filesystem::path archive_root, int attempts);

    /**
     * archive
     * Moves source into the partition for day, keeping its name unless taken,
     * in which case "_1", "_2", ... is inserted before the extension.
     * Retries up to the configured attempt count.
     * @return The archived path. Throws ArchiveError when every attempt fails.
     */
    std::filesystem::path archive(const std::filesystem::path& source, const Date& day) const;

    // Moves an archived file back into dest_dir, collision-safe. Throws ArchiveError.
    std::filesystem::path restore(const std::filesystem::path& archived, const std::filesystem::path& dest_dir) const;

    // First free name for filename inside dir.
    static std::filesystem::path collision_free(const std::filesystem::path& dir, const std::string& filename);

    const std::filesystem::path& root() const { return root_; }

private:
    void move_file(const std::filesystem::path& from, const std::filesystem::path& to) const;

    std::filesystem::path root_;
    int attempts_;
    // Picking a free name and moving into it must not interleave between workers.
    mutable std::mutex mutex_;
};

} // namespace tally

#endif // TALLY_ARCHIVER_HPP
