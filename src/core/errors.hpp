/**
 * ============================================================================
 * SOFTWARE: Tally: Statement Ingestion Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: errors.hpp
 * ============================================================================
 * * DESCRIPTION:
 * File-level and storage-level failures are exceptions. Row-level problems
 * are RowError values (see model.hpp) and never travel as exceptions.
 * ============================================================================
 */

#ifndef TALLY_ERRORS_HPP
#define TALLY_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace tally {

    // Unreadable, empty or unsupported input file.
    class FileError : public std::runtime_error {
    public:
        enum class Reason { Unreadable, Unsupported };

        FileError(Reason reason, const std::string& what)
            : std::runtime_error(what), reason_(reason) {}

        Reason reason() const { return reason_; }

    private:
        Reason reason_;
    };

    // Any failure of the persistence layer, including timeouts and rollbacks.
    class StorageError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    // Raised when commit_batch is aborted by its abort check before committing.
    class CommitAborted : public StorageError {
    public:
        using StorageError::StorageError;
    };

    class ArchiveError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    class ConfigError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

} // namespace tally

#endif // TALLY_ERRORS_HPP
