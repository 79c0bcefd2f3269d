/**
 * ============================================================================
 * SOFTWARE: Tally: Statement Ingestion Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: log.hpp
 * ============================================================================
 */

#ifndef TALLY_LOG_HPP
#define TALLY_LOG_HPP

#include <string>
#include <vector>

namespace tally {

    /**
     * @brief Writes "[HH:MM:SS] [LEVEL] message" to stdout and keeps the last
     * 200 lines in memory for the /api/system/logs route.
     * Levels in use: DEBUG, INFO, WARN, ERROR, CRITICAL, FATAL.
     */
    void tally_log(const std::string& level, const std::string& message);

    // Snapshot of the retained lines, oldest first.
    std::vector<std::string> recent_logs();

} // namespace tally

#endif // TALLY_LOG_HPP
