/**
 * ============================================================================
 * SOFTWARE: PawnPro Ledger - Core Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: logger.hpp
 * ============================================================================
 */

#ifndef PPL_LOGGER_HPP
#define PPL_LOGGER_HPP

#include <cstddef>
#include <string>
#include <vector>

namespace ppl {

    /**
     * ppl_log
     * Writes "[HH:MM:SS] [LEVEL] message" to stdout and keeps the line in a
     * bounded in-memory ring for the admin log viewer.
     */
    void ppl_log(const std::string& level, const std::string& message);

    // Snapshot of the ring, oldest first.
    std::vector<std::string> recent_logs();

    void set_log_capacity(std::size_t capacity);

} // namespace ppl

#endif // PPL_LOGGER_HPP
