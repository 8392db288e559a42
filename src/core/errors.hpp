/**
 * ============================================================================
 * SOFTWARE: PawnPro Ledger - Core Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: errors.hpp
 * ============================================================================
 * * DESCRIPTION:
 * The single exception type raised by every ledger operation. The kind
 * decides how a caller may react; the code is the machine-readable name
 * returned over the API ("UnbalancedVoucher", "AlreadyClosed", ...).
 * ============================================================================
 */

#ifndef PPL_ERRORS_HPP
#define PPL_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace ppl {

    enum class ErrorKind {
        Validation,     // bad input, nothing written
        Referential,    // unknown or missing record, nothing written
        StateConflict,  // business policy refused the operation
        Consistency     // internal invariant broken, transaction rolled back
    };

    const char* to_string(ErrorKind kind);

    class LedgerError : public std::runtime_error {
    public:
        LedgerError(ErrorKind kind, const std::string& code, const std::string& message);

        ErrorKind kind() const { return kind_; }
        const std::string& code() const { return code_; }

        /**
         * @return The HTTP status the front door answers with (400/404/409/500).
         */
        int http_status() const;

        /**
         * @return The message safe to show a caller. Consistency failures
         * never leak their detail.
         */
        std::string public_message() const;

    private:
        ErrorKind kind_;
        std::string code_;
    };

    LedgerError validation_error(const std::string& code, const std::string& message);
    LedgerError referential_error(const std::string& code, const std::string& message);
    LedgerError state_conflict(const std::string& code, const std::string& message);
    LedgerError consistency_error(const std::string& message);

} // namespace ppl

#endif // PPL_ERRORS_HPP
