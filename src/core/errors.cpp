/**
 * ============================================================================
 * SOFTWARE: PawnPro Ledger - Core Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: errors.cpp
 * ============================================================================
 */

#include "errors.hpp"

namespace ppl {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Validation: return "validation";
        case ErrorKind::Referential: return "referential";
        case ErrorKind::StateConflict: return "state_conflict";
        case ErrorKind::Consistency: return "consistency";
    }
    return "unknown";
}

LedgerError::LedgerError(ErrorKind kind, const std::string& code, const std::string& message)
    : std::runtime_error(message), kind_(kind), code_(code) {}

int LedgerError::http_status() const {
    switch (kind_) {
        case ErrorKind::Validation: return 400;
        case ErrorKind::Referential: return 404;
        case ErrorKind::StateConflict: return 409;
        case ErrorKind::Consistency: return 500;
    }
    return 500;
}

std::string LedgerError::public_message() const {
    if (kind_ == ErrorKind::Consistency) return "internal ledger error";
    return what();
}

LedgerError validation_error(const std::string& code, const std::string& message) {
    return LedgerError(ErrorKind::Validation, code, message);
}

LedgerError referential_error(const std::string& code, const std::string& message) {
    return LedgerError(ErrorKind::Referential, code, message);
}

LedgerError state_conflict(const std::string& code, const std::string& message) {
    return LedgerError(ErrorKind::StateConflict, code, message);
}

LedgerError consistency_error(const std::string& message) {
    return LedgerError(ErrorKind::Consistency, "InternalInvariant", message);
}

} // namespace ppl
