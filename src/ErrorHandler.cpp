#include "ErrorHandler.hpp"

namespace dbscope {

UnsupportedSchemeError::UnsupportedSchemeError(const std::string& scheme)
    : DatabaseError("Unsupported database URL scheme '" + scheme +
                    "' (supported: sqlite, postgresql, mysql)")
    , m_scheme(scheme) {
}

StatementError::StatementError(const std::string& message, int code,
                               std::string sqlState, bool transient)
    : DatabaseError(message)
    , m_code(code)
    , m_sqlState(std::move(sqlState))
    , m_transient(transient) {
}

bool ErrorHandler::isRetryable(const std::exception& e) {
    if (dynamic_cast<const PoolExhaustedError*>(&e) ||
        dynamic_cast<const ConnectionError*>(&e)) {
        return true;
    }
    if (auto* stmt = dynamic_cast<const StatementError*>(&e)) {
        return stmt->isTransient();
    }
    return false;
}

bool ErrorHandler::isTransientSqlState(const std::string& sqlState) {
    // 40001 serialization_failure, 40P01 deadlock_detected,
    // 55P03 lock_not_available, 57P01 admin_shutdown, class 08 connection exceptions
    return sqlState == "40001" || sqlState == "40P01" || sqlState == "55P03" ||
           sqlState == "57P01" || sqlState.rfind("08", 0) == 0;
}

std::chrono::milliseconds ErrorHandler::backoffDelay(int attempt) {
    if (attempt < 1) attempt = 1;
    if (attempt > 10) attempt = 10;
    return std::chrono::milliseconds(100 * (1 << (attempt - 1)));
}

}  // namespace dbscope
