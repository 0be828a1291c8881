#include "infrastructure/error_handling.h"
#include <mutex>
#include <deque>
#include <unordered_map>
#include <ctime>

namespace rentledger {

const char* errorToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "OK";
        case ErrorCode::INVALID_ADDRESS: return "Invalid address";
        case ErrorCode::UNAUTHORIZED: return "Unauthorized";
        case ErrorCode::INVALID_AMOUNT: return "Invalid amount";
        case ErrorCode::ROUND_NOT_FUNDED: return "Round not funded";
        case ErrorCode::ROUND_NOT_FINALIZED: return "Round not finalized";
        case ErrorCode::ROUND_NOT_FOUND: return "Round not found";
        case ErrorCode::ALREADY_CLAIMED: return "Already claimed";
        case ErrorCode::NO_ENTITLEMENT: return "No entitlement";
        case ErrorCode::DIVISION_BY_ZERO: return "Division by zero";
        case ErrorCode::INVALID_SNAPSHOT: return "Invalid snapshot";
        case ErrorCode::GRACE_PERIOD_ACTIVE: return "Grace period active";
        case ErrorCode::TRANSFER_FAILED: return "Transfer failed";
        case ErrorCode::REENTRANT_CALL: return "Reentrant call";
        case ErrorCode::DATABASE_ERROR: return "Database error";
        default: return "Unknown error";
    }
}

const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "OK";
        case ErrorCode::INVALID_ADDRESS: return "InvalidAddress";
        case ErrorCode::UNAUTHORIZED: return "Unauthorized";
        case ErrorCode::INVALID_AMOUNT: return "InvalidAmount";
        case ErrorCode::ROUND_NOT_FUNDED: return "RoundNotFunded";
        case ErrorCode::ROUND_NOT_FINALIZED: return "RoundNotFinalized";
        case ErrorCode::ROUND_NOT_FOUND: return "RoundNotFound";
        case ErrorCode::ALREADY_CLAIMED: return "AlreadyClaimed";
        case ErrorCode::NO_ENTITLEMENT: return "NoEntitlement";
        case ErrorCode::DIVISION_BY_ZERO: return "DivisionByZero";
        case ErrorCode::INVALID_SNAPSHOT: return "InvalidSnapshot";
        case ErrorCode::GRACE_PERIOD_ACTIVE: return "GracePeriodActive";
        case ErrorCode::TRANSFER_FAILED: return "TransferFailed";
        case ErrorCode::REENTRANT_CALL: return "ReentrantCall";
        case ErrorCode::DATABASE_ERROR: return "DatabaseError";
        default: return "Unknown";
    }
}

const char* severityToString(ErrorSeverity severity) {
    switch (severity) {
        case ErrorSeverity::INFO: return "INFO";
        case ErrorSeverity::WARNING: return "WARNING";
        case ErrorSeverity::ERROR: return "ERROR";
        case ErrorSeverity::CRITICAL: return "CRITICAL";
        default: return "UNKNOWN";
    }
}

Error makeError(ErrorCode code, const std::string& message) {
    Error err;
    err.code = code;
    err.severity = ErrorSeverity::ERROR;
    err.message = message;
    err.timestamp = static_cast<uint64_t>(std::time(nullptr));
    return err;
}

Error makeError(ErrorCode code, const std::string& message, const std::string& context) {
    Error err = makeError(code, message);
    err.context = context;
    return err;
}

struct ErrorHandler::Impl {
    std::function<void(const Error&)> handler;
    std::deque<Error> recentErrors;
    std::unordered_map<int, uint64_t> errorCounts;
    uint64_t totalErrors = 0;
    mutable std::mutex mtx;
    static constexpr size_t MAX_RECENT_ERRORS = 100;
};

ErrorHandler::ErrorHandler() : impl_(std::make_unique<Impl>()) {}

ErrorHandler& ErrorHandler::instance() {
    static ErrorHandler inst;
    return inst;
}

void ErrorHandler::setHandler(std::function<void(const Error&)> handler) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->handler = handler;
}

void ErrorHandler::handle(const Error& error) {
    std::function<void(const Error&)> handler;
    {
        std::lock_guard<std::mutex> lock(impl_->mtx);
        impl_->recentErrors.push_back(error);
        if (impl_->recentErrors.size() > Impl::MAX_RECENT_ERRORS) {
            impl_->recentErrors.pop_front();
        }
        impl_->totalErrors++;
        impl_->errorCounts[static_cast<int>(error.code)]++;
        handler = impl_->handler;
    }
    if (handler) handler(error);
}

std::vector<Error> ErrorHandler::getRecentErrors(size_t count) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    std::vector<Error> result;
    size_t start = impl_->recentErrors.size() > count ?
                   impl_->recentErrors.size() - count : 0;
    for (size_t i = impl_->recentErrors.size(); i > start; i--) {
        result.push_back(impl_->recentErrors[i - 1]);
    }
    return result;
}

void ErrorHandler::clearErrors() {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->recentErrors.clear();
    impl_->errorCounts.clear();
    impl_->totalErrors = 0;
}

uint64_t ErrorHandler::getErrorCount() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->totalErrors;
}

uint64_t ErrorHandler::getErrorCount(ErrorCode code) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    auto it = impl_->errorCounts.find(static_cast<int>(code));
    return it != impl_->errorCounts.end() ? it->second : 0;
}

Error ErrorHandler::getLastError() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (impl_->recentErrors.empty()) {
        return Error{};
    }
    return impl_->recentErrors.back();
}

}
