#pragma once

#include <string>
#include <functional>
#include <vector>
#include <memory>
#include <cstdint>

namespace rentledger {

enum class ErrorCode {
    OK = 0,
    INVALID_ADDRESS,
    UNAUTHORIZED,
    INVALID_AMOUNT,
    ROUND_NOT_FUNDED,
    ROUND_NOT_FINALIZED,
    ROUND_NOT_FOUND,
    ALREADY_CLAIMED,
    NO_ENTITLEMENT,
    DIVISION_BY_ZERO,
    INVALID_SNAPSHOT,
    GRACE_PERIOD_ACTIVE,
    TRANSFER_FAILED,
    REENTRANT_CALL,
    DATABASE_ERROR,
    UNKNOWN
};

enum class ErrorSeverity {
    INFO,
    WARNING,
    ERROR,
    CRITICAL
};

struct Error {
    ErrorCode code;
    ErrorSeverity severity;
    std::string message;
    std::string context;
    uint64_t timestamp;

    Error() : code(ErrorCode::OK), severity(ErrorSeverity::INFO), timestamp(0) {}
    Error(ErrorCode c, const std::string& msg) : code(c), severity(ErrorSeverity::ERROR), message(msg), timestamp(0) {}
};

template<typename T>
class Result {
public:
    Result(T value) : value_(std::move(value)), error_(), hasValue_(true) {}
    Result(Error error) : value_(), error_(std::move(error)), hasValue_(false) {}

    bool ok() const { return hasValue_; }
    bool failed() const { return !hasValue_; }

    const T& value() const { return value_; }
    T& value() { return value_; }
    const Error& error() const { return error_; }
    ErrorCode code() const { return hasValue_ ? ErrorCode::OK : error_.code; }

    T valueOr(const T& defaultValue) const { return hasValue_ ? value_ : defaultValue; }

private:
    T value_;
    Error error_;
    bool hasValue_;
};

template<>
class Result<void> {
public:
    Result() : error_(), hasValue_(true) {}
    Result(Error error) : error_(std::move(error)), hasValue_(false) {}

    bool ok() const { return hasValue_; }
    bool failed() const { return !hasValue_; }
    const Error& error() const { return error_; }
    ErrorCode code() const { return hasValue_ ? ErrorCode::OK : error_.code; }

private:
    Error error_;
    bool hasValue_;
};

// Process-wide sink for rejected operations. Keeps per-code counters and a
// bounded history; an optional handler sees every error as it is reported.
class ErrorHandler {
public:
    static ErrorHandler& instance();

    void setHandler(std::function<void(const Error&)> handler);
    void handle(const Error& error);

    std::vector<Error> getRecentErrors(size_t count = 10) const;
    void clearErrors();

    uint64_t getErrorCount() const;
    uint64_t getErrorCount(ErrorCode code) const;
    Error getLastError() const;

private:
    ErrorHandler();
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

const char* errorToString(ErrorCode code);
const char* errorCodeName(ErrorCode code);
const char* severityToString(ErrorSeverity severity);

Error makeError(ErrorCode code, const std::string& message);
Error makeError(ErrorCode code, const std::string& message, const std::string& context);

#define RENTLEDGER_CHECK(expr, code, msg) if (!(expr)) return rentledger::makeError(code, msg)

}
