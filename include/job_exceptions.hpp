#pragma once

#include <chrono>
#include <exception>
#include <optional>
#include <string>
#include <unordered_map>

namespace mdjobs {

class JobsException;
class ValidationException;
class SystemException;
class BusinessException;
class ProviderException;

// Consolidated error codes organized by category
enum class ErrorCode {
    // Validation errors (1000-1999)
    INVALID_INPUT = 1000,
    MISSING_FIELD = 1001,
    INVALID_FORMAT = 1002,
    INVALID_RANGE = 1003,

    // Authentication errors (2000-2999)
    UNAUTHORIZED = 2000,
    TOKEN_EXPIRED = 2002,
    INVALID_CREDENTIALS = 2003,

    // System errors (3000-3999)
    DATABASE_ERROR = 3000,
    NETWORK_ERROR = 3001,
    LOCK_TIMEOUT = 3004,
    RESOURCE_EXHAUSTED = 3005,
    CONFIGURATION_ERROR = 3006,

    // Business logic errors (4000-4999)
    JOB_NOT_FOUND = 4000,
    JOB_ALREADY_RUNNING = 4001,
    INVALID_JOB_STATE = 4002,
    PROCESSING_FAILED = 4003,
    SCAN_NOT_FOUND = 4007,

    // Market data provider errors (5000-5999)
    PROVIDER_ERROR = 5000,
    PROVIDER_TIMEOUT = 5001,
    EMPTY_RESULT = 5002
};

using ErrorContext = std::unordered_map<std::string, std::string>;

const char* getErrorCodeDescription(ErrorCode code);

// Base exception with error context and correlation ID support
class JobsException : public std::exception {
public:
    JobsException(ErrorCode code, std::string message, ErrorContext context = {});

    JobsException(const JobsException& other) = default;
    JobsException& operator=(const JobsException& other) = default;
    JobsException(JobsException&& other) noexcept = default;
    JobsException& operator=(JobsException&& other) noexcept = default;

    virtual ~JobsException() = default;

    ErrorCode getCode() const { return errorCode_; }
    const std::string& getMessage() const { return message_; }
    const ErrorContext& getContext() const { return context_; }
    const std::string& getCorrelationId() const { return correlationId_; }
    std::chrono::system_clock::time_point getTimestamp() const { return timestamp_; }

    const char* what() const noexcept override { return message_.c_str(); }

    virtual std::string toLogString() const;
    std::string toJsonString() const;

    void addContext(const std::string& key, const std::string& value);
    void setCorrelationId(const std::string& correlationId);

protected:
    ErrorCode errorCode_;
    std::string message_;
    ErrorContext context_;
    std::string correlationId_;
    std::chrono::system_clock::time_point timestamp_;

    static std::string generateCorrelationId();
};

// Input and configuration validation errors
class ValidationException : public JobsException {
public:
    ValidationException(ErrorCode code, std::string message,
                        std::string field = "", std::string value = "",
                        ErrorContext context = {});

    const std::string& getField() const { return field_; }
    const std::string& getValue() const { return value_; }

    std::string toLogString() const override;

private:
    std::string field_;
    std::string value_;
};

// Infrastructure errors (database, network, configuration)
class SystemException : public JobsException {
public:
    SystemException(ErrorCode code, std::string message,
                    std::string component = "",
                    ErrorContext context = {});

    const std::string& getComponent() const { return component_; }

    std::string toLogString() const override;

private:
    std::string component_;
};

// Job workflow errors (unknown job, overlap, illegal state transition)
class BusinessException : public JobsException {
public:
    BusinessException(ErrorCode code, std::string message,
                      std::string operation = "",
                      ErrorContext context = {});

    const std::string& getOperation() const { return operation_; }

    std::string toLogString() const override;

private:
    std::string operation_;
};

// Failure reported by the external price-history provider. The HTTP status is
// absent for transport failures and deadline overruns.
class ProviderException : public JobsException {
public:
    ProviderException(std::optional<int> httpStatus, std::string message,
                      ErrorCode code = ErrorCode::PROVIDER_ERROR,
                      ErrorContext context = {});

    const std::optional<int>& getHttpStatus() const { return httpStatus_; }
    bool isTransient() const;

    std::string toLogString() const override;

private:
    std::optional<int> httpStatus_;
};

// Authentication failures while pre-warming the provider token
class AuthException : public JobsException {
public:
    explicit AuthException(std::string message, ErrorContext context = {});

    std::string toLogString() const override;
};

// Statuses worth retrying: transport failure (none), 401, 429, and 5xx
bool isTransientStatus(const std::optional<int>& httpStatus);

ValidationException createValidationError(const std::string& field,
                                          const std::string& value,
                                          const std::string& reason);

SystemException createSystemError(ErrorCode code,
                                  const std::string& component,
                                  const std::string& details);

BusinessException createBusinessError(ErrorCode code,
                                      const std::string& operation,
                                      const std::string& details);

bool isValidationError(const std::exception& ex);
bool isSystemError(const std::exception& ex);
bool isBusinessError(const std::exception& ex);
bool isProviderError(const std::exception& ex);

template<typename ExceptionType>
const ExceptionType* asException(const std::exception& ex) {
    return dynamic_cast<const ExceptionType*>(&ex);
}

} // namespace mdjobs
