#include "job_exceptions.hpp"
#include <iomanip>
#include <random>
#include <sstream>

namespace mdjobs {

const char* getErrorCodeDescription(ErrorCode code) {
    switch (code) {
        case ErrorCode::INVALID_INPUT: return "Invalid input data or format";
        case ErrorCode::MISSING_FIELD: return "Required field is missing";
        case ErrorCode::INVALID_FORMAT: return "Value has an invalid format";
        case ErrorCode::INVALID_RANGE: return "Value is outside acceptable range";
        case ErrorCode::UNAUTHORIZED: return "Authentication required or credentials invalid";
        case ErrorCode::TOKEN_EXPIRED: return "Authentication token has expired";
        case ErrorCode::INVALID_CREDENTIALS: return "Invalid credentials";
        case ErrorCode::DATABASE_ERROR: return "Database operation failed";
        case ErrorCode::NETWORK_ERROR: return "Network communication failed";
        case ErrorCode::LOCK_TIMEOUT: return "Timed out acquiring a lock";
        case ErrorCode::RESOURCE_EXHAUSTED: return "System resources exhausted";
        case ErrorCode::CONFIGURATION_ERROR: return "Configuration is invalid";
        case ErrorCode::JOB_NOT_FOUND: return "Job not found";
        case ErrorCode::JOB_ALREADY_RUNNING: return "Job is already running";
        case ErrorCode::INVALID_JOB_STATE: return "Invalid job state transition";
        case ErrorCode::PROCESSING_FAILED: return "Job processing failed";
        case ErrorCode::SCAN_NOT_FOUND: return "Scan not found";
        case ErrorCode::PROVIDER_ERROR: return "Market data provider request failed";
        case ErrorCode::PROVIDER_TIMEOUT: return "Market data provider request timed out";
        case ErrorCode::EMPTY_RESULT: return "No data returned for the requested range";
    }
    return "Unknown error";
}

std::string JobsException::generateCorrelationId() {
    static thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<> dis(0, 15);

    std::stringstream ss;
    for (int i = 0; i < 8; ++i) {
        ss << std::hex << dis(gen);
    }
    return ss.str();
}

JobsException::JobsException(ErrorCode code, std::string message, ErrorContext context)
    : errorCode_(code), message_(std::move(message)), context_(std::move(context)),
      correlationId_(generateCorrelationId()), timestamp_(std::chrono::system_clock::now()) {
}

std::string JobsException::toLogString() const {
    std::stringstream ss;
    ss << "[" << correlationId_ << "] "
       << "ErrorCode=" << static_cast<int>(errorCode_) << " "
       << "Message=\"" << message_ << "\"";

    if (!context_.empty()) {
        ss << " Context={";
        bool first = true;
        for (const auto& [key, value] : context_) {
            if (!first) ss << ", ";
            ss << key << "=\"" << value << "\"";
            first = false;
        }
        ss << "}";
    }

    return ss.str();
}

std::string JobsException::toJsonString() const {
    std::stringstream ss;
    ss << "{"
       << "\"correlationId\":\"" << correlationId_ << "\","
       << "\"errorCode\":" << static_cast<int>(errorCode_) << ","
       << "\"message\":\"" << message_ << "\","
       << "\"timestamp\":\"" << std::chrono::duration_cast<std::chrono::milliseconds>(timestamp_.time_since_epoch()).count() << "\"";

    if (!context_.empty()) {
        ss << ",\"context\":{";
        bool first = true;
        for (const auto& [key, value] : context_) {
            if (!first) ss << ",";
            ss << "\"" << key << "\":\"" << value << "\"";
            first = false;
        }
        ss << "}";
    }

    ss << "}";
    return ss.str();
}

void JobsException::addContext(const std::string& key, const std::string& value) {
    context_[key] = value;
}

void JobsException::setCorrelationId(const std::string& correlationId) {
    correlationId_ = correlationId;
}

ValidationException::ValidationException(ErrorCode code, std::string message,
                                         std::string field, std::string value,
                                         ErrorContext context)
    : JobsException(code, std::move(message), std::move(context)),
      field_(std::move(field)), value_(std::move(value)) {
    if (!field_.empty()) {
        addContext("field", field_);
    }
    if (!value_.empty()) {
        addContext("value", value_);
    }
}

std::string ValidationException::toLogString() const {
    std::stringstream ss;
    ss << "[VALIDATION] " << JobsException::toLogString();
    if (!field_.empty()) {
        ss << " Field=\"" << field_ << "\"";
    }
    if (!value_.empty()) {
        ss << " Value=\"" << value_ << "\"";
    }
    return ss.str();
}

SystemException::SystemException(ErrorCode code, std::string message,
                                 std::string component, ErrorContext context)
    : JobsException(code, std::move(message), std::move(context)),
      component_(std::move(component)) {
    if (!component_.empty()) {
        addContext("component", component_);
    }
}

std::string SystemException::toLogString() const {
    std::stringstream ss;
    ss << "[SYSTEM] " << JobsException::toLogString();
    if (!component_.empty()) {
        ss << " Component=\"" << component_ << "\"";
    }
    return ss.str();
}

BusinessException::BusinessException(ErrorCode code, std::string message,
                                     std::string operation, ErrorContext context)
    : JobsException(code, std::move(message), std::move(context)),
      operation_(std::move(operation)) {
    if (!operation_.empty()) {
        addContext("operation", operation_);
    }
}

std::string BusinessException::toLogString() const {
    std::stringstream ss;
    ss << "[BUSINESS] " << JobsException::toLogString();
    if (!operation_.empty()) {
        ss << " Operation=\"" << operation_ << "\"";
    }
    return ss.str();
}

ProviderException::ProviderException(std::optional<int> httpStatus, std::string message,
                                     ErrorCode code, ErrorContext context)
    : JobsException(code, std::move(message), std::move(context)),
      httpStatus_(httpStatus) {
    if (httpStatus_) {
        addContext("http_status", std::to_string(*httpStatus_));
    }
}

bool ProviderException::isTransient() const {
    return isTransientStatus(httpStatus_);
}

std::string ProviderException::toLogString() const {
    std::stringstream ss;
    ss << "[PROVIDER] " << JobsException::toLogString();
    ss << " Status=" << (httpStatus_ ? std::to_string(*httpStatus_) : "none");
    return ss.str();
}

AuthException::AuthException(std::string message, ErrorContext context)
    : JobsException(ErrorCode::UNAUTHORIZED, std::move(message), std::move(context)) {
}

std::string AuthException::toLogString() const {
    return "[AUTH] " + JobsException::toLogString();
}

bool isTransientStatus(const std::optional<int>& httpStatus) {
    if (!httpStatus) {
        return true;
    }
    const int status = *httpStatus;
    return status == 401 || status == 429 || status >= 500;
}

ValidationException createValidationError(const std::string& field,
                                          const std::string& value,
                                          const std::string& reason) {
    ErrorContext context;
    context["reason"] = reason;
    return ValidationException(ErrorCode::INVALID_INPUT,
                               "Validation failed: " + reason,
                               field, value, context);
}

SystemException createSystemError(ErrorCode code,
                                  const std::string& component,
                                  const std::string& details) {
    ErrorContext context;
    context["details"] = details;
    return SystemException(code, getErrorCodeDescription(code), component, context);
}

BusinessException createBusinessError(ErrorCode code,
                                      const std::string& operation,
                                      const std::string& details) {
    ErrorContext context;
    context["details"] = details;
    return BusinessException(code, getErrorCodeDescription(code), operation, context);
}

bool isValidationError(const std::exception& ex) {
    return dynamic_cast<const ValidationException*>(&ex) != nullptr;
}

bool isSystemError(const std::exception& ex) {
    return dynamic_cast<const SystemException*>(&ex) != nullptr;
}

bool isBusinessError(const std::exception& ex) {
    return dynamic_cast<const BusinessException*>(&ex) != nullptr;
}

bool isProviderError(const std::exception& ex) {
    return dynamic_cast<const ProviderException*>(&ex) != nullptr;
}

} // namespace mdjobs
