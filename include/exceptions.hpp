#pragma once

#include "error_codes.hpp"
#include <chrono>
#include <exception>
#include <string>
#include <unordered_map>

namespace scrub {

// Error context for additional debugging information
using ErrorContext = std::unordered_map<std::string, std::string>;

// Base exception with error context and correlation ID support
class ScrubException : public std::exception {
public:
    ScrubException(ErrorCode code, std::string message, ErrorContext context = {});

    ScrubException(const ScrubException& other) = default;
    ScrubException& operator=(const ScrubException& other) = default;
    ScrubException(ScrubException&& other) noexcept = default;
    ScrubException& operator=(ScrubException&& other) noexcept = default;

    virtual ~ScrubException() = default;

    // Accessors
    ErrorCode getCode() const { return errorCode_; }
    const std::string& getMessage() const { return message_; }
    const ErrorContext& getContext() const { return context_; }
    const std::string& getCorrelationId() const { return correlationId_; }
    std::chrono::system_clock::time_point getTimestamp() const { return timestamp_; }

    const char* what() const noexcept override { return message_.c_str(); }

    // Serialization for logging
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

// Input-shape and parameter errors
class ValidationException : public ScrubException {
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

// Failure local to one cleaning operation
class OperationException : public ScrubException {
public:
    OperationException(ErrorCode code, std::string message,
                       std::string operation = "",
                       ErrorContext context = {});

    const std::string& getOperation() const { return operation_; }

    std::string toLogString() const override;

private:
    std::string operation_;
};

// Configuration loading and validation errors
class ConfigException : public ScrubException {
public:
    ConfigException(ErrorCode code, std::string message,
                    std::string configPath = "",
                    ErrorContext context = {});

    const std::string& getConfigPath() const { return configPath_; }

    std::string toLogString() const override;

private:
    std::string configPath_;
};

// Create exceptions with common patterns
ValidationException createValidationError(const std::string& field,
                                          const std::string& value,
                                          const std::string& reason);

OperationException createOperationError(ErrorCode code,
                                        const std::string& operation,
                                        const std::string& details);

// Exception type checking
bool isValidationError(const std::exception& ex);
bool isConfigError(const std::exception& ex);

} // namespace scrub
