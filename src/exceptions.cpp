#include "exceptions.hpp"
#include <nlohmann/json.hpp>
#include <random>
#include <sstream>

namespace scrub {

std::string ScrubException::generateCorrelationId() {
    thread_local std::mt19937 gen(std::random_device{}());
    thread_local std::uniform_int_distribution<> dis(0, 15);

    std::stringstream ss;
    for (int i = 0; i < 8; ++i) {
        ss << std::hex << dis(gen);
    }
    return ss.str();
}

ScrubException::ScrubException(ErrorCode code, std::string message, ErrorContext context)
    : errorCode_(code), message_(std::move(message)), context_(std::move(context)),
      correlationId_(generateCorrelationId()), timestamp_(std::chrono::system_clock::now()) {
}

std::string ScrubException::toLogString() const {
    std::stringstream ss;
    ss << "[" << correlationId_ << "] "
       << "ErrorCode=" << static_cast<int>(errorCode_)
       << " (" << errorCodeToString(errorCode_) << ") "
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

std::string ScrubException::toJsonString() const {
    nlohmann::json j;
    j["correlationId"] = correlationId_;
    j["errorCode"] = static_cast<int>(errorCode_);
    j["error"] = errorCodeToString(errorCode_);
    j["message"] = message_;
    j["timestamp"] = std::chrono::duration_cast<std::chrono::milliseconds>(
                         timestamp_.time_since_epoch())
                         .count();
    if (!context_.empty()) {
        j["context"] = context_;
    }
    return j.dump();
}

void ScrubException::addContext(const std::string& key, const std::string& value) {
    context_[key] = value;
}

void ScrubException::setCorrelationId(const std::string& correlationId) {
    correlationId_ = correlationId;
}

ValidationException::ValidationException(ErrorCode code, std::string message,
                                         std::string field, std::string value,
                                         ErrorContext context)
    : ScrubException(code, std::move(message), std::move(context)),
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
    ss << "[VALIDATION] " << ScrubException::toLogString();
    if (!field_.empty()) {
        ss << " Field=\"" << field_ << "\"";
    }
    return ss.str();
}

OperationException::OperationException(ErrorCode code, std::string message,
                                       std::string operation, ErrorContext context)
    : ScrubException(code, std::move(message), std::move(context)),
      operation_(std::move(operation)) {
    if (!operation_.empty()) {
        addContext("operation", operation_);
    }
}

std::string OperationException::toLogString() const {
    std::stringstream ss;
    ss << "[OPERATION] " << ScrubException::toLogString();
    if (!operation_.empty()) {
        ss << " Operation=\"" << operation_ << "\"";
    }
    return ss.str();
}

ConfigException::ConfigException(ErrorCode code, std::string message,
                                 std::string configPath, ErrorContext context)
    : ScrubException(code, std::move(message), std::move(context)),
      configPath_(std::move(configPath)) {
    if (!configPath_.empty()) {
        addContext("config_path", configPath_);
    }
}

std::string ConfigException::toLogString() const {
    std::stringstream ss;
    ss << "[CONFIG] " << ScrubException::toLogString();
    return ss.str();
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

OperationException createOperationError(ErrorCode code,
                                        const std::string& operation,
                                        const std::string& details) {
    ErrorContext context;
    context["details"] = details;
    return OperationException(code, getErrorCodeDescription(code), operation, context);
}

bool isValidationError(const std::exception& ex) {
    return dynamic_cast<const ValidationException*>(&ex) != nullptr;
}

bool isConfigError(const std::exception& ex) {
    return dynamic_cast<const ConfigException*>(&ex) != nullptr;
}

} // namespace scrub
