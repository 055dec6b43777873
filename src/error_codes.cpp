#include "error_codes.hpp"

namespace scrub {

// Error code information mapping
const std::unordered_map<ErrorCode, ErrorCodeInfo> &getErrorCodeInfo() {
  static const std::unordered_map<ErrorCode, ErrorCodeInfo> errorInfo = {
      // Validation errors
      {ErrorCode::INVALID_INPUT,
       {"Invalid input data or format", "Validation"}},
      {ErrorCode::EMPTY_DATASET,
       {"Dataset has no columns or no rows", "Validation"}},
      {ErrorCode::UNKNOWN_COLUMN,
       {"Column scope references a column that does not exist", "Validation"}},
      {ErrorCode::INVALID_PARAMETER,
       {"Operation parameter is outside its accepted domain", "Validation"}},
      {ErrorCode::SHAPE_MISMATCH,
       {"Columns and row identifiers are not aligned", "Validation"}},

      // Configuration errors
      {ErrorCode::CONFIGURATION_ERROR,
       {"Configuration loading or parsing failed", "Configuration"}},
      {ErrorCode::FILE_ERROR,
       {"File could not be read or written", "Configuration"}},

      // Processing errors
      {ErrorCode::OPERATION_FAILED,
       {"Cleaning operation failed", "Processing"}},
      {ErrorCode::DATA_INTEGRITY_ERROR,
       {"Dataset invariant violated", "Processing"}}};

  return errorInfo;
}

const char *getErrorCodeDescription(ErrorCode code) {
  const auto &info = getErrorCodeInfo();
  auto it = info.find(code);
  if (it != info.end()) {
    return it->second.description.c_str();
  }
  return "Unknown error";
}

std::string getErrorCategory(ErrorCode code) {
  const auto &info = getErrorCodeInfo();
  auto it = info.find(code);
  return it != info.end() ? it->second.category : "Unknown";
}

std::string errorCodeToString(ErrorCode code) {
  switch (code) {
  case ErrorCode::INVALID_INPUT:
    return "INVALID_INPUT";
  case ErrorCode::EMPTY_DATASET:
    return "EMPTY_DATASET";
  case ErrorCode::UNKNOWN_COLUMN:
    return "UNKNOWN_COLUMN";
  case ErrorCode::INVALID_PARAMETER:
    return "INVALID_PARAMETER";
  case ErrorCode::SHAPE_MISMATCH:
    return "SHAPE_MISMATCH";
  case ErrorCode::CONFIGURATION_ERROR:
    return "CONFIGURATION_ERROR";
  case ErrorCode::FILE_ERROR:
    return "FILE_ERROR";
  case ErrorCode::OPERATION_FAILED:
    return "OPERATION_FAILED";
  case ErrorCode::DATA_INTEGRITY_ERROR:
    return "DATA_INTEGRITY_ERROR";
  }
  return "UNKNOWN_ERROR";
}

} // namespace scrub
