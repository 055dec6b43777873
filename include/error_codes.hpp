#pragma once

#include <functional> // Needed for std::hash
#include <string>
#include <type_traits>
#include <unordered_map>

namespace scrub {

// Error codes organized by category
enum class ErrorCode {
  // Validation errors (1000-1999)
  INVALID_INPUT = 1000,     // Malformed job document or value
  EMPTY_DATASET = 1001,     // Zero columns or zero rows
  UNKNOWN_COLUMN = 1002,    // Column scope names an absent column (strict)
  INVALID_PARAMETER = 1003, // Operation parameter out of its domain
  SHAPE_MISMATCH = 1004,    // Column lengths or row ids disagree

  // Configuration errors (3000-3999)
  CONFIGURATION_ERROR = 3000,
  FILE_ERROR = 3001,

  // Processing errors (4000-4999)
  OPERATION_FAILED = 4000,
  DATA_INTEGRITY_ERROR = 4001
};

// Error code metadata
struct ErrorCodeInfo {
  std::string description;
  std::string category;
};

const std::unordered_map<ErrorCode, ErrorCodeInfo> &getErrorCodeInfo();

} // namespace scrub

// Hash support for ErrorCode keys in unordered_map
namespace std {
template <> struct hash<scrub::ErrorCode> {
  size_t operator()(const scrub::ErrorCode code) const noexcept {
    using Underlying = std::underlying_type_t<scrub::ErrorCode>;
    return std::hash<Underlying>{}(static_cast<Underlying>(code));
  }
};
} // namespace std

namespace scrub {
// Utility functions
const char *getErrorCodeDescription(ErrorCode code);
std::string getErrorCategory(ErrorCode code);
std::string errorCodeToString(ErrorCode code);
} // namespace scrub
