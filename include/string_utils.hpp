#pragma once

#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace scrub {
namespace string_utils {

// ============================================================================
// String View Utilities
// ============================================================================

std::string_view trim_left(std::string_view str) noexcept;
std::string_view trim_right(std::string_view str) noexcept;
std::string_view trim(std::string_view str) noexcept;

bool iequals(std::string_view lhs, std::string_view rhs) noexcept;

// ============================================================================
// Case and character-class transforms (ASCII)
// ============================================================================

std::string to_lower(std::string_view str);
std::string to_upper(std::string_view str);

/**
 * Upper-cases the first letter of every alphabetic run and lower-cases the
 * rest, so "o'NEIL mcdonald" becomes "O'Neil Mcdonald".
 */
std::string to_title(std::string_view str);

/**
 * Drops every character that is neither alphanumeric nor whitespace.
 * Whitespace, including internal runs, is left as is.
 */
std::string strip_special(std::string_view str);

// ============================================================================
// Splitting and joining
// ============================================================================

std::vector<std::string> split(std::string_view str, char delimiter);

template <typename Container>
std::string join(const Container &items, std::string_view separator) {
  std::ostringstream out;
  bool first = true;
  for (const auto &item : items) {
    if (!first) {
      out << separator;
    }
    out << item;
    first = false;
  }
  return out.str();
}

} // namespace string_utils
} // namespace scrub
