#include "string_utils.hpp"
#include <algorithm>
#include <cctype>

namespace scrub {
namespace string_utils {

namespace {
constexpr std::string_view kWhitespace = " \t\n\r\f\v";
}

std::string_view trim_left(std::string_view str) noexcept {
  auto start = str.find_first_not_of(kWhitespace);
  return start == std::string_view::npos ? std::string_view{}
                                         : str.substr(start);
}

std::string_view trim_right(std::string_view str) noexcept {
  auto end = str.find_last_not_of(kWhitespace);
  return end == std::string_view::npos ? std::string_view{}
                                       : str.substr(0, end + 1);
}

std::string_view trim(std::string_view str) noexcept {
  return trim_left(trim_right(str));
}

bool iequals(std::string_view lhs, std::string_view rhs) noexcept {
  if (lhs.size() != rhs.size()) {
    return false;
  }

  return std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b) {
    return std::tolower(static_cast<unsigned char>(a)) ==
           std::tolower(static_cast<unsigned char>(b));
  });
}

std::string to_lower(std::string_view str) {
  std::string result(str);
  std::transform(result.begin(), result.end(), result.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return result;
}

std::string to_upper(std::string_view str) {
  std::string result(str);
  std::transform(result.begin(), result.end(), result.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return result;
}

std::string to_title(std::string_view str) {
  std::string result;
  result.reserve(str.size());
  bool atWordStart = true;
  for (char ch : str) {
    auto c = static_cast<unsigned char>(ch);
    if (std::isalpha(c)) {
      result += static_cast<char>(atWordStart ? std::toupper(c) : std::tolower(c));
      atWordStart = false;
    } else {
      result += ch;
      atWordStart = !std::isdigit(c);
    }
  }
  return result;
}

std::string strip_special(std::string_view str) {
  std::string result;
  result.reserve(str.size());
  for (char ch : str) {
    auto c = static_cast<unsigned char>(ch);
    if (std::isalnum(c) || std::isspace(c)) {
      result += ch;
    }
  }
  return result;
}

std::vector<std::string> split(std::string_view str, char delimiter) {
  std::vector<std::string> parts;
  std::size_t start = 0;
  while (true) {
    auto pos = str.find(delimiter, start);
    if (pos == std::string_view::npos) {
      parts.emplace_back(str.substr(start));
      break;
    }
    parts.emplace_back(str.substr(start, pos - start));
    start = pos + 1;
  }
  return parts;
}

} // namespace string_utils
} // namespace scrub
