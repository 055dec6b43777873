#include "date_parser.hpp"
#include "string_utils.hpp"
#include <array>
#include <iomanip>
#include <regex>
#include <sstream>

namespace scrub {

namespace {

constexpr std::array<const char *, 12> kMonthNames = {
    "January", "February", "March",     "April",   "May",      "June",
    "July",    "August",   "September", "October", "November", "December"};

constexpr std::array<const char *, 7> kWeekdayNames = {
    "Sunday", "Monday", "Tuesday", "Wednesday", "Thursday", "Friday",
    "Saturday"};

// Optional trailing time of day, discarded after matching
const std::string kTimeSuffix =
    R"((?:(?:T|\s+)\d{1,2}:\d{2}(?::\d{2}(?:\.\d+)?)?(?:\s*[AaPp][Mm])?)"
    R"((?:Z|\s*[+-]\d{2}:?\d{2})?)?)";

const std::regex &isoPattern() {
  static const std::regex pattern(R"(^(\d{4})([-/.])(\d{1,2})\2(\d{1,2}))" +
                                  kTimeSuffix + "$");
  return pattern;
}

const std::regex &compactPattern() {
  static const std::regex pattern(R"(^(\d{4})(\d{2})(\d{2})$)");
  return pattern;
}

const std::regex &usPattern() {
  static const std::regex pattern(
      R"(^(\d{1,2})([-/.])(\d{1,2})\2(\d{4}|\d{2}))" + kTimeSuffix + "$");
  return pattern;
}

const std::regex &monthFirstPattern() {
  static const std::regex pattern(
      R"(^([A-Za-z]{3,9})\.?\s+(\d{1,2})(?:st|nd|rd|th)?,?\s+(\d{4}))" +
      kTimeSuffix + "$");
  return pattern;
}

const std::regex &dayFirstPattern() {
  static const std::regex pattern(
      R"(^(\d{1,2})(?:st|nd|rd|th)?[\s-]+([A-Za-z]{3,9})\.?,?[\s-]+(\d{4}))" +
      kTimeSuffix + "$");
  return pattern;
}

std::optional<int> monthFromName(const std::string &name) {
  std::string lowered = string_utils::to_lower(name);
  if (lowered == "sept") {
    return 9;
  }
  for (size_t i = 0; i < kMonthNames.size(); ++i) {
    std::string full = string_utils::to_lower(kMonthNames[i]);
    if (lowered == full || lowered == full.substr(0, 3)) {
      return static_cast<int>(i) + 1;
    }
  }
  return std::nullopt;
}

std::optional<Date> makeDate(int year, int month, int day) {
  Date date{year, month, day};
  if (!isValidDate(date)) {
    return std::nullopt;
  }
  return date;
}

int expandTwoDigitYear(int year) {
  return year >= 69 ? 1900 + year : 2000 + year;
}

int dayOfYear(const Date &date) {
  int total = date.day;
  for (int m = 1; m < date.month; ++m) {
    total += daysInMonth(date.year, m);
  }
  return total;
}

// Sakamoto's method, 0 = Sunday
int dayOfWeek(const Date &date) {
  static constexpr std::array<int, 12> offsets = {0, 3, 2, 5, 0, 3,
                                                  5, 1, 4, 6, 2, 4};
  int y = date.year - (date.month < 3 ? 1 : 0);
  return (y + y / 4 - y / 100 + y / 400 + offsets[date.month - 1] +
          date.day) %
         7;
}

} // namespace

bool isLeapYear(int year) noexcept {
  return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int daysInMonth(int year, int month) noexcept {
  static constexpr std::array<int, 12> days = {31, 28, 31, 30, 31, 30,
                                               31, 31, 30, 31, 30, 31};
  if (month < 1 || month > 12) {
    return 0;
  }
  if (month == 2 && isLeapYear(year)) {
    return 29;
  }
  return days[month - 1];
}

bool isValidDate(const Date &date) noexcept {
  return date.year >= 1 && date.year <= 9999 && date.month >= 1 &&
         date.month <= 12 && date.day >= 1 &&
         date.day <= daysInMonth(date.year, date.month);
}

std::optional<Date> parseDate(std::string_view text) {
  const std::string value(string_utils::trim(text));
  if (value.empty()) {
    return std::nullopt;
  }

  std::smatch match;
  if (std::regex_match(value, match, isoPattern())) {
    return makeDate(std::stoi(match[1].str()), std::stoi(match[3].str()),
                    std::stoi(match[4].str()));
  }

  if (std::regex_match(value, match, compactPattern())) {
    return makeDate(std::stoi(match[1].str()), std::stoi(match[2].str()),
                    std::stoi(match[3].str()));
  }

  if (std::regex_match(value, match, usPattern())) {
    int first = std::stoi(match[1].str());
    int second = std::stoi(match[3].str());
    int year = std::stoi(match[4].str());
    if (match[4].length() == 2) {
      year = expandTwoDigitYear(year);
    }
    // Dotted dates are day first; slash and dash dates month first unless
    // that is impossible and the other order is not
    bool dayFirst = match[2].str() == ".";
    if (dayFirst ? (second > 12 && first <= 12) : (first > 12 && second <= 12)) {
      dayFirst = !dayFirst;
    }
    return dayFirst ? makeDate(year, second, first)
                    : makeDate(year, first, second);
  }

  if (std::regex_match(value, match, monthFirstPattern())) {
    auto month = monthFromName(match[1].str());
    if (!month) {
      return std::nullopt;
    }
    return makeDate(std::stoi(match[3].str()), *month,
                    std::stoi(match[2].str()));
  }

  if (std::regex_match(value, match, dayFirstPattern())) {
    auto month = monthFromName(match[2].str());
    if (!month) {
      return std::nullopt;
    }
    return makeDate(std::stoi(match[3].str()), *month,
                    std::stoi(match[1].str()));
  }

  return std::nullopt;
}

bool matchesDatePattern(std::string_view text) {
  static const std::regex patterns(
      R"(^(?:\d{4}-\d{2}-\d{2}|\d{2}/\d{2}/\d{4}|\d{2}-\d{2}-\d{4})$)");
  const std::string value(string_utils::trim(text));
  return std::regex_match(value, patterns);
}

std::string formatDate(const Date &date, std::string_view format) {
  if (!isValidDate(date)) {
    return {};
  }

  std::ostringstream out;
  out << std::setfill('0');

  for (size_t i = 0; i < format.size(); ++i) {
    char ch = format[i];
    if (ch != '%' || i + 1 == format.size()) {
      out << ch;
      continue;
    }

    char directive = format[++i];
    switch (directive) {
    case 'Y':
      out << std::setw(4) << date.year;
      break;
    case 'y':
      out << std::setw(2) << date.year % 100;
      break;
    case 'm':
      out << std::setw(2) << date.month;
      break;
    case 'd':
      out << std::setw(2) << date.day;
      break;
    case 'e':
      out << std::setfill(' ') << std::setw(2) << date.day
          << std::setfill('0');
      break;
    case 'B':
      out << kMonthNames[date.month - 1];
      break;
    case 'b':
      out << std::string(kMonthNames[date.month - 1]).substr(0, 3);
      break;
    case 'A':
      out << kWeekdayNames[dayOfWeek(date)];
      break;
    case 'a':
      out << std::string(kWeekdayNames[dayOfWeek(date)]).substr(0, 3);
      break;
    case 'j':
      out << std::setw(3) << dayOfYear(date);
      break;
    case '%':
      out << '%';
      break;
    default:
      out << '%' << directive;
      break;
    }
  }

  return out.str();
}

} // namespace scrub
