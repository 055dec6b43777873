#pragma once

#include "cell_value.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace scrub {

bool isLeapYear(int year) noexcept;
int daysInMonth(int year, int month) noexcept;
bool isValidDate(const Date &date) noexcept;

/**
 * Best-effort calendar date parser.
 *
 * Accepted forms (surrounding whitespace ignored, an optional trailing
 * time-of-day such as "T10:30:00Z" or " 10:30" is discarded):
 *   YYYY-MM-DD, YYYY/MM/DD, YYYY.MM.DD, YYYYMMDD
 *   MM/DD/YYYY, MM-DD-YYYY              (read as DD/MM when the first field
 *                                        exceeds 12 and the second does not)
 *   DD.MM.YYYY                          (same swap rule, reversed)
 *   MM/DD/YY                            (69-99 -> 19xx, 00-68 -> 20xx)
 *   "Jan 5, 2024", "January 5 2024", "5 Jan 2024", "05-Jan-2024"
 *
 * Returns std::nullopt for anything else or for impossible dates.
 */
std::optional<Date> parseDate(std::string_view text);

/**
 * True when @p text literally matches one of the auto-detection patterns
 * YYYY-MM-DD, MM/DD/YYYY or MM-DD-YYYY. Values are not range-checked.
 */
bool matchesDatePattern(std::string_view text);

/**
 * strftime-style rendering. Supported directives: %Y %y %m %d %e %B %b %A
 * %a %j %%. Unknown directives are copied through unchanged. An invalid
 * date renders as an empty string.
 */
std::string formatDate(const Date &date, std::string_view format);

} // namespace scrub
