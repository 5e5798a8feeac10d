#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace Normalizer {

/**
 * @brief Canonical form of a value for its detected label.
 *
 * Dispatches on the label's domain.category, then on the full label.
 * std::nullopt means the value does not hold up as that type (do not cast it).
 * Labels without a rule get the trimmed value back.
 */
std::optional<std::string> normalize(std::string_view value, const std::string& label);

/// 00-49 -> 2000-2049, 50-99 -> 1950-1999; anything but two digits is returned as is.
std::string expandTwoDigitYear(const std::string& year);

bool isLeapYear(int year);
int daysInMonth(int year, int month);

} // namespace Normalizer
