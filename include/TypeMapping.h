#pragma once

#include <string>

namespace TypeMapping {

// Recommended SQL logical type for a label; VARCHAR when the label is not mapped.
std::string toSqlType(const std::string& label);

} // namespace TypeMapping
