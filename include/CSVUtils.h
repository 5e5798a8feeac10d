#pragma once

#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace CSVUtils {
// RFC 4180 style tokenization for column profiling and validation input.
struct ParseLimits {
    size_t maxFieldBytes = 8 * 1024 * 1024;           // 8 MiB
    size_t maxColumns = 20000;
    size_t maxPhysicalLinesPerRecord = 10000;
};

struct LineStatus {
    bool malformed = false;
    bool limitExceeded = false;
};

void skipBOM(std::istream& is);

/**
 * @brief Reads one logical record; quoted fields may span physical lines.
 *
 * Unquoted fields are trimmed of spaces and tabs. Returns an empty vector at
 * end of input or for a blank line.
 */
std::vector<std::string> parseCSVLine(std::istream& is,
                                      char delimiter,
                                      LineStatus* status = nullptr,
                                      const ParseLimits& limits = ParseLimits{});

// Empty names become column_N, duplicates get a _2, _3 ... suffix.
std::vector<std::string> normalizeHeader(const std::vector<std::string>& header);

// Case-insensitive NA, N/A, null, NULL, None, NaN, "-" and empty cells.
bool isMissingToken(const std::string& value);

// Non-empty lines with any trailing CR removed; for one-value-per-line inputs.
std::vector<std::string> readLines(std::istream& is);

/**
 * @brief Extracts one column by header name, one entry per data record.
 *
 * Empty cells, short rows and blank lines are null, so entry i is always data
 * record i. Missing-value tokens (NA, null, NaN, "-") stay literal unless
 * missingTokensAsNull is set.
 * @throws Finetype::IOException if the stream has no header or the column is absent.
 * @throws Finetype::ParseException on an unterminated quote or an exceeded limit.
 */
std::vector<std::optional<std::string>> readColumn(std::istream& is,
                                                   char delimiter,
                                                   const std::string& column,
                                                   bool missingTokensAsNull = false,
                                                   const ParseLimits& limits = ParseLimits{});
}
