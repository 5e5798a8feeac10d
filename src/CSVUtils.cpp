#include "CSVUtils.h"
#include "CommonUtils.h"
#include "FinetypeExceptions.h"

#include <unordered_set>

namespace {
std::string trimUnquotedField(const std::string& value) {
    const size_t start = value.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    const size_t end = value.find_last_not_of(" \t");
    return value.substr(start, end - start + 1);
}
} // namespace

namespace CSVUtils {
void skipBOM(std::istream& is) {
    static const unsigned char kBom[3] = {0xEF, 0xBB, 0xBF};
    if (!is.good()) return;

    const std::streampos start = is.tellg();
    for (unsigned char expected : kBom) {
        const int c = is.peek();
        if (c == EOF || static_cast<unsigned char>(c) != expected) {
            is.clear(is.rdstate() & ~std::ios::eofbit);
            if (start != std::streampos(-1)) is.seekg(start);
            return;
        }
        is.get();
    }
}

std::vector<std::string> parseCSVLine(std::istream& is,
                                      char delimiter,
                                      LineStatus* status,
                                      const ParseLimits& limits) {
    if (status) *status = LineStatus{};
    if (is.peek() == EOF) return {};

    std::vector<std::string> row;
    std::string field;
    bool inQuotes = false;
    bool fieldQuoted = false;
    bool sawDelimiter = false;
    size_t physicalLines = 1;
    char c;

    auto flagLimit = [&]() {
        if (status) status->limitExceeded = true;
    };
    auto pushField = [&]() {
        row.push_back(fieldQuoted ? field : trimUnquotedField(field));
        field.clear();
        fieldQuoted = false;
        if (limits.maxColumns > 0 && row.size() > limits.maxColumns) flagLimit();
    };
    auto appendChar = [&](char ch) {
        field += ch;
        if (limits.maxFieldBytes > 0 && field.size() > limits.maxFieldBytes) flagLimit();
    };

    while (is.get(c)) {
        if (inQuotes) {
            if (c == '"') {
                if (is.peek() == '"') {
                    is.get();
                    appendChar('"');
                } else {
                    inQuotes = false;
                }
            } else {
                if (c == '\r' && is.peek() == '\n') is.get();
                if (c == '\r' || c == '\n') {
                    ++physicalLines;
                    if (limits.maxPhysicalLinesPerRecord > 0 && physicalLines > limits.maxPhysicalLinesPerRecord) {
                        flagLimit();
                    }
                    appendChar('\n');
                } else {
                    appendChar(c);
                }
            }
        } else if (c == '"' && trimUnquotedField(field).empty() && !fieldQuoted) {
            field.clear();
            inQuotes = true;
            fieldQuoted = true;
        } else if (c == delimiter) {
            pushField();
            sawDelimiter = true;
        } else if (c == '\r' || c == '\n') {
            if (c == '\r' && is.peek() == '\n') is.get();
            break;
        } else if (!fieldQuoted) {
            appendChar(c);
        }

        if (status && status->limitExceeded) break;
    }

    if (inQuotes && status) status->malformed = true;

    if (!sawDelimiter && !fieldQuoted && trimUnquotedField(field).empty()) return {};
    pushField();
    return row;
}

std::vector<std::string> normalizeHeader(const std::vector<std::string>& header) {
    std::vector<std::string> out;
    out.reserve(header.size());
    std::unordered_set<std::string> seen;

    for (size_t i = 0; i < header.size(); ++i) {
        std::string name = CommonUtils::trim(header[i]);
        if (name.empty()) name = "column_" + std::to_string(i + 1);

        std::string unique = name;
        for (size_t suffix = 2; seen.count(unique) > 0; ++suffix) {
            unique = name + "_" + std::to_string(suffix);
        }
        seen.insert(unique);
        out.push_back(std::move(unique));
    }
    return out;
}

bool isMissingToken(const std::string& value) {
    static const std::unordered_set<std::string> kMissing = {"", "na", "n/a", "null", "none", "nan", "-"};
    return kMissing.count(CommonUtils::toLower(CommonUtils::trim(value))) > 0;
}

std::vector<std::string> readLines(std::istream& is) {
    skipBOM(is);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(is, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (!line.empty()) lines.push_back(line);
    }
    return lines;
}

std::vector<std::optional<std::string>> readColumn(std::istream& is,
                                                   char delimiter,
                                                   const std::string& column,
                                                   bool missingTokensAsNull,
                                                   const ParseLimits& limits) {
    skipBOM(is);
    LineStatus status;
    const auto rawHeader = parseCSVLine(is, delimiter, &status, limits);
    if (rawHeader.empty()) throw Finetype::IOException("CSV input has no header row");
    if (status.malformed || status.limitExceeded) throw Finetype::ParseException("malformed CSV header row");

    const auto header = normalizeHeader(rawHeader);
    size_t index = header.size();
    for (size_t i = 0; i < header.size(); ++i) {
        if (header[i] == column) {
            index = i;
            break;
        }
    }
    if (index == header.size()) throw Finetype::IOException("Column not found in CSV header: " + column);

    std::vector<std::optional<std::string>> values;
    size_t record = 1;
    while (is.peek() != EOF) {
        ++record;
        const auto row = parseCSVLine(is, delimiter, &status, limits);
        if (status.malformed) {
            throw Finetype::ParseException("unterminated quoted field in record " + std::to_string(record));
        }
        if (status.limitExceeded) {
            throw Finetype::ParseException("CSV limits exceeded in record " + std::to_string(record));
        }
        // A blank line is a record with every cell empty.
        if (index >= row.size() || row[index].empty() || (missingTokensAsNull && isMissingToken(row[index]))) {
            values.emplace_back(std::nullopt);
        } else {
            values.emplace_back(row[index]);
        }
    }
    return values;
}
}
