#include "Normalizer.h"
#include "CommonUtils.h"

#include <json/json.h>

#include <array>
#include <cstdio>
#include <memory>
#include <unordered_map>

namespace {
using NormalizeFn = std::optional<std::string> (*)(std::string_view value, const std::string& label);

std::optional<uint32_t> parseU32(const std::string& text) {
    const auto parsed = CommonUtils::parseUInt64(text);
    if (!parsed || *parsed > 0xFFFFFFFFull) return std::nullopt;
    return static_cast<uint32_t>(*parsed);
}

std::string formatDate(uint32_t y, uint32_t m, uint32_t d) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04u-%02u-%02u", y, m, d);
    return buf;
}

std::optional<std::string> validateDateParts(const std::string& year, const std::string& month, const std::string& day) {
    const auto y = parseU32(year);
    const auto m = parseU32(month);
    const auto d = parseU32(day);
    if (!y || !m || !d) return std::nullopt;
    if (*y < 1 || *y > 9999 || *m < 1 || *m > 12 || *d < 1) return std::nullopt;
    if (static_cast<int>(*d) > Normalizer::daysInMonth(static_cast<int>(*y), static_cast<int>(*m))) return std::nullopt;
    return formatDate(*y, *m, *d);
}

std::optional<std::string> validateIsoDate(const std::string& iso) {
    const auto parts = CommonUtils::splitAny(iso, "-");
    if (parts.size() != 3) return std::nullopt;
    return validateDateParts(parts[0], parts[1], parts[2]);
}

std::optional<uint32_t> monthNumber(const std::string& name) {
    static const std::unordered_map<std::string, uint32_t> kMonths = {
        {"january", 1}, {"jan", 1},
        {"february", 2}, {"feb", 2},
        {"march", 3}, {"mar", 3},
        {"april", 4}, {"apr", 4},
        {"may", 5},
        {"june", 6}, {"jun", 6},
        {"july", 7}, {"jul", 7},
        {"august", 8}, {"aug", 8},
        {"september", 9}, {"sep", 9}, {"sept", 9},
        {"october", 10}, {"oct", 10},
        {"november", 11}, {"nov", 11},
        {"december", 12}, {"dec", 12},
    };
    const auto it = kMonths.find(CommonUtils::toLower(name));
    if (it == kMonths.end()) return std::nullopt;
    return it->second;
}

std::string stripAlphaSuffix(const std::string& token) {
    size_t end = token.size();
    while (end > 0 && std::isalpha(static_cast<unsigned char>(token[end - 1]))) --end;
    return token.substr(0, end);
}

// "January 15, 2024", "15 Jan 2024", "Monday, January 15, 2024", "Jan 1st, 2024"
std::optional<std::string> normalizeNamedMonthDate(const std::string& value) {
    static const std::array<const char*, 7> kWeekdays = {
        "monday", "tuesday", "wednesday", "thursday", "friday", "saturday", "sunday"};

    std::string v = value;
    const size_t comma = value.find(", ");
    if (comma != std::string::npos) {
        const std::string before = CommonUtils::toLower(value.substr(0, comma));
        for (const char* weekday : kWeekdays) {
            if (CommonUtils::startsWith(before, weekday)) {
                v = CommonUtils::trim(value.substr(comma + 2));
                break;
            }
        }
    }

    std::optional<uint32_t> year;
    std::optional<uint32_t> month;
    std::optional<uint32_t> day;
    for (const auto& token : CommonUtils::splitAny(v, " ,-", true)) {
        if (const auto m = monthNumber(token)) {
            month = m;
        } else if (const auto num = parseU32(token)) {
            if (*num > 31) {
                year = num;
            } else if (!day) {
                day = num;
            }
        } else if (const auto ordinal = parseU32(stripAlphaSuffix(token))) {
            if (*ordinal <= 31 && !day) day = ordinal;
        }
    }

    if (!year || !month || !day) return std::nullopt;
    return validateDateParts(std::to_string(*year), std::to_string(*month), std::to_string(*day));
}

std::optional<std::string> normalizeCompact(const std::string& v, size_t yPos, size_t mPos, size_t dPos) {
    if (v.size() != 8 || !CommonUtils::isAllDigits(v)) return std::nullopt;
    return validateDateParts(v.substr(yPos, 4), v.substr(mPos, 2), v.substr(dPos, 2));
}

enum class DateLayout { YMD, MDY, DMY, NAMED_MONTH, COMPACT_YMD, COMPACT_MDY, COMPACT_DMY };

std::optional<std::string> normalizeDate(std::string_view value, const std::string& label) {
    static const std::unordered_map<std::string, DateLayout> kLayouts = {
        {"datetime.date.iso", DateLayout::YMD},
        {"datetime.date.short_ymd", DateLayout::YMD},
        {"datetime.date.us_slash", DateLayout::MDY},
        {"datetime.date.short_mdy", DateLayout::MDY},
        {"datetime.date.eu_slash", DateLayout::DMY},
        {"datetime.date.eu_dot", DateLayout::DMY},
        {"datetime.date.short_dmy", DateLayout::DMY},
        {"datetime.date.long_full_month", DateLayout::NAMED_MONTH},
        {"datetime.date.abbreviated_month", DateLayout::NAMED_MONTH},
        {"datetime.date.weekday_full_month", DateLayout::NAMED_MONTH},
        {"datetime.date.weekday_abbreviated_month", DateLayout::NAMED_MONTH},
        {"datetime.date.compact_ymd", DateLayout::COMPACT_YMD},
        {"datetime.date.compact_mdy", DateLayout::COMPACT_MDY},
        {"datetime.date.compact_dmy", DateLayout::COMPACT_DMY},
    };

    std::string v = CommonUtils::trim(value);
    const auto it = kLayouts.find(label);
    if (it == kLayouts.end()) return v;

    switch (it->second) {
        case DateLayout::YMD:
            std::replace(v.begin(), v.end(), '/', '-');
            return validateIsoDate(v);
        case DateLayout::MDY:
        case DateLayout::DMY: {
            const auto parts = CommonUtils::splitAnyN(v, it->second == DateLayout::MDY ? "/-" : "/.-", 3);
            if (parts.size() != 3) return std::nullopt;
            const std::string first = CommonUtils::trim(parts[0]);
            const std::string second = CommonUtils::trim(parts[1]);
            const std::string year = Normalizer::expandTwoDigitYear(CommonUtils::trim(parts[2]));
            if (it->second == DateLayout::MDY) return validateDateParts(year, first, second);
            return validateDateParts(year, second, first);
        }
        case DateLayout::NAMED_MONTH:
            return normalizeNamedMonthDate(v);
        case DateLayout::COMPACT_YMD:
            return normalizeCompact(v, 0, 4, 6);
        case DateLayout::COMPACT_MDY:
            return normalizeCompact(v, 4, 0, 2);
        case DateLayout::COMPACT_DMY:
            return normalizeCompact(v, 4, 2, 0);
    }
    return v;
}

void eraseAll(std::string& s, const std::string& token) {
    for (size_t pos = s.find(token); pos != std::string::npos; pos = s.find(token)) {
        s.erase(pos, token.size());
    }
}

std::optional<std::string> normalize12hTime(const std::string& value) {
    std::string v = CommonUtils::toUpper(value);
    const bool isPm = v.find("PM") != std::string::npos || v.find("P.M.") != std::string::npos;
    const bool isAm = v.find("AM") != std::string::npos || v.find("A.M.") != std::string::npos;
    if (!isPm && !isAm) return value;

    for (const char* marker : {"A.M.", "P.M.", "AM", "PM"}) eraseAll(v, marker);
    const auto parts = CommonUtils::splitAny(CommonUtils::trim(v), ":");

    auto hour = parseU32(CommonUtils::trim(parts[0]));
    std::optional<uint32_t> minute = 0u;
    std::optional<uint32_t> second = 0u;
    if (parts.size() > 1) minute = parseU32(CommonUtils::trim(parts[1]));
    if (parts.size() > 2) second = parseU32(CommonUtils::trim(parts[2]));
    if (!hour || !minute || !second) return std::nullopt;

    if (*hour > 12) return std::nullopt;
    if (isPm && *hour != 12) *hour += 12;
    if (isAm && *hour == 12) *hour = 0;
    if (*hour > 23 || *minute > 59 || *second > 59) return std::nullopt;

    char buf[16];
    std::snprintf(buf, sizeof(buf), "%02u:%02u:%02u", *hour, *minute, *second);
    return std::string(buf);
}

std::optional<std::string> normalizeTime(std::string_view value, const std::string& label) {
    const std::string v = CommonUtils::trim(value);
    if (label == "datetime.time.hm_24h") return v + ":00";
    if (label == "datetime.time.hm_12h" || label == "datetime.time.hms_12h") return normalize12hTime(v);
    return v;
}

std::optional<std::string> normalizeTimestamp(std::string_view value, const std::string&) {
    std::string v = CommonUtils::trim(value);
    if (v.empty()) return std::nullopt;
    return v;
}

std::optional<std::string> normalizeEpoch(std::string_view value, const std::string&) {
    std::string v = CommonUtils::trim(value);
    if (!CommonUtils::parseInt64(v)) return std::nullopt;
    return v;
}

std::optional<std::string> passThrough(std::string_view value, const std::string&) {
    return std::string(value);
}

std::optional<std::string> normalizeBoolean(const std::string& value) {
    static const std::unordered_map<std::string, bool> kTokens = {
        {"true", true}, {"yes", true}, {"y", true}, {"1", true}, {"on", true}, {"t", true},
        {"false", false}, {"no", false}, {"n", false}, {"0", false}, {"off", false}, {"f", false},
    };
    const auto it = kTokens.find(CommonUtils::toLower(CommonUtils::trim(value)));
    if (it == kTokens.end()) return std::nullopt;
    return std::string(it->second ? "true" : "false");
}

std::optional<std::string> normalizeDevelopment(std::string_view value, const std::string& label) {
    if (label == "technology.development.boolean") return normalizeBoolean(std::string(value));
    return CommonUtils::trim(value);
}

std::optional<std::string> normalizeCryptographic(std::string_view value, const std::string& label) {
    if (label != "technology.cryptographic.uuid") return CommonUtils::trim(value);

    std::string hex;
    for (char c : CommonUtils::toLower(CommonUtils::trim(value))) {
        if (std::isxdigit(static_cast<unsigned char>(c))) hex.push_back(c);
    }
    if (hex.size() != 32) return std::nullopt;
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
           hex.substr(16, 4) + "-" + hex.substr(20, 12);
}

std::optional<std::string> normalizeInternet(std::string_view value, const std::string& label) {
    std::string v = CommonUtils::trim(value);
    if (label == "technology.internet.ip_v4") {
        const auto octets = CommonUtils::splitAny(v, ".");
        if (octets.size() != 4) return std::nullopt;
        for (const auto& octet : octets) {
            const auto n = CommonUtils::parseUInt64(octet);
            if (!n || *n > 255) return std::nullopt;
        }
        return v;
    }
    if (label == "technology.internet.http_status_code") {
        const auto n = CommonUtils::parseUInt64(v);
        if (!n || *n < 100 || *n > 599) return std::nullopt;
        return v;
    }
    if (label == "technology.internet.port") {
        const auto n = CommonUtils::parseUInt64(v);
        if (!n || *n > 65535) return std::nullopt;
        return v;
    }
    return v;
}

std::string keepChars(const std::string& v, bool keepDecimalPoint) {
    std::string out;
    for (char c : v) {
        if (std::isdigit(static_cast<unsigned char>(c)) || c == '-' || c == '+' || (keepDecimalPoint && c == '.')) {
            out.push_back(c);
        }
    }
    return out;
}

std::optional<std::string> normalizeNumeric(std::string_view value, const std::string& label) {
    std::string v = CommonUtils::trim(value);
    if (label == "representation.numeric.integer_number" || label == "representation.numeric.increment") {
        std::string clean = keepChars(v, false);
        if (!CommonUtils::parseInt64(clean)) return std::nullopt;
        return clean;
    }
    if (label == "representation.numeric.decimal_number") {
        std::string clean = keepChars(v, true);
        if (!CommonUtils::parseDouble(clean)) return std::nullopt;
        return clean;
    }
    if (label == "representation.numeric.percentage") {
        while (!v.empty() && v.back() == '%') v.pop_back();
        std::string clean = keepChars(CommonUtils::trim(v), true);
        if (!CommonUtils::parseDouble(clean)) return std::nullopt;
        return clean;
    }
    if (label == "representation.numeric.scientific_notation") {
        if (!CommonUtils::parseDouble(v)) return std::nullopt;
        return v;
    }
    return v;
}

bool isWellFormedJson(const std::string& text) {
    Json::CharReaderBuilder builder;
    Json::CharReaderBuilder::strictMode(&builder.settings_);
    builder["strictRoot"] = false;
    builder["rejectDupKeys"] = false;
    const std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errors;
    return reader->parse(text.data(), text.data() + text.size(), &root, &errors);
}

std::optional<std::string> normalizeObject(std::string_view value, const std::string& label) {
    std::string v = CommonUtils::trim(value);
    if (label != "container.object.json") return v;
    if (!isWellFormedJson(v)) return std::nullopt;
    return v;
}

const std::unordered_map<std::string, NormalizeFn>& familyTable() {
    static const std::unordered_map<std::string, NormalizeFn> kFamilies = {
        {"datetime.date", &normalizeDate},
        {"datetime.time", &normalizeTime},
        {"datetime.timestamp", &normalizeTimestamp},
        {"datetime.epoch", &normalizeEpoch},
        {"datetime.duration", &passThrough},
        {"datetime.component", &passThrough},
        {"datetime.offset", &passThrough},
        {"technology.development", &normalizeDevelopment},
        {"technology.cryptographic", &normalizeCryptographic},
        {"technology.internet", &normalizeInternet},
        {"representation.numeric", &normalizeNumeric},
        {"container.object", &normalizeObject},
    };
    return kFamilies;
}
} // namespace

namespace Normalizer {

std::optional<std::string> normalize(std::string_view value, const std::string& label) {
    const auto segments = CommonUtils::splitAnyN(label, ".", 3);
    const std::string family = segments.size() >= 2 ? segments[0] + "." + segments[1] : label;

    const auto& table = familyTable();
    const auto it = table.find(family);
    if (it == table.end()) return CommonUtils::trim(value);
    return it->second(value, label);
}

std::string expandTwoDigitYear(const std::string& year) {
    if (year.size() != 2 || !CommonUtils::isAllDigits(year)) return year;
    return (year < "50" ? "20" : "19") + year;
}

bool isLeapYear(int year) {
    return (year % 4 == 0 && year % 100 != 0) || (year % 400 == 0);
}

int daysInMonth(int year, int month) {
    static constexpr int kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) return 0;
    if (month == 2 && isLeapYear(year)) return 29;
    return kDays[month - 1];
}

} // namespace Normalizer
