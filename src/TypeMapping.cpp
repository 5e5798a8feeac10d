#include "TypeMapping.h"

#include <unordered_map>
#include <utility>
#include <vector>

namespace {
using Group = std::pair<std::string, std::vector<std::string>>;

std::unordered_map<std::string, std::string> buildTable() {
    const std::vector<Group> groups = {
        {"DATE", {"datetime.date.iso", "datetime.date.us_slash", "datetime.date.eu_slash", "datetime.date.eu_dot",
                  "datetime.date.long_full_month", "datetime.date.abbreviated_month",
                  "datetime.date.weekday_full_month", "datetime.date.weekday_abbreviated_month",
                  "datetime.date.ordinal", "datetime.date.julian", "datetime.date.iso_week",
                  "datetime.date.compact_ymd", "datetime.date.compact_mdy", "datetime.date.compact_dmy",
                  "datetime.date.short_ymd", "datetime.date.short_mdy", "datetime.date.short_dmy"}},
        {"TIME", {"datetime.time.hm_24h", "datetime.time.hms_24h", "datetime.time.hm_12h",
                  "datetime.time.hms_12h", "datetime.time.iso"}},
        {"TIMESTAMP", {"datetime.timestamp.iso_8601", "datetime.timestamp.iso_8601_compact",
                       "datetime.timestamp.iso_8601_microseconds", "datetime.timestamp.iso_microseconds",
                       "datetime.timestamp.american", "datetime.timestamp.american_24h",
                       "datetime.timestamp.european", "datetime.timestamp.sql_standard"}},
        {"TIMESTAMPTZ", {"datetime.timestamp.iso_8601_offset", "datetime.timestamp.rfc_2822",
                         "datetime.timestamp.rfc_2822_ordinal", "datetime.timestamp.rfc_3339"}},
        {"BIGINT", {"datetime.epoch.unix_seconds", "datetime.epoch.unix_milliseconds",
                    "datetime.epoch.unix_microseconds", "technology.hardware.ram_size",
                    "representation.numeric.integer_number", "representation.numeric.increment",
                    "representation.file.file_size"}},
        {"INTERVAL", {"datetime.duration.iso_8601"}},
        {"INTEGER", {"datetime.component.year", "datetime.component.day_of_month",
                     "geography.address.street_number"}},
        {"INET", {"technology.internet.ip_v4", "technology.internet.ip_v6", "technology.internet.ip_v4_with_port"}},
        {"SMALLINT", {"technology.internet.http_status_code", "technology.internet.port", "identity.person.age"}},
        {"UUID", {"technology.cryptographic.uuid"}},
        {"BOOLEAN", {"technology.development.boolean"}},
        {"DOUBLE", {"technology.hardware.screen_size", "geography.coordinate.latitude",
                    "geography.coordinate.longitude", "identity.person.height", "identity.person.weight",
                    "representation.numeric.decimal_number", "representation.numeric.percentage",
                    "representation.numeric.scientific_notation"}},
        {"POINT", {"geography.coordinate.coordinates"}},
        {"JSON", {"container.object.json", "container.object.json_array"}},
    };

    std::unordered_map<std::string, std::string> table;
    for (const auto& [sqlType, labels] : groups) {
        for (const auto& label : labels) table.emplace(label, sqlType);
    }
    return table;
}
} // namespace

namespace TypeMapping {

std::string toSqlType(const std::string& label) {
    static const std::unordered_map<std::string, std::string> kTable = buildTable();
    const auto it = kTable.find(label);
    return it == kTable.end() ? "VARCHAR" : it->second;
}

} // namespace TypeMapping
