#include "FinetypeConfig.h"
#include "CommonUtils.h"
#include "FinetypeExceptions.h"
#include "Validator.h"

#include <algorithm>
#include <fstream>
#include <limits>
#include <unordered_map>
#include <utility>

namespace {
constexpr const char* kUsage =
    "Usage: finetype <taxonomy|check|validate|normalize|generate|infer|unpack|profile> "
    "[--config path] [--taxonomy dir] [--input file.csv|values.txt|-] [--column name] [--label domain.category.type] "
    "[--value text] [--strategy quarantine|set_null|ffill|bfill] [--output plain|json|csv] [--file path] "
    "[--samples N] [--priority 0..255] [--seed N] [--max-failures N] [--sample-size N] "
    "[--min-agreement 0..1] [--delimiter ,] [--verbose true|false] [--localized true|false] "
    "[--confidence true|false]";

template <typename T>
T parseIntegerStrict(const std::string& value, const std::string& key, int64_t minValue, int64_t maxValue) {
    const auto parsed = CommonUtils::parseInt64(CommonUtils::trim(value));
    if (!parsed) {
        throw Finetype::ConfigurationException("Invalid integer for " + key + ": " + value);
    }
    if (*parsed < minValue) {
        throw Finetype::ConfigurationException("Value for " + key + " must be >= " + std::to_string(minValue));
    }
    if (*parsed > maxValue) {
        throw Finetype::ConfigurationException("Value for " + key + " must be <= " + std::to_string(maxValue));
    }
    return static_cast<T>(*parsed);
}

double parseDoubleStrict(const std::string& value, const std::string& key, double minValue) {
    const auto parsed = CommonUtils::parseDouble(CommonUtils::trim(value));
    if (!parsed) {
        throw Finetype::ConfigurationException("Invalid number for " + key + ": " + value);
    }
    if (*parsed < minValue) {
        throw Finetype::ConfigurationException("Value for " + key + " must be >= " + std::to_string(minValue));
    }
    return *parsed;
}

bool parseBoolStrict(const std::string& value, const std::string& key) {
    const std::string v = CommonUtils::toLower(CommonUtils::trim(value));
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw Finetype::ConfigurationException("Invalid boolean for " + key + ": " + value);
}

std::string stripStructuralTokensOutsideQuotes(const std::string& line) {
    std::string out;
    out.reserve(line.size());

    bool inQuotes = false;
    bool escaped = false;
    for (char c : line) {
        if (escaped) {
            out.push_back(c);
            escaped = false;
        } else if (c == '\\') {
            out.push_back(c);
            escaped = true;
        } else if (c == '"') {
            inQuotes = !inQuotes;
            out.push_back(c);
        } else if (inQuotes || (c != '{' && c != '}')) {
            out.push_back(c);
        }
    }

    const size_t lastNonSpace = out.find_last_not_of(" \t\r\n");
    if (lastNonSpace != std::string::npos && out[lastNonSpace] == ',') {
        out.erase(lastNonSpace, 1);
    }
    return out;
}

size_t findSeparatorOutsideQuotes(const std::string& line, char sep) {
    bool inQuotes = false;
    bool escaped = false;
    for (size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (escaped) {
            escaped = false;
        } else if (c == '\\') {
            escaped = true;
        } else if (c == '"') {
            inQuotes = !inQuotes;
        } else if (!inQuotes && c == sep) {
            return i;
        }
    }
    return std::string::npos;
}

std::string maybeUnquote(std::string value) {
    value = CommonUtils::trim(value);
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

std::string normalizeConfigKey(const std::string& key) {
    std::string out = CommonUtils::toLower(CommonUtils::trim(key));
    while (CommonUtils::startsWith(out, "-")) out.erase(0, 1);
    std::replace(out.begin(), out.end(), '-', '_');
    return out;
}

bool isBoolKey(const std::string& key) {
    return key == "verbose" || key == "localized" || key == "confidence";
}

void assignKeyValue(FinetypeConfig& config, const std::string& key, const std::string& value) {
    if (key == "delimiter") {
        if (value == "\\t" || CommonUtils::toLower(value) == "tab") {
            config.delimiter = '\t';
            return;
        }
        if (value.size() != 1) throw Finetype::ConfigurationException("delimiter expects a single character");
        config.delimiter = value[0];
        return;
    }
    if (key == "priority") {
        config.priority = parseIntegerStrict<int>(value, key, 0, 255);
        return;
    }
    if (key == "seed") {
        config.seed = parseIntegerStrict<uint64_t>(value, key, 0, std::numeric_limits<int64_t>::max());
        return;
    }
    if (key == "min_agreement") {
        config.minAgreement = parseDoubleStrict(value, key, 0.0);
        return;
    }

    struct SizeRule {
        size_t FinetypeConfig::*member;
        int64_t minValue;
    };

    static const std::unordered_map<std::string, std::string FinetypeConfig::*> rawStringFields = {
        {"taxonomy", &FinetypeConfig::taxonomyPath},
        {"input", &FinetypeConfig::inputPath},
        {"file", &FinetypeConfig::filePath},
        {"column", &FinetypeConfig::column},
        {"label", &FinetypeConfig::label},
        {"value", &FinetypeConfig::value}
    };
    static const std::unordered_map<std::string, std::string FinetypeConfig::*> lowerStringFields = {
        {"strategy", &FinetypeConfig::strategy},
        {"output", &FinetypeConfig::outputFormat}
    };
    static const std::unordered_map<std::string, bool FinetypeConfig::*> boolFields = {
        {"verbose", &FinetypeConfig::verbose},
        {"localized", &FinetypeConfig::localized},
        {"confidence", &FinetypeConfig::showConfidence}
    };
    static const std::unordered_map<std::string, SizeRule> sizeFields = {
        {"samples", {&FinetypeConfig::samples, 1}},
        {"max_failures", {&FinetypeConfig::maxFailures, 0}},
        {"sample_size", {&FinetypeConfig::sampleSize, 1}}
    };

    if (const auto it = rawStringFields.find(key); it != rawStringFields.end()) {
        config.*(it->second) = value;
        return;
    }
    if (const auto it = lowerStringFields.find(key); it != lowerStringFields.end()) {
        config.*(it->second) = CommonUtils::toLower(value);
        return;
    }
    if (const auto it = boolFields.find(key); it != boolFields.end()) {
        config.*(it->second) = parseBoolStrict(value, key);
        return;
    }
    if (const auto it = sizeFields.find(key); it != sizeFields.end()) {
        config.*(it->second.member) = parseIntegerStrict<size_t>(
            value, key, it->second.minValue, std::numeric_limits<int64_t>::max());
        return;
    }
    throw Finetype::ConfigurationException("Unknown config key: " + key);
}

void applyFile(FinetypeConfig& config, const std::string& configPath) {
    std::ifstream in(configPath);
    if (!in) throw Finetype::ConfigurationException("Could not open config file: " + configPath);

    std::string line;
    size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        line = CommonUtils::trim(line);
        if (line.empty() || line[0] == '#') continue;

        // Loose YAML (key: value) and loose JSON ("key": "value",) both land here.
        line = CommonUtils::trim(stripStructuralTokensOutsideQuotes(line));
        if (line.empty()) continue;

        const size_t sep = findSeparatorOutsideQuotes(line, ':');
        if (sep == std::string::npos) {
            throw Finetype::ConfigurationException(
                "Config parse error at line " + std::to_string(lineNo) + ": '" + line + "' -> expected key: value");
        }

        const std::string key = normalizeConfigKey(maybeUnquote(line.substr(0, sep)));
        const std::string value = maybeUnquote(line.substr(sep + 1));
        try {
            assignKeyValue(config, key, value);
        } catch (const Finetype::FinetypeException& ex) {
            throw Finetype::ConfigurationException(
                "Config parse error at line " + std::to_string(lineNo) + ": '" + line + "' -> " + ex.what());
        }
    }
}

void requireField(const std::string& value, const std::string& flag, const std::string& command) {
    if (value.empty()) {
        throw Finetype::ConfigurationException(command + " requires --" + flag);
    }
}
} // namespace

const std::vector<std::string>& FinetypeConfig::commands() {
    static const std::vector<std::string> kCommands = {
        "taxonomy", "check", "validate", "normalize", "generate", "infer", "unpack", "profile"};
    return kCommands;
}

FinetypeConfig FinetypeConfig::fromArgs(int argc, char* argv[]) {
    if (argc < 2) {
        throw Finetype::ConfigurationException(kUsage);
    }
    const std::string command = CommonUtils::toLower(argv[1]);
    if (command == "--help" || command == "-h" || command == "help") {
        throw Finetype::ConfigurationException(kUsage);
    }

    FinetypeConfig config;
    config.command = command;

    std::vector<std::pair<std::string, std::string>> flags;
    for (int i = 2; i < argc; ++i) {
        const std::string arg = argv[i];
        if (!CommonUtils::startsWith(arg, "--")) {
            throw Finetype::ConfigurationException("Unexpected argument: " + arg + "\n" + kUsage);
        }
        const std::string key = normalizeConfigKey(arg);
        const bool hasValue = i + 1 < argc && !CommonUtils::startsWith(argv[i + 1], "--");
        if (key == "config") {
            if (!hasValue) throw Finetype::ConfigurationException("--config expects a path");
            config.configPath = argv[++i];
            continue;
        }
        if (!hasValue) {
            // Bare boolean switches: --verbose, --localized, --confidence.
            if (!isBoolKey(key)) throw Finetype::ConfigurationException("Missing value for " + arg);
            flags.emplace_back(key, "true");
            continue;
        }
        flags.emplace_back(key, argv[++i]);
    }

    if (!config.configPath.empty()) applyFile(config, config.configPath);
    for (const auto& [key, value] : flags) {
        assignKeyValue(config, key, value);
    }
    config.validate();
    return config;
}

FinetypeConfig FinetypeConfig::fromFile(const std::string& configPath, const FinetypeConfig& base) {
    FinetypeConfig config = base;
    applyFile(config, configPath);
    config.validate();
    return config;
}

void FinetypeConfig::validate() const {
    const auto isIn = [](const std::string& value, const std::vector<std::string>& allowed) {
        return std::find(allowed.begin(), allowed.end(), value) != allowed.end();
    };

    if (!command.empty() && !isIn(command, commands())) {
        throw Finetype::ConfigurationException("Unknown command: " + command + "\n" + kUsage);
    }
    if (!isIn(outputFormat, {"plain", "json", "csv"})) {
        throw Finetype::ConfigurationException("output must be one of: plain, json, csv");
    }
    if (!invalidStrategyFromString(strategy)) {
        throw Finetype::ConfigurationException("strategy must be one of: quarantine, set_null, ffill, bfill");
    }
    if (minAgreement < 0.0 || minAgreement > 1.0) {
        throw Finetype::ConfigurationException("min_agreement must be within [0,1]");
    }
    if (sampleSize == 0) {
        throw Finetype::ConfigurationException("sample_size must be > 0");
    }
    if (samples == 0) {
        throw Finetype::ConfigurationException("samples must be > 0");
    }
    if (priority < 0 || priority > 255) {
        throw Finetype::ConfigurationException("priority must be within [0,255]");
    }
    if (taxonomyPath.empty()) {
        throw Finetype::ConfigurationException("taxonomy path must not be empty");
    }

    if (command == "validate") {
        requireField(label, "label", command);
        if (value.empty()) {
            requireField(inputPath, "input", command);
            requireField(column, "column", command);
        }
    } else if (command == "normalize") {
        requireField(label, "label", command);
        requireField(value, "value", command);
    } else if (command == "infer" || command == "unpack") {
        // One value inline, or a file (or - for stdin) with one value per line.
        if (inputPath.empty()) requireField(value, "value", command);
    } else if (command == "profile") {
        requireField(inputPath, "input", command);
        requireField(column, "column", command);
    }
}
