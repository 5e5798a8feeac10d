#include "Unpack.h"
#include "CommonUtils.h"
#include "FinetypeExceptions.h"
#include "ReportWriter.h"
#include "TypeMapping.h"

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <utility>

namespace {
constexpr const char* kUnknown = "unknown";
constexpr const char* kBooleanLabel = "technology.development.boolean";

Json::Value annotation(Json::Value value, const std::string& label, double confidence, const std::string& sqlType) {
    Json::Value out(Json::objectValue);
    out["value"] = std::move(value);
    out["type"] = label;
    out["confidence"] = confidence;
    out["sql_type"] = sqlType;
    return out;
}

Json::Value classifyScalar(const std::string& text, const ValueClassifier& classifier) {
    if (text.empty()) return annotation(Json::Value(text), kUnknown, 0.0, "VARCHAR");
    try {
        const ClassificationResult result = classifier.classify(text);
        return annotation(Json::Value(text), result.label, result.confidence, TypeMapping::toSqlType(result.label));
    } catch (const Finetype::ClassifierException& ex) {
        std::cerr << "[Finetype][Unpack] classification failed, leaving field unknown: " << ex.what() << "\n";
        return annotation(Json::Value(text), kUnknown, 0.0, "VARCHAR");
    }
}
} // namespace

namespace Unpack {

std::string numberText(const Json::Value& number) {
    if (number.type() == Json::intValue) return std::to_string(number.asInt64());
    if (number.type() == Json::uintValue) return std::to_string(number.asUInt64());

    const double value = number.asDouble();
    char buf[32];
    for (int precision = 1; precision <= 17; ++precision) {
        std::snprintf(buf, sizeof(buf), "%.*g", precision, value);
        if (std::strtod(buf, nullptr) == value) break;
    }
    std::string text = buf;
    // A real stays visibly real: 2.0 not 2.
    if (text.find_first_of(".e") == std::string::npos) text += ".0";
    return text;
}

Json::Value annotate(const Json::Value& value, const ValueClassifier& classifier) {
    switch (value.type()) {
        case Json::objectValue: {
            Json::Value out(Json::objectValue);
            for (const auto& name : value.getMemberNames()) out[name] = annotate(value[name], classifier);
            return out;
        }
        case Json::arrayValue: {
            Json::Value out(Json::arrayValue);
            for (const auto& item : value) out.append(annotate(item, classifier));
            return out;
        }
        case Json::stringValue:
            return classifyScalar(value.asString(), classifier);
        case Json::intValue:
        case Json::uintValue:
        case Json::realValue:
            return classifyScalar(numberText(value), classifier);
        case Json::booleanValue:
            return annotation(value, kBooleanLabel, 1.0, "BOOLEAN");
        case Json::nullValue:
            break;
    }
    return annotation(Json::Value(Json::nullValue), kUnknown, 0.0, "VARCHAR");
}

std::optional<std::string> unpackJson(const std::string& text, const ValueClassifier& classifier) {
    const std::string trimmed = CommonUtils::trim(text);
    Json::CharReaderBuilder builder;
    Json::CharReaderBuilder::strictMode(&builder.settings_);
    builder["strictRoot"] = false;
    const std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errors;
    if (!reader->parse(trimmed.data(), trimmed.data() + trimmed.size(), &root, &errors)) return std::nullopt;
    return ReportWriter::toJsonText(annotate(root, classifier), false);
}

} // namespace Unpack
