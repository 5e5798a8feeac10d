#include "ReportWriter.h"
#include "CommonUtils.h"
#include "FinetypeExceptions.h"

#include <iomanip>
#include <memory>
#include <sstream>

namespace {
constexpr size_t kSampleDisplayMax = 60;
constexpr size_t kSampleDisplayKeep = 57;

std::string displaySample(const std::string& sample) {
    if (sample.size() <= kSampleDisplayMax) return sample;
    return sample.substr(0, kSampleDisplayKeep) + "...";
}

std::string percent(double rate, int precision) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(precision) << rate * 100.0;
    return os.str();
}

std::string fixed4(double value) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(4) << value;
    return os.str();
}

Json::Value stringArray(const std::vector<std::string>& values) {
    Json::Value out(Json::arrayValue);
    for (const auto& v : values) out.append(v);
    return out;
}

template <typename T>
Json::Value optionalString(const std::optional<T>& value) {
    return value ? Json::Value(*value) : Json::Value(Json::nullValue);
}
} // namespace

std::optional<OutputFormat> outputFormatFromString(const std::string& text) {
    const std::string lowered = CommonUtils::toLower(CommonUtils::trim(text));
    if (lowered == "plain") return OutputFormat::PLAIN;
    if (lowered == "json") return OutputFormat::JSON;
    if (lowered == "csv") return OutputFormat::CSV;
    return std::nullopt;
}

namespace ReportWriter {

std::string toJsonText(const Json::Value& value, bool pretty) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = pretty ? "  " : "";
    builder["emitUTF8"] = true;
    return Json::writeString(builder, value);
}

std::string quoteCsvField(const std::string& field) {
    std::string out = "\"";
    for (char c : field) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

std::string formatCheckReport(const CheckReport& report, bool verbose) {
    std::ostringstream out;
    out << "Finetype Taxonomy Check - " << report.totalDefinitions << " definitions\n";
    out << std::string(60, '=') << "\n\n";

    out << "SUMMARY\n";
    out << "  Generators found:   " << report.generatorsFound << "/" << report.totalDefinitions << "\n";
    out << "  Generators missing: " << report.generatorsMissing << "\n";
    out << "  Fully passing:      " << report.fullyPassing << "\n";
    out << "  Has failures:       " << report.hasFailures << "\n";
    out << "  No pattern:         " << report.noPattern << " (untestable)\n";
    out << "  Samples:            " << report.totalPassed << "/" << report.totalSamples << " passed ("
        << percent(report.passRate(), 1) << "%)\n\n";

    out << "BY DOMAIN\n";
    for (const auto& [domain, results] : report.byDomain()) {
        size_t passing = 0;
        size_t missing = 0;
        for (const auto* r : results) {
            if (r->passed()) ++passing;
            if (!r->generatorExists) ++missing;
        }
        out << "  " << (passing == results.size() ? "[ok]" : "[!!]") << " " << std::left << std::setw(20) << domain
            << " " << passing << "/" << results.size() << " passing";
        if (missing > 0) out << " (" << missing << " missing generators)";
        out << "\n";
    }
    out << "\n";

    std::vector<const DefinitionCheckResult*> missing;
    std::vector<const DefinitionCheckResult*> failing;
    std::vector<const DefinitionCheckResult*> noPattern;
    for (const auto& r : report.results) {
        if (!r.generatorExists) {
            missing.push_back(&r);
            continue;
        }
        if (r.samplesFailed > 0) failing.push_back(&r);
        if (!r.hasPattern) noPattern.push_back(&r);
    }

    if (!missing.empty()) {
        out << "MISSING GENERATORS (" << missing.size() << ")\n";
        for (const auto* r : missing) {
            out << "  - " << r->key << " (priority: " << static_cast<int>(r->releasePriority) << ")\n";
        }
        out << "\n";
    }

    if (!failing.empty()) {
        out << "VALIDATION FAILURES (" << failing.size() << ")\n";
        for (const auto* r : failing) {
            out << "  " << r->key << ": " << r->samplesFailed << "/" << r->samplesGenerated << " failed ("
                << percent(r->passRate(), 0) << "% pass rate)\n";
            if (!verbose) continue;
            for (const auto& failure : r->failures) {
                out << "    " << toJsonText(Json::Value(displaySample(failure.sample)), false) << " -> "
                    << failure.reason.describe() << "\n";
            }
        }
        out << "\n";
    }

    if (verbose && !noPattern.empty()) {
        out << "NO VALIDATION PATTERN (" << noPattern.size() << ")\n";
        for (const auto* r : noPattern) {
            out << "  - " << r->key << " (priority: " << static_cast<int>(r->releasePriority) << ")\n";
        }
        out << "\n";
    }

    if (report.allPassed()) {
        out << "ALL CHECKS PASSED\n";
    } else {
        out << "CHECKS FAILED: " << report.generatorsMissing << " missing generators, " << report.hasFailures
            << " definitions with failures\n";
    }
    return out.str();
}

Json::Value checkReportToJson(const CheckReport& report) {
    Json::Value root(Json::objectValue);
    Json::Value summary(Json::objectValue);
    summary["total_definitions"] = Json::UInt64(report.totalDefinitions);
    summary["generators_found"] = Json::UInt64(report.generatorsFound);
    summary["generators_missing"] = Json::UInt64(report.generatorsMissing);
    summary["fully_passing"] = Json::UInt64(report.fullyPassing);
    summary["has_failures"] = Json::UInt64(report.hasFailures);
    summary["no_pattern"] = Json::UInt64(report.noPattern);
    summary["total_samples"] = Json::UInt64(report.totalSamples);
    summary["total_passed"] = Json::UInt64(report.totalPassed);
    summary["total_failed"] = Json::UInt64(report.totalFailed);
    summary["pass_rate"] = report.passRate();
    summary["all_passed"] = report.allPassed();
    root["summary"] = summary;

    Json::Value results(Json::arrayValue);
    for (const auto& r : report.results) {
        Json::Value item(Json::objectValue);
        item["key"] = r.key;
        item["domain"] = r.domain;
        item["priority"] = static_cast<int>(r.releasePriority);
        item["generator_exists"] = r.generatorExists;
        item["has_pattern"] = r.hasPattern;
        item["samples_generated"] = Json::UInt64(r.samplesGenerated);
        item["samples_passed"] = Json::UInt64(r.samplesPassed);
        item["samples_failed"] = Json::UInt64(r.samplesFailed);
        Json::Value failures(Json::arrayValue);
        for (const auto& f : r.failures) {
            Json::Value failure(Json::objectValue);
            failure["sample"] = f.sample;
            failure["reason"] = f.reason.describe();
            failures.append(failure);
        }
        item["failures"] = failures;
        results.append(item);
    }
    root["results"] = results;
    return root;
}

Json::Value definitionToJson(const Definition& definition) {
    Json::Value item(Json::objectValue);
    item["key"] = definition.key;
    item["title"] = optionalString(definition.title);
    item["broad_type"] = optionalString(definition.broadType);
    item["designation"] = designationToString(definition.designation);
    item["priority"] = static_cast<int>(definition.releasePriority);
    item["transform"] = optionalString(definition.transform);
    item["locales"] = stringArray(definition.locales);
    item["tier"] = stringArray(definition.tier);
    return item;
}

std::string formatTaxonomy(const Taxonomy& taxonomy,
                           const std::vector<const Definition*>& definitions,
                           OutputFormat format) {
    std::ostringstream out;
    switch (format) {
    case OutputFormat::JSON: {
        Json::Value labels(Json::arrayValue);
        for (const auto* def : definitions) labels.append(definitionToJson(*def));
        out << toJsonText(labels) << "\n";
        break;
    }
    case OutputFormat::CSV:
        out << "key,broad_type,priority,designation,title\n";
        for (const auto* def : definitions) {
            out << quoteCsvField(def->key) << "," << quoteCsvField(def->broadType.value_or("")) << ","
                << static_cast<int>(def->releasePriority) << "," << quoteCsvField(designationToString(def->designation))
                << "," << quoteCsvField(def->title.value_or("")) << "\n";
        }
        break;
    case OutputFormat::PLAIN:
        out << "Domains: " << CommonUtils::joinStrings(taxonomy.domains(), ", ") << "\n";
        out << "Total labels: " << taxonomy.size() << "\n\n";
        for (const auto* def : definitions) {
            out << def->key << " -> " << def->broadType.value_or("?") << " (priority: "
                << static_cast<int>(def->releasePriority) << ", " << designationToString(def->designation) << ")\n";
            if (def->title) out << "  " << *def->title << "\n";
        }
        out << "\n" << definitions.size() << " definitions shown\n";
        break;
    }
    return out.str();
}

std::string formatClassification(const std::string& text,
                                 const ClassificationResult& result,
                                 OutputFormat format,
                                 bool showConfidence) {
    std::ostringstream out;
    switch (format) {
    case OutputFormat::JSON: {
        Json::Value obj(Json::objectValue);
        obj["class"] = result.label;
        obj["input"] = text;
        if (showConfidence) obj["confidence"] = result.confidence;
        out << toJsonText(obj, false) << "\n";
        break;
    }
    case OutputFormat::CSV:
        out << quoteCsvField(text) << "," << quoteCsvField(result.label);
        if (showConfidence) out << "," << fixed4(result.confidence);
        out << "\n";
        break;
    case OutputFormat::PLAIN:
        out << result.label;
        if (showConfidence) out << "\t" << fixed4(result.confidence);
        out << "\n";
        break;
    }
    return out.str();
}

std::string formatClassifications(const std::vector<std::string>& texts,
                                  const std::vector<ClassificationResult>& results,
                                  OutputFormat format,
                                  bool showConfidence) {
    if (results.size() != texts.size()) {
        throw Finetype::ClassifierException("classifier returned " + std::to_string(results.size()) +
                                            " results for " + std::to_string(texts.size()) + " inputs");
    }
    std::string out;
    for (size_t i = 0; i < texts.size(); ++i) {
        out += formatClassification(texts[i], results[i], format, showConfidence);
    }
    return out;
}

Json::Value columnResultToJson(const std::string& column, const ColumnResult& result) {
    Json::Value obj(Json::objectValue);
    obj["column"] = column;
    obj["label"] = result.label;
    obj["confidence"] = result.confidence;
    obj["samples_used"] = Json::UInt64(result.samplesUsed);
    obj["disambiguation_applied"] = result.disambiguationApplied;
    obj["disambiguation_rule"] = optionalString(result.disambiguationRule);
    Json::Value votes(Json::arrayValue);
    for (const auto& [label, fraction] : result.voteDistribution) {
        Json::Value vote(Json::objectValue);
        vote["label"] = label;
        vote["fraction"] = fraction;
        votes.append(vote);
    }
    obj["votes"] = votes;
    return obj;
}

std::string formatColumnResult(const std::string& column, const ColumnResult& result, OutputFormat format) {
    std::ostringstream out;
    switch (format) {
    case OutputFormat::JSON:
        out << toJsonText(columnResultToJson(column, result)) << "\n";
        break;
    case OutputFormat::CSV:
        out << "column,label,confidence,samples_used,disambiguation_rule\n";
        out << quoteCsvField(column) << "," << quoteCsvField(result.label) << "," << fixed4(result.confidence) << ","
            << result.samplesUsed << "," << quoteCsvField(result.disambiguationRule.value_or("")) << "\n";
        break;
    case OutputFormat::PLAIN:
        out << "Column:     " << column << "\n";
        out << "Type:       " << result.label << "\n";
        out << "Confidence: " << fixed4(result.confidence) << "\n";
        out << "Samples:    " << result.samplesUsed << "\n";
        if (result.disambiguationRule) out << "Rule:       " << *result.disambiguationRule << "\n";
        out << "Votes:\n";
        for (const auto& [label, fraction] : result.voteDistribution) {
            out << "  " << std::left << std::setw(44) << label << " " << percent(fraction, 1) << "%\n";
        }
        break;
    }
    return out.str();
}

Json::Value columnValidationToJson(const std::string& label,
                                   InvalidStrategy strategy,
                                   const ColumnValidationResult& result) {
    Json::Value obj(Json::objectValue);
    obj["label"] = label;
    obj["strategy"] = invalidStrategyToString(strategy);

    Json::Value stats(Json::objectValue);
    stats["total"] = Json::UInt64(result.stats.totalCount);
    stats["valid"] = Json::UInt64(result.stats.validCount);
    stats["invalid"] = Json::UInt64(result.stats.invalidCount);
    stats["null"] = Json::UInt64(result.stats.nullCount);
    stats["validity_rate"] = result.stats.validityRate();
    Json::Value byCheck(Json::objectValue);
    for (const auto& [check, count] : result.stats.errorsByCheck) {
        byCheck[validationCheckName(check)] = Json::UInt64(count);
    }
    stats["errors_by_check"] = byCheck;
    obj["stats"] = stats;

    Json::Value quarantined(Json::arrayValue);
    for (const auto& q : result.quarantined) {
        Json::Value item(Json::objectValue);
        item["row"] = Json::UInt64(q.rowIndex);
        item["value"] = q.value;
        Json::Value errors(Json::arrayValue);
        for (const auto& e : q.errors) errors.append(e.message);
        item["errors"] = errors;
        quarantined.append(item);
    }
    obj["quarantined"] = quarantined;
    return obj;
}

std::string formatColumnValidation(const std::string& label,
                                   InvalidStrategy strategy,
                                   const ColumnValidationResult& result,
                                   OutputFormat format) {
    std::ostringstream out;
    switch (format) {
    case OutputFormat::JSON:
        out << toJsonText(columnValidationToJson(label, strategy, result)) << "\n";
        break;
    case OutputFormat::CSV:
        out << "row,value\n";
        for (size_t i = 0; i < result.values.size(); ++i) {
            out << i << ",";
            if (result.values[i]) out << quoteCsvField(*result.values[i]);
            out << "\n";
        }
        break;
    case OutputFormat::PLAIN: {
        const auto& s = result.stats;
        out << "Label:    " << label << " (strategy: " << invalidStrategyToString(strategy) << ")\n";
        out << "Rows:     " << s.totalCount << "\n";
        out << "Valid:    " << s.validCount << "\n";
        out << "Invalid:  " << s.invalidCount << "\n";
        out << "Null:     " << s.nullCount << "\n";
        out << "Validity: " << percent(s.validityRate(), 1) << "%\n";
        for (const auto& [check, count] : s.errorsByCheck) {
            out << "  " << std::left << std::setw(10) << validationCheckName(check) << " " << count << "\n";
        }
        if (!result.quarantined.empty()) {
            out << "Quarantined (" << result.quarantined.size() << ", rows are 0-based data records):\n";
            for (const auto& q : result.quarantined) {
                out << "  row " << q.rowIndex << ": " << toJsonText(Json::Value(displaySample(q.value)), false);
                if (!q.errors.empty()) out << " -> " << q.errors.front().message;
                out << "\n";
            }
        }
        break;
    }
    }
    return out.str();
}

} // namespace ReportWriter
