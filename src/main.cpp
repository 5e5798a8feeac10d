#include "CSVUtils.h"
#include "CommonUtils.h"
#include "Checker.h"
#include "ColumnClassifier.h"
#include "FinetypeConfig.h"
#include "FinetypeExceptions.h"
#include "Generator.h"
#include "Normalizer.h"
#include "ReportWriter.h"
#include "SchemaClassifier.h"
#include "Taxonomy.h"
#include "TypeMapping.h"
#include "Unpack.h"
#include "Validator.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>

namespace {
void logInfo(const FinetypeConfig& config, const std::string& message) {
    if (config.verbose) std::cerr << "[Finetype][" << config.command << "] " << message << "\n";
}

Taxonomy loadTaxonomy(const FinetypeConfig& config) {
    std::error_code ec;
    const bool isDirectory = std::filesystem::is_directory(config.taxonomyPath, ec);
    Taxonomy taxonomy = isDirectory ? Taxonomy::fromDirectory(config.taxonomyPath)
                                    : Taxonomy::fromFile(config.taxonomyPath);
    logInfo(config, "Loaded " + std::to_string(taxonomy.size()) + " label definitions across " +
                        std::to_string(taxonomy.domains().size()) + " domains from " + config.taxonomyPath);
    return taxonomy;
}

OutputFormat outputFormat(const FinetypeConfig& config) {
    return outputFormatFromString(config.outputFormat).value_or(OutputFormat::PLAIN);
}

std::vector<std::optional<std::string>> loadColumn(const FinetypeConfig& config, bool missingTokensAsNull) {
    std::ifstream in(config.inputPath, std::ios::binary);
    if (!in) throw Finetype::IOException("Could not open input file: " + config.inputPath);
    auto values = CSVUtils::readColumn(in, config.delimiter, config.column, missingTokensAsNull);
    logInfo(config, "Read " + std::to_string(values.size()) + " rows from column '" + config.column + "'");
    return values;
}

// --value, or the lines of --input ("-" for stdin).
std::vector<std::string> loadInputs(const FinetypeConfig& config) {
    if (config.inputPath.empty()) return {config.value};
    if (config.inputPath == "-") return CSVUtils::readLines(std::cin);
    std::ifstream in(config.inputPath, std::ios::binary);
    if (!in) throw Finetype::IOException("Could not open input file: " + config.inputPath);
    auto lines = CSVUtils::readLines(in);
    logInfo(config, "Read " + std::to_string(lines.size()) + " inputs from " + config.inputPath);
    return lines;
}

int runTaxonomy(const FinetypeConfig& config) {
    const Taxonomy taxonomy = loadTaxonomy(config);
    std::vector<const Definition*> definitions;
    if (!config.label.empty()) {
        // --label filters by domain or domain.category.
        const auto parts = CommonUtils::splitAny(config.label, ".");
        definitions = parts.size() >= 2 ? taxonomy.byCategory(parts[0], parts[1]) : taxonomy.byDomain(parts[0]);
    } else {
        definitions = taxonomy.atPriority(0);
    }
    definitions.erase(std::remove_if(definitions.begin(), definitions.end(),
                                     [&config](const Definition* d) {
                                         return d->releasePriority < config.priority;
                                     }),
                      definitions.end());
    std::sort(definitions.begin(), definitions.end(),
              [](const Definition* a, const Definition* b) { return a->key < b->key; });
    std::cout << ReportWriter::formatTaxonomy(taxonomy, definitions, outputFormat(config));
    return 0;
}

int runCheck(const FinetypeConfig& config) {
    const Taxonomy taxonomy = loadTaxonomy(config);
    CheckerConfig checkerConfig;
    checkerConfig.samplesPerKey = config.samples;
    checkerConfig.maxFailuresPerKey = config.maxFailures;
    checkerConfig.seed = config.seed;
    checkerConfig.verbose = config.verbose;

    const CheckReport report = Checker(checkerConfig).run(taxonomy);
    if (outputFormat(config) == OutputFormat::JSON) {
        std::cout << ReportWriter::toJsonText(ReportWriter::checkReportToJson(report)) << "\n";
    } else {
        std::cout << ReportWriter::formatCheckReport(report, config.verbose);
    }
    return report.allPassed() ? 0 : 1;
}

int runValidate(const FinetypeConfig& config) {
    const Taxonomy taxonomy = loadTaxonomy(config);
    const InvalidStrategy strategy = invalidStrategyFromString(config.strategy).value_or(InvalidStrategy::QUARANTINE);

    if (!config.value.empty()) {
        const ValidationResult result = Validator::validateValueForLabel(config.value, config.label, taxonomy);
        if (outputFormat(config) == OutputFormat::JSON) {
            Json::Value obj(Json::objectValue);
            obj["value"] = config.value;
            obj["label"] = config.label;
            obj["is_valid"] = result.isValid;
            Json::Value errors(Json::arrayValue);
            for (const auto& e : result.errors) errors.append(e.message);
            obj["errors"] = errors;
            std::cout << ReportWriter::toJsonText(obj, false) << "\n";
        } else {
            std::cout << (result.isValid ? "valid" : "invalid") << "\n";
            for (const auto& e : result.errors) std::cout << "  " << validationCheckName(e.check) << ": " << e.message << "\n";
        }
        return result.isValid ? 0 : 1;
    }

    // Validation sees "-" or "NaN" as values; only empty cells are null.
    const auto values = loadColumn(config, false);
    const ColumnValidationResult result = Validator::validateColumnForLabel(values, config.label, taxonomy, strategy);
    std::cout << ReportWriter::formatColumnValidation(config.label, strategy, result, outputFormat(config));
    return 0;
}

int runNormalize(const FinetypeConfig& config) {
    const auto normalized = Normalizer::normalize(config.value, config.label);
    if (!normalized) {
        std::cerr << "[Finetype][normalize] value does not hold up as " << config.label << "\n";
        return 1;
    }
    if (outputFormat(config) == OutputFormat::JSON) {
        Json::Value obj(Json::objectValue);
        obj["input"] = config.value;
        obj["label"] = config.label;
        obj["normalized"] = *normalized;
        obj["sql_type"] = TypeMapping::toSqlType(config.label);
        std::cout << ReportWriter::toJsonText(obj, false) << "\n";
    } else {
        std::cout << *normalized << "\n";
    }
    return 0;
}

int runGenerate(const FinetypeConfig& config) {
    const Taxonomy taxonomy = loadTaxonomy(config);
    logInfo(config, "Generating " + std::to_string(config.samples) + " samples per label (priority >= " +
                        std::to_string(config.priority) + ")");

    DefinitionSampleGenerator generator(taxonomy, config.seed);
    const auto minPriority = static_cast<uint8_t>(config.priority);
    const std::vector<Sample> samples =
        config.localized ? SampleGeneration::generateAllLocalized(generator, taxonomy, minPriority, config.samples)
                         : SampleGeneration::generateAll(generator, taxonomy, minPriority, config.samples);

    std::ofstream file;
    if (!config.filePath.empty()) {
        file.open(config.filePath);
        if (!file) throw Finetype::IOException("Could not open output file: " + config.filePath);
    }
    std::ostream& out = config.filePath.empty() ? std::cout : file;
    for (const auto& sample : samples) {
        Json::Value record(Json::objectValue);
        record["text"] = sample.text;
        record["classification"] = sample.label;
        out << ReportWriter::toJsonText(record, false) << "\n";
    }
    if (!out) throw Finetype::IOException("Failed writing generated samples");
    logInfo(config, "Generated " + std::to_string(samples.size()) + " total samples");
    return 0;
}

int runInfer(const FinetypeConfig& config) {
    const Taxonomy taxonomy = loadTaxonomy(config);
    const SchemaClassifier classifier(taxonomy, static_cast<uint8_t>(config.priority));
    for (const auto& label : classifier.skippedLabels()) {
        logInfo(config, "Skipping " + label + ": pattern does not compile");
    }
    const std::vector<std::string> inputs = loadInputs(config);
    const std::vector<ClassificationResult> results = classifier.classifyBatch(inputs);
    std::cout << ReportWriter::formatClassifications(inputs, results, outputFormat(config), config.showConfidence);
    return 0;
}

int runUnpack(const FinetypeConfig& config) {
    const Taxonomy taxonomy = loadTaxonomy(config);
    const SchemaClassifier classifier(taxonomy, static_cast<uint8_t>(config.priority));
    int exitCode = 0;
    size_t index = 0;
    for (const auto& input : loadInputs(config)) {
        ++index;
        const auto annotated = Unpack::unpackJson(input, classifier);
        if (!annotated) {
            logInfo(config, "Input " + std::to_string(index) + " is not JSON");
            exitCode = 1;
        }
        std::cout << annotated.value_or("null") << "\n";
    }
    return exitCode;
}

int runProfile(const FinetypeConfig& config) {
    const Taxonomy taxonomy = loadTaxonomy(config);
    const auto column = loadColumn(config, true);
    std::vector<std::string> values;
    values.reserve(column.size());
    for (const auto& v : column) {
        if (v) values.push_back(*v);
    }

    ColumnConfig columnConfig;
    columnConfig.sampleSize = config.sampleSize;
    columnConfig.minAgreement = config.minAgreement;
    const ColumnClassifier classifier(
        std::make_shared<SchemaClassifier>(taxonomy, static_cast<uint8_t>(config.priority)), columnConfig);
    const ColumnResult result = classifier.classifyColumn(values);
    std::cout << ReportWriter::formatColumnResult(config.column, result, outputFormat(config));
    return 0;
}
} // namespace

int main(int argc, char* argv[]) {
    try {
        const FinetypeConfig config = FinetypeConfig::fromArgs(argc, argv);
        if (config.command == "taxonomy") return runTaxonomy(config);
        if (config.command == "check") return runCheck(config);
        if (config.command == "validate") return runValidate(config);
        if (config.command == "normalize") return runNormalize(config);
        if (config.command == "generate") return runGenerate(config);
        if (config.command == "infer") return runInfer(config);
        if (config.command == "unpack") return runUnpack(config);
        return runProfile(config);
    } catch (const Finetype::FinetypeException& e) {
        std::cerr << "[Finetype Error] " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "[Finetype Exception] " << e.what() << "\n";
        return 2;
    }
}
