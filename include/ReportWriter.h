#pragma once

#include "Checker.h"
#include "Classifier.h"
#include "ColumnClassifier.h"
#include "Taxonomy.h"
#include "Validator.h"

#include <json/json.h>

#include <optional>
#include <string>
#include <vector>

enum class OutputFormat { PLAIN, JSON, CSV };

std::optional<OutputFormat> outputFormatFromString(const std::string& text);

/**
 * @brief Text renderers for the CLI.
 *
 * Every renderer returns the complete text including the trailing newline;
 * JSON goes through jsoncpp so escaping is never done by hand.
 */
namespace ReportWriter {

std::string formatCheckReport(const CheckReport& report, bool verbose);
Json::Value checkReportToJson(const CheckReport& report);

Json::Value definitionToJson(const Definition& definition);
std::string formatTaxonomy(const Taxonomy& taxonomy,
                           const std::vector<const Definition*>& definitions,
                           OutputFormat format);

std::string formatClassification(const std::string& text,
                                 const ClassificationResult& result,
                                 OutputFormat format,
                                 bool showConfidence);
/// One formatClassification row per input, in input order.
/// @throws Finetype::ClassifierException when the counts differ.
std::string formatClassifications(const std::vector<std::string>& texts,
                                  const std::vector<ClassificationResult>& results,
                                  OutputFormat format,
                                  bool showConfidence);

Json::Value columnResultToJson(const std::string& column, const ColumnResult& result);
std::string formatColumnResult(const std::string& column, const ColumnResult& result, OutputFormat format);

Json::Value columnValidationToJson(const std::string& label,
                                   InvalidStrategy strategy,
                                   const ColumnValidationResult& result);
/// CSV renders one row per value after the strategy was applied; null cells stay empty.
std::string formatColumnValidation(const std::string& label,
                                   InvalidStrategy strategy,
                                   const ColumnValidationResult& result,
                                   OutputFormat format);

std::string toJsonText(const Json::Value& value, bool pretty = true);
std::string quoteCsvField(const std::string& field);

} // namespace ReportWriter
