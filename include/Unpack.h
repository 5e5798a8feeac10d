#pragma once

#include "Classifier.h"

#include <json/json.h>

#include <optional>
#include <string>

/**
 * @brief Per-field type annotation of JSON documents.
 *
 * Every scalar becomes {"value", "type", "confidence", "sql_type"}. Objects
 * and arrays keep their shape with each member annotated. Booleans are
 * technology.development.boolean and nulls are unknown without consulting the
 * classifier; empty strings are unknown as well. A field the classifier fails
 * on is logged and left unknown so one bad value does not lose the document.
 */
namespace Unpack {

Json::Value annotate(const Json::Value& value, const ValueClassifier& classifier);

/// Compact annotated JSON, or std::nullopt when the text is not JSON.
std::optional<std::string> unpackJson(const std::string& text, const ValueClassifier& classifier);

/// Integers as written; reals as the shortest text that reads back the same (3.14, 2.0, 1e+300).
std::string numberText(const Json::Value& number);

} // namespace Unpack
