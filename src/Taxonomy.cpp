#include "Taxonomy.h"
#include "CommonUtils.h"
#include "FinetypeExceptions.h"
#include "TierGraph.h"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace {
constexpr std::string_view kDefinitionPrefix = "definitions_";
constexpr std::string_view kDefinitionSuffix = ".yaml";

bool isLocaleSegment(const std::string& segment) {
    bool hasLetter = false;
    for (char c : segment) {
        if (std::isupper(static_cast<unsigned char>(c))) {
            hasLetter = true;
        } else if (!std::isdigit(static_cast<unsigned char>(c)) && c != '_') {
            return false;
        }
    }
    return hasLetter;
}

std::string contextOf(const std::string& source, const std::string& key, const char* field) {
    return source + ": " + key + "." + field;
}

std::string scalarText(const YAML::Node& node, const std::string& context) {
    if (!node.IsScalar()) {
        throw Finetype::ParseException(context + " expects a scalar value");
    }
    return node.Scalar();
}

std::optional<std::string> optionalString(const YAML::Node& map, const char* field, const std::string& context) {
    const YAML::Node node = map[field];
    if (!node || node.IsNull()) return std::nullopt;
    return scalarText(node, context);
}

std::vector<std::string> stringList(const YAML::Node& map, const char* field, const std::string& context) {
    const YAML::Node node = map[field];
    std::vector<std::string> out;
    if (!node || node.IsNull()) return out;
    if (node.IsScalar()) {
        out.push_back(node.Scalar());
        return out;
    }
    if (!node.IsSequence()) {
        throw Finetype::ParseException(context + " expects a list of strings");
    }
    for (const auto& item : node) {
        out.push_back(item.IsScalar() ? item.Scalar() : YAML::Dump(item));
    }
    return out;
}

template <typename T>
std::optional<T> optionalNumber(const YAML::Node& map, const char* field, const std::string& context) {
    const YAML::Node node = map[field];
    if (!node || node.IsNull()) return std::nullopt;
    try {
        return node.as<T>();
    } catch (const YAML::Exception&) {
        throw Finetype::ParseException(context + " expects a number, got '" + YAML::Dump(node) + "'");
    }
}

Validation parseValidation(const YAML::Node& node, const std::string& context) {
    if (!node.IsMap()) {
        throw Finetype::ParseException(context + " expects a mapping");
    }
    Validation v;
    v.schemaType = optionalString(node, "type", context + ".type");
    v.pattern = optionalString(node, "pattern", context + ".pattern");
    v.minLength = optionalNumber<uint32_t>(node, "minLength", context + ".minLength");
    v.maxLength = optionalNumber<uint32_t>(node, "maxLength", context + ".maxLength");
    v.minimum = optionalNumber<double>(node, "minimum", context + ".minimum");
    v.maximum = optionalNumber<double>(node, "maximum", context + ".maximum");
    const YAML::Node enumNode = node["enum"];
    if (enumNode && !enumNode.IsNull()) {
        if (!enumNode.IsSequence()) {
            throw Finetype::ParseException(context + ".enum expects a list");
        }
        std::vector<std::string> values;
        for (const auto& item : enumNode) values.push_back(scalarText(item, context + ".enum"));
        v.enumValues = std::move(values);
    }
    return v;
}

Definition parseDefinition(const std::string& key, const YAML::Node& node, const std::string& source) {
    const auto label = Label::parse(key);
    if (!label || label->hasLocale() || label->full() != key) {
        throw Finetype::ParseException(source + ": invalid label key (expected provider.method): " + key);
    }
    if (!node.IsMap()) {
        throw Finetype::ParseException(source + ": definition for " + key + " must be a mapping");
    }

    Definition def;
    def.key = key;
    def.provider = label->provider;
    def.method = label->method;
    def.title = optionalString(node, "title", contextOf(source, key, "title"));
    def.description = optionalString(node, "description", contextOf(source, key, "description"));

    if (const auto designation = optionalString(node, "designation", contextOf(source, key, "designation"))) {
        const auto parsed = designationFromString(*designation);
        if (!parsed) {
            throw Finetype::ParseException(contextOf(source, key, "designation") + ": unknown designation '" + *designation + "'");
        }
        def.designation = *parsed;
    }

    def.locales = stringList(node, "locales", contextOf(source, key, "locales"));
    def.broadType = optionalString(node, "broad_type", contextOf(source, key, "broad_type"));
    def.formatString = optionalString(node, "format_string", contextOf(source, key, "format_string"));
    def.transform = optionalString(node, "transform", contextOf(source, key, "transform"));
    def.transformExt = optionalString(node, "transform_ext", contextOf(source, key, "transform_ext"));

    const YAML::Node validation = node["validation"];
    if (validation && !validation.IsNull()) {
        def.validation = parseValidation(validation, contextOf(source, key, "validation"));
    }

    def.tier = stringList(node, "tier", contextOf(source, key, "tier"));

    if (const auto priority = optionalNumber<int>(node, "release_priority", contextOf(source, key, "release_priority"))) {
        if (*priority < 0 || *priority > 255) {
            throw Finetype::ParseException(contextOf(source, key, "release_priority") + " must be within [0,255]");
        }
        def.releasePriority = static_cast<uint8_t>(*priority);
    }

    def.aliases = stringList(node, "aliases", contextOf(source, key, "aliases"));
    def.samples = stringList(node, "samples", contextOf(source, key, "samples"));
    def.references = stringList(node, "references", contextOf(source, key, "references"));
    def.notes = optionalString(node, "notes", contextOf(source, key, "notes"));
    return def;
}

std::string readFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw Finetype::IOException("Failed to read taxonomy file: " + path);
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) throw Finetype::IOException("Failed to read taxonomy file: " + path);
    return buffer.str();
}

void sortByKey(std::vector<const Definition*>& defs) {
    std::sort(defs.begin(), defs.end(), [](const Definition* a, const Definition* b) { return a->key < b->key; });
}
} // namespace

std::optional<Label> Label::parse(std::string_view text) {
    const std::string trimmed = CommonUtils::trim(text);
    const auto parts = CommonUtils::splitAny(trimmed, ".");
    if (parts.size() < 2 || parts.size() > 4) return std::nullopt;
    for (const auto& part : parts) {
        if (part.empty()) return std::nullopt;
    }

    Label label;
    switch (parts.size()) {
        case 2:
            label.provider = parts[0];
            label.method = parts[1];
            break;
        case 3:
            label.provider = parts[0] + "." + parts[1];
            label.method = parts[2];
            break;
        default:
            if (!isLocaleSegment(parts[3])) return std::nullopt;
            label.provider = parts[0] + "." + parts[1];
            label.method = parts[2];
            label.locale = parts[3];
            break;
    }
    return label;
}

std::string Label::domain() const {
    const size_t dot = provider.find('.');
    return dot == std::string::npos ? provider : provider.substr(0, dot);
}

std::string Label::category() const {
    const size_t dot = provider.find('.');
    return dot == std::string::npos ? std::string() : provider.substr(dot + 1);
}

std::string designationToString(Designation designation) {
    switch (designation) {
        case Designation::UNIVERSAL: return "universal";
        case Designation::LOCALE_SPECIFIC: return "locale_specific";
        case Designation::BROAD_NUMBERS: return "broad_numbers";
        case Designation::BROAD_CHARACTERS: return "broad_characters";
        case Designation::BROAD_WORDS: return "broad_words";
        case Designation::BROAD_OBJECT: return "broad_object";
        case Designation::DUPLICATE: return "duplicate";
    }
    return "universal";
}

std::optional<Designation> designationFromString(const std::string& text) {
    const std::string v = CommonUtils::toLower(CommonUtils::trim(text));
    if (v == "universal") return Designation::UNIVERSAL;
    if (v == "locale_specific") return Designation::LOCALE_SPECIFIC;
    if (v == "broad_numbers") return Designation::BROAD_NUMBERS;
    if (v == "broad_characters") return Designation::BROAD_CHARACTERS;
    if (v == "broad_words") return Designation::BROAD_WORDS;
    if (v == "broad_object") return Designation::BROAD_OBJECT;
    if (v == "duplicate") return Designation::DUPLICATE;
    return std::nullopt;
}

std::string Definition::domain() const {
    const size_t dot = key.find('.');
    return dot == std::string::npos ? key : key.substr(0, dot);
}

Taxonomy Taxonomy::fromYaml(const std::string& yaml) {
    Taxonomy taxonomy;
    taxonomy.mergeDocument(yaml, "<yaml>");
    taxonomy.rebuildLabels();
    return taxonomy;
}

Taxonomy Taxonomy::fromFile(const std::string& path) {
    Taxonomy taxonomy;
    taxonomy.mergeDocument(readFile(path), path);
    taxonomy.rebuildLabels();
    return taxonomy;
}

Taxonomy Taxonomy::fromDirectory(const std::string& directory) {
    namespace fs = std::filesystem;
    std::error_code ec;
    if (!fs::is_directory(directory, ec)) {
        throw Finetype::IOException("Taxonomy directory not found: " + directory);
    }

    std::vector<fs::path> paths;
    for (fs::directory_iterator it(directory, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code entryEc;
        if (!it->is_regular_file(entryEc)) continue;
        const std::string name = it->path().filename().string();
        if (CommonUtils::startsWith(name, kDefinitionPrefix) &&
            name.size() >= kDefinitionSuffix.size() &&
            name.compare(name.size() - kDefinitionSuffix.size(), kDefinitionSuffix.size(), kDefinitionSuffix) == 0) {
            paths.push_back(it->path());
        }
    }
    if (ec) {
        throw Finetype::IOException("Failed to list taxonomy directory " + directory + ": " + ec.message());
    }
    if (paths.empty()) {
        throw Finetype::IOException("No definition files found in: " + (fs::path(directory) / "definitions_*.yaml").string());
    }
    std::sort(paths.begin(), paths.end());

    Taxonomy taxonomy;
    for (const auto& path : paths) {
        taxonomy.mergeDocument(readFile(path.string()), path.string());
    }
    taxonomy.rebuildLabels();
    return taxonomy;
}

void Taxonomy::mergeDocument(const std::string& yaml, const std::string& sourceName) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml);
    } catch (const YAML::Exception& ex) {
        throw Finetype::ParseException("Failed to parse taxonomy YAML (" + sourceName + "): " + ex.what());
    }
    if (!root.IsMap()) {
        throw Finetype::ParseException("Failed to parse taxonomy YAML (" + sourceName + "): root must be a mapping of label to definition");
    }

    for (const auto& entry : root) {
        if (!entry.first.IsScalar()) {
            throw Finetype::ParseException(sourceName + ": definition keys must be strings");
        }
        const std::string key = entry.first.Scalar();
        definitions_[key] = parseDefinition(key, entry.second, sourceName);
    }
}

void Taxonomy::rebuildLabels() {
    labels_.clear();
    labels_.reserve(definitions_.size());
    for (const auto& [key, def] : definitions_) labels_.push_back(key);
    std::sort(labels_.begin(), labels_.end());
}

const Definition* Taxonomy::get(const std::string& label) const {
    const auto it = definitions_.find(label);
    return it == definitions_.end() ? nullptr : &it->second;
}

std::vector<const Definition*> Taxonomy::atPriority(uint8_t minPriority) const {
    std::vector<const Definition*> out;
    for (const auto& [key, def] : definitions_) {
        if (def.releasePriority >= minPriority) out.push_back(&def);
    }
    return out;
}

std::vector<const Definition*> Taxonomy::byProvider(const std::string& provider) const {
    std::vector<const Definition*> out;
    for (const auto& [key, def] : definitions_) {
        if (def.provider == provider) out.push_back(&def);
    }
    return out;
}

std::vector<const Definition*> Taxonomy::byDomain(const std::string& domain) const {
    const std::string prefix = domain + ".";
    std::vector<const Definition*> out;
    for (const auto& [key, def] : definitions_) {
        if (CommonUtils::startsWith(key, prefix)) out.push_back(&def);
    }
    sortByKey(out);
    return out;
}

std::vector<const Definition*> Taxonomy::byCategory(const std::string& domain, const std::string& category) const {
    const std::string prefix = domain + "." + category + ".";
    std::vector<const Definition*> out;
    for (const auto& [key, def] : definitions_) {
        if (CommonUtils::startsWith(key, prefix)) out.push_back(&def);
    }
    sortByKey(out);
    return out;
}

std::vector<std::string> Taxonomy::providers() const {
    std::vector<std::string> out;
    out.reserve(definitions_.size());
    for (const auto& [key, def] : definitions_) out.push_back(def.provider);
    std::sort(out.begin(), out.end());
    out.erase(std::unique(out.begin(), out.end()), out.end());
    return out;
}

std::vector<std::string> Taxonomy::domains() const {
    std::vector<std::string> out;
    for (const auto& [key, def] : definitions_) out.push_back(def.domain());
    std::sort(out.begin(), out.end());
    out.erase(std::unique(out.begin(), out.end()), out.end());
    return out;
}

std::vector<std::string> Taxonomy::categories(const std::string& domain) const {
    std::vector<std::string> out;
    for (const auto& [key, def] : definitions_) {
        const auto label = Label::parse(key);
        if (label && label->domain() == domain && !label->category().empty()) {
            out.push_back(label->category());
        }
    }
    std::sort(out.begin(), out.end());
    out.erase(std::unique(out.begin(), out.end()), out.end());
    return out;
}

std::unordered_map<std::string, size_t> Taxonomy::labelToIndex() const {
    std::unordered_map<std::string, size_t> out;
    out.reserve(labels_.size());
    for (size_t i = 0; i < labels_.size(); ++i) out.emplace(labels_[i], i);
    return out;
}

TierGraph Taxonomy::tierGraph() const {
    return TierGraph::fromTaxonomy(*this);
}
