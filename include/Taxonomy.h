#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

class TierGraph;

/**
 * @brief Dotted type identifier: provider.method with an optional locale suffix.
 *
 * Three-segment keys (domain.category.type) split as provider = "domain.category"
 * and method = "type". A fourth upper-case segment is the locale.
 */
struct Label {
    std::string provider;
    std::string method;
    std::string locale;

    static std::optional<Label> parse(std::string_view text);

    std::string base() const { return provider + "." + method; }
    std::string full() const { return locale.empty() ? base() : base() + "." + locale; }
    std::string domain() const;
    std::string category() const;
    bool hasLocale() const { return !locale.empty(); }

    bool operator==(const Label& other) const { return full() == other.full(); }
    bool operator!=(const Label& other) const { return !(*this == other); }
};

enum class Designation {
    UNIVERSAL,
    LOCALE_SPECIFIC,
    BROAD_NUMBERS,
    BROAD_CHARACTERS,
    BROAD_WORDS,
    BROAD_OBJECT,
    DUPLICATE
};

std::string designationToString(Designation designation);
std::optional<Designation> designationFromString(const std::string& text);

// Schema fragment checked by Validator.
struct Validation {
    std::optional<std::string> schemaType;
    std::optional<std::string> pattern;
    std::optional<uint32_t> minLength;
    std::optional<uint32_t> maxLength;
    std::optional<double> minimum;
    std::optional<double> maximum;
    std::optional<std::vector<std::string>> enumValues;
};

struct Definition {
    std::string key;
    std::string provider;
    std::string method;

    std::optional<std::string> title;
    std::optional<std::string> description;
    Designation designation = Designation::UNIVERSAL;
    std::vector<std::string> locales;
    std::optional<std::string> broadType;
    std::optional<std::string> formatString;
    std::optional<std::string> transform;
    std::optional<std::string> transformExt;
    std::optional<Validation> validation;
    std::vector<std::string> tier;
    uint8_t releasePriority = 0;
    std::vector<std::string> aliases;
    std::vector<std::string> samples;
    std::vector<std::string> references;
    std::optional<std::string> notes;

    std::string label() const { return provider + "." + method; }
    std::string domain() const;
    bool hasPattern() const { return validation && validation->pattern.has_value(); }
};

/**
 * @brief Immutable label -> Definition map loaded from YAML definition files.
 *
 * Labels are kept sorted; that order backs labelToIndex()/indexToLabel() so two
 * loads of the same source agree on class indices.
 *
 * A key repeated within a document or across files of one directory resolves
 * last-write-wins.
 */
class Taxonomy {
public:
    /**
     * @throws Finetype::ParseException on malformed YAML, a non-map root, a field of the
     *         wrong shape or a key that is not provider.method.
     */
    static Taxonomy fromYaml(const std::string& yaml);

    /// @throws Finetype::IOException if the file cannot be read.
    static Taxonomy fromFile(const std::string& path);

    /**
     * @brief Loads every definitions_*.yaml file in a directory, in file-name order.
     * @throws Finetype::IOException when the directory is unreadable or holds no definition files.
     */
    static Taxonomy fromDirectory(const std::string& directory);

    const Definition* get(const std::string& label) const;
    const std::vector<std::string>& labels() const { return labels_; }

    std::vector<const Definition*> atPriority(uint8_t minPriority) const;
    std::vector<const Definition*> byProvider(const std::string& provider) const;
    std::vector<const Definition*> byDomain(const std::string& domain) const;
    std::vector<const Definition*> byCategory(const std::string& domain, const std::string& category) const;

    std::vector<std::string> providers() const;
    std::vector<std::string> domains() const;
    std::vector<std::string> categories(const std::string& domain) const;

    std::unordered_map<std::string, size_t> labelToIndex() const;
    std::vector<std::string> indexToLabel() const { return labels_; }

    size_t size() const { return definitions_.size(); }
    bool empty() const { return definitions_.empty(); }

    TierGraph tierGraph() const;

private:
    void mergeDocument(const std::string& yaml, const std::string& sourceName);
    void rebuildLabels();

    std::unordered_map<std::string, Definition> definitions_;
    std::vector<std::string> labels_;
};
