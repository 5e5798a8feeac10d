#ifndef FINETYPE_EXCEPTIONS_H
#define FINETYPE_EXCEPTIONS_H

#include <stdexcept>
#include <string>

namespace Finetype {

class FinetypeException : public std::runtime_error {
public:
    explicit FinetypeException(const std::string& message) : std::runtime_error(message) {}
};

class IOException : public FinetypeException {
public:
    explicit IOException(const std::string& message) : FinetypeException("IO Error: " + message) {}
};

class ParseException : public FinetypeException {
public:
    explicit ParseException(const std::string& message) : FinetypeException("Parse Error: " + message) {}
};

class ConfigurationException : public FinetypeException {
public:
    explicit ConfigurationException(const std::string& message) : FinetypeException("Configuration Error: " + message) {}
};

class UnknownLabelException : public FinetypeException {
public:
    explicit UnknownLabelException(const std::string& label)
        : FinetypeException("Unknown label: " + label), label_(label) {}
    const std::string& label() const { return label_; }

private:
    std::string label_;
};

class NoSchemaException : public FinetypeException {
public:
    explicit NoSchemaException(const std::string& label)
        : FinetypeException("No validation schema for label: " + label), label_(label) {}
    const std::string& label() const { return label_; }

private:
    std::string label_;
};

class InvalidPatternException : public FinetypeException {
public:
    InvalidPatternException(const std::string& label, const std::string& pattern, const std::string& reason)
        : FinetypeException("Invalid regex pattern for " + label + ": '" + pattern + "' (" + reason + ")"),
          label_(label),
          pattern_(pattern) {}
    const std::string& label() const { return label_; }
    const std::string& pattern() const { return pattern_; }

private:
    std::string label_;
    std::string pattern_;
};

class GeneratorException : public FinetypeException {
public:
    enum class Kind { UNKNOWN_LABEL, NOT_IMPLEMENTED, FAILED };

    GeneratorException(Kind kind, const std::string& message)
        : FinetypeException(prefixFor(kind) + message), kind_(kind) {}
    Kind kind() const { return kind_; }

private:
    static std::string prefixFor(Kind kind) {
        switch (kind) {
            case Kind::UNKNOWN_LABEL: return "Unknown label: ";
            case Kind::NOT_IMPLEMENTED: return "Generator not implemented for: ";
            case Kind::FAILED: return "Generator Error: ";
        }
        return "Generator Error: ";
    }

    Kind kind_;
};

class ClassifierException : public FinetypeException {
public:
    explicit ClassifierException(const std::string& message) : FinetypeException("Classifier Error: " + message) {}
};

} // namespace Finetype

#endif // FINETYPE_EXCEPTIONS_H
