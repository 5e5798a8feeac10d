#pragma once
#include <cstdint>
#include <string>
#include <vector>

struct FinetypeConfig {
    std::string command;
    std::string configPath;

    std::string taxonomyPath = "labels";
    // CSV for validate/profile; one value per line for infer/unpack ("-" reads stdin).
    std::string inputPath;
    // Output file for commands that write records (generate); stdout when empty.
    std::string filePath;
    std::string column;
    std::string label;
    std::string value;

    std::string strategy = "quarantine";   // quarantine|set_null|ffill|bfill
    std::string outputFormat = "plain";    // plain|json|csv
    char delimiter = ',';

    size_t samples = 10;
    int priority = 0;
    uint64_t seed = 42;
    size_t maxFailures = 5;
    size_t sampleSize = 100;
    double minAgreement = 0.3;

    bool verbose = false;
    bool localized = false;
    bool showConfidence = false;

    static const std::vector<std::string>& commands();

    /**
     * @brief Parses `finetype <command> [--flag value ...]`.
     *
     * A `--config path` file is applied first; flags given on the command
     * line override it regardless of their position.
     * @throws Finetype::ConfigurationException on unknown flags or bad values.
     */
    static FinetypeConfig fromArgs(int argc, char* argv[]);
    static FinetypeConfig fromFile(const std::string& configPath, const FinetypeConfig& base);
    void validate() const;
};
