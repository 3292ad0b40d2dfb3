#ifndef CONFIG_READER_HPP
#define CONFIG_READER_HPP

#include "JOSHC.hpp"
#include <string>
#include <map>
#include <vector>
#include <fstream>
#include <sstream>

namespace JOSHC {

/**
 * @brief INI-style configuration reader for the client
 *
 * Reads [reader], [grid] and [output] sections so a stream can be replayed,
 * geocoded and exported without code changes.
 */
class ConfigReader {
public:
    struct ValidationResult {
        bool valid;
        std::vector<std::string> errors;
        std::vector<std::string> warnings;
    };

    ConfigReader();

    // Load configuration file
    bool loadFile(const std::string& filename);

    /**
     * @brief Overlay another file; its values replace existing ones
     */
    bool mergeFile(const std::string& filename);

    // Parse client sections
    bool parseClientConfig(ClientConfig& config) const;

    /**
     * @brief Build metadata from the [grid] section
     *
     * Requires start, end and patch_size. steps_low/steps_high are optional.
     *
     * @return false if the section or a required key is missing
     * @throws FormatError if start, end or patch_size cannot be parsed
     */
    bool parseSimulationMetadata(SimulationMetadata& metadata) const;

    // Generic accessors
    std::string getString(const std::string& section, const std::string& key,
                         const std::string& default_val = "") const;
    int getInt(const std::string& section, const std::string& key, int default_val = 0) const;
    long getLong(const std::string& section, const std::string& key, long default_val = 0) const;
    double getDouble(const std::string& section, const std::string& key,
                    double default_val = 0.0) const;
    bool getBool(const std::string& section, const std::string& key,
                bool default_val = false) const;

    bool hasSection(const std::string& section) const;
    bool hasKey(const std::string& section, const std::string& key) const;

    std::vector<std::string> getSections() const;
    std::vector<std::string> getKeys(const std::string& section) const;
    std::map<std::string, std::string> getSectionData(const std::string& section) const;

    /**
     * @brief Check values the client would otherwise silently replace by defaults
     */
    ValidationResult validate() const;

    /**
     * @brief Write a commented configuration template
     * @return false if the file cannot be created
     */
    static bool generateTemplate(const std::string& filename);

private:
    std::map<std::string, std::map<std::string, std::string>> data;

    std::string trim(const std::string& str) const;
};

} // namespace JOSHC

#endif // CONFIG_READER_HPP
