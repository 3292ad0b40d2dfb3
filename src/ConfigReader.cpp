#include "ConfigReader.hpp"
#include "EngineValue.hpp"
#include "SimulationMetadata.hpp"
#include <iostream>
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace JOSHC {

namespace {

std::string toLower(std::string val) {
    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return val;
}

} // namespace

// =============================================================================
// Enum Conversions
// =============================================================================

ErrorPolicy parseErrorPolicy(const std::string& text, ErrorPolicy default_val) {
    std::string val = toLower(text);
    if (val == "abort") return ErrorPolicy::ABORT;
    if (val == "skip") return ErrorPolicy::SKIP;
    return default_val;
}

ExportSeries parseExportSeries(const std::string& text, ExportSeries default_val) {
    std::string val = toLower(text);
    if (val == "simulation") return ExportSeries::SIMULATION;
    if (val == "patches") return ExportSeries::PATCHES;
    if (val == "entities") return ExportSeries::ENTITIES;
    if (val == "all") return ExportSeries::ALL;
    return default_val;
}

std::string toString(ErrorPolicy policy) {
    switch (policy) {
        case ErrorPolicy::ABORT: return "ABORT";
        case ErrorPolicy::SKIP: return "SKIP";
    }
    return "ABORT";
}

std::string toString(ExportSeries series) {
    switch (series) {
        case ExportSeries::SIMULATION: return "simulation";
        case ExportSeries::PATCHES: return "patches";
        case ExportSeries::ENTITIES: return "entities";
        case ExportSeries::ALL: return "all";
    }
    return "all";
}

// =============================================================================
// ConfigReader Implementation
// =============================================================================

ConfigReader::ConfigReader() {}

bool ConfigReader::loadFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Error: Cannot open configuration file: " << filename << std::endl;
        return false;
    }

    std::string current_section;
    std::string line;
    int line_num = 0;

    while (std::getline(file, line)) {
        line_num++;
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        if (line[0] == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.length() - 2));
            continue;
        }

        size_t eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            std::cerr << "Warning: Invalid line " << line_num << ": " << line << std::endl;
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        size_t comment_pos = value.find('#');
        if (comment_pos != std::string::npos) {
            value = trim(value.substr(0, comment_pos));
        }

        if (current_section.empty()) {
            std::cerr << "Warning: Key without section at line " << line_num << std::endl;
            continue;
        }

        data[current_section][key] = value;
    }

    return true;
}

bool ConfigReader::mergeFile(const std::string& filename) {
    ConfigReader other;
    if (!other.loadFile(filename)) {
        return false;
    }

    for (const auto& section : other.data) {
        for (const auto& key_val : section.second) {
            data[section.first][key_val.first] = key_val.second;
        }
    }

    return true;
}

std::string ConfigReader::trim(const std::string& str) const {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";

    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

std::string ConfigReader::getString(const std::string& section, const std::string& key,
                                    const std::string& default_val) const {
    auto sec_it = data.find(section);
    if (sec_it == data.end()) return default_val;

    auto key_it = sec_it->second.find(key);
    if (key_it == sec_it->second.end()) return default_val;

    return key_it->second;
}

int ConfigReader::getInt(const std::string& section, const std::string& key,
                         int default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;

    try {
        return std::stoi(val);
    } catch (const std::logic_error&) {
        return default_val;
    }
}

long ConfigReader::getLong(const std::string& section, const std::string& key,
                           long default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;

    try {
        return std::stol(val);
    } catch (const std::logic_error&) {
        return default_val;
    }
}

double ConfigReader::getDouble(const std::string& section, const std::string& key,
                               double default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;

    try {
        return std::stod(val);
    } catch (const std::logic_error&) {
        return default_val;
    }
}

bool ConfigReader::getBool(const std::string& section, const std::string& key,
                           bool default_val) const {
    std::string val = toLower(getString(section, key));
    if (val.empty()) return default_val;

    if (val == "true" || val == "yes" || val == "1" || val == "on") return true;
    if (val == "false" || val == "no" || val == "0" || val == "off") return false;

    return default_val;
}

bool ConfigReader::hasSection(const std::string& section) const {
    return data.find(section) != data.end();
}

bool ConfigReader::hasKey(const std::string& section, const std::string& key) const {
    auto sec_it = data.find(section);
    if (sec_it == data.end()) return false;
    return sec_it->second.find(key) != sec_it->second.end();
}

std::vector<std::string> ConfigReader::getSections() const {
    std::vector<std::string> sections;
    for (const auto& pair : data) {
        sections.push_back(pair.first);
    }
    return sections;
}

std::vector<std::string> ConfigReader::getKeys(const std::string& section) const {
    std::vector<std::string> keys;
    auto sec_it = data.find(section);
    if (sec_it != data.end()) {
        for (const auto& pair : sec_it->second) {
            keys.push_back(pair.first);
        }
    }
    return keys;
}

std::map<std::string, std::string> ConfigReader::getSectionData(const std::string& section) const {
    auto it = data.find(section);
    if (it != data.end()) {
        return it->second;
    }
    return {};
}

// =============================================================================
// Client Sections
// =============================================================================

bool ConfigReader::parseClientConfig(ClientConfig& config) const {
    if (!hasSection("reader") && !hasSection("output")) return false;

    ReaderConfig& reader = config.reader;
    reader.error_policy = parseErrorPolicy(getString("reader", "error_policy"), reader.error_policy);
    reader.start_step = getLong("reader", "start_step", reader.start_step);
    reader.verbose = getBool("reader", "verbose", reader.verbose);
    reader.chunk_size = getInt("reader", "chunk_size", reader.chunk_size);

    OutputConfig& output = config.output;
    output.geocode = getBool("output", "geocode", output.geocode);
    output.series = parseExportSeries(getString("output", "series"), output.series);
    output.final_only = getBool("output", "final_only", output.final_only);
    output.output_file = getString("output", "file", output.output_file);

    config.input_file = getString("reader", "input", config.input_file);

    return true;
}

bool ConfigReader::parseSimulationMetadata(SimulationMetadata& metadata) const {
    if (!hasSection("grid")) return false;
    if (!hasKey("grid", "start") || !hasKey("grid", "end") || !hasKey("grid", "patch_size")) {
        std::cerr << "Warning: [grid] needs start, end and patch_size" << std::endl;
        return false;
    }

    StartEndString start = parseStartEndString(getString("grid", "start"));
    StartEndString end = parseStartEndString(getString("grid", "end"));
    EngineValue patch_size = parseEngineValueString(getString("grid", "patch_size"));

    SimulationMetadata parsed = SimulationMetadata::fromStartEnd(start, end, patch_size);

    long steps_low = getLong("grid", "steps_low", 0);
    long steps_high = getLong("grid", "steps_high", steps_low);
    parsed.setSteps(steps_low, steps_high);

    metadata = parsed;
    return true;
}

ConfigReader::ValidationResult ConfigReader::validate() const {
    ValidationResult result;
    result.valid = true;

    if (!hasSection("reader")) {
        result.warnings.push_back("No [reader] section found - using defaults");
    }

    std::string policy = getString("reader", "error_policy");
    if (!policy.empty() && parseErrorPolicy(policy, ErrorPolicy::ABORT) == ErrorPolicy::ABORT &&
        toLower(policy) != "abort") {
        result.errors.push_back("Unknown error_policy '" + policy + "' (ABORT or SKIP)");
        result.valid = false;
    }

    if (hasKey("reader", "chunk_size") && getInt("reader", "chunk_size", 0) <= 0) {
        result.errors.push_back("chunk_size must be a positive integer");
        result.valid = false;
    }

    std::string series = getString("output", "series");
    if (!series.empty() && parseExportSeries(series, ExportSeries::ALL) == ExportSeries::ALL &&
        toLower(series) != "all") {
        result.errors.push_back("Unknown series '" + series + "'");
        result.valid = false;
    }

    if (getBool("output", "geocode", false) && !hasSection("grid")) {
        result.errors.push_back("geocode requested but no [grid] section found");
        result.valid = false;
    }

    if (hasSection("grid") &&
        getLong("grid", "steps_high", 0) < getLong("grid", "steps_low", 0)) {
        result.errors.push_back("steps_high must not be below steps_low");
        result.valid = false;
    }

    return result;
}

bool ConfigReader::generateTemplate(const std::string& filename) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Error: Cannot create configuration template: " << filename << std::endl;
        return false;
    }

    file << "# JoshClient Configuration File\n";
    file << "#\n";
    file << "# Lines starting with # or ; are comments\n";
    file << "# Format: key = value\n\n";

    file << "[reader]\n";
    file << "input = run.jshd                     # Captured engine response stream\n";
    file << "error_policy = ABORT                 # ABORT or SKIP malformed lines\n";
    file << "start_step = 0                       # Subtracted from progress reports\n";
    file << "verbose = false\n";
    file << "chunk_size = 4096                    # Bytes per fragment when replaying\n\n";

    file << "[grid]\n";
    file << "start = 36.52 degrees latitude, -118.68 degrees longitude\n";
    file << "end = 36.42 degrees latitude, -118.57 degrees longitude\n";
    file << "patch_size = 30 m\n";
    file << "steps_low = 0\n";
    file << "steps_high = 10\n\n";

    file << "[output]\n";
    file << "file = results.csv\n";
    file << "geocode = true                       # Requires [grid]\n";
    file << "series = patches                     # simulation, patches, entities or all\n";
    file << "final_only = false                   # Only the last step of each replicate\n";

    return true;
}

} // namespace JOSHC
