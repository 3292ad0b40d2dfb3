#include "WireProtocol.hpp"
#include "Exceptions.hpp"
#include <cctype>
#include <limits>
#include <sstream>

namespace JOSHC {

namespace {

const std::string ERROR_PREFIX = "[error] ";
const std::string END_PREFIX = "end ";
const std::string PROGRESS_PREFIX = "progress ";

std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";

    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

bool isDigits(const std::string& str) {
    if (str.empty()) return false;
    for (char c : str) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

bool startsWith(const std::string& str, const std::string& prefix) {
    return str.compare(0, prefix.size(), prefix) == 0;
}

long parseCounter(const std::string& digits, const std::string& line) {
    if (!isDigits(digits)) {
        throw FormatError("Invalid engine response format", line);
    }
    try {
        return std::stol(digits);
    } catch (const std::out_of_range&) {
        throw FormatError("Counter out of range in engine response", line);
    }
}

ReplicateId parseReplicate(const std::string& digits, const std::string& line) {
    long value = parseCounter(digits, line);
    if (value > std::numeric_limits<ReplicateId>::max()) {
        throw FormatError("Replicate out of range in engine response", line);
    }
    return static_cast<ReplicateId>(value);
}

std::string makeSafe(const std::string& value) {
    std::string safe;
    safe.reserve(value.size());
    for (char c : value) {
        if (c == '\t' || c == '\n' || c == '\r') {
            safe += "    ";
        } else {
            safe += c;
        }
    }
    return safe;
}

bool hasAnyOf(const std::string& str, const char* chars) {
    return str.find_first_of(chars) != std::string::npos;
}

} // namespace

// =============================================================================
// WireConverter Implementation
// =============================================================================

std::string WireConverter::serializeToString(const NamedMap& named_map) {
    // Names and keys are structural, so they cannot be rewritten like values
    if (named_map.name.empty() || hasAnyOf(named_map.name, ":\t\r\n")) {
        throw FormatError("Target name cannot be empty or contain ':', tabs or newlines",
                          named_map.name);
    }
    for (const auto& pair : named_map.target) {
        if (pair.first.empty() || hasAnyOf(pair.first, "=\t\r\n")) {
            throw FormatError("Attribute key cannot be empty or contain '=', tabs or newlines",
                              pair.first);
        }
    }

    std::ostringstream ss;
    ss << named_map.name << ":";

    bool first = true;
    for (const auto& pair : named_map.target) {
        if (!first) ss << "\t";
        ss << pair.first << "=" << makeSafe(pair.second);
        first = false;
    }

    return ss.str();
}

NamedMap WireConverter::deserializeFromString(const std::string& wire_format) {
    if (trim(wire_format).empty()) {
        throw FormatError("Wire format string cannot be empty", wire_format);
    }

    size_t colon_pos = wire_format.find(':');
    if (colon_pos == std::string::npos) {
        throw FormatError("Wire format must contain a colon separator", wire_format);
    }
    if (colon_pos == 0) {
        throw FormatError("Wire format must have a non-empty name before colon", wire_format);
    }

    NamedMap result;
    result.name = wire_format.substr(0, colon_pos);

    std::stringstream data_section(wire_format.substr(colon_pos + 1));
    std::string pair;
    while (std::getline(data_section, pair, '\t')) {
        if (pair.empty()) continue;

        size_t equals_pos = pair.find('=');
        if (equals_pos == std::string::npos) {
            throw FormatError("Invalid key-value pair format '" + pair + "'", wire_format);
        }
        if (equals_pos == 0) {
            throw FormatError("Key cannot be empty in key-value pair", wire_format);
        }

        result.target[pair.substr(0, equals_pos)] = pair.substr(equals_pos + 1);
    }

    return result;
}

// =============================================================================
// WireResponseParser Implementation
// =============================================================================

ParsedResponse WireResponseParser::parseEngineResponse(const std::string& line) {
    ParsedResponse response;

    std::string trimmed = trim(line);
    if (trimmed.empty()) {
        return response;
    }

    if (startsWith(trimmed, ERROR_PREFIX) && trimmed.size() > ERROR_PREFIX.size()) {
        response.type = ResponseType::ENGINE_ERROR;
        response.error_message = trimmed.substr(ERROR_PREFIX.size());
        return response;
    }

    size_t close_pos = trimmed.find(']');
    if (trimmed[0] != '[' || close_pos == std::string::npos) {
        throw FormatError("Invalid engine response format", line);
    }

    std::string tag = trimmed.substr(1, close_pos - 1);
    std::string rest = trimmed.substr(close_pos + 1);

    if (startsWith(tag, END_PREFIX) && rest.empty()) {
        response.type = ResponseType::END;
        response.replicate = parseReplicate(tag.substr(END_PREFIX.size()), line);
        return response;
    }

    if (startsWith(tag, PROGRESS_PREFIX) && rest.empty()) {
        response.type = ResponseType::PROGRESS;
        response.step_count = parseCounter(tag.substr(PROGRESS_PREFIX.size()), line);
        return response;
    }

    if (!isDigits(tag)) {
        throw FormatError("Invalid engine response format", line);
    }

    ReplicateId replicate = parseReplicate(tag, line);

    // "[N]" on its own carries no data
    if (rest.empty()) {
        return response;
    }

    if (rest[0] != ' ') {
        throw FormatError("Invalid engine response format", line);
    }

    std::string payload = rest.substr(1);
    if (trim(payload).empty()) {
        return response;
    }

    response.type = ResponseType::DATUM;
    response.replicate = replicate;
    response.datum = WireConverter::deserializeFromString(payload);
    return response;
}

std::string WireResponseParser::formatDatum(ReplicateId replicate, const NamedMap& datum) {
    return "[" + std::to_string(replicate) + "] " + WireConverter::serializeToString(datum);
}

std::string WireResponseParser::formatEnd(ReplicateId replicate) {
    return "[end " + std::to_string(replicate) + "]";
}

std::string WireResponseParser::formatProgress(long step) {
    return "[progress " + std::to_string(step) + "]";
}

} // namespace JOSHC
