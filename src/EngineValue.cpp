#include "EngineValue.hpp"
#include "Exceptions.hpp"
#include "UnitSystem.hpp"
#include <sstream>

namespace JOSHC {

namespace {

std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";

    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

std::vector<std::string> tokenize(const std::string& line) {
    std::vector<std::string> tokens;
    std::istringstream iss(line);
    std::string token;
    while (iss >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

} // namespace

double EngineValue::getAsMeters(const UnitSystem& units) const {
    return units.toMeters(value_, units_);
}

double EngineValue::getAsDegrees(const UnitSystem& units) const {
    return units.toDegrees(value_, units_);
}

double parseDoubleStrict(const std::string& text, const std::string& context) {
    if (text.empty()) {
        throw FormatError("Missing number", context);
    }

    size_t consumed = 0;
    double value;
    try {
        value = std::stod(text, &consumed);
    } catch (const std::invalid_argument&) {
        throw FormatError("Invalid number '" + text + "'", context);
    } catch (const std::out_of_range&) {
        throw FormatError("Number out of range '" + text + "'", context);
    }

    if (consumed != text.size()) {
        throw FormatError("Invalid number '" + text + "'", context);
    }

    return value;
}

EngineValue parseEngineValueString(const std::string& target) {
    std::string trimmed = trim(target);

    size_t space_pos = trimmed.find(' ');
    if (space_pos == std::string::npos) {
        throw FormatError("Invalid engine value string format", target);
    }

    std::string number = trimmed.substr(0, space_pos);
    std::string units = trim(trimmed.substr(space_pos + 1));
    if (units.empty()) {
        throw FormatError("Invalid engine value string format", target);
    }

    return EngineValue(parseDoubleStrict(number, target), units);
}

StartEndString parseStartEndString(const std::string& target) {
    std::vector<std::string> parts;
    std::stringstream ss(target);
    std::string item;
    while (std::getline(ss, item, ',')) {
        parts.push_back(item);
    }
    // getline drops a trailing empty field, which still counts as a part
    if (!target.empty() && target.back() == ',') {
        parts.push_back("");
    }

    if (parts.size() != 2) {
        throw FormatError("Invalid start/end string format", target);
    }

    std::vector<std::string> first_parts = tokenize(parts[0]);
    std::vector<std::string> second_parts = tokenize(parts[1]);

    if (first_parts.size() < 3 || second_parts.size() < 3) {
        throw FormatError("Invalid coordinate format", target);
    }

    bool first_is_latitude = first_parts[2].find("latitude") != std::string::npos;

    EngineValue first(parseDoubleStrict(first_parts[0], target), first_parts[1]);
    EngineValue second(parseDoubleStrict(second_parts[0], target), second_parts[1]);

    if (first_is_latitude) {
        return StartEndString(second, first);
    }
    return StartEndString(first, second);
}

} // namespace JOSHC
