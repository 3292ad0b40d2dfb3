#include "UnitSystem.hpp"
#include <algorithm>
#include <cctype>

namespace JOSHC {

UnitSystem::UnitSystem() {
    addLengthUnits();
    addAngleUnits();
}

// =============================================================================
// Unit Tables
// =============================================================================

void UnitSystem::addLengthUnits() {
    Dimension length(1, 0);

    // Metric
    registerUnit(Unit("meter", "m", length, 1.0, {"meters", "metre", "metres"}));
    registerUnit(Unit("centimeter", "cm", length, 0.01, {"centimeters"}));
    registerUnit(Unit("kilometer", "km", length, 1000.0, {"kilometers"}));

    // Imperial/US
    registerUnit(Unit("foot", "ft", length, 0.3048, {"feet"}));
    registerUnit(Unit("yard", "yd", length, 0.9144, {"yards"}));
    registerUnit(Unit("mile", "mi", length, 1609.344, {"miles"}));
}

void UnitSystem::addAngleUnits() {
    Dimension angle(0, 1);

    registerUnit(Unit("degree", "deg", angle, 1.0, {"degrees"}));
    registerUnit(Unit("radian", "rad", angle, 180.0 / M_PI, {"radians"}));
    registerUnit(Unit("arcminute", "arcmin", angle, 1.0 / 60.0, {"arcminutes"}));
    registerUnit(Unit("arcsecond", "arcsec", angle, 1.0 / 3600.0, {"arcseconds"}));
}

void UnitSystem::registerUnit(const Unit& unit) {
    units_[toLowerCase(unit.name)] = unit;

    // Symbols are case-sensitive first, lowercase second
    if (!unit.symbol.empty()) {
        units_[unit.symbol] = unit;
        units_[toLowerCase(unit.symbol)] = unit;
    }

    for (const auto& alias : unit.aliases) {
        units_[toLowerCase(alias)] = unit;
    }
}

std::string UnitSystem::toLowerCase(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

// =============================================================================
// Lookup and Conversion
// =============================================================================

const Unit* UnitSystem::getUnit(const std::string& name_or_symbol) const {
    auto it = units_.find(name_or_symbol);
    if (it != units_.end()) {
        return &(it->second);
    }

    it = units_.find(toLowerCase(name_or_symbol));
    if (it != units_.end()) {
        return &(it->second);
    }

    return nullptr;
}

bool UnitSystem::hasUnit(const std::string& name_or_symbol) const {
    return getUnit(name_or_symbol) != nullptr;
}

double UnitSystem::toBaseChecked(double value, const std::string& from_unit,
                                 const Dimension& expected, const char* what) const {
    const Unit* unit = getUnit(from_unit);
    if (!unit) {
        throw std::runtime_error("Unknown unit: " + from_unit);
    }
    if (unit->dimension != expected) {
        throw std::runtime_error("Expected " + std::string(what) + " unit but got: " + from_unit);
    }
    return unit->convertToBase(value);
}

double UnitSystem::toMeters(double value, const std::string& from_unit) const {
    return toBaseChecked(value, from_unit, Dimension(1, 0), "length");
}

double UnitSystem::toDegrees(double value, const std::string& from_unit) const {
    return toBaseChecked(value, from_unit, Dimension(0, 1), "angle");
}

} // namespace JOSHC
