#ifndef ENGINE_VALUE_HPP
#define ENGINE_VALUE_HPP

#include "JOSHC.hpp"
#include <string>
#include <vector>

namespace JOSHC {

/**
 * @brief Number with units as reported by the engine (e.g. "30 m")
 */
class EngineValue {
public:
    EngineValue(double value, const std::string& units)
        : value_(value), units_(units) {}

    double getValue() const { return value_; }

    /**
     * @brief Units description like "m" or "degrees"
     */
    const std::string& getUnits() const { return units_; }

    /**
     * @brief Value in meters, using UnitSystem to resolve the units
     * @throws std::runtime_error if the units are not a known length
     */
    double getAsMeters(const UnitSystem& units) const;

    /**
     * @brief Value in degrees, using UnitSystem to resolve the units
     * @throws std::runtime_error if the units are not a known angle
     */
    double getAsDegrees(const UnitSystem& units) const;

private:
    double value_;
    std::string units_;
};

/**
 * @brief Corner point parsed from a grid start or end string
 *
 * Order in the source text does not matter, the label next to each value
 * decides which one is latitude.
 */
class StartEndString {
public:
    StartEndString(const EngineValue& longitude, const EngineValue& latitude)
        : longitude_(longitude), latitude_(latitude) {}

    const EngineValue& getLongitude() const { return longitude_; }
    const EngineValue& getLatitude() const { return latitude_; }

private:
    EngineValue longitude_;
    EngineValue latitude_;
};

// =============================================================================
// Parsing Functions
// =============================================================================

/**
 * @brief Parse "<number> <units>" like "30 m"
 *
 * Surrounding whitespace is ignored and the text is split on the first
 * space, so units may themselves contain spaces ("36.5 degrees north").
 *
 * @throws FormatError if there is no unit part or the number is not a valid
 *         floating point literal
 */
EngineValue parseEngineValueString(const std::string& target);

/**
 * @brief Parse a corner like "36.519 degrees latitude, -118.672 degrees longitude"
 *
 * The text must split on commas into exactly two parts, each with at least
 * three space separated tokens (number, units, label...). If the third token
 * of the first part contains "latitude" that part is the latitude and the
 * second is the longitude, otherwise the other way around.
 *
 * @throws FormatError on any structural or numeric problem
 */
StartEndString parseStartEndString(const std::string& target);

/**
 * @brief Parse a full floating point literal, rejecting trailing garbage
 * @throws FormatError if text is not entirely a number
 */
double parseDoubleStrict(const std::string& text, const std::string& context);

} // namespace JOSHC

#endif // ENGINE_VALUE_HPP
