#ifndef UNIT_SYSTEM_HPP
#define UNIT_SYSTEM_HPP

#include <string>
#include <map>
#include <vector>
#include <stdexcept>
#include <cmath>

namespace JOSHC {

/**
 * @brief Unit dimension in terms of Length and plane Angle (L A)
 *
 * Engine values reported alongside grid metadata are either distances
 * (patch sizes) or angles (corner coordinates). Anything else is rejected.
 */
struct Dimension {
    double L;  // Length exponent
    double A;  // Angle exponent

    Dimension(double length = 0, double angle = 0)
        : L(length), A(angle) {}

    bool operator==(const Dimension& other) const {
        return (std::abs(L - other.L) < 1e-10 &&
                std::abs(A - other.A) < 1e-10);
    }

    bool operator!=(const Dimension& other) const {
        return !(*this == other);
    }
};

/**
 * @brief Unit definition with conversion factor to base units
 *
 * Base units are:
 * - Length: meter (m)
 * - Angle: degree (deg), since every downstream geodesy call takes degrees
 */
struct Unit {
    std::string name;           // Full name (e.g., "meter")
    std::string symbol;         // Short symbol (e.g., "m")
    Dimension dimension;
    double to_base;             // Conversion factor to base units
    std::vector<std::string> aliases;  // Plural or alternate spellings

    Unit() : to_base(1.0) {}

    Unit(const std::string& n, const std::string& s,
         const Dimension& d, double factor,
         const std::vector<std::string>& alias_list = {})
        : name(n), symbol(s), dimension(d), to_base(factor), aliases(alias_list) {}

    double convertToBase(double value) const {
        return value * to_base;
    }
};

/**
 * @brief Database of the length and angle units an engine may report
 *
 * Lookup is by name, symbol or alias, case-insensitively, so "30 m",
 * "30 meters" and "0.03 km" all resolve to 30 meters.
 */
class UnitSystem {
public:
    UnitSystem();
    ~UnitSystem() = default;

    /**
     * @brief Get unit by name, symbol or alias
     * @return Pointer to Unit, or nullptr if not found
     */
    const Unit* getUnit(const std::string& name_or_symbol) const;

    bool hasUnit(const std::string& name_or_symbol) const;

    // =========================================================================
    // Conversion Functions
    // =========================================================================

    /**
     * @brief Convert to meters, rejecting non-length units
     * @throws std::runtime_error if the unit is unknown or not a length
     */
    double toMeters(double value, const std::string& from_unit) const;

    /**
     * @brief Convert to degrees, rejecting non-angle units
     */
    double toDegrees(double value, const std::string& from_unit) const;

private:
    // name/symbol/alias -> Unit
    std::map<std::string, Unit> units_;

    void addLengthUnits();
    void addAngleUnits();

    void registerUnit(const Unit& unit);
    double toBaseChecked(double value, const std::string& from_unit,
                         const Dimension& expected, const char* what) const;

    static std::string toLowerCase(const std::string& str);
};

} // namespace JOSHC

#endif // UNIT_SYSTEM_HPP
