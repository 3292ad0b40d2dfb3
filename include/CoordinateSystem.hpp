#ifndef COORDINATE_SYSTEM_HPP
#define COORDINATE_SYSTEM_HPP

#include "JOSHC.hpp"
#include <string>
#include <vector>
#include <cmath>

namespace JOSHC {

/**
 * @brief Position on Earth in degrees
 */
struct EarthPoint {
    double longitude;   ///< Degrees, positive east
    double latitude;    ///< Degrees, positive north

    EarthPoint() : longitude(0), latitude(0) {}
    EarthPoint(double lon, double lat) : longitude(lon), latitude(lat) {}

    double getLongitude() const { return longitude; }
    double getLatitude() const { return latitude; }
};

/**
 * @brief Position in grid space, in patches right of and below the origin
 */
struct GridPoint {
    double x;
    double y;

    GridPoint() : x(0), y(0) {}
    GridPoint(double xx, double yy) : x(xx), y(yy) {}
};

enum class CardinalDirection {
    NORTH,
    SOUTH,
    EAST,
    WEST
};

/**
 * @brief Parse exactly "N", "S", "E" or "W"
 * @throws InvalidArgument for anything else (including lowercase)
 */
CardinalDirection parseDirection(const std::string& direction);

/**
 * @brief Spherical Earth calculations used for geocoding grid results
 */
namespace Geodetic {

    constexpr double EARTH_RADIUS = 6371000.0;  ///< Mean radius in meters

    inline double deg2rad(double degrees) {
        return degrees * M_PI / 180.0;
    }

    inline double rad2deg(double radians) {
        return radians * 180.0 / M_PI;
    }

    /**
     * @brief Great circle distance using the Haversine formula
     * @param lat1, lon1 First point in degrees
     * @param lat2, lon2 Second point in degrees
     * @return Distance in meters
     */
    double haversineDistance(double lat1, double lon1, double lat2, double lon2);

    /**
     * @brief Distance in meters between two points (symmetric)
     */
    double getDistanceMeters(const EarthPoint& start, const EarthPoint& end);

    /**
     * @brief Point reached by moving along a cardinal direction
     *
     * North and south change latitude by distance / radius. East and west
     * change longitude by the same angle scaled by 1 / cos(latitude), an
     * equirectangular step rather than a great circle bearing. Small moves
     * measured back with getDistanceMeters reproduce the distance.
     *
     * @throws InvalidArgument for east/west moves starting at a pole
     */
    EarthPoint getAtDistanceFrom(const EarthPoint& start, double distance_meters,
                                 CardinalDirection direction);

    /**
     * @brief As above with the direction given as "N", "S", "E" or "W"
     * @throws InvalidArgument for any other direction string
     */
    EarthPoint getAtDistanceFrom(const EarthPoint& start, double distance_meters,
                                 const std::string& direction);
}

/**
 * @brief Converts between grid space and Earth space for one simulation grid
 *
 * The grid origin is its top left corner. x grows east and y grows south,
 * both counted in patches of a fixed size in meters.
 */
class GridProjector {
public:
    /**
     * @throws InvalidArgument if patch_size_meters is not positive
     */
    GridProjector(const EarthPoint& top_left, double patch_size_meters);

    /**
     * @brief Earth position of a grid position: east by x patches, then south by y
     */
    EarthPoint toEarth(double x, double y) const;

    /**
     * @brief Grid cell containing an Earth position
     *
     * Distances east and south of the origin are divided by the patch size
     * and floored, so any point inside a patch maps to that patch's index.
     */
    GridPoint toGrid(const EarthPoint& point) const;

    const EarthPoint& getTopLeft() const { return top_left_; }
    double getPatchSizeMeters() const { return patch_size_meters_; }

private:
    EarthPoint top_left_;
    double patch_size_meters_;
};

/**
 * @brief Add position.longitude and position.latitude to grid-space results
 *
 * Every record of every replicate carrying both position.x and position.y
 * gets longitude/latitude computed from the metadata's top left corner and
 * patch size, overwriting earlier values. Other records are untouched.
 * All replicates are assumed to share the same grid.
 *
 * @param results Modified in place
 * @param metadata Grid description; must have Earth-space bounds
 * @return results, for chaining
 * @throws InvalidArgument if metadata has no Earth-space bounds
 * @throws FormatError if a position value is not numeric; no record is
 *         changed in that case
 */
SimulationResults& addPositions(SimulationResults& results, const SimulationMetadata& metadata);

} // namespace JOSHC

#endif // COORDINATE_SYSTEM_HPP
