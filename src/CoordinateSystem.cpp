#include "CoordinateSystem.hpp"
#include "Exceptions.hpp"
#include "OutputDatum.hpp"
#include "SimulationMetadata.hpp"
#include <cmath>
#include <vector>

namespace JOSHC {

CardinalDirection parseDirection(const std::string& direction) {
    if (direction == "N") return CardinalDirection::NORTH;
    if (direction == "S") return CardinalDirection::SOUTH;
    if (direction == "E") return CardinalDirection::EAST;
    if (direction == "W") return CardinalDirection::WEST;
    throw InvalidArgument("Invalid direction '" + direction + "', expected N, S, E or W");
}

// ============================================================================
// Geodetic Utilities Implementation
// ============================================================================

namespace Geodetic {

double haversineDistance(double lat1, double lon1, double lat2, double lon2) {
    double phi1 = deg2rad(lat1);
    double phi2 = deg2rad(lat2);
    double dPhi = deg2rad(lat2 - lat1);
    double dLambda = deg2rad(lon2 - lon1);

    double a = std::sin(dPhi / 2) * std::sin(dPhi / 2) +
               std::cos(phi1) * std::cos(phi2) *
               std::sin(dLambda / 2) * std::sin(dLambda / 2);
    double c = 2 * std::atan2(std::sqrt(a), std::sqrt(1 - a));

    return EARTH_RADIUS * c;
}

double getDistanceMeters(const EarthPoint& start, const EarthPoint& end) {
    return haversineDistance(start.latitude, start.longitude, end.latitude, end.longitude);
}

EarthPoint getAtDistanceFrom(const EarthPoint& start, double distance_meters,
                             CardinalDirection direction) {
    double delta = rad2deg(distance_meters / EARTH_RADIUS);

    switch (direction) {
        case CardinalDirection::NORTH:
            return EarthPoint(start.longitude, start.latitude + delta);
        case CardinalDirection::SOUTH:
            return EarthPoint(start.longitude, start.latitude - delta);
        case CardinalDirection::EAST:
        case CardinalDirection::WEST: {
            double cos_lat = std::cos(deg2rad(start.latitude));
            if (std::abs(cos_lat) < 1e-12) {
                throw InvalidArgument("Cannot move east or west from a pole");
            }
            double delta_lon = delta / cos_lat;
            if (direction == CardinalDirection::WEST) {
                delta_lon = -delta_lon;
            }
            return EarthPoint(start.longitude + delta_lon, start.latitude);
        }
    }

    throw InvalidArgument("Unsupported direction");
}

EarthPoint getAtDistanceFrom(const EarthPoint& start, double distance_meters,
                             const std::string& direction) {
    return getAtDistanceFrom(start, distance_meters, parseDirection(direction));
}

} // namespace Geodetic

// ============================================================================
// GridProjector Implementation
// ============================================================================

GridProjector::GridProjector(const EarthPoint& top_left, double patch_size_meters)
    : top_left_(top_left), patch_size_meters_(patch_size_meters) {
    if (!(patch_size_meters > 0)) {
        throw InvalidArgument("Patch size must be positive");
    }
}

EarthPoint GridProjector::toEarth(double x, double y) const {
    EarthPoint east = Geodetic::getAtDistanceFrom(
        top_left_, x * patch_size_meters_, CardinalDirection::EAST);
    return Geodetic::getAtDistanceFrom(
        east, y * patch_size_meters_, CardinalDirection::SOUTH);
}

GridPoint GridProjector::toGrid(const EarthPoint& point) const {
    // Horizontal distance along the origin's parallel, vertical along its meridian
    double horizontal = Geodetic::getDistanceMeters(
        top_left_, EarthPoint(point.longitude, top_left_.latitude));
    double vertical = Geodetic::getDistanceMeters(
        top_left_, EarthPoint(top_left_.longitude, point.latitude));

    return GridPoint(std::floor(horizontal / patch_size_meters_),
                     std::floor(vertical / patch_size_meters_));
}

// ============================================================================
// Result Geocoding
// ============================================================================

SimulationResults& addPositions(SimulationResults& results, const SimulationMetadata& metadata) {
    if (!metadata.hasDegrees()) {
        throw InvalidArgument("Simulation metadata has no Earth-space bounds to geocode against");
    }

    GridProjector projector(metadata.getTopLeft(), metadata.getPatchSize());

    struct Placement {
        size_t replicate;
        size_t record;
        EarthPoint point;
    };

    // Every position is projected before any record changes
    std::vector<Placement> placements;
    for (size_t i = 0; i < results.size(); ++i) {
        const auto& records = results[i].getRecords();
        for (size_t j = 0; j < records.size(); ++j) {
            const OutputDatum& record = records[j];
            if (!record.hasValue("position.x") || !record.hasValue("position.y")) {
                continue;
            }

            EarthPoint point = projector.toEarth(record.getNumericValue("position.x"),
                                                 record.getNumericValue("position.y"));
            placements.push_back({i, j, point});
        }
    }

    for (const auto& placement : placements) {
        SimulationResult& replicate = results[placement.replicate];
        replicate.setRecordValue(placement.record, "position.longitude", placement.point.longitude);
        replicate.setRecordValue(placement.record, "position.latitude", placement.point.latitude);
    }

    return results;
}

} // namespace JOSHC
