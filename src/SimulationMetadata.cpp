#include "SimulationMetadata.hpp"
#include "Exceptions.hpp"
#include "UnitSystem.hpp"
#include <algorithm>

namespace JOSHC {

SimulationMetadata::SimulationMetadata()
    : start_x_(0), start_y_(0), end_x_(0), end_y_(0), patch_size_(1.0),
      has_degrees_(false),
      min_longitude_(0), max_longitude_(0), min_latitude_(0), max_latitude_(0),
      steps_low_(0), steps_high_(0) {}

SimulationMetadata::SimulationMetadata(double start_x, double start_y,
                                       double end_x, double end_y,
                                       double patch_size)
    : SimulationMetadata() {
    if (!(patch_size > 0)) {
        throw InvalidArgument("Patch size must be positive");
    }
    start_x_ = start_x;
    start_y_ = start_y;
    end_x_ = end_x;
    end_y_ = end_y;
    patch_size_ = patch_size;
}

SimulationMetadata SimulationMetadata::fromStartEnd(const StartEndString& start,
                                                    const StartEndString& end,
                                                    const EngineValue& patch_size) {
    UnitSystem units;

    double start_lon = start.getLongitude().getAsDegrees(units);
    double start_lat = start.getLatitude().getAsDegrees(units);
    double end_lon = end.getLongitude().getAsDegrees(units);
    double end_lat = end.getLatitude().getAsDegrees(units);
    double patch_meters = patch_size.getAsMeters(units);

    if (!(patch_meters > 0)) {
        throw InvalidArgument("Patch size must be positive");
    }

    SimulationMetadata metadata;
    metadata.has_degrees_ = true;
    metadata.min_longitude_ = std::min(start_lon, end_lon);
    metadata.max_longitude_ = std::max(start_lon, end_lon);
    metadata.min_latitude_ = std::min(start_lat, end_lat);
    metadata.max_latitude_ = std::max(start_lat, end_lat);
    metadata.patch_size_ = patch_meters;

    // Extent in patches measured along the top and left edges
    EarthPoint top_left = metadata.getTopLeft();
    EarthPoint top_right(metadata.max_longitude_, metadata.max_latitude_);
    EarthPoint bottom_left(metadata.min_longitude_, metadata.min_latitude_);

    metadata.end_x_ = Geodetic::getDistanceMeters(top_left, top_right) / patch_meters;
    metadata.end_y_ = Geodetic::getDistanceMeters(top_left, bottom_left) / patch_meters;

    return metadata;
}

EarthPoint SimulationMetadata::getTopLeft() const {
    if (!has_degrees_) {
        throw InvalidArgument("Simulation metadata has no Earth-space bounds");
    }
    return EarthPoint(min_longitude_, max_latitude_);
}

void SimulationMetadata::setSteps(long low, long high) {
    if (high < low) {
        throw InvalidArgument("steps_high must not be below steps_low");
    }
    steps_low_ = low;
    steps_high_ = high;
}

} // namespace JOSHC
