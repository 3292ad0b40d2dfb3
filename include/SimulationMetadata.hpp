#ifndef SIMULATION_METADATA_HPP
#define SIMULATION_METADATA_HPP

#include "JOSHC.hpp"
#include "CoordinateSystem.hpp"
#include "EngineValue.hpp"

namespace JOSHC {

/**
 * @brief Grid and timestep description of a simulation
 *
 * Grid coordinates are in patches, with (0, 0) at the top left corner.
 * When the simulation is anchored on Earth the min/max longitude and
 * latitude are also known and hasDegrees() is true.
 */
class SimulationMetadata {
public:
    SimulationMetadata();

    /**
     * @brief Grid-only metadata without an Earth anchor
     */
    SimulationMetadata(double start_x, double start_y, double end_x, double end_y,
                       double patch_size);

    /**
     * @brief Earth-space metadata from the grid corners and patch size
     *
     * The corners may be given in any order. Patch size units are resolved
     * with the default UnitSystem, so "1 km" and "30 m" both work.
     *
     * @throws InvalidArgument if the patch size is not positive
     * @throws std::runtime_error if units are not a known angle or length
     */
    static SimulationMetadata fromStartEnd(const StartEndString& start,
                                           const StartEndString& end,
                                           const EngineValue& patch_size);

    // Grid extent
    double getStartX() const { return start_x_; }
    double getStartY() const { return start_y_; }
    double getEndX() const { return end_x_; }
    double getEndY() const { return end_y_; }
    double getWidth() const { return end_x_ - start_x_; }
    double getHeight() const { return end_y_ - start_y_; }

    /**
     * @brief Patch edge length in meters
     */
    double getPatchSize() const { return patch_size_; }

    // Earth-space bounds
    bool hasDegrees() const { return has_degrees_; }
    double getMinLongitude() const { return min_longitude_; }
    double getMaxLongitude() const { return max_longitude_; }
    double getMinLatitude() const { return min_latitude_; }
    double getMaxLatitude() const { return max_latitude_; }

    /**
     * @brief Grid origin on Earth: (min longitude, max latitude)
     * @throws InvalidArgument if hasDegrees() is false
     */
    EarthPoint getTopLeft() const;

    // Timesteps
    void setSteps(long low, long high);
    long getStepsLow() const { return steps_low_; }
    long getStepsHigh() const { return steps_high_; }
    long getTotalSteps() const { return steps_high_ - steps_low_ + 1; }

private:
    double start_x_;
    double start_y_;
    double end_x_;
    double end_y_;
    double patch_size_;

    bool has_degrees_;
    double min_longitude_;
    double max_longitude_;
    double min_latitude_;
    double max_latitude_;

    long steps_low_;
    long steps_high_;
};

} // namespace JOSHC

#endif // SIMULATION_METADATA_HPP
