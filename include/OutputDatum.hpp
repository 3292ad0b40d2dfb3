#ifndef OUTPUT_DATUM_HPP
#define OUTPUT_DATUM_HPP

#include "JOSHC.hpp"
#include <string>
#include <vector>
#include <map>
#include <set>

namespace JOSHC {

/**
 * @brief Target categories an engine export may be written for
 */
enum class TargetCategory {
    SIMULATION,     ///< "simulation"
    PATCHES,        ///< "patches"
    ENTITIES,       ///< "entities"
    OTHER           ///< Any other export target
};

TargetCategory categorizeTarget(const std::string& target);

/**
 * @brief One observation exported by the engine
 *
 * Attribute values are kept as the strings the engine sent. Numeric access
 * parses on demand.
 */
class OutputDatum {
public:
    OutputDatum(const std::string& target,
                const std::map<std::string, std::string>& attributes)
        : target_(target), attributes_(attributes) {}

    const std::string& getTarget() const { return target_; }

    /**
     * @brief Attribute names in sorted order
     */
    std::vector<std::string> getAttributeNames() const;

    const std::map<std::string, std::string>& getAttributes() const { return attributes_; }

    bool hasValue(const std::string& name) const;

    /**
     * @brief Raw value of an attribute
     * @throws std::out_of_range if the attribute is not present
     */
    const std::string& getValue(const std::string& name) const;

    /**
     * @brief Attribute parsed as a double
     * @throws std::out_of_range if absent, FormatError if not numeric
     */
    double getNumericValue(const std::string& name) const;

    /**
     * @brief Add or overwrite an attribute
     */
    void setValue(const std::string& name, const std::string& value);
    void setValue(const std::string& name, double value);

private:
    std::string target_;
    std::map<std::string, std::string> attributes_;
};

/**
 * @brief Grid-space extent of the positions seen in one replicate
 */
struct GridBounds {
    double min_x = 0.0;
    double min_y = 0.0;
    double max_x = 0.0;
    double max_y = 0.0;
};

/**
 * @brief Finished results of a single replicate
 *
 * Holds every record in arrival order together with per-category indices
 * into that sequence, so category views always agree with getRecords().
 */
class SimulationResult {
public:
    SimulationResult(std::vector<OutputDatum> records,
                     std::map<TargetCategory, std::vector<size_t>> category_index,
                     std::map<TargetCategory, std::set<std::string>> category_attributes,
                     bool has_bounds, const GridBounds& bounds);

    // =========================================================================
    // Records
    // =========================================================================

    const std::vector<OutputDatum>& getRecords() const { return records_; }

    /**
     * @brief Add or overwrite one attribute of the record at index
     *
     * The attribute joins the variable set of the record's category.
     * @throws std::out_of_range if index is past the last record
     */
    void setRecordValue(size_t index, const std::string& name, double value);

    size_t size() const { return records_.size(); }

    std::vector<OutputDatum> getSimResults() const;
    std::vector<OutputDatum> getPatchResults() const;
    std::vector<OutputDatum> getEntityResults() const;
    std::vector<OutputDatum> getResults(TargetCategory category) const;

    // =========================================================================
    // Attribute Sets
    // =========================================================================

    std::set<std::string> getSimulationVariables() const;
    std::set<std::string> getPatchVariables() const;
    std::set<std::string> getEntityVariables() const;
    std::set<std::string> getVariables(TargetCategory category) const;

    // =========================================================================
    // Timesteps
    // =========================================================================

    /**
     * @brief Distinct "step" values in order of first appearance
     *
     * Records without a step attribute are not part of any step.
     */
    std::vector<std::string> getSteps() const;

    std::vector<OutputDatum> getRecordsForStep(const std::string& step) const;

    // =========================================================================
    // Bounds
    // =========================================================================

    bool hasBounds() const { return has_bounds_; }
    double getMinX() const { return bounds_.min_x; }
    double getMinY() const { return bounds_.min_y; }
    double getMaxX() const { return bounds_.max_x; }
    double getMaxY() const { return bounds_.max_y; }

private:
    std::vector<OutputDatum> records_;
    std::map<TargetCategory, std::vector<size_t>> category_index_;
    std::map<TargetCategory, std::set<std::string>> category_attributes_;
    bool has_bounds_;
    GridBounds bounds_;
};

/**
 * @brief Accumulates records for one replicate until it completes
 */
class SimulationResultBuilder {
public:
    SimulationResultBuilder();

    /**
     * @brief Append a record, preserving arrival order
     */
    void add(const OutputDatum& result);

    size_t size() const { return records_.size(); }

    /**
     * @brief Copy everything collected so far into a finished result
     */
    SimulationResult build() const;

private:
    std::vector<OutputDatum> records_;
    std::map<TargetCategory, std::vector<size_t>> category_index_;
    std::map<TargetCategory, std::set<std::string>> category_attributes_;
    bool has_bounds_;
    GridBounds bounds_;

    void updateBounds(const OutputDatum& result);
};

} // namespace JOSHC

#endif // OUTPUT_DATUM_HPP
