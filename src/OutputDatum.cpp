#include "OutputDatum.hpp"
#include "EngineValue.hpp"
#include <algorithm>
#include <cstdlib>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace JOSHC {

namespace {

bool tryParseDouble(const std::string& text, double& value) {
    if (text.empty()) return false;
    char* end = nullptr;
    value = std::strtod(text.c_str(), &end);
    return end == text.c_str() + text.size();
}

} // namespace

TargetCategory categorizeTarget(const std::string& target) {
    if (target == "simulation") return TargetCategory::SIMULATION;
    if (target == "patches") return TargetCategory::PATCHES;
    if (target == "entities") return TargetCategory::ENTITIES;
    return TargetCategory::OTHER;
}

// =============================================================================
// OutputDatum Implementation
// =============================================================================

std::vector<std::string> OutputDatum::getAttributeNames() const {
    std::vector<std::string> names;
    names.reserve(attributes_.size());
    for (const auto& pair : attributes_) {
        names.push_back(pair.first);
    }
    return names;
}

bool OutputDatum::hasValue(const std::string& name) const {
    return attributes_.find(name) != attributes_.end();
}

const std::string& OutputDatum::getValue(const std::string& name) const {
    auto it = attributes_.find(name);
    if (it == attributes_.end()) {
        throw std::out_of_range("Value for attribute " + name + " not found.");
    }
    return it->second;
}

double OutputDatum::getNumericValue(const std::string& name) const {
    return parseDoubleStrict(getValue(name), target_ + "." + name);
}

void OutputDatum::setValue(const std::string& name, const std::string& value) {
    attributes_[name] = value;
}

void OutputDatum::setValue(const std::string& name, double value) {
    std::ostringstream ss;
    ss << std::setprecision(std::numeric_limits<double>::max_digits10) << value;
    attributes_[name] = ss.str();
}

// =============================================================================
// SimulationResult Implementation
// =============================================================================

SimulationResult::SimulationResult(std::vector<OutputDatum> records,
                                   std::map<TargetCategory, std::vector<size_t>> category_index,
                                   std::map<TargetCategory, std::set<std::string>> category_attributes,
                                   bool has_bounds, const GridBounds& bounds)
    : records_(std::move(records)),
      category_index_(std::move(category_index)),
      category_attributes_(std::move(category_attributes)),
      has_bounds_(has_bounds),
      bounds_(bounds) {}

void SimulationResult::setRecordValue(size_t index, const std::string& name, double value) {
    if (index >= records_.size()) {
        throw std::out_of_range("Record index " + std::to_string(index) + " out of range");
    }

    OutputDatum& record = records_[index];
    record.setValue(name, value);
    category_attributes_[categorizeTarget(record.getTarget())].insert(name);
}

std::vector<OutputDatum> SimulationResult::getResults(TargetCategory category) const {
    std::vector<OutputDatum> result;
    auto it = category_index_.find(category);
    if (it == category_index_.end()) return result;

    result.reserve(it->second.size());
    for (size_t index : it->second) {
        result.push_back(records_[index]);
    }
    return result;
}

std::vector<OutputDatum> SimulationResult::getSimResults() const {
    return getResults(TargetCategory::SIMULATION);
}

std::vector<OutputDatum> SimulationResult::getPatchResults() const {
    return getResults(TargetCategory::PATCHES);
}

std::vector<OutputDatum> SimulationResult::getEntityResults() const {
    return getResults(TargetCategory::ENTITIES);
}

std::set<std::string> SimulationResult::getVariables(TargetCategory category) const {
    auto it = category_attributes_.find(category);
    if (it == category_attributes_.end()) return {};
    return it->second;
}

std::set<std::string> SimulationResult::getSimulationVariables() const {
    return getVariables(TargetCategory::SIMULATION);
}

std::set<std::string> SimulationResult::getPatchVariables() const {
    return getVariables(TargetCategory::PATCHES);
}

std::set<std::string> SimulationResult::getEntityVariables() const {
    return getVariables(TargetCategory::ENTITIES);
}

std::vector<std::string> SimulationResult::getSteps() const {
    std::vector<std::string> steps;
    std::set<std::string> seen;
    for (const auto& record : records_) {
        if (!record.hasValue("step")) continue;
        const std::string& step = record.getValue("step");
        if (seen.insert(step).second) {
            steps.push_back(step);
        }
    }
    return steps;
}

std::vector<OutputDatum> SimulationResult::getRecordsForStep(const std::string& step) const {
    std::vector<OutputDatum> result;
    for (const auto& record : records_) {
        if (record.hasValue("step") && record.getValue("step") == step) {
            result.push_back(record);
        }
    }
    return result;
}

// =============================================================================
// SimulationResultBuilder Implementation
// =============================================================================

SimulationResultBuilder::SimulationResultBuilder()
    : has_bounds_(false) {}

void SimulationResultBuilder::add(const OutputDatum& result) {
    TargetCategory category = categorizeTarget(result.getTarget());

    category_index_[category].push_back(records_.size());
    records_.push_back(result);

    auto& attributes = category_attributes_[category];
    for (const auto& pair : result.getAttributes()) {
        attributes.insert(pair.first);
    }

    updateBounds(result);
}

SimulationResult SimulationResultBuilder::build() const {
    return SimulationResult(records_, category_index_, category_attributes_,
                            has_bounds_, bounds_);
}

void SimulationResultBuilder::updateBounds(const OutputDatum& result) {
    // Records without a numeric position.x and position.y do not move the bounds
    if (!result.hasValue("position.x") || !result.hasValue("position.y")) {
        return;
    }

    double pos_x, pos_y;
    if (!tryParseDouble(result.getValue("position.x"), pos_x) ||
        !tryParseDouble(result.getValue("position.y"), pos_y)) {
        return;
    }

    if (!has_bounds_) {
        bounds_.min_x = bounds_.max_x = pos_x;
        bounds_.min_y = bounds_.max_y = pos_y;
        has_bounds_ = true;
        return;
    }

    bounds_.min_x = std::min(bounds_.min_x, pos_x);
    bounds_.min_y = std::min(bounds_.min_y, pos_y);
    bounds_.max_x = std::max(bounds_.max_x, pos_x);
    bounds_.max_y = std::max(bounds_.max_y, pos_y);
}

} // namespace JOSHC
