#include "ResultExporter.hpp"
#include <fstream>
#include <set>
#include <stdexcept>

namespace JOSHC {

ResultExporter::ResultExporter(ExportSeries series, bool final_only)
    : series_(series), final_only_(final_only) {}

std::vector<OutputDatum> ResultExporter::selectRecords(const SimulationResult& result) const {
    std::vector<OutputDatum> selected;
    switch (series_) {
        case ExportSeries::SIMULATION: selected = result.getSimResults(); break;
        case ExportSeries::PATCHES: selected = result.getPatchResults(); break;
        case ExportSeries::ENTITIES: selected = result.getEntityResults(); break;
        case ExportSeries::ALL: selected = result.getRecords(); break;
    }

    if (!final_only_) return selected;

    std::vector<std::string> steps = result.getSteps();
    if (steps.empty()) return selected;

    const std::string& last_step = steps.back();
    std::vector<OutputDatum> final_records;
    for (const auto& record : selected) {
        if (record.hasValue("step") && record.getValue("step") == last_step) {
            final_records.push_back(record);
        }
    }
    return final_records;
}

std::vector<std::string> ResultExporter::getColumns(const SimulationResults& results) const {
    std::set<std::string> names;
    for (const auto& result : results) {
        for (const auto& record : selectRecords(result)) {
            for (const auto& pair : record.getAttributes()) {
                names.insert(pair.first);
            }
        }
    }

    std::vector<std::string> columns;
    columns.push_back("replicate");
    columns.insert(columns.end(), names.begin(), names.end());
    return columns;
}

size_t ResultExporter::write(std::ostream& out, const SimulationResults& results) const {
    std::vector<std::string> columns = getColumns(results);

    for (size_t i = 0; i < columns.size(); ++i) {
        if (i > 0) out << ",";
        out << escapeCell(columns[i]);
    }
    out << "\n";

    size_t rows = 0;
    for (size_t replicate = 0; replicate < results.size(); ++replicate) {
        for (const auto& record : selectRecords(results[replicate])) {
            out << replicate;
            for (size_t i = 1; i < columns.size(); ++i) {
                out << ",";
                if (record.hasValue(columns[i])) {
                    out << escapeCell(record.getValue(columns[i]));
                }
            }
            out << "\n";
            rows++;
        }
    }

    return rows;
}

size_t ResultExporter::writeFile(const std::string& filename,
                                 const SimulationResults& results) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file: " + filename);
    }

    size_t rows = write(file, results);
    if (!file) {
        throw std::runtime_error("Failed writing file: " + filename);
    }
    return rows;
}

std::string ResultExporter::escapeCell(const std::string& value) {
    if (value.find_first_of(",\"\n\r") == std::string::npos) {
        return value;
    }

    std::string quoted = "\"";
    for (char c : value) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    quoted += "\"";
    return quoted;
}

} // namespace JOSHC
