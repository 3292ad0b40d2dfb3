#ifndef RESULT_EXPORTER_HPP
#define RESULT_EXPORTER_HPP

/**
 * @file ResultExporter.hpp
 * @brief CSV export of completed replicate results
 *
 * One row per record. The first column is the replicate's position in the
 * results (completion order), followed by the sorted union of attribute
 * names over every exported record.
 */

#include "JOSHC.hpp"
#include "OutputDatum.hpp"
#include <ostream>
#include <string>
#include <vector>

namespace JOSHC {

class ResultExporter {
public:
    explicit ResultExporter(ExportSeries series = ExportSeries::ALL, bool final_only = false);

    /**
     * @brief Records of one replicate selected by series and step filter
     *
     * With final_only, only records whose "step" equals the replicate's
     * last step are kept. A replicate without any step keeps all records.
     */
    std::vector<OutputDatum> selectRecords(const SimulationResult& result) const;

    /**
     * @brief Header columns, "replicate" first
     */
    std::vector<std::string> getColumns(const SimulationResults& results) const;

    /**
     * @brief Write header and rows
     * @return Number of rows written, header excluded
     */
    size_t write(std::ostream& out, const SimulationResults& results) const;

    /**
     * @throws std::runtime_error if the file cannot be opened
     */
    size_t writeFile(const std::string& filename, const SimulationResults& results) const;

    /**
     * @brief Quote a cell if it holds a comma, quote or line break
     */
    static std::string escapeCell(const std::string& value);

    ExportSeries getSeries() const { return series_; }
    bool isFinalOnly() const { return final_only_; }

private:
    ExportSeries series_;
    bool final_only_;
};

} // namespace JOSHC

#endif // RESULT_EXPORTER_HPP
