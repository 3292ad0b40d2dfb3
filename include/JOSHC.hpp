#ifndef JOSHC_HPP
#define JOSHC_HPP

#include <string>
#include <vector>

#define JOSHC_VERSION_MAJOR 1
#define JOSHC_VERSION_MINOR 0
#define JOSHC_VERSION_PATCH 0
#define JOSHC_VERSION_STRING "1.0.0"

namespace JOSHC {

// Forward declarations
class ResponseReader;
class ReplicateObserver;
class OutputDatum;
class SimulationResult;
class SimulationResultBuilder;
class SimulationMetadata;
class ConfigReader;
class UnitSystem;
class GridProjector;
class ResultExporter;

/**
 * @brief Replicate identifier as labelled by the engine ("[3] ...")
 */
using ReplicateId = int;

/**
 * @brief Results of every completed replicate, in completion order
 */
using SimulationResults = std::vector<SimulationResult>;

/**
 * @brief What the reader does when a single line cannot be used
 */
enum class ErrorPolicy {
    ABORT,      ///< Propagate the exception to the caller of processResponse
    SKIP        ///< Log a warning, count the line and keep going
};

/**
 * @brief Which target series of a result to export
 */
enum class ExportSeries {
    SIMULATION,
    PATCHES,
    ENTITIES,
    ALL
};

// Configuration structures
struct ReaderConfig {
    ErrorPolicy error_policy = ErrorPolicy::ABORT;
    long start_step = 0;
    bool verbose = false;
    int chunk_size = 4096;
};

struct OutputConfig {
    bool geocode = false;
    ExportSeries series = ExportSeries::ALL;
    bool final_only = false;
    std::string output_file;
};

struct ClientConfig {
    std::string input_file;
    ReaderConfig reader;
    OutputConfig output;
};

/**
 * @brief Parse "ABORT" / "SKIP" (case-insensitive), falling back to default_val
 */
ErrorPolicy parseErrorPolicy(const std::string& text, ErrorPolicy default_val);

/**
 * @brief Parse "simulation", "patches", "entities" or "all" (case-insensitive)
 */
ExportSeries parseExportSeries(const std::string& text, ExportSeries default_val);

std::string toString(ErrorPolicy policy);
std::string toString(ExportSeries series);

} // namespace JOSHC

#endif // JOSHC_HPP
