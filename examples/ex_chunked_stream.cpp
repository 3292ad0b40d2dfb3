/**
 * @file ex_chunked_stream.cpp
 * @brief Feed an engine response to the reader in arbitrary fragments
 *
 * Builds a small two-replicate response with interleaved lines, cuts it
 * into fragments of the given size (as a socket would), reconstructs the
 * replicates and geocodes the patch records onto a grid in the Sierra
 * Nevada.
 *
 * Usage:
 *   ./ex_chunked_stream [fragment_size]
 */

#include "CoordinateSystem.hpp"
#include "EngineValue.hpp"
#include "OutputDatum.hpp"
#include "ResponseReader.hpp"
#include "SimulationMetadata.hpp"
#include "WireProtocol.hpp"
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <string>

using namespace JOSHC;

namespace {

std::string buildResponse() {
    std::string response;

    for (int step = 0; step < 3; ++step) {
        response += WireResponseParser::formatProgress(step) + "\n";
        for (int replicate = 0; replicate < 2; ++replicate) {
            for (int patch = 0; patch < 2; ++patch) {
                NamedMap datum;
                datum.name = "patches";
                datum.target["step"] = std::to_string(step);
                datum.target["position.x"] = std::to_string(patch) + ".5";
                datum.target["position.y"] = "0.5";
                datum.target["treeCount"] = std::to_string(10 * replicate + step + patch);
                response += WireResponseParser::formatDatum(replicate, datum) + "\n";
            }
        }
    }

    response += WireResponseParser::formatEnd(1) + "\n";
    response += WireResponseParser::formatEnd(0) + "\n";
    return response;
}

} // namespace

int main(int argc, char** argv) {
    size_t fragment_size = 7;
    if (argc > 1) {
        fragment_size = static_cast<size_t>(std::atoi(argv[1]));
        if (fragment_size == 0) {
            std::cerr << "Error: fragment size must be a positive integer" << std::endl;
            return 1;
        }
    }

    std::string response = buildResponse();

    CallbackObserver observer(
        [](int completed) {
            std::cout << "Replicate finished (" << completed << " so far)" << std::endl;
        },
        [](long step) {
            std::cout << "Engine at step " << step << std::endl;
        });
    ResponseReader reader(observer);

    try {
        for (size_t pos = 0; pos < response.size(); pos += fragment_size) {
            reader.processResponse(response.substr(pos, fragment_size));
        }
        reader.flush();

        SimulationMetadata metadata = SimulationMetadata::fromStartEnd(
            parseStartEndString("36.52 degrees latitude, -118.68 degrees longitude"),
            parseStartEndString("36.42 degrees latitude, -118.57 degrees longitude"),
            parseEngineValueString("1 km"));

        SimulationResults results = reader.getCompleteReplicates();
        addPositions(results, metadata);

        std::cout << std::fixed << std::setprecision(6);
        for (size_t i = 0; i < results.size(); ++i) {
            std::cout << "\nReplicate #" << i << ": " << results[i].size() << " records, "
                      << results[i].getSteps().size() << " steps" << std::endl;
            for (const auto& record : results[i].getRecordsForStep("2")) {
                std::cout << "  treeCount=" << record.getValue("treeCount")
                          << " at (" << record.getNumericValue("position.longitude")
                          << ", " << record.getNumericValue("position.latitude") << ")"
                          << std::endl;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
