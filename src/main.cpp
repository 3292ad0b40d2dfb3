#include "JOSHC.hpp"
#include "ConfigReader.hpp"
#include "CoordinateSystem.hpp"
#include "ResponseReader.hpp"
#include "ResultExporter.hpp"
#include "SimulationMetadata.hpp"
#include <petsc.h>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

static char help[] = "joshc - Replay, geocode and export Josh engine response streams\n"
                    "Usage: joshc [options]\n\n"
                    "Options:\n"
                    "  -i <file>             Captured engine response stream\n"
                    "  -c <file>             Configuration file (.ini)\n"
                    "  -o <file>             CSV output file\n"
                    "  -chunk_size <n>       Bytes per fragment fed to the reader\n"
                    "  -series <name>        simulation, patches, entities or all\n"
                    "  -final_only           Export only the last step of each replicate\n"
                    "  -geocode              Add longitude/latitude using the [grid] section\n"
                    "  -skip_errors          Skip malformed lines instead of aborting\n"
                    "  -verbose              Log each replicate completion\n\n"
                    "Examples:\n"
                    "  joshc -i run.jshd -o results.csv\n"
                    "  joshc -c client.ini -geocode -series patches\n"
                    "  joshc -generate_config client.ini\n\n";

namespace {

/**
 * @brief Logs replicate completions and progress through PETSc on rank 0
 */
class ProgressPrinter : public JOSHC::ReplicateObserver {
public:
    explicit ProgressPrinter(MPI_Comm comm) : comm_(comm) {}

    void onReplicateComplete(int completed) override {
        PetscPrintf(comm_, "  Replicates complete: %d\n", completed);
    }

    void onProgress(long step) override {
        PetscPrintf(comm_, "  Step %ld\n", step);
    }

private:
    MPI_Comm comm_;
};

size_t replayStream(const std::string& filename, JOSHC::ResponseReader& reader, int chunk_size) {
    std::ifstream file(filename, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open stream file: " + filename);
    }

    std::vector<char> chunk(static_cast<size_t>(chunk_size));
    size_t total = 0;
    while (file) {
        file.read(chunk.data(), chunk_size);
        std::streamsize count = file.gcount();
        if (count <= 0) break;
        reader.processResponse(std::string(chunk.data(), static_cast<size_t>(count)));
        total += static_cast<size_t>(count);
    }
    reader.flush();

    return total;
}

} // namespace

int main(int argc, char** argv) {
    PetscErrorCode ierr;

    ierr = PetscInitialize(&argc, &argv, nullptr, help); CHKERRQ(ierr);

    int exit_code = 0;
    {
        MPI_Comm comm = PETSC_COMM_WORLD;
        int rank;
        MPI_Comm_rank(comm, &rank);

        char generate_config[PETSC_MAX_PATH_LEN] = "";
        PetscBool gen_config;
        ierr = PetscOptionsGetString(nullptr, nullptr, "-generate_config", generate_config,
                                     sizeof(generate_config), &gen_config); CHKERRQ(ierr);

        if (gen_config) {
            if (rank == 0) {
                if (JOSHC::ConfigReader::generateTemplate(generate_config)) {
                    PetscPrintf(comm, "Configuration template written to: %s\n", generate_config);
                } else {
                    exit_code = 1;
                }
            }
            ierr = PetscFinalize();
            return exit_code;
        }

        char config_file[PETSC_MAX_PATH_LEN] = "";
        char input_file[PETSC_MAX_PATH_LEN] = "";
        char output_file[PETSC_MAX_PATH_LEN] = "";
        char series[64] = "";
        PetscBool config_provided = PETSC_FALSE;
        PetscBool input_provided = PETSC_FALSE;
        PetscBool output_provided = PETSC_FALSE;
        PetscBool series_provided = PETSC_FALSE;
        PetscInt chunk_size = 0;
        PetscBool chunk_provided = PETSC_FALSE;
        PetscBool geocode = PETSC_FALSE;
        PetscBool skip_errors = PETSC_FALSE;
        PetscBool final_only = PETSC_FALSE;
        PetscBool verbose = PETSC_FALSE;

        ierr = PetscOptionsGetString(nullptr, nullptr, "-c", config_file,
                                     sizeof(config_file), &config_provided); CHKERRQ(ierr);
        ierr = PetscOptionsGetString(nullptr, nullptr, "-i", input_file,
                                     sizeof(input_file), &input_provided); CHKERRQ(ierr);
        ierr = PetscOptionsGetString(nullptr, nullptr, "-o", output_file,
                                     sizeof(output_file), &output_provided); CHKERRQ(ierr);
        ierr = PetscOptionsGetString(nullptr, nullptr, "-series", series,
                                     sizeof(series), &series_provided); CHKERRQ(ierr);
        ierr = PetscOptionsGetInt(nullptr, nullptr, "-chunk_size", &chunk_size,
                                  &chunk_provided); CHKERRQ(ierr);
        ierr = PetscOptionsHasName(nullptr, nullptr, "-geocode", &geocode); CHKERRQ(ierr);
        ierr = PetscOptionsHasName(nullptr, nullptr, "-skip_errors", &skip_errors); CHKERRQ(ierr);
        ierr = PetscOptionsHasName(nullptr, nullptr, "-final_only", &final_only); CHKERRQ(ierr);
        ierr = PetscOptionsHasName(nullptr, nullptr, "-verbose", &verbose); CHKERRQ(ierr);

        if (!config_provided && !input_provided) {
            if (rank == 0) {
                PetscPrintf(comm, "Error: Configuration file (-c) or stream file (-i) required\n");
                PetscPrintf(comm, "Run with -help for usage information\n");
                PetscPrintf(comm, "Generate template: joshc -generate_config client.ini\n");
            }
            ierr = PetscFinalize();
            return 1;
        }

        // The stream is replayed by a single process
        if (rank == 0) {
            try {
                JOSHC::ClientConfig config;
                JOSHC::ConfigReader reader_config;
                bool have_config = false;

                if (config_provided) {
                    if (!reader_config.loadFile(config_file)) {
                        throw std::runtime_error(std::string("Cannot load configuration: ") + config_file);
                    }
                    have_config = true;
                    reader_config.parseClientConfig(config);

                    JOSHC::ConfigReader::ValidationResult validation = reader_config.validate();
                    for (const auto& warning : validation.warnings) {
                        PetscPrintf(comm, "Warning: %s\n", warning.c_str());
                    }
                    for (const auto& error : validation.errors) {
                        PetscPrintf(comm, "Error: %s\n", error.c_str());
                    }
                    if (!validation.valid) {
                        throw std::runtime_error("Invalid configuration");
                    }
                }

                // Command line overrides configuration
                if (input_provided) config.input_file = input_file;
                if (output_provided) config.output.output_file = output_file;
                if (series_provided) {
                    config.output.series = JOSHC::parseExportSeries(series, config.output.series);
                }
                if (chunk_provided) config.reader.chunk_size = static_cast<int>(chunk_size);
                if (geocode) config.output.geocode = true;
                if (skip_errors) config.reader.error_policy = JOSHC::ErrorPolicy::SKIP;
                if (final_only) config.output.final_only = true;
                if (verbose) config.reader.verbose = true;

                if (config.input_file.empty()) {
                    throw std::runtime_error("No stream file given (-i or [reader] input)");
                }
                if (config.reader.chunk_size <= 0) {
                    throw std::runtime_error("chunk_size must be positive");
                }

                JOSHC::SimulationMetadata metadata;
                bool have_metadata = have_config && reader_config.parseSimulationMetadata(metadata);
                if (have_metadata && !reader_config.hasKey("reader", "start_step")) {
                    config.reader.start_step = metadata.getStepsLow();
                }

                PetscPrintf(comm, "\n");
                PetscPrintf(comm, "============================================================\n");
                PetscPrintf(comm, "  JoshClient - Engine Response Reader\n");
                PetscPrintf(comm, "  Version %s\n", JOSHC_VERSION_STRING);
                PetscPrintf(comm, "============================================================\n");
                PetscPrintf(comm, "\n");
                PetscPrintf(comm, "Stream file:   %s\n", config.input_file.c_str());
                PetscPrintf(comm, "Chunk size:    %d bytes\n", config.reader.chunk_size);
                PetscPrintf(comm, "Error policy:  %s\n", JOSHC::toString(config.reader.error_policy).c_str());
                PetscPrintf(comm, "Series:        %s\n", JOSHC::toString(config.output.series).c_str());
                PetscPrintf(comm, "\n");

                ProgressPrinter printer(comm);
                JOSHC::ResponseReader reader(printer, config.reader);

                double start_time = MPI_Wtime();
                size_t bytes = replayStream(config.input_file, reader, config.reader.chunk_size);
                double end_time = MPI_Wtime();

                PetscPrintf(comm, "------------------------------------------------------------\n");
                PetscPrintf(comm, "Read %zu bytes in %.3f seconds\n", bytes, end_time - start_time);
                PetscPrintf(comm, "Completed replicates: %d\n", reader.getCompletedCount());
                if (reader.getSkippedLines() > 0) {
                    PetscPrintf(comm, "Skipped lines:        %d\n", reader.getSkippedLines());
                }
                for (JOSHC::ReplicateId open : reader.getOpenReplicates()) {
                    PetscPrintf(comm, "Warning: Replicate %d never completed\n", open);
                }

                JOSHC::SimulationResults results = reader.getCompleteReplicates();

                if (config.output.geocode) {
                    if (!have_metadata) {
                        throw std::runtime_error("Geocoding requires a [grid] section in the configuration");
                    }
                    JOSHC::addPositions(results, metadata);
                    PetscPrintf(comm, "Geocoded positions from top left (%g, %g), patch %g m\n",
                                metadata.getTopLeft().longitude, metadata.getTopLeft().latitude,
                                metadata.getPatchSize());
                }

                if (!config.output.output_file.empty()) {
                    JOSHC::ResultExporter exporter(config.output.series, config.output.final_only);
                    size_t rows = exporter.writeFile(config.output.output_file, results);
                    PetscPrintf(comm, "Wrote %zu rows to: %s\n", rows, config.output.output_file.c_str());
                }

                PetscPrintf(comm, "\n");
                PetscPrintf(comm, "============================================================\n");

            } catch (const std::exception& e) {
                PetscPrintf(comm, "\nError: %s\n", e.what());
                exit_code = 1;
            }
        }

        MPI_Bcast(&exit_code, 1, MPI_INT, 0, comm);
    }

    ierr = PetscFinalize();
    return exit_code;
}
