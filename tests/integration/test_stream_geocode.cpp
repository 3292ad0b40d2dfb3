/**
 * @file test_stream_geocode.cpp
 * @brief End-to-end: config file, chunked stream replay, geocoding and CSV export
 */

#include <gtest/gtest.h>
#include "ConfigReader.hpp"
#include "CoordinateSystem.hpp"
#include "ResponseReader.hpp"
#include "ResultExporter.hpp"
#include "SimulationMetadata.hpp"
#include "WireProtocol.hpp"
#include <petsc.h>
#include <cstdio>
#include <fstream>
#include <sstream>

using namespace JOSHC;

class StreamGeocodeTest : public ::testing::Test {
protected:
    void SetUp() override {
        MPI_Comm_rank(PETSC_COMM_WORLD, &rank);
        config_file = "test_stream_geocode.ini";

        if (rank == 0) {
            std::ofstream config(config_file);
            config << "[reader]\n";
            config << "error_policy = SKIP\n";
            config << "chunk_size = 13\n";
            config << "[grid]\n";
            config << "start = 36.52 degrees latitude, -118.68 degrees longitude\n";
            config << "end = 36.42 degrees latitude, -118.57 degrees longitude\n";
            config << "patch_size = 30 m\n";
            config << "steps_low = 5\n";
            config << "steps_high = 6\n";
            config << "[output]\n";
            config << "geocode = true\n";
            config << "series = patches\n";
            config << "final_only = true\n";
            config.close();
        }
        MPI_Barrier(PETSC_COMM_WORLD);
    }

    void TearDown() override {
        MPI_Barrier(PETSC_COMM_WORLD);
        if (rank == 0) {
            std::remove(config_file.c_str());
        }
    }

    static std::string buildStream() {
        std::string stream;
        for (long step = 5; step <= 6; ++step) {
            stream += WireResponseParser::formatProgress(step) + "\n";
            for (int replicate = 0; replicate < 3; ++replicate) {
                NamedMap datum;
                datum.name = "patches";
                datum.target["step"] = std::to_string(step);
                datum.target["position.x"] = std::to_string(replicate);
                datum.target["position.y"] = std::to_string(step - 5);
                datum.target["label"] = "cell\twith tab";
                stream += WireResponseParser::formatDatum(replicate, datum) + "\n";
            }
            stream += "garbage line\n";
        }
        for (int replicate = 2; replicate >= 0; --replicate) {
            stream += WireResponseParser::formatEnd(replicate) + "\n";
        }
        return stream;
    }

    std::string config_file;
    int rank;
};

TEST_F(StreamGeocodeTest, ReplayGeocodeExport) {
    ConfigReader reader_config;
    ASSERT_TRUE(reader_config.loadFile(config_file));
    ASSERT_TRUE(reader_config.validate().valid);

    ClientConfig config;
    ASSERT_TRUE(reader_config.parseClientConfig(config));
    SimulationMetadata metadata;
    ASSERT_TRUE(reader_config.parseSimulationMetadata(metadata));
    config.reader.start_step = metadata.getStepsLow();

    std::vector<long> progress;
    CallbackObserver observer([](int) {}, [&progress](long step) { progress.push_back(step); });
    ResponseReader reader(observer, config.reader);

    std::string stream = buildStream();
    size_t chunk = static_cast<size_t>(config.reader.chunk_size);
    for (size_t pos = 0; pos < stream.size(); pos += chunk) {
        reader.processResponse(stream.substr(pos, chunk));
    }
    reader.flush();

    EXPECT_EQ(reader.getCompletedCount(), 3);
    EXPECT_EQ(reader.getSkippedLines(), 2);
    EXPECT_TRUE(reader.getOpenReplicates().empty());
    EXPECT_EQ(progress, (std::vector<long>{0, 1}));

    SimulationResults results = reader.getCompleteReplicates();
    addPositions(results, metadata);

    // Replicates finished in reverse order; the first result is replicate 2
    const OutputDatum& last = results[0].getRecords().back();
    EXPECT_EQ(last.getValue("label"), "cell    with tab");
    EarthPoint expected = GridProjector(metadata.getTopLeft(), metadata.getPatchSize()).toEarth(2, 1);
    EXPECT_DOUBLE_EQ(last.getNumericValue("position.longitude"), expected.longitude);
    EXPECT_DOUBLE_EQ(last.getNumericValue("position.latitude"), expected.latitude);

    // Reader keeps its own results untouched
    EXPECT_FALSE(reader.getCompleteReplicates()[0].getRecords().back().hasValue("position.longitude"));

    ResultExporter exporter(config.output.series, config.output.final_only);
    std::ostringstream out;
    EXPECT_EQ(exporter.write(out, results), 3u);

    std::istringstream lines(out.str());
    std::string header;
    std::getline(lines, header);
    EXPECT_EQ(header, "replicate,label,position.latitude,position.longitude,position.x,position.y,step");
}
