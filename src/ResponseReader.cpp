#include "ResponseReader.hpp"
#include "Exceptions.hpp"
#include "WireProtocol.hpp"
#include <iostream>

namespace JOSHC {

ResponseReader::ResponseReader(ReplicateObserver& observer, const ReaderConfig& config)
    : observer_(observer),
      config_(config),
      completed_replicates_(0),
      skipped_lines_(0) {}

// =============================================================================
// Stream Ingestion
// =============================================================================

void ResponseReader::processResponse(const std::string& text) {
    buffer_ += text;
    dispatchPending();
}

void ResponseReader::flush() {
    dispatchPending();

    if (buffer_.empty()) return;

    std::string line;
    line.swap(buffer_);
    processLine(line);
}

void ResponseReader::dispatchPending() {
    size_t start = 0;
    size_t end;

    // Consumed lines are erased in one go, also when a line throws, so the
    // buffer always starts at the first line not yet dispatched.
    try {
        while ((end = buffer_.find('\n', start)) != std::string::npos) {
            std::string line = buffer_.substr(start, end - start);
            start = end + 1;
            processLine(line);
        }
    } catch (...) {
        buffer_.erase(0, start);
        throw;
    }

    buffer_.erase(0, start);
}

void ResponseReader::processLine(const std::string& line) {
    try {
        ParsedResponse response = WireResponseParser::parseEngineResponse(line);

        switch (response.type) {
            case ResponseType::IGNORED:
                break;
            case ResponseType::DATUM:
                handleDatum(response);
                break;
            case ResponseType::END:
                handleEnd(response);
                break;
            case ResponseType::PROGRESS:
                handleProgress(response);
                break;
            case ResponseType::ENGINE_ERROR:
                throw EngineError("Server error: " + response.error_message);
        }
    } catch (const FormatError& e) {
        if (config_.error_policy != ErrorPolicy::SKIP) throw;
        skipped_lines_++;
        std::cerr << "Warning: Skipping malformed engine response line: " << e.what() << std::endl;
    } catch (const ProtocolViolation& e) {
        if (config_.error_policy != ErrorPolicy::SKIP) throw;
        skipped_lines_++;
        std::cerr << "Warning: Skipping engine response line: " << e.what() << std::endl;
    }
}

void ResponseReader::handleDatum(const ParsedResponse& response) {
    if (isFinalized(response.replicate)) {
        throw ProtocolViolation("Data received for completed replicate " +
                                std::to_string(response.replicate), response.replicate);
    }

    // First datum for a replicate opens its builder
    SimulationResultBuilder& builder = replicate_reducer_[response.replicate];
    builder.add(OutputDatum(response.datum.name, response.datum.target));
}

void ResponseReader::handleEnd(const ParsedResponse& response) {
    ReplicateId replicate = response.replicate;

    if (isFinalized(replicate)) {
        throw ProtocolViolation("Replicate " + std::to_string(replicate) +
                                " was already completed", replicate);
    }

    auto it = replicate_reducer_.find(replicate);
    if (it == replicate_reducer_.end()) {
        throw ProtocolViolation("End received for unknown replicate " +
                                std::to_string(replicate), replicate);
    }

    complete_replicates_.push_back(it->second.build());
    replicate_reducer_.erase(it);
    finalized_.insert(replicate);
    completed_replicates_++;

    if (config_.verbose) {
        std::cout << "Replicate " << replicate << " complete ("
                  << completed_replicates_ << " done, "
                  << complete_replicates_.back().size() << " records)" << std::endl;
    }

    observer_.onReplicateComplete(completed_replicates_);
}

void ResponseReader::handleProgress(const ParsedResponse& response) {
    observer_.onProgress(response.step_count - config_.start_step);
}

// =============================================================================
// Inspection
// =============================================================================

std::vector<ReplicateId> ResponseReader::getOpenReplicates() const {
    std::vector<ReplicateId> open;
    for (const auto& pair : replicate_reducer_) {
        open.push_back(pair.first);
    }
    return open;
}

bool ResponseReader::isFinalized(ReplicateId replicate) const {
    return finalized_.find(replicate) != finalized_.end();
}

} // namespace JOSHC
