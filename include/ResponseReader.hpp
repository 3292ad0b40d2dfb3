#ifndef RESPONSE_READER_HPP
#define RESPONSE_READER_HPP

/**
 * @file ResponseReader.hpp
 * @brief Incremental reconstruction of replicate results from an engine stream
 *
 * The engine streams lines for several replicates interleaved in any order.
 * Network reads cut that stream at arbitrary byte positions, so the reader
 * keeps the unterminated tail between calls and only acts on a line once
 * its newline has arrived.
 *
 * Usage:
 * @code
 * class Printer : public ReplicateObserver {
 *     void onReplicateComplete(int completed) override {
 *         std::cout << completed << " replicates done\n";
 *     }
 * };
 *
 * Printer printer;
 * ResponseReader reader(printer);
 * while (socket.read(chunk)) {
 *     reader.processResponse(chunk);
 * }
 * reader.flush();
 * const SimulationResults& results = reader.getCompleteReplicates();
 * @endcode
 *
 * Not thread safe. Callers that receive chunks on several threads must
 * serialize calls before handing them to one reader.
 */

#include "JOSHC.hpp"
#include "OutputDatum.hpp"
#include <functional>
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace JOSHC {

struct ParsedResponse;

/**
 * @brief Receives synchronous notifications from a ResponseReader
 *
 * Callbacks must not call back into the reader's processResponse or flush.
 * Reading getCompleteReplicates() from inside a callback is fine.
 */
class ReplicateObserver {
public:
    virtual ~ReplicateObserver() = default;

    /**
     * @brief A replicate finished
     * @param completed Running count of completed replicates, starting at 1
     */
    virtual void onReplicateComplete(int completed) = 0;

    /**
     * @brief The engine reported progress
     * @param step Step count relative to the reader's start step
     */
    virtual void onProgress(long step) { (void)step; }
};

/**
 * @brief Observer that forwards to std::function callbacks
 */
class CallbackObserver : public ReplicateObserver {
public:
    using ReplicateCallback = std::function<void(int)>;
    using ProgressCallback = std::function<void(long)>;

    explicit CallbackObserver(ReplicateCallback on_replicate,
                              ProgressCallback on_progress = nullptr)
        : on_replicate_(std::move(on_replicate)), on_progress_(std::move(on_progress)) {}

    void onReplicateComplete(int completed) override {
        if (on_replicate_) on_replicate_(completed);
    }

    void onProgress(long step) override {
        if (on_progress_) on_progress_(step);
    }

private:
    ReplicateCallback on_replicate_;
    ProgressCallback on_progress_;
};

class ResponseReader {
public:
    /**
     * @brief Create a reader for one engine run
     * @param observer Notified on every replicate completion; must outlive the reader
     * @param config Error policy, start step for progress and verbosity
     */
    explicit ResponseReader(ReplicateObserver& observer,
                            const ReaderConfig& config = ReaderConfig());

    ResponseReader(const ResponseReader&) = delete;
    ResponseReader& operator=(const ResponseReader&) = delete;

    // =========================================================================
    // Stream Ingestion
    // =========================================================================

    /**
     * @brief Consume the next fragment of the engine response
     *
     * Appends text to the carry-over buffer and dispatches every line whose
     * terminator is now present, in order. Zero-length text is allowed and
     * resumes any lines left over from an aborted call.
     *
     * With ErrorPolicy::ABORT a bad line throws FormatError or
     * ProtocolViolation. Lines before it have been applied, the bad line is
     * consumed and everything after it stays buffered for the next call.
     * An "[error]" line always throws EngineError under the same rules.
     */
    void processResponse(const std::string& text);

    /**
     * @brief Treat the unterminated tail as a final line (end of stream)
     */
    void flush();

    // =========================================================================
    // Inspection
    // =========================================================================

    /**
     * @brief Text received but not yet dispatched
     */
    const std::string& getBuffer() const { return buffer_; }

    /**
     * @brief Results of every completed replicate, in completion order
     */
    const SimulationResults& getCompleteReplicates() const { return complete_replicates_; }

    int getCompletedCount() const { return completed_replicates_; }

    /**
     * @brief Replicates that have data but no end marker yet
     */
    std::vector<ReplicateId> getOpenReplicates() const;

    bool isFinalized(ReplicateId replicate) const;

    /**
     * @brief Lines dropped under ErrorPolicy::SKIP
     */
    int getSkippedLines() const { return skipped_lines_; }

    const ReaderConfig& getConfig() const { return config_; }

private:
    ReplicateObserver& observer_;
    ReaderConfig config_;

    std::string buffer_;
    std::map<ReplicateId, SimulationResultBuilder> replicate_reducer_;
    std::set<ReplicateId> finalized_;
    SimulationResults complete_replicates_;
    int completed_replicates_;
    int skipped_lines_;

    void dispatchPending();
    void processLine(const std::string& line);
    void handleDatum(const ParsedResponse& response);
    void handleEnd(const ParsedResponse& response);
    void handleProgress(const ParsedResponse& response);
};

} // namespace JOSHC

#endif // RESPONSE_READER_HPP
