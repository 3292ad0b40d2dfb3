#ifndef WIRE_PROTOCOL_HPP
#define WIRE_PROTOCOL_HPP

/**
 * @file WireProtocol.hpp
 * @brief Line format streamed back by a Josh engine
 *
 * Each line of an engine response is one of:
 * - "[end N]"        replicate N has completed
 * - "[progress N]"   the engine reached absolute timestep N
 * - "[error] text"   the engine failed with the given message
 * - "[N]"            empty datum for replicate N (ignored)
 * - "[N] payload"    datum for replicate N, payload in named map format
 *
 * Named map format: "target:key1=value1\tkey2=value2..."
 */

#include "JOSHC.hpp"
#include <string>
#include <map>

namespace JOSHC {

/**
 * @brief Target name plus attribute map, the payload of a datum line
 */
struct NamedMap {
    std::string name;
    std::map<std::string, std::string> target;

    NamedMap() = default;
    NamedMap(const std::string& n, const std::map<std::string, std::string>& t)
        : name(n), target(t) {}
};

/**
 * @brief Conversion between NamedMap and its single-line wire form
 */
class WireConverter {
public:
    /**
     * @brief Encode as "name:key=value\t..."
     *
     * Tabs and newlines inside values are replaced with four spaces so an
     * encoded record never spans lines.
     *
     * @throws FormatError if the name is empty or holds ':', a tab or a
     *         newline, or a key is empty or holds '=', a tab or a newline
     */
    static std::string serializeToString(const NamedMap& named_map);

    /**
     * @brief Decode "name:key=value\t..."
     * @throws FormatError if the name is missing or a pair has no key
     */
    static NamedMap deserializeFromString(const std::string& wire_format);
};

enum class ResponseType {
    IGNORED,    ///< Blank line or empty datum
    DATUM,      ///< Data point for a replicate
    PROGRESS,   ///< Current absolute step
    END,        ///< Replicate completed
    ENGINE_ERROR    ///< Engine reported a failure
};

/**
 * @brief One classified response line
 */
struct ParsedResponse {
    ResponseType type = ResponseType::IGNORED;
    ReplicateId replicate = -1;     ///< DATUM and END only
    NamedMap datum;                 ///< DATUM only
    long step_count = 0;            ///< PROGRESS only
    std::string error_message;      ///< ENGINE_ERROR only
};

class WireResponseParser {
public:
    /**
     * @brief Classify a single line (without its terminator)
     *
     * Surrounding whitespace, including a trailing carriage return, is
     * ignored. Blank lines and empty "[N]" data come back as IGNORED.
     *
     * @throws FormatError if the line matches none of the known forms or the
     *         datum payload is malformed
     */
    static ParsedResponse parseEngineResponse(const std::string& line);

    /**
     * @brief Build the "[N] payload" line for a record
     */
    static std::string formatDatum(ReplicateId replicate, const NamedMap& datum);

    static std::string formatEnd(ReplicateId replicate);

    static std::string formatProgress(long step);
};

} // namespace JOSHC

#endif // WIRE_PROTOCOL_HPP
