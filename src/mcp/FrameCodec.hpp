#pragma once

#include "protocol/Message.hpp"
#include <optional>
#include <string>
#include <variant>

namespace mcprt {

/**
 * @brief A line that could not be turned into a message
 *
 * salvaged_id is set only when a legal id could be recovered, in which
 * case the failure is answered with an error response; otherwise the line
 * is dropped.
 */
struct DecodeFailure {
    int code;
    std::string reason;
    std::optional<RequestId> salvaged_id;
};

/// Blank line, nothing to do
struct SkipLine {};

using DecodeResult = std::variant<Message, DecodeFailure, SkipLine>;

/**
 * @brief Converts single protocol lines to messages and back
 *
 * One newline-terminated UTF-8 line carries exactly one JSON-RPC message.
 * Batches (JSON arrays) are not part of this protocol and are rejected.
 */
class FrameCodec {
public:
    /**
     * @brief Decode one line (without its terminating newline)
     * @param line Raw line as read from the transport
     * @return Message, DecodeFailure, or SkipLine for blank input
     */
    static DecodeResult decode(const std::string& line);

    /**
     * @brief Serialize a response as a single line, without the newline
     *
     * Field order is fixed: jsonrpc, id, then result or error.
     */
    static std::string encode(const Response& response);

    /**
     * @brief Try to recover a request id from text that is not valid JSON
     * @return Legal id of the outermost object, or std::nullopt
     */
    static std::optional<RequestId> salvage_id(const std::string& line);

private:
    static DecodeResult decode_object(const json& j);
};

} // namespace mcprt
