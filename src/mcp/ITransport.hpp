#pragma once

#include <optional>
#include <string>

namespace mcprt {

/**
 * @brief Abstract interface for line-framed MCP transports
 *
 * One line carries one JSON-RPC message. read_line() runs on the reader
 * thread while write_line() runs on the dispatch thread, so
 * implementations must keep the two directions independent.
 */
class ITransport {
public:
    virtual ~ITransport() = default;

    /**
     * @brief Read the next line, without its terminating newline
     * @return Line, or std::nullopt once the stream is closed or unreadable
     */
    virtual std::optional<std::string> read_line() = 0;

    /**
     * @brief Write one line followed by a newline and flush it
     * @throws std::runtime_error if the peer can no longer be written to
     */
    virtual void write_line(const std::string& line) = 0;

    /**
     * @brief Check if transport is still open
     * @return true if transport can read/write, false otherwise
     */
    virtual bool is_open() const = 0;
};

} // namespace mcprt
