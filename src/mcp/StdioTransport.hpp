#pragma once

#include "ITransport.hpp"
#include <iostream>

namespace mcprt {

/**
 * @brief Transport using standard input/output streams
 *
 * Reads messages line-by-line from stdin and writes them line-by-line to
 * stdout, flushing after every line.
 */
class StdioTransport : public ITransport {
public:
    /**
     * @brief Construct stdio transport
     * @param in Input stream (default: std::cin)
     * @param out Output stream (default: std::cout)
     */
    explicit StdioTransport(std::istream& in = std::cin, std::ostream& out = std::cout);

    std::optional<std::string> read_line() override;
    void write_line(const std::string& line) override;
    bool is_open() const override;

private:
    std::istream& in_;
    std::ostream& out_;
};

} // namespace mcprt
