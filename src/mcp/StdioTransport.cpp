#include "StdioTransport.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace mcprt {

StdioTransport::StdioTransport(std::istream& in, std::ostream& out)
    : in_(in), out_(out) {
    // std::cin is tied to std::cout by default; a read on the reader thread
    // would then flush the output stream behind the dispatch thread's back.
    in_.tie(nullptr);
    spdlog::debug("StdioTransport initialized");
}

std::optional<std::string> StdioTransport::read_line() {
    std::string line;

    if (!std::getline(in_, line)) {
        if (in_.eof()) {
            spdlog::debug("Reached end of input stream");
        } else {
            spdlog::error("Error reading from input stream");
        }
        return std::nullopt;
    }

    spdlog::debug("Read line: {}", line);
    return line;
}

void StdioTransport::write_line(const std::string& line) {
    out_ << line << '\n';
    out_.flush();
    if (!out_) {
        throw std::runtime_error("Failed to write to output stream");
    }
    spdlog::debug("Wrote message: {}", line);
}

bool StdioTransport::is_open() const {
    return in_.good() && out_.good();
}

} // namespace mcprt
