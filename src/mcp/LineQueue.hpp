#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>
#include <string>

namespace mcprt {

/**
 * @brief Thread-safe hand-off of raw lines from the reader thread
 *
 * Single producer (reader thread), single consumer (dispatch thread).
 * Closing wakes the consumer; lines pushed before close() are still
 * delivered.
 */
class LineQueue {
public:
    /**
     * @brief Enqueue a line
     * @return false if the queue was already closed
     */
    bool push(std::string line);

    /**
     * @brief Pop with timeout
     * @return Line if one became available, std::nullopt on timeout or when closed and drained
     */
    std::optional<std::string> pop_for(std::chrono::milliseconds timeout);

    /// Wakes blocked consumers and rejects further pushes
    void close();

    /// True once closed and every queued line has been popped
    bool finished() const;

    size_t size() const;

private:
    std::queue<std::string> lines_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool closed_ = false;
};

} // namespace mcprt
