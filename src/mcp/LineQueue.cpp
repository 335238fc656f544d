#include "LineQueue.hpp"

namespace mcprt {

bool LineQueue::push(std::string line) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        return false;
    }
    lines_.push(std::move(line));
    cv_.notify_one();
    return true;
}

std::optional<std::string> LineQueue::pop_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);

    bool ready = cv_.wait_for(lock, timeout, [this] {
        return !lines_.empty() || closed_;
    });

    if (!ready || lines_.empty()) {
        return std::nullopt;
    }

    std::string line = std::move(lines_.front());
    lines_.pop();
    return line;
}

void LineQueue::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    cv_.notify_all();
}

bool LineQueue::finished() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_ && lines_.empty();
}

size_t LineQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_.size();
}

} // namespace mcprt
