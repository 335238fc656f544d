#include "MockTransport.hpp"
#include <stdexcept>

namespace mcprt {

std::optional<std::string> MockTransport::read_line() {
    std::unique_lock<std::mutex> lock(mutex_);
    input_cv_.wait(lock, [this] { return !requests_.empty() || !open_; });

    if (requests_.empty()) {
        return std::nullopt;  // EOF
    }

    std::string line = std::move(requests_.front());
    requests_.pop_front();
    drained_cv_.notify_all();
    return line;
}

void MockTransport::write_line(const std::string& line) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fail_writes_) {
        throw std::runtime_error("Broken pipe");
    }
    responses_.push_back(line);
    written_.push_back(line);
    output_cv_.notify_all();
}

bool MockTransport::is_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return open_;
}

void MockTransport::push_request(const json& request) {
    push_line(request.dump());
}

void MockTransport::push_line(const std::string& line) {
    std::lock_guard<std::mutex> lock(mutex_);
    requests_.push_back(line);
    input_cv_.notify_all();
}

json MockTransport::pop_response() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (responses_.empty()) {
        return json();
    }

    json response = json::parse(responses_.front());
    responses_.pop_front();
    return response;
}

bool MockTransport::has_responses() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !responses_.empty();
}

std::vector<std::string> MockTransport::written_lines() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return written_;
}

bool MockTransport::wait_for_responses(size_t count, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return output_cv_.wait_for(lock, timeout, [this, count] { return written_.size() >= count; });
}

bool MockTransport::wait_for_input_drained(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return drained_cv_.wait_for(lock, timeout, [this] { return requests_.empty(); });
}

void MockTransport::fail_writes() {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_writes_ = true;
}

void MockTransport::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    open_ = false;
    input_cv_.notify_all();
}

} // namespace mcprt
