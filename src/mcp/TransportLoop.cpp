#include "TransportLoop.hpp"
#include "FrameCodec.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace mcprt {

TransportLoop::TransportLoop(std::shared_ptr<ITransport> transport, Dispatcher& dispatcher, Session& session)
    : transport_(std::move(transport)),
      dispatcher_(dispatcher),
      session_(session),
      queue_(std::make_shared<LineQueue>()),
      reader_done_(std::make_shared<std::atomic<bool>>(false)) {
    if (!transport_) {
        throw std::invalid_argument("Transport cannot be null");
    }
}

TransportLoop::~TransportLoop() {
    queue_->close();
    release_reader();
}

void TransportLoop::start_reader() {
    // The thread owns copies of everything it touches, so it may outlive
    // this object when it is parked in a blocking read at shutdown.
    auto transport = transport_;
    auto queue = queue_;
    auto done = reader_done_;

    reader_ = std::thread([transport, queue, done]() {
        try {
            while (auto line = transport->read_line()) {
                if (!queue->push(std::move(*line))) {
                    break;
                }
            }
        } catch (const std::exception& e) {
            spdlog::error("Reader thread failed: {}", e.what());
        }
        spdlog::debug("Reader thread finished");
        *done = true;
        queue->close();
    });
}

void TransportLoop::release_reader() {
    if (!reader_.joinable()) {
        return;
    }
    if (*reader_done_) {
        reader_.join();
    } else {
        // Still blocked reading input nobody will send; it holds its own state
        spdlog::debug("Detaching reader thread blocked on input");
        reader_.detach();
    }
}

int TransportLoop::run() {
    if (started_) {
        throw std::logic_error("TransportLoop::run called twice");
    }
    started_ = true;
    running_ = true;
    spdlog::info("Transport loop starting");

    start_reader();

    while (!stop_requested_) {
        auto line = queue_->pop_for(kPollInterval);
        if (!line) {
            if (queue_->finished()) {
                spdlog::info("Input stream closed");
                break;
            }
            continue;
        }

        try {
            process_line(*line);
        } catch (const std::exception& e) {
            // write_line failed: the host is gone
            spdlog::error("Transport failure, shutting down: {}", e.what());
            break;
        }
    }

    if (stop_requested_) {
        spdlog::info("Transport loop stop requested");
    }

    queue_->close();
    session_.close();
    release_reader();

    running_ = false;
    spdlog::info("Transport loop stopped");
    return 0;
}

void TransportLoop::stop() {
    stop_requested_ = true;
}

void TransportLoop::process_line(const std::string& line) {
    std::optional<Response> response;
    try {
        DecodeResult decoded = FrameCodec::decode(line);
        if (std::holds_alternative<SkipLine>(decoded)) {
            return;
        }
        if (const auto* failure = std::get_if<DecodeFailure>(&decoded)) {
            response = dispatcher_.handle_decode_failure(*failure);
        } else {
            response = dispatcher_.handle(std::get<Message>(decoded));
        }
    } catch (const std::exception& e) {
        spdlog::error("Dropping line after unexpected failure: {} (line: {})", e.what(), line);
        return;
    }

    if (response && !stop_requested_) {
        transport_->write_line(FrameCodec::encode(*response));
    }
}

} // namespace mcprt
