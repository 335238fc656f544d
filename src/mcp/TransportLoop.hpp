#pragma once

#include "Dispatcher.hpp"
#include "ITransport.hpp"
#include "LineQueue.hpp"
#include "Session.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>

namespace mcprt {

/**
 * @brief Process main loop: transport -> codec -> dispatcher -> transport
 *
 * A dedicated reader thread pulls lines off the transport into a
 * LineQueue, so a slow tool handler never keeps the input side from being
 * drained. The calling thread pops lines and decodes, dispatches, writes
 * and flushes them strictly one at a time, in arrival order.
 */
class TransportLoop {
public:
    /**
     * @param transport Line transport, shared with the reader thread
     * @param dispatcher Message router
     * @param session Session to close once the stream ends
     */
    TransportLoop(std::shared_ptr<ITransport> transport, Dispatcher& dispatcher, Session& session);
    ~TransportLoop();

    TransportLoop(const TransportLoop&) = delete;
    TransportLoop& operator=(const TransportLoop&) = delete;

    /**
     * @brief Run until the input stream closes or stop() is called
     *
     * Lines already read when the stream closes are still processed.
     *
     * @return Process exit code (0 on clean shutdown)
     * @throws std::logic_error if called twice
     */
    int run();

    /**
     * @brief Ask the loop to finish without writing anything further
     *
     * Only touches an atomic flag, so it may be called from a signal handler.
     */
    void stop();

    bool is_running() const { return running_; }

    /// Upper bound on how long stop() takes to be noticed
    static constexpr std::chrono::milliseconds kPollInterval{100};

private:
    void start_reader();
    void release_reader();
    void process_line(const std::string& line);

    std::shared_ptr<ITransport> transport_;
    Dispatcher& dispatcher_;
    Session& session_;
    std::shared_ptr<LineQueue> queue_;
    std::shared_ptr<std::atomic<bool>> reader_done_;
    std::thread reader_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    bool started_ = false;
};

} // namespace mcprt
