#pragma once

#include "Catalog.hpp"
#include "ToolRegistry.hpp"
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace mcprt {

using json = nlohmann::json;

/**
 * @brief Lifecycle of the single host connection
 *
 * Uninitialized -> Initializing -> Ready -> Closed. Closed is terminal.
 */
enum class SessionState {
    Uninitialized,
    Initializing,
    Ready,
    Closed
};

const char* to_string(SessionState state);

/**
 * @brief Identity reported in the initialize result
 */
struct ServerInfo {
    std::string name = "mcp-stdio-server";
    std::string version = "1.0.0";
    std::optional<std::string> instructions;
};

/**
 * @brief Feature flags advertised during the handshake
 *
 * Always derived from what is registered, never set by hand.
 */
struct Capabilities {
    bool tools = false;
    bool resources = false;
    bool prompts = false;

    static Capabilities derive(const ToolRegistry& registry, const Catalog& catalog);

    json to_json() const;
};

/**
 * @brief Handshake state machine
 *
 * Single-threaded: only the dispatch thread touches it.
 */
class Session {
public:
    static constexpr const char* kDefaultProtocolVersion = "2024-11-05";

    explicit Session(ServerInfo info = {});

    /// Protocol versions this server can speak, oldest first
    static const std::vector<std::string>& supported_versions();

    SessionState state() const { return state_; }
    bool is_ready() const { return state_ == SessionState::Ready; }
    bool is_closed() const { return state_ == SessionState::Closed; }

    /**
     * @brief Handle an initialize request
     *
     * The first call moves Uninitialized -> Initializing and builds the
     * result; later calls return that same result unchanged. An unknown
     * requested protocol version is answered with the default version.
     *
     * @param params initialize params (protocolVersion, clientInfo, ...)
     * @param capabilities Capabilities derived from the registries
     * @return initialize result object
     * @throws std::logic_error if the session is closed
     */
    json initialize(const json& params, const Capabilities& capabilities);

    /**
     * @brief Initializing -> Ready, once the initialize result was produced
     *
     * No-op in any other state.
     */
    void complete_initialization();

    /// Any state -> Closed
    void close();

    /// Version agreed during the handshake, empty before initialize
    const std::string& protocol_version() const { return protocol_version_; }

    const ServerInfo& server_info() const { return info_; }

private:
    static std::string negotiate_version(const json& params);

    ServerInfo info_;
    SessionState state_{SessionState::Uninitialized};
    std::optional<json> init_result_;
    std::string protocol_version_;
};

} // namespace mcprt
