#include "Session.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <stdexcept>

namespace mcprt {

const char* to_string(SessionState state) {
    switch (state) {
        case SessionState::Uninitialized: return "Uninitialized";
        case SessionState::Initializing:  return "Initializing";
        case SessionState::Ready:         return "Ready";
        case SessionState::Closed:        return "Closed";
    }
    return "Unknown";
}

Capabilities Capabilities::derive(const ToolRegistry& registry, const Catalog& catalog) {
    Capabilities caps;
    caps.tools = !registry.empty();
    caps.resources = catalog.has_resources();
    caps.prompts = catalog.has_prompts();
    return caps;
}

json Capabilities::to_json() const {
    json caps = json::object();
    if (tools) {
        caps["tools"] = json::object();
    }
    if (resources) {
        caps["resources"] = json::object();
    }
    if (prompts) {
        caps["prompts"] = json::object();
    }
    return caps;
}

Session::Session(ServerInfo info)
    : info_(std::move(info)) {
}

const std::vector<std::string>& Session::supported_versions() {
    static const std::vector<std::string> versions = {
        "2024-11-05",
        "2025-03-26",
        "2025-06-18"
    };
    return versions;
}

std::string Session::negotiate_version(const json& params) {
    std::string requested;
    if (params.is_object()) {
        auto it = params.find("protocolVersion");
        if (it != params.end() && it->is_string()) {
            requested = it->get<std::string>();
        }
    }

    const auto& versions = supported_versions();
    if (std::find(versions.begin(), versions.end(), requested) != versions.end()) {
        return requested;
    }

    if (requested.empty()) {
        spdlog::warn("Client did not request a protocol version, using {}", kDefaultProtocolVersion);
    } else {
        spdlog::warn("Client requested unknown protocol version {}, offering {}",
                     requested, kDefaultProtocolVersion);
    }
    return kDefaultProtocolVersion;
}

json Session::initialize(const json& params, const Capabilities& capabilities) {
    if (state_ == SessionState::Closed) {
        throw std::logic_error("initialize on a closed session");
    }

    if (init_result_) {
        std::string requested = negotiate_version(params);
        if (requested != protocol_version_) {
            spdlog::warn("Repeated initialize asks for {}, keeping {}", requested, protocol_version_);
        } else {
            spdlog::info("Repeated initialize, returning the original handshake result");
        }
        return *init_result_;
    }

    state_ = SessionState::Initializing;

    if (params.is_object() && params.contains("clientInfo") && params["clientInfo"].is_object()) {
        const json& client = params["clientInfo"];
        spdlog::info("Client: {} version {}",
                     client.contains("name") ? client["name"].dump() : "unknown",
                     client.contains("version") ? client["version"].dump() : "unknown");
    }

    protocol_version_ = negotiate_version(params);

    json result = {
        {"protocolVersion", protocol_version_},
        {"capabilities", capabilities.to_json()},
        {"serverInfo", {
            {"name", info_.name},
            {"version", info_.version}
        }}
    };
    if (info_.instructions) {
        result["instructions"] = *info_.instructions;
    }

    init_result_ = result;
    spdlog::info("Handshake: protocol {}, capabilities {}", protocol_version_, result["capabilities"].dump());
    return result;
}

void Session::complete_initialization() {
    if (state_ == SessionState::Initializing) {
        state_ = SessionState::Ready;
        spdlog::info("Session ready");
    }
}

void Session::close() {
    if (state_ != SessionState::Closed) {
        spdlog::info("Session closed (was {})", to_string(state_));
        state_ = SessionState::Closed;
    }
}

} // namespace mcprt
