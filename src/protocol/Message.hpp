#pragma once

#include "protocol/Error.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace mcprt {

using json = nlohmann::json;

/// JSON-RPC request id: integer or string, never null
using RequestId = std::variant<int64_t, std::string>;

json id_to_json(const RequestId& id);

/// Human-readable form of an id for log lines
std::string id_to_string(const RequestId& id);

/**
 * @brief Convert an inbound id value to a RequestId
 *
 * @param id Raw "id" member (may be null or of an illegal type)
 * @return RequestId if the value is a legal id, std::nullopt otherwise
 */
std::optional<RequestId> parse_id(const json& id);

/**
 * @brief Best-effort id for diagnostics
 *
 * Never yields null: legal ids are rendered as-is, an absent or null id
 * becomes "<missing>", anything else its compact JSON text. The returned
 * string is meant for log lines only; a message without a legal id is
 * rejected, not processed.
 */
std::string ensure_valid_id(const json* id);

/**
 * @brief JSON-RPC error member
 */
struct ErrorObject {
    int code;
    std::string message;
    std::optional<json> data;
};

void to_json(json& j, const ErrorObject& e);

struct Request {
    RequestId id;
    std::string method;
    json params;  // object, or null when absent
};

struct Notification {
    std::string method;
    json params;
};

/**
 * @brief JSON-RPC response carrying exactly one of result or error
 *
 * Only constructible through success() or failure(), so a response with
 * both or neither member cannot exist.
 */
class Response {
public:
    static Response success(RequestId id, json result);
    static Response failure(RequestId id, ErrorObject error);
    static Response failure(RequestId id, int code, std::string message);

    const RequestId& id() const { return id_; }
    bool is_error() const { return std::holds_alternative<ErrorObject>(body_); }

    /// @pre !is_error()
    const json& result() const { return std::get<json>(body_); }

    /// @pre is_error()
    const ErrorObject& error() const { return std::get<ErrorObject>(body_); }

    json to_json() const;

private:
    Response(RequestId id, std::variant<json, ErrorObject> body)
        : id_(std::move(id)), body_(std::move(body)) {}

    RequestId id_;
    std::variant<json, ErrorObject> body_;
};

using Message = std::variant<Request, Notification, Response>;

} // namespace mcprt
