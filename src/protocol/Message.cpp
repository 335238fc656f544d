#include "Message.hpp"

namespace mcprt {

json id_to_json(const RequestId& id) {
    return std::visit([](const auto& v) { return json(v); }, id);
}

std::string id_to_string(const RequestId& id) {
    if (const auto* s = std::get_if<std::string>(&id)) {
        return "\"" + *s + "\"";
    }
    return std::to_string(std::get<int64_t>(id));
}

std::optional<RequestId> parse_id(const json& id) {
    if (id.is_number_integer()) {
        // Unsigned values above int64 range cannot be echoed back faithfully
        if (id.is_number_unsigned() &&
            id.get<uint64_t>() > static_cast<uint64_t>(INT64_MAX)) {
            return std::nullopt;
        }
        return RequestId{id.get<int64_t>()};
    }
    if (id.is_string()) {
        return RequestId{id.get<std::string>()};
    }
    return std::nullopt;
}

std::string ensure_valid_id(const json* id) {
    if (id == nullptr || id->is_null()) {
        return "<missing>";
    }
    if (auto parsed = parse_id(*id)) {
        return id_to_string(*parsed);
    }
    return id->dump();
}

void to_json(json& j, const ErrorObject& e) {
    j = json{{"code", e.code}, {"message", e.message}};
    if (e.data) {
        j["data"] = *e.data;
    }
}

Response Response::success(RequestId id, json result) {
    // A null result would read as "no result" to hosts
    if (result.is_null()) {
        result = json::object();
    }
    return Response(std::move(id),
                    std::variant<json, ErrorObject>(std::in_place_type<json>, std::move(result)));
}

Response Response::failure(RequestId id, ErrorObject error) {
    return Response(std::move(id),
                    std::variant<json, ErrorObject>(std::in_place_type<ErrorObject>, std::move(error)));
}

Response Response::failure(RequestId id, int code, std::string message) {
    return failure(std::move(id), ErrorObject{code, std::move(message), std::nullopt});
}

json Response::to_json() const {
    json j = {
        {"jsonrpc", "2.0"},
        {"id", id_to_json(id_)}
    };
    if (is_error()) {
        j["error"] = error();
    } else {
        j["result"] = result();
    }
    return j;
}

} // namespace mcprt
