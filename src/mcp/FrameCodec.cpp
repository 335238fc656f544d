#include "FrameCodec.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <limits>

namespace mcprt {

namespace {

bool is_blank(const std::string& line) {
    return std::all_of(line.begin(), line.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

DecodeFailure invalid_request(const std::string& reason, std::optional<RequestId> id = std::nullopt) {
    return {error::InvalidRequest, "Invalid Request: " + reason, std::move(id)};
}

// Walks a possibly truncated document and captures the value of a top-level
// "id" member. Parsing stops as soon as that value has been seen.
class IdScanner : public nlohmann::json_sax<json> {
public:
    std::optional<RequestId> id;

    bool null() override { return scalar(std::nullopt); }
    bool boolean(bool) override { return scalar(std::nullopt); }

    bool number_integer(number_integer_t value) override {
        return scalar(RequestId{static_cast<int64_t>(value)});
    }

    bool number_unsigned(number_unsigned_t value) override {
        if (value > static_cast<number_unsigned_t>(std::numeric_limits<int64_t>::max())) {
            return scalar(std::nullopt);
        }
        return scalar(RequestId{static_cast<int64_t>(value)});
    }

    bool number_float(number_float_t, const string_t&) override { return scalar(std::nullopt); }
    bool string(string_t& value) override { return scalar(RequestId{value}); }
    bool binary(binary_t&) override { return scalar(std::nullopt); }

    bool start_object(std::size_t) override { return open(); }
    bool end_object() override { return close(); }
    bool start_array(std::size_t) override { return open(); }
    bool end_array() override { return close(); }

    bool key(string_t& name) override {
        expecting_id_ = depth_ == 1 && name == "id";
        return true;
    }

    bool parse_error(std::size_t, const std::string&, const json::exception&) override {
        return false;
    }

private:
    bool scalar(std::optional<RequestId> value) {
        if (!expecting_id_) {
            return true;
        }
        id = std::move(value);
        return false;
    }

    bool open() {
        if (expecting_id_) {
            // Object or array where the id should be: not a legal id
            return false;
        }
        ++depth_;
        return true;
    }

    bool close() {
        --depth_;
        return true;
    }

    int depth_ = 0;
    bool expecting_id_ = false;
};

} // namespace

DecodeResult FrameCodec::decode(const std::string& line) {
    std::string text = line;
    if (!text.empty() && text.back() == '\r') {
        text.pop_back();
    }

    if (is_blank(text)) {
        return SkipLine{};
    }

    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        spdlog::debug("JSON parse error: {}", e.what());
        return DecodeFailure{error::ParseError, "Parse error", salvage_id(text)};
    }

    return decode_object(j);
}

DecodeResult FrameCodec::decode_object(const json& j) {
    if (!j.is_object()) {
        return invalid_request(j.is_array() ? "batch messages are not supported"
                                            : "message must be a JSON object");
    }

    auto id_it = j.find("id");
    bool has_id = id_it != j.end();
    std::optional<RequestId> id = has_id ? parse_id(*id_it) : std::nullopt;

    auto version_it = j.find("jsonrpc");
    if (version_it == j.end() || *version_it != "2.0") {
        return invalid_request("missing or invalid jsonrpc field", id);
    }

    auto method_it = j.find("method");
    if (method_it != j.end()) {
        if (!method_it->is_string()) {
            return invalid_request("method must be a string", id);
        }

        json params = j.value("params", json());
        if (!params.is_null() && !params.is_object() && !params.is_array()) {
            return invalid_request("params must be an object or array", id);
        }

        if (!has_id) {
            return Message{Notification{method_it->get<std::string>(), std::move(params)}};
        }
        if (!id) {
            // Nothing legal to echo back, so no response can be built
            return invalid_request("request id " + ensure_valid_id(&*id_it) +
                                   " must be a string or integer");
        }
        return Message{Request{std::move(*id), method_it->get<std::string>(), std::move(params)}};
    }

    if (has_id) {
        // A reply from the host. Replies are never answered, so no id is salvaged.
        bool has_result = j.contains("result");
        auto error_it = j.find("error");
        bool has_error = error_it != j.end();
        if (!id || has_result == has_error) {
            return invalid_request("malformed response from host");
        }
        if (has_result) {
            return Message{Response::success(std::move(*id), j.at("result"))};
        }
        if (!error_it->is_object()) {
            return invalid_request("malformed error member in host response");
        }
        auto code_it = error_it->find("code");
        auto message_it = error_it->find("message");
        ErrorObject err{
            code_it != error_it->end() && code_it->is_number_integer() ? code_it->get<int>()
                                                                      : error::InternalError,
            message_it != error_it->end() && message_it->is_string() ? message_it->get<std::string>()
                                                                    : std::string(),
            std::nullopt};
        if (error_it->contains("data")) {
            err.data = error_it->at("data");
        }
        return Message{Response::failure(std::move(*id), std::move(err))};
    }

    return invalid_request("missing both id and method");
}

std::string FrameCodec::encode(const Response& response) {
    // Invalid UTF-8 from a handler is replaced rather than failing the whole frame
    auto dump = [](const json& value) {
        return value.dump(-1, ' ', false, json::error_handler_t::replace);
    };

    std::string out = "{\"jsonrpc\":\"2.0\",\"id\":";
    out += dump(id_to_json(response.id()));
    if (response.is_error()) {
        out += ",\"error\":";
        out += dump(json(response.error()));
    } else {
        out += ",\"result\":";
        out += dump(response.result());
    }
    out += '}';
    return out;
}

std::optional<RequestId> FrameCodec::salvage_id(const std::string& line) {
    IdScanner scanner;
    try {
        json::sax_parse(line, &scanner);
    } catch (const json::exception& e) {
        spdlog::debug("Could not salvage id: {}", e.what());
        return std::nullopt;
    }
    return scanner.id;
}

} // namespace mcprt
