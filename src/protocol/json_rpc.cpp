#include "protocol/json_rpc.hpp"

namespace sqlbridge::protocol {

using nlohmann::json;

namespace {

std::optional<std::int64_t> read_id(const json& message) {
    const auto& id = message.at("id");
    if (id.is_number_integer()) {
        return id.get<std::int64_t>();
    }
    return std::nullopt;
}

RpcError read_error(const json& error) {
    RpcError parsed;
    if (!error.is_object()) {
        parsed.code = kInternalError;
        parsed.message = error.is_string() ? error.get<std::string>() : error.dump();
        return parsed;
    }
    if (error.contains("code") && error.at("code").is_number_integer()) {
        parsed.code = error.at("code").get<int>();
    }
    if (error.contains("message") && error.at("message").is_string()) {
        parsed.message = error.at("message").get<std::string>();
    } else {
        parsed.message = error.dump();
    }
    if (error.contains("data")) {
        parsed.data = error.at("data");
    }
    return parsed;
}

json read_params(const json& message) {
    if (message.contains("params") && !message.at("params").is_null()) {
        return message.at("params");
    }
    return json::object();
}

}  // namespace

std::optional<ProtocolMessage> parse_message(const std::string& line) {
    const json message = json::parse(line, nullptr, false);
    if (message.is_discarded() || !message.is_object()) {
        return std::nullopt;
    }

    const bool has_id = message.contains("id") && !message.at("id").is_null();
    const bool has_method = message.contains("method") && message.at("method").is_string();

    if (has_id && has_method) {
        const auto id = read_id(message);
        if (!id) {
            return std::nullopt;
        }
        return Request{*id, message.at("method").get<std::string>(), read_params(message)};
    }

    if (has_id && (message.contains("result") || message.contains("error"))) {
        const auto id = read_id(message);
        if (!id) {
            return std::nullopt;
        }
        Response response;
        response.id = *id;
        if (message.contains("error") && !message.at("error").is_null()) {
            response.error = read_error(message.at("error"));
        } else {
            response.result = message.at("result");
        }
        return response;
    }

    if (!has_id && has_method) {
        return Notification{message.at("method").get<std::string>(), read_params(message)};
    }

    return std::nullopt;
}

json to_json(const Request& request) {
    return json{{"jsonrpc", kJsonRpcVersion},
                {"id", request.id},
                {"method", request.method},
                {"params", request.params}};
}

json to_json(const Response& response) {
    json message{{"jsonrpc", kJsonRpcVersion}, {"id", response.id}};
    if (response.error) {
        json error{{"code", response.error->code}, {"message", response.error->message}};
        if (!response.error->data.is_null()) {
            error["data"] = response.error->data;
        }
        message["error"] = error;
    } else {
        message["result"] = response.result.is_null() ? json::object() : response.result;
    }
    return message;
}

json to_json(const Notification& notification) {
    return json{{"jsonrpc", kJsonRpcVersion},
                {"method", notification.method},
                {"params", notification.params}};
}

std::string serialize(const ProtocolMessage& message) {
    return std::visit([](const auto& m) { return to_json(m).dump(); }, message);
}

std::string display_json(const json& value, const int indent) {
    return value.dump(indent, ' ', false, json::error_handler_t::replace);
}

} // namespace sqlbridge::protocol
