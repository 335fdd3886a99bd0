#include "json_codec.hpp"

#include "errors.hpp"

namespace stavily::codec {

namespace {

Json parse_line(const std::string& line) {
    if (line.size() > kMaxLineSize) {
        throw ProtocolError("line exceeds " + std::to_string(kMaxLineSize) + " bytes");
    }
    try {
        return Json::parse(line);
    } catch (const Json::parse_error& exc) {
        throw ProtocolError(std::string("invalid JSON: ") + exc.what());
    }
}

std::string dump_line(const Json& json) {
    // strict: invalid UTF-8 throws instead of being written out
    return json.dump(-1, ' ', false, Json::error_handler_t::strict);
}

Json envelope_json(const ResponseEnvelope& response) {
    Json root = Json::object();
    root["success"] = response.success;
    root["data"] = response.data;
    root["error"] = response.error ? to_json(*response.error) : Json(nullptr);
    return root;
}

} // namespace

RequestEnvelope decode_request(const std::string& line) {
    Json root = parse_line(line);
    if (!root.is_object()) {
        throw ProtocolError("request must be a JSON object");
    }

    RequestEnvelope request;

    const Json* action_obj = find_key(root, "action");
    if (!action_obj) {
        throw ProtocolError("missing 'action'");
    }
    if (!action_obj->is_string() || action_obj->get_ref<const std::string&>().empty()) {
        throw ProtocolError("'action' must be a non-empty string");
    }
    request.action = action_obj->get<std::string>();

    if (const Json* config_obj = find_key(root, "config")) {
        if (!config_obj->is_null()) {
            if (!config_obj->is_object()) {
                throw ProtocolError("'config' must be an object");
            }
            request.config = *config_obj;
        }
    }

    if (const Json* ar_obj = find_key(root, "action_request")) {
        if (!ar_obj->is_null()) {
            if (!ar_obj->is_object()) {
                throw ProtocolError("'action_request' must be an object");
            }
            ActionRequest action_request;
            if (const Json* id_obj = find_key(*ar_obj, "id")) {
                if (!id_obj->is_string()) {
                    throw ProtocolError("'action_request.id' must be a string");
                }
                action_request.id = id_obj->get<std::string>();
            }
            if (const Json* params_obj = find_key(*ar_obj, "parameters")) {
                if (!params_obj->is_null()) {
                    if (!params_obj->is_object()) {
                        throw ProtocolError("'action_request.parameters' must be an object");
                    }
                    action_request.parameters = *params_obj;
                }
            }
            request.action_request = std::move(action_request);
        }
    }

    return request;
}

std::string encode_response(const ResponseEnvelope& response) {
    try {
        return encode_response_checked(response);
    } catch (const ProtocolError& exc) {
        auto fallback = ResponseEnvelope::failure(ErrorKind::InternalError, exc.what());
        return envelope_json(fallback).dump();
    }
}

std::string encode_response_checked(const ResponseEnvelope& response) {
    try {
        return dump_line(envelope_json(response));
    } catch (const Json::exception& exc) {
        throw ProtocolError(std::string("response not serializable: ") + exc.what());
    }
}

std::string to_valid_utf8(const std::string& text) {
    std::string quoted = Json(text).dump(-1, ' ', false, Json::error_handler_t::replace);
    return Json::parse(quoted).get<std::string>();
}

std::string encode_request(const RequestEnvelope& request) {
    Json root = Json::object();
    root["action"] = request.action;
    if (request.config) {
        root["config"] = *request.config;
    }
    if (request.action_request) {
        root["action_request"] = to_json(*request.action_request);
    }
    return dump_line(root);
}

ResponseEnvelope decode_response(const std::string& line) {
    Json root = parse_line(line);
    if (!root.is_object()) {
        throw ProtocolError("response must be a JSON object");
    }

    const Json* success_obj = find_key(root, "success");
    if (!success_obj || !success_obj->is_boolean()) {
        throw ProtocolError("response is missing boolean 'success'");
    }

    ResponseEnvelope response;
    response.success = success_obj->get<bool>();
    if (const Json* data_obj = find_key(root, "data")) {
        response.data = *data_obj;
    }

    const Json* error_obj = find_key(root, "error");
    if (error_obj && error_obj->is_object()) {
        ErrorInfo error;
        std::string kind = as_string(error_obj->value("kind", Json()), "");
        error.kind = parse_error_kind(kind).value_or(ErrorKind::InternalError);
        error.message = as_string(error_obj->value("message", Json()), "");
        response.error = std::move(error);
    }

    if (!response.success && !response.error) {
        throw ProtocolError("failed response without 'error'");
    }
    return response;
}

const Json* find_key(const Json& map_obj, const std::string& key) {
    if (!map_obj.is_object()) {
        return nullptr;
    }
    auto it = map_obj.find(key);
    if (it == map_obj.end()) {
        return nullptr;
    }
    return &*it;
}

std::string as_string(const Json& obj, const std::string& fallback) {
    if (obj.is_string()) {
        return obj.get<std::string>();
    }
    return fallback;
}

int64_t as_int64(const Json& obj, int64_t fallback) {
    if (obj.is_number_integer()) {
        return obj.get<int64_t>();
    }
    if (obj.is_number_float()) {
        return static_cast<int64_t>(obj.get<double>());
    }
    return fallback;
}

bool as_bool(const Json& obj, bool fallback) {
    if (obj.is_boolean()) {
        return obj.get<bool>();
    }
    return fallback;
}

double as_double(const Json& obj, double fallback) {
    if (obj.is_number()) {
        return obj.get<double>();
    }
    return fallback;
}

} // namespace stavily::codec
