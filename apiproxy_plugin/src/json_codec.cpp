#include "json_codec.hpp"

#include <cstddef>
#include <string>

namespace apiproxy::codec {

namespace {

constexpr std::size_t npos = std::string::npos;

std::size_t skip_ws(const std::string& line, std::size_t pos) {
    while (pos < line.size() &&
           (line[pos] == ' ' || line[pos] == '\t' || line[pos] == '\r' || line[pos] == '\n')) {
        ++pos;
    }
    return pos;
}

// Returns the index one past the closing quote of the string starting at pos.
std::size_t scan_string(const std::string& line, std::size_t pos) {
    for (std::size_t i = pos + 1; i < line.size(); ++i) {
        if (line[i] == '\\') {
            ++i;
            continue;
        }
        if (line[i] == '"') {
            return i + 1;
        }
    }
    return npos;
}

std::size_t scan_scalar(const std::string& line, std::size_t pos) {
    if (pos >= line.size()) {
        return npos;
    }
    if (line[pos] == '"') {
        return scan_string(line, pos);
    }
    if (line[pos] == '{' || line[pos] == '[') {
        return npos;
    }
    std::size_t i = pos;
    while (i < line.size()) {
        char c = line[i];
        if (c == ',' || c == '}' || c == ']' || c == ' ' || c == '\t' || c == '\r' || c == '\n') {
            break;
        }
        ++i;
    }
    return i == pos ? npos : i;
}

bool is_valid_id_token(const std::string& token) {
    nlohmann::json value = nlohmann::json::parse(token, nullptr, false);
    if (value.is_discarded()) {
        return false;
    }
    return value.is_string() || value.is_number() || value.is_null();
}

rpc::RpcError make_error(rpc::ErrorKind kind, const std::string& message) {
    return rpc::RpcError::make(kind, message);
}

} // namespace

std::string dump(const nlohmann::json& value) {
    return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::optional<std::string> extract_raw_id(const std::string& line) {
    std::size_t pos = skip_ws(line, 0);
    if (pos >= line.size() || line[pos] != '{') {
        return std::nullopt;
    }

    std::optional<std::string> found;
    int depth = 0;
    bool expect_key = false;
    std::size_t i = pos;
    while (i < line.size()) {
        char c = line[i];
        if (c == '"') {
            std::size_t end = scan_string(line, i);
            if (end == npos) {
                break;
            }
            if (depth == 1 && expect_key) {
                expect_key = false;
                std::size_t colon = skip_ws(line, end);
                if (colon < line.size() && line[colon] == ':' && line.compare(i, end - i, "\"id\"") == 0) {
                    std::size_t value_start = skip_ws(line, colon + 1);
                    std::size_t value_end = scan_scalar(line, value_start);
                    if (value_end != npos) {
                        std::string token = line.substr(value_start, value_end - value_start);
                        if (is_valid_id_token(token)) {
                            // Later duplicates win, as they do for the full parser.
                            found = token;
                        }
                        i = value_end;
                        continue;
                    }
                }
            }
            i = end;
            continue;
        }

        switch (c) {
            case '{':
                ++depth;
                expect_key = depth == 1;
                break;
            case '[':
                ++depth;
                break;
            case '}':
            case ']':
                --depth;
                break;
            case ',':
                expect_key = depth == 1;
                break;
            default:
                break;
        }
        if (depth <= 0 && i > pos) {
            break;
        }
        ++i;
    }
    return found;
}

DecodeResult decode_request(const std::string& line) {
    DecodeResult result;
    if (auto raw_id = extract_raw_id(line)) {
        result.id.raw = *raw_id;
    }

    bool too_deep = false;
    nlohmann::json root = parse_bounded<nlohmann::json>(line, &too_deep);
    if (too_deep) {
        result.error = make_error(rpc::ErrorKind::ParseError, "Parse error: nesting deeper than " +
                                                                  std::to_string(kMaxJsonDepth) + " levels");
        return result;
    }
    if (root.is_discarded()) {
        result.error = make_error(rpc::ErrorKind::ParseError, "Parse error: invalid JSON");
        return result;
    }
    if (!root.is_object()) {
        result.error = make_error(rpc::ErrorKind::ParseError, "Parse error: message is not an object");
        return result;
    }

    if (auto id_obj = find_key(root, "id")) {
        if (!id_obj->is_string() && !id_obj->is_number() && !id_obj->is_null()) {
            result.id = rpc::RpcId{};
            result.error = make_error(rpc::ErrorKind::ParseError, "Parse error: id must be a string, number or null");
            return result;
        }
        if (!result.id.present()) {
            result.id = rpc::RpcId::from_json(*id_obj);
        }
    } else {
        result.id = rpc::RpcId{};
    }

    if (auto version = find_key(root, "jsonrpc")) {
        if (!version->is_string() || version->get<std::string>() != rpc::kJsonRpcVersion) {
            result.error = make_error(rpc::ErrorKind::VersionError,
                                      "Unsupported jsonrpc version: " + dump(*version));
            return result;
        }
    }

    auto method_obj = find_key(root, "method");
    if (!method_obj || !method_obj->is_string()) {
        result.error = make_error(rpc::ErrorKind::ParseError, "Parse error: method must be a string");
        return result;
    }

    rpc::RpcRequest request;
    request.method = method_obj->get<std::string>();
    request.id = result.id;

    if (auto params_obj = find_key(root, "params")) {
        if (params_obj->is_array()) {
            request.params = *params_obj;
        } else if (!params_obj->is_null()) {
            result.error = make_error(rpc::ErrorKind::InvalidParams, "Invalid params: params must be an array");
            return result;
        }
    }

    result.request = std::move(request);
    return result;
}

std::string encode_response(const rpc::RpcResponse& response) {
    std::string line = "{\"jsonrpc\":\"2.0\",";
    if (response.ok()) {
        line += "\"result\":";
        line += dump(response.result());
    } else {
        const auto& error = *response.error();
        nlohmann::json error_obj = nlohmann::json::object();
        error_obj["code"] = error.code;
        error_obj["message"] = error.message;
        line += "\"error\":";
        line += dump(error_obj);
    }
    line += ",\"id\":";
    line += response.id().wire();
    line += "}\n";
    return line;
}

std::string encode_request(const rpc::RpcRequest& request) {
    std::string line = "{\"jsonrpc\":\"2.0\",\"method\":";
    line += dump(request.method);
    line += ",\"params\":";
    line += dump(request.params.is_null() ? nlohmann::json::array() : request.params);
    if (request.id.present()) {
        line += ",\"id\":";
        line += request.id.raw;
    }
    line += "}\n";
    return line;
}

rpc::RpcResponse decode_response(const std::string& line) {
    nlohmann::json root = parse_bounded<nlohmann::json>(line);
    if (root.is_discarded() || !root.is_object()) {
        throw CodecError("malformed reply line");
    }

    if (auto version = find_key(root, "jsonrpc")) {
        if (!version->is_string() || version->get<std::string>() != rpc::kJsonRpcVersion) {
            throw CodecError("unsupported jsonrpc version in reply: " + dump(*version));
        }
    }

    rpc::RpcId id;
    if (auto raw_id = extract_raw_id(line)) {
        id.raw = *raw_id;
    } else if (auto id_obj = find_key(root, "id")) {
        id = rpc::RpcId::from_json(*id_obj);
    }

    auto result_obj = find_key(root, "result");
    auto error_obj = find_key(root, "error");
    if (error_obj && !error_obj->is_null()) {
        if (result_obj && !result_obj->is_null()) {
            throw CodecError("reply carries both result and error");
        }
        if (!error_obj->is_object()) {
            throw CodecError("reply error is not an object");
        }
        rpc::RpcError error;
        error.code = static_cast<int>(as_int64(error_obj->value("code", nlohmann::json()), rpc::kPluginErrorCode));
        error.message = as_string(error_obj->value("message", nlohmann::json()), "");
        return rpc::RpcResponse::failure(std::move(id), std::move(error));
    }
    if (!result_obj) {
        throw CodecError("reply carries neither result nor error");
    }
    return rpc::RpcResponse::success(std::move(id), *result_obj);
}

const nlohmann::json* find_key(const nlohmann::json& map_obj, const std::string& key) {
    if (!map_obj.is_object()) {
        return nullptr;
    }
    auto it = map_obj.find(key);
    if (it == map_obj.end()) {
        return nullptr;
    }
    return &(*it);
}

std::string as_string(const nlohmann::json& obj, const std::string& fallback) {
    if (obj.is_string()) {
        return obj.get<std::string>();
    }
    return fallback;
}

int64_t as_int64(const nlohmann::json& obj, int64_t fallback) {
    if (obj.is_number_integer()) {
        return obj.get<int64_t>();
    }
    return fallback;
}

bool as_bool(const nlohmann::json& obj, bool fallback) {
    if (obj.is_boolean()) {
        return obj.get<bool>();
    }
    return fallback;
}

} // namespace apiproxy::codec
