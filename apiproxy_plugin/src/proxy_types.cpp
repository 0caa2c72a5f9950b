#include "proxy_types.hpp"

#include "base64.hpp"
#include "json_codec.hpp"

#include <cstdint>
#include <initializer_list>
#include <string>
#include <utility>

namespace apiproxy {

namespace {

bool parse_string_map(const nlohmann::json& obj, const char* field, std::map<std::string, std::string>& out,
                      std::string& error) {
    out.clear();
    if (obj.is_null()) {
        return true;
    }
    if (!obj.is_object()) {
        error = std::string(field) + " must be an object";
        return false;
    }
    for (auto it = obj.begin(); it != obj.end(); ++it) {
        if (!it.value().is_string()) {
            error = std::string(field) + "." + it.key() + " must be a string";
            return false;
        }
        out[it.key()] = it.value().get<std::string>();
    }
    return true;
}

bool parse_body(const nlohmann::json& root, Payload& out, std::string& error) {
    out = Payload{};

    if (auto encoding = codec::find_key(root, "body_encoding")) {
        std::string name = codec::as_string(*encoding, "");
        if (name == "text") {
            out.encoding = BodyEncoding::Text;
        } else if (name == "base64") {
            out.encoding = BodyEncoding::Base64;
        } else {
            error = "body_encoding must be \"text\" or \"base64\"";
            return false;
        }
        out.encoding_explicit = true;
    }

    auto body = codec::find_key(root, "body");
    if (!body || body->is_null()) {
        return true;
    }
    if (!body->is_string()) {
        error = "body must be a string";
        return false;
    }

    if (out.encoding == BodyEncoding::Base64) {
        if (!codec::base64_decode(body->get<std::string>(), out.data)) {
            error = "body is not valid base64";
            return false;
        }
        return true;
    }
    out.data = body->get<std::string>();
    return true;
}

void put_body(nlohmann::json& root, const Payload& body) {
    if (body.encoding == BodyEncoding::Base64) {
        root["body"] = codec::base64_encode(body.data);
        root["body_encoding"] = "base64";
        return;
    }
    root["body"] = body.data;
    if (body.encoding_explicit) {
        root["body_encoding"] = "text";
    }
}

void collect_extensions(const nlohmann::json& root, std::initializer_list<const char*> known, nlohmann::json& out) {
    out = nlohmann::json::object();
    for (auto it = root.begin(); it != root.end(); ++it) {
        bool is_known = false;
        for (const char* name : known) {
            if (it.key() == name) {
                is_known = true;
                break;
            }
        }
        if (!is_known) {
            out[it.key()] = it.value();
        }
    }
}

bool decode_param(const nlohmann::json& param, nlohmann::json& out, std::string& error) {
    if (param.is_object()) {
        out = param;
        return true;
    }
    if (!param.is_string()) {
        error = "expected an encoded JSON object";
        return false;
    }
    bool too_deep = false;
    out = codec::parse_bounded<nlohmann::json>(param.get<std::string>(), &too_deep);
    if (too_deep) {
        error = "encoded value is nested deeper than " + std::to_string(codec::kMaxJsonDepth) + " levels";
        return false;
    }
    if (out.is_discarded() || !out.is_object()) {
        error = "encoded value is not a JSON object";
        return false;
    }
    return true;
}

} // namespace

bool parse_proxy_request(const nlohmann::json& value, ProxyRequest& out, std::string& error) {
    if (!value.is_object()) {
        error = "request must be an object";
        return false;
    }

    ProxyRequest request;
    if (auto method = codec::find_key(value, "method")) {
        if (!method->is_string() && !method->is_null()) {
            error = "method must be a string";
            return false;
        }
        request.method = codec::as_string(*method, "");
    }
    auto endpoint = codec::find_key(value, "endpoint");
    if (!endpoint || !endpoint->is_string()) {
        error = "endpoint must be a string";
        return false;
    }
    request.endpoint = endpoint->get<std::string>();

    if (!parse_string_map(value.value("headers", nlohmann::json()), "headers", request.headers, error) ||
        !parse_string_map(value.value("metadata", nlohmann::json()), "metadata", request.metadata, error) ||
        !parse_body(value, request.body, error)) {
        return false;
    }
    collect_extensions(value, {"method", "endpoint", "headers", "body", "body_encoding", "metadata"},
                       request.extensions);

    out = std::move(request);
    return true;
}

bool parse_proxy_response(const nlohmann::json& value, ProxyResponse& out, std::string& error) {
    if (!value.is_object()) {
        error = "response must be an object";
        return false;
    }

    ProxyResponse response;
    auto status = codec::find_key(value, "status_code");
    if (!status || !status->is_number_integer()) {
        error = "status_code must be an integer";
        return false;
    }
    int64_t status_code = status->get<int64_t>();
    if (status_code < 100 || status_code > 599) {
        error = "status_code " + std::to_string(status_code) + " is not an HTTP status";
        return false;
    }
    response.status_code = static_cast<int>(status_code);

    if (auto cached = codec::find_key(value, "cached")) {
        if (!cached->is_boolean() && !cached->is_null()) {
            error = "cached must be a boolean";
            return false;
        }
        response.cached = codec::as_bool(*cached, false);
    }

    if (!parse_string_map(value.value("headers", nlohmann::json()), "headers", response.headers, error) ||
        !parse_string_map(value.value("metadata", nlohmann::json()), "metadata", response.metadata, error) ||
        !parse_body(value, response.body, error)) {
        return false;
    }
    collect_extensions(value, {"status_code", "headers", "body", "body_encoding", "cached", "metadata"},
                       response.extensions);

    out = std::move(response);
    return true;
}

bool decode_proxy_request(const nlohmann::json& param, ProxyRequest& out, std::string& error) {
    nlohmann::json value;
    if (!decode_param(param, value, error)) {
        return false;
    }
    return parse_proxy_request(value, out, error);
}

bool decode_proxy_response(const nlohmann::json& param, ProxyResponse& out, std::string& error) {
    nlohmann::json value;
    if (!decode_param(param, value, error)) {
        return false;
    }
    return parse_proxy_response(value, out, error);
}

nlohmann::json to_json(const ProxyRequest& request) {
    nlohmann::json root = request.extensions.is_object() ? request.extensions : nlohmann::json::object();
    root["method"] = request.method;
    root["endpoint"] = request.endpoint;
    root["headers"] = request.headers;
    put_body(root, request.body);
    root["metadata"] = request.metadata;
    return root;
}

nlohmann::json to_json(const ProxyResponse& response) {
    nlohmann::json root = response.extensions.is_object() ? response.extensions : nlohmann::json::object();
    root["status_code"] = response.status_code;
    root["headers"] = response.headers;
    put_body(root, response.body);
    root["cached"] = response.cached;
    root["metadata"] = response.metadata;
    return root;
}

std::string encode_proxy_request(const ProxyRequest& request) {
    return codec::dump(to_json(request));
}

std::string encode_proxy_response(const ProxyResponse& response) {
    return codec::dump(to_json(response));
}

void merge_metadata(MetadataMap& base, const MetadataMap& overlay) {
    for (const auto& entry : overlay) {
        base[entry.first] = entry.second;
    }
}

void rewrite_endpoint(ProxyRequest& request, const std::string& new_endpoint) {
    if (request.metadata.find(kOriginalEndpointKey) == request.metadata.end()) {
        request.metadata[kOriginalEndpointKey] = request.endpoint;
    }
    request.endpoint = new_endpoint;
}

} // namespace apiproxy
