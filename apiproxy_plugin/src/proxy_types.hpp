#pragma once

#include <nlohmann/json.hpp>

#include <map>
#include <string>

namespace apiproxy {

using HeaderMap = std::map<std::string, std::string>;
using MetadataMap = std::map<std::string, std::string>;

// Metadata key under which a rewritten endpoint keeps its original value.
constexpr const char* kOriginalEndpointKey = "original_endpoint";

enum class BodyEncoding {
    Text,
    Base64,
};

/**
 * A request or response body. `data` always holds the raw bytes; `encoding`
 * records how the host represented them on the wire so the reply can use the
 * same representation.
 */
struct Payload {
    std::string data;
    BodyEncoding encoding = BodyEncoding::Text;
    bool encoding_explicit = false; // body_encoding was present on the wire

    bool empty() const { return data.empty(); }
};

struct ProxyRequest {
    std::string method;
    std::string endpoint;
    HeaderMap headers;
    Payload body;
    MetadataMap metadata;
    nlohmann::json extensions = nlohmann::json::object(); // unknown fields, passed through
};

struct ProxyResponse {
    int status_code = 200;
    HeaderMap headers;
    Payload body;
    bool cached = false;
    MetadataMap metadata;
    nlohmann::json extensions = nlohmann::json::object();
};

bool parse_proxy_request(const nlohmann::json& value, ProxyRequest& out, std::string& error);
bool parse_proxy_response(const nlohmann::json& value, ProxyResponse& out, std::string& error);

/// Accepts either an encoded JSON string (the wire form) or an inline object.
bool decode_proxy_request(const nlohmann::json& param, ProxyRequest& out, std::string& error);
bool decode_proxy_response(const nlohmann::json& param, ProxyResponse& out, std::string& error);

nlohmann::json to_json(const ProxyRequest& request);
nlohmann::json to_json(const ProxyResponse& response);

/// Encoded text form used for params.
std::string encode_proxy_request(const ProxyRequest& request);
std::string encode_proxy_response(const ProxyResponse& response);

/// Overlays `overlay` onto `base`; on collision the overlay value wins.
void merge_metadata(MetadataMap& base, const MetadataMap& overlay);

/// Records the current endpoint under kOriginalEndpointKey (first rewrite only) and replaces it.
void rewrite_endpoint(ProxyRequest& request, const std::string& new_endpoint);

} // namespace apiproxy
