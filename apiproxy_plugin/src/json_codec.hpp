#pragma once

#include "protocol.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <stdexcept>
#include <string>

namespace apiproxy::codec {

// Deepest object/array nesting accepted from the wire or from a message body.
constexpr int kMaxJsonDepth = 512;

/**
 * Parses `text` without building anything nested deeper than kMaxJsonDepth.
 * Returns a discarded value on malformed or too deeply nested input; `too_deep`
 * tells the two apart.
 */
template <typename BasicJson>
BasicJson parse_bounded(const std::string& text, bool* too_deep = nullptr) {
    using event_t = typename BasicJson::parse_event_t;
    bool exceeded = false;
    BasicJson value = BasicJson::parse(
        text,
        [&exceeded](int depth, event_t event, BasicJson&) {
            if (depth >= kMaxJsonDepth && (event == event_t::object_start || event == event_t::array_start)) {
                exceeded = true;
                return false;
            }
            return true;
        },
        false);
    if (too_deep) {
        *too_deep = exceeded;
    }
    if (exceeded) {
        return BasicJson(BasicJson::value_t::discarded);
    }
    return value;
}

struct DecodeResult {
    std::optional<rpc::RpcRequest> request;
    std::optional<rpc::RpcError> error;
    // Filled whenever the id could be recovered, including on failure.
    rpc::RpcId id;

    bool ok() const { return request.has_value(); }
};

class CodecError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

DecodeResult decode_request(const std::string& line);

/// Locates the top-level "id" member without requiring the rest of the line to parse.
std::optional<std::string> extract_raw_id(const std::string& line);

std::string encode_response(const rpc::RpcResponse& response);
std::string encode_request(const rpc::RpcRequest& request);

/// Host side: parse one reply line. Throws CodecError on malformed input.
rpc::RpcResponse decode_response(const std::string& line);

std::string dump(const nlohmann::json& value);

const nlohmann::json* find_key(const nlohmann::json& map_obj, const std::string& key);
std::string as_string(const nlohmann::json& obj, const std::string& fallback = "");
int64_t as_int64(const nlohmann::json& obj, int64_t fallback = 0);
bool as_bool(const nlohmann::json& obj, bool fallback = false);

} // namespace apiproxy::codec
