#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <utility>

namespace apiproxy::rpc {

constexpr const char* kJsonRpcVersion = "2.0";

// Every plugin-side failure shares one code so that a minimal host only has to
// check for the presence of "error".
constexpr int kPluginErrorCode = -32000;

enum class ErrorKind {
    ParseError,
    VersionError,
    MethodNotFound,
    InvalidParams,
    StateError,
    HandlerError,
};

inline const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::ParseError:
            return "parse_error";
        case ErrorKind::VersionError:
            return "version_error";
        case ErrorKind::MethodNotFound:
            return "method_not_found";
        case ErrorKind::InvalidParams:
            return "invalid_params";
        case ErrorKind::StateError:
            return "state_error";
        case ErrorKind::HandlerError:
            return "handler_error";
    }
    return "unknown";
}

struct RpcError {
    ErrorKind kind = ErrorKind::HandlerError; // not serialized
    int code = kPluginErrorCode;
    std::string message;

    static RpcError make(ErrorKind kind, std::string message) {
        RpcError error;
        error.kind = kind;
        error.message = std::move(message);
        return error;
    }
};

/**
 * Call id kept as its raw JSON token so the reply can echo it byte for byte.
 * An empty token means the call carried no id (notification).
 */
struct RpcId {
    std::string raw;

    bool present() const { return !raw.empty(); }
    std::string wire() const { return raw.empty() ? std::string("null") : raw; }

    static RpcId from_json(const nlohmann::json& value) {
        return RpcId{value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)};
    }

    bool operator==(const RpcId& other) const { return wire() == other.wire(); }
    bool operator!=(const RpcId& other) const { return !(*this == other); }
};

struct RpcRequest {
    std::string method;
    nlohmann::json params = nlohmann::json::array();
    RpcId id;

    bool is_notification() const { return !id.present(); }
};

class RpcResponse {
public:
    static RpcResponse success(RpcId id, nlohmann::json result) {
        return RpcResponse(std::move(id), std::move(result), std::nullopt);
    }

    static RpcResponse failure(RpcId id, RpcError error) {
        return RpcResponse(std::move(id), nullptr, std::move(error));
    }

    const RpcId& id() const { return id_; }
    bool ok() const { return !error_.has_value(); }
    const nlohmann::json& result() const { return result_; }
    const std::optional<RpcError>& error() const { return error_; }

private:
    RpcResponse(RpcId id, nlohmann::json result, std::optional<RpcError> error)
        : id_(std::move(id)), result_(std::move(result)), error_(std::move(error)) {}

    RpcId id_;
    nlohmann::json result_;
    std::optional<RpcError> error_;
};

} // namespace apiproxy::rpc
