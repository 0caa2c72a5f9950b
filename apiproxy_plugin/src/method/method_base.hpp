#pragma once

#include "../plugin.hpp"
#include "../protocol.hpp"
#include "../proxy_types.hpp"
#include "../session.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace apiproxy::methods {

enum class ParamKind {
    Config,          // JSON object (null accepted as empty)
    EncodedRequest,  // ProxyRequest as encoded JSON text
    EncodedResponse, // ProxyResponse as encoded JSON text
};

enum class StateGate {
    Any,
    Initializable, // anything but Terminated
    Ready,
};

struct MethodSpec {
    const char* name;
    std::vector<ParamKind> params;
    StateGate gate;
};

/// Params decoded and type-checked against a MethodSpec before the handler runs.
struct DecodedParams {
    nlohmann::json config = nlohmann::json::object();
    std::optional<ProxyRequest> request;
    std::optional<ProxyResponse> response;
};

struct MethodContext {
    const rpc::RpcRequest& call;
    PluginSession& session;
    Plugin& plugin;
    DecodedParams& params;
};

struct CallResult {
    nlohmann::json result;
    std::optional<rpc::RpcError> error;

    bool ok() const { return !error.has_value(); }

    static CallResult success(nlohmann::json result);
    static CallResult failure(rpc::RpcError error);
};

class MethodHandler {
public:
    virtual ~MethodHandler() = default;
    virtual const MethodSpec& spec() const = 0;
    virtual CallResult handle(MethodContext& ctx) = 0;

    const char* name() const { return spec().name; }

protected:
    static nlohmann::json status_ok();

    /// Keeps the host's metadata and body representation; the hook's keys win on collision.
    static void reconcile(const ProxyRequest& before, ProxyRequest& after);
    static void reconcile(const ProxyResponse& before, ProxyResponse& after);
};

} // namespace apiproxy::methods
