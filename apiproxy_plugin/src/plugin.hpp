#pragma once

#include "plugin_config.hpp"
#include "proxy_types.hpp"
#include "session.hpp"

#include <optional>

namespace apiproxy {

/**
 * Outcome of on_request. forward() lets the host continue with the (possibly
 * rewritten) request; respond() short-circuits the exchange and must carry the
 * synthetic response the host returns instead of calling upstream.
 */
class RequestDecision {
public:
    static RequestDecision forward(ProxyRequest request);
    static RequestDecision respond(ProxyRequest request, ProxyResponse response);

    bool should_continue() const { return !response_.has_value(); }
    const ProxyRequest& request() const { return request_; }
    ProxyRequest& request() { return request_; }
    const std::optional<ProxyResponse>& response() const { return response_; }
    std::optional<ProxyResponse>& response() { return response_; }

private:
    RequestDecision(ProxyRequest request, std::optional<ProxyResponse> response);

    ProxyRequest request_;
    std::optional<ProxyResponse> response_;
};

/**
 * Hook implementation hosted by the runtime. Hooks may throw; the dispatcher
 * converts any exception into an error reply. All per-process state a hook
 * needs lives in the session it is handed.
 */
class Plugin {
public:
    virtual ~Plugin() = default;

    virtual const char* name() const = 0;
    virtual const char* version() const = 0;

    virtual ConfigSchema config_schema() const { return ConfigSchema{}; }

    /// Called with the validated configuration before the session accepts it.
    virtual void on_init(const PluginConfig& config);

    virtual RequestDecision on_request(const PluginSession& session, ProxyRequest request);
    virtual ProxyResponse on_response(const PluginSession& session, const ProxyRequest& request,
                                      ProxyResponse response);
    virtual ProxyResponse on_cache_hit(const PluginSession& session, const ProxyRequest& request,
                                       ProxyResponse response);
    virtual void on_shutdown(const PluginSession& session);
};

} // namespace apiproxy
