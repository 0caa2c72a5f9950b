#pragma once

#include "plugin.hpp"

namespace apiproxy::plugins {

/**
 * Logs every exchange, tags forwarded requests with a marker header and can
 * short-circuit configured endpoints with a fixed status.
 */
class RequestLogger final : public Plugin {
public:
    const char* name() const override { return "request_logger"; }
    const char* version() const override { return "1.0.0"; }

    ConfigSchema config_schema() const override;
    void on_init(const PluginConfig& config) override;

    RequestDecision on_request(const PluginSession& session, ProxyRequest request) override;
    ProxyResponse on_response(const PluginSession& session, const ProxyRequest& request,
                              ProxyResponse response) override;
    ProxyResponse on_cache_hit(const PluginSession& session, const ProxyRequest& request,
                               ProxyResponse response) override;
    void on_shutdown(const PluginSession& session) override;
};

} // namespace apiproxy::plugins
