#pragma once

#include "plugin.hpp"

namespace apiproxy::plugins {

/**
 * Routes /v1/openai/... requests to the OpenAI API: injects the bearer token,
 * strips the routing prefix, fills request defaults and records token usage
 * from responses.
 */
class OpenAiAdapter final : public Plugin {
public:
    static constexpr const char* kProvider = "openai";

    const char* name() const override { return "openai_adapter"; }
    const char* version() const override { return "1.0.0"; }

    ConfigSchema config_schema() const override;

    RequestDecision on_request(const PluginSession& session, ProxyRequest request) override;
    ProxyResponse on_response(const PluginSession& session, const ProxyRequest& request,
                              ProxyResponse response) override;
    ProxyResponse on_cache_hit(const PluginSession& session, const ProxyRequest& request,
                               ProxyResponse response) override;
    void on_shutdown(const PluginSession& session) override;
};

} // namespace apiproxy::plugins
