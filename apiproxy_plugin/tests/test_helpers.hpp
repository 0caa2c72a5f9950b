#pragma once

#include "plugin.hpp"
#include "plugin_config.hpp"
#include "proxy_types.hpp"
#include "session.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <string>
#include <vector>

namespace test {

/// Plugin whose hooks are supplied by the test; unset hooks fall back to identity.
class ScriptedPlugin : public apiproxy::Plugin {
public:
    std::function<void(const apiproxy::PluginConfig&)> init_hook;
    std::function<apiproxy::RequestDecision(const apiproxy::PluginSession&, apiproxy::ProxyRequest)> request_hook;
    std::function<apiproxy::ProxyResponse(const apiproxy::PluginSession&, const apiproxy::ProxyRequest&,
                                          apiproxy::ProxyResponse)>
        response_hook;
    std::function<apiproxy::ProxyResponse(const apiproxy::PluginSession&, const apiproxy::ProxyRequest&,
                                          apiproxy::ProxyResponse)>
        cache_hit_hook;
    apiproxy::ConfigSchema schema;
    int shutdown_calls = 0;

    const char* name() const override { return "scripted"; }
    const char* version() const override { return "0.1.0"; }
    apiproxy::ConfigSchema config_schema() const override { return schema; }

    void on_init(const apiproxy::PluginConfig& config) override;
    apiproxy::RequestDecision on_request(const apiproxy::PluginSession& session,
                                         apiproxy::ProxyRequest request) override;
    apiproxy::ProxyResponse on_response(const apiproxy::PluginSession& session, const apiproxy::ProxyRequest& request,
                                        apiproxy::ProxyResponse response) override;
    apiproxy::ProxyResponse on_cache_hit(const apiproxy::PluginSession& session, const apiproxy::ProxyRequest& request,
                                         apiproxy::ProxyResponse response) override;
    void on_shutdown(const apiproxy::PluginSession& session) override;
};

/// Builds one call line: {"jsonrpc":"2.0","method":...,"params":...,"id":<raw_id>}.
std::string call_line(const std::string& method, const nlohmann::json& params, const std::string& raw_id = "1");

/// Runs one line through the dispatcher and parses the reply.
nlohmann::json call(apiproxy::PluginSession& session, apiproxy::Plugin& plugin, const std::string& method,
                    const nlohmann::json& params = nlohmann::json::array(), const std::string& raw_id = "1");

std::string error_message(const nlohmann::json& reply);
bool is_error(const nlohmann::json& reply);

apiproxy::ProxyRequest make_request(const std::string& method, const std::string& endpoint,
                                    const std::string& body = "");
apiproxy::ProxyResponse make_response(int status_code, const std::string& body = "");

std::vector<std::string> split_lines(const std::string& text);

} // namespace test
