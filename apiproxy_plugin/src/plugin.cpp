#include "plugin.hpp"

#include <utility>

namespace apiproxy {

RequestDecision::RequestDecision(ProxyRequest request, std::optional<ProxyResponse> response)
    : request_(std::move(request)), response_(std::move(response)) {}

RequestDecision RequestDecision::forward(ProxyRequest request) {
    return RequestDecision(std::move(request), std::nullopt);
}

RequestDecision RequestDecision::respond(ProxyRequest request, ProxyResponse response) {
    return RequestDecision(std::move(request), std::move(response));
}

void Plugin::on_init(const PluginConfig&) {}

RequestDecision Plugin::on_request(const PluginSession&, ProxyRequest request) {
    return RequestDecision::forward(std::move(request));
}

ProxyResponse Plugin::on_response(const PluginSession&, const ProxyRequest&, ProxyResponse response) {
    return response;
}

ProxyResponse Plugin::on_cache_hit(const PluginSession&, const ProxyRequest&, ProxyResponse response) {
    return response;
}

void Plugin::on_shutdown(const PluginSession&) {}

} // namespace apiproxy
