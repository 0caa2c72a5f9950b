#pragma once

#include "plugin_client.hpp"

#include "../proxy_types.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace apiproxy::host {

struct PluginSpec {
    std::string name;
    std::string path;
    std::vector<std::string> args;
    bool enabled = true;
    nlohmann::json config = nlohmann::json::object();
    std::chrono::milliseconds timeout{5000};
};

/**
 * Ordered set of running plugins as the daemon sees them. A plugin that fails
 * a call is logged and bypassed for that exchange; the value it was handed
 * moves on to the next plugin un-mutated.
 */
class PluginChain {
public:
    PluginChain() = default;
    ~PluginChain();

    PluginChain(const PluginChain&) = delete;
    PluginChain& operator=(const PluginChain&) = delete;

    /// Spawns, identifies and initializes each enabled spec. Returns how many started.
    size_t start(const std::vector<PluginSpec>& specs);

    /// Adds an already connected client. get_info and init are the caller's business.
    void add(std::string name, std::unique_ptr<PluginClient> client);

    /// Runs on_request through the chain; the first short-circuit ends it.
    RequestOutcome on_request(ProxyRequest request);
    ProxyResponse on_response(const ProxyRequest& request, ProxyResponse response);
    ProxyResponse on_cache_hit(const ProxyRequest& request, ProxyResponse response);

    /// Sends shutdown to every plugin and reaps them. Errors are only logged.
    void shutdown();

    size_t size() const { return entries_.size(); }
    std::vector<std::string> names() const;

private:
    struct Entry {
        std::string name;
        std::unique_ptr<PluginClient> client;
    };

    template <typename Hook>
    ProxyResponse fold_responses(const char* hook, const ProxyRequest& request, ProxyResponse response, Hook&& invoke);

    std::vector<Entry> entries_;
};

} // namespace apiproxy::host
