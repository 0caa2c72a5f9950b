#include "plugin_chain.hpp"

#include "../logger.hpp"

#include <utility>

#include <log4cplus/loggingmacros.h>

namespace apiproxy::host {

PluginChain::~PluginChain() {
    shutdown();
}

size_t PluginChain::start(const std::vector<PluginSpec>& specs) {
    size_t started = 0;
    for (const auto& spec : specs) {
        if (!spec.enabled) {
            LOG4CPLUS_DEBUG(host_logger(), "Plugin " << spec.name << " disabled, skipping");
            continue;
        }

        try {
            auto process = std::make_unique<PluginProcess>(PluginProcessConfig{spec.path, spec.args});
            auto client = std::make_unique<PluginClient>(std::move(process), spec.timeout);
            PluginInfo info = client->get_info();
            client->init(spec.config);
            LOG4CPLUS_INFO(host_logger(), "Loaded plugin " << spec.name << " (" << info.name << " " << info.version
                                                           << ")");
            entries_.push_back(Entry{spec.name, std::move(client)});
            ++started;
        } catch (const std::exception& exc) {
            LOG4CPLUS_ERROR(host_logger(), "Plugin " << spec.name << " unavailable: " << exc.what());
        }
    }
    return started;
}

void PluginChain::add(std::string name, std::unique_ptr<PluginClient> client) {
    if (!client) {
        return;
    }
    entries_.push_back(Entry{std::move(name), std::move(client)});
}

RequestOutcome PluginChain::on_request(ProxyRequest request) {
    for (auto& entry : entries_) {
        if (entry.client->failed()) {
            continue;
        }
        try {
            RequestOutcome outcome = entry.client->on_request(request);
            if (!outcome.proceed) {
                LOG4CPLUS_INFO(host_logger(), "Plugin " << entry.name << " short-circuited " << request.endpoint);
                return outcome;
            }
            request = std::move(outcome.request);
        } catch (const PluginCallError& exc) {
            LOG4CPLUS_WARN(host_logger(), "Plugin " << entry.name << " on_request failed, bypassing: " << exc.what());
        }
    }

    RequestOutcome outcome;
    outcome.request = std::move(request);
    outcome.proceed = true;
    return outcome;
}

template <typename Hook>
ProxyResponse PluginChain::fold_responses(const char* hook, const ProxyRequest& request, ProxyResponse response,
                                          Hook&& invoke) {
    for (auto& entry : entries_) {
        if (entry.client->failed()) {
            continue;
        }
        try {
            response = invoke(*entry.client, request, response);
        } catch (const PluginCallError& exc) {
            LOG4CPLUS_WARN(host_logger(), "Plugin " << entry.name << " " << hook << " failed, bypassing: "
                                                    << exc.what());
        }
    }
    return response;
}

ProxyResponse PluginChain::on_response(const ProxyRequest& request, ProxyResponse response) {
    return fold_responses("on_response", request, std::move(response),
                          [](PluginClient& client, const ProxyRequest& req, const ProxyResponse& resp) {
                              return client.on_response(req, resp);
                          });
}

ProxyResponse PluginChain::on_cache_hit(const ProxyRequest& request, ProxyResponse response) {
    return fold_responses("on_cache_hit", request, std::move(response),
                          [](PluginClient& client, const ProxyRequest& req, const ProxyResponse& resp) {
                              return client.on_cache_hit(req, resp);
                          });
}

void PluginChain::shutdown() {
    for (auto& entry : entries_) {
        if (!entry.client->failed()) {
            try {
                entry.client->shutdown();
            } catch (const PluginCallError& exc) {
                LOG4CPLUS_WARN(host_logger(), "Plugin " << entry.name << " shutdown failed: " << exc.what());
            }
        }
        entry.client->close();
    }
    entries_.clear();
}

std::vector<std::string> PluginChain::names() const {
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto& entry : entries_) {
        out.push_back(entry.name);
    }
    return out;
}

} // namespace apiproxy::host
