#pragma once

#include "plugin_process.hpp"

#include "../line_transport.hpp"
#include "../proxy_types.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>

namespace apiproxy::host {

class PluginCallError : public std::runtime_error {
public:
    enum class Kind {
        Transport, // pipe closed or write failed
        Timeout,
        Protocol,  // malformed reply or id mismatch
        Remote,    // plugin answered with an error
    };

    PluginCallError(Kind kind, const std::string& message) : std::runtime_error(message), kind_(kind) {}

    Kind kind() const { return kind_; }

private:
    Kind kind_;
};

struct PluginInfo {
    std::string name;
    std::string version;
};

/// Host view of an on_request reply.
struct RequestOutcome {
    ProxyRequest request;
    bool proceed = true;
    std::optional<ProxyResponse> response; // set when the plugin short-circuited
};

/**
 * Lock-step JSON-RPC client for one plugin process: one call written, one
 * reply read, never overlapping. A timeout or a desynchronized reply marks the
 * client failed for good, since a late reply would be paired with the wrong call.
 */
class PluginClient {
public:
    PluginClient(std::unique_ptr<PluginProcess> process, std::chrono::milliseconds timeout);

    /// Talks over existing descriptors (an in-process server, a socketpair). Does not own them.
    PluginClient(int read_fd, int write_fd, std::chrono::milliseconds timeout);

    ~PluginClient();

    PluginClient(const PluginClient&) = delete;
    PluginClient& operator=(const PluginClient&) = delete;

    /// Sends one call and returns its result. Throws PluginCallError.
    nlohmann::json call(const std::string& method, nlohmann::json params);

    PluginInfo get_info();
    void init(const nlohmann::json& config);
    RequestOutcome on_request(const ProxyRequest& request);
    ProxyResponse on_response(const ProxyRequest& request, const ProxyResponse& response);
    ProxyResponse on_cache_hit(const ProxyRequest& request, const ProxyResponse& response);
    void shutdown();

    /// Closes the plugin's input and reaps it. Any later call fails with a Transport error.
    void close();

    bool failed() const { return failed_.load(); }
    std::chrono::milliseconds timeout() const { return timeout_; }

private:
    ProxyResponse response_hook(const char* method, const ProxyRequest& request, const ProxyResponse& response);
    [[noreturn]] void fail(PluginCallError::Kind kind, const std::string& message);

    std::unique_ptr<PluginProcess> process_;
    transport::FdLineTransport transport_;
    std::chrono::milliseconds timeout_;
    std::mutex mutex_;
    int64_t next_id_ = 0;
    std::atomic<bool> failed_{false};
    bool closed_ = false;
};

} // namespace apiproxy::host
