#pragma once

#include "plugin_config.hpp"
#include "protocol.hpp"

#include <string>

namespace apiproxy {

enum class SessionState {
    Uninitialized,
    Ready,
    Terminated,
};

const char* to_string(SessionState state);

/**
 * Lifecycle state and configuration of the one plugin hosted by this process.
 * Created once at startup and passed explicitly into every dispatch; calls are
 * strictly sequential so it carries no locking.
 *
 * Uninitialized --init--> Ready --init--> Ready --shutdown--> Terminated
 */
class PluginSession {
public:
    PluginSession(std::string name, std::string version);

    const std::string& name() const { return name_; }
    const std::string& version() const { return version_; }
    SessionState state() const { return state_; }
    const PluginConfig& config() const { return config_; }
    unsigned init_count() const { return init_count_; }

    /// Exchange hooks require Ready.
    bool require_ready(rpc::RpcError& error) const;

    /// init is accepted until the session is terminated.
    bool can_initialize(rpc::RpcError& error) const;

    /// Moves to Ready, replacing any previous configuration.
    bool initialize(PluginConfig config, rpc::RpcError& error);

    /// Ready -> Terminated; fails in any other state.
    bool terminate(rpc::RpcError& error);

private:
    std::string name_;
    std::string version_;
    SessionState state_ = SessionState::Uninitialized;
    PluginConfig config_;
    unsigned init_count_ = 0;
};

} // namespace apiproxy
