#include "session.hpp"

#include "logger.hpp"

#include <utility>

#include <log4cplus/loggingmacros.h>

namespace apiproxy {

namespace {

rpc::RpcError state_error(const char* message) {
    return rpc::RpcError::make(rpc::ErrorKind::StateError, message);
}

} // namespace

const char* to_string(SessionState state) {
    switch (state) {
        case SessionState::Uninitialized:
            return "uninitialized";
        case SessionState::Ready:
            return "ready";
        case SessionState::Terminated:
            return "terminated";
    }
    return "unknown";
}

PluginSession::PluginSession(std::string name, std::string version)
    : name_(std::move(name)), version_(std::move(version)) {}

bool PluginSession::require_ready(rpc::RpcError& error) const {
    switch (state_) {
        case SessionState::Ready:
            return true;
        case SessionState::Uninitialized:
            error = state_error("not initialized");
            return false;
        case SessionState::Terminated:
            error = state_error("already shut down");
            return false;
    }
    return false;
}

bool PluginSession::can_initialize(rpc::RpcError& error) const {
    if (state_ == SessionState::Terminated) {
        error = state_error("already shut down");
        return false;
    }
    return true;
}

bool PluginSession::initialize(PluginConfig config, rpc::RpcError& error) {
    if (!can_initialize(error)) {
        return false;
    }
    if (state_ == SessionState::Ready) {
        LOG4CPLUS_INFO(core_logger(), name_ << ": re-init replaces previous configuration");
    }
    config_ = std::move(config);
    state_ = SessionState::Ready;
    ++init_count_;
    return true;
}

bool PluginSession::terminate(rpc::RpcError& error) {
    if (!require_ready(error)) {
        return false;
    }
    state_ = SessionState::Terminated;
    return true;
}

} // namespace apiproxy
