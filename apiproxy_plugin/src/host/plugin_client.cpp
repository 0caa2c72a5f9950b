#include "plugin_client.hpp"

#include "../json_codec.hpp"
#include "../logger.hpp"

#include <utility>

#include <log4cplus/loggingmacros.h>

namespace apiproxy::host {

PluginClient::PluginClient(std::unique_ptr<PluginProcess> process, std::chrono::milliseconds timeout)
    : process_(std::move(process)),
      transport_(process_->stdout_fd(), process_->stdin_fd()),
      timeout_(timeout) {}

PluginClient::PluginClient(int read_fd, int write_fd, std::chrono::milliseconds timeout)
    : transport_(read_fd, write_fd), timeout_(timeout) {}

PluginClient::~PluginClient() {
    close();
}

void PluginClient::fail(PluginCallError::Kind kind, const std::string& message) {
    if (kind != PluginCallError::Kind::Remote) {
        failed_ = true;
    }
    throw PluginCallError(kind, message);
}

nlohmann::json PluginClient::call(const std::string& method, nlohmann::json params) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        throw PluginCallError(PluginCallError::Kind::Transport, "plugin connection is closed");
    }
    if (failed_) {
        throw PluginCallError(PluginCallError::Kind::Transport, "plugin is unavailable after an earlier failure");
    }

    rpc::RpcRequest request;
    request.method = method;
    request.params = std::move(params);
    request.id.raw = std::to_string(++next_id_);

    LOG4CPLUS_DEBUG(host_logger(), "-> " << method << " id=" << request.id.raw);
    if (!transport_.write_line(codec::encode_request(request))) {
        fail(PluginCallError::Kind::Transport, "failed to write " + method + " call");
    }

    std::string line;
    transport::ReadStatus status = transport_.read_line_for(line, timeout_);
    if (status == transport::ReadStatus::Timeout) {
        fail(PluginCallError::Kind::Timeout,
             method + " timed out after " + std::to_string(timeout_.count()) + "ms");
    }
    if (status != transport::ReadStatus::Line) {
        fail(PluginCallError::Kind::Transport,
             std::string("plugin closed connection (") + transport::to_string(status) + ")");
    }

    rpc::RpcResponse response = rpc::RpcResponse::success(rpc::RpcId{}, nullptr);
    try {
        response = codec::decode_response(line);
    } catch (const codec::CodecError& exc) {
        fail(PluginCallError::Kind::Protocol, std::string("failed to parse reply: ") + exc.what());
    }

    if (response.id() != request.id) {
        fail(PluginCallError::Kind::Protocol,
             "reply id " + response.id().wire() + " does not match call id " + request.id.raw);
    }
    if (!response.ok()) {
        const auto& error = *response.error();
        fail(PluginCallError::Kind::Remote,
             "plugin error: " + error.message + " (code " + std::to_string(error.code) + ")");
    }
    return response.result();
}

PluginInfo PluginClient::get_info() {
    nlohmann::json result = call("get_info", nlohmann::json::array());
    PluginInfo info;
    if (auto name = codec::find_key(result, "name")) {
        info.name = codec::as_string(*name, "");
    }
    if (auto version = codec::find_key(result, "version")) {
        info.version = codec::as_string(*version, "");
    }
    if (info.name.empty()) {
        fail(PluginCallError::Kind::Protocol, "get_info returned no name");
    }
    return info;
}

void PluginClient::init(const nlohmann::json& config) {
    call("init", nlohmann::json::array({config.is_null() ? nlohmann::json::object() : config}));
}

RequestOutcome PluginClient::on_request(const ProxyRequest& request) {
    nlohmann::json result = call("on_request", nlohmann::json::array({encode_proxy_request(request)}));

    RequestOutcome outcome;
    std::string error;
    auto request_obj = codec::find_key(result, "request");
    if (!request_obj || !parse_proxy_request(*request_obj, outcome.request, error)) {
        fail(PluginCallError::Kind::Protocol, "on_request returned an invalid request: " + error);
    }
    auto continue_obj = codec::find_key(result, "continue");
    if (!continue_obj || !continue_obj->is_boolean()) {
        fail(PluginCallError::Kind::Protocol, "on_request returned no continue flag");
    }
    outcome.proceed = continue_obj->get<bool>();

    if (!outcome.proceed) {
        ProxyResponse response;
        auto response_obj = codec::find_key(result, "response");
        if (!response_obj || !parse_proxy_response(*response_obj, response, error)) {
            fail(PluginCallError::Kind::Protocol, "short-circuit without a valid response: " + error);
        }
        outcome.response = std::move(response);
    }
    return outcome;
}

ProxyResponse PluginClient::response_hook(const char* method, const ProxyRequest& request,
                                          const ProxyResponse& response) {
    nlohmann::json result =
        call(method, nlohmann::json::array({encode_proxy_request(request), encode_proxy_response(response)}));

    ProxyResponse mutated;
    std::string error;
    if (!parse_proxy_response(result, mutated, error)) {
        fail(PluginCallError::Kind::Protocol, std::string(method) + " returned an invalid response: " + error);
    }
    return mutated;
}

ProxyResponse PluginClient::on_response(const ProxyRequest& request, const ProxyResponse& response) {
    return response_hook("on_response", request, response);
}

ProxyResponse PluginClient::on_cache_hit(const ProxyRequest& request, const ProxyResponse& response) {
    return response_hook("on_cache_hit", request, response);
}

void PluginClient::shutdown() {
    call("shutdown", nlohmann::json::array());
}

void PluginClient::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    // The descriptors are gone (or no longer ours) after this point.
    closed_ = true;
    failed_ = true;
    if (process_) {
        int status = process_->terminate(std::chrono::milliseconds(2000));
        LOG4CPLUS_DEBUG(host_logger(), "Plugin " << process_->executable() << " exited with status " << status);
        process_.reset();
    }
}

} // namespace apiproxy::host
