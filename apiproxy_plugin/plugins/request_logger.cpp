#include "request_logger.hpp"

#include "json_codec.hpp"
#include "time_util.hpp"

#include <stdexcept>
#include <string>
#include <utility>

#include <log4cplus/logger.h>
#include <log4cplus/loggingmacros.h>

namespace apiproxy::plugins {

namespace {

auto& logger() {
    static auto logger = log4cplus::Logger::getInstance("apiproxy_plugin.request_logger");
    return logger;
}

constexpr const char* kBlockedBody = "{\"error\":\"blocked by request_logger\"}";

} // namespace

ConfigSchema RequestLogger::config_schema() const {
    ConfigSchema schema;
    schema.add("header_name", ConfigType::String, "X-Plugin-Logger")
        .add("log_bodies", ConfigType::Bool, false)
        .add("block_endpoints", ConfigType::Object, nlohmann::json::object());
    return schema;
}

void RequestLogger::on_init(const PluginConfig& config) {
    if (config.get_string("header_name").empty()) {
        throw std::invalid_argument("header_name must not be empty");
    }

    const nlohmann::json& blocked = config.get("block_endpoints");
    for (auto it = blocked.begin(); it != blocked.end(); ++it) {
        int64_t status = codec::as_int64(it.value(), 0);
        if (status < 100 || status > 599) {
            throw std::invalid_argument("block_endpoints." + it.key() + " must be an HTTP status code");
        }
    }
    LOG4CPLUS_INFO(logger(), "Initialized with config: " << codec::dump(config.to_json()));
}

RequestDecision RequestLogger::on_request(const PluginSession& session, ProxyRequest request) {
    const PluginConfig& config = session.config();
    LOG4CPLUS_INFO(logger(), request.method << " Request to " << request.endpoint << " at " << now_iso());
    if (config.get_bool("log_bodies") && !request.body.empty()) {
        LOG4CPLUS_DEBUG(logger(), "Request body: " << request.body.data);
    }

    if (auto status = codec::find_key(config.get("block_endpoints"), request.endpoint)) {
        LOG4CPLUS_WARN(logger(), "Blocking " << request.endpoint << " with status " << codec::dump(*status));
        ProxyResponse blocked;
        blocked.status_code = static_cast<int>(codec::as_int64(*status, 403));
        blocked.headers["Content-Type"] = "application/json";
        blocked.body.data = kBlockedBody;
        blocked.metadata["blocked_by"] = name();
        return RequestDecision::respond(std::move(request), std::move(blocked));
    }

    request.headers[config.get_string("header_name", "X-Plugin-Logger")] = "enabled";
    return RequestDecision::forward(std::move(request));
}

ProxyResponse RequestLogger::on_response(const PluginSession& session, const ProxyRequest& request,
                                         ProxyResponse response) {
    LOG4CPLUS_INFO(logger(), "Response from " << request.endpoint << ": status=" << response.status_code
                                              << ", size=" << response.body.data.size() << " bytes");
    if (session.config().get_bool("log_bodies") && !response.body.empty()) {
        LOG4CPLUS_DEBUG(logger(), "Response body: " << response.body.data);
    }
    response.metadata["logged_at"] = now_iso();
    return response;
}

ProxyResponse RequestLogger::on_cache_hit(const PluginSession&, const ProxyRequest& request, ProxyResponse response) {
    LOG4CPLUS_INFO(logger(), "Cache HIT for " << request.method << " " << request.endpoint);
    return response;
}

void RequestLogger::on_shutdown(const PluginSession& session) {
    LOG4CPLUS_INFO(logger(), "Shutting down after init #" << session.init_count());
}

} // namespace apiproxy::plugins
