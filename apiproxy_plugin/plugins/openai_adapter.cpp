#include "openai_adapter.hpp"

#include "json_codec.hpp"
#include "time_util.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <utility>

#include <log4cplus/logger.h>
#include <log4cplus/loggingmacros.h>

namespace apiproxy::plugins {

namespace {

auto& logger() {
    static auto logger = log4cplus::Logger::getInstance("apiproxy_plugin.openai_adapter");
    return logger;
}

bool is_openai_exchange(const ProxyRequest& request) {
    auto it = request.metadata.find("provider");
    return it != request.metadata.end() && it->second == OpenAiAdapter::kProvider;
}

std::string counter_value(const nlohmann::json& usage, const char* key) {
    auto value = codec::find_key(usage, key);
    if (!value || value->is_null()) {
        return "0";
    }
    if (value->is_string()) {
        return value->get<std::string>();
    }
    return codec::dump(*value);
}

} // namespace

ConfigSchema OpenAiAdapter::config_schema() const {
    ConfigSchema schema;
    schema.add("openai_api_key", ConfigType::String, "")
        .add("default_model", ConfigType::String, "gpt-3.5-turbo")
        .add("route_prefix", ConfigType::String, "/v1/openai/");
    return schema;
}

RequestDecision OpenAiAdapter::on_request(const PluginSession& session, ProxyRequest request) {
    const PluginConfig& config = session.config();
    const std::string prefix = config.get_string("route_prefix", "/v1/openai/");
    if (prefix.empty() || request.endpoint.compare(0, prefix.size(), prefix) != 0) {
        return RequestDecision::forward(std::move(request));
    }

    LOG4CPLUS_INFO(logger(), "Processing OpenAI request to " << request.endpoint);

    const std::string api_key = config.get_string("openai_api_key");
    if (!api_key.empty()) {
        request.headers["Authorization"] = "Bearer " + api_key;
    }

    rewrite_endpoint(request, "/v1/" + request.endpoint.substr(prefix.size()));
    request.metadata["provider"] = kProvider;

    if (!request.body.empty()) {
        // ordered_json keeps the client's key order in the rewritten body.
        bool too_deep = false;
        auto body = codec::parse_bounded<nlohmann::ordered_json>(request.body.data, &too_deep);
        if (too_deep) {
            LOG4CPLUS_WARN(logger(), "Request body nests deeper than " << codec::kMaxJsonDepth
                                                                        << " levels, leaving it untouched");
        } else if (body.is_discarded() || !body.is_object()) {
            LOG4CPLUS_WARN(logger(), "Could not parse request body as a JSON object");
        } else {
            if (!body.contains("model")) {
                body["model"] = config.get_string("default_model", "gpt-3.5-turbo");
            }
            if (!body.contains("user")) {
                body["user"] = "apiproxyd-" + today_compact();
            }
            request.body.data = body.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
            LOG4CPLUS_DEBUG(logger(), "Transformed request for model: " << body["model"].dump());
        }
    }

    return RequestDecision::forward(std::move(request));
}

ProxyResponse OpenAiAdapter::on_response(const PluginSession&, const ProxyRequest& request, ProxyResponse response) {
    if (!is_openai_exchange(request)) {
        return response;
    }

    auto body = codec::parse_bounded<nlohmann::json>(response.body.data);
    if (body.is_discarded() || !body.is_object()) {
        LOG4CPLUS_WARN(logger(), "Could not parse response body as a JSON object");
        return response;
    }

    if (auto usage = codec::find_key(body, "usage"); usage && usage->is_object()) {
        response.metadata["tokens_used"] = counter_value(*usage, "total_tokens");
        response.metadata["prompt_tokens"] = counter_value(*usage, "prompt_tokens");
        response.metadata["completion_tokens"] = counter_value(*usage, "completion_tokens");
    }
    if (auto model = codec::find_key(body, "model"); model && model->is_string()) {
        response.metadata["model"] = model->get<std::string>();
    }

    auto tokens = response.metadata.find("tokens_used");
    LOG4CPLUS_INFO(logger(), "Response processed: tokens="
                                 << (tokens != response.metadata.end() ? tokens->second : std::string("unknown")));
    return response;
}

ProxyResponse OpenAiAdapter::on_cache_hit(const PluginSession&, const ProxyRequest& request, ProxyResponse response) {
    if (!is_openai_exchange(request)) {
        return response;
    }

    LOG4CPLUS_INFO(logger(), "Cache HIT for OpenAI request " << request.endpoint);
    response.metadata["cached"] = "true";
    response.metadata["cache_hit_at"] = now_iso();
    return response;
}

void OpenAiAdapter::on_shutdown(const PluginSession&) {
    LOG4CPLUS_INFO(logger(), "Shutting down OpenAI adapter");
}

} // namespace apiproxy::plugins
