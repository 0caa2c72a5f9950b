#include "method_base.hpp"
#include "method_registry.hpp"

#include "../logger.hpp"

#include <memory>
#include <utility>

#include <log4cplus/loggingmacros.h>

namespace apiproxy::methods {

class OnRequestMethod final : public MethodHandler {
public:
    const MethodSpec& spec() const override {
        static const MethodSpec spec{"on_request", {ParamKind::EncodedRequest}, StateGate::Ready};
        return spec;
    }

    CallResult handle(MethodContext& ctx) override {
        const ProxyRequest& original = *ctx.params.request;
        LOG4CPLUS_DEBUG(hook_logger(), "on_request " << original.method << " " << original.endpoint);

        RequestDecision decision = ctx.plugin.on_request(ctx.session, original);
        reconcile(original, decision.request());

        nlohmann::json result = nlohmann::json::object();
        result["request"] = to_json(decision.request());
        result["continue"] = decision.should_continue();
        if (!decision.should_continue()) {
            LOG4CPLUS_INFO(hook_logger(), "on_request short-circuited " << original.endpoint << " with status "
                                                                       << decision.response()->status_code);
            result["response"] = to_json(*decision.response());
        }
        return CallResult::success(std::move(result));
    }
};

/// on_response and on_cache_hit share signature and merge rules.
class ResponseHookMethod : public MethodHandler {
public:
    CallResult handle(MethodContext& ctx) override {
        const ProxyRequest& request = *ctx.params.request;
        const ProxyResponse& original = *ctx.params.response;
        LOG4CPLUS_DEBUG(hook_logger(), name() << " " << request.endpoint << " status=" << original.status_code);

        ProxyResponse mutated = invoke(ctx, request, original);
        reconcile(original, mutated);
        return CallResult::success(to_json(mutated));
    }

protected:
    virtual ProxyResponse invoke(MethodContext& ctx, const ProxyRequest& request, const ProxyResponse& response) = 0;
};

class OnResponseMethod final : public ResponseHookMethod {
public:
    const MethodSpec& spec() const override {
        static const MethodSpec spec{
            "on_response", {ParamKind::EncodedRequest, ParamKind::EncodedResponse}, StateGate::Ready};
        return spec;
    }

protected:
    ProxyResponse invoke(MethodContext& ctx, const ProxyRequest& request, const ProxyResponse& response) override {
        return ctx.plugin.on_response(ctx.session, request, response);
    }
};

class OnCacheHitMethod final : public ResponseHookMethod {
public:
    const MethodSpec& spec() const override {
        static const MethodSpec spec{
            "on_cache_hit", {ParamKind::EncodedRequest, ParamKind::EncodedResponse}, StateGate::Ready};
        return spec;
    }

protected:
    ProxyResponse invoke(MethodContext& ctx, const ProxyRequest& request, const ProxyResponse& response) override {
        return ctx.plugin.on_cache_hit(ctx.session, request, response);
    }
};

void register_exchange_methods(MethodRegistry& registry) {
    registry.add(std::make_unique<OnRequestMethod>());
    registry.add(std::make_unique<OnResponseMethod>());
    registry.add(std::make_unique<OnCacheHitMethod>());
}

} // namespace apiproxy::methods
