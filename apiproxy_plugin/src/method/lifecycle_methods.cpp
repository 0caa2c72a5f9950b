#include "method_base.hpp"
#include "method_registry.hpp"

#include "../logger.hpp"

#include <memory>
#include <utility>

#include <log4cplus/loggingmacros.h>

namespace apiproxy::methods {

class GetInfoMethod final : public MethodHandler {
public:
    const MethodSpec& spec() const override {
        static const MethodSpec spec{"get_info", {}, StateGate::Any};
        return spec;
    }

    CallResult handle(MethodContext& ctx) override {
        return CallResult::success({{"name", ctx.session.name()}, {"version", ctx.session.version()}});
    }
};

class InitMethod final : public MethodHandler {
public:
    const MethodSpec& spec() const override {
        static const MethodSpec spec{"init", {ParamKind::Config}, StateGate::Initializable};
        return spec;
    }

    CallResult handle(MethodContext& ctx) override {
        PluginConfig config;
        std::string error;
        if (!PluginConfig::from_json(ctx.params.config, ctx.plugin.config_schema(), config, error)) {
            LOG4CPLUS_ERROR(hook_logger(), "init rejected: " << error);
            return CallResult::failure(rpc::RpcError::make(rpc::ErrorKind::InvalidParams, "Invalid params: " + error));
        }

        ctx.plugin.on_init(config);

        rpc::RpcError state_error;
        if (!ctx.session.initialize(std::move(config), state_error)) {
            return CallResult::failure(state_error);
        }
        LOG4CPLUS_INFO(hook_logger(), ctx.session.name() << " initialized (init #" << ctx.session.init_count() << ")");
        return CallResult::success(status_ok());
    }
};

class ShutdownMethod final : public MethodHandler {
public:
    const MethodSpec& spec() const override {
        static const MethodSpec spec{"shutdown", {}, StateGate::Ready};
        return spec;
    }

    CallResult handle(MethodContext& ctx) override {
        rpc::RpcError state_error;
        if (!ctx.session.terminate(state_error)) {
            return CallResult::failure(state_error);
        }
        // The session is terminated even if plugin cleanup throws.
        ctx.plugin.on_shutdown(ctx.session);
        LOG4CPLUS_INFO(hook_logger(), ctx.session.name() << " shut down");
        return CallResult::success(status_ok());
    }
};

void register_lifecycle_methods(MethodRegistry& registry) {
    registry.add(std::make_unique<GetInfoMethod>());
    registry.add(std::make_unique<InitMethod>());
    registry.add(std::make_unique<ShutdownMethod>());
}

} // namespace apiproxy::methods
