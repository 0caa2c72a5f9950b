#include <gtest/gtest.h>

#include "host/plugin_chain.hpp"
#include "host/plugin_client.hpp"
#include "host/plugin_process.hpp"
#include "test_helpers.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using apiproxy::host::PluginChain;
using apiproxy::host::PluginClient;
using apiproxy::host::PluginProcess;
using apiproxy::host::PluginProcessConfig;
using apiproxy::host::PluginSpec;

namespace {

PluginProcessConfig adapter_process() {
    return PluginProcessConfig{APIPROXY_OPENAI_ADAPTER_PATH, {"--log-config", APIPROXY_TEST_LOG_CONFIG}};
}

} // namespace

TEST(PluginProcess, SpawnedAdapterServesTheProtocol) {
    auto process = std::make_unique<PluginProcess>(adapter_process());
    EXPECT_TRUE(process->is_alive());

    PluginClient client(std::move(process), std::chrono::milliseconds(5000));
    auto info = client.get_info();
    EXPECT_EQ(info.name, "openai_adapter");
    EXPECT_EQ(info.version, "1.0.0");

    client.init({{"openai_api_key", "K"}});
    auto outcome = client.on_request(test::make_request("POST", "/v1/openai/chat/completions", "{}"));
    EXPECT_TRUE(outcome.proceed);
    EXPECT_EQ(outcome.request.headers["Authorization"], "Bearer K");
    EXPECT_EQ(outcome.request.endpoint, "/v1/chat/completions");
    EXPECT_EQ(outcome.request.metadata["provider"], "openai");

    client.shutdown();
    client.close();
    EXPECT_TRUE(client.failed());
    EXPECT_THROW(client.get_info(), apiproxy::host::PluginCallError);
}

TEST(PluginProcess, ExitsCleanlyWhenInputCloses) {
    PluginProcess process(adapter_process());

    EXPECT_EQ(process.terminate(std::chrono::milliseconds(5000)), 0);
    EXPECT_FALSE(process.is_alive());
}

TEST(PluginProcess, MissingExecutableThrows) {
    EXPECT_THROW({ PluginProcess process(PluginProcessConfig{"/nonexistent/apiproxy-plugin", {}}); },
                 std::runtime_error);
}

TEST(PluginProcess, ChainStartSkipsUnavailablePlugins) {
    PluginSpec missing;
    missing.name = "missing";
    missing.path = "/nonexistent/apiproxy-plugin";

    PluginSpec disabled;
    disabled.name = "disabled";
    disabled.path = APIPROXY_OPENAI_ADAPTER_PATH;
    disabled.enabled = false;

    PluginSpec adapter;
    adapter.name = "openai";
    adapter.path = APIPROXY_OPENAI_ADAPTER_PATH;
    adapter.args = {"--log-config", APIPROXY_TEST_LOG_CONFIG};
    adapter.config = {{"openai_api_key", "K"}};

    PluginChain chain;
    EXPECT_EQ(chain.start({missing, disabled, adapter}), 1u);
    EXPECT_EQ(chain.names(), std::vector<std::string>{"openai"});

    auto outcome = chain.on_request(test::make_request("GET", "/v1/openai/models"));
    EXPECT_EQ(outcome.request.endpoint, "/v1/models");
    chain.shutdown();
}
