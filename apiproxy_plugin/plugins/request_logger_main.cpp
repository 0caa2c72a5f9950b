#include "plugin_main.hpp"
#include "request_logger.hpp"

int main(int argc, char** argv) {
    apiproxy::plugins::RequestLogger plugin;
    return apiproxy::run_plugin_main(argc, argv, plugin);
}
