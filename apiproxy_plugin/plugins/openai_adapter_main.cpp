#include "openai_adapter.hpp"
#include "plugin_main.hpp"

int main(int argc, char** argv) {
    apiproxy::plugins::OpenAiAdapter plugin;
    return apiproxy::run_plugin_main(argc, argv, plugin);
}
