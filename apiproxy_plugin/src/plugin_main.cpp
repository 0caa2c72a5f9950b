#include "plugin_main.hpp"

#include "line_transport.hpp"
#include "logger.hpp"
#include "plugin_server.hpp"

#include <log4cplus/initializer.h>
#include <log4cplus/loggingmacros.h>

#include <cstring>
#include <iostream>
#include <string>

#include <signal.h>
#include <sys/prctl.h>
#include <unistd.h>

namespace apiproxy {

int run_plugin_main(int argc, char** argv, Plugin& plugin) {
    log4cplus::Initializer log_initializer;

    bool enable_pdeathsig = false;
    std::string config_path = "log4cplus.ini";

    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            std::cout << plugin.name() << " " << plugin.version() << std::endl;
            std::cout << "Runtime: " << APIPROXY_VERSION_STRING << std::endl;
            std::cout << "Commit: " << APIPROXY_GIT_VERSION_STRING << std::endl;
            std::cout << "Build Time: " << APIPROXY_BUILD_TIMESTAMP << std::endl;
            return 0;
        }

        if (strcmp(argv[i], "--pdeathsig") == 0) {
            enable_pdeathsig = true;
            continue;
        }

        if (strcmp(argv[i], "--log-config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
            continue;
        }

        if (strncmp(argv[i], "--log-config=", 13) == 0) {
            config_path = argv[i] + 13;
            continue;
        }

        std::cerr << "Unknown argument: " << argv[i] << std::endl;
        return 2;
    }

#ifdef __linux__
    if (enable_pdeathsig) {
        prctl(PR_SET_PDEATHSIG, SIGTERM);
        if (getppid() == 1) {
            return 1;
        }
    }
#endif

    // A host that goes away mid-write must surface as a failed write, not a signal.
    signal(SIGPIPE, SIG_IGN);

    init_logging(config_path);

    LOG4CPLUS_INFO(core_logger(), plugin.name() << " " << plugin.version() << " starting");
    LOG4CPLUS_INFO(core_logger(), "Runtime: " << APIPROXY_VERSION_STRING << ", Commit: " << APIPROXY_GIT_VERSION_STRING);
    LOG4CPLUS_INFO(core_logger(), "Build Time: " << APIPROXY_BUILD_TIMESTAMP);
    LOG4CPLUS_INFO(core_logger(), "Parent death signal: " << (enable_pdeathsig ? "enabled" : "disabled"));

    transport::StreamLineTransport transport(std::cin, std::cout);
    PluginServer server(transport, plugin);
    server.run();

    LOG4CPLUS_INFO(core_logger(), plugin.name() << " exiting");
    return 0;
}

} // namespace apiproxy
