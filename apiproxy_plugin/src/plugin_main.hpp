#pragma once

#include "plugin.hpp"

namespace apiproxy {

/**
 * Entry point shared by plugin executables: parses the command line,
 * configures logging and serves JSON-RPC on stdin/stdout until the host
 * closes the pipe.
 *
 *   <plugin> [--log-config <path>] [--pdeathsig] [-v|--version]
 */
int run_plugin_main(int argc, char** argv, Plugin& plugin);

} // namespace apiproxy
