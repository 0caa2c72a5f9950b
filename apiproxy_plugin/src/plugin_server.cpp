#include "plugin_server.hpp"

#include "logger.hpp"
#include "method/dispatch.hpp"

#include <optional>
#include <string>

#include <log4cplus/loggingmacros.h>

namespace apiproxy {

PluginServer::PluginServer(transport::LineTransport& transport, Plugin& plugin)
    : transport_(transport), plugin_(plugin), session_(plugin.name(), plugin.version()) {}

bool PluginServer::serve_one() {
    std::string line;
    if (!transport_.read_line(line)) {
        return false;
    }

    std::optional<std::string> reply;
    if (transport_.line_truncated()) {
        reply = methods::reject_oversized_line(line);
    } else {
        reply = methods::handle_line(line, session_, plugin_);
    }
    if (!reply) {
        return true;
    }
    if (!transport_.write_line(*reply)) {
        LOG4CPLUS_ERROR(core_logger(), "Failed to write reply, host channel closed");
        return false;
    }
    ++replies_;
    return true;
}

std::size_t PluginServer::run() {
    LOG4CPLUS_INFO(core_logger(), session_.name() << " " << session_.version() << " serving");
    while (serve_one()) {
    }
    LOG4CPLUS_INFO(core_logger(), session_.name() << " input closed after " << replies_ << " replies (state "
                                                  << to_string(session_.state()) << ")");
    return replies_;
}

} // namespace apiproxy
