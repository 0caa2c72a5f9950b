#pragma once

#include "line_transport.hpp"
#include "plugin.hpp"
#include "session.hpp"

#include <cstddef>

namespace apiproxy {

/**
 * Single-threaded serve loop: read one call, answer it, flush, repeat.
 * There is never more than one call in flight, so the session is touched by
 * exactly one caller.
 */
class PluginServer {
public:
    PluginServer(transport::LineTransport& transport, Plugin& plugin);

    /// Serves until the input stream ends or the reply channel breaks.
    std::size_t run();

    /// Handles one input line. Returns false at end of stream or on a failed write.
    bool serve_one();

    const PluginSession& session() const { return session_; }
    std::size_t replies_sent() const { return replies_; }

private:
    transport::LineTransport& transport_;
    Plugin& plugin_;
    PluginSession session_;
    std::size_t replies_ = 0;
};

} // namespace apiproxy
