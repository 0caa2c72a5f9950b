#pragma once

#include "method_base.hpp"

#include "../plugin.hpp"
#include "../protocol.hpp"
#include "../session.hpp"

#include <optional>
#include <string>

namespace apiproxy::methods {

/// Routes one decoded call. Never throws: every failure becomes an error response.
rpc::RpcResponse dispatch(const rpc::RpcRequest& call, PluginSession& session, Plugin& plugin);

/**
 * Decodes, dispatches and encodes one input line. Returns the reply line, or
 * nullopt for a blank line (nothing to answer).
 */
std::optional<std::string> handle_line(const std::string& line, PluginSession& session, Plugin& plugin);

/// Error reply for a line cut short by the transport; the id is recovered from the kept prefix when possible.
std::string reject_oversized_line(const std::string& prefix);

/// Call schema of a built-in method, or nullptr when the name is unknown.
const MethodSpec* find_method_spec(const std::string& method);

} // namespace apiproxy::methods
