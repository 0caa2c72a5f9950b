#include "dispatch.hpp"

#include "method_registry.hpp"

#include "../json_codec.hpp"
#include "../logger.hpp"

#include <string>
#include <utility>
#include <vector>

#include <log4cplus/loggingmacros.h>

namespace apiproxy::methods {

namespace {

MethodRegistry& get_registry() {
	static MethodRegistry registry = [] {
		MethodRegistry reg;
		register_lifecycle_methods(reg);
		register_exchange_methods(reg);
		return reg;
	}();

	return registry;
}

std::string join_names(const std::vector<std::string>& names) {
	std::string out;
	for (const auto& name : names) {
		if (!out.empty()) {
			out += ", ";
		}
		out += name;
	}
	return out;
}

rpc::RpcError invalid_params(const std::string& message) {
	return rpc::RpcError::make(rpc::ErrorKind::InvalidParams, "Invalid params: " + message);
}

bool check_gate(StateGate gate, const PluginSession& session, rpc::RpcError& error) {
	switch (gate) {
		case StateGate::Any:
			return true;
		case StateGate::Initializable:
			return session.can_initialize(error);
		case StateGate::Ready:
			return session.require_ready(error);
	}
	return true;
}

bool decode_params(const MethodSpec& spec, const nlohmann::json& params, DecodedParams& out, rpc::RpcError& error) {
	if (!params.is_array() && !params.is_null()) {
		error = invalid_params("params must be an array");
		return false;
	}
	size_t given = params.is_array() ? params.size() : 0;
	if (given < spec.params.size()) {
		error = invalid_params(std::string(spec.name) + " expects " + std::to_string(spec.params.size()) +
		                       " param(s), got " + std::to_string(given));
		return false;
	}

	for (size_t i = 0; i < spec.params.size(); ++i) {
		const nlohmann::json& param = params[i];
		std::string reason;
		switch (spec.params[i]) {
			case ParamKind::Config:
				if (param.is_null()) {
					out.config = nlohmann::json::object();
				} else if (param.is_object()) {
					out.config = param;
				} else {
					error = invalid_params("param " + std::to_string(i) + " must be a config object");
					return false;
				}
				break;
			case ParamKind::EncodedRequest: {
				ProxyRequest request;
				if (!decode_proxy_request(param, request, reason)) {
					error = invalid_params("param " + std::to_string(i) + " (request): " + reason);
					return false;
				}
				out.request = std::move(request);
				break;
			}
			case ParamKind::EncodedResponse: {
				ProxyResponse response;
				if (!decode_proxy_response(param, response, reason)) {
					error = invalid_params("param " + std::to_string(i) + " (response): " + reason);
					return false;
				}
				out.response = std::move(response);
				break;
			}
		}
	}
	return true;
}

rpc::RpcResponse fail(const rpc::RpcRequest& call, rpc::RpcError error) {
	LOG4CPLUS_WARN(rpc_logger(), call.method << " id=" << call.id.wire() << " failed ("
	                                         << rpc::to_string(error.kind) << "): " << error.message);
	return rpc::RpcResponse::failure(call.id, std::move(error));
}

} // namespace

const MethodSpec* find_method_spec(const std::string& method) {
	return get_registry().find_spec(method);
}

rpc::RpcResponse dispatch(const rpc::RpcRequest& call, PluginSession& session, Plugin& plugin) {
	LOG4CPLUS_DEBUG(rpc_logger(), "call " << call.method << " id=" << call.id.wire());

	MethodHandler* handler = get_registry().find(call.method);
	if (!handler) {
		LOG4CPLUS_DEBUG(rpc_logger(), "Known methods: " << join_names(get_registry().names()));
		return fail(call, rpc::RpcError::make(rpc::ErrorKind::MethodNotFound, "Method not found: " + call.method));
	}

	const MethodSpec& spec = handler->spec();
	rpc::RpcError error;
	if (!check_gate(spec.gate, session, error)) {
		return fail(call, std::move(error));
	}

	DecodedParams params;
	if (!decode_params(spec, call.params, params, error)) {
		return fail(call, std::move(error));
	}

	CallResult result;
	MethodContext ctx{call, session, plugin, params};
	try {
		result = handler->handle(ctx);
	} catch (const std::exception& exc) {
		LOG4CPLUS_ERROR(hook_logger(), call.method << " raised: " << exc.what());
		return fail(call, rpc::RpcError::make(rpc::ErrorKind::HandlerError, exc.what()));
	} catch (...) {
		LOG4CPLUS_ERROR(hook_logger(), call.method << " raised a non-standard exception");
		return fail(call, rpc::RpcError::make(rpc::ErrorKind::HandlerError, "unknown failure in " + call.method));
	}

	if (!result.ok()) {
		return fail(call, std::move(*result.error));
	}
	return rpc::RpcResponse::success(call.id, std::move(result.result));
}

std::optional<std::string> handle_line(const std::string& line, PluginSession& session, Plugin& plugin) {
	if (line.find_first_not_of(" \t\r\n") == std::string::npos) {
		return std::nullopt;
	}

	codec::DecodeResult decoded = codec::decode_request(line);
	if (!decoded.ok()) {
		LOG4CPLUS_ERROR(rpc_logger(), "Decode error (" << rpc::to_string(decoded.error->kind)
		                                              << "): " << decoded.error->message << " id=" << decoded.id.wire());
		return codec::encode_response(rpc::RpcResponse::failure(decoded.id, std::move(*decoded.error)));
	}

	return codec::encode_response(dispatch(*decoded.request, session, plugin));
}

std::string reject_oversized_line(const std::string& prefix) {
	rpc::RpcId id;
	if (auto raw_id = codec::extract_raw_id(prefix)) {
		id.raw = *raw_id;
	}
	LOG4CPLUS_ERROR(rpc_logger(), "Rejecting oversized line (" << prefix.size() << " bytes kept) id=" << id.wire());
	return codec::encode_response(rpc::RpcResponse::failure(
	    id, rpc::RpcError::make(rpc::ErrorKind::ParseError, "Parse error: line exceeds the size limit")));
}

} // namespace apiproxy::methods
