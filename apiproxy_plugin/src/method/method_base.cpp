#include "method_base.hpp"

#include <utility>

namespace apiproxy::methods {

CallResult CallResult::success(nlohmann::json result) {
    CallResult out;
    out.result = std::move(result);
    return out;
}

CallResult CallResult::failure(rpc::RpcError error) {
    CallResult out;
    out.error = std::move(error);
    return out;
}

nlohmann::json MethodHandler::status_ok() {
    return nlohmann::json{{"status", "ok"}};
}

void MethodHandler::reconcile(const ProxyRequest& before, ProxyRequest& after) {
    MetadataMap merged = before.metadata;
    merge_metadata(merged, after.metadata);
    after.metadata = std::move(merged);
    after.body.encoding = before.body.encoding;
    after.body.encoding_explicit = before.body.encoding_explicit;
}

void MethodHandler::reconcile(const ProxyResponse& before, ProxyResponse& after) {
    MetadataMap merged = before.metadata;
    merge_metadata(merged, after.metadata);
    after.metadata = std::move(merged);
    after.body.encoding = before.body.encoding;
    after.body.encoding_explicit = before.body.encoding_explicit;
}

} // namespace apiproxy::methods
