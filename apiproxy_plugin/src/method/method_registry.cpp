#include "method_registry.hpp"

#include "../logger.hpp"

#include <algorithm>
#include <utility>

#include <log4cplus/loggingmacros.h>

namespace apiproxy::methods {

bool MethodRegistry::add(std::unique_ptr<MethodHandler> handler) {
    if (!handler) {
        return false;
    }
    std::string name = handler->name();
    auto inserted = handlers_.emplace(name, std::move(handler));
    if (!inserted.second) {
        LOG4CPLUS_ERROR(rpc_logger(), "Method " << name << " is already registered, ignoring duplicate");
        return false;
    }
    return true;
}

MethodHandler* MethodRegistry::find(const std::string& method) const {
    auto it = handlers_.find(method);
    if (it == handlers_.end()) {
        return nullptr;
    }
    return it->second.get();
}

const MethodSpec* MethodRegistry::find_spec(const std::string& method) const {
    const MethodHandler* handler = find(method);
    return handler ? &handler->spec() : nullptr;
}

std::vector<std::string> MethodRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(handlers_.size());
    for (const auto& entry : handlers_) {
        out.push_back(entry.first);
    }
    std::sort(out.begin(), out.end());
    return out;
}

} // namespace apiproxy::methods
