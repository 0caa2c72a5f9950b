#pragma once

#include "method_base.hpp"

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace apiproxy::methods {

/// Built-in methods by wire name. A name can be registered once; the first handler wins.
class MethodRegistry {
public:
    /// Returns false (and keeps the existing handler) for a null handler or a duplicate name.
    bool add(std::unique_ptr<MethodHandler> handler);

    MethodHandler* find(const std::string& method) const;
    const MethodSpec* find_spec(const std::string& method) const;

    /// Registered wire names, sorted.
    std::vector<std::string> names() const;
    size_t size() const { return handlers_.size(); }

private:
    std::unordered_map<std::string, std::unique_ptr<MethodHandler>> handlers_;
};

void register_lifecycle_methods(MethodRegistry& registry);
void register_exchange_methods(MethodRegistry& registry);

} // namespace apiproxy::methods
