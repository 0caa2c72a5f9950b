#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace apiproxy {

enum class ConfigType {
    String,
    Bool,
    Integer,
    Number,
    Object,
};

const char* to_string(ConfigType type);

struct ConfigField {
    std::string name;
    ConfigType type = ConfigType::String;
    nlohmann::json default_value;
    bool required = false;
};

/// Keys a plugin recognizes in its init configuration.
class ConfigSchema {
public:
    ConfigSchema& add(std::string name, ConfigType type, nlohmann::json default_value, bool required = false);

    const std::vector<ConfigField>& fields() const { return fields_; }
    const ConfigField* find(const std::string& name) const;

private:
    std::vector<ConfigField> fields_;
};

/**
 * Validated plugin configuration. Every recognized key holds a value of its
 * declared type (the default when absent); unrecognized keys are kept
 * untouched in extensions() for forward compatibility.
 */
class PluginConfig {
public:
    PluginConfig() = default;

    /// Fails (returns false, sets error) on wrong-typed or missing required keys.
    static bool from_json(const nlohmann::json& raw, const ConfigSchema& schema, PluginConfig& out,
                          std::string& error);

    bool has(const std::string& key) const;
    const nlohmann::json& get(const std::string& key) const;
    std::string get_string(const std::string& key, const std::string& fallback = "") const;
    bool get_bool(const std::string& key, bool fallback = false) const;
    int64_t get_int(const std::string& key, int64_t fallback = 0) const;

    const nlohmann::json& extensions() const { return extensions_; }
    nlohmann::json to_json() const;

private:
    std::map<std::string, nlohmann::json> values_;
    nlohmann::json extensions_ = nlohmann::json::object();
};

} // namespace apiproxy
