#include "plugin_config.hpp"

#include "json_codec.hpp"

#include <utility>

namespace apiproxy {

namespace {

bool matches(ConfigType type, const nlohmann::json& value) {
    switch (type) {
        case ConfigType::String:
            return value.is_string();
        case ConfigType::Bool:
            return value.is_boolean();
        case ConfigType::Integer:
            return value.is_number_integer();
        case ConfigType::Number:
            return value.is_number();
        case ConfigType::Object:
            return value.is_object();
    }
    return false;
}

const nlohmann::json& null_json() {
    static const nlohmann::json value;
    return value;
}

} // namespace

const char* to_string(ConfigType type) {
    switch (type) {
        case ConfigType::String:
            return "string";
        case ConfigType::Bool:
            return "bool";
        case ConfigType::Integer:
            return "integer";
        case ConfigType::Number:
            return "number";
        case ConfigType::Object:
            return "object";
    }
    return "unknown";
}

ConfigSchema& ConfigSchema::add(std::string name, ConfigType type, nlohmann::json default_value, bool required) {
    fields_.push_back(ConfigField{std::move(name), type, std::move(default_value), required});
    return *this;
}

const ConfigField* ConfigSchema::find(const std::string& name) const {
    for (const auto& field : fields_) {
        if (field.name == name) {
            return &field;
        }
    }
    return nullptr;
}

bool PluginConfig::from_json(const nlohmann::json& raw, const ConfigSchema& schema, PluginConfig& out,
                             std::string& error) {
    if (!raw.is_null() && !raw.is_object()) {
        error = "config must be an object";
        return false;
    }

    PluginConfig config;
    for (const auto& field : schema.fields()) {
        const nlohmann::json* value = raw.is_object() ? codec::find_key(raw, field.name) : nullptr;
        if (!value || value->is_null()) {
            if (field.required) {
                error = "config." + field.name + " is required";
                return false;
            }
            config.values_[field.name] = field.default_value;
            continue;
        }
        if (!matches(field.type, *value)) {
            error = "config." + field.name + " must be " + to_string(field.type);
            return false;
        }
        config.values_[field.name] = *value;
    }

    if (raw.is_object()) {
        for (auto it = raw.begin(); it != raw.end(); ++it) {
            if (!schema.find(it.key())) {
                config.extensions_[it.key()] = it.value();
            }
        }
    }

    out = std::move(config);
    return true;
}

bool PluginConfig::has(const std::string& key) const {
    return values_.find(key) != values_.end() || extensions_.contains(key);
}

const nlohmann::json& PluginConfig::get(const std::string& key) const {
    auto it = values_.find(key);
    if (it != values_.end()) {
        return it->second;
    }
    if (auto value = codec::find_key(extensions_, key)) {
        return *value;
    }
    return null_json();
}

std::string PluginConfig::get_string(const std::string& key, const std::string& fallback) const {
    return codec::as_string(get(key), fallback);
}

bool PluginConfig::get_bool(const std::string& key, bool fallback) const {
    return codec::as_bool(get(key), fallback);
}

int64_t PluginConfig::get_int(const std::string& key, int64_t fallback) const {
    return codec::as_int64(get(key), fallback);
}

nlohmann::json PluginConfig::to_json() const {
    nlohmann::json root = extensions_;
    for (const auto& entry : values_) {
        root[entry.first] = entry.second;
    }
    return root;
}

} // namespace apiproxy
