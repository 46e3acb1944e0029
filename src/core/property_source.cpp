#include "relaunch/core/property_source.h"
#include "relaunch/core/lifecycle_errors.h"
#include "relaunch/utils/logging.hpp"

#include <cstdlib>
#include <fstream>

#include <nlohmann/json.hpp>

namespace relaunch {
namespace core {

std::optional<std::string> EnvironmentPropertySource::get(const std::string& key) const {
    const char* value = std::getenv(key.c_str());
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

MapPropertySource::MapPropertySource(std::map<std::string, std::string> values)
    : values_(std::move(values)) {}

std::optional<std::string> MapPropertySource::get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = values_.find(key);
    if (it == values_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void MapPropertySource::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    values_[key] = value;
}

bool MapPropertySource::erase(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return values_.erase(key) > 0;
}

void MapPropertySource::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    values_.clear();
}

JsonPropertySource::JsonPropertySource(const std::filesystem::path& path) : path_(path) {
    std::ifstream file(path_);
    if (!file) {
        throw ConfigurationError("Cannot open properties file: " + path_.string());
    }

    nlohmann::json document;
    try {
        file >> document;
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationError("Malformed properties file " + path_.string() + ": " + e.what());
    }

    if (!document.is_object()) {
        throw ConfigurationError("Properties file " + path_.string() + " must hold a JSON object");
    }

    for (const auto& [key, value] : document.items()) {
        if (value.is_string()) {
            values_[key] = value.get<std::string>();
        } else if (value.is_number() || value.is_boolean()) {
            values_[key] = value.dump();
        } else {
            RLOG_WARN("Ignoring non-scalar property '{}' in {}", key, path_.string());
        }
    }
    RLOG_DEBUG("Loaded {} properties from {}", values_.size(), path_.string());
}

std::optional<std::string> JsonPropertySource::get(const std::string& key) const {
    auto it = values_.find(key);
    if (it == values_.end()) {
        return std::nullopt;
    }
    return it->second;
}

LayeredPropertySource::LayeredPropertySource(std::vector<std::shared_ptr<const PropertySource>> layers)
    : layers_(std::move(layers)) {}

std::optional<std::string> LayeredPropertySource::get(const std::string& key) const {
    for (const auto& layer : layers_) {
        if (!layer) {
            continue;
        }
        if (auto value = layer->get(key)) {
            return value;
        }
    }
    return std::nullopt;
}

namespace {

std::shared_ptr<MapPropertySource> overridesInstance() {
    static auto overrides = std::make_shared<MapPropertySource>();
    return overrides;
}

} // namespace

std::shared_ptr<LayeredPropertySource> layerProperties(std::shared_ptr<const PropertySource> overrides,
                                                       std::shared_ptr<const PropertySource> environment) {
    std::vector<std::shared_ptr<const PropertySource>> layers{overrides};

    std::optional<std::string> configFile;
    if (overrides) {
        configFile = overrides->get(kConfigFileProperty);
    }
    if (!configFile && environment) {
        configFile = environment->get(kConfigFileProperty);
    }
    if (configFile && !configFile->empty()) {
        layers.push_back(std::make_shared<JsonPropertySource>(*configFile));
        RLOG_INFO("Using properties file {}", *configFile);
    }

    layers.push_back(std::move(environment));
    return std::make_shared<LayeredPropertySource>(std::move(layers));
}

MapPropertySource& systemOverrides() {
    return *overridesInstance();
}

std::shared_ptr<const PropertySource> systemProperties() {
    static const std::shared_ptr<const PropertySource> properties =
        layerProperties(overridesInstance(), std::make_shared<EnvironmentPropertySource>());
    return properties;
}

} // namespace core
} // namespace relaunch
