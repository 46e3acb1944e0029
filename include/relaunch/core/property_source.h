#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace relaunch {
namespace core {

/// Names the lifecycle variant to activate. Unset selects DefaultLifecycle.
inline constexpr const char* kLifecycleProperty = "RELAUNCH_LIFECYCLE";
/// Path of the installed artifact the running process was started from.
inline constexpr const char* kArtifactProperty = "RELAUNCH_ARTIFACT";
/// Optional JSON file merged into systemProperties().
inline constexpr const char* kConfigFileProperty = "RELAUNCH_CONFIG";

/**
 * @brief Read-only key/value configuration lookup.
 */
class PropertySource {
public:
    virtual ~PropertySource() = default;

    /**
     * @brief Look up a property.
     * @param key Property name.
     * @return The value, or std::nullopt if this source does not define it.
     */
    virtual std::optional<std::string> get(const std::string& key) const = 0;
};

/**
 * @brief Properties backed by the process environment.
 */
class EnvironmentPropertySource : public PropertySource {
public:
    std::optional<std::string> get(const std::string& key) const override;
};

/**
 * @brief Mutable in-memory properties. Safe to use from multiple threads.
 */
class MapPropertySource : public PropertySource {
public:
    MapPropertySource() = default;
    explicit MapPropertySource(std::map<std::string, std::string> values);

    std::optional<std::string> get(const std::string& key) const override;

    void set(const std::string& key, const std::string& value);
    bool erase(const std::string& key);
    void clear();

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::string> values_;
};

/**
 * @brief Properties loaded once from a flat JSON object.
 *
 * String members are taken verbatim; numbers and booleans are rendered as
 * their JSON text. Nested objects, arrays and nulls are skipped.
 */
class JsonPropertySource : public PropertySource {
public:
    /**
     * @brief Load properties from a JSON file.
     * @param path File holding a single JSON object.
     * @throws ConfigurationError if the file cannot be read or parsed, or
     *         if its top-level value is not an object.
     */
    explicit JsonPropertySource(const std::filesystem::path& path);

    std::optional<std::string> get(const std::string& key) const override;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    std::map<std::string, std::string> values_;
};

/**
 * @brief Chains several sources; the first one defining a key wins.
 */
class LayeredPropertySource : public PropertySource {
public:
    LayeredPropertySource() = default;
    explicit LayeredPropertySource(std::vector<std::shared_ptr<const PropertySource>> layers);

    std::optional<std::string> get(const std::string& key) const override;

    size_t layerCount() const { return layers_.size(); }

private:
    std::vector<std::shared_ptr<const PropertySource>> layers_;
};

/**
 * @brief Stack overrides, then the JSON file named by RELAUNCH_CONFIG (looked
 * up in overrides first, then environment), then environment.
 *
 * @throws ConfigurationError if RELAUNCH_CONFIG names an unreadable file.
 */
std::shared_ptr<LayeredPropertySource> layerProperties(std::shared_ptr<const PropertySource> overrides,
                                                       std::shared_ptr<const PropertySource> environment);

/**
 * @brief Process-wide override layer consulted before anything else.
 *
 * The host sets values here (for example from command-line flags) before the
 * active lifecycle is first resolved.
 */
MapPropertySource& systemOverrides();

/**
 * @brief Process-wide properties: systemOverrides(), then the JSON file named
 * by RELAUNCH_CONFIG (if any), then the environment.
 *
 * Built on first call with layerProperties().
 * @throws ConfigurationError if RELAUNCH_CONFIG names an unreadable file.
 */
std::shared_ptr<const PropertySource> systemProperties();

} // namespace core
} // namespace relaunch
