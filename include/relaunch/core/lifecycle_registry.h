#pragma once

#include "relaunch/core/lifecycle.h"
#include "relaunch/utils/result.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace relaunch {
namespace core {

/**
 * @brief Factory type for creating lifecycle variants with no arguments
 */
using LifecycleFactory = std::function<std::unique_ptr<Lifecycle>()>;

/**
 * @brief A lifecycle variant resolved by name
 */
struct LifecycleType {
    std::string name;
    std::string description;
    LifecycleFactory factory;
};

/**
 * @brief Turns a selection name into a constructed lifecycle variant
 *
 * This is what LifecycleResolver needs from the host's plugin and
 * type-loading machinery. Both steps may fail.
 */
class LifecycleTypeResolver {
public:
    virtual ~LifecycleTypeResolver() = default;

    /**
     * @brief Look up the variant registered under a name
     *
     * @param name Selection name
     * @return Result<LifecycleType> The type, or an error naming the missing variant
     */
    virtual Result<LifecycleType> resolveType(const std::string& name) const = 0;

    /**
     * @brief Construct an instance of a resolved type
     *
     * @param type Type returned by resolveType()
     * @return std::unique_ptr<Lifecycle> New instance, or nullptr if the factory produced none
     * @throws anything the variant's constructor throws
     */
    virtual std::unique_ptr<Lifecycle> instantiate(const LifecycleType& type) const = 0;
};

/**
 * @brief Registry mapping selection names to lifecycle variant factories
 *
 * Built-in variants are registered during static initialization through
 * LifecycleRegistrar; plugin-provided variants are registered by the host
 * before the active lifecycle is first resolved. Thread-safe.
 */
class LifecycleRegistry : public LifecycleTypeResolver {
public:
    LifecycleRegistry() = default;

    /**
     * @brief Get the process-wide registry
     *
     * @return LifecycleRegistry& Singleton instance
     */
    static LifecycleRegistry& getInstance();

    /**
     * @brief Register a variant factory under a name
     *
     * @param name Selection name, usually the variant's fully qualified class name
     * @param factory Factory creating a new instance
     * @param description Optional description of the variant
     * @throws std::invalid_argument if name is empty or factory is null
     * @throws std::runtime_error if name is already registered
     */
    void registerLifecycle(
        const std::string& name,
        LifecycleFactory factory,
        const std::string& description = "");

    /**
     * @brief Check if a variant is registered under a name
     */
    bool hasLifecycle(const std::string& name) const;

    /**
     * @brief Get the names of every registered variant, sorted
     */
    std::vector<std::string> registeredNames() const;

    /**
     * @brief Get description of a registered variant
     *
     * @throws std::runtime_error if name not registered
     */
    std::string getDescription(const std::string& name) const;

    Result<LifecycleType> resolveType(const std::string& name) const override;
    std::unique_ptr<Lifecycle> instantiate(const LifecycleType& type) const override;

    LifecycleRegistry(const LifecycleRegistry&) = delete;
    LifecycleRegistry& operator=(const LifecycleRegistry&) = delete;
    LifecycleRegistry(LifecycleRegistry&&) = delete;
    LifecycleRegistry& operator=(LifecycleRegistry&&) = delete;

private:
    struct VariantInfo {
        LifecycleFactory factory;
        std::string description;
    };

    mutable std::mutex mutex_;
    std::unordered_map<std::string, VariantInfo> registry_;
};

} // namespace core
} // namespace relaunch
