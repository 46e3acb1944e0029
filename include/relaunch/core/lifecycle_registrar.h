#pragma once

#include "relaunch/core/lifecycle_registry.h"
#include <memory>
#include <string>
#include <type_traits>

namespace relaunch {
namespace core {

/**
 * @brief Helper class for registering a lifecycle variant at static initialization
 *
 * Usage:
 *   static LifecycleRegistrar<SystemdLifecycle> registrar("acme.SystemdLifecycle", "systemd unit");
 *
 * Instances are created with makeLifecycle(), so a variant whose declared
 * capabilities disagree with its overrides fails when it is activated.
 *
 * @tparam T Variant class type (must inherit from Lifecycle and be default constructible)
 */
template<typename T>
class LifecycleRegistrar {
    static_assert(std::is_base_of<Lifecycle, T>::value,
        "Lifecycle variant must inherit from Lifecycle");
    static_assert(std::is_default_constructible<T>::value,
        "Lifecycle variant must be constructible with no arguments");

public:
    /**
     * @brief Construct and register a variant
     *
     * @param name Selection name the variant is activated by
     * @param description Optional description of the variant
     * @param registry Registry to add to, the process-wide one by default
     */
    explicit LifecycleRegistrar(const std::string& name,
                                const std::string& description = "",
                                LifecycleRegistry& registry = LifecycleRegistry::getInstance()) {
        registry.registerLifecycle(
            name,
            []() -> std::unique_ptr<Lifecycle> { return makeLifecycle<T>(); },
            description
        );
    }
};

} // namespace core
} // namespace relaunch
