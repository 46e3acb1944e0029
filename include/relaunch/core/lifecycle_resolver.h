#pragma once

#include "relaunch/core/lifecycle.h"
#include "relaunch/core/lifecycle_registry.h"
#include "relaunch/core/property_source.h"
#include <atomic>
#include <exception>
#include <memory>
#include <mutex>
#include <string>

namespace relaunch {
namespace core {

/**
 * @brief Selects, constructs and caches the single active lifecycle.
 *
 * The first getActiveStrategy() call reads RELAUNCH_LIFECYCLE once. Without
 * a value the inert DefaultLifecycle is used; otherwise the named variant is
 * resolved and constructed through the LifecycleTypeResolver. Every later
 * call, from any thread, returns that same instance. The instance is never
 * replaced.
 *
 * Selection failures are fatal to startup and sticky: the failure is
 * remembered and rethrown on every later call without retrying.
 */
class LifecycleResolver {
public:
    /**
     * @param properties Source of the selection key; also bound to the
     *        selected instance for its artifact lookup
     * @param types Resolves selection names; must outlive the resolver
     */
    LifecycleResolver(std::shared_ptr<const PropertySource> properties,
                      const LifecycleTypeResolver& types);
    ~LifecycleResolver();

    LifecycleResolver(const LifecycleResolver&) = delete;
    LifecycleResolver& operator=(const LifecycleResolver&) = delete;

    /**
     * @brief Get the active lifecycle, selecting it on first use.
     *
     * Safe to call concurrently. Only the first call takes the lock; later
     * calls cost one acquire load.
     *
     * @return Lifecycle& The active lifecycle, valid for the resolver's lifetime
     * @throws StrategySelectionError if the configured variant cannot be
     *         resolved or constructed; the cause is nested inside
     */
    Lifecycle& getActiveStrategy();

    /**
     * @brief Whether a lifecycle has been selected and published.
     */
    bool isResolved() const noexcept;

    /**
     * @brief The RELAUNCH_LIFECYCLE value read during selection.
     *
     * Empty before selection and when the default lifecycle was chosen.
     */
    std::string selectionKey() const;

private:
    std::unique_ptr<Lifecycle> select();

    std::shared_ptr<const PropertySource> properties_;
    const LifecycleTypeResolver& types_;

    std::atomic<Lifecycle*> active_{nullptr};
    mutable std::mutex mutex_;
    std::unique_ptr<Lifecycle> instance_;
    std::exception_ptr failure_;
    std::string selection_;
};

/**
 * @brief The process-wide resolver over systemProperties() and
 * LifecycleRegistry::getInstance(). Never destroyed.
 */
LifecycleResolver& systemLifecycleResolver();

/**
 * @brief Shorthand for systemLifecycleResolver().getActiveStrategy().
 */
Lifecycle& activeLifecycle();

} // namespace core
} // namespace relaunch
