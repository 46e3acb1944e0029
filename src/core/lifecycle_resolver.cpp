#include "relaunch/core/lifecycle_resolver.h"
#include "relaunch/core/lifecycle_errors.h"
#include "relaunch/utils/logging.hpp"

namespace relaunch {
namespace core {

LifecycleResolver::LifecycleResolver(std::shared_ptr<const PropertySource> properties,
                                     const LifecycleTypeResolver& types)
    : properties_(std::move(properties)), types_(types) {
    if (!properties_) {
        throw std::invalid_argument("LifecycleResolver requires a property source");
    }
}

LifecycleResolver::~LifecycleResolver() = default;

Lifecycle& LifecycleResolver::getActiveStrategy() {
    if (Lifecycle* active = active_.load(std::memory_order_acquire)) {
        return *active;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (Lifecycle* active = active_.load(std::memory_order_relaxed)) {
        return *active;
    }
    if (failure_) {
        std::rethrow_exception(failure_);
    }

    try {
        instance_ = select();
    } catch (const StrategySelectionError&) {
        failure_ = std::current_exception();
        throw;
    }

    RLOG_INFO("Active lifecycle: {} (capabilities: {})",
              instance_->name(), instance_->capabilities().toString());

    // Publish only once the instance is fully constructed and bound.
    active_.store(instance_.get(), std::memory_order_release);
    return *instance_;
}

bool LifecycleResolver::isResolved() const noexcept {
    return active_.load(std::memory_order_acquire) != nullptr;
}

std::string LifecycleResolver::selectionKey() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return selection_;
}

std::unique_ptr<Lifecycle> LifecycleResolver::select() {
    auto configured = properties_->get(kLifecycleProperty);
    if (!configured || configured->empty()) {
        RLOG_DEBUG("{} not set, using the default lifecycle", kLifecycleProperty);
        auto fallback = std::make_unique<DefaultLifecycle>();
        fallback->bind(properties_, "");
        return fallback;
    }

    selection_ = *configured;
    const std::string context = "Cannot activate lifecycle '" + selection_ + "' named by " + kLifecycleProperty;

    std::unique_ptr<Lifecycle> instance;
    try {
        auto type = types_.resolveType(selection_);
        if (type.has_error()) {
            throw UnknownLifecycleError(type.error());
        }
        instance = types_.instantiate(type.value());
        if (!instance) {
            throw std::runtime_error("factory for '" + selection_ + "' produced no instance");
        }
    } catch (const std::exception& e) {
        RLOG_CRITICAL("{}: {}", context, utils::describeNested(e));
        std::throw_with_nested(StrategySelectionError(selection_, context + ": " + e.what()));
    } catch (...) {
        RLOG_CRITICAL("{}: non-standard exception", context);
        std::throw_with_nested(StrategySelectionError(selection_, context + ": non-standard exception"));
    }

    instance->bind(properties_, selection_);
    return instance;
}

LifecycleResolver& systemLifecycleResolver() {
    static LifecycleResolver* resolver =
        new LifecycleResolver(systemProperties(), LifecycleRegistry::getInstance());
    return *resolver;
}

Lifecycle& activeLifecycle() {
    return systemLifecycleResolver().getActiveStrategy();
}

} // namespace core
} // namespace relaunch
