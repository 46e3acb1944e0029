#include "relaunch/core/lifecycle_registry.h"
#include "relaunch/utils/logging.hpp"
#include <algorithm>
#include <stdexcept>

namespace relaunch {
namespace core {

LifecycleRegistry& LifecycleRegistry::getInstance() {
    static LifecycleRegistry instance;
    return instance;
}

void LifecycleRegistry::registerLifecycle(
    const std::string& name,
    LifecycleFactory factory,
    const std::string& description) {
    if (name.empty()) {
        throw std::invalid_argument("Lifecycle name must not be empty");
    }
    if (!factory) {
        throw std::invalid_argument("Lifecycle factory must not be null: " + name);
    }

    std::lock_guard<std::mutex> lock(mutex_);

    if (registry_.find(name) != registry_.end()) {
        throw std::runtime_error("Lifecycle already registered: " + name);
    }

    registry_[name] = VariantInfo{
        std::move(factory),
        description
    };
    RLOG_DEBUG("Registered lifecycle variant '{}'", name);
}

bool LifecycleRegistry::hasLifecycle(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return registry_.find(name) != registry_.end();
}

std::vector<std::string> LifecycleRegistry::registeredNames() const {
    std::vector<std::string> names;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        names.reserve(registry_.size());
        for (const auto& [name, info] : registry_) {
            names.push_back(name);
        }
    }
    std::sort(names.begin(), names.end());
    return names;
}

std::string LifecycleRegistry::getDescription(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = registry_.find(name);
    if (it == registry_.end()) {
        throw std::runtime_error("No lifecycle registered: " + name);
    }

    return it->second.description;
}

Result<LifecycleType> LifecycleRegistry::resolveType(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = registry_.find(name);
    if (it == registry_.end()) {
        return Result<LifecycleType>::failure("No lifecycle registered: " + name);
    }

    return LifecycleType{name, it->second.description, it->second.factory};
}

std::unique_ptr<Lifecycle> LifecycleRegistry::instantiate(const LifecycleType& type) const {
    if (!type.factory) {
        return nullptr;
    }
    return type.factory();
}

} // namespace core
} // namespace relaunch
