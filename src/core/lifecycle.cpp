#include "relaunch/core/lifecycle.h"
#include "relaunch/core/lifecycle_errors.h"
#include "relaunch/utils/logging.hpp"

#include <system_error>

namespace relaunch {
namespace core {

std::string Capabilities::toString() const {
    if (empty()) {
        return "none";
    }
    std::string names;
    if (has(Capability::ReplaceArtifact)) {
        names = "replace-artifact";
    }
    if (has(Capability::Restart)) {
        if (!names.empty()) {
            names += ",";
        }
        names += "restart";
    }
    return names;
}

std::string Lifecycle::name() const {
    return selectedName_.empty() ? "lifecycle" : selectedName_;
}

std::optional<std::filesystem::path> Lifecycle::locateArtifact() const {
    auto configured = properties().get(kArtifactProperty);
    if (!configured || configured->empty()) {
        return std::nullopt;
    }

    std::filesystem::path artifact(*configured);
    std::error_code ec;
    if (!std::filesystem::exists(artifact, ec)) {
        RLOG_DEBUG("Configured artifact {} does not exist", artifact.string());
        return std::nullopt;
    }
    return artifact;
}

bool Lifecycle::canReplaceArtifact() const {
    // if we don't know where the artifact is, it's impossible to replace.
    if (!locateArtifact()) {
        return false;
    }
    return capabilities_.has(Capability::ReplaceArtifact);
}

void Lifecycle::replaceArtifact(const std::filesystem::path& replacement) {
    if (capabilities_.has(Capability::ReplaceArtifact)) {
        RLOG_CRITICAL("Lifecycle '{}' declares replace-artifact but does not implement it", name());
        throw CapabilityMismatchError("Lifecycle '" + name() +
                                      "' declares replace-artifact but does not override replaceArtifact()");
    }
    throw UnsupportedOperationError("Lifecycle '" + name() + "' cannot replace the installed artifact with " +
                                    replacement.string());
}

bool Lifecycle::canRestart() const noexcept {
    return capabilities_.has(Capability::Restart);
}

void Lifecycle::restart() {
    if (capabilities_.has(Capability::Restart)) {
        RLOG_CRITICAL("Lifecycle '{}' declares restart but does not implement it", name());
        throw CapabilityMismatchError("Lifecycle '" + name() + "' declares restart but does not override restart()");
    }
    throw UnsupportedOperationError("Lifecycle '" + name() + "' does not support restart");
}

const PropertySource& Lifecycle::properties() const {
    if (properties_) {
        return *properties_;
    }
    static const EnvironmentPropertySource environment;
    return environment;
}

void Lifecycle::settleCapabilities(Capabilities detected) {
    if (!declared_) {
        declareCapabilities(detected);
        return;
    }
    if (capabilities_ != detected) {
        RLOG_CRITICAL("Lifecycle '{}' declares {} but overrides {}", name(), capabilities_.toString(),
                      detected.toString());
        throw CapabilityMismatchError("Lifecycle '" + name() + "' declares " + capabilities_.toString() +
                                      " but overrides " + detected.toString());
    }
}

void Lifecycle::bind(std::shared_ptr<const PropertySource> properties, std::string selectedName) {
    properties_ = std::move(properties);
    selectedName_ = std::move(selectedName);
}

} // namespace core
} // namespace relaunch
