#include "relaunch/core/lifecycle_errors.h"
#include "relaunch/core/lifecycle_registrar.h"
#include "relaunch/core/lifecycle_resolver.h"
#include "relaunch/utils/logging.hpp"
#include <filesystem>
#include <iostream>

using namespace relaunch::core;

namespace {

// Upgrades by copying the new artifact over the old one; restarting is left
// to whatever supervises the process.
class CopyingLifecycle : public LifecycleVariant<CopyingLifecycle> {
public:
    void replaceArtifact(const std::filesystem::path& replacement) override {
        auto artifact = locateArtifact();
        if (!artifact) {
            throw LifecycleOperationError("artifact location is unknown");
        }
        std::error_code ec;
        std::filesystem::copy_file(replacement, *artifact,
                                   std::filesystem::copy_options::overwrite_existing, ec);
        if (ec) {
            throw LifecycleOperationError("cannot overwrite " + artifact->string() + ": " + ec.message());
        }
    }
};

LifecycleRegistrar<CopyingLifecycle> registrar("example.CopyingLifecycle", "copies the new artifact in place");

} // namespace

int main(int argc, char** argv) {
    // Equivalent to exporting RELAUNCH_LIFECYCLE / RELAUNCH_ARTIFACT.
    if (argc > 1) {
        systemOverrides().set(kLifecycleProperty, argv[1]);
    }
    if (argc > 2) {
        systemOverrides().set(kArtifactProperty, argv[2]);
    }

    std::cout << "Registered lifecycles:\n";
    for (const auto& name : LifecycleRegistry::getInstance().registeredNames()) {
        std::cout << "- " << name << ": " << LifecycleRegistry::getInstance().getDescription(name) << "\n";
    }

    try {
        Lifecycle& lifecycle = activeLifecycle();
        auto artifact = lifecycle.locateArtifact();

        std::cout << "Active lifecycle: " << lifecycle.name() << "\n";
        std::cout << "Artifact: " << (artifact ? artifact->string() : "unknown") << "\n";
        std::cout << "Offer upgrade: " << (lifecycle.canReplaceArtifact() ? "yes" : "no") << "\n";
        std::cout << "Offer restart: " << (lifecycle.canRestart() ? "yes" : "no") << "\n";
    } catch (const StrategySelectionError& e) {
        std::cerr << "Startup aborted: " << relaunch::utils::describeNested(e) << "\n";
        return 1;
    } catch (const ConfigurationError& e) {
        std::cerr << "Startup aborted: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
