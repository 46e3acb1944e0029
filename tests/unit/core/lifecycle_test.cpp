#include <gtest/gtest.h>
#include "relaunch/core/lifecycle.h"
#include "relaunch/core/lifecycle_errors.h"

#include <atomic>
#include <cstdlib>
#include <fstream>
#include <vector>

using namespace relaunch::core;

namespace {

class RestartOnlyLifecycle : public LifecycleVariant<RestartOnlyLifecycle> {
public:
    void restart() override { ++restarts; }
    int restarts = 0;
};

class ReplaceOnlyLifecycle : public LifecycleVariant<ReplaceOnlyLifecycle> {
public:
    void replaceArtifact(const std::filesystem::path& replacement) override {
        lastReplacement = replacement;
    }
    std::filesystem::path lastReplacement;
};

class FullLifecycle : public LifecycleVariant<FullLifecycle> {
public:
    void restart() override {}
    void replaceArtifact(const std::filesystem::path&) override {}
};

class InheritsRestart : public RestartOnlyLifecycle {};

// Declares restart without implementing it.
class MisdeclaredLifecycle : public Lifecycle {
public:
    MisdeclaredLifecycle() : Lifecycle(Capability::Restart) {}
};

// Declares and implements restart without the CRTP helper.
class ExplicitRestartLifecycle : public Lifecycle {
public:
    ExplicitRestartLifecycle() : Lifecycle(Capability::Restart) {}
    void restart() override { restarted = true; }
    bool restarted = false;
};

class FailingRestartLifecycle : public LifecycleVariant<FailingRestartLifecycle> {
public:
    void restart() override { throw LifecycleOperationError("service manager refused"); }
};

// Same names, different signatures: these hide the operations, they do not
// override them.
class DelayedRestartLifecycle : public LifecycleVariant<DelayedRestartLifecycle> {
public:
    void restart(int delaySeconds) { lastDelay = delaySeconds; }
    void replaceArtifact(const std::string& replacement) { lastReplacement = replacement; }
    int lastDelay = 0;
    std::string lastReplacement;
};

class ConstRestartLifecycle : public LifecycleVariant<ConstRestartLifecycle> {
public:
    void restart() const {}
};

class OverloadedRestartLifecycle : public LifecycleVariant<OverloadedRestartLifecycle> {
public:
    void restart() override { ++restarts; }
    void restart(int) { ++restarts; }
    int restarts = 0;
};

class NoexceptRestartLifecycle : public LifecycleVariant<NoexceptRestartLifecycle> {
public:
    void restart() noexcept override {}
};

// Refines a concrete variant and re-runs detection against itself.
class RestartAndUpgradeLifecycle : public LifecycleVariant<RestartAndUpgradeLifecycle, RestartOnlyLifecycle> {
public:
    void replaceArtifact(const std::filesystem::path& replacement) override {
        lastReplacement = replacement;
    }
    std::filesystem::path lastReplacement;
};

// Adds an override to a concrete variant without refining it.
class UnrefinedUpgradeLifecycle : public RestartOnlyLifecycle {
public:
    void replaceArtifact(const std::filesystem::path&) override {}
};

// Plain subclass with neither the helper nor a declaration.
class UndeclaredRestartLifecycle : public Lifecycle {
public:
    void restart() override {}
};

static_assert(DefaultLifecycle::detectCapabilities().empty(), "default lifecycle declares nothing");
static_assert(RestartOnlyLifecycle::detectCapabilities() == Capabilities(Capability::Restart),
              "restart override detected");
static_assert(ReplaceOnlyLifecycle::detectCapabilities() == Capabilities(Capability::ReplaceArtifact),
              "replaceArtifact override detected");
static_assert(FullLifecycle::detectCapabilities() == (Capability::Restart | Capability::ReplaceArtifact),
              "both overrides detected");
static_assert(DelayedRestartLifecycle::detectCapabilities().empty(), "hiding declarations are not overrides");
static_assert(ConstRestartLifecycle::detectCapabilities().empty(), "const restart is not an override");
static_assert(OverloadedRestartLifecycle::detectCapabilities() == Capabilities(Capability::Restart),
              "override found among overloads");
static_assert(NoexceptRestartLifecycle::detectCapabilities() == Capabilities(Capability::Restart),
              "noexcept override detected");
static_assert(RestartAndUpgradeLifecycle::detectCapabilities() ==
                  (Capability::Restart | Capability::ReplaceArtifact),
              "refined variant keeps inherited overrides");
static_assert(detail::detectCapabilities<UndeclaredRestartLifecycle>() == Capabilities(Capability::Restart),
              "detection works on any subclass");

// Points RELAUNCH_ARTIFACT at an existing file for the lifetime of the object.
class ScopedArtifact {
public:
    ScopedArtifact() : path_(std::filesystem::temp_directory_path() / "relaunch_lifecycle_test_artifact") {
        std::ofstream(path_) << "artifact";
        ::setenv(kArtifactProperty, path_.c_str(), 1);
    }
    ~ScopedArtifact() {
        ::unsetenv(kArtifactProperty);
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

private:
    std::filesystem::path path_;
};

} // namespace

TEST(CapabilitiesTest, FlagOperations) {
    Capabilities none;
    EXPECT_TRUE(none.empty());
    EXPECT_FALSE(none.has(Capability::Restart));
    EXPECT_EQ(none.toString(), "none");

    Capabilities both = Capability::ReplaceArtifact | Capability::Restart;
    EXPECT_TRUE(both.has(Capability::Restart));
    EXPECT_TRUE(both.has(Capability::ReplaceArtifact));
    EXPECT_EQ(both.toString(), "replace-artifact,restart");
    EXPECT_NE(both, Capabilities(Capability::Restart));
    EXPECT_EQ(Capabilities(Capability::Restart).toString(), "restart");
}

TEST(LifecycleTest, DefaultLifecycleSupportsNothing) {
    DefaultLifecycle lifecycle;

    EXPECT_EQ(lifecycle.name(), "default");
    EXPECT_TRUE(lifecycle.capabilities().empty());
    EXPECT_FALSE(lifecycle.canRestart());
    EXPECT_FALSE(lifecycle.canReplaceArtifact());
    EXPECT_THROW(lifecycle.restart(), UnsupportedOperationError);
    EXPECT_THROW(lifecycle.replaceArtifact("/tmp/new-artifact"), UnsupportedOperationError);
}

TEST(LifecycleTest, RestartOverrideIsDetected) {
    RestartOnlyLifecycle lifecycle;

    EXPECT_TRUE(lifecycle.canRestart());
    EXPECT_FALSE(lifecycle.capabilities().has(Capability::ReplaceArtifact));
    EXPECT_FALSE(lifecycle.canReplaceArtifact());

    lifecycle.restart();
    EXPECT_EQ(lifecycle.restarts, 1);
    EXPECT_THROW(lifecycle.replaceArtifact("/tmp/new-artifact"), UnsupportedOperationError);
}

TEST(LifecycleTest, ReplaceOverrideIsDetected) {
    ReplaceOnlyLifecycle lifecycle;

    EXPECT_FALSE(lifecycle.canRestart());
    EXPECT_TRUE(lifecycle.capabilities().has(Capability::ReplaceArtifact));
    EXPECT_THROW(lifecycle.restart(), UnsupportedOperationError);

    lifecycle.replaceArtifact("/tmp/new-artifact");
    EXPECT_EQ(lifecycle.lastReplacement, std::filesystem::path("/tmp/new-artifact"));
}

TEST(LifecycleTest, OverrideInIntermediateClassCounts) {
    InheritsRestart lifecycle;
    EXPECT_TRUE(lifecycle.canRestart());
}

TEST(LifecycleTest, ExplicitDeclarationIsHonoured) {
    ExplicitRestartLifecycle lifecycle;
    ASSERT_TRUE(lifecycle.canRestart());
    lifecycle.restart();
    EXPECT_TRUE(lifecycle.restarted);
}

TEST(LifecycleTest, DeclaredButMissingOperationIsADefect) {
    MisdeclaredLifecycle lifecycle;

    EXPECT_TRUE(lifecycle.canRestart());
    EXPECT_THROW(lifecycle.restart(), CapabilityMismatchError);

    // Undeclared and unimplemented stays a plain unsupported operation.
    EXPECT_THROW(lifecycle.replaceArtifact("/tmp/new-artifact"), UnsupportedOperationError);
}

TEST(LifecycleTest, MismatchIsNotReportedAsUnsupported) {
    MisdeclaredLifecycle lifecycle;
    try {
        lifecycle.restart();
        FAIL() << "restart() should throw";
    } catch (const UnsupportedOperationError&) {
        FAIL() << "declaration defect reported as unsupported";
    } catch (const CapabilityMismatchError& e) {
        EXPECT_NE(std::string(e.what()).find("restart"), std::string::npos);
    }
}

TEST(LifecycleTest, OperationalFailureIsDistinctFromUnsupported) {
    FailingRestartLifecycle lifecycle;

    // Supported, so the failure is environmental rather than "unsupported".
    ASSERT_TRUE(lifecycle.canRestart());
    EXPECT_THROW(lifecycle.restart(), LifecycleOperationError);
}

TEST(LifecycleTest, CanRestartMatchesRestartBehaviour) {
    DefaultLifecycle defaults;
    RestartOnlyLifecycle restartOnly;
    ReplaceOnlyLifecycle replaceOnly;
    FullLifecycle full;

    std::vector<Lifecycle*> variants{&defaults, &restartOnly, &replaceOnly, &full};
    for (Lifecycle* lifecycle : variants) {
        bool unsupported = false;
        try {
            lifecycle->restart();
        } catch (const UnsupportedOperationError&) {
            unsupported = true;
        }
        EXPECT_EQ(lifecycle->canRestart(), !unsupported) << lifecycle->name();
    }
}

TEST(LifecycleTest, DirectlyConstructedLifecycleHasGenericName) {
    RestartOnlyLifecycle lifecycle;
    EXPECT_EQ(lifecycle.name(), "lifecycle");
}

TEST(LifecycleTest, HidingDeclarationIsNotAnOverride) {
    DelayedRestartLifecycle lifecycle;
    Lifecycle& base = lifecycle;

    EXPECT_FALSE(base.canRestart());
    EXPECT_TRUE(base.capabilities().empty());
    EXPECT_THROW(base.restart(), UnsupportedOperationError);
    EXPECT_THROW(base.replaceArtifact("/tmp/new-artifact"), UnsupportedOperationError);

    lifecycle.restart(5);
    EXPECT_EQ(lifecycle.lastDelay, 5);
}

TEST(LifecycleTest, ConstRestartIsNotAnOverride) {
    ConstRestartLifecycle lifecycle;
    Lifecycle& base = lifecycle;

    EXPECT_FALSE(base.canRestart());
    EXPECT_THROW(base.restart(), UnsupportedOperationError);
}

TEST(LifecycleTest, OverrideAmongOverloadsIsDetected) {
    OverloadedRestartLifecycle lifecycle;
    Lifecycle& base = lifecycle;

    ASSERT_TRUE(base.canRestart());
    base.restart();
    EXPECT_EQ(lifecycle.restarts, 1);
}

TEST(LifecycleTest, RefinedVariantDetectsAddedOverride) {
    ScopedArtifact artifact;
    RestartAndUpgradeLifecycle lifecycle;
    Lifecycle& base = lifecycle;

    ASSERT_TRUE(base.locateArtifact().has_value());
    EXPECT_TRUE(base.canRestart());
    EXPECT_TRUE(base.canReplaceArtifact());

    base.replaceArtifact("/tmp/new-artifact");
    EXPECT_EQ(lifecycle.lastReplacement, std::filesystem::path("/tmp/new-artifact"));
    base.restart();
    EXPECT_EQ(lifecycle.restarts, 1);
}

TEST(MakeLifecycleTest, UndeclaredVariantTakesDetectedCapabilities) {
    UndeclaredRestartLifecycle direct;
    EXPECT_FALSE(direct.canRestart());

    auto made = makeLifecycle<UndeclaredRestartLifecycle>();
    EXPECT_TRUE(made->canRestart());
    EXPECT_FALSE(made->capabilities().has(Capability::ReplaceArtifact));
}

TEST(MakeLifecycleTest, UnrefinedSubclassIsRejected) {
    EXPECT_THROW(makeLifecycle<UnrefinedUpgradeLifecycle>(), CapabilityMismatchError);
}

TEST(MakeLifecycleTest, DeclarationWithoutOverrideIsRejected) {
    EXPECT_THROW(makeLifecycle<MisdeclaredLifecycle>(), CapabilityMismatchError);
}

TEST(MakeLifecycleTest, ConsistentVariantsAreAccepted) {
    EXPECT_TRUE(makeLifecycle<DefaultLifecycle>()->capabilities().empty());
    EXPECT_TRUE(makeLifecycle<ExplicitRestartLifecycle>()->canRestart());
    EXPECT_TRUE(makeLifecycle<InheritsRestart>()->canRestart());
    EXPECT_EQ(makeLifecycle<RestartAndUpgradeLifecycle>()->capabilities(),
              Capability::Restart | Capability::ReplaceArtifact);
}
