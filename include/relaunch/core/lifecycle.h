#pragma once

#include "relaunch/core/property_source.h"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>

namespace relaunch {
namespace core {

/**
 * @brief Optional lifecycle operations a variant may implement.
 */
enum class Capability : std::uint8_t {
    ReplaceArtifact = 1u << 0,  ///< replaceArtifact() performs an in-place upgrade
    Restart = 1u << 1           ///< restart() restarts the process
};

/**
 * @brief Set of Capability flags.
 */
class Capabilities {
public:
    constexpr Capabilities() = default;
    constexpr Capabilities(Capability capability)
        : bits_(static_cast<std::uint8_t>(capability)) {}

    constexpr bool has(Capability capability) const {
        return (bits_ & static_cast<std::uint8_t>(capability)) != 0;
    }

    constexpr bool empty() const { return bits_ == 0; }

    constexpr Capabilities operator|(Capabilities other) const {
        return Capabilities(static_cast<std::uint8_t>(bits_ | other.bits_));
    }

    constexpr bool operator==(Capabilities other) const { return bits_ == other.bits_; }
    constexpr bool operator!=(Capabilities other) const { return bits_ != other.bits_; }

    /// Comma separated flag names, or "none".
    std::string toString() const;

private:
    constexpr explicit Capabilities(std::uint8_t bits) : bits_(bits) {}

    std::uint8_t bits_{0};
};

constexpr Capabilities operator|(Capability lhs, Capability rhs) {
    return Capabilities(lhs) | Capabilities(rhs);
}

class LifecycleResolver;

template <typename T>
std::unique_ptr<T> makeLifecycle();

/**
 * @brief Controls restart and in-place upgrade of the host process.
 *
 * How the process is restarted or its installed artifact replaced depends on
 * how it was launched (service wrapper, container, plain executable), so
 * each launch mechanism is a variant of this class. Exactly one variant is
 * active per process; see LifecycleResolver.
 *
 * Restart and artifact replacement are optional. A variant either derives
 * from LifecycleVariant, which detects the operations it overrides at
 * compile time, or declares its Capabilities explicitly through the
 * protected constructor. Variants created through makeLifecycle() (as the
 * registry does) are checked against what their dynamic type overrides. Callers ask canRestart() / canReplaceArtifact()
 * before offering an operation; nothing is ever invoked to find out.
 */
class Lifecycle {
public:
    virtual ~Lifecycle() = default;

    Lifecycle(const Lifecycle&) = delete;
    Lifecycle& operator=(const Lifecycle&) = delete;
    Lifecycle(Lifecycle&&) = delete;
    Lifecycle& operator=(Lifecycle&&) = delete;

    /**
     * @brief Diagnostic name of this variant.
     *
     * Defaults to the name the variant was selected under, or "lifecycle"
     * when it was constructed directly.
     */
    virtual std::string name() const;

    /**
     * @brief Location of the installed artifact the process runs from.
     *
     * The default reads RELAUNCH_ARTIFACT from the bound properties and
     * answers std::nullopt when it is unset or the file does not exist.
     * Evaluated on every call. When a location is returned the host may
     * offer an upgrade to a newer artifact.
     */
    virtual std::optional<std::filesystem::path> locateArtifact() const;

    /**
     * @brief Can replaceArtifact() work?
     *
     * False whenever the artifact location is unknown.
     */
    bool canReplaceArtifact() const;

    /**
     * @brief Replaces the installed artifact with the given file.
     *
     * @throws UnsupportedOperationError unless overridden
     * @throws LifecycleOperationError from variants, on environmental failure
     */
    virtual void replaceArtifact(const std::filesystem::path& replacement);

    /**
     * @brief Can restart() restart the process?
     */
    bool canRestart() const noexcept;

    /**
     * @brief Restarts the process if this variant supports it.
     *
     * The restart may happen synchronously, in which case this call never
     * returns, or asynchronously, in which case it returns once the restart
     * has been scheduled.
     *
     * @throws UnsupportedOperationError unless overridden
     * @throws LifecycleOperationError from variants, on environmental failure
     */
    virtual void restart();

    Capabilities capabilities() const noexcept { return capabilities_; }

protected:
    Lifecycle() = default;
    explicit Lifecycle(Capabilities declared) : capabilities_(declared), declared_(true) {}

    /// Replaces whatever a base class declared.
    void declareCapabilities(Capabilities declared) noexcept {
        capabilities_ = declared;
        declared_ = true;
    }

    /// Properties bound by the resolver; the process environment otherwise.
    const PropertySource& properties() const;

private:
    friend class LifecycleResolver;
    template <typename T>
    friend std::unique_ptr<T> makeLifecycle();

    void settleCapabilities(Capabilities detected);
    void bind(std::shared_ptr<const PropertySource> properties, std::string selectedName);

    Capabilities capabilities_;
    bool declared_{false};
    std::shared_ptr<const PropertySource> properties_;
    std::string selectedName_;
};

namespace detail {

template <typename C>
constexpr bool declaredBelowLifecycle() {
    return std::is_base_of<Lifecycle, C>::value && !std::is_same<C, Lifecycle>::value;
}

// &T::restart is a void (C::*)() naming the override's class, or
// Lifecycle's own member when nothing overrides it. Hiding declarations with
// another signature or cv-qualifier fall through to the generic overload.
template <typename MemberPointer>
constexpr bool restartOverride(MemberPointer) {
    return false;
}

template <typename C>
constexpr bool restartOverride(void (C::*)()) {
    return declaredBelowLifecycle<C>();
}

template <typename C>
constexpr bool restartOverride(void (C::*)() noexcept) {
    return declaredBelowLifecycle<C>();
}

template <typename MemberPointer>
constexpr bool replaceArtifactOverride(MemberPointer) {
    return false;
}

template <typename C>
constexpr bool replaceArtifactOverride(void (C::*)(const std::filesystem::path&)) {
    return declaredBelowLifecycle<C>();
}

template <typename C>
constexpr bool replaceArtifactOverride(void (C::*)(const std::filesystem::path&) noexcept) {
    return declaredBelowLifecycle<C>();
}

template <typename T>
constexpr bool overridesRestart() {
    return restartOverride(&T::restart);
}

template <typename T>
constexpr bool overridesReplaceArtifact() {
    return replaceArtifactOverride(&T::replaceArtifact);
}

/// Operations T overrides, whichever class in its hierarchy declares them.
template <typename T>
constexpr Capabilities detectCapabilities() {
    Capabilities detected;
    if (overridesReplaceArtifact<T>()) {
        detected = detected | Capability::ReplaceArtifact;
    }
    if (overridesRestart<T>()) {
        detected = detected | Capability::Restart;
    }
    return detected;
}

} // namespace detail

/**
 * @brief Base for variants whose capabilities follow from what they override.
 *
 * Usage:
 *   class SystemdLifecycle : public LifecycleVariant<SystemdLifecycle> {
 *   public:
 *       void restart() override;
 *   };
 *
 * A variant refining another concrete variant names it as Base, so the
 * detection runs again against the more derived class:
 *   class SystemdUpgrader : public LifecycleVariant<SystemdUpgrader, SystemdLifecycle> {
 *   public:
 *       void replaceArtifact(const std::filesystem::path& replacement) override;
 *   };
 *
 * Only a member with the exact signature of the Lifecycle operation, declared
 * in a class below Lifecycle, counts as an override. Overrides must be public.
 *
 * @tparam Derived The concrete variant (CRTP)
 * @tparam Base Class Derived refines, Lifecycle by default
 */
template <typename Derived, typename Base = Lifecycle>
class LifecycleVariant : public Base {
    static_assert(std::is_base_of<Lifecycle, Base>::value,
                  "LifecycleVariant base must be a Lifecycle");

public:
    static constexpr Capabilities detectCapabilities() {
        return detail::detectCapabilities<Derived>();
    }

protected:
    LifecycleVariant() {
        static_assert(std::is_base_of<LifecycleVariant<Derived, Base>, Derived>::value,
                      "LifecycleVariant must be instantiated with the deriving class");
        this->declareCapabilities(detectCapabilities());
    }
};

/**
 * @brief Construct a variant and check its capabilities against its overrides.
 *
 * A variant that never declared capabilities (a plain Lifecycle subclass
 * using the default constructor) takes the detected set. One that declared
 * a different set gets CapabilityMismatchError, which is what happens when a
 * concrete variant is subclassed without naming it as LifecycleVariant's Base.
 *
 * @throws CapabilityMismatchError if declared and detected capabilities differ
 */
template <typename T>
std::unique_ptr<T> makeLifecycle() {
    static_assert(std::is_base_of<Lifecycle, T>::value, "Lifecycle variant must inherit from Lifecycle");
    auto instance = std::make_unique<T>();
    static_cast<Lifecycle&>(*instance).settleCapabilities(detail::detectCapabilities<T>());
    return instance;
}

/**
 * @brief Inert variant used when no lifecycle is configured.
 *
 * Neither restart nor artifact replacement is supported.
 */
class DefaultLifecycle final : public LifecycleVariant<DefaultLifecycle> {
public:
    DefaultLifecycle() = default;

    std::string name() const override { return "default"; }
};

} // namespace core
} // namespace relaunch
