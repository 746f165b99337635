#pragma once

#include "input/ControllerTypes.hpp"
#include "input/Keyboard.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>

namespace tenfoot {

class ControllerService;

/// Something the right stick can scroll continuously (a list, a text pane).
class ScrollTarget {
public:
    virtual ~ScrollTarget() = default;

    /// Scroll by `delta` units; positive is down.
    virtual void scrollBy(float delta) = 0;
};

/// Event vocabulary delivered to a UI focus scope. Every callback is
/// optional; an empty one is simply not called.
struct NavigationCallbacks {
    std::function<void(Direction)> onNavigate;
    std::function<void()> onConfirm;
    std::function<void()> onBack;
    std::function<void()> onOption1;
    std::function<void()> onOption2;
    std::function<void()> onLeftBumper;
    std::function<void()> onRightBumper;
    std::function<void()> onSelect;
    std::function<void()> onStart;
};

struct NavigationConfig {
    bool enabled = true;

    /// Accept arrow/WASD/Enter/Escape/Tab presses while no controller is
    /// connected.
    bool keyboardFallback = true;

    NavigationCallbacks callbacks;

    /// Explicit repeat timing for this scope. Unset values follow the
    /// defaults pushed in with setDefaultRepeatTiming().
    std::optional<int> repeatDelayMs;
    std::optional<int> repeatRateMs;

    /// Controller this scope listens to. Unset: the caller's preferred
    /// controller, else the first connected one.
    std::optional<int> activeController;

    /// Optional right-stick scroll target (not owned).
    ScrollTarget* scrollTarget = nullptr;
    float scrollSpeed = 8.0f;
};

/// Lifecycle of a coordinator's directional input.
enum class NavPhase {
    Disabled,
    ArmingAfterEnable,  // first tick after enable: only records held input
    Idle,               // enabled, no direction held
    DirectionHeld,      // direction held, repeat timer running
    AwaitingRelease,    // direction was held at enable; ignored until released
};

const char* toString(NavPhase phase);

/// Action buttons a coordinator reports, in callback order.
enum class NavAction : int {
    Confirm,
    Back,
    Option1,
    Option2,
    LeftBumper,
    RightBumper,
    Select,
    Start,
};

constexpr std::size_t NAV_ACTION_COUNT = 8;

struct NavigationState {
    std::optional<Direction> currentDirection;
    double pressTimestamp      = 0.0;
    double lastRepeatTimestamp = 0.0;
    bool   needsRelease        = false;
    std::array<bool, NAV_ACTION_COUNT> previousButtonStates{};
};

/// Turns the shared ControllerService's per-tick state into debounced,
/// repeat-aware navigation events for exactly one UI focus scope.
///
/// Directions fire once on press, then again after the repeat delay and
/// every repeat interval while held. Action buttons fire once per press.
/// On every disabled -> enabled transition the first tick only records what
/// is already held: a held direction must be released before it can fire,
/// and held buttons do not count as presses.
class NavigationCoordinator {
public:
    explicit NavigationCoordinator(NavigationConfig config = {});

    /// Run one tick. `nowMs` is a monotonic timestamp in milliseconds.
    /// `preferredController` is used when the config does not pin one.
    void update(const ControllerService& service, double nowMs,
                std::optional<int> preferredController = std::nullopt);

    /// Keyboard fallback. Returns true if the press was mapped to a
    /// registered callback. Ignored while any controller is connected.
    bool handleKeyPress(const KeyPress& press, const ControllerService& service);

    void setEnabled(bool enabled);
    bool isEnabled() const { return m_config.enabled; }

    /// Bumped on every disabled -> enabled transition. Lets a dispatcher
    /// tell a scope enabled mid-dispatch from one that was already live.
    uint64_t getEnableGeneration() const { return m_enableGeneration; }

    /// Replace the callbacks without disturbing the polling state.
    void setCallbacks(NavigationCallbacks callbacks);

    /// Replace the whole configuration. Enabling re-arms on the next tick.
    void setConfig(NavigationConfig config);
    const NavigationConfig& getConfig() const { return m_config; }

    void setActiveController(std::optional<int> index) { m_config.activeController = index; }
    void setScrollTarget(ScrollTarget* target, float speed = DEFAULT_SCROLL_SPEED);

    /// Repeat timing used when the config leaves it unset (from settings).
    void setDefaultRepeatTiming(int repeatDelayMs, int repeatRateMs);

    int getRepeatDelayMs() const;
    int getRepeatRateMs() const;

    NavPhase getPhase() const { return m_phase; }
    const NavigationState& getState() const { return m_state; }

    static constexpr float STICK_THRESHOLD      = 0.5f;
    static constexpr float SCROLL_DEADZONE      = 0.2f;
    static constexpr float DEFAULT_SCROLL_SPEED = 8.0f;

private:
    using ButtonSet = std::array<bool, NAV_ACTION_COUNT>;

    std::optional<int> resolveController(const ControllerService& service,
                                         std::optional<int> preferred) const;

    ButtonSet readButtons(const ControllerService& service, int index) const;

    /// First tick after enable: remember held input, fire nothing.
    void arm(std::optional<Direction> direction, const ButtonSet& pressed);
    void disarm();

    void updateDirection(std::optional<Direction> direction, double nowMs);
    void updateButtons(const ButtonSet& pressed);
    void updateScroll(const ControllerService& service, int index);

    void fireNavigate(Direction direction);
    void fireAction(NavAction action);

    NavigationConfig m_config;
    NavigationState  m_state;
    NavPhase         m_phase = NavPhase::Disabled;

    uint64_t m_enableGeneration = 0;

    int m_defaultRepeatDelayMs = 400;
    int m_defaultRepeatRateMs  = 100;
};

} // namespace tenfoot
