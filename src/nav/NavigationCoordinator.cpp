#include "nav/NavigationCoordinator.hpp"
#include "input/ControllerService.hpp"
#include "engine/Log.hpp"

#include <cmath>
#include <utility>

namespace tenfoot {

namespace {

constexpr std::array<ButtonAction, NAV_ACTION_COUNT> kNavActionButtons = {
    ButtonAction::Confirm,
    ButtonAction::Back,
    ButtonAction::Option1,
    ButtonAction::Option2,
    ButtonAction::LeftBumper,
    ButtonAction::RightBumper,
    ButtonAction::Select,
    ButtonAction::Start,
};

} // anonymous namespace

const char* toString(NavPhase phase) {
    switch (phase) {
        case NavPhase::Disabled:          return "Disabled";
        case NavPhase::ArmingAfterEnable: return "ArmingAfterEnable";
        case NavPhase::Idle:              return "Idle";
        case NavPhase::DirectionHeld:     return "DirectionHeld";
        case NavPhase::AwaitingRelease:   return "AwaitingRelease";
    }
    return "?";
}

NavigationCoordinator::NavigationCoordinator(NavigationConfig config)
    : m_config(std::move(config)) {}

// ---------------------------------------------------------------------------
// Configuration
// ---------------------------------------------------------------------------

void NavigationCoordinator::setEnabled(bool enabled) {
    if (enabled && !m_config.enabled) {
        ++m_enableGeneration;
    }
    m_config.enabled = enabled;
    if (!enabled) {
        disarm();
    }
}

void NavigationCoordinator::setCallbacks(NavigationCallbacks callbacks) {
    m_config.callbacks = std::move(callbacks);
}

void NavigationCoordinator::setConfig(NavigationConfig config) {
    if (config.enabled && !m_config.enabled) {
        ++m_enableGeneration;
    }
    m_config = std::move(config);
    if (!m_config.enabled) {
        disarm();
    }
}

void NavigationCoordinator::setScrollTarget(ScrollTarget* target, float speed) {
    m_config.scrollTarget = target;
    m_config.scrollSpeed = speed;
}

void NavigationCoordinator::setDefaultRepeatTiming(int repeatDelayMs, int repeatRateMs) {
    m_defaultRepeatDelayMs = repeatDelayMs;
    m_defaultRepeatRateMs = repeatRateMs;
}

int NavigationCoordinator::getRepeatDelayMs() const {
    return m_config.repeatDelayMs.value_or(m_defaultRepeatDelayMs);
}

int NavigationCoordinator::getRepeatRateMs() const {
    return m_config.repeatRateMs.value_or(m_defaultRepeatRateMs);
}

// ---------------------------------------------------------------------------
// Tick
// ---------------------------------------------------------------------------

void NavigationCoordinator::update(const ControllerService& service, double nowMs,
                                   std::optional<int> preferredController) {
    if (!m_config.enabled) {
        disarm();
        return;
    }

    if (m_phase == NavPhase::Disabled) {
        m_phase = NavPhase::ArmingAfterEnable;
    }

    // Arming stays pending until there is a controller to read
    auto index = resolveController(service, preferredController);
    if (!index) return;

    auto direction = service.getNavigationDirection(*index, STICK_THRESHOLD);
    ButtonSet pressed = readButtons(service, *index);

    if (m_phase == NavPhase::ArmingAfterEnable) {
        arm(direction, pressed);
        return;
    }

    updateDirection(direction, nowMs);
    if (!m_config.enabled) return;

    updateButtons(pressed);
    if (!m_config.enabled) return;

    updateScroll(service, *index);
}

std::optional<int> NavigationCoordinator::resolveController(const ControllerService& service,
                                                            std::optional<int> preferred) const {
    if (m_config.activeController) return m_config.activeController;
    if (preferred) return preferred;
    return service.getFirstControllerIndex();
}

NavigationCoordinator::ButtonSet NavigationCoordinator::readButtons(
        const ControllerService& service, int index) const {
    ButtonSet pressed{};
    for (std::size_t i = 0; i < NAV_ACTION_COUNT; ++i) {
        pressed[i] = service.isActionPressed(index, kNavActionButtons[i]);
    }
    return pressed;
}

void NavigationCoordinator::arm(std::optional<Direction> direction, const ButtonSet& pressed) {
    // Both guards are set together: a held direction waits for release and
    // held buttons are recorded as already down.
    m_state.needsRelease = direction.has_value();
    m_state.currentDirection = direction;
    m_state.previousButtonStates = pressed;

    if (direction) {
        m_phase = NavPhase::AwaitingRelease;
        UI_LOG_DEBUG("Navigation armed with '{}' held; waiting for release", toString(*direction));
    } else {
        m_phase = NavPhase::Idle;
    }
}

void NavigationCoordinator::disarm() {
    m_phase = NavPhase::Disabled;
    m_state.currentDirection.reset();
    m_state.needsRelease = false;
}

void NavigationCoordinator::updateDirection(std::optional<Direction> direction, double nowMs) {
    if (m_state.needsRelease) {
        if (!direction) {
            m_state.needsRelease = false;
            m_state.currentDirection.reset();
            m_phase = NavPhase::Idle;
        }
        return;
    }

    if (!direction) {
        m_state.currentDirection.reset();
        m_phase = NavPhase::Idle;
        return;
    }

    if (m_state.currentDirection != direction) {
        m_state.currentDirection = direction;
        m_state.pressTimestamp = nowMs;
        m_state.lastRepeatTimestamp = nowMs;
        m_phase = NavPhase::DirectionHeld;
        fireNavigate(*direction);
        return;
    }

    double sincePress = nowMs - m_state.pressTimestamp;
    double sinceRepeat = nowMs - m_state.lastRepeatTimestamp;
    if (sincePress > getRepeatDelayMs() && sinceRepeat > getRepeatRateMs()) {
        m_state.lastRepeatTimestamp = nowMs;
        fireNavigate(*direction);
    }
}

void NavigationCoordinator::updateButtons(const ButtonSet& pressed) {
    // Edges are taken and history stored before any callback runs, so a
    // callback that disables this scope cannot leave stale history behind.
    ButtonSet edges{};
    for (std::size_t i = 0; i < NAV_ACTION_COUNT; ++i) {
        edges[i] = pressed[i] && !m_state.previousButtonStates[i];
    }
    m_state.previousButtonStates = pressed;

    for (std::size_t i = 0; i < NAV_ACTION_COUNT; ++i) {
        if (!m_config.enabled) return;
        if (edges[i]) {
            fireAction(static_cast<NavAction>(i));
        }
    }
}

void NavigationCoordinator::updateScroll(const ControllerService& service, int index) {
    if (!m_config.scrollTarget) return;

    StickVector stick = service.getRightStick(index);
    if (std::abs(stick.y) > SCROLL_DEADZONE) {
        m_config.scrollTarget->scrollBy(stick.y * m_config.scrollSpeed);
    }
}

// ---------------------------------------------------------------------------
// Keyboard fallback
// ---------------------------------------------------------------------------

bool NavigationCoordinator::handleKeyPress(const KeyPress& press, const ControllerService& service) {
    if (!m_config.enabled || !m_config.keyboardFallback) return false;

    // A connected controller drives navigation; keys would double-fire
    if (service.getConnectedCount() > 0) return false;

    // Copies: a callback may replace this scope's callbacks while running
    const NavigationCallbacks cbs = m_config.callbacks;
    auto navigate = [&cbs](Direction direction) {
        if (!cbs.onNavigate) return false;
        cbs.onNavigate(direction);
        return true;
    };
    auto invoke = [](const std::function<void()>& callback) {
        if (!callback) return false;
        callback();
        return true;
    };

    switch (press.key) {
        case Key::Up:
        case Key::W:
        case Key::PageUp:
            return navigate(Direction::Up);
        case Key::Down:
        case Key::S:
        case Key::PageDown:
            return navigate(Direction::Down);
        case Key::Left:
        case Key::A:
            return navigate(Direction::Left);
        case Key::Right:
        case Key::D:
            return navigate(Direction::Right);
        case Key::Enter:
        case Key::Space:
            return invoke(cbs.onConfirm);
        case Key::Escape:
        case Key::Backspace:
            return invoke(cbs.onBack);
        case Key::Tab:
            return press.shift ? invoke(cbs.onLeftBumper) : invoke(cbs.onRightBumper);
        default:
            break;
    }
    return false;
}

// ---------------------------------------------------------------------------
// Dispatch
// ---------------------------------------------------------------------------

void NavigationCoordinator::fireNavigate(Direction direction) {
    // Invoke a copy: the callback may call setCallbacks()/setConfig()
    auto callback = m_config.callbacks.onNavigate;
    if (callback) {
        callback(direction);
    }
}

void NavigationCoordinator::fireAction(NavAction action) {
    const auto& cbs = m_config.callbacks;
    std::function<void()> callback;
    switch (action) {
        case NavAction::Confirm:     callback = cbs.onConfirm; break;
        case NavAction::Back:        callback = cbs.onBack; break;
        case NavAction::Option1:     callback = cbs.onOption1; break;
        case NavAction::Option2:     callback = cbs.onOption2; break;
        case NavAction::LeftBumper:  callback = cbs.onLeftBumper; break;
        case NavAction::RightBumper: callback = cbs.onRightBumper; break;
        case NavAction::Select:      callback = cbs.onSelect; break;
        case NavAction::Start:       callback = cbs.onStart; break;
    }
    if (callback) {
        callback();
    }
}

} // namespace tenfoot
