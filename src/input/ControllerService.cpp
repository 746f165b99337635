#include "input/ControllerService.hpp"
#include "input/ButtonMapping.hpp"
#include "engine/Log.hpp"

#include <algorithm>
#include <cmath>
#include <set>

namespace tenfoot {

ControllerService::ControllerService(ControllerHost& host)
    : m_host(host) {}

// ---------------------------------------------------------------------------
// Polling
// ---------------------------------------------------------------------------

void ControllerService::poll() {
    std::set<int> seen;

    for (const auto& slot : m_host.readControllers()) {
        if (!slot || !slot->connected) continue;

        const RawControllerState& raw = *slot;
        seen.insert(raw.index);

        if (m_controllers.count(raw.index) == 0) {
            track(raw);
        }
        // Looked up again: a connection listener may have reacted to track()
        auto it = m_controllers.find(raw.index);
        if (it != m_controllers.end()) {
            refresh(it->second, raw);
        }
    }

    // Anything tracked that the host no longer reports has gone away
    std::vector<int> lost;
    for (const auto& [index, record] : m_controllers) {
        if (seen.count(index) == 0) lost.push_back(index);
    }
    for (int index : lost) {
        untrack(index);
    }

    notifySubscribers();
}

void ControllerService::handleConnected(const RawControllerState& raw) {
    if (!raw.connected || m_controllers.count(raw.index) > 0) return;
    track(raw);
}

void ControllerService::handleDisconnected(int index) {
    if (m_controllers.count(index) == 0) return;
    untrack(index);
}

void ControllerService::track(const RawControllerState& raw) {
    ControllerRecord record;
    record.snapshot.index = raw.index;
    record.snapshot.rawId = raw.id;
    record.snapshot.type = classifyController(raw.id);
    record.snapshot.displayName = controllerDisplayName(raw.id, record.snapshot.type);
    record.snapshot.buttons = raw.buttons;
    record.snapshot.axes = raw.axes;
    record.snapshot.connected = true;
    record.mapping = resolveMapping(raw.id, record.snapshot.type);
    // Nothing counts as previously held, so a button down at connect time
    // registers as an edge on the first poll.
    record.previousPressed.assign(raw.buttons.size(), false);
    record.justPressed.assign(raw.buttons.size(), false);

    auto it = m_controllers.emplace(raw.index, std::move(record)).first;

    const ControllerSnapshot& snapshot = it->second.snapshot;
    LOG_INFO("Controller {} connected: '{}' ({})", snapshot.index,
             snapshot.displayName, toString(snapshot.type));

    notifyConnection(snapshot, true);
}

void ControllerService::refresh(ControllerRecord& record, const RawControllerState& raw) {
    record.snapshot.buttons = raw.buttons;
    record.snapshot.axes = raw.axes;

    const std::size_t count = raw.buttons.size();
    record.previousPressed.resize(count, false);
    record.justPressed.assign(count, false);

    for (std::size_t i = 0; i < count; ++i) {
        bool pressed = raw.buttons[i].pressed;
        record.justPressed[i] = pressed && !record.previousPressed[i];
        record.previousPressed[i] = pressed;
    }
}

void ControllerService::untrack(int index) {
    auto it = m_controllers.find(index);
    if (it == m_controllers.end()) return;

    // Listeners get the last known state, flagged as disconnected
    ControllerSnapshot last = std::move(it->second.snapshot);
    last.connected = false;
    m_controllers.erase(it);

    LOG_INFO("Controller {} disconnected: '{}'", last.index, last.displayName);
    notifyConnection(last, false);
}

// ---------------------------------------------------------------------------
// Controller queries
// ---------------------------------------------------------------------------

const ControllerService::ControllerRecord* ControllerService::find(int index) const {
    auto it = m_controllers.find(index);
    return it != m_controllers.end() ? &it->second : nullptr;
}

std::vector<ControllerSnapshot> ControllerService::getControllers() const {
    std::vector<ControllerSnapshot> out;
    out.reserve(m_controllers.size());
    for (const auto& [index, record] : m_controllers) {
        out.push_back(record.snapshot);
    }
    return out;
}

std::optional<ControllerSnapshot> ControllerService::getController(int index) const {
    const auto* record = find(index);
    if (!record) return std::nullopt;
    return record->snapshot;
}

std::optional<int> ControllerService::getFirstControllerIndex() const {
    if (m_controllers.empty()) return std::nullopt;
    return m_controllers.begin()->first;
}

// ---------------------------------------------------------------------------
// Action queries
// ---------------------------------------------------------------------------

int ControllerService::physicalSlot(const ControllerRecord& record, ButtonAction action) {
    int slot = record.mapping.indexOf(action);
    if (slot < 0 || static_cast<std::size_t>(slot) >= record.snapshot.buttons.size()) {
        return -1;
    }
    return slot;
}

bool ControllerService::isActionPressed(int index, ButtonAction action) const {
    const auto* record = find(index);
    if (!record) return false;

    int slot = physicalSlot(*record, action);
    return slot >= 0 && record->snapshot.buttons[slot].pressed;
}

bool ControllerService::isActionJustPressed(int index, ButtonAction action) const {
    const auto* record = find(index);
    if (!record) return false;

    int slot = physicalSlot(*record, action);
    if (slot < 0 || static_cast<std::size_t>(slot) >= record->justPressed.size()) {
        return false;
    }
    return record->justPressed[slot];
}

// ---------------------------------------------------------------------------
// Analog queries
// ---------------------------------------------------------------------------

float ControllerService::readAxis(const ControllerRecord& record, ControllerAxis axis) const {
    auto i = static_cast<std::size_t>(axis);
    if (i >= record.snapshot.axes.size()) return 0.0f;
    float value = record.snapshot.axes[i];
    return std::isfinite(value) ? std::clamp(value, -1.0f, 1.0f) : 0.0f;
}

float ControllerService::applyDeadzone(float value) const {
    float magnitude = std::abs(value);
    if (magnitude <= m_deadzone) {
        return 0.0f;
    }

    // Remap [deadzone, 1] onto [0, 1] so the response is continuous at the edge
    float scaled = (magnitude - m_deadzone) / (1.0f - m_deadzone);
    return value > 0.0f ? scaled : -scaled;
}

StickVector ControllerService::getLeftStick(int index) const {
    const auto* record = find(index);
    if (!record) return {};
    return {applyDeadzone(readAxis(*record, ControllerAxis::LeftX)),
            applyDeadzone(readAxis(*record, ControllerAxis::LeftY))};
}

StickVector ControllerService::getRightStick(int index) const {
    const auto* record = find(index);
    if (!record) return {};
    return {applyDeadzone(readAxis(*record, ControllerAxis::RightX)),
            applyDeadzone(readAxis(*record, ControllerAxis::RightY))};
}

DpadAxes ControllerService::getDpadFromAxes(int index) const {
    const auto* record = find(index);
    if (!record) return {};

    float hatX = readAxis(*record, ControllerAxis::DpadHatX);
    float hatY = readAxis(*record, ControllerAxis::DpadHatY);

    DpadAxes dpad;
    dpad.up    = hatY < -DPAD_AXIS_THRESHOLD;
    dpad.down  = hatY >  DPAD_AXIS_THRESHOLD;
    dpad.left  = hatX < -DPAD_AXIS_THRESHOLD;
    dpad.right = hatX >  DPAD_AXIS_THRESHOLD;
    return dpad;
}

std::optional<Direction> ControllerService::getNavigationDirection(int index,
                                                                   float stickThreshold) const {
    if (!find(index)) return std::nullopt;

    if (isActionPressed(index, ButtonAction::DpadUp))    return Direction::Up;
    if (isActionPressed(index, ButtonAction::DpadDown))  return Direction::Down;
    if (isActionPressed(index, ButtonAction::DpadLeft))  return Direction::Left;
    if (isActionPressed(index, ButtonAction::DpadRight)) return Direction::Right;

    DpadAxes hat = getDpadFromAxes(index);
    if (hat.up)    return Direction::Up;
    if (hat.down)  return Direction::Down;
    if (hat.left)  return Direction::Left;
    if (hat.right) return Direction::Right;

    // Stick: negative Y is up. Vertical wins when it dominates.
    StickVector stick = getLeftStick(index);
    if (std::abs(stick.y) > std::abs(stick.x)) {
        if (stick.y < -stickThreshold) return Direction::Up;
        if (stick.y >  stickThreshold) return Direction::Down;
    } else {
        if (stick.x < -stickThreshold) return Direction::Left;
        if (stick.x >  stickThreshold) return Direction::Right;
    }

    return std::nullopt;
}

// ---------------------------------------------------------------------------
// Configuration
// ---------------------------------------------------------------------------

void ControllerService::setDeadzone(float deadzone) {
    if (!std::isfinite(deadzone)) deadzone = DEFAULT_DEADZONE;
    m_deadzone = std::clamp(deadzone, 0.0f, MAX_DEADZONE);
    LOG_DEBUG("Analog deadzone set to {:.2f}", m_deadzone);
}

const ButtonMapping& ControllerService::getDefaultMapping(ControllerType type) {
    return ::tenfoot::getDefaultMapping(type);
}

const ButtonMapping& ControllerService::resolveMapping(const std::string& rawId,
                                                       ControllerType type) const {
    auto it = m_mappingOverrides.find(rawId);
    if (it != m_mappingOverrides.end()) {
        return it->second;
    }
    return ::tenfoot::getDefaultMapping(type);
}

void ControllerService::setMappingOverride(const std::string& rawId, const ButtonMapping& mapping) {
    m_mappingOverrides[rawId] = mapping;
    for (auto& [index, record] : m_controllers) {
        if (record.snapshot.rawId == rawId) {
            record.mapping = mapping;
            LOG_DEBUG("Controller {} now uses a custom button mapping", index);
        }
    }
}

void ControllerService::clearMappingOverrides() {
    m_mappingOverrides.clear();
    for (auto& [index, record] : m_controllers) {
        record.mapping = ::tenfoot::getDefaultMapping(record.snapshot.type);
    }
}

const ButtonMapping* ControllerService::getMapping(int index) const {
    const auto* record = find(index);
    return record ? &record->mapping : nullptr;
}

// ---------------------------------------------------------------------------
// Listeners
// ---------------------------------------------------------------------------

ListenerId ControllerService::subscribe(ControllersListener listener) {
    ListenerId id = m_nextListenerId++;
    m_subscribers.push_back({id, std::move(listener)});
    return id;
}

ListenerId ControllerService::onConnection(ConnectionListener listener) {
    ListenerId id = m_nextListenerId++;
    m_connectionListeners.push_back({id, std::move(listener)});
    return id;
}

bool ControllerService::unsubscribe(ListenerId id) {
    auto matches = [id](const auto& entry) { return entry.id == id; };

    auto sub = std::find_if(m_subscribers.begin(), m_subscribers.end(), matches);
    if (sub != m_subscribers.end()) {
        m_subscribers.erase(sub);
        return true;
    }

    auto conn = std::find_if(m_connectionListeners.begin(), m_connectionListeners.end(), matches);
    if (conn != m_connectionListeners.end()) {
        m_connectionListeners.erase(conn);
        return true;
    }
    return false;
}

void ControllerService::notifyConnection(const ControllerSnapshot& snapshot, bool connected) {
    // Copy so listeners may (un)subscribe from inside the callback
    auto listeners = m_connectionListeners;
    for (const auto& entry : listeners) {
        bool stillRegistered = std::any_of(m_connectionListeners.begin(), m_connectionListeners.end(),
            [&entry](const auto& current) { return current.id == entry.id; });
        if (stillRegistered && entry.callback) {
            entry.callback(snapshot, connected);
        }
    }
}

void ControllerService::notifySubscribers() {
    if (m_subscribers.empty()) return;

    std::vector<ControllerSnapshot> controllers = getControllers();
    auto listeners = m_subscribers;
    for (const auto& entry : listeners) {
        bool stillRegistered = std::any_of(m_subscribers.begin(), m_subscribers.end(),
            [&entry](const auto& current) { return current.id == entry.id; });
        if (stillRegistered && entry.callback) {
            entry.callback(controllers);
        }
    }
}

} // namespace tenfoot
