#pragma once

#include "input/ControllerTypes.hpp"
#include "input/ControllerHost.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace tenfoot {

/// Handle for removing a listener registered on ControllerService.
using ListenerId = uint64_t;

/// Fired after every poll with all connected controllers.
using ControllersListener = std::function<void(const std::vector<ControllerSnapshot>&)>;

/// Fired on connect (connected = true) and disconnect (connected = false).
using ConnectionListener = std::function<void(const ControllerSnapshot&, bool connected)>;

/// Single source of truth for "what are the controllers doing right now".
///
/// poll() is called once per display refresh by the application root. All
/// queries are plain reads of the state captured by the last poll, and every
/// query on an index that is not connected returns a neutral value (false,
/// zero vector, no direction) so UI code can ask every frame without checks.
class ControllerService {
public:
    explicit ControllerService(ControllerHost& host);

    /// Read the host's controller array, diff it against the tracked set,
    /// refresh button/axis state and edges, raise connection notifications,
    /// then notify subscribers with the full list.
    void poll();

    /// Host connect notification. Starts tracking the controller if it is
    /// not already known; a known index is left untouched.
    void handleConnected(const RawControllerState& raw);

    /// Host disconnect notification. Unknown indices are ignored.
    void handleDisconnected(int index);

    // --- Controller queries ---

    /// All connected controllers ordered by index.
    std::vector<ControllerSnapshot> getControllers() const;
    std::optional<ControllerSnapshot> getController(int index) const;
    std::optional<int> getFirstControllerIndex() const;
    int getConnectedCount() const { return static_cast<int>(m_controllers.size()); }
    bool isConnected(int index) const { return m_controllers.count(index) > 0; }

    // --- Action queries ---

    bool isActionPressed(int index, ButtonAction action) const;

    /// True only on the poll where the action's button went from released
    /// to pressed. Tracked here, so every consumer sees the same edge.
    bool isActionJustPressed(int index, ButtonAction action) const;

    // --- Analog queries (deadzone applied per axis) ---

    StickVector getLeftStick(int index) const;
    StickVector getRightStick(int index) const;

    /// D-pad reported on hat axes 6/7 (threshold 0.5).
    DpadAxes getDpadFromAxes(int index) const;

    /// D-pad buttons, then D-pad hat axes, then the left stick beyond
    /// `stickThreshold`. Within each source the order is up, down, left,
    /// right; the stick prefers its dominant axis.
    std::optional<Direction> getNavigationDirection(
        int index, float stickThreshold = DEFAULT_STICK_THRESHOLD) const;

    // --- Configuration ---

    /// Clamped to [0, MAX_DEADZONE]; applies to all later stick reads.
    void  setDeadzone(float deadzone);
    float getDeadzone() const { return m_deadzone; }

    /// Replace the default table for every controller reporting `rawId`.
    /// Applied immediately to matching connected controllers.
    void setMappingOverride(const std::string& rawId, const ButtonMapping& mapping);
    void clearMappingOverrides();

    /// Mapping in effect for a connected controller, or nullptr.
    const ButtonMapping* getMapping(int index) const;

    static const ButtonMapping& getDefaultMapping(ControllerType type);

    // --- Listeners ---

    ListenerId subscribe(ControllersListener listener);
    ListenerId onConnection(ConnectionListener listener);

    /// Remove a listener registered with subscribe() or onConnection().
    /// Takes effect immediately, including during a dispatch in progress.
    bool unsubscribe(ListenerId id);

    static constexpr float DEFAULT_DEADZONE        = 0.15f;
    static constexpr float MAX_DEADZONE            = 0.5f;
    static constexpr float DPAD_AXIS_THRESHOLD     = 0.5f;
    static constexpr float DEFAULT_STICK_THRESHOLD = 0.7f;

private:
    struct ControllerRecord {
        ControllerSnapshot snapshot;
        ButtonMapping      mapping;
        std::vector<bool>  previousPressed;
        std::vector<bool>  justPressed;
    };

    template <typename Fn>
    struct ListenerEntry {
        ListenerId id;
        Fn callback;
    };

    void track(const RawControllerState& raw);
    void refresh(ControllerRecord& record, const RawControllerState& raw);
    void untrack(int index);

    const ControllerRecord* find(int index) const;
    const ButtonMapping& resolveMapping(const std::string& rawId, ControllerType type) const;

    /// Physical slot for `action`, or -1 when the button array is too short.
    static int physicalSlot(const ControllerRecord& record, ButtonAction action);

    float readAxis(const ControllerRecord& record, ControllerAxis axis) const;
    float applyDeadzone(float value) const;

    void notifyConnection(const ControllerSnapshot& snapshot, bool connected);
    void notifySubscribers();

    ControllerHost& m_host;
    std::map<int, ControllerRecord> m_controllers;
    std::unordered_map<std::string, ButtonMapping> m_mappingOverrides;

    std::vector<ListenerEntry<ControllersListener>> m_subscribers;
    std::vector<ListenerEntry<ConnectionListener>>  m_connectionListeners;
    ListenerId m_nextListenerId = 1;

    float m_deadzone = DEFAULT_DEADZONE;
};

} // namespace tenfoot
