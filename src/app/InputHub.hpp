#pragma once

#include "input/ControllerService.hpp"
#include "input/InputSettings.hpp"
#include "input/Keyboard.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace tenfoot {

class NavigationCoordinator;

/// Application-root composition point for controller input.
///
/// Owns the ControllerService, keeps track of which controller is "active"
/// (the first one connected, re-selected when it goes away), and drives the
/// registered navigation coordinators once per tick. Coordinators are not
/// owned; remove them before destroying them.
class InputHub {
public:
    explicit InputHub(ControllerHost& host);
    ~InputHub();

    InputHub(const InputHub&) = delete;
    InputHub& operator=(const InputHub&) = delete;

    /// Push deadzone, mapping overrides and default repeat timing into the
    /// service and every registered coordinator. Safe to call at any time.
    void applySettings(const InputSettings& settings);
    const InputSettings& getSettings() const { return m_settings; }

    /// Poll the service, then update every enabled coordinator.
    void tick(double nowMs);

    /// Forward a key press to the registered coordinators. Returns true if
    /// any of them handled it.
    bool handleKeyPress(const KeyPress& press);

    /// Forward every queued press from `source`. Returns how many were handled.
    int drainKeys(KeySource& source);

    void addCoordinator(NavigationCoordinator* coordinator);
    void removeCoordinator(NavigationCoordinator* coordinator);
    std::size_t getCoordinatorCount() const { return m_coordinators.size(); }

    std::optional<int> getActiveController() const { return m_activeController; }
    void setActiveController(std::optional<int> index) { m_activeController = index; }

    /// Snapshot of the active controller, if one is connected.
    std::optional<ControllerSnapshot> getActiveSnapshot() const;

    ControllerService&       getService()       { return m_service; }
    const ControllerService& getService() const { return m_service; }

private:
    void onConnectionChanged(const ControllerSnapshot& controller, bool connected);
    bool isRegistered(const NavigationCoordinator* coordinator) const;

    ControllerService m_service;
    InputSettings     m_settings;
    ListenerId        m_connectionListener = 0;

    std::optional<int> m_activeController;
    std::vector<NavigationCoordinator*> m_coordinators;
};

} // namespace tenfoot
