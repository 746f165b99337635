#include "app/InputHub.hpp"
#include "nav/NavigationCoordinator.hpp"
#include "engine/Log.hpp"

#include <algorithm>
#include <cstdint>
#include <vector>

namespace tenfoot {

InputHub::InputHub(ControllerHost& host)
    : m_service(host) {
    m_connectionListener = m_service.onConnection(
        [this](const ControllerSnapshot& controller, bool connected) {
            onConnectionChanged(controller, connected);
        });
}

InputHub::~InputHub() {
    m_service.unsubscribe(m_connectionListener);
}

void InputHub::applySettings(const InputSettings& settings) {
    m_settings = settings;

    m_service.setDeadzone(settings.analogDeadzone);
    m_service.clearMappingOverrides();
    for (const auto& [rawId, mapping] : settings.controllerMappings) {
        m_service.setMappingOverride(rawId, mapping);
    }

    for (auto* coordinator : m_coordinators) {
        coordinator->setDefaultRepeatTiming(settings.dpadRepeatDelay, settings.dpadRepeatRate);
    }

    LOG_DEBUG("Input settings applied: deadzone {:.2f}, repeat {}ms/{}ms, {} mapping override(s)",
              settings.analogDeadzone, settings.dpadRepeatDelay, settings.dpadRepeatRate,
              settings.controllerMappings.size());
}

void InputHub::tick(double nowMs) {
    m_service.poll();

    // Callbacks may add or remove coordinators (opening a dialog, closing a
    // menu). Work from a copy and skip anything removed meanwhile.
    auto coordinators = m_coordinators;
    for (auto* coordinator : coordinators) {
        if (!isRegistered(coordinator)) continue;
        coordinator->update(m_service, nowMs, m_activeController);
    }
}

bool InputHub::handleKeyPress(const KeyPress& press) {
    // Only scopes live before the press see it. One enabled by a handler
    // during this dispatch (a dialog opened by Enter) starts with the next key.
    struct LiveScope {
        NavigationCoordinator* coordinator;
        uint64_t generation;
    };
    std::vector<LiveScope> live;
    for (auto* coordinator : m_coordinators) {
        if (coordinator->isEnabled()) {
            live.push_back({coordinator, coordinator->getEnableGeneration()});
        }
    }

    bool handled = false;
    for (const auto& scope : live) {
        if (!isRegistered(scope.coordinator)) continue;
        if (scope.coordinator->getEnableGeneration() != scope.generation) continue;
        if (scope.coordinator->handleKeyPress(press, m_service)) {
            handled = true;
        }
    }
    return handled;
}

int InputHub::drainKeys(KeySource& source) {
    int handled = 0;
    while (auto press = source.nextKeyPress()) {
        if (handleKeyPress(*press)) {
            ++handled;
        }
    }
    return handled;
}

void InputHub::addCoordinator(NavigationCoordinator* coordinator) {
    if (!coordinator || isRegistered(coordinator)) return;
    coordinator->setDefaultRepeatTiming(m_settings.dpadRepeatDelay, m_settings.dpadRepeatRate);
    m_coordinators.push_back(coordinator);
}

void InputHub::removeCoordinator(NavigationCoordinator* coordinator) {
    m_coordinators.erase(std::remove(m_coordinators.begin(), m_coordinators.end(), coordinator),
                         m_coordinators.end());
}

bool InputHub::isRegistered(const NavigationCoordinator* coordinator) const {
    return std::find(m_coordinators.begin(), m_coordinators.end(), coordinator) != m_coordinators.end();
}

std::optional<ControllerSnapshot> InputHub::getActiveSnapshot() const {
    if (!m_activeController) return std::nullopt;
    return m_service.getController(*m_activeController);
}

void InputHub::onConnectionChanged(const ControllerSnapshot& controller, bool connected) {
    if (connected) {
        if (!m_activeController) {
            m_activeController = controller.index;
            LOG_INFO("Active controller: {} '{}' ({})", controller.index,
                     controller.displayName, toString(controller.type));
        }
        return;
    }

    if (m_activeController != controller.index) return;

    // The service drops the controller before notifying, so this picks
    // among the ones still connected.
    m_activeController = m_service.getFirstControllerIndex();
    if (m_activeController) {
        auto next = m_service.getController(*m_activeController);
        LOG_INFO("Active controller: {} '{}' ({})", *m_activeController,
                 next ? next->displayName : std::string("?"),
                 next ? toString(next->type) : "generic");
    } else {
        LOG_INFO("No controller connected; keyboard navigation active");
    }
}

} // namespace tenfoot
