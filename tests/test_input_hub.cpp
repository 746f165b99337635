#include <gtest/gtest.h>
#include "app/InputHub.hpp"
#include "nav/NavigationCoordinator.hpp"
#include "FakeControllerHost.hpp"

#include <deque>

using namespace tenfoot;

namespace {

constexpr int BTN_A       = 0;
constexpr int BTN_B       = 1;
constexpr int BTN_DPAD_UP = 12;

class ScriptedKeySource : public KeySource {
public:
    std::optional<KeyPress> nextKeyPress() override {
        if (presses.empty()) return std::nullopt;
        KeyPress press = presses.front();
        presses.pop_front();
        return press;
    }
    std::deque<KeyPress> presses;
};

} // anonymous namespace

class InputHubTest : public ::testing::Test {
protected:
    FakeControllerHost host;
    InputHub hub{host};
};

// ============================================================================
// Active controller
// ============================================================================

TEST_F(InputHubTest, NoActiveControllerInitially) {
    hub.tick(0);
    EXPECT_FALSE(hub.getActiveController().has_value());
    EXPECT_FALSE(hub.getActiveSnapshot().has_value());
}

TEST_F(InputHubTest, FirstConnectedBecomesActive) {
    host.connect(1, "DualSense Wireless Controller");
    hub.tick(0);
    EXPECT_EQ(hub.getActiveController(), 1);

    host.connect(0);
    hub.tick(16);
    EXPECT_EQ(hub.getActiveController(), 1);

    auto active = hub.getActiveSnapshot();
    ASSERT_TRUE(active.has_value());
    EXPECT_EQ(active->type, ControllerType::PlayStation);
}

TEST_F(InputHubTest, ActiveDisconnectSelectsRemaining) {
    host.connect(0);
    host.connect(2, "Pro Controller");
    hub.tick(0);
    ASSERT_EQ(hub.getActiveController(), 0);

    host.disconnect(0);
    hub.tick(16);
    EXPECT_EQ(hub.getActiveController(), 2);

    host.disconnect(2);
    hub.tick(32);
    EXPECT_FALSE(hub.getActiveController().has_value());
}

TEST_F(InputHubTest, OtherDisconnectKeepsActive) {
    host.connect(0);
    host.connect(1);
    hub.tick(0);

    host.disconnect(1);
    hub.tick(16);
    EXPECT_EQ(hub.getActiveController(), 0);
}

// ============================================================================
// Settings
// ============================================================================

TEST_F(InputHubTest, ApplySettingsConfiguresServiceAndCoordinators) {
    NavigationCoordinator coordinator;
    hub.addCoordinator(&coordinator);

    InputSettings settings;
    settings.analogDeadzone = 0.3f;
    settings.dpadRepeatDelay = 250;
    settings.dpadRepeatRate = 50;
    ButtonMapping swapped = ControllerService::getDefaultMapping(ControllerType::Xbox);
    swapped.buttons[0] = 1;
    swapped.buttons[1] = 0;
    settings.controllerMappings[FakeControllerHost::XBOX_ID] = swapped;
    hub.applySettings(settings);

    EXPECT_FLOAT_EQ(hub.getService().getDeadzone(), 0.3f);
    EXPECT_EQ(coordinator.getRepeatDelayMs(), 250);
    EXPECT_EQ(coordinator.getRepeatRateMs(), 50);

    host.connect(0);
    host.setButton(0, BTN_B, true);
    hub.tick(0);
    EXPECT_TRUE(hub.getService().isActionPressed(0, ButtonAction::Confirm));

    hub.removeCoordinator(&coordinator);
}

TEST_F(InputHubTest, CoordinatorAddedLaterGetsCurrentRepeatTiming) {
    InputSettings settings;
    settings.dpadRepeatDelay = 300;
    hub.applySettings(settings);

    NavigationCoordinator coordinator;
    hub.addCoordinator(&coordinator);
    EXPECT_EQ(coordinator.getRepeatDelayMs(), 300);
    hub.removeCoordinator(&coordinator);
}

TEST_F(InputHubTest, ReapplyingSettingsClearsOldOverrides) {
    InputSettings settings;
    ButtonMapping custom = ControllerService::getDefaultMapping(ControllerType::Xbox);
    custom.buttons[0] = 3;
    settings.controllerMappings[FakeControllerHost::XBOX_ID] = custom;
    hub.applySettings(settings);

    host.connect(0);
    hub.tick(0);
    EXPECT_EQ(hub.getService().getMapping(0)->indexOf(ButtonAction::Confirm), 3);

    hub.applySettings(InputSettings{});
    EXPECT_EQ(hub.getService().getMapping(0)->indexOf(ButtonAction::Confirm), 0);
}

// ============================================================================
// Coordinators
// ============================================================================

TEST_F(InputHubTest, TickDrivesRegisteredCoordinators) {
    int confirms = 0;
    NavigationCoordinator coordinator;
    NavigationCallbacks cbs;
    cbs.onConfirm = [&confirms]() { ++confirms; };
    coordinator.setCallbacks(std::move(cbs));
    hub.addCoordinator(&coordinator);
    hub.addCoordinator(&coordinator);
    EXPECT_EQ(hub.getCoordinatorCount(), 1u);

    host.connect(0);
    hub.tick(0);
    host.setButton(0, BTN_A, true);
    hub.tick(16);
    EXPECT_EQ(confirms, 1);

    hub.removeCoordinator(&coordinator);
    host.setButton(0, BTN_A, false);
    hub.tick(32);
    host.setButton(0, BTN_A, true);
    hub.tick(48);
    EXPECT_EQ(confirms, 1);
}

TEST_F(InputHubTest, CoordinatorsFollowActiveController) {
    int confirms = 0;
    NavigationCoordinator coordinator;
    NavigationCallbacks cbs;
    cbs.onConfirm = [&confirms]() { ++confirms; };
    coordinator.setCallbacks(std::move(cbs));
    hub.addCoordinator(&coordinator);

    host.connect(0);
    host.connect(1);
    hub.tick(0);
    hub.setActiveController(1);

    host.setButton(0, BTN_A, true);
    hub.tick(16);
    EXPECT_EQ(confirms, 0);

    host.setButton(1, BTN_A, true);
    hub.tick(32);
    EXPECT_EQ(confirms, 1);

    hub.removeCoordinator(&coordinator);
}

TEST_F(InputHubTest, ModalHandOffArmsIncomingScope) {
    // Confirm on the list opens a dialog; the still-held button must not
    // also confirm inside the dialog.
    int dialogConfirms = 0;
    int dialogBacks = 0;
    NavigationCoordinator list;
    NavigationCoordinator dialog;

    NavigationCallbacks listCbs;
    listCbs.onConfirm = [&]() {
        list.setEnabled(false);
        dialog.setEnabled(true);
    };
    list.setCallbacks(std::move(listCbs));

    NavigationCallbacks dialogCbs;
    dialogCbs.onConfirm = [&dialogConfirms]() { ++dialogConfirms; };
    dialogCbs.onBack = [&dialogBacks]() { ++dialogBacks; };
    dialog.setCallbacks(std::move(dialogCbs));
    dialog.setEnabled(false);

    hub.addCoordinator(&list);
    hub.addCoordinator(&dialog);

    host.connect(0);
    hub.tick(0);
    host.setButton(0, BTN_A, true);
    hub.tick(16);
    hub.tick(32);
    hub.tick(48);
    EXPECT_FALSE(list.isEnabled());
    EXPECT_EQ(dialogConfirms, 0);

    host.setButton(0, BTN_B, true);
    hub.tick(64);
    EXPECT_EQ(dialogBacks, 1);

    hub.removeCoordinator(&dialog);
    hub.removeCoordinator(&list);
}

TEST_F(InputHubTest, RemovingCoordinatorDuringTickSkipsIt) {
    NavigationCoordinator first;
    NavigationCoordinator second;
    int secondNavigates = 0;

    NavigationCallbacks firstCbs;
    firstCbs.onNavigate = [&](Direction) { hub.removeCoordinator(&second); };
    first.setCallbacks(std::move(firstCbs));

    NavigationCallbacks secondCbs;
    secondCbs.onNavigate = [&secondNavigates](Direction) { ++secondNavigates; };
    second.setCallbacks(std::move(secondCbs));

    hub.addCoordinator(&first);
    hub.addCoordinator(&second);

    host.connect(0);
    hub.tick(0);
    host.setButton(0, BTN_DPAD_UP, true);
    hub.tick(16);

    EXPECT_EQ(secondNavigates, 0);
    EXPECT_EQ(hub.getCoordinatorCount(), 1u);
    hub.removeCoordinator(&first);
}

// ============================================================================
// Keyboard
// ============================================================================

TEST_F(InputHubTest, DrainKeysForwardsToCoordinators) {
    std::vector<Direction> directions;
    NavigationCoordinator coordinator;
    NavigationCallbacks cbs;
    cbs.onNavigate = [&directions](Direction d) { directions.push_back(d); };
    coordinator.setCallbacks(std::move(cbs));
    hub.addCoordinator(&coordinator);

    ScriptedKeySource keys;
    keys.presses = {{Key::Down}, {Key::W}, {Key::Enter}};
    hub.tick(0);

    EXPECT_EQ(hub.drainKeys(keys), 2);
    EXPECT_TRUE(keys.presses.empty());
    ASSERT_EQ(directions.size(), 2u);
    EXPECT_EQ(directions[0], Direction::Down);
    EXPECT_EQ(directions[1], Direction::Up);

    hub.removeCoordinator(&coordinator);
}

TEST_F(InputHubTest, KeysIgnoredWithControllerConnected) {
    int confirms = 0;
    NavigationCoordinator coordinator;
    NavigationCallbacks cbs;
    cbs.onConfirm = [&confirms]() { ++confirms; };
    coordinator.setCallbacks(std::move(cbs));
    hub.addCoordinator(&coordinator);

    host.connect(0);
    hub.tick(0);
    EXPECT_FALSE(hub.handleKeyPress({Key::Enter}));
    EXPECT_EQ(confirms, 0);

    hub.removeCoordinator(&coordinator);
}

TEST_F(InputHubTest, KeyPressDoesNotReachScopeEnabledDuringDispatch) {
    int gridConfirms = 0;
    int dialogConfirms = 0;
    NavigationConfig closed;
    closed.enabled = false;
    NavigationCoordinator grid;
    NavigationCoordinator dialog(closed);

    NavigationCallbacks dialogCbs;
    dialogCbs.onConfirm = [&dialogConfirms]() { ++dialogConfirms; };
    dialog.setCallbacks(std::move(dialogCbs));

    NavigationCallbacks gridCbs;
    gridCbs.onConfirm = [&]() {
        ++gridConfirms;
        grid.setEnabled(false);
        dialog.setEnabled(true);
    };
    grid.setCallbacks(std::move(gridCbs));

    hub.addCoordinator(&grid);
    hub.addCoordinator(&dialog);
    hub.tick(0);

    // Enter opens the dialog; the same press must not also confirm it
    EXPECT_TRUE(hub.handleKeyPress({Key::Enter}));
    EXPECT_EQ(gridConfirms, 1);
    EXPECT_EQ(dialogConfirms, 0);

    EXPECT_TRUE(hub.handleKeyPress({Key::Enter}));
    EXPECT_EQ(gridConfirms, 1);
    EXPECT_EQ(dialogConfirms, 1);

    hub.removeCoordinator(&grid);
    hub.removeCoordinator(&dialog);
}

TEST_F(InputHubTest, ScopeReenabledDuringDispatchWaitsForNextKey) {
    int confirms = 0;
    NavigationCoordinator first;
    NavigationCoordinator second;

    NavigationCallbacks firstCbs;
    firstCbs.onConfirm = [&second]() {
        second.setEnabled(false);
        second.setEnabled(true);
    };
    first.setCallbacks(std::move(firstCbs));

    NavigationCallbacks secondCbs;
    secondCbs.onConfirm = [&confirms]() { ++confirms; };
    second.setCallbacks(std::move(secondCbs));

    hub.addCoordinator(&first);
    hub.addCoordinator(&second);
    hub.tick(0);

    hub.handleKeyPress({Key::Enter});
    EXPECT_EQ(confirms, 0);

    hub.removeCoordinator(&first);
    hub.removeCoordinator(&second);
}
