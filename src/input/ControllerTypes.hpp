#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace tenfoot {

/// Controller vendor family, classified once from the host id string.
enum class ControllerType : int {
    Xbox,
    PlayStation,
    Nintendo,
    Generic,
};

/// Vendor-independent input names. Values double as the canonical physical
/// slot on an Xbox-layout controller (W3C "standard" gamepad order).
enum class ButtonAction : int {
    // Face buttons
    Confirm      = 0,   // A / Cross (south)
    Back         = 1,   // B / Circle (east)
    Option1      = 2,   // X / Square (west)
    Option2      = 3,   // Y / Triangle (north)

    // Shoulders
    LeftBumper   = 4,
    RightBumper  = 5,
    LeftTrigger  = 6,
    RightTrigger = 7,

    // Center buttons
    Select       = 8,   // View / Share / Minus
    Start        = 9,   // Menu / Options / Plus

    // Stick clicks
    LeftStick    = 10,
    RightStick   = 11,

    // D-pad
    DpadUp       = 12,
    DpadDown     = 13,
    DpadLeft     = 14,
    DpadRight    = 15,

    Home         = 16,  // Guide / PS / Home
};

constexpr std::size_t BUTTON_ACTION_COUNT = 17;

/// Discrete navigation direction. "No direction" is an empty optional.
enum class Direction : int {
    Up,
    Down,
    Left,
    Right,
};

/// Axis slots as reported by the host.
enum class ControllerAxis : int {
    LeftX      = 0,
    LeftY      = 1,
    RightX     = 2,
    RightY     = 3,
    DpadHatX   = 6,   // Some Linux drivers report the D-pad on axes 6/7
    DpadHatY   = 7,
};

struct ButtonState {
    bool  pressed = false;
    float value   = 0.0f;
};

/// Deadzone-corrected stick vector, each component in [-1, 1].
struct StickVector {
    float x = 0.0f;
    float y = 0.0f;
};

/// D-pad as read from hat axes.
struct DpadAxes {
    bool up    = false;
    bool down  = false;
    bool left  = false;
    bool right = false;
};

/// Logical action -> physical button index for one controller family.
struct ButtonMapping {
    std::array<int, BUTTON_ACTION_COUNT> buttons{};

    int indexOf(ButtonAction action) const {
        return buttons[static_cast<std::size_t>(action)];
    }

    bool operator==(const ButtonMapping& other) const { return buttons == other.buttons; }
    bool operator!=(const ButtonMapping& other) const { return !(*this == other); }
};

/// Per-tick state of one connected controller.
struct ControllerSnapshot {
    int            index = -1;
    std::string    rawId;
    ControllerType type = ControllerType::Generic;
    std::string    displayName;
    std::vector<ButtonState> buttons;
    std::vector<float>       axes;      // raw, deadzone is applied on read
    bool           connected = false;
};

const char* toString(ControllerType type);
const char* toString(Direction direction);

/// Config name of an action ("confirm", "lb", "dpadUp", ...).
const char* actionName(ButtonAction action);

/// Inverse of actionName(); empty if the name is unknown.
std::optional<ButtonAction> actionFromName(const std::string& name);

} // namespace tenfoot
