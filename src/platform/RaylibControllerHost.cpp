#include "platform/RaylibControllerHost.hpp"

#include <raylib.h>

#include <array>

namespace tenfoot {

namespace {

// Standard slot -> raylib positional button
constexpr std::array<int, BUTTON_ACTION_COUNT> kStandardToRaylib = {
    GAMEPAD_BUTTON_RIGHT_FACE_DOWN,   // 0  south
    GAMEPAD_BUTTON_RIGHT_FACE_RIGHT,  // 1  east
    GAMEPAD_BUTTON_RIGHT_FACE_LEFT,   // 2  west
    GAMEPAD_BUTTON_RIGHT_FACE_UP,     // 3  north
    GAMEPAD_BUTTON_LEFT_TRIGGER_1,    // 4  left bumper
    GAMEPAD_BUTTON_RIGHT_TRIGGER_1,   // 5  right bumper
    GAMEPAD_BUTTON_LEFT_TRIGGER_2,    // 6  left trigger
    GAMEPAD_BUTTON_RIGHT_TRIGGER_2,   // 7  right trigger
    GAMEPAD_BUTTON_MIDDLE_LEFT,       // 8  select
    GAMEPAD_BUTTON_MIDDLE_RIGHT,      // 9  start
    GAMEPAD_BUTTON_LEFT_THUMB,        // 10
    GAMEPAD_BUTTON_RIGHT_THUMB,       // 11
    GAMEPAD_BUTTON_LEFT_FACE_UP,      // 12 d-pad
    GAMEPAD_BUTTON_LEFT_FACE_DOWN,    // 13
    GAMEPAD_BUTTON_LEFT_FACE_LEFT,    // 14
    GAMEPAD_BUTTON_LEFT_FACE_RIGHT,   // 15
    GAMEPAD_BUTTON_MIDDLE,            // 16 home
};

constexpr std::size_t LEFT_TRIGGER_SLOT  = 6;
constexpr std::size_t RIGHT_TRIGGER_SLOT = 7;

// raylib triggers rest at -1; the standard layout wants 0..1
float triggerValue(int index, int axis) {
    return (GetGamepadAxisMovement(index, axis) + 1.0f) * 0.5f;
}

} // anonymous namespace

std::vector<std::optional<RawControllerState>> RaylibControllerHost::readControllers() {
    std::vector<std::optional<RawControllerState>> slots(MAX_GAMEPADS);
    for (int i = 0; i < MAX_GAMEPADS; ++i) {
        if (IsGamepadAvailable(i)) {
            slots[i] = readController(i);
        }
    }
    return slots;
}

RawControllerState RaylibControllerHost::readController(int index) {
    RawControllerState state;
    state.index = index;
    const char* name = GetGamepadName(index);
    state.id = name ? name : "";
    state.connected = true;

    state.buttons.resize(BUTTON_ACTION_COUNT);
    for (std::size_t slot = 0; slot < BUTTON_ACTION_COUNT; ++slot) {
        bool down = IsGamepadButtonDown(index, kStandardToRaylib[slot]);
        state.buttons[slot] = ButtonState{down, down ? 1.0f : 0.0f};
    }
    state.buttons[LEFT_TRIGGER_SLOT].value = triggerValue(index, GAMEPAD_AXIS_LEFT_TRIGGER);
    state.buttons[RIGHT_TRIGGER_SLOT].value = triggerValue(index, GAMEPAD_AXIS_RIGHT_TRIGGER);

    // raylib reports the d-pad as buttons only, so the standard four axes suffice
    state.axes = {
        GetGamepadAxisMovement(index, GAMEPAD_AXIS_LEFT_X),
        GetGamepadAxisMovement(index, GAMEPAD_AXIS_LEFT_Y),
        GetGamepadAxisMovement(index, GAMEPAD_AXIS_RIGHT_X),
        GetGamepadAxisMovement(index, GAMEPAD_AXIS_RIGHT_Y),
    };
    return state;
}

} // namespace tenfoot
