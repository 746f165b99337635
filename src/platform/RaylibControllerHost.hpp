#pragma once

#include "input/ControllerHost.hpp"

namespace tenfoot {

/// ControllerHost over raylib's gamepad API. raylib reports buttons by
/// position (right face down, left trigger 1...), which are laid out here
/// in the 17-slot standard order the mappings expect.
class RaylibControllerHost : public ControllerHost {
public:
    std::vector<std::optional<RawControllerState>> readControllers() override;

    static constexpr int MAX_GAMEPADS = 4;

private:
    static RawControllerState readController(int index);
};

} // namespace tenfoot
