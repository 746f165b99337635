#include "input/ControllerTypes.hpp"

namespace tenfoot {

namespace {

constexpr std::array<const char*, BUTTON_ACTION_COUNT> kActionNames = {
    "confirm", "back", "option1", "option2",
    "lb", "rb", "lt", "rt",
    "select", "start",
    "l3", "r3",
    "dpadUp", "dpadDown", "dpadLeft", "dpadRight",
    "home",
};

} // anonymous namespace

const char* toString(ControllerType type) {
    switch (type) {
        case ControllerType::Xbox:        return "xbox";
        case ControllerType::PlayStation: return "playstation";
        case ControllerType::Nintendo:    return "nintendo";
        case ControllerType::Generic:     return "generic";
    }
    return "generic";
}

const char* toString(Direction direction) {
    switch (direction) {
        case Direction::Up:    return "up";
        case Direction::Down:  return "down";
        case Direction::Left:  return "left";
        case Direction::Right: return "right";
    }
    return "?";
}

const char* actionName(ButtonAction action) {
    auto i = static_cast<std::size_t>(action);
    return i < kActionNames.size() ? kActionNames[i] : "?";
}

std::optional<ButtonAction> actionFromName(const std::string& name) {
    for (std::size_t i = 0; i < kActionNames.size(); ++i) {
        if (name == kActionNames[i]) {
            return static_cast<ButtonAction>(i);
        }
    }
    return std::nullopt;
}

} // namespace tenfoot
