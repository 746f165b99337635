#include "input/ActionGlyphs.hpp"
#include "input/ButtonMapping.hpp"

namespace tenfoot {

namespace {

std::string sharedLabel(ButtonAction action) {
    switch (action) {
        case ButtonAction::DpadUp:    return "D-Up";
        case ButtonAction::DpadDown:  return "D-Down";
        case ButtonAction::DpadLeft:  return "D-Left";
        case ButtonAction::DpadRight: return "D-Right";
        default: break;
    }
    return "?";
}

} // anonymous namespace

std::string ActionGlyphs::getLabel(ButtonAction action, ControllerType type) {
    switch (type) {
        case ControllerType::Xbox:
            switch (action) {
                case ButtonAction::Confirm:      return "A";
                case ButtonAction::Back:         return "B";
                case ButtonAction::Option1:      return "X";
                case ButtonAction::Option2:      return "Y";
                case ButtonAction::LeftBumper:   return "LB";
                case ButtonAction::RightBumper:  return "RB";
                case ButtonAction::LeftTrigger:  return "LT";
                case ButtonAction::RightTrigger: return "RT";
                case ButtonAction::Select:       return "View";
                case ButtonAction::Start:        return "Menu";
                case ButtonAction::LeftStick:    return "LS";
                case ButtonAction::RightStick:   return "RS";
                case ButtonAction::Home:         return "Guide";
                default: break;
            }
            break;

        case ControllerType::PlayStation:
            switch (action) {
                case ButtonAction::Confirm:      return "Cross";
                case ButtonAction::Back:         return "Circle";
                case ButtonAction::Option1:      return "Square";
                case ButtonAction::Option2:      return "Triangle";
                case ButtonAction::LeftBumper:   return "L1";
                case ButtonAction::RightBumper:  return "R1";
                case ButtonAction::LeftTrigger:  return "L2";
                case ButtonAction::RightTrigger: return "R2";
                case ButtonAction::Select:       return "Share";
                case ButtonAction::Start:        return "Options";
                case ButtonAction::LeftStick:    return "L3";
                case ButtonAction::RightStick:   return "R3";
                case ButtonAction::Home:         return "PS";
                default: break;
            }
            break;

        case ControllerType::Nintendo:
            switch (action) {
                case ButtonAction::Confirm:      return "A";
                case ButtonAction::Back:         return "B";
                case ButtonAction::Option1:      return "Y";
                case ButtonAction::Option2:      return "X";
                case ButtonAction::LeftBumper:   return "L";
                case ButtonAction::RightBumper:  return "R";
                case ButtonAction::LeftTrigger:  return "ZL";
                case ButtonAction::RightTrigger: return "ZR";
                case ButtonAction::Select:       return "Minus";
                case ButtonAction::Start:        return "Plus";
                case ButtonAction::LeftStick:    return "LS";
                case ButtonAction::RightStick:   return "RS";
                case ButtonAction::Home:         return "Home";
                default: break;
            }
            break;

        case ControllerType::Generic:
            switch (action) {
                case ButtonAction::Confirm:      return "A";
                case ButtonAction::Back:         return "B";
                case ButtonAction::Option1:      return "X";
                case ButtonAction::Option2:      return "Y";
                case ButtonAction::LeftBumper:   return "LB";
                case ButtonAction::RightBumper:  return "RB";
                case ButtonAction::LeftTrigger:  return "LT";
                case ButtonAction::RightTrigger: return "RT";
                case ButtonAction::Select:       return "Select";
                case ButtonAction::Start:        return "Start";
                case ButtonAction::LeftStick:    return "LS";
                case ButtonAction::RightStick:   return "RS";
                case ButtonAction::Home:         return "Home";
                default: break;
            }
            break;
    }
    return sharedLabel(action);
}

std::string ActionGlyphs::getLabel(ButtonAction action, ControllerType type,
                                   const ButtonMapping& mapping) {
    int physical = mapping.indexOf(action);
    const ButtonMapping& defaults = getDefaultMapping(type);
    for (std::size_t i = 0; i < BUTTON_ACTION_COUNT; ++i) {
        auto candidate = static_cast<ButtonAction>(i);
        if (defaults.indexOf(candidate) == physical) {
            return getLabel(candidate, type);
        }
    }
    return "Button " + std::to_string(physical);
}

std::string ActionGlyphs::getLabel(ButtonAction action, const ControllerSnapshot* controller,
                                   const ButtonMapping* mapping) {
    if (!controller) {
        return getLabel(action, ControllerType::Xbox);
    }
    if (!mapping) {
        return getLabel(action, controller->type);
    }
    return getLabel(action, controller->type, *mapping);
}

} // namespace tenfoot
