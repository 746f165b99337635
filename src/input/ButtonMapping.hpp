#pragma once

#include "input/ControllerTypes.hpp"

#include <string>

namespace tenfoot {

/// Default logical -> physical table for a controller family.
/// Xbox, PlayStation and Generic share the standard layout; Nintendo swaps
/// confirm/back and option1/option2 because A/B and X/Y are mirrored on its
/// face buttons.
const ButtonMapping& getDefaultMapping(ControllerType type);

/// Physical button index bound to `action` on the default table for `type`.
int getButtonIndex(ButtonAction action, ControllerType type);

/// Classify a host id string by case-insensitive vendor token match.
/// Unrecognised ids are Generic.
ControllerType classifyController(const std::string& rawId);

/// Human-readable name: the id up to the first '(' with surrounding
/// whitespace removed, or a per-family fallback if that is unusable.
std::string controllerDisplayName(const std::string& rawId, ControllerType type);

} // namespace tenfoot
