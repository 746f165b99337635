#pragma once

#include "input/ControllerTypes.hpp"

#include <string>

namespace tenfoot {

/// Button prompt labels for the hint bar ("A Select  B Back"), following the
/// printed legend of each controller family. A Nintendo controller shows "A"
/// for confirm even though it sits where Xbox has "B".
class ActionGlyphs {
public:
    /// Label for `action` on a `type` controller with its default mapping
    /// (e.g. "Cross", "L1", "Plus").
    static std::string getLabel(ButtonAction action, ControllerType type);

    /// Label of the physical button `mapping` binds to `action`. A remapped
    /// confirm on slot 1 of an Xbox pad reads "B". Slots outside the family's
    /// default table read "Button N".
    static std::string getLabel(ButtonAction action, ControllerType type,
                                const ButtonMapping& mapping);

    /// Label for `controller`'s family and `mapping` (default table when
    /// null), or the Xbox label when there is no active controller
    /// (keyboard users still see a prompt).
    static std::string getLabel(ButtonAction action, const ControllerSnapshot* controller,
                                const ButtonMapping* mapping = nullptr);
};

} // namespace tenfoot
