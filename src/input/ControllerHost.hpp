#pragma once

#include "input/ControllerTypes.hpp"

#include <optional>
#include <string>
#include <vector>

namespace tenfoot {

/// One slot of the host platform's controller array, as read this tick.
struct RawControllerState {
    int         index = 0;
    std::string id;
    bool        connected = true;
    std::vector<ButtonState> buttons;
    std::vector<float>       axes;
};

/// Host platform controller API. Implementations wrap the real backend
/// (raylib, SDL, a browser bridge...) and must be cheap to call once per
/// display refresh.
class ControllerHost {
public:
    virtual ~ControllerHost() = default;

    /// Current controller array. Empty optionals are slots with nothing
    /// plugged in; the vector may be shorter than the host's slot count.
    virtual std::vector<std::optional<RawControllerState>> readControllers() = 0;
};

} // namespace tenfoot
