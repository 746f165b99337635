#pragma once

#include "input/Keyboard.hpp"

namespace tenfoot {

/// KeySource over raylib's per-frame key queue. Keys the navigation
/// fallback does not know are skipped.
class RaylibKeySource : public KeySource {
public:
    std::optional<KeyPress> nextKeyPress() override;
};

} // namespace tenfoot
