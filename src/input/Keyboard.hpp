#pragma once

#include <optional>

namespace tenfoot {

/// Keys the navigation keyboard fallback understands. Values match the
/// raylib/GLFW key codes so backends can cast directly.
enum class Key : int {
    A = 65, D = 68, S = 83, W = 87,

    Up = 265, Down = 264, Left = 263, Right = 262,
    PageUp = 266, PageDown = 267,

    Space = 32,
    Enter = 257,
    Escape = 256,
    Backspace = 259,
    Tab = 258,

    LeftShift = 340, RightShift = 344,
};

/// A key press as delivered to the UI: the key plus the Shift state at the
/// moment it went down.
struct KeyPress {
    Key  key;
    bool shift = false;
};

/// Source of keyboard presses, one entry per key-down in arrival order.
class KeySource {
public:
    virtual ~KeySource() = default;

    /// Next queued press this frame, or empty when drained.
    virtual std::optional<KeyPress> nextKeyPress() = 0;
};

} // namespace tenfoot
