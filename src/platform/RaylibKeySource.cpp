#include "platform/RaylibKeySource.hpp"

#include <raylib.h>

namespace tenfoot {

namespace {

bool isNavigationKey(int code) {
    switch (static_cast<Key>(code)) {
        case Key::A: case Key::D: case Key::S: case Key::W:
        case Key::Up: case Key::Down: case Key::Left: case Key::Right:
        case Key::PageUp: case Key::PageDown:
        case Key::Space: case Key::Enter: case Key::Escape:
        case Key::Backspace: case Key::Tab:
            return true;
        default:
            return false;
    }
}

} // anonymous namespace

std::optional<KeyPress> RaylibKeySource::nextKeyPress() {
    for (int code = GetKeyPressed(); code != 0; code = GetKeyPressed()) {
        if (!isNavigationKey(code)) continue;

        KeyPress press{static_cast<Key>(code)};
        press.shift = IsKeyDown(KEY_LEFT_SHIFT) || IsKeyDown(KEY_RIGHT_SHIFT);
        return press;
    }
    return std::nullopt;
}

} // namespace tenfoot
