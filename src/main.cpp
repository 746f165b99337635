#include "app/InputHub.hpp"
#include "engine/Config.hpp"
#include "engine/FrameClock.hpp"
#include "engine/Log.hpp"
#include "input/ActionGlyphs.hpp"
#include "input/InputSettings.hpp"
#include "nav/NavigationCoordinator.hpp"
#include "platform/RaylibControllerHost.hpp"
#include "platform/RaylibKeySource.hpp"

#include <raylib.h>

#include <algorithm>
#include <string>

using namespace tenfoot;

namespace {

constexpr int GRID_COLUMNS = 4;
constexpr int GRID_ROWS    = 3;
constexpr int TILE_WIDTH   = 220;
constexpr int TILE_HEIGHT  = 140;
constexpr int TILE_GAP     = 24;

/// Text pane in the details dialog, scrolled by the right stick.
class DetailsPane : public ScrollTarget {
public:
    void scrollBy(float delta) override {
        m_offset = std::clamp(m_offset + delta, 0.0f, MAX_OFFSET);
    }
    void reset() { m_offset = 0.0f; }
    float getOffset() const { return m_offset; }

    static constexpr float MAX_OFFSET = 600.0f;

private:
    float m_offset = 0.0f;
};

struct DemoState {
    int  focusColumn = 0;
    int  focusRow    = 0;
    bool detailsOpen = false;
    bool quit        = false;
};

void moveFocus(DemoState& state, Direction direction) {
    switch (direction) {
        case Direction::Up:    state.focusRow    = std::max(0, state.focusRow - 1); break;
        case Direction::Down:  state.focusRow    = std::min(GRID_ROWS - 1, state.focusRow + 1); break;
        case Direction::Left:  state.focusColumn = std::max(0, state.focusColumn - 1); break;
        case Direction::Right: state.focusColumn = std::min(GRID_COLUMNS - 1, state.focusColumn + 1); break;
    }
}

std::string hint(const InputHub& hub, ButtonAction action,
                 const std::optional<ControllerSnapshot>& controller, const char* label) {
    if (!controller) {
        return ActionGlyphs::getLabel(action, nullptr) + " " + label;
    }
    const ButtonMapping* mapping = hub.getService().getMapping(controller->index);
    return ActionGlyphs::getLabel(action, &*controller, mapping) + " " + label;
}

void drawGrid(const DemoState& state) {
    for (int row = 0; row < GRID_ROWS; ++row) {
        for (int col = 0; col < GRID_COLUMNS; ++col) {
            int x = 60 + col * (TILE_WIDTH + TILE_GAP);
            int y = 80 + row * (TILE_HEIGHT + TILE_GAP);
            bool focused = col == state.focusColumn && row == state.focusRow;
            DrawRectangle(x, y, TILE_WIDTH, TILE_HEIGHT, focused ? SKYBLUE : DARKGRAY);
            if (focused) {
                DrawRectangleLinesEx({static_cast<float>(x) - 4, static_cast<float>(y) - 4,
                                      TILE_WIDTH + 8.0f, TILE_HEIGHT + 8.0f}, 3.0f, RAYWHITE);
            }
            DrawText(TextFormat("Item %d", row * GRID_COLUMNS + col + 1), x + 12, y + 12, 20, RAYWHITE);
        }
    }
}

void drawDetails(const DemoState& state, const DetailsPane& pane) {
    DrawRectangle(0, 0, GetScreenWidth(), GetScreenHeight(), Fade(BLACK, 0.6f));
    DrawRectangle(240, 120, 800, 440, Fade(DARKBLUE, 0.95f));
    DrawText(TextFormat("Item %d", state.focusRow * GRID_COLUMNS + state.focusColumn + 1),
             264, 140, 28, RAYWHITE);

    BeginScissorMode(264, 190, 752, 340);
    int y = 190 - static_cast<int>(pane.getOffset());
    for (int line = 0; line < 40; ++line) {
        DrawText(TextFormat("Details line %d", line + 1), 264, y + line * 24, 20, LIGHTGRAY);
    }
    EndScissorMode();
}

} // anonymous namespace

int main() {
    const std::string configPath = "config.json";

    Config config;
    if (!config.loadFromFile(configPath)) {
        Log::init("", "debug");
        LOG_WARN("Could not load config from '{}', using defaults", configPath);
    } else {
        Log::init(config.getString("logging.file", ""), config.getString("logging.level", "info"));
        LOG_INFO("Configuration loaded from '{}'", configPath);
    }

    InitWindow(config.getInt("window.width", 1280), config.getInt("window.height", 720),
               config.getString("window.title", "tenfoot demo").c_str());
    SetTargetFPS(config.getInt("window.fps", 60));
    SetExitKey(KEY_NULL);

    RaylibControllerHost host;
    RaylibKeySource keys;
    InputHub hub(host);
    hub.applySettings(InputSettings::fromConfig(config));

    DemoState state;
    DetailsPane pane;

    NavigationCoordinator grid;
    NavigationCoordinator details;

    NavigationCallbacks gridCallbacks;
    gridCallbacks.onNavigate = [&state](Direction d) { moveFocus(state, d); };
    gridCallbacks.onConfirm = [&]() {
        state.detailsOpen = true;
        pane.reset();
        grid.setEnabled(false);
        details.setEnabled(true);
    };
    gridCallbacks.onStart = [&state]() { state.quit = true; };
    grid.setCallbacks(std::move(gridCallbacks));

    NavigationCallbacks detailsCallbacks;
    detailsCallbacks.onBack = [&]() {
        state.detailsOpen = false;
        details.setEnabled(false);
        grid.setEnabled(true);
    };
    details.setCallbacks(std::move(detailsCallbacks));
    details.setScrollTarget(&pane);
    details.setEnabled(false);

    hub.addCoordinator(&grid);
    hub.addCoordinator(&details);

    FrameClock clock;
    while (!WindowShouldClose() && !state.quit) {
        clock.tick(GetFrameTime());
        hub.tick(clock.nowMs());
        hub.drainKeys(keys);

        BeginDrawing();
        ClearBackground({18, 20, 28, 255});
        drawGrid(state);
        if (state.detailsOpen) {
            drawDetails(state, pane);
        }

        auto active = hub.getActiveSnapshot();
        std::string hints = state.detailsOpen
            ? hint(hub, ButtonAction::Back, active, "Close")
            : hint(hub, ButtonAction::Confirm, active, "Open") + "   "
                + hint(hub, ButtonAction::Start, active, "Quit");
        DrawText(hints.c_str(), 60, GetScreenHeight() - 48, 22, RAYWHITE);
        DrawText(active ? active->displayName.c_str() : "Keyboard", 60, 24, 20, GRAY);
        EndDrawing();
    }

    hub.removeCoordinator(&details);
    hub.removeCoordinator(&grid);
    CloseWindow();
    LOG_INFO("Demo shut down after {} frames", clock.frameCount());
    Log::shutdown();
    return 0;
}
