#include "input/InputSettings.hpp"
#include "input/ButtonMapping.hpp"
#include "engine/Config.hpp"
#include "engine/Log.hpp"

#include <algorithm>

namespace tenfoot {

namespace {

int clampRepeat(int value, const char* key) {
    int clamped = std::clamp(value, InputSettings::MIN_REPEAT_MS, InputSettings::MAX_REPEAT_MS);
    if (clamped != value) {
        LOG_WARN("Settings: {}={} out of range, using {}", key, value, clamped);
    }
    return clamped;
}

/// Parse one stored mapping on top of the default table for the id's family.
bool parseMapping(const std::string& controllerId, const nlohmann::json& entry,
                  ButtonMapping& out) {
    if (!entry.is_object()) {
        LOG_WARN("Settings: mapping for '{}' is not an object, ignored", controllerId);
        return false;
    }

    out = getDefaultMapping(classifyController(controllerId));
    for (auto it = entry.begin(); it != entry.end(); ++it) {
        auto action = actionFromName(it.key());
        if (!action) {
            LOG_WARN("Settings: unknown action '{}' in mapping for '{}'", it.key(), controllerId);
            continue;
        }
        auto index = Config::toInt(*it);
        if (!index || *index < 0) {
            LOG_WARN("Settings: bad button index for '{}' in mapping for '{}'",
                     it.key(), controllerId);
            continue;
        }
        out.buttons[static_cast<std::size_t>(*action)] = *index;
    }
    return true;
}

} // anonymous namespace

InputSettings InputSettings::fromConfig(const Config& config) {
    InputSettings settings;

    float deadzone = config.getFloat("input.analogDeadzone", settings.analogDeadzone);
    settings.analogDeadzone = std::clamp(deadzone, 0.0f, 0.5f);

    settings.dpadRepeatDelay = clampRepeat(
        config.getInt("input.dpadRepeatDelay", settings.dpadRepeatDelay), "dpadRepeatDelay");
    settings.dpadRepeatRate = clampRepeat(
        config.getInt("input.dpadRepeatRate", settings.dpadRepeatRate), "dpadRepeatRate");

    if (const auto* mappings = config.getJson("input.controllerMappings")) {
        if (mappings->is_object()) {
            for (auto it = mappings->begin(); it != mappings->end(); ++it) {
                ButtonMapping mapping;
                if (parseMapping(it.key(), *it, mapping)) {
                    settings.controllerMappings[it.key()] = mapping;
                }
            }
        } else {
            LOG_WARN("Settings: input.controllerMappings is not an object, ignored");
        }
    }

    return settings;
}

void InputSettings::writeTo(Config& config) const {
    config.setFloat("input.analogDeadzone", analogDeadzone);
    config.setInt("input.dpadRepeatDelay", dpadRepeatDelay);
    config.setInt("input.dpadRepeatRate", dpadRepeatRate);

    nlohmann::json mappings = nlohmann::json::object();
    for (const auto& [controllerId, mapping] : controllerMappings) {
        nlohmann::json entry = nlohmann::json::object();
        for (std::size_t i = 0; i < BUTTON_ACTION_COUNT; ++i) {
            entry[actionName(static_cast<ButtonAction>(i))] = mapping.buttons[i];
        }
        mappings[controllerId] = std::move(entry);
    }
    config.setJson("input.controllerMappings", mappings);
}

} // namespace tenfoot
