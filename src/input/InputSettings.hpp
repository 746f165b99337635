#pragma once

#include "input/ControllerTypes.hpp"

#include <map>
#include <string>

namespace tenfoot {

class Config;

/// Persisted input preferences, read from and written to the "input"
/// section of the settings file.
///
///   "input": {
///     "analogDeadzone": 0.15,
///     "dpadRepeatDelay": 400,
///     "dpadRepeatRate": 100,
///     "controllerMappings": {
///       "<controller id>": { "confirm": 1, "back": 0, ... }
///     }
///   }
struct InputSettings {
    float analogDeadzone  = 0.15f;
    int   dpadRepeatDelay = 400;   // ms before a held direction repeats
    int   dpadRepeatRate  = 100;   // ms between repeats

    /// Per controller id. Actions missing from a stored entry keep the
    /// default physical index for that controller's family.
    std::map<std::string, ButtonMapping> controllerMappings;

    /// Read from `config`, falling back to defaults for missing keys and
    /// clamping out-of-range values. Malformed mapping entries are skipped.
    static InputSettings fromConfig(const Config& config);

    /// Write every field back into `config` under "input.*".
    void writeTo(Config& config) const;

    static constexpr int MIN_REPEAT_MS = 16;
    static constexpr int MAX_REPEAT_MS = 2000;
};

} // namespace tenfoot
