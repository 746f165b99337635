#include "engine/Config.hpp"
#include "engine/Log.hpp"

#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>

namespace tenfoot {

bool Config::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return false;
    }

    try {
        m_data = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        LOG_WARN("Config: failed to parse '{}': {}", path, e.what());
        return false;
    }
    return true;
}

bool Config::loadFromString(const std::string& jsonStr) {
    try {
        m_data = nlohmann::json::parse(jsonStr);
    } catch (const nlohmann::json::parse_error&) {
        return false;
    }
    return true;
}

bool Config::mergeFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return false;
    }

    nlohmann::json overlay;
    try {
        overlay = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        LOG_WARN("Config: failed to parse overlay '{}': {}", path, e.what());
        return false;
    }

    nlohmann::json merged = m_data;
    mergeJson(merged, overlay);
    m_data = std::move(merged);
    return true;
}

bool Config::saveToFile(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        LOG_WARN("Config: cannot open '{}' for writing", path);
        return false;
    }

    file << m_data.dump(4) << '\n';
    return file.good();
}

// ---------------------------------------------------------------------------
// Key paths
// ---------------------------------------------------------------------------

std::vector<std::string> Config::splitKey(const std::string& key) {
    std::vector<std::string> parts;
    std::istringstream stream(key);
    std::string segment;
    while (std::getline(stream, segment, '.')) {
        parts.push_back(segment);
    }
    return parts;
}

const nlohmann::json* Config::getJson(const std::string& key) const {
    const nlohmann::json* current = &m_data;
    for (const auto& part : splitKey(key)) {
        if (!current->is_object()) return nullptr;
        auto it = current->find(part);
        if (it == current->end()) return nullptr;
        current = &(*it);
    }
    return current;
}

nlohmann::json& Config::slot(const std::string& key) {
    nlohmann::json* current = &m_data;
    for (const auto& part : splitKey(key)) {
        if (!current->is_object()) {
            if (!current->is_null()) {
                LOG_WARN("Config: replacing non-object value while setting '{}'", key);
            }
            *current = nlohmann::json::object();
        }
        current = &(*current)[part];
    }
    return *current;
}

bool Config::hasKey(const std::string& key) const {
    return getJson(key) != nullptr;
}

// ---------------------------------------------------------------------------
// Getters
// ---------------------------------------------------------------------------

std::optional<int> Config::toInt(const nlohmann::json& value) {
    constexpr auto INT_MIN_VAL = std::numeric_limits<int>::min();
    constexpr auto INT_MAX_VAL = std::numeric_limits<int>::max();

    if (value.is_number_unsigned()) {
        auto n = value.get<std::uint64_t>();
        if (n > static_cast<std::uint64_t>(INT_MAX_VAL)) return std::nullopt;
        return static_cast<int>(n);
    }
    if (value.is_number_integer()) {
        auto n = value.get<std::int64_t>();
        if (n < INT_MIN_VAL || n > INT_MAX_VAL) return std::nullopt;
        return static_cast<int>(n);
    }
    return std::nullopt;
}

std::string Config::getString(const std::string& key, const std::string& defaultVal) const {
    const auto* val = getJson(key);
    return (val && val->is_string()) ? val->get<std::string>() : defaultVal;
}

int Config::getInt(const std::string& key, int defaultVal) const {
    const auto* val = getJson(key);
    if (!val) return defaultVal;
    return toInt(*val).value_or(defaultVal);
}

float Config::getFloat(const std::string& key, float defaultVal) const {
    const auto* val = getJson(key);
    return (val && val->is_number()) ? val->get<float>() : defaultVal;
}

bool Config::getBool(const std::string& key, bool defaultVal) const {
    const auto* val = getJson(key);
    return (val && val->is_boolean()) ? val->get<bool>() : defaultVal;
}

// ---------------------------------------------------------------------------
// Setters
// ---------------------------------------------------------------------------

void Config::setString(const std::string& key, const std::string& value) {
    slot(key) = value;
}

void Config::setInt(const std::string& key, int value) {
    slot(key) = value;
}

void Config::setFloat(const std::string& key, float value) {
    slot(key) = value;
}

void Config::setBool(const std::string& key, bool value) {
    slot(key) = value;
}

void Config::setJson(const std::string& key, const nlohmann::json& value) {
    slot(key) = value;
}

void Config::mergeJson(nlohmann::json& base, const nlohmann::json& overlay) {
    if (!overlay.is_object() || !base.is_object()) {
        base = overlay;
        return;
    }
    for (auto it = overlay.begin(); it != overlay.end(); ++it) {
        auto existing = base.find(it.key());
        if (existing != base.end() && existing->is_object() && it->is_object()) {
            mergeJson(*existing, *it);
        } else {
            base[it.key()] = *it;
        }
    }
}

} // namespace tenfoot
