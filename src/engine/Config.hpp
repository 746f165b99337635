#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace tenfoot {

/// JSON-backed settings store addressed with dot-notation key paths
/// ("input.analogDeadzone"). Getters never throw: a missing key or a value
/// of the wrong JSON type yields the supplied default.
class Config {
public:
    /// Load from a JSON file. Returns false if the file cannot be read or
    /// parsed; the current contents are kept in that case.
    bool loadFromFile(const std::string& path);

    /// Load from a JSON string (useful for testing).
    bool loadFromString(const std::string& jsonStr);

    /// Merge a JSON file on top of the current contents. Nested objects are
    /// merged key by key; any other value replaces outright.
    bool mergeFromFile(const std::string& path);

    /// Write the current contents to a JSON file (pretty-printed).
    bool saveToFile(const std::string& path) const;

    std::string getString(const std::string& key, const std::string& defaultVal = "") const;
    int         getInt(const std::string& key, int defaultVal = 0) const;
    float       getFloat(const std::string& key, float defaultVal = 0.0f) const;
    bool        getBool(const std::string& key, bool defaultVal = false) const;

    /// Raw access to a nested value, or nullptr if the path does not exist.
    const nlohmann::json* getJson(const std::string& key) const;

    void setString(const std::string& key, const std::string& value);
    void setInt(const std::string& key, int value);
    void setFloat(const std::string& key, float value);
    void setBool(const std::string& key, bool value);
    void setJson(const std::string& key, const nlohmann::json& value);

    bool hasKey(const std::string& key) const;

    /// `value` as an int, or nullopt if it is not an integer or does not fit.
    static std::optional<int> toInt(const nlohmann::json& value);

    const nlohmann::json& raw() const { return m_data; }

private:
    static std::vector<std::string> splitKey(const std::string& key);

    /// Walk to the value at `key`, creating intermediate objects. Non-object
    /// values in the way are replaced (with a warning).
    nlohmann::json& slot(const std::string& key);

    static void mergeJson(nlohmann::json& base, const nlohmann::json& overlay);

    nlohmann::json m_data = nlohmann::json::object();
};

} // namespace tenfoot
