/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef SETTINGS_MANAGER_HPP
#define SETTINGS_MANAGER_HPP

#include <mutex>
#include <shared_mutex>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <variant>
#include <vector>

namespace Driftwood {

class JsonValue;

/**
 * @brief Category/key settings store backing every simulation config
 *
 * Values are loaded from JSON, typed on read, and missing keys fall back to
 * the caller's default. Components build their config structs from here
 * (WaveFieldConfig::fromSettings, BuildSessionConfig::fromSettings, ...).
 *
 * Usage:
 *   auto& settings = SettingsManager::Instance();
 *   settings.loadFromFile("res/settings.json");
 *   settings.applyDefaults();
 *   float cell = settings.get<float>("grid", "cell_size", 1.5f);
 */
class SettingsManager {
public:
    ~SettingsManager() = default;

    static SettingsManager& Instance() {
        static SettingsManager instance;
        return instance;
    }

    using SettingValue = std::variant<int, float, bool, std::string>;

    /**
     * @brief Loads settings from a JSON file, merging over current values
     * @return true if the file parsed and its root is an object
     */
    bool loadFromFile(const std::string& filepath);

    /**
     * @brief Same as loadFromFile for an in-memory document
     */
    bool loadFromJsonString(const std::string& json);

    /**
     * @brief Writes all categories as an indented JSON document
     */
    bool saveToFile(const std::string& filepath) const;

    /**
     * @brief Seeds the stock simulation values for any key not already set
     *
     * Categories: ocean, grid, build, structure, simulation.
     */
    void applyDefaults();

    /**
     * @brief Typed read; int values are readable as float
     * @return The stored value, or defaultValue when missing or mistyped
     */
    template<typename T>
    T get(const std::string& category, const std::string& key, T defaultValue = T{}) const;

    template<typename T>
    bool set(const std::string& category, const std::string& key, const T& value);

    bool has(const std::string& category, const std::string& key) const;
    bool remove(const std::string& category, const std::string& key);
    void clearAll();

    std::vector<std::string> getCategories() const;
    std::vector<std::string> getKeys(const std::string& category) const;

private:
    using CategorySettings = std::unordered_map<std::string, SettingValue>;
    std::unordered_map<std::string, CategorySettings> m_settings;
    mutable std::shared_mutex m_settingsMutex;

    bool mergeRoot(const JsonValue& root, const std::string& source);
    void setDefault(const std::string& category, const std::string& key, SettingValue value);

    SettingsManager(const SettingsManager&) = delete;
    SettingsManager& operator=(const SettingsManager&) = delete;

    SettingsManager() = default;
};

template<typename T>
T SettingsManager::get(const std::string& category, const std::string& key, T defaultValue) const {
    std::shared_lock<std::shared_mutex> lock(m_settingsMutex);

    auto categoryIt = m_settings.find(category);
    if (categoryIt == m_settings.end()) {
        return defaultValue;
    }

    auto keyIt = categoryIt->second.find(key);
    if (keyIt == categoryIt->second.end()) {
        return defaultValue;
    }

    const SettingValue& stored = keyIt->second;
    if constexpr (std::is_same_v<T, float>) {
        // "1" in a JSON file loads as int; callers asking for float still get it
        if (const int* asInt = std::get_if<int>(&stored)) {
            return static_cast<float>(*asInt);
        }
    }

    if constexpr (std::is_same_v<T, int> || std::is_same_v<T, float> ||
                  std::is_same_v<T, bool> || std::is_same_v<T, std::string>) {
        if (const T* value = std::get_if<T>(&stored)) {
            return *value;
        }
    }
    return defaultValue;
}

template<typename T>
bool SettingsManager::set(const std::string& category, const std::string& key, const T& value) {
    SettingValue settingValue;

    if constexpr (std::is_same_v<T, int> || std::is_same_v<T, float> ||
                  std::is_same_v<T, bool> || std::is_same_v<T, std::string>) {
        settingValue = value;
    } else if constexpr (std::is_convertible_v<T, std::string>) {
        settingValue = std::string(value);
    } else {
        return false;
    }

    std::unique_lock<std::shared_mutex> lock(m_settingsMutex);
    m_settings[category][key] = std::move(settingValue);
    return true;
}

} // namespace Driftwood

#endif // SETTINGS_MANAGER_HPP
