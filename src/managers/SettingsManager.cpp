/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "managers/SettingsManager.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"
#include <fstream>

namespace Driftwood {

bool SettingsManager::loadFromFile(const std::string& filepath) {
    JsonReader reader;
    if (!reader.loadFromFile(filepath)) {
        SETTINGS_ERROR("Failed to load settings from file: " + filepath + " - " + reader.getLastError());
        return false;
    }
    return mergeRoot(reader.getRoot(), filepath);
}

bool SettingsManager::loadFromJsonString(const std::string& json) {
    JsonReader reader;
    if (!reader.parse(json)) {
        SETTINGS_ERROR("Failed to parse settings: " + reader.getLastError());
        return false;
    }
    return mergeRoot(reader.getRoot(), "<memory>");
}

bool SettingsManager::mergeRoot(const JsonValue& root, const std::string& source) {
    if (!root.isObject()) {
        SETTINGS_ERROR("Settings root is not a JSON object: " + source);
        return false;
    }

    std::unique_lock<std::shared_mutex> lock(m_settingsMutex);

    for (const auto& [categoryName, categoryValue] : root.asObject()) {
        if (!categoryValue.isObject()) {
            SETTINGS_WARNING("Category '" + categoryName + "' is not an object, skipping");
            continue;
        }

        for (const auto& [key, value] : categoryValue.asObject()) {
            SettingValue settingValue;

            if (value.isBool()) {
                settingValue = value.asBool();
            } else if (value.isNumber()) {
                double numValue = value.asNumber();
                if (numValue == static_cast<int>(numValue)) {
                    settingValue = static_cast<int>(numValue);
                } else {
                    settingValue = static_cast<float>(numValue);
                }
            } else if (value.isString()) {
                settingValue = value.asString();
            } else {
                SETTINGS_WARNING("Unsupported value type for setting '" + categoryName + "." + key + "', skipping");
                continue;
            }

            m_settings[categoryName][key] = std::move(settingValue);
        }
    }

    SETTINGS_INFO("Loaded settings from " + source);
    return true;
}

bool SettingsManager::saveToFile(const std::string& filepath) const {
    JsonValue root{JsonObject{}};
    {
        std::shared_lock<std::shared_mutex> lock(m_settingsMutex);
        for (const auto& [categoryName, categorySettings] : m_settings) {
            JsonValue& category = root[categoryName];
            category = JsonValue(JsonObject{});
            for (const auto& [key, value] : categorySettings) {
                category[key] = std::visit([](const auto& arg) { return JsonValue(arg); }, value);
            }
        }
    }

    std::ofstream file(filepath);
    if (!file.is_open()) {
        SETTINGS_ERROR("Failed to open settings file for writing: " + filepath);
        return false;
    }
    file << root.toStyledString();
    if (!file.good()) {
        SETTINGS_ERROR("Failed writing settings file: " + filepath);
        return false;
    }

    SETTINGS_INFO("Saved settings to file: " + filepath);
    return true;
}

void SettingsManager::applyDefaults() {
    // Ocean: wave synthesis and the calm/storm presets
    setDefault("ocean", "component_count", 4);
    setDefault("ocean", "seed", 1337);
    setDefault("ocean", "base_height", 0.6f);
    setDefault("ocean", "base_speed", 1.0f);
    setDefault("ocean", "base_wavelength", 12.0f);
    setDefault("ocean", "current_dir_x", 1.0f);
    setDefault("ocean", "current_dir_z", 0.0f);
    setDefault("ocean", "current_strength", 0.4f);
    setDefault("ocean", "turbulence", 0.25f);
    setDefault("ocean", "calm_height", 0.6f);
    setDefault("ocean", "storm_height", 2.4f);
    setDefault("ocean", "calm_speed", 1.0f);
    setDefault("ocean", "storm_speed", 1.6f);
    setDefault("ocean", "calm_current", 0.4f);
    setDefault("ocean", "storm_current", 1.8f);

    setDefault("grid", "cell_size", 1.5f);

    setDefault("build", "placement_offset", 3.0f);

    setDefault("structure", "thrust_per_engine", 250.0f);

    setDefault("motion", "mass_per_tile", 80.0f);
    setDefault("motion", "turn_rate", 0.35f);
    setDefault("motion", "current_drag", 0.8f);
    setDefault("motion", "linear_damping", 0.5f);
    setDefault("motion", "freeboard", 0.3f);
    setDefault("motion", "buoyancy_rate", 4.0f);

    setDefault("simulation", "tick_rate", 60);
    setDefault("simulation", "demo_ticks", 600);
    setDefault("simulation", "save_directory", std::string("saves"));
    setDefault("simulation", "catalog_path", std::string("res/data/construction_items.json"));
}

void SettingsManager::setDefault(const std::string& category, const std::string& key, SettingValue value) {
    std::unique_lock<std::shared_mutex> lock(m_settingsMutex);
    auto& categorySettings = m_settings[category];
    if (categorySettings.find(key) == categorySettings.end()) {
        categorySettings.emplace(key, std::move(value));
    }
}

bool SettingsManager::has(const std::string& category, const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(m_settingsMutex);

    auto categoryIt = m_settings.find(category);
    if (categoryIt == m_settings.end()) {
        return false;
    }
    return categoryIt->second.find(key) != categoryIt->second.end();
}

bool SettingsManager::remove(const std::string& category, const std::string& key) {
    std::unique_lock<std::shared_mutex> lock(m_settingsMutex);

    auto categoryIt = m_settings.find(category);
    if (categoryIt == m_settings.end()) {
        return false;
    }

    if (categoryIt->second.erase(key) == 0) {
        return false;
    }

    if (categoryIt->second.empty()) {
        m_settings.erase(categoryIt);
    }
    return true;
}

void SettingsManager::clearAll() {
    std::unique_lock<std::shared_mutex> lock(m_settingsMutex);
    m_settings.clear();
}

std::vector<std::string> SettingsManager::getCategories() const {
    std::shared_lock<std::shared_mutex> lock(m_settingsMutex);

    std::vector<std::string> categories;
    categories.reserve(m_settings.size());
    for (const auto& [category, _] : m_settings) {
        categories.push_back(category);
    }
    return categories;
}

std::vector<std::string> SettingsManager::getKeys(const std::string& category) const {
    std::shared_lock<std::shared_mutex> lock(m_settingsMutex);

    auto categoryIt = m_settings.find(category);
    if (categoryIt == m_settings.end()) {
        return {};
    }

    std::vector<std::string> keys;
    keys.reserve(categoryIt->second.size());
    for (const auto& [key, _] : categoryIt->second) {
        keys.push_back(key);
    }
    return keys;
}

} // namespace Driftwood
