/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "managers/ConstructionCatalog.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"
#include <algorithm>
#include <cctype>

namespace Driftwood {

namespace {

ResourceCost costFromJson(const JsonValue& json) {
    ResourceCost cost;
    const JsonObject* entries = json.tryAsObject();
    if (entries == nullptr) {
        return cost;
    }
    for (const auto& [resourceId, amount] : *entries) {
        auto value = amount.tryAsInt();
        if (value && *value > 0) {
            cost[resourceId] = *value;
        } else {
            CATALOG_WARN("Ignoring invalid cost entry for resource: " + resourceId);
        }
    }
    return cost;
}

ItemDefinition makeDefinition(const std::string& id, const std::string& name, ItemCategory category,
                              ResourceCost cost, ResourceCost repairCost, float maxHealth) {
    ItemDefinition def;
    def.id = id;
    def.name = name;
    def.category = category;
    def.cost = std::move(cost);
    def.repairCost = std::move(repairCost);
    def.maxHealth = maxHealth;
    return def;
}

} // namespace

const char* itemCategoryToString(ItemCategory category) {
    switch (category) {
        case ItemCategory::Foundation: return "Foundation";
        case ItemCategory::Structure: return "Structure";
        case ItemCategory::Storage: return "Storage";
        case ItemCategory::Engine: return "Engine";
        case ItemCategory::Rudder: return "Rudder";
        case ItemCategory::Decoration: return "Decoration";
    }
    return "Unknown";
}

std::optional<ItemCategory> itemCategoryFromString(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "foundation") return ItemCategory::Foundation;
    if (lower == "structure") return ItemCategory::Structure;
    if (lower == "storage") return ItemCategory::Storage;
    if (lower == "engine") return ItemCategory::Engine;
    if (lower == "rudder") return ItemCategory::Rudder;
    if (lower == "decoration") return ItemCategory::Decoration;
    return std::nullopt;
}

ConstructionCatalog ConstructionCatalog::createDefault() {
    ConstructionCatalog catalog;

    catalog.registerDefinition(makeDefinition("foundation", "Foundation", ItemCategory::Foundation,
                                              {{"plank", 4}, {"rope", 2}}, {{"plank", 1}}, 100.0f));

    catalog.registerDefinition(makeDefinition("floor", "Floor", ItemCategory::Structure,
                                              {{"plank", 2}}, {{"plank", 1}}, 60.0f));

    ItemDefinition wall = makeDefinition("wall", "Wall", ItemCategory::Structure,
                                         {{"plank", 3}}, {{"plank", 1}}, 120.0f);
    wall.walkable = false;
    catalog.registerDefinition(wall);

    ItemDefinition storage = makeDefinition("storage", "Storage Crate", ItemCategory::Storage,
                                            {{"nail", 4}, {"plank", 6}}, {{"plank", 2}}, 80.0f);
    storage.storage = true;
    storage.storageCapacity = 20;
    storage.walkable = false;
    catalog.registerDefinition(storage);

    ItemDefinition engine = makeDefinition("engine", "Paddle Engine", ItemCategory::Engine,
                                           {{"plank", 4}, {"scrap", 10}}, {{"scrap", 3}}, 150.0f);
    engine.footprintWidth = 2;
    engine.walkable = false;
    catalog.registerDefinition(engine);

    ItemDefinition rudder = makeDefinition("rudder", "Rudder", ItemCategory::Rudder,
                                           {{"plank", 6}, {"scrap", 2}}, {{"plank", 1}, {"scrap", 1}}, 100.0f);
    rudder.walkable = false;
    catalog.registerDefinition(rudder);

    catalog.setFallbackItemId("foundation");
    return catalog;
}

bool ConstructionCatalog::loadFromJson(const std::string& filename) {
    JsonReader reader;
    if (!reader.loadFromFile(filename)) {
        CATALOG_ERROR("Failed to load catalog file '" + filename + "': " + reader.getLastError());
        return false;
    }
    return loadFromJsonString(reader.getRoot().toString());
}

bool ConstructionCatalog::loadFromJsonString(const std::string& jsonString) {
    JsonReader reader;
    if (!reader.parse(jsonString)) {
        CATALOG_ERROR("Failed to parse catalog JSON: " + reader.getLastError());
        return false;
    }

    const JsonValue& root = reader.getRoot();
    if (!root.isObject()) {
        CATALOG_ERROR("Catalog root JSON is not an object");
        return false;
    }

    if (!root.hasKey("items") || !root["items"].isArray()) {
        CATALOG_ERROR("Catalog JSON is missing the 'items' array");
        return false;
    }

    if (auto fallback = root["fallback"].tryAsString()) {
        m_fallbackItemId = *fallback;
    }

    const JsonValue& items = root["items"];
    size_t loadedCount = 0;
    size_t failedCount = 0;

    for (size_t i = 0; i < items.size(); ++i) {
        try {
            auto definition = definitionFromJson(items[i]);
            if (!definition) {
                failedCount++;
                CATALOG_WARN("Skipping malformed item at index " + std::to_string(i));
                continue;
            }
            if (registerDefinition(*definition)) {
                loadedCount++;
                CATALOG_DEBUG("Loaded item: " + definition->id);
            } else {
                failedCount++;
            }
        } catch (const std::exception& ex) {
            failedCount++;
            CATALOG_ERROR("Exception processing item at index " + std::to_string(i) + ": " + ex.what());
        }
    }

    CATALOG_INFO("Catalog load completed: " + std::to_string(loadedCount) + " loaded, " +
                 std::to_string(failedCount) + " failed");

    if (!contains(m_fallbackItemId)) {
        CATALOG_WARN("Fallback item '" + m_fallbackItemId + "' is not in the catalog");
    }

    return failedCount == 0;
}

std::optional<ItemDefinition> ConstructionCatalog::definitionFromJson(const JsonValue& json) {
    if (!json.isObject()) {
        return std::nullopt;
    }

    auto id = json["id"].tryAsString();
    if (!id || id->empty()) {
        return std::nullopt;
    }

    ItemDefinition def;
    def.id = *id;
    def.name = json.getString("name", def.id);

    const std::string categoryName = json.getString("category", "Foundation");
    auto category = itemCategoryFromString(categoryName);
    if (!category) {
        CATALOG_WARN("Unknown category '" + categoryName + "' for item " + def.id);
        return std::nullopt;
    }
    def.category = *category;

    def.cost = costFromJson(json["cost"]);
    def.repairCost = costFromJson(json["repairCost"]);

    const JsonValue& footprint = json["footprint"];
    def.footprintWidth = footprint.getInt("width", 1);
    def.footprintDepth = footprint.getInt("depth", 1);

    def.walkable = json.getBool("walkable", true);
    def.storage = json.getBool("storage", def.category == ItemCategory::Storage);
    def.storageCapacity = json.getInt("storageCapacity", 0);
    def.maxHealth = json.getFloat("maxHealth", 100.0f);

    if (def.maxHealth <= 0.0f) {
        CATALOG_WARN("Item " + def.id + " has non-positive maxHealth");
        return std::nullopt;
    }
    return def;
}

bool ConstructionCatalog::registerDefinition(const ItemDefinition& definition) {
    if (definition.id.empty()) {
        CATALOG_ERROR("Cannot register item with empty id");
        return false;
    }
    if (definition.footprintWidth <= 0 || definition.footprintDepth <= 0 ||
        definition.footprintWidth > MAX_FOOTPRINT_SIDE || definition.footprintDepth > MAX_FOOTPRINT_SIDE) {
        CATALOG_ERROR("Item " + definition.id + " has an invalid footprint " +
                      std::to_string(definition.footprintWidth) + "x" +
                      std::to_string(definition.footprintDepth));
        return false;
    }
    if (m_definitions.count(definition.id) > 0) {
        CATALOG_WARN("Duplicate item id ignored: " + definition.id);
        return false;
    }

    m_definitions.emplace(definition.id, definition);
    return true;
}

const ItemDefinition* ConstructionCatalog::find(const std::string& itemId) const {
    auto it = m_definitions.find(itemId);
    return it != m_definitions.end() ? &it->second : nullptr;
}

std::vector<std::string> ConstructionCatalog::getItemIds() const {
    std::vector<std::string> ids;
    ids.reserve(m_definitions.size());
    for (const auto& [id, def] : m_definitions) {
        (void)def;
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

std::vector<const ItemDefinition*> ConstructionCatalog::getByCategory(ItemCategory category) const {
    std::vector<const ItemDefinition*> result;
    for (const auto& [id, def] : m_definitions) {
        (void)id;
        if (def.category == category) {
            result.push_back(&def);
        }
    }
    std::sort(result.begin(), result.end(),
              [](const ItemDefinition* a, const ItemDefinition* b) { return a->id < b->id; });
    return result;
}

void ConstructionCatalog::clear() {
    m_definitions.clear();
    m_fallbackItemId = "foundation";
}

} // namespace Driftwood
