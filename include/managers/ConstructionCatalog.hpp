/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef CONSTRUCTION_CATALOG_HPP
#define CONSTRUCTION_CATALOG_HPP

#include <boost/container/flat_map.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace Driftwood {

class JsonValue;

enum class ItemCategory : uint8_t {
    Foundation = 0,
    Structure = 1,
    Storage = 2,
    Engine = 3,
    Rudder = 4,
    Decoration = 5
};

const char* itemCategoryToString(ItemCategory category);
std::optional<ItemCategory> itemCategoryFromString(const std::string& name);

// Resource id -> amount. Small and iterated in order, so a flat map.
using ResourceCost = boost::container::flat_map<std::string, int>;

struct ItemDefinition {
    std::string id;
    std::string name;
    ItemCategory category{ItemCategory::Foundation};
    ResourceCost cost;
    int footprintWidth{1};
    int footprintDepth{1};
    bool walkable{true};
    bool storage{false};
    int storageCapacity{0};
    float maxHealth{100.0f};
    ResourceCost repairCost;

    bool isEngine() const { return category == ItemCategory::Engine; }
    bool isRudder() const { return category == ItemCategory::Rudder; }
};

/**
 * @brief Lookup table of buildable raft items
 *
 * Loaded once at startup, from a JSON data file or from createDefault(), and
 * read-only afterwards. find() returning nullptr is the "unknown item" case;
 * callers must not conflate it with an affordability failure.
 *
 * JSON layout:
 * {
 *   "fallback": "foundation",
 *   "items": [
 *     { "id": "foundation", "name": "Foundation", "category": "Foundation",
 *       "cost": {"plank": 4, "rope": 2}, "footprint": {"width": 1, "depth": 1},
 *       "walkable": true, "storage": false, "storageCapacity": 0,
 *       "maxHealth": 100, "repairCost": {"plank": 1} }
 *   ]
 * }
 */
class ConstructionCatalog {
public:
    static constexpr int MAX_FOOTPRINT_SIDE = 16;

    ConstructionCatalog() = default;

    static ConstructionCatalog createDefault();

    bool loadFromJson(const std::string& filename);
    bool loadFromJsonString(const std::string& jsonString);

    /**
     * @brief Add one definition
     * @return false for an empty id, a duplicate id, or a footprint side outside
     *         1..MAX_FOOTPRINT_SIDE
     */
    bool registerDefinition(const ItemDefinition& definition);

    const ItemDefinition* find(const std::string& itemId) const;
    bool contains(const std::string& itemId) const { return find(itemId) != nullptr; }

    std::vector<std::string> getItemIds() const;
    std::vector<const ItemDefinition*> getByCategory(ItemCategory category) const;
    size_t size() const { return m_definitions.size(); }
    bool empty() const { return m_definitions.empty(); }
    void clear();

    /**
     * @brief Base type substituted for unknown ids when restoring old saves
     */
    const std::string& fallbackItemId() const { return m_fallbackItemId; }
    void setFallbackItemId(const std::string& itemId) { m_fallbackItemId = itemId; }

    static std::optional<ItemDefinition> definitionFromJson(const JsonValue& json);

private:
    std::unordered_map<std::string, ItemDefinition> m_definitions;
    std::string m_fallbackItemId{"foundation"};
};

} // namespace Driftwood

#endif // CONSTRUCTION_CATALOG_HPP
