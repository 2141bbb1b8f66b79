/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef STRUCTURE_DATA_HPP
#define STRUCTURE_DATA_HPP

#include "managers/ConstructionCatalog.hpp"
#include "utils/Vector3D.hpp"
#include "world/GridTopology.hpp"
#include <string>
#include <vector>

namespace Driftwood {

class JsonValue;

/**
 * @brief One placed raft piece, owned by value inside StructureRegistry
 *
 * Every cell of the footprint aliases this tile's id in the occupancy map.
 */
struct Tile {
    TileId id{INVALID_TILE_ID};
    std::string itemId;
    ItemCategory category{ItemCategory::Foundation};
    GridCoord origin{};
    FootprintCells footprint;
    Vector3D worldPosition{};     // origin cell center, y = 0
    float health{0.0f};
    float maxHealth{0.0f};
    bool storage{false};
    int storageCapacity{0};
    ResourceCost storedItems;

    bool isDestroyed() const { return health <= 0.0f; }
    bool isDamaged() const { return health < maxHealth; }
    int storedTotal() const {
        int total = 0;
        for (const auto& [resourceId, amount] : storedItems) {
            (void)resourceId;
            total += amount;
        }
        return total;
    }
};

/**
 * @brief Structure-wide physics summary, recomputed after every mutation
 *
 * thrust is a magnitude along the raft's forward axis. steering is an
 * undirected rudder count; turning direction belongs to the motion integrator.
 */
struct StructureAggregate {
    Vector3D centerOfMass{};
    float healthPercent{1.0f};
    float thrust{0.0f};
    float steering{0.0f};
    bool canMove{false};
    size_t tileCount{0};
};

struct TileRecord {
    std::string tileType;
    GridCoord gridPosition{};
    float health{0.0f};
    ResourceCost storedItems;
};

/**
 * @brief Logical save shape of one raft
 *
 * {
 *   "version": 1,
 *   "tiles": [ {"tileType": "foundation", "gridPosition": {"x": 0, "y": 0},
 *               "health": 100, "storage": {"plank": 3}} ],
 *   "raftCenter": {"x": 0, "y": 0, "z": 0}
 * }
 *
 * gridPosition.x is the column and gridPosition.y the row.
 */
struct StructureSnapshot {
    static constexpr int CURRENT_VERSION = 1;

    int version{CURRENT_VERSION};
    std::vector<TileRecord> tiles;
    Vector3D raftCenter{};

    JsonValue toJson() const;

    /**
     * @brief Lenient reader: missing version reads as legacy 0, missing fields default
     * @return false only when the root is not an object
     */
    static bool fromJson(const JsonValue& json, StructureSnapshot& out);
};

} // namespace Driftwood

#endif // STRUCTURE_DATA_HPP
