/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "world/StructureRegistry.hpp"
#include "core/Logger.hpp"
#include "entities/resources/ResourceLedger.hpp"
#include "events/PresentationSink.hpp"
#include "managers/ConstructionCatalog.hpp"
#include <algorithm>

namespace Driftwood {

StructureRegistry::StructureRegistry(const ConstructionCatalog& catalog, const GridTopology& grid,
                                     PresentationSink* sink, float thrustPerEngine)
    : m_catalog(catalog),
      m_grid(grid),
      m_sink(sink),
      m_thrustPerEngine(thrustPerEngine) {}

const Tile* StructureRegistry::place(const GridCoord& origin, const ItemDefinition& definition) {
    return placeTile(origin, definition, nullptr);
}

const Tile* StructureRegistry::placeTile(const GridCoord& origin, const ItemDefinition& definition,
                                         const TileRecord* saved) {
    if (!GridTopology::isInBounds(origin)) {
        STRUCTURE_WARN("place - Origin " + std::to_string(origin.column) + "," +
                       std::to_string(origin.row) + " is out of bounds, rejecting " + definition.id);
        return nullptr;
    }

    FootprintCells cells = GridTopology::footprintCells(origin, definition.footprintWidth,
                                                        definition.footprintDepth);

    // Check every cell before touching anything so a rejected footprint leaves no trace
    for (const auto& cell : cells) {
        if (m_occupancy.count(cell) > 0) {
            STRUCTURE_WARN("place - Cell " + std::to_string(cell.column) + "," +
                           std::to_string(cell.row) + " already occupied, rejecting " + definition.id);
            return nullptr;
        }
    }

    Tile tile;
    tile.id = m_nextTileId++;
    tile.itemId = definition.id;
    tile.category = definition.category;
    tile.origin = origin;
    tile.footprint = cells;
    tile.worldPosition = m_grid.gridToWorld(origin);
    tile.maxHealth = definition.maxHealth;
    tile.health = definition.maxHealth;
    tile.storage = definition.storage;
    tile.storageCapacity = definition.storage ? definition.storageCapacity : 0;

    if (saved != nullptr) {
        tile.health = std::clamp(saved->health, 0.0f, tile.maxHealth);
        for (const auto& [resourceId, amount] : saved->storedItems) {
            const int space = std::max(tile.storageCapacity - tile.storedTotal(), 0);
            const int stored = std::min(space, amount);
            if (stored > 0 && !resourceId.empty()) {
                tile.storedItems[resourceId] += stored;
            }
        }
    }

    for (const auto& cell : cells) {
        m_occupancy.emplace(cell, tile.id);
    }
    auto [it, inserted] = m_tiles.emplace(tile.id, std::move(tile));
    (void)inserted;

    recomputeAggregate();

    STRUCTURE_DEBUG("Placed " + definition.id + " (tile " + std::to_string(it->first) + ") at " +
                    std::to_string(origin.column) + "," + std::to_string(origin.row));

    const Tile& placed = it->second;
    notifySink(m_sink, "tilePlaced", [&](PresentationSink& sink) { sink.tilePlaced(placed, origin); });
    return &placed;
}

bool StructureRegistry::remove(const GridCoord& cell) {
    auto occIt = m_occupancy.find(cell);
    if (occIt == m_occupancy.end()) {
        return false;
    }

    auto tileIt = m_tiles.find(occIt->second);
    if (tileIt == m_tiles.end()) {
        STRUCTURE_ERROR("remove - Occupancy references missing tile " + std::to_string(occIt->second));
        m_occupancy.erase(occIt);
        return false;
    }

    const GridCoord origin = tileIt->second.origin;
    for (const auto& aliased : tileIt->second.footprint) {
        m_occupancy.erase(aliased);
    }
    m_tiles.erase(tileIt);

    recomputeAggregate();

    notifySink(m_sink, "tileRemoved", [&](PresentationSink& sink) { sink.tileRemoved(origin); });
    return true;
}

bool StructureRegistry::damage(const GridCoord& cell, float amount) {
    if (!(amount > 0.0f)) {
        return false;
    }

    Tile* tile = findTile(cell);
    if (tile == nullptr) {
        return false;
    }

    const bool wasDestroyed = tile->isDestroyed();
    tile->health = std::max(tile->health - amount, 0.0f);
    if (!wasDestroyed && tile->isDestroyed()) {
        STRUCTURE_INFO("Tile " + std::to_string(tile->id) + " (" + tile->itemId + ") destroyed");
    }

    recomputeAggregate();
    return true;
}

BuildResult StructureRegistry::repair(const GridCoord& cell, ResourceLedger* ledger) {
    Tile* tile = findTile(cell);
    if (tile == nullptr || !tile->isDamaged()) {
        return BuildResult::InvalidPlacement;
    }

    const ItemDefinition* definition = m_catalog.find(tile->itemId);
    if (definition == nullptr) {
        return BuildResult::UnknownItem;
    }

    if (!deductAll(ledger, definition->repairCost)) {
        return BuildResult::InsufficientResources;
    }

    tile->health = tile->maxHealth;
    recomputeAggregate();
    return BuildResult::Success;
}

int StructureRegistry::depositToStorage(const GridCoord& cell, const std::string& resourceId, int amount) {
    Tile* tile = findTile(cell);
    if (tile == nullptr || !tile->storage || amount <= 0 || resourceId.empty()) {
        return 0;
    }

    const int space = std::max(tile->storageCapacity - tile->storedTotal(), 0);
    const int stored = std::min(space, amount);
    if (stored > 0) {
        tile->storedItems[resourceId] += stored;
    }
    return stored;
}

int StructureRegistry::withdrawFromStorage(const GridCoord& cell, const std::string& resourceId, int amount) {
    Tile* tile = findTile(cell);
    if (tile == nullptr || !tile->storage || amount <= 0) {
        return 0;
    }

    auto it = tile->storedItems.find(resourceId);
    if (it == tile->storedItems.end()) {
        return 0;
    }

    const int taken = std::min(it->second, amount);
    it->second -= taken;
    if (it->second == 0) {
        tile->storedItems.erase(it);
    }
    return taken;
}

StructureSnapshot StructureRegistry::persist() const {
    StructureSnapshot snapshot;
    snapshot.tiles.reserve(m_tiles.size());

    for (const Tile* tile : getTiles()) {
        TileRecord record;
        record.tileType = tile->itemId;
        record.gridPosition = tile->origin;
        record.health = tile->health;
        record.storedItems = tile->storedItems;
        snapshot.tiles.push_back(std::move(record));
    }

    snapshot.raftCenter = m_aggregate.centerOfMass;
    return snapshot;
}

size_t StructureRegistry::restore(const StructureSnapshot& snapshot) {
    clear();

    size_t restored = 0;
    for (const auto& record : snapshot.tiles) {
        const ItemDefinition* definition = m_catalog.find(record.tileType);
        if (definition == nullptr) {
            STRUCTURE_WARN("restore - Unknown tile type '" + record.tileType + "', using " +
                           m_catalog.fallbackItemId());
            definition = m_catalog.find(m_catalog.fallbackItemId());
        }
        if (definition == nullptr) {
            STRUCTURE_ERROR("restore - No fallback definition, skipping tile at " +
                            std::to_string(record.gridPosition.column) + "," +
                            std::to_string(record.gridPosition.row));
            continue;
        }

        if (placeTile(record.gridPosition, *definition, &record) == nullptr) {
            STRUCTURE_WARN("restore - Skipping tile " + record.tileType);
            continue;
        }
        ++restored;
    }

    recomputeAggregate();
    STRUCTURE_INFO("Restored " + std::to_string(restored) + " of " +
                   std::to_string(snapshot.tiles.size()) + " tiles");
    return restored;
}

void StructureRegistry::clear() {
    std::vector<GridCoord> origins;
    origins.reserve(m_tiles.size());
    for (const Tile* tile : getTiles()) {
        origins.push_back(tile->origin);
    }

    m_tiles.clear();
    m_occupancy.clear();
    recomputeAggregate();

    for (const auto& origin : origins) {
        notifySink(m_sink, "tileRemoved", [&](PresentationSink& sink) { sink.tileRemoved(origin); });
    }
}

const Tile* StructureRegistry::tileAt(const GridCoord& cell) const {
    auto occIt = m_occupancy.find(cell);
    if (occIt == m_occupancy.end()) {
        return nullptr;
    }
    return getTile(occIt->second);
}

const Tile* StructureRegistry::getTile(TileId id) const {
    auto it = m_tiles.find(id);
    return it != m_tiles.end() ? &it->second : nullptr;
}

std::vector<const Tile*> StructureRegistry::getTiles() const {
    std::vector<const Tile*> tiles;
    tiles.reserve(m_tiles.size());
    for (const auto& [id, tile] : m_tiles) {
        (void)id;
        tiles.push_back(&tile);
    }
    std::sort(tiles.begin(), tiles.end(), [](const Tile* a, const Tile* b) { return a->id < b->id; });
    return tiles;
}

Tile* StructureRegistry::findTile(const GridCoord& cell) {
    auto occIt = m_occupancy.find(cell);
    if (occIt == m_occupancy.end()) {
        return nullptr;
    }
    auto tileIt = m_tiles.find(occIt->second);
    return tileIt != m_tiles.end() ? &tileIt->second : nullptr;
}

void StructureRegistry::recomputeAggregate() {
    StructureAggregate result;
    result.tileCount = m_tiles.size();

    if (m_tiles.empty()) {
        m_aggregate = result;
        return;
    }

    Vector3D positionSum;
    float healthSum = 0.0f;
    int engines = 0;
    int rudders = 0;

    for (const auto& [id, tile] : m_tiles) {
        (void)id;
        positionSum += tile.worldPosition;
        healthSum += tile.maxHealth > 0.0f ? tile.health / tile.maxHealth : 0.0f;

        if (tile.isDestroyed()) {
            continue;
        }
        if (tile.category == ItemCategory::Engine) {
            ++engines;
        } else if (tile.category == ItemCategory::Rudder) {
            ++rudders;
        }
    }

    const float count = static_cast<float>(m_tiles.size());
    result.centerOfMass = positionSum / count;
    result.healthPercent = healthSum / count;
    result.canMove = engines > 0;
    result.thrust = static_cast<float>(engines) * m_thrustPerEngine;
    result.steering = static_cast<float>(rudders);
    m_aggregate = result;
}

} // namespace Driftwood
