/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef STRUCTURE_REGISTRY_HPP
#define STRUCTURE_REGISTRY_HPP

/**
 * @file StructureRegistry.hpp
 * @brief Owner of every placed tile on one raft
 *
 * The registry keeps tiles by value keyed by TileId, and an occupancy map in
 * which each footprint cell aliases its tile's id. Every mutation keeps the
 * two in step and recomputes the aggregate before returning.
 *
 * Single writer: one registry per raft, mutated from the simulation thread.
 */

#include "world/BuildResult.hpp"
#include "world/GridTopology.hpp"
#include "world/StructureData.hpp"
#include <string>
#include <unordered_map>
#include <vector>

namespace Driftwood {

class ConstructionCatalog;
class PresentationSink;
class ResourceLedger;
struct ItemDefinition;

class StructureRegistry {
public:
    StructureRegistry(const ConstructionCatalog& catalog, const GridTopology& grid,
                      PresentationSink* sink = nullptr, float thrustPerEngine = 250.0f);

    /**
     * @brief Insert a tile whose footprint starts at origin
     *
     * Adjacency is the caller's concern (BuildSession checks it); the
     * registry only refuses footprints that overlap existing tiles.
     * @return The new tile, or nullptr if any footprint cell is taken
     */
    const Tile* place(const GridCoord& origin, const ItemDefinition& definition);

    /**
     * @brief Remove the tile covering cell together with all of its aliased cells
     * @return false if cell is empty
     */
    bool remove(const GridCoord& cell);

    /**
     * @brief Lower a tile's health, clamped at 0
     *
     * A tile at 0 health counts as destroyed but stays registered until removed.
     * @return false if cell is empty or amount is not positive
     */
    bool damage(const GridCoord& cell, float amount);

    /**
     * @brief Restore a damaged tile to full health, paying the item's repair cost
     */
    BuildResult repair(const GridCoord& cell, ResourceLedger* ledger);

    /**
     * @brief Move items into a storage tile
     * @return Amount actually stored (limited by remaining capacity)
     */
    int depositToStorage(const GridCoord& cell, const std::string& resourceId, int amount);

    /**
     * @brief Take items out of a storage tile
     * @return Amount actually removed
     */
    int withdrawFromStorage(const GridCoord& cell, const std::string& resourceId, int amount);

    const StructureAggregate& aggregate() const { return m_aggregate; }

    StructureSnapshot persist() const;

    /**
     * @brief Replace all tiles with the snapshot's contents
     *
     * Unknown tile types become the catalog's fallback type. Overlapping
     * entries are skipped.
     * @return Number of tiles recreated
     */
    size_t restore(const StructureSnapshot& snapshot);

    void clear();

    const Tile* tileAt(const GridCoord& cell) const;
    const Tile* getTile(TileId id) const;
    std::vector<const Tile*> getTiles() const; // ordered by id

    const OccupancyMap& getOccupancy() const { return m_occupancy; }
    const GridTopology& getGrid() const { return m_grid; }
    size_t size() const { return m_tiles.size(); }
    bool empty() const { return m_tiles.empty(); }

    float getThrustPerEngine() const { return m_thrustPerEngine; }
    void setPresentationSink(PresentationSink* sink) { m_sink = sink; }

private:
    // saved carries the health and storage a restored tile starts with
    const Tile* placeTile(const GridCoord& origin, const ItemDefinition& definition,
                          const TileRecord* saved);
    Tile* findTile(const GridCoord& cell);
    void recomputeAggregate();

    const ConstructionCatalog& m_catalog;
    const GridTopology& m_grid;
    PresentationSink* m_sink;
    float m_thrustPerEngine;

    std::unordered_map<TileId, Tile> m_tiles;
    OccupancyMap m_occupancy;
    TileId m_nextTileId{1};
    StructureAggregate m_aggregate{};
};

} // namespace Driftwood

#endif // STRUCTURE_REGISTRY_HPP
