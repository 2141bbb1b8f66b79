/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef GRID_TOPOLOGY_HPP
#define GRID_TOPOLOGY_HPP

#include "utils/Vector3D.hpp"
#include <boost/container/small_vector.hpp>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <ostream>
#include <unordered_map>
#include <vector>

namespace Driftwood {

struct GridCoord {
    int column{0};
    int row{0};

    bool operator==(const GridCoord& other) const {
        return column == other.column && row == other.row;
    }
    bool operator!=(const GridCoord& other) const { return !(*this == other); }

    GridCoord offset(int dColumn, int dRow) const { return GridCoord{column + dColumn, row + dRow}; }
};

inline std::ostream& operator<<(std::ostream& os, const GridCoord& cell) {
    return os << "[" << cell.column << ", " << cell.row << "]";
}

struct GridCoordHash {
    size_t operator()(const GridCoord& cell) const {
        // Pack both halves so neighbouring cells never collide
        const uint64_t packed = (static_cast<uint64_t>(static_cast<uint32_t>(cell.column)) << 32) |
                                static_cast<uint32_t>(cell.row);
        return std::hash<uint64_t>{}(packed);
    }
};

using TileId = uint32_t;
constexpr TileId INVALID_TILE_ID = 0;

// Cell -> owning tile. Multi-cell tiles appear once per footprint cell.
using OccupancyMap = std::unordered_map<GridCoord, TileId, GridCoordHash>;

// Most items are 1x1 or 2x1; larger footprints spill to the heap
using FootprintCells = boost::container::small_vector<GridCoord, 4>;

enum class PlacementCheck : uint8_t {
    Ok,
    Occupied,     // a footprint cell already belongs to a tile
    NotAdjacent,  // structure is non-empty and the origin touches nothing
    OutOfBounds   // a footprint cell lies outside the addressable lattice
};

const char* placementCheckToString(PlacementCheck check);

/**
 * @brief World <-> lattice mapping and placement rules for the raft grid
 *
 * The grid lies in the XZ plane. Column follows X, row follows Z. Cell (c, r)
 * is centered at (c * cellSize, r * cellSize).
 */
class GridTopology {
public:
    // Cells with |column| or |row| at or beyond this are never placeable
    static constexpr int MAX_GRID_EXTENT = 1 << 20;

    explicit GridTopology(float cellSize = 1.5f);

    float getCellSize() const { return m_cellSize; }

    /**
     * @brief Snap a world position to the nearest cell (half away from zero)
     *
     * Positions past the lattice saturate at +/-MAX_GRID_EXTENT and non-finite
     * axes map to MAX_GRID_EXTENT, so the result is always out of bounds
     * rather than wrapped.
     */
    GridCoord worldToGrid(const Vector3D& position) const;

    /**
     * @brief Cell center; the vertical axis is left to the caller
     */
    Vector3D gridToWorld(const GridCoord& cell, float y = 0.0f) const;

    /**
     * @brief Cells covered by a width x depth item anchored at origin
     */
    static FootprintCells footprintCells(const GridCoord& origin, int width, int depth);

    /**
     * @brief Full placement verdict for a footprint
     *
     * Adjacency is checked against the origin cell only; the first placement
     * on an empty structure needs no neighbour.
     */
    static PlacementCheck checkPlacement(const GridCoord& origin, const FootprintCells& footprint,
                                         const OccupancyMap& occupancy);

    static bool isValidPlacement(const GridCoord& origin, const FootprintCells& footprint,
                                 const OccupancyMap& occupancy) {
        return checkPlacement(origin, footprint, occupancy) == PlacementCheck::Ok;
    }

    /**
     * @brief Unoccupied orthogonal neighbours of the structure
     * @return Sorted by (row, column), no duplicates
     */
    static std::vector<GridCoord> frontier(const OccupancyMap& occupancy);

    static bool isInBounds(const GridCoord& cell) {
        return cell.column > -MAX_GRID_EXTENT && cell.column < MAX_GRID_EXTENT &&
               cell.row > -MAX_GRID_EXTENT && cell.row < MAX_GRID_EXTENT;
    }

    static bool hasOccupiedNeighbor(const GridCoord& cell, const OccupancyMap& occupancy);

private:
    float m_cellSize;
};

} // namespace Driftwood

#endif // GRID_TOPOLOGY_HPP
