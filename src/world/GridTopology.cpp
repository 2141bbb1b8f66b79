/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "world/GridTopology.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <array>
#include <cmath>
#include <unordered_set>

namespace Driftwood {

namespace {
constexpr std::array<GridCoord, 4> ORTHOGONAL_OFFSETS{{{1, 0}, {-1, 0}, {0, 1}, {0, -1}}};

int snapAxis(float coordinate, float cellSize) {
    const double cells = static_cast<double>(std::round(coordinate / cellSize));
    if (!std::isfinite(cells)) {
        return std::isinf(cells) && cells < 0.0 ? -GridTopology::MAX_GRID_EXTENT
                                                : GridTopology::MAX_GRID_EXTENT;
    }
    const double limit = static_cast<double>(GridTopology::MAX_GRID_EXTENT);
    return static_cast<int>(std::clamp(cells, -limit, limit));
}
}

const char* placementCheckToString(PlacementCheck check) {
    switch (check) {
        case PlacementCheck::Ok: return "Ok";
        case PlacementCheck::Occupied: return "Occupied";
        case PlacementCheck::NotAdjacent: return "NotAdjacent";
        case PlacementCheck::OutOfBounds: return "OutOfBounds";
    }
    return "Unknown";
}

GridTopology::GridTopology(float cellSize) : m_cellSize(cellSize) {
    if (!(cellSize > 0.0f) || !std::isfinite(cellSize)) {
        GRID_WARN("Invalid cell size " + std::to_string(cellSize) + ", using 1.0");
        m_cellSize = 1.0f;
    }
}

GridCoord GridTopology::worldToGrid(const Vector3D& position) const {
    return GridCoord{snapAxis(position.getX(), m_cellSize), snapAxis(position.getZ(), m_cellSize)};
}

Vector3D GridTopology::gridToWorld(const GridCoord& cell, float y) const {
    return Vector3D(static_cast<float>(cell.column) * m_cellSize, y,
                    static_cast<float>(cell.row) * m_cellSize);
}

FootprintCells GridTopology::footprintCells(const GridCoord& origin, int width, int depth) {
    FootprintCells cells;
    const int w = std::max(width, 1);
    const int d = std::max(depth, 1);
    cells.reserve(static_cast<size_t>(w) * static_cast<size_t>(d));
    for (int dz = 0; dz < d; ++dz) {
        for (int dx = 0; dx < w; ++dx) {
            cells.push_back(origin.offset(dx, dz));
        }
    }
    return cells;
}

bool GridTopology::hasOccupiedNeighbor(const GridCoord& cell, const OccupancyMap& occupancy) {
    for (const auto& offset : ORTHOGONAL_OFFSETS) {
        if (occupancy.count(cell.offset(offset.column, offset.row)) > 0) {
            return true;
        }
    }
    return false;
}

PlacementCheck GridTopology::checkPlacement(const GridCoord& origin, const FootprintCells& footprint,
                                            const OccupancyMap& occupancy) {
    for (const auto& cell : footprint) {
        if (!isInBounds(cell)) {
            return PlacementCheck::OutOfBounds;
        }
    }
    for (const auto& cell : footprint) {
        if (occupancy.count(cell) > 0) {
            return PlacementCheck::Occupied;
        }
    }

    if (occupancy.empty()) {
        return PlacementCheck::Ok;
    }

    // Origin-only adjacency: a wide item may touch the raft with a non-origin cell and still be rejected
    return hasOccupiedNeighbor(origin, occupancy) ? PlacementCheck::Ok : PlacementCheck::NotAdjacent;
}

std::vector<GridCoord> GridTopology::frontier(const OccupancyMap& occupancy) {
    std::unordered_set<GridCoord, GridCoordHash> seen;
    std::vector<GridCoord> result;

    for (const auto& [cell, tile] : occupancy) {
        (void)tile;
        for (const auto& offset : ORTHOGONAL_OFFSETS) {
            GridCoord neighbor = cell.offset(offset.column, offset.row);
            if (occupancy.count(neighbor) == 0 && seen.insert(neighbor).second) {
                result.push_back(neighbor);
            }
        }
    }

    std::sort(result.begin(), result.end(), [](const GridCoord& a, const GridCoord& b) {
        return a.row != b.row ? a.row < b.row : a.column < b.column;
    });
    return result;
}

} // namespace Driftwood
