/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "controllers/BuildSession.hpp"
#include "core/Logger.hpp"
#include "entities/resources/ResourceLedger.hpp"
#include "events/PresentationSink.hpp"
#include "managers/ConstructionCatalog.hpp"
#include "managers/SettingsManager.hpp"
#include "world/StructureRegistry.hpp"

using Driftwood::BuildResult;
using Driftwood::GridCoord;
using Driftwood::PlacementCheck;
using Driftwood::PresentationSink;

BuildSessionConfig BuildSessionConfig::fromSettings(const Driftwood::SettingsManager& settings)
{
    BuildSessionConfig config;
    config.placementOffset = settings.get<float>("build", "placement_offset", config.placementOffset);
    return config;
}

BuildSession::BuildSession(const Driftwood::ConstructionCatalog& catalog,
                           const Driftwood::GridTopology& grid,
                           Driftwood::StructureRegistry& registry,
                           Driftwood::ResourceLedger* ledger,
                           Driftwood::PresentationSink* sink,
                           BuildSessionConfig config)
    : m_catalog(catalog),
      m_grid(grid),
      m_registry(registry),
      m_ledger(ledger),
      m_sink(sink),
      m_config(config)
{
}

BuildResult BuildSession::start(const std::string& itemId,
                                const Vector3D& anchorPosition,
                                const Vector3D& anchorForward)
{
    if (m_state == BuildState::Active) {
        // Never leave an orphaned preview behind
        enterIdle();
    }

    const Driftwood::ItemDefinition* definition = m_catalog.find(itemId);
    if (definition == nullptr) {
        BUILD_WARN("start - Unknown item: " + itemId);
        return BuildResult::UnknownItem;
    }

    if (!Driftwood::canAfford(m_ledger, definition->cost)) {
        BUILD_DEBUG("start - Cannot afford " + itemId);
        return BuildResult::InsufficientResources;
    }

    m_state = BuildState::Active;
    m_itemId = itemId;
    m_previewCell = previewCellFor(anchorPosition, anchorForward);
    m_previewCheck = evaluate(*definition, m_previewCell);
    m_previewValid = (m_previewCheck == PlacementCheck::Ok);

    BUILD_INFO("Build mode started: " + itemId);
    Driftwood::notifySink(m_sink, "buildModeStarted",
                          [&](PresentationSink& sink) { sink.buildModeStarted(itemId); });
    return BuildResult::Success;
}

void BuildSession::tick(const Vector3D& anchorPosition, const Vector3D& anchorForward)
{
    if (m_state != BuildState::Active) {
        return;
    }

    const Driftwood::ItemDefinition* definition = m_catalog.find(m_itemId);
    if (definition == nullptr) {
        return;
    }

    m_previewCell = previewCellFor(anchorPosition, anchorForward);
    m_previewCheck = evaluate(*definition, m_previewCell);
    m_previewValid = (m_previewCheck == PlacementCheck::Ok);
}

BuildResult BuildSession::confirm()
{
    if (m_state != BuildState::Active) {
        return BuildResult::NoActiveSession;
    }

    const Driftwood::ItemDefinition* definition = m_catalog.find(m_itemId);
    if (definition == nullptr) {
        // Catalog is immutable after load, so this only happens on misuse
        BUILD_ERROR("confirm - Active item vanished from catalog: " + m_itemId);
        enterIdle();
        return BuildResult::UnknownItem;
    }

    // The structure may have changed since the last tick
    const GridCoord cell = m_previewCell;
    m_previewCheck = evaluate(*definition, cell);
    m_previewValid = (m_previewCheck == PlacementCheck::Ok);

    if (!m_previewValid) {
        const std::string reason = Driftwood::placementCheckToString(m_previewCheck);
        BUILD_DEBUG("confirm - Invalid placement at " + std::to_string(cell.column) + "," +
                    std::to_string(cell.row) + ": " + reason);
        Driftwood::notifySink(m_sink, "placementInvalid",
                              [&](PresentationSink& sink) { sink.placementInvalid(reason); });
        return BuildResult::InvalidPlacement;
    }

    if (!Driftwood::deductAll(m_ledger, definition->cost)) {
        return BuildResult::InsufficientResources;
    }

    const Driftwood::Tile* tile = m_registry.place(cell, *definition);
    if (tile == nullptr) {
        // Validity was just checked against the same occupancy; give the materials back
        BUILD_ERROR("confirm - Registry rejected a validated placement for " + m_itemId);
        for (const auto& [resourceId, amount] : definition->cost) {
            m_ledger->refund(resourceId, amount);
        }
        return BuildResult::InvalidPlacement;
    }

    BUILD_INFO("Placed " + m_itemId + " at " + std::to_string(cell.column) + "," +
               std::to_string(cell.row));

    // The cell is now occupied, so the preview is no longer valid until the actor moves
    m_previewCheck = evaluate(*definition, m_previewCell);
    m_previewValid = (m_previewCheck == PlacementCheck::Ok);

    if (!Driftwood::canAfford(m_ledger, definition->cost)) {
        BUILD_DEBUG("confirm - Out of materials for " + m_itemId + ", leaving build mode");
        enterIdle();
    }
    return BuildResult::Success;
}

BuildResult BuildSession::cancel()
{
    if (m_state != BuildState::Active) {
        return BuildResult::NoActiveSession;
    }
    enterIdle();
    return BuildResult::Success;
}

std::vector<GridCoord> BuildSession::placementHints() const
{
    if (m_registry.empty()) {
        if (m_state == BuildState::Active) {
            return {m_previewCell};
        }
        return {};
    }
    return Driftwood::GridTopology::frontier(m_registry.getOccupancy());
}

GridCoord BuildSession::previewCellFor(const Vector3D& anchorPosition,
                                       const Vector3D& anchorForward) const
{
    return m_grid.worldToGrid(anchorPosition + anchorForward.flattened() * m_config.placementOffset);
}

PlacementCheck BuildSession::evaluate(const Driftwood::ItemDefinition& definition,
                                      const GridCoord& cell) const
{
    const auto footprint = Driftwood::GridTopology::footprintCells(
        cell, definition.footprintWidth, definition.footprintDepth);
    return Driftwood::GridTopology::checkPlacement(cell, footprint, m_registry.getOccupancy());
}

void BuildSession::enterIdle()
{
    m_state = BuildState::Idle;
    m_itemId.clear();
    m_previewCell = GridCoord{};
    m_previewCheck = PlacementCheck::Ok;
    m_previewValid = false;

    BUILD_DEBUG("Build mode cancelled");
    Driftwood::notifySink(m_sink, "buildModeCancelled",
                          [](PresentationSink& sink) { sink.buildModeCancelled(); });
}
