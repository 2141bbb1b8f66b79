/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef BUILD_SESSION_HPP
#define BUILD_SESSION_HPP

/**
 * @file BuildSession.hpp
 * @brief Per-actor build mode: preview, validation and confirmation of placements
 *
 * States:
 *   Idle   --start(item)-->  Active(item, previewCell, valid)
 *   Active --tick(pose)--->  Active (preview/validity refresh only)
 *   Active --confirm()--->   Active, or Idle once the item is no longer affordable
 *   Active --cancel()---->   Idle
 *
 * Confirmation is a transaction: the full cost is deducted across every
 * resource type or not at all, and only then is the tile committed.
 *
 * Ownership: the actor's state owns the session (not a singleton). The
 * catalog, grid, registry, ledger and sink must outlive it.
 */

#include "utils/Vector3D.hpp"
#include "world/BuildResult.hpp"
#include "world/GridTopology.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace Driftwood {
class ConstructionCatalog;
class PresentationSink;
class ResourceLedger;
class SettingsManager;
class StructureRegistry;
struct ItemDefinition;
}

struct BuildSessionConfig {
    float placementOffset{3.0f}; // distance in front of the anchor, world units

    static BuildSessionConfig fromSettings(const Driftwood::SettingsManager& settings);
};

enum class BuildState : uint8_t {
    Idle,
    Active
};

class BuildSession
{
public:
    BuildSession(const Driftwood::ConstructionCatalog& catalog,
                 const Driftwood::GridTopology& grid,
                 Driftwood::StructureRegistry& registry,
                 Driftwood::ResourceLedger* ledger,
                 Driftwood::PresentationSink* sink = nullptr,
                 BuildSessionConfig config = {});

    /**
     * @brief Enter build mode for itemId, previewing in front of the anchor
     *
     * An already active session is cancelled first.
     * @return UnknownItem, InsufficientResources or Success
     */
    Driftwood::BuildResult start(const std::string& itemId,
                                 const Vector3D& anchorPosition,
                                 const Vector3D& anchorForward);

    /**
     * @brief Refresh the preview cell and validity flag from the actor pose
     * @note Never changes state. No-op while idle.
     */
    void tick(const Vector3D& anchorPosition, const Vector3D& anchorForward);

    /**
     * @brief Place the previewed item
     *
     * Failures leave the session Active and the ledger untouched. After a
     * success the session drops to Idle if the item can no longer be paid for.
     */
    Driftwood::BuildResult confirm();

    Driftwood::BuildResult cancel();

    /**
     * @brief Cells to highlight as candidate placements
     * @return The structure frontier, or the preview cell for an empty raft
     */
    [[nodiscard]] std::vector<Driftwood::GridCoord> placementHints() const;

    [[nodiscard]] BuildState getState() const { return m_state; }
    [[nodiscard]] bool isActive() const { return m_state == BuildState::Active; }
    [[nodiscard]] const std::string& getItemId() const { return m_itemId; }
    [[nodiscard]] const Driftwood::GridCoord& getPreviewCell() const { return m_previewCell; }
    [[nodiscard]] bool isPreviewValid() const { return m_previewValid; }
    [[nodiscard]] Driftwood::PlacementCheck getPreviewCheck() const { return m_previewCheck; }
    [[nodiscard]] std::string_view getName() const { return "BuildSession"; }

    void setLedger(Driftwood::ResourceLedger* ledger) { m_ledger = ledger; }
    void setPresentationSink(Driftwood::PresentationSink* sink) { m_sink = sink; }

private:
    Driftwood::GridCoord previewCellFor(const Vector3D& anchorPosition,
                                        const Vector3D& anchorForward) const;
    Driftwood::PlacementCheck evaluate(const Driftwood::ItemDefinition& definition,
                                       const Driftwood::GridCoord& cell) const;
    void enterIdle();

    const Driftwood::ConstructionCatalog& m_catalog;
    const Driftwood::GridTopology& m_grid;
    Driftwood::StructureRegistry& m_registry;
    Driftwood::ResourceLedger* m_ledger;
    Driftwood::PresentationSink* m_sink;
    BuildSessionConfig m_config;

    BuildState m_state{BuildState::Idle};
    std::string m_itemId;
    Driftwood::GridCoord m_previewCell{};
    Driftwood::PlacementCheck m_previewCheck{Driftwood::PlacementCheck::Ok};
    bool m_previewValid{false};
};

#endif // BUILD_SESSION_HPP
