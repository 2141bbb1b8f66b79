/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "controllers/BuildSession.hpp"
#include "controllers/RaftMotionController.hpp"
#include "core/Logger.hpp"
#include "core/SimulationClock.hpp"
#include "entities/resources/InventoryComponent.hpp"
#include "managers/ConstructionCatalog.hpp"
#include "managers/SaveGameManager.hpp"
#include "managers/SettingsManager.hpp"
#include "world/GridTopology.hpp"
#include "world/StructureRegistry.hpp"
#include "world/WaveField.hpp"
#include <algorithm>
#include <array>
#include <cstring>
#include <string>
#include <vector>

// Headless session: build a small raft, sail it into a storm, save it.

namespace {

struct BuildStep {
  const char* itemId;
  Vector3D anchor;   // builder position
  Vector3D forward;  // builder facing
};

std::vector<BuildStep> makeBuildPlan(const Driftwood::GridTopology& grid, float offset) {
  // The builder stands `offset` behind each target cell facing +Z
  auto standBehind = [&](int column, int row) {
    Vector3D cell = grid.gridToWorld(Driftwood::GridCoord{column, row});
    return cell - Vector3D(0.0f, 0.0f, offset);
  };
  const Vector3D facing(0.0f, 0.0f, 1.0f);

  return {
      {"foundation", standBehind(0, 0), facing},
      {"foundation", standBehind(1, 0), facing},
      {"foundation", standBehind(0, 1), facing},
      {"foundation", standBehind(1, 1), facing},
      {"storage", standBehind(0, 2), facing},
      {"engine", standBehind(0, -1), facing},
      {"rudder", standBehind(2, 0), facing},
  };
}

} // namespace

int main(int argc, char* argv[]) {
  SIMLOOP_INFO("Initializing Driftwood raft simulation");

  bool realtime = false;
  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "--realtime") == 0) {
      realtime = true;
    }
  }

  auto& settings = Driftwood::SettingsManager::Instance();
  if (!settings.loadFromFile("res/settings.json")) {
    SIMLOOP_WARN("Failed to load settings.json - using defaults");
  }
  settings.applyDefaults();

  Driftwood::ConstructionCatalog catalog;
  const std::string catalogPath =
      settings.get<std::string>("simulation", "catalog_path", "res/data/construction_items.json");
  if (!catalog.loadFromJson(catalogPath) || catalog.empty()) {
    SIMLOOP_WARN("Catalog data unavailable at " + catalogPath + " - using built-in items");
    catalog = Driftwood::ConstructionCatalog::createDefault();
  }

  Driftwood::WaveField ocean(Driftwood::WaveFieldConfig::fromSettings(settings));
  Driftwood::GridTopology grid(settings.get<float>("grid", "cell_size", 1.5f));
  Driftwood::StructureRegistry registry(catalog, grid, nullptr,
                                        settings.get<float>("structure", "thrust_per_engine", 250.0f));

  InventoryComponent inventory;
  inventory.addResource("plank", 60);
  inventory.addResource("rope", 12);
  inventory.addResource("nail", 8);
  inventory.addResource("scrap", 20);

  const BuildSessionConfig buildConfig = BuildSessionConfig::fromSettings(settings);
  BuildSession session(catalog, grid, registry, &inventory, nullptr, buildConfig);

  for (const auto& step : makeBuildPlan(grid, buildConfig.placementOffset)) {
    Driftwood::BuildResult result = session.start(step.itemId, step.anchor, step.forward);
    if (result == Driftwood::BuildResult::Success) {
      result = session.confirm();
    }
    if (result != Driftwood::BuildResult::Success) {
      SIMLOOP_WARN(std::string("Could not build ") + step.itemId + ": " +
                   Driftwood::buildResultToString(result));
    }
    if (session.cancel() == Driftwood::BuildResult::Success) {
      SIMLOOP_DEBUG("Left build mode after " + std::string(step.itemId));
    }
  }

  const auto& agg = registry.aggregate();
  SIMLOOP_INFO("Raft built: " + std::to_string(agg.tileCount) + " tiles, thrust " +
               std::to_string(agg.thrust) + ", steering " + std::to_string(agg.steering));

  RaftMotionController motion(registry, ocean, RaftMotionConfig::fromSettings(settings));
  motion.setThrottle(1.0f);

  // Ocean first so the raft samples this tick's surface
  std::array<IUpdatable*, 2> updateOrder{&ocean, &motion};

  SimulationClock clock(static_cast<float>(settings.get<int>("simulation", "tick_rate", 60)));
  clock.setRealtimePacing(realtime);
  const uint64_t totalTicks =
      static_cast<uint64_t>(std::max(settings.get<int>("simulation", "demo_ticks", 600), 1));

  while (clock.getTickCount() < totalTicks) {
    if (realtime) {
      clock.startFrame();
    } else {
      clock.advanceBy(clock.getUpdateDeltaTime());
    }

    while (clock.shouldUpdate()) {
      const float progress = static_cast<float>(clock.getTickCount()) / static_cast<float>(totalTicks);
      ocean.setStormIntensity(progress);
      motion.setSteerInput(progress > 0.5f ? 0.5f : 0.0f);

      for (IUpdatable* system : updateOrder) {
        system->update(clock.getUpdateDeltaTime());
      }
    }

    clock.endFrame();
  }

  const Vector3D& position = motion.getPosition();
  SIMLOOP_INFO("Sailed " + std::to_string(clock.getSimulatedSeconds()) + "s, raft at (" +
               std::to_string(position.getX()) + ", " + std::to_string(position.getY()) + ", " +
               std::to_string(position.getZ()) + "), storm " + std::to_string(ocean.getStormIntensity()));

  auto& saves = SaveGameManager::Instance();
  saves.setSaveDirectory(settings.get<std::string>("simulation", "save_directory", "saves"));
  if (!saves.saveToSlot(1, registry.persist())) {
    SIMLOOP_ERROR("Failed to save raft to slot 1");
    return 1;
  }

  SIMLOOP_INFO("Raft saved to " + SaveGameManager::getSlotFileName(1));
  return 0;
}
