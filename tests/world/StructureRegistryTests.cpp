/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE StructureRegistryTests
#include <boost/test/unit_test.hpp>

#include "entities/resources/InventoryComponent.hpp"
#include "managers/ConstructionCatalog.hpp"
#include "mocks/MockPresentationSink.hpp"
#include "utils/JsonReader.hpp"
#include "world/StructureRegistry.hpp"
#include <set>
#include <tuple>

using namespace Driftwood;

struct RegistryFixture {
    RegistryFixture()
        : catalog(ConstructionCatalog::createDefault()),
          grid(2.0f),
          registry(catalog, grid, &sink, 250.0f) {}

    const Tile* placeItem(const std::string& itemId, int column, int row) {
        const ItemDefinition* definition = catalog.find(itemId);
        BOOST_REQUIRE(definition != nullptr);
        return registry.place(GridCoord{column, row}, *definition);
    }

    ConstructionCatalog catalog;
    GridTopology grid;
    MockPresentationSink sink;
    StructureRegistry registry;
    InventoryComponent inventory;
};

BOOST_FIXTURE_TEST_SUITE(StructureRegistryTestSuite, RegistryFixture)

BOOST_AUTO_TEST_CASE(TestEmptyAggregate) {
    const StructureAggregate& agg = registry.aggregate();
    BOOST_CHECK(registry.empty());
    BOOST_CHECK_EQUAL(agg.tileCount, 0u);
    BOOST_CHECK(agg.centerOfMass == Vector3D(0.0f, 0.0f, 0.0f));
    BOOST_CHECK_EQUAL(agg.healthPercent, 1.0f);
    BOOST_CHECK(!agg.canMove);
    BOOST_CHECK_EQUAL(agg.thrust, 0.0f);
    BOOST_CHECK_EQUAL(agg.steering, 0.0f);
}

BOOST_AUTO_TEST_CASE(TestPlaceSingleTile) {
    const Tile* tile = placeItem("foundation", 3, -2);
    BOOST_REQUIRE(tile != nullptr);
    BOOST_CHECK_NE(tile->id, INVALID_TILE_ID);
    BOOST_CHECK_EQUAL(tile->itemId, "foundation");
    BOOST_CHECK_EQUAL(tile->health, tile->maxHealth);
    BOOST_CHECK(tile->worldPosition == grid.gridToWorld(GridCoord{3, -2}));

    BOOST_CHECK_EQUAL(registry.size(), 1u);
    BOOST_CHECK(registry.tileAt(GridCoord{3, -2}) == tile);
    BOOST_CHECK(registry.getTile(tile->id) == tile);
    BOOST_CHECK(registry.aggregate().centerOfMass == tile->worldPosition);

    BOOST_REQUIRE_EQUAL(sink.placedIds.size(), 1u);
    BOOST_CHECK_EQUAL(sink.placedIds[0], tile->id);
    BOOST_CHECK_EQUAL(sink.placedCells[0], (GridCoord{3, -2}));
}

BOOST_AUTO_TEST_CASE(TestOverlapIsRejected) {
    BOOST_REQUIRE(placeItem("foundation", 0, 0) != nullptr);
    BOOST_CHECK(placeItem("floor", 0, 0) == nullptr);
    // Engine is 2 wide, so origin (-1,0) would cover (0,0)
    BOOST_CHECK(placeItem("engine", -1, 0) == nullptr);

    BOOST_CHECK_EQUAL(registry.size(), 1u);
    BOOST_CHECK_EQUAL(registry.getOccupancy().size(), 1u);
    BOOST_CHECK_EQUAL(sink.placedIds.size(), 1u);
}

BOOST_AUTO_TEST_CASE(TestCenterOfMassIsMeanOfTiles) {
    const Tile* a = placeItem("foundation", 0, 0);
    const Tile* b = placeItem("foundation", 1, 0);
    BOOST_REQUIRE(a != nullptr);
    BOOST_REQUIRE(b != nullptr);

    const float expectedX = (a->worldPosition.getX() + b->worldPosition.getX()) / 2.0f;
    BOOST_CHECK_CLOSE(registry.aggregate().centerOfMass.getX(), expectedX, 0.001f);
    BOOST_CHECK_SMALL(registry.aggregate().centerOfMass.getZ(), 1e-6f);
    BOOST_CHECK_EQUAL(registry.aggregate().tileCount, 2u);
}

BOOST_AUTO_TEST_CASE(TestMultiCellTileAliasesEveryCell) {
    const Tile* engine = placeItem("engine", 0, 0);
    BOOST_REQUIRE(engine != nullptr);
    const TileId id = engine->id;

    BOOST_CHECK_EQUAL(engine->footprint.size(), 2u);
    BOOST_CHECK_EQUAL(registry.getOccupancy().size(), 2u);
    BOOST_CHECK(registry.tileAt(GridCoord{0, 0}) == registry.tileAt(GridCoord{1, 0}));

    // Removing through the second cell clears both
    BOOST_CHECK(registry.remove(GridCoord{1, 0}));
    BOOST_CHECK(registry.empty());
    BOOST_CHECK(registry.getOccupancy().empty());
    BOOST_CHECK(registry.getTile(id) == nullptr);
    BOOST_REQUIRE_EQUAL(sink.removedCells.size(), 1u);
    BOOST_CHECK_EQUAL(sink.removedCells[0], (GridCoord{0, 0}));

    BOOST_CHECK(!registry.remove(GridCoord{1, 0}));
}

BOOST_AUTO_TEST_CASE(TestEnginesAndRuddersDriveAggregate) {
    placeItem("foundation", 0, 0);
    BOOST_CHECK(!registry.aggregate().canMove);

    placeItem("engine", 0, -1);
    placeItem("engine", 0, 1);
    placeItem("rudder", -1, 0);

    const StructureAggregate& agg = registry.aggregate();
    BOOST_CHECK(agg.canMove);
    BOOST_CHECK_CLOSE(agg.thrust, 500.0f, 0.001f);
    BOOST_CHECK_EQUAL(agg.steering, 1.0f);
    BOOST_CHECK_EQUAL(agg.tileCount, 4u);
}

BOOST_AUTO_TEST_CASE(TestDestroyedEngineStopsThrust) {
    placeItem("foundation", 0, 0);
    placeItem("engine", 1, 0);
    BOOST_REQUIRE(registry.aggregate().canMove);

    BOOST_CHECK(registry.damage(GridCoord{2, 0}, 1000.0f));
    const Tile* engine = registry.tileAt(GridCoord{1, 0});
    BOOST_REQUIRE(engine != nullptr);
    BOOST_CHECK_EQUAL(engine->health, 0.0f);
    BOOST_CHECK(engine->isDestroyed());

    // Still registered, but no longer propels
    BOOST_CHECK_EQUAL(registry.size(), 2u);
    BOOST_CHECK(!registry.aggregate().canMove);
    BOOST_CHECK_EQUAL(registry.aggregate().thrust, 0.0f);
    BOOST_CHECK_CLOSE(registry.aggregate().healthPercent, 0.5f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestDamageRejectsBadInput) {
    placeItem("foundation", 0, 0);
    BOOST_CHECK(!registry.damage(GridCoord{5, 5}, 10.0f));
    BOOST_CHECK(!registry.damage(GridCoord{0, 0}, 0.0f));
    BOOST_CHECK(!registry.damage(GridCoord{0, 0}, -5.0f));
    BOOST_CHECK_EQUAL(registry.aggregate().healthPercent, 1.0f);

    BOOST_CHECK(registry.damage(GridCoord{0, 0}, 25.0f));
    BOOST_CHECK_CLOSE(registry.aggregate().healthPercent, 0.75f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestRepairPaysRepairCost) {
    placeItem("foundation", 0, 0);
    inventory.addResource("plank", 5);

    BOOST_CHECK(registry.repair(GridCoord{0, 0}, &inventory) == BuildResult::InvalidPlacement);
    BOOST_CHECK(registry.repair(GridCoord{9, 9}, &inventory) == BuildResult::InvalidPlacement);

    registry.damage(GridCoord{0, 0}, 40.0f);
    BOOST_CHECK(registry.repair(GridCoord{0, 0}, &inventory) == BuildResult::Success);
    BOOST_CHECK_EQUAL(registry.tileAt(GridCoord{0, 0})->health, 100.0f);
    BOOST_CHECK_EQUAL(inventory.getResourceQuantity("plank"), 4);
}

BOOST_AUTO_TEST_CASE(TestRepairWithoutMaterialsLeavesLedgerUntouched) {
    placeItem("engine", 0, 0);
    registry.damage(GridCoord{0, 0}, 10.0f);
    inventory.addResource("scrap", 2);

    BOOST_CHECK(registry.repair(GridCoord{0, 0}, &inventory) == BuildResult::InsufficientResources);
    BOOST_CHECK_EQUAL(inventory.getResourceQuantity("scrap"), 2);
    BOOST_CHECK_CLOSE(registry.tileAt(GridCoord{0, 0})->health, 140.0f, 0.001f);

    BOOST_CHECK(registry.repair(GridCoord{0, 0}, nullptr) == BuildResult::InsufficientResources);
}

BOOST_AUTO_TEST_CASE(TestStorageCapacity) {
    placeItem("storage", 0, 0);
    placeItem("foundation", 1, 0);

    BOOST_CHECK_EQUAL(registry.depositToStorage(GridCoord{0, 0}, "plank", 15), 15);
    BOOST_CHECK_EQUAL(registry.depositToStorage(GridCoord{0, 0}, "rope", 10), 5);
    BOOST_CHECK_EQUAL(registry.depositToStorage(GridCoord{0, 0}, "nail", 1), 0);
    BOOST_CHECK_EQUAL(registry.tileAt(GridCoord{0, 0})->storedTotal(), 20);

    // Not a storage tile
    BOOST_CHECK_EQUAL(registry.depositToStorage(GridCoord{1, 0}, "plank", 1), 0);

    BOOST_CHECK_EQUAL(registry.withdrawFromStorage(GridCoord{0, 0}, "rope", 8), 5);
    BOOST_CHECK_EQUAL(registry.withdrawFromStorage(GridCoord{0, 0}, "rope", 1), 0);
    BOOST_CHECK_EQUAL(registry.withdrawFromStorage(GridCoord{0, 0}, "plank", 4), 4);
    BOOST_CHECK_EQUAL(registry.tileAt(GridCoord{0, 0})->storedItems.at("plank"), 11);
}

BOOST_AUTO_TEST_CASE(TestPersistRestoreRoundTrip) {
    placeItem("foundation", 0, 0);
    placeItem("foundation", 1, 0);
    placeItem("engine", 0, 1);
    placeItem("storage", -1, 0);
    placeItem("rudder", 2, 0);
    registry.damage(GridCoord{1, 0}, 30.0f);
    registry.depositToStorage(GridCoord{-1, 0}, "scrap", 7);

    const StructureSnapshot snapshot = registry.persist();
    BOOST_CHECK_EQUAL(snapshot.version, StructureSnapshot::CURRENT_VERSION);
    BOOST_CHECK_EQUAL(snapshot.tiles.size(), 5u);
    const Vector3D centerBefore = registry.aggregate().centerOfMass;
    const float thrustBefore = registry.aggregate().thrust;

    using TileKey = std::tuple<std::string, int, int, float>;
    std::set<TileKey> before;
    for (const Tile* tile : registry.getTiles()) {
        before.emplace(tile->itemId, tile->origin.column, tile->origin.row, tile->health);
    }

    StructureRegistry restored(catalog, grid);
    BOOST_CHECK_EQUAL(restored.restore(snapshot), 5u);

    std::set<TileKey> after;
    for (const Tile* tile : restored.getTiles()) {
        after.emplace(tile->itemId, tile->origin.column, tile->origin.row, tile->health);
    }
    BOOST_CHECK(before == after);

    const Vector3D centerAfter = restored.aggregate().centerOfMass;
    BOOST_CHECK_SMALL(Vector3D::distance(centerBefore, centerAfter), 1e-4f);
    BOOST_CHECK_EQUAL(restored.aggregate().thrust, thrustBefore);
    BOOST_CHECK_EQUAL(restored.tileAt(GridCoord{-1, 0})->storedItems.at("scrap"), 7);
    BOOST_CHECK_EQUAL(restored.getOccupancy().size(), 6u);
}

BOOST_AUTO_TEST_CASE(TestSnapshotSurvivesJson) {
    placeItem("foundation", 0, 0);
    placeItem("storage", 0, 1);
    registry.depositToStorage(GridCoord{0, 1}, "plank", 3);

    JsonReader reader;
    BOOST_REQUIRE(reader.parse(registry.persist().toJson().toString()));

    StructureSnapshot parsed;
    BOOST_REQUIRE(StructureSnapshot::fromJson(reader.getRoot(), parsed));
    BOOST_CHECK_EQUAL(parsed.version, StructureSnapshot::CURRENT_VERSION);
    BOOST_REQUIRE_EQUAL(parsed.tiles.size(), 2u);
    BOOST_CHECK_EQUAL(parsed.tiles[1].tileType, "storage");
    BOOST_CHECK_EQUAL(parsed.tiles[1].gridPosition, (GridCoord{0, 1}));
    BOOST_CHECK_EQUAL(parsed.tiles[1].storedItems.at("plank"), 3);
    BOOST_CHECK_CLOSE(parsed.raftCenter.getZ(), registry.aggregate().centerOfMass.getZ(), 0.001f);
}

BOOST_AUTO_TEST_CASE(TestLegacySnapshotDefaults) {
    JsonReader reader;
    BOOST_REQUIRE(reader.parse(R"({"tiles": [{"tileType": "floor", "gridPosition": {"x": 2, "y": 3}}]})"));

    StructureSnapshot parsed;
    BOOST_REQUIRE(StructureSnapshot::fromJson(reader.getRoot(), parsed));
    BOOST_CHECK_EQUAL(parsed.version, 0);
    BOOST_REQUIRE_EQUAL(parsed.tiles.size(), 1u);

    // Missing health restores at full strength
    BOOST_CHECK_EQUAL(registry.restore(parsed), 1u);
    const Tile* floor = registry.tileAt(GridCoord{2, 3});
    BOOST_REQUIRE(floor != nullptr);
    BOOST_CHECK_EQUAL(floor->health, floor->maxHealth);

    JsonReader notObject;
    BOOST_REQUIRE(notObject.parse("[]"));
    BOOST_CHECK(!StructureSnapshot::fromJson(notObject.getRoot(), parsed));
}

BOOST_AUTO_TEST_CASE(TestRestoreUsesFallbackAndSkipsOverlaps) {
    StructureSnapshot snapshot;
    snapshot.tiles.push_back(TileRecord{"foundation", GridCoord{0, 0}, 50.0f, {}});
    snapshot.tiles.push_back(TileRecord{"sail_mast", GridCoord{1, 0}, 100.0f, {}});
    snapshot.tiles.push_back(TileRecord{"floor", GridCoord{0, 0}, 60.0f, {}});
    snapshot.tiles.push_back(TileRecord{"wall", GridCoord{0, 1}, -20.0f, {}});

    BOOST_CHECK_EQUAL(registry.restore(snapshot), 3u);
    BOOST_CHECK_EQUAL(registry.tileAt(GridCoord{1, 0})->itemId, "foundation");
    BOOST_CHECK_EQUAL(registry.tileAt(GridCoord{0, 0})->health, 50.0f);
    BOOST_CHECK_EQUAL(registry.tileAt(GridCoord{0, 1})->health, 0.0f);
}

BOOST_AUTO_TEST_CASE(TestRestoreNotifiesWithSavedState) {
    StructureSnapshot snapshot;
    snapshot.tiles.push_back(TileRecord{"foundation", GridCoord{0, 0}, 40.0f, {}});
    snapshot.tiles.push_back(TileRecord{"storage", GridCoord{0, 1}, 25.0f, {{"plank", 4}}});

    BOOST_CHECK_EQUAL(registry.restore(snapshot), 2u);
    BOOST_REQUIRE_EQUAL(sink.placedHealths.size(), 2u);
    BOOST_CHECK_EQUAL(sink.placedHealths[0], 40.0f);
    BOOST_CHECK_EQUAL(sink.placedHealths[1], 25.0f);
    BOOST_CHECK_EQUAL(sink.placedStoredTotals[1], 4);
}

BOOST_AUTO_TEST_CASE(TestOutOfRangePositionsAreContained) {
    JsonReader reader;
    BOOST_REQUIRE(reader.parse(R"({"tiles": [
        {"tileType": "foundation", "gridPosition": {"x": 1e12, "y": 0}},
        {"tileType": "floor", "gridPosition": {"x": 2147483647, "y": 0}}
    ]})"));

    StructureSnapshot parsed;
    BOOST_REQUIRE(StructureSnapshot::fromJson(reader.getRoot(), parsed));
    BOOST_REQUIRE_EQUAL(parsed.tiles.size(), 2u);
    // A coordinate that does not fit an int reads as the default
    BOOST_CHECK_EQUAL(parsed.tiles[0].gridPosition, (GridCoord{0, 0}));
    BOOST_CHECK_EQUAL(parsed.tiles[1].gridPosition.column, 2147483647);

    // The in-range but unaddressable cell is skipped
    BOOST_CHECK_EQUAL(registry.restore(parsed), 1u);
    BOOST_CHECK(registry.tileAt(GridCoord{0, 0}) != nullptr);
    BOOST_CHECK_EQUAL(registry.getOccupancy().size(), 1u);

    const ItemDefinition* floor = catalog.find("floor");
    BOOST_REQUIRE(floor != nullptr);
    BOOST_CHECK(registry.place(GridCoord{0, GridTopology::MAX_GRID_EXTENT}, *floor) == nullptr);
}

BOOST_AUTO_TEST_CASE(TestRestoreReplacesExistingTiles) {
    placeItem("foundation", 5, 5);
    sink.reset();

    StructureSnapshot snapshot;
    snapshot.tiles.push_back(TileRecord{"floor", GridCoord{0, 0}, 60.0f, {}});
    BOOST_CHECK_EQUAL(registry.restore(snapshot), 1u);

    BOOST_CHECK(registry.tileAt(GridCoord{5, 5}) == nullptr);
    BOOST_CHECK_EQUAL(registry.size(), 1u);
    BOOST_REQUIRE_EQUAL(sink.removedCells.size(), 1u);
    BOOST_CHECK_EQUAL(sink.removedCells[0], (GridCoord{5, 5}));
    BOOST_CHECK_EQUAL(sink.placedIds.size(), 1u);
}

BOOST_AUTO_TEST_CASE(TestThrowingSinkDoesNotBreakPlacement) {
    sink.throwOnPlaced = true;
    const Tile* tile = placeItem("foundation", 0, 0);
    BOOST_CHECK(tile != nullptr);
    BOOST_CHECK_EQUAL(registry.size(), 1u);
    BOOST_CHECK_EQUAL(sink.placedIds.size(), 1u);
}

BOOST_AUTO_TEST_CASE(TestClearNotifiesEveryTile) {
    placeItem("foundation", 0, 0);
    placeItem("engine", 1, 0);
    registry.clear();

    BOOST_CHECK(registry.empty());
    BOOST_CHECK(registry.getOccupancy().empty());
    BOOST_CHECK_EQUAL(sink.removedCells.size(), 2u);
    BOOST_CHECK_EQUAL(registry.aggregate().tileCount, 0u);
}

BOOST_AUTO_TEST_CASE(TestTilesOrderedById) {
    placeItem("foundation", 0, 0);
    placeItem("foundation", 0, 1);
    placeItem("foundation", 0, 2);
    auto tiles = registry.getTiles();
    BOOST_REQUIRE_EQUAL(tiles.size(), 3u);
    BOOST_CHECK_LT(tiles[0]->id, tiles[1]->id);
    BOOST_CHECK_LT(tiles[1]->id, tiles[2]->id);
}

BOOST_AUTO_TEST_SUITE_END()
