/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "world/StructureData.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"

namespace Driftwood {

JsonValue StructureSnapshot::toJson() const {
    JsonValue root{JsonObject{}};
    root["version"] = JsonValue(version);

    JsonValue tileArray{JsonArray{}};
    for (const auto& record : tiles) {
        JsonValue entry{JsonObject{}};
        entry["tileType"] = JsonValue(record.tileType);

        JsonValue position{JsonObject{}};
        position["x"] = JsonValue(record.gridPosition.column);
        position["y"] = JsonValue(record.gridPosition.row);
        entry["gridPosition"] = std::move(position);

        entry["health"] = JsonValue(record.health);

        if (!record.storedItems.empty()) {
            JsonValue storage{JsonObject{}};
            for (const auto& [resourceId, amount] : record.storedItems) {
                storage[resourceId] = JsonValue(amount);
            }
            entry["storage"] = std::move(storage);
        }
        tileArray.push(std::move(entry));
    }
    root["tiles"] = std::move(tileArray);

    JsonValue center{JsonObject{}};
    center["x"] = JsonValue(raftCenter.getX());
    center["y"] = JsonValue(raftCenter.getY());
    center["z"] = JsonValue(raftCenter.getZ());
    root["raftCenter"] = std::move(center);

    return root;
}

bool StructureSnapshot::fromJson(const JsonValue& json, StructureSnapshot& out) {
    if (!json.isObject()) {
        STRUCTURE_ERROR("Snapshot root is not a JSON object");
        return false;
    }

    StructureSnapshot snapshot;
    snapshot.version = json.getInt("version", 0);
    if (snapshot.version > CURRENT_VERSION) {
        STRUCTURE_WARN("Snapshot version " + std::to_string(snapshot.version) +
                       " is newer than supported, reading known fields only");
    }

    if (const JsonArray* entries = json["tiles"].tryAsArray()) {
        snapshot.tiles.reserve(entries->size());
        for (const auto& entry : *entries) {
            if (!entry.isObject()) {
                STRUCTURE_WARN("Skipping non-object tile entry");
                continue;
            }

            TileRecord record;
            record.tileType = entry.getString("tileType", "");
            const JsonValue& position = entry["gridPosition"];
            record.gridPosition.column = position.getInt("x", 0);
            record.gridPosition.row = position.getInt("y", 0);
            // Missing health restores at full strength (clamped by the registry)
            record.health = entry.getFloat("health", 1.0e9f);

            if (const JsonObject* storage = entry["storage"].tryAsObject()) {
                for (const auto& [resourceId, amount] : *storage) {
                    const int count = amount.tryAsInt().value_or(0);
                    if (count > 0) {
                        record.storedItems[resourceId] = count;
                    }
                }
            }
            snapshot.tiles.push_back(std::move(record));
        }
    }

    const JsonValue& center = json["raftCenter"];
    snapshot.raftCenter = Vector3D(center.getFloat("x", 0.0f), center.getFloat("y", 0.0f),
                                   center.getFloat("z", 0.0f));

    out = std::move(snapshot);
    return true;
}

} // namespace Driftwood
