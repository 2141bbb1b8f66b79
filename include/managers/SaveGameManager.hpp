/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef SAVE_GAME_MANAGER_HPP
#define SAVE_GAME_MANAGER_HPP

#include <boost/container/small_vector.hpp>
#include <cstdint>
#include <string>

namespace Driftwood {
struct StructureSnapshot;
}

// Fixed header at the start of every raft save file
struct SaveGameHeader {
    char signature[9]{'D', 'R', 'I', 'F', 'T', 'S', 'A', 'V', 'E'};
    uint32_t version{1};     // container format version
    int64_t timestamp{0};    // seconds since epoch
    uint32_t dataSize{0};    // bytes following the header
};

// Metadata for save menus, read without restoring the raft
struct SaveGameData {
    std::string saveName{};
    std::string timestamp{};
    int snapshotVersion{0};
    size_t tileCount{0};
    float raftCenterX{0.0f};
    float raftCenterZ{0.0f};
};

/**
 * Slot-based persistence for StructureSnapshot.
 *
 * File layout: SaveGameHeader fields, then the snapshot as a length-prefixed
 * JSON document. The JSON is the logical save shape; the header only
 * identifies and dates the file.
 */
class SaveGameManager {
public:
    ~SaveGameManager() = default;

    static SaveGameManager& Instance() {
        static SaveGameManager instance;
        return instance;
    }

    bool save(const std::string& saveFileName, const Driftwood::StructureSnapshot& snapshot);
    bool saveToSlot(int slotNumber, const Driftwood::StructureSnapshot& snapshot);

    bool load(const std::string& saveFileName, Driftwood::StructureSnapshot& snapshot) const;
    bool loadFromSlot(int slotNumber, Driftwood::StructureSnapshot& snapshot) const;

    bool deleteSave(const std::string& saveFileName) const;
    bool deleteSlot(int slotNumber) const;

    // All valid save files in the save directory, sorted by name
    boost::container::small_vector<std::string, 10> getSaveFiles() const;

    SaveGameData getSaveInfo(const std::string& saveFileName) const;

    bool saveExists(const std::string& saveFileName) const;
    bool slotExists(int slotNumber) const;
    bool isValidSaveFile(const std::string& saveFileName) const;

    void setSaveDirectory(const std::string& directory);
    const std::string& getSaveDirectory() const { return m_saveDirectory; }

    static std::string getSlotFileName(int slotNumber);

    static constexpr const char* SAVE_EXTENSION = ".dsav";

private:
    std::string m_saveDirectory{"saves"};

    std::string getFullSavePath(const std::string& saveFileName) const;
    bool ensureSaveDirectoryExists() const;
    bool readDocument(const std::string& saveFileName, SaveGameHeader& header, std::string& json) const;

    SaveGameManager(const SaveGameManager&) = delete;
    SaveGameManager& operator=(const SaveGameManager&) = delete;

    SaveGameManager() = default;
};

#endif  // SAVE_GAME_MANAGER_HPP
