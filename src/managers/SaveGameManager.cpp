/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/SaveGameManager.hpp"
#include "core/Logger.hpp"
#include "utils/BinarySerializer.hpp"
#include "utils/JsonReader.hpp"
#include "world/StructureData.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstring>
#include <ctime>
#include <filesystem>

constexpr char DRIFT_SAVE_SIGNATURE[9] = {'D', 'R', 'I', 'F', 'T',
                                          'S', 'A', 'V', 'E'};
constexpr size_t DRIFT_SAVE_SIGNATURE_SIZE = sizeof(DRIFT_SAVE_SIGNATURE);
constexpr uint32_t DRIFT_SAVE_FORMAT_VERSION = 1;

namespace {

bool writeHeader(BinarySerial::Writer &writer, uint32_t dataSize) {
  SaveGameHeader header;
  std::memcpy(header.signature, DRIFT_SAVE_SIGNATURE,
              DRIFT_SAVE_SIGNATURE_SIZE);
  header.version = DRIFT_SAVE_FORMAT_VERSION;
  header.timestamp = static_cast<int64_t>(
      std::chrono::system_clock::to_time_t(std::chrono::system_clock::now()));
  header.dataSize = dataSize;

  // Field by field so padding never reaches the file
  return writer.writeBytes(header.signature, DRIFT_SAVE_SIGNATURE_SIZE) &&
         writer.write(header.version) && writer.write(header.timestamp) &&
         writer.write(header.dataSize);
}

bool readHeader(BinarySerial::Reader &reader, SaveGameHeader &header) {
  if (!reader.readBytes(header.signature, DRIFT_SAVE_SIGNATURE_SIZE)) {
    return false;
  }
  if (std::memcmp(header.signature, DRIFT_SAVE_SIGNATURE,
                  DRIFT_SAVE_SIGNATURE_SIZE) != 0) {
    return false;
  }
  return reader.read(header.version) && reader.read(header.timestamp) &&
         reader.read(header.dataSize);
}

std::string formatTimestamp(int64_t timestamp) {
  std::time_t raw = static_cast<std::time_t>(timestamp);
  std::tm timeinfo{};
#ifdef _WIN32
  localtime_s(&timeinfo, &raw);
#else
  localtime_r(&raw, &timeinfo);
#endif
  char buffer[80];
  std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &timeinfo);
  return buffer;
}

} // namespace

bool SaveGameManager::save(const std::string &saveFileName,
                           const Driftwood::StructureSnapshot &snapshot) {
  if (!ensureSaveDirectoryExists()) {
    SAVEGAME_ERROR("Failed to ensure save directory exists!");
    return false;
  }

  const std::string fullPath = getFullSavePath(saveFileName);
  const std::string document = snapshot.toJson().toString();

  try {
    auto writer = BinarySerial::Writer::createFileWriter(fullPath);
    if (!writer) {
      return false;
    }

    const uint32_t dataSize =
        static_cast<uint32_t>(sizeof(uint32_t) + document.size());
    if (!writeHeader(*writer, dataSize)) {
      SAVEGAME_ERROR("Failed to write save header: " + fullPath);
      return false;
    }

    if (!writer->writeString(document)) {
      SAVEGAME_ERROR("Failed to write raft data: " + fullPath);
      return false;
    }

    writer->flush();
    if (!writer->good()) {
      SAVEGAME_ERROR("Stream error while saving: " + fullPath);
      return false;
    }
  } catch (const std::exception &e) {
    SAVEGAME_ERROR("Error saving raft: " + std::string(e.what()));
    return false;
  }

  SAVEGAME_INFO("Save successful: " + saveFileName + " (" +
                std::to_string(snapshot.tiles.size()) + " tiles)");
  return true;
}

bool SaveGameManager::saveToSlot(int slotNumber,
                                 const Driftwood::StructureSnapshot &snapshot) {
  if (slotNumber < 1) {
    SAVEGAME_ERROR("Invalid slot number: " + std::to_string(slotNumber));
    return false;
  }
  return save(getSlotFileName(slotNumber), snapshot);
}

bool SaveGameManager::load(const std::string &saveFileName,
                           Driftwood::StructureSnapshot &snapshot) const {
  SaveGameHeader header;
  std::string document;
  if (!readDocument(saveFileName, header, document)) {
    return false;
  }

  Driftwood::JsonReader reader;
  if (!reader.parse(document)) {
    SAVEGAME_ERROR("Corrupt raft data in " + saveFileName + ": " +
                   reader.getLastError());
    return false;
  }

  if (!Driftwood::StructureSnapshot::fromJson(reader.getRoot(), snapshot)) {
    SAVEGAME_ERROR("Invalid raft document in " + saveFileName);
    return false;
  }

  SAVEGAME_INFO("Raft loaded: " + saveFileName);
  return true;
}

bool SaveGameManager::loadFromSlot(int slotNumber,
                                   Driftwood::StructureSnapshot &snapshot) const {
  if (slotNumber < 1) {
    SAVEGAME_ERROR("Invalid slot number: " + std::to_string(slotNumber));
    return false;
  }
  return load(getSlotFileName(slotNumber), snapshot);
}

bool SaveGameManager::deleteSave(const std::string &saveFileName) const {
  try {
    std::string fullPath = getFullSavePath(saveFileName);
    if (!std::filesystem::exists(fullPath)) {
      SAVEGAME_ERROR("Save file does not exist: " + fullPath);
      return false;
    }
    std::filesystem::remove(fullPath);
    SAVEGAME_INFO("Deleted save: " + saveFileName);
    return true;
  } catch (const std::filesystem::filesystem_error &e) {
    SAVEGAME_ERROR("Error deleting save file: " + std::string(e.what()));
    return false;
  }
}

bool SaveGameManager::deleteSlot(int slotNumber) const {
  if (slotNumber < 1) {
    SAVEGAME_ERROR("Invalid slot number: " + std::to_string(slotNumber));
    return false;
  }
  return deleteSave(getSlotFileName(slotNumber));
}

boost::container::small_vector<std::string, 10>
SaveGameManager::getSaveFiles() const {
  boost::container::small_vector<std::string, 10> saveFiles;

  try {
    if (!std::filesystem::is_directory(m_saveDirectory)) {
      return saveFiles;
    }

    for (const auto &entry :
         std::filesystem::directory_iterator(m_saveDirectory)) {
      if (!entry.is_regular_file()) {
        continue;
      }

      std::string extension = entry.path().extension().string();
      std::transform(extension.begin(), extension.end(), extension.begin(),
                     [](unsigned char c) { return std::tolower(c); });

      const std::string fileName = entry.path().filename().string();
      if (extension == SAVE_EXTENSION && isValidSaveFile(fileName)) {
        saveFiles.push_back(fileName);
      }
    }
  } catch (const std::filesystem::filesystem_error &e) {
    SAVEGAME_ERROR("Error listing save files: " + std::string(e.what()));
  }

  std::sort(saveFiles.begin(), saveFiles.end());
  return saveFiles;
}

SaveGameData
SaveGameManager::getSaveInfo(const std::string &saveFileName) const {
  SaveGameData info;
  info.saveName = saveFileName;

  SaveGameHeader header;
  std::string document;
  if (!readDocument(saveFileName, header, document)) {
    return info;
  }
  info.timestamp = formatTimestamp(header.timestamp);

  Driftwood::JsonReader reader;
  Driftwood::StructureSnapshot snapshot;
  if (reader.parse(document) &&
      Driftwood::StructureSnapshot::fromJson(reader.getRoot(), snapshot)) {
    info.snapshotVersion = snapshot.version;
    info.tileCount = snapshot.tiles.size();
    info.raftCenterX = snapshot.raftCenter.getX();
    info.raftCenterZ = snapshot.raftCenter.getZ();
  }
  return info;
}

bool SaveGameManager::saveExists(const std::string &saveFileName) const {
  std::error_code ec;
  return std::filesystem::exists(getFullSavePath(saveFileName), ec);
}

bool SaveGameManager::slotExists(int slotNumber) const {
  if (slotNumber < 1) {
    return false;
  }
  return saveExists(getSlotFileName(slotNumber));
}

bool SaveGameManager::isValidSaveFile(const std::string &saveFileName) const {
  if (!saveExists(saveFileName)) {
    return false;
  }

  try {
    auto reader =
        BinarySerial::Reader::createFileReader(getFullSavePath(saveFileName));
    if (!reader) {
      return false;
    }
    SaveGameHeader header;
    return readHeader(*reader, header);
  } catch (const std::exception &e) {
    SAVEGAME_WARN("Unreadable save file " + saveFileName + ": " + e.what());
    return false;
  }
}

void SaveGameManager::setSaveDirectory(const std::string &directory) {
  m_saveDirectory = directory;
  ensureSaveDirectoryExists();
}

std::string SaveGameManager::getSlotFileName(int slotNumber) {
  return "raft_slot_" + std::to_string(slotNumber) + SAVE_EXTENSION;
}

std::string
SaveGameManager::getFullSavePath(const std::string &saveFileName) const {
  return (std::filesystem::path(m_saveDirectory) / saveFileName).string();
}

bool SaveGameManager::ensureSaveDirectoryExists() const {
  try {
    if (std::filesystem::exists(m_saveDirectory)) {
      return std::filesystem::is_directory(m_saveDirectory);
    }
    if (!std::filesystem::create_directories(m_saveDirectory)) {
      SAVEGAME_ERROR("Failed to create save directory: " + m_saveDirectory);
      return false;
    }
    SAVEGAME_INFO("Created save directory: " + m_saveDirectory);
    return true;
  } catch (const std::exception &e) {
    SAVEGAME_ERROR("Error creating save directory: " + std::string(e.what()));
    return false;
  }
}

bool SaveGameManager::readDocument(const std::string &saveFileName,
                                   SaveGameHeader &header,
                                   std::string &json) const {
  const std::string fullPath = getFullSavePath(saveFileName);
  if (!saveExists(saveFileName)) {
    SAVEGAME_ERROR("Save file does not exist: " + saveFileName);
    return false;
  }

  try {
    auto reader = BinarySerial::Reader::createFileReader(fullPath);
    if (!reader) {
      return false;
    }

    if (!readHeader(*reader, header)) {
      SAVEGAME_ERROR("Invalid save file format: " + saveFileName);
      return false;
    }

    if (header.version > DRIFT_SAVE_FORMAT_VERSION) {
      SAVEGAME_ERROR("Save file " + saveFileName + " uses newer format " +
                     std::to_string(header.version));
      return false;
    }

    if (!reader->readString(json)) {
      SAVEGAME_ERROR("Error reading raft data from " + saveFileName);
      return false;
    }
  } catch (const std::exception &e) {
    SAVEGAME_ERROR("Error loading raft: " + std::string(e.what()));
    return false;
  }
  return true;
}
