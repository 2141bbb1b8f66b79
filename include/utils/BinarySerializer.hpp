/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef BINARY_SERIALIZER_HPP
#define BINARY_SERIALIZER_HPP

#include "core/Logger.hpp"
#include <cstdint>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

/**
 * Header-only binary stream helpers for save slot files.
 * Fixed-size fields are written raw; strings are length-prefixed (uint32).
 */
namespace BinarySerial {

// Raft documents are JSON text; a generous cap still rejects garbage lengths
constexpr uint32_t MAX_STRING_BYTES = 16u * 1024u * 1024u;

class Writer {
private:
  std::shared_ptr<std::ostream> m_stream;

public:
  explicit Writer(std::shared_ptr<std::ostream> stream)
      : m_stream(std::move(stream)) {
    if (!m_stream || !m_stream->good()) {
      throw std::runtime_error("Invalid output stream");
    }
  }

  ~Writer() {
    if (m_stream) {
      m_stream->flush();
    }
  }

  static std::unique_ptr<Writer> createFileWriter(const std::string &filename) {
    auto stream = std::make_shared<std::ofstream>(filename, std::ios::binary);
    if (!stream->is_open()) {
      SAVEGAME_ERROR("Failed to create writer for file: " + filename);
      return nullptr;
    }
    SAVEGAME_DEBUG("Created binary writer for file: " + filename);
    return std::make_unique<Writer>(stream);
  }

  template <typename T> bool write(const T &value) {
    static_assert(std::is_trivially_copyable_v<T>,
                  "Type must be trivially copyable");
    m_stream->write(reinterpret_cast<const char *>(&value), sizeof(T));
    return m_stream->good();
  }

  bool writeBytes(const char *data, size_t count) {
    m_stream->write(data, static_cast<std::streamsize>(count));
    return m_stream->good();
  }

  bool writeString(const std::string &str) {
    if (str.size() > MAX_STRING_BYTES) {
      SAVEGAME_ERROR("String too large to write: " +
                     std::to_string(str.size()) + " bytes");
      return false;
    }
    uint32_t length = static_cast<uint32_t>(str.size());
    if (!write(length)) {
      return false;
    }
    return length == 0 || writeBytes(str.data(), length);
  }

  bool good() const { return m_stream && m_stream->good(); }

  void flush() {
    if (m_stream) {
      m_stream->flush();
    }
  }
};

class Reader {
private:
  std::shared_ptr<std::istream> m_stream;

public:
  explicit Reader(std::shared_ptr<std::istream> stream)
      : m_stream(std::move(stream)) {
    if (!m_stream || !m_stream->good()) {
      throw std::runtime_error("Invalid input stream");
    }
  }

  static std::unique_ptr<Reader> createFileReader(const std::string &filename) {
    auto stream = std::make_shared<std::ifstream>(filename, std::ios::binary);
    if (!stream->is_open()) {
      SAVEGAME_ERROR("Failed to create reader for file: " + filename);
      return nullptr;
    }
    SAVEGAME_DEBUG("Created binary reader for file: " + filename);
    return std::make_unique<Reader>(stream);
  }

  template <typename T> bool read(T &value) {
    static_assert(std::is_trivially_copyable_v<T>,
                  "Type must be trivially copyable");
    m_stream->read(reinterpret_cast<char *>(&value), sizeof(T));
    return m_stream->good() && m_stream->gcount() == sizeof(T);
  }

  bool readBytes(char *data, size_t count) {
    m_stream->read(data, static_cast<std::streamsize>(count));
    return m_stream->gcount() == static_cast<std::streamsize>(count);
  }

  bool readString(std::string &str) {
    uint32_t length = 0;
    if (!read(length)) {
      return false;
    }

    if (length == 0) {
      str.clear();
      return true;
    }

    if (length > MAX_STRING_BYTES) {
      SAVEGAME_ERROR("String length too large: " + std::to_string(length) +
                     " bytes");
      return false;
    }

    str.resize(length);
    return readBytes(&str[0], length);
  }

  bool good() const { return m_stream && m_stream->good(); }
};

} // namespace BinarySerial

#endif // BINARY_SERIALIZER_HPP
