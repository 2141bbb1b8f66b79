/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

// Only compile this file for release builds - debug builds log inline to stdout
#ifndef DEBUG

#include "core/Logger.hpp"

#include <SDL3/SDL.h>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <vector>

#ifndef DRIFTWOOD_APP_NAME
#define DRIFTWOOD_APP_NAME "Driftwood"
#endif

namespace Driftwood {
namespace {

constexpr size_t LOG_FILES_KEPT = 5;
constexpr size_t FLUSH_INTERVAL = 50;

std::tm localTime(std::time_t when) {
  std::tm timeinfo{};
#ifdef _WIN32
  localtime_s(&timeinfo, &when);
#else
  localtime_r(&when, &timeinfo);
#endif
  return timeinfo;
}

// Rotating file sink under the SDL preference directory
class FileSink {
public:
  static FileSink &Instance() {
    static FileSink instance;
    return instance;
  }

  FileSink(const FileSink &) = delete;
  FileSink &operator=(const FileSink &) = delete;

  void write(LogLevel level, const char *system, const char *message) {
    std::lock_guard<std::mutex> lock(m_fileMutex);

    if (!m_opened) {
      open();
    }
    if (!m_stream.is_open()) {
      return;
    }

    // YYYY-MM-DD HH:MM:SS.mmm [LEVEL] [SYSTEM] message
    auto now = std::chrono::system_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  now.time_since_epoch()) %
              1000;
    std::tm timeinfo = localTime(std::chrono::system_clock::to_time_t(now));

    m_stream << std::put_time(&timeinfo, "%Y-%m-%d %H:%M:%S") << '.'
             << std::setfill('0') << std::setw(3) << ms.count() << " ["
             << getLevelString(level) << "] [" << system << "] " << message
             << '\n';

    if (level == LogLevel::CRITICAL || ++m_pending >= FLUSH_INTERVAL) {
      m_stream.flush();
      m_pending = 0;
    }
  }

private:
  FileSink() = default;

  ~FileSink() {
    if (m_stream.is_open()) {
      m_stream.flush();
    }
  }

  void open() {
    m_opened = true;

    char *prefPath = SDL_GetPrefPath("DriftwoodForged", DRIFTWOOD_APP_NAME);
    if (prefPath == nullptr) {
      return;
    }

    namespace fs = std::filesystem;
    fs::path logDir = fs::path(prefPath) / "logs";
    SDL_free(prefPath);

    std::error_code ec;
    fs::create_directories(logDir, ec);
    if (ec) {
      return;
    }

    pruneOldLogs(logDir);

    std::tm timeinfo = localTime(
        std::chrono::system_clock::to_time_t(std::chrono::system_clock::now()));
    std::ostringstream filename;
    filename << "driftwood_" << std::put_time(&timeinfo, "%Y%m%d_%H%M%S")
             << ".log";

    m_stream.open(logDir / filename.str(), std::ios::out | std::ios::app);
    if (m_stream.is_open()) {
      m_stream << "=== " << DRIFTWOOD_APP_NAME << " Log ===\n"
               << "Started: " << std::put_time(&timeinfo, "%Y-%m-%d %H:%M:%S")
               << "\n\n";
      m_stream.flush();
    }
  }

  // Keeps the newest LOG_FILES_KEPT - 1 files so the new one makes it LOG_FILES_KEPT
  void pruneOldLogs(const std::filesystem::path &logDir) {
    namespace fs = std::filesystem;
    std::vector<fs::directory_entry> logFiles;

    std::error_code ec;
    for (const auto &entry : fs::directory_iterator(logDir, ec)) {
      if (entry.path().extension() == ".log" &&
          entry.path().filename().string().starts_with("driftwood_")) {
        logFiles.push_back(entry);
      }
    }

    if (logFiles.size() < LOG_FILES_KEPT) {
      return;
    }

    std::sort(logFiles.begin(), logFiles.end(),
              [](const fs::directory_entry &a, const fs::directory_entry &b) {
                return a.last_write_time() < b.last_write_time();
              });

    size_t toRemove = logFiles.size() - (LOG_FILES_KEPT - 1);
    for (size_t i = 0; i < toRemove; ++i) {
      fs::remove(logFiles[i].path(), ec);
    }
  }

  std::mutex m_fileMutex;
  std::ofstream m_stream;
  bool m_opened = false;
  size_t m_pending = 0;
};

} // anonymous namespace

void Logger::Log(LogLevel level, const char *system,
                 const std::string &message) {
  Log(level, system, message.c_str());
}

void Logger::Log(LogLevel level, const char *system, const char *message) {
  if (s_benchmarkMode.load(std::memory_order_relaxed)) {
    return;
  }
  FileSink::Instance().write(level, system, message);
}

} // namespace Driftwood

#endif // ifndef DEBUG
