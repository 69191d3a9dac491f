/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/Logger.hpp"

#include <cstdio>
#include <mutex>

#ifndef DEBUG
#include <SDL3/SDL.h>

#include <algorithm>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <vector>
#endif

namespace CosmicEngine {

const char *Logger::LevelName(LogLevel level) {
  switch (level) {
  case LogLevel::CRITICAL:
    return "CRITICAL";
  case LogLevel::ERROR_LEVEL:
    return "ERROR";
  case LogLevel::WARNING:
    return "WARNING";
  case LogLevel::INFO:
    return "INFO";
  case LogLevel::DEBUG_LEVEL:
    return "DEBUG";
  }
  return "UNKNOWN";
}

#ifdef DEBUG

namespace {
std::mutex s_consoleMutex;
}

void Logger::Log(LogLevel level, const char *system, const char *message) {
  std::lock_guard<std::mutex> lock(s_consoleMutex);
  std::printf("Cosmic Collision - [%s] %s: %s\n", system, LevelName(level), message);
  std::fflush(stdout);
}

#else

namespace {

namespace fs = std::filesystem;

constexpr const char *LOG_PREFIX = "collision_";
constexpr size_t MAX_LOG_FILES = 5;
// Warnings can come every tick under load; batch them
constexpr size_t FLUSH_INTERVAL = 32;

std::tm localTime(std::time_t when) {
  std::tm result{};
#ifdef _WIN32
  localtime_s(&result, &when);
#else
  localtime_r(&when, &result);
#endif
  return result;
}

// Oldest files beyond the newest 'keep' are deleted
void pruneLogs(const fs::path &dir, size_t keep) {
  std::error_code ec;
  std::vector<fs::path> logs;
  for (const auto &entry : fs::directory_iterator(dir, ec)) {
    const std::string name = entry.path().filename().string();
    if (entry.path().extension() == ".log" && name.rfind(LOG_PREFIX, 0) == 0) {
      logs.push_back(entry.path());
    }
  }
  if (logs.size() <= keep) {
    return;
  }

  std::sort(logs.begin(), logs.end(), [](const fs::path &a, const fs::path &b) {
    std::error_code ignored;
    return fs::last_write_time(a, ignored) > fs::last_write_time(b, ignored);
  });
  for (size_t i = keep; i < logs.size(); ++i) {
    fs::remove(logs[i], ec);
  }
}

class LogFile {
public:
  static LogFile &get() {
    static LogFile file;
    return file;
  }

  void append(LogLevel level, const char *system, const char *message) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_opened) {
      open();
    }
    if (!m_out.is_open()) {
      return;
    }

    const auto now = std::chrono::system_clock::now();
    const std::tm stamp = localTime(std::chrono::system_clock::to_time_t(now));
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                            now.time_since_epoch()).count() % 1000;

    m_out << std::put_time(&stamp, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0')
          << std::setw(3) << millis << ' ' << Logger::LevelName(level) << " ["
          << system << "] " << message << '\n';

    if (level == LogLevel::CRITICAL || ++m_pending >= FLUSH_INTERVAL) {
      m_out.flush();
      m_pending = 0;
    }
  }

  LogFile(const LogFile &) = delete;
  LogFile &operator=(const LogFile &) = delete;

private:
  LogFile() = default;
  ~LogFile() {
    if (m_out.is_open()) {
      m_out.flush();
    }
  }

  void open() {
    m_opened = true;

    // COSMIC_APP_NAME comes from ${PROJECT_NAME}
    char *prefPath = SDL_GetPrefPath("CosmicForge", COSMIC_APP_NAME);
    if (prefPath == nullptr) {
      std::fprintf(stderr, "Cosmic Collision: no preference path (%s), file logging off\n",
                   SDL_GetError());
      return;
    }
    const fs::path dir = fs::path(prefPath) / "logs";
    SDL_free(prefPath);

    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
      std::fprintf(stderr, "Cosmic Collision: cannot create %s: %s\n",
                   dir.string().c_str(), ec.message().c_str());
      return;
    }
    pruneLogs(dir, MAX_LOG_FILES - 1);

    const std::tm started = localTime(std::time(nullptr));
    std::ostringstream name;
    name << LOG_PREFIX << std::put_time(&started, "%Y%m%d_%H%M%S") << ".log";

    m_out.open(dir / name.str(), std::ios::out | std::ios::app);
    if (m_out.is_open()) {
      m_out << "# " << COSMIC_APP_NAME << " started "
            << std::put_time(&started, "%Y-%m-%d %H:%M:%S") << '\n';
    }
  }

  std::mutex m_mutex;
  std::ofstream m_out;
  bool m_opened{false};
  size_t m_pending{0};
};

} // namespace

void Logger::Log(LogLevel level, const char *system, const char *message) {
  LogFile::get().append(level, system, message);
}

#endif // DEBUG

} // namespace CosmicEngine
