#include "common/logging/logger.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iostream>
#include <mutex>

using json = nlohmann::json;

namespace sweepflux {
namespace log {

namespace {

std::atomic<bool> g_json_mode{false};
std::atomic<int> g_min_level{static_cast<int>(Level::INFO)};
std::mutex g_mutex;
std::string g_job_id; // guarded by g_mutex

const char *LevelString(Level level) {
  switch (level) {
  case Level::DEBUG:
    return "DEBUG";
  case Level::INFO:
    return "INFO";
  case Level::WARN:
    return "WARN";
  case Level::ERROR:
    return "ERROR";
  }
  return "UNKNOWN";
}

std::string LocalTimestamp(std::chrono::system_clock::time_point now) {
  std::time_t t = std::chrono::system_clock::to_time_t(now);
  std::tm tm{};
  localtime_r(&t, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
  return buf;
}

} // namespace

void SetJsonMode(bool enabled) { g_json_mode.store(enabled); }
bool IsJsonMode() { return g_json_mode.load(); }

void SetMinLevel(Level level) { g_min_level.store(static_cast<int>(level)); }
Level MinLevel() { return static_cast<Level>(g_min_level.load()); }

void SetJobContext(const std::string &job_id) {
  std::lock_guard<std::mutex> lock(g_mutex);
  g_job_id = job_id;
}

Level ParseLevel(const std::string &text) {
  std::string lowered = text;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lowered == "debug")
    return Level::DEBUG;
  if (lowered == "warn" || lowered == "warning")
    return Level::WARN;
  if (lowered == "error")
    return Level::ERROR;
  return Level::INFO;
}

void Log(Level level, const std::string &component, const std::string &message,
         const std::string &extra) {
  if (static_cast<int>(level) < g_min_level.load()) {
    return;
  }
  auto now = std::chrono::system_clock::now();

  std::lock_guard<std::mutex> lock(g_mutex);
  std::string line;
  if (g_json_mode.load()) {
    json j;
    j["ts"] = std::chrono::duration_cast<std::chrono::milliseconds>(
                  now.time_since_epoch())
                  .count();
    j["level"] = LevelString(level);
    if (!g_job_id.empty()) {
      j["job"] = g_job_id;
    }
    j["component"] = component;
    j["message"] = message;
    if (!extra.empty()) {
      j["extra"] = extra;
    }
    // Messages may carry raw process output; never throw on bad UTF-8.
    line = j.dump(-1, ' ', false, json::error_handler_t::replace);
  } else {
    line = LocalTimestamp(now) + " [" + LevelString(level) + "] ";
    if (!g_job_id.empty()) {
      line += "[job=" + g_job_id + "] ";
    }
    line += component + ": " + message;
    if (!extra.empty()) {
      line += " | " + extra;
    }
  }
  std::cerr << line << "\n";
}

void Section(const std::string &component, const std::string &title) {
  if (g_json_mode.load()) {
    Log(Level::INFO, component, "== " + title);
    return;
  }
  Log(Level::INFO, component, "");
  Log(Level::INFO, component, title);
  Log(Level::INFO, component, std::string(60, '-'));
}

} // namespace log
} // namespace sweepflux
