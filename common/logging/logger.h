#pragma once

#include <string>

namespace sweepflux {
namespace log {

enum class Level { DEBUG, INFO, WARN, ERROR };

// Enable JSON-structured output (one JSON object per line to stderr).
// Default mode is plain text: "<time> [LEVEL] component: message".
// Call from main() based on SWEEPFLUX_LOG_FORMAT=json before any logging.
void SetJsonMode(bool enabled);
bool IsJsonMode();

// Entries below `level` are dropped. Defaults to INFO.
void SetMinLevel(Level level);
Level MinLevel();

// Tags every subsequent entry with the sweep's job id ("job" in JSON, a
// "[job=<id>]" prefix in text). Empty clears it.
void SetJobContext(const std::string &job_id);

// Parses "debug", "info", "warn"/"warning", "error" (case-insensitive).
// Unknown strings map to INFO.
Level ParseLevel(const std::string &text);

// Emit a log entry at the given level.  `component` identifies the subsystem
// (e.g. "allocator", "registry", "orchestrator").  `extra` is an optional
// key=value string appended to the JSON object or the text line.
void Log(Level level, const std::string &component, const std::string &message,
         const std::string &extra = {});

// Convenience wrappers.
inline void Debug(const std::string &component, const std::string &message,
                  const std::string &extra = {}) {
  Log(Level::DEBUG, component, message, extra);
}
inline void Info(const std::string &component, const std::string &message,
                 const std::string &extra = {}) {
  Log(Level::INFO, component, message, extra);
}
inline void Warn(const std::string &component, const std::string &message,
                 const std::string &extra = {}) {
  Log(Level::WARN, component, message, extra);
}
inline void Error(const std::string &component, const std::string &message,
                  const std::string &extra = {}) {
  Log(Level::ERROR, component, message, extra);
}

// Prints a blank line, the title and a rule. Used to separate sweep stages.
void Section(const std::string &component, const std::string &title);

} // namespace log
} // namespace sweepflux
