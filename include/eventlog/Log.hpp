#pragma once

#include <functional>
#include <string>
#include <string_view>

namespace eventlog::log {

enum class Level { Trace = 0, Debug, Info, Warn, Error };

using Sink = std::function<void(Level, std::string_view component, const std::string& message)>;

// Lines below the threshold are discarded. Default comes from EVENTLOG_LOG_LEVEL, else Info.
void setThreshold(Level level);
Level threshold();

// Replace the output sink (default writes "Component: message" to std::cerr).
// Passing an empty function restores the default.
void setSink(Sink sink);

void write(Level level, std::string_view component, const std::string& message);

inline void trace(std::string_view c, const std::string& m) { write(Level::Trace, c, m); }
inline void debug(std::string_view c, const std::string& m) { write(Level::Debug, c, m); }
inline void info(std::string_view c, const std::string& m) { write(Level::Info, c, m); }
inline void warn(std::string_view c, const std::string& m) { write(Level::Warn, c, m); }
inline void error(std::string_view c, const std::string& m) { write(Level::Error, c, m); }

const char* levelName(Level level);

} // namespace eventlog::log
