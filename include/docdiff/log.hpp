#pragma once
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace docdiff::log {

enum class Level : std::uint8_t { Debug, Info, Warn, Error, Off };

using Sink = std::function<void(Level, std::string_view)>;

// Messages below `level` are dropped. Default: Warn.
void set_level(Level level);
Level level();

// Replace the output sink; an empty sink restores the default spdlog
// stderr sink ("[level] message"). Calls to a sink are serialized. A sink may
// call set_sink itself but must not log.
void set_sink(Sink sink);

void write(Level level, std::string_view message);

inline void debug(std::string_view m) { write(Level::Debug, m); }
inline void info(std::string_view m) { write(Level::Info, m); }
inline void warn(std::string_view m) { write(Level::Warn, m); }
inline void error(std::string_view m) { write(Level::Error, m); }

std::string_view level_name(Level level);
// "debug" | "info" | "warn" | "error" | "off"; false on unknown names.
bool parse_level(std::string_view name, Level &out);

} // namespace docdiff::log
