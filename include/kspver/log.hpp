#pragma once

#include <string>

namespace kspver::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();

// Whether a message at `lvl` would be written
bool enabled(Level lvl);

void set_color_enabled(bool enabled);
bool is_color_enabled();

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

// Returns the name string for a level
const char* level_name(Level lvl);

// Inverse of level_name(); returns false for unknown names
bool level_from_name(const std::string& name, Level& out);

} // namespace kspver::log
