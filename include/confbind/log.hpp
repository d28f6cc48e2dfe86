#pragma once

#include <optional>
#include <string>

namespace confbind {
class Environment;
}

namespace confbind::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();

void set_color_enabled(bool enabled);
bool is_color_enabled();

// Accepts the names returned by level_name(), case-insensitive, plus
// "warning" and "err".
std::optional<Level> parse_level(const std::string& name);

// Set the level from an environment variable, e.g. CONFBIND_LOG=debug.
// Unset or unrecognised values leave the level unchanged; returns whether
// the level was changed.
bool init_from_env(const Environment& env, const std::string& key);

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

const char* level_name(Level lvl);

} // namespace confbind::log
