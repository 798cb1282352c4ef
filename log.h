#pragma once

#include <iosfwd>
#include <string>

namespace parkcore {
namespace log {

enum class Level { Debug, Info, Warn, Error, Fatal };

Level levelFromString(const std::string& s);   // throws ConfigError
const char* tag(Level l);                       // "[WARN]" etc.

// Sets the minimum level; PARKCORE_LOG_LEVEL in the environment wins.
void configure(Level configured);
void setLevel(Level l);
Level level();

// nullptr restores std::clog.
void setSink(std::ostream* os);

void write(Level l, const std::string& msg);

inline void debug(const std::string& m) { write(Level::Debug, m); }
inline void info(const std::string& m)  { write(Level::Info, m); }
inline void warn(const std::string& m)  { write(Level::Warn, m); }
inline void error(const std::string& m) { write(Level::Error, m); }
inline void fatal(const std::string& m) { write(Level::Fatal, m); }

} // namespace log
} // namespace parkcore
