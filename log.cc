#include "log.h"
#include "errors.h"

#include <atomic>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <mutex>

using namespace std;

namespace parkcore {
namespace log {

namespace {
std::atomic<Level> minLevel{Level::Info};
std::mutex sinkMu;           // guards sink and serialises lines
ostream* sink = nullptr;
}

Level levelFromString(const string& s) {
    string lower = s;
    for (char& c : lower) c = (char)tolower((unsigned char)c);
    if (lower == "debug") return Level::Debug;
    if (lower == "info")  return Level::Info;
    if (lower == "warn" || lower == "warning") return Level::Warn;
    if (lower == "error") return Level::Error;
    if (lower == "fatal") return Level::Fatal;
    throw ConfigError("Invalid log level: " + s);
}

const char* tag(Level l) {
    switch (l) {
        case Level::Debug: return "[DEBUG]";
        case Level::Info:  return "[INFO]";
        case Level::Warn:  return "[WARN]";
        case Level::Error: return "[ERROR]";
        case Level::Fatal: return "[FATAL]";
    }
    return "[INFO]";
}

void configure(Level configured) {
    Level l = configured;
    if (const char* env = getenv("PARKCORE_LOG_LEVEL")) {
        try {
            l = levelFromString(env);
        } catch (const ConfigError& e) {
            setLevel(configured);
            warn(string(e.what()) + " (PARKCORE_LOG_LEVEL ignored)");
            return;
        }
    }
    setLevel(l);
}

void setLevel(Level l) { minLevel.store(l, memory_order_relaxed); }

Level level() { return minLevel.load(memory_order_relaxed); }

void setSink(ostream* os) {
    lock_guard<mutex> lk(sinkMu);
    sink = os;
}

void write(Level l, const string& msg) {
    if (l < level()) return;
    lock_guard<mutex> lk(sinkMu);
    ostream& out = sink ? *sink : clog;
    out << tag(l) << ' ' << msg << '\n';
}

} // namespace log
} // namespace parkcore
