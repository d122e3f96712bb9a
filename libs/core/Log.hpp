#pragma once
// Leveled console logger for the command-line tools (beacon_replay, beacon_probe).
// The libraries log through the BeaconLogging.hpp categories instead.
#include <fmt/chrono.h>
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <string_view>

namespace beacon {
namespace Log {

enum class Level { TRACE = 0, DEBUG, INFO, WARN, ERROR, OFF };

// Accepts the level names in any case; anything unrecognized keeps the fallback.
inline Level parseLevel(std::string_view text, Level fallback = Level::INFO) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "trace") return Level::TRACE;
    if (lower == "debug") return Level::DEBUG;
    if (lower == "info")  return Level::INFO;
    if (lower == "warn" || lower == "warning") return Level::WARN;
    if (lower == "error") return Level::ERROR;
    if (lower == "off")   return Level::OFF;
    return fallback;
}

struct State {
    Level level;
    std::chrono::steady_clock::time_point started = std::chrono::steady_clock::now();
};

inline State& state() {
    static State s{ [] {
#ifdef NDEBUG
        const Level def = Level::INFO;
#else
        const Level def = Level::DEBUG;
#endif
        const char* env = std::getenv("BEACON_LOG");
        return env ? parseLevel(env, def) : def;
    }() };
    return s;
}

inline void setLevel(Level level) { state().level = level; }
inline bool enabled(Level level) { return level >= state().level && state().level != Level::OFF; }

inline const char* levelTag(Level level) {
    switch (level) {
        case Level::TRACE: return "T";
        case Level::DEBUG: return "D";
        case Level::INFO:  return "I";
        case Level::WARN:  return "W";
        case Level::ERROR: return "E";
        case Level::OFF:   break;
    }
    return "?";
}

// Warnings and errors go to stderr so gesture output on stdout stays pipeable.
template <class... Args>
inline void write(Level level, std::string_view category, fmt::format_string<Args...> format, Args&&... args) {
    if (!enabled(level)) return;

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - state().started);
    std::FILE* out = level >= Level::WARN ? stderr : stdout;
    fmt::print(out, "{} +{:>7} [{}] {}\n", levelTag(level), elapsed, category,
               fmt::format(format, std::forward<Args>(args)...));
}

} // namespace Log
} // namespace beacon

#define LOG_AT(level, cat, fmt, ...) ::beacon::Log::write(::beacon::Log::Level::level, cat, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOG_T(cat, fmt, ...) LOG_AT(TRACE, cat, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOG_D(cat, fmt, ...) LOG_AT(DEBUG, cat, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOG_I(cat, fmt, ...) LOG_AT(INFO,  cat, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOG_W(cat, fmt, ...) LOG_AT(WARN,  cat, fmt __VA_OPT__(, ) __VA_ARGS__)
#define LOG_E(cat, fmt, ...) LOG_AT(ERROR, cat, fmt __VA_OPT__(, ) __VA_ARGS__)
