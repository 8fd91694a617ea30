#pragma once

#include <relpack/result.hpp>
#include <cstdarg>
#include <cstdio>
#include <mutex>
#include <string>

namespace relpack::log {

enum Level { Trace, Debug, Info, Warn, Error, Silent };

enum class ColorMode { Auto, Always, Never };

struct Options {
    Level level = Info;
    ColorMode color = ColorMode::Auto;
};

// Returns the name string for a level
const char* level_name(Level lvl);

Result<Level> parse_level(const std::string& name);
Result<ColorMode> parse_color_mode(const std::string& name);

// Whether `stream` is attached to a terminal
bool is_terminal(std::FILE* stream);

// Leveled logger passed explicitly to every component. Color and level are
// fixed at construction; ColorMode::Auto is resolved against the stream once.
// Safe to use from worker threads.
class Logger {
public:
    explicit Logger(Options opts = {}, std::FILE* stream = stderr);

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    Level level() const { return level_; }
    bool color_enabled() const { return color_; }
    bool enabled(Level lvl) const { return lvl >= level_; }

    void trace(const char* fmt, ...);
    void debug(const char* fmt, ...);
    void info(const char* fmt, ...);
    void warn(const char* fmt, ...);
    void error(const char* fmt, ...);

    // Info-level lines with their own tag: stage banners and completions
    void step(const char* fmt, ...);
    void success(const char* fmt, ...);

    // Logs a RelpackError (message, hint, location) at error level
    void report(const RelpackError& err);

private:
    void write(Level lvl, const char* tag, const char* color,
               const char* fmt, va_list args);

    Level level_;
    bool color_;
    std::FILE* stream_;
    std::mutex mutex_;
};

} // namespace relpack::log
