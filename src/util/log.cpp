#include <relpack/log.hpp>

#include <unistd.h>

namespace relpack::log {

const char* level_name(Level lvl) {
    switch (lvl) {
        case Trace:  return "trace";
        case Debug:  return "debug";
        case Info:   return "info";
        case Warn:   return "warn";
        case Error:  return "error";
        case Silent: return "silent";
    }
    return "unknown";
}

Result<Level> parse_level(const std::string& name) {
    for (Level lvl : {Trace, Debug, Info, Warn, Error, Silent}) {
        if (name == level_name(lvl)) return Result<Level>::ok(lvl);
    }
    return RelpackError{RelpackError::Config,
        "unknown log level '" + name + "'",
        "expected one of: trace, debug, info, warn, error, silent"};
}

Result<ColorMode> parse_color_mode(const std::string& name) {
    if (name == "auto") return Result<ColorMode>::ok(ColorMode::Auto);
    if (name == "always") return Result<ColorMode>::ok(ColorMode::Always);
    if (name == "never") return Result<ColorMode>::ok(ColorMode::Never);
    return RelpackError{RelpackError::Config,
        "unknown color mode '" + name + "'",
        "expected one of: auto, always, never"};
}

bool is_terminal(std::FILE* stream) {
    return stream != nullptr && isatty(fileno(stream));
}

static bool resolve_color(ColorMode mode, std::FILE* stream) {
    switch (mode) {
        case ColorMode::Always: return true;
        case ColorMode::Never:  return false;
        case ColorMode::Auto:   return is_terminal(stream);
    }
    return false;
}

static const char* level_color(Level lvl) {
    switch (lvl) {
        case Trace:  return "\033[90m";   // gray
        case Debug:  return "\033[36m";   // cyan
        case Info:   return "\033[32m";   // green
        case Warn:   return "\033[33m";   // yellow
        case Error:  return "\033[31m";   // red
        case Silent: return "";
    }
    return "";
}

static const char* reset_color() {
    return "\033[0m";
}

Logger::Logger(Options opts, std::FILE* stream)
    : level_(opts.level),
      color_(resolve_color(opts.color, stream)),
      stream_(stream) {}

void Logger::write(Level lvl, const char* tag, const char* color,
                   const char* fmt, va_list args) {
    if (lvl < level_ || stream_ == nullptr) return;

    std::lock_guard<std::mutex> lock(mutex_);
    if (color_) {
        std::fprintf(stream_, "%s%s%s: ", color, tag, reset_color());
    } else {
        std::fprintf(stream_, "%s: ", tag);
    }
    std::vfprintf(stream_, fmt, args);
    std::fputc('\n', stream_);
    std::fflush(stream_);
}

void Logger::trace(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write(Trace, level_name(Trace), level_color(Trace), fmt, args);
    va_end(args);
}

void Logger::debug(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write(Debug, level_name(Debug), level_color(Debug), fmt, args);
    va_end(args);
}

void Logger::info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write(Info, level_name(Info), level_color(Info), fmt, args);
    va_end(args);
}

void Logger::warn(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write(Warn, level_name(Warn), level_color(Warn), fmt, args);
    va_end(args);
}

void Logger::error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write(Error, level_name(Error), level_color(Error), fmt, args);
    va_end(args);
}

void Logger::step(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write(Info, "==>", "\033[1;34m", fmt, args);  // bold blue
    va_end(args);
}

void Logger::success(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write(Info, "ok", "\033[1;32m", fmt, args);   // bold green
    va_end(args);
}

void Logger::report(const RelpackError& err) {
    std::string text = std::string("[") + RelpackError::code_name(err.code) +
                       "] " + err.message;
    if (!err.hint.empty()) {
        text += "\n  hint: " + err.hint;
    }
    if (!err.file.empty()) {
        text += "\n  --> " + err.file;
        if (err.line > 0) text += ":" + std::to_string(err.line);
    }
    error("%s", text.c_str());
}

} // namespace relpack::log
