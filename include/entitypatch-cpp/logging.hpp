/// @file logging.hpp
/// @brief Pluggable logging for the patch engine.
///
/// The engine never writes anywhere on its own: it logs through the Logger
/// held by PatchOptions, and does nothing when none is configured.

#pragma once

#include <fmt/format.h>

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace entitypatch_cpp {

/// Log levels, most severe first.
enum class Verbosity : std::uint8_t {
    error,
    warn,
    info,
    debug,
};

/// Convert a Verbosity to its string representation.
constexpr auto to_string_view(Verbosity level) noexcept -> std::string_view {
    switch (level) {
        case Verbosity::error: return "error";
        case Verbosity::warn:  return "warn";
        case Verbosity::info:  return "info";
        case Verbosity::debug: return "debug";
    }
    return "unknown";
}

/// Parse "error", "warn", "info" or "debug".
auto verbosity_from_string(std::string_view name) -> std::optional<Verbosity>;

/// Output format of the stderr logger.
enum class LogFormat : std::uint8_t {
    text,  ///< `[level] entitypatch: message`
    json,  ///< One JSON object per line: level, logger, message.
};

/// Parse "text" or "json".
auto log_format_from_string(std::string_view name) -> std::optional<LogFormat>;

/// Abstract log sink with a level threshold.
class Logger {
public:
    explicit Logger(Verbosity level = Verbosity::info) : level_{level} {}
    virtual ~Logger() = default;

    auto level() const noexcept -> Verbosity { return level_; }
    void set_level(Verbosity level) noexcept { level_ = level; }

    /// True if messages at `level` pass the threshold.
    auto enabled(Verbosity level) const noexcept -> bool { return level <= level_; }

    void log(Verbosity level, std::string_view message) {
        if (enabled(level)) write(level, message);
    }

    /// Format with fmt and log; formatting is skipped below the threshold.
    template <typename... Args>
    void logf(Verbosity level, fmt::format_string<Args...> format, Args&&... args) {
        if (enabled(level)) write(level, fmt::format(format, std::forward<Args>(args)...));
    }

protected:
    virtual void write(Verbosity level, std::string_view message) = 0;

private:
    Verbosity level_;
};

/// A logger writing to stderr. Writes are serialized.
auto make_stderr_logger(Verbosity level = Verbosity::info,
                        LogFormat format = LogFormat::text) -> std::shared_ptr<Logger>;

/// A logger that keeps every accepted line in memory.
class CaptureLogger : public Logger {
public:
    struct Line {
        Verbosity level;
        std::string message;

        auto operator==(const Line&) const -> bool = default;
    };

    explicit CaptureLogger(Verbosity level = Verbosity::debug) : Logger{level} {}

    auto lines() const -> std::vector<Line>;
    void clear();

protected:
    void write(Verbosity level, std::string_view message) override;

private:
    mutable std::mutex mutex_;
    std::vector<Line> lines_;
};

}  // namespace entitypatch_cpp
