#include <entitypatch-cpp/logging.hpp>

#include <nlohmann/json.hpp>

#include <cstdio>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace entitypatch_cpp {

namespace {

constexpr auto logger_name = std::string_view{"entitypatch"};

class StderrLogger : public Logger {
public:
    StderrLogger(Verbosity level, LogFormat format)
        : Logger{level}, format_{format} {}

protected:
    void write(Verbosity level, std::string_view message) override {
        auto line = std::string{};
        switch (format_) {
            case LogFormat::text:
                line = fmt::format("[{}] {}: {}\n", to_string_view(level), logger_name, message);
                break;
            case LogFormat::json: {
                auto record = nlohmann::json{
                    {"level", std::string{to_string_view(level)}},
                    {"logger", std::string{logger_name}},
                    {"message", std::string{message}},
                };
                line = record.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
                line.push_back('\n');
                break;
            }
        }
        auto lock = std::lock_guard{mutex_};
        std::fwrite(line.data(), 1, line.size(), stderr);
    }

private:
    LogFormat format_;
    std::mutex mutex_;
};

}  // anonymous namespace

auto verbosity_from_string(std::string_view name) -> std::optional<Verbosity> {
    if (name == "error") return Verbosity::error;
    if (name == "warn")  return Verbosity::warn;
    if (name == "info")  return Verbosity::info;
    if (name == "debug") return Verbosity::debug;
    return std::nullopt;
}

auto log_format_from_string(std::string_view name) -> std::optional<LogFormat> {
    if (name == "text") return LogFormat::text;
    if (name == "json") return LogFormat::json;
    return std::nullopt;
}

auto make_stderr_logger(Verbosity level, LogFormat format) -> std::shared_ptr<Logger> {
    return std::make_shared<StderrLogger>(level, format);
}

auto CaptureLogger::lines() const -> std::vector<Line> {
    auto lock = std::lock_guard{mutex_};
    return lines_;
}

void CaptureLogger::clear() {
    auto lock = std::lock_guard{mutex_};
    lines_.clear();
}

void CaptureLogger::write(Verbosity level, std::string_view message) {
    auto lock = std::lock_guard{mutex_};
    lines_.push_back(Line{level, std::string{message}});
}

}  // namespace entitypatch_cpp
