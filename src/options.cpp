#include <entitypatch-cpp/options.hpp>

#include <fmt/format.h>

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace entitypatch_cpp {

namespace {

auto string_setting(const nlohmann::json& config, std::string_view key)
    -> std::optional<std::string> {
    auto it = config.find(std::string{key});
    if (it == config.end()) return std::nullopt;
    if (!it->is_string()) {
        throw std::invalid_argument{fmt::format("option '{}' must be a string", key)};
    }
    return it->get<std::string>();
}

}  // anonymous namespace

void validate_options(const PatchOptions& options) {
    if (options.label_field.empty()) {
        throw std::invalid_argument{"option 'label_field' must not be empty"};
    }
    if (options.payload_field.empty()) {
        throw std::invalid_argument{"option 'payload_field' must not be empty"};
    }
    if (options.label_field == options.payload_field) {
        throw std::invalid_argument{
            fmt::format("'label_field' and 'payload_field' must differ (both '{}')",
                        options.label_field)};
    }
}

auto load_options(const nlohmann::json& config) -> PatchOptions {
    if (!config.is_object()) {
        throw std::invalid_argument{"options must be a JSON object"};
    }

    auto options = PatchOptions{};
    if (auto v = string_setting(config, "label_field")) options.label_field = *v;
    if (auto v = string_setting(config, "payload_field")) options.payload_field = *v;

    if (auto it = config.find("max_operations"); it != config.end()) {
        const auto non_negative = it->is_number_unsigned() ||
                                  (it->is_number_integer() && it->get<std::int64_t>() >= 0);
        if (!non_negative) {
            throw std::invalid_argument{"option 'max_operations' must be a non-negative integer"};
        }
        options.max_operations = it->get<std::size_t>();
    }

    auto format = LogFormat::text;
    if (auto v = string_setting(config, "log_format")) {
        auto parsed = log_format_from_string(*v);
        if (!parsed) {
            throw std::invalid_argument{fmt::format("unknown log_format '{}'", *v)};
        }
        format = *parsed;
    }
    if (auto v = string_setting(config, "log_level")) {
        auto level = verbosity_from_string(*v);
        if (!level) {
            throw std::invalid_argument{fmt::format("unknown log_level '{}'", *v)};
        }
        options.logger = make_stderr_logger(*level, format);
    }

    validate_options(options);
    return options;
}

}  // namespace entitypatch_cpp
