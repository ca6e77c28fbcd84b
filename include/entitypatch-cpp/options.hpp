/// @file options.hpp
/// @brief Configuration for pointer root names, request limits and logging.

#pragma once

#include <entitypatch-cpp/logging.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <memory>
#include <string>

namespace entitypatch_cpp {

/// Options controlling how a request is applied.
///
/// The two field names are the first pointer segment that selects each
/// document root: with the defaults, "/name" addresses the label and
/// "/data", "/data/..." address the payload.
struct PatchOptions {
    std::string label_field{"name"};     ///< Root segment for the label.
    std::string payload_field{"data"};   ///< Root segment for the payload.
    std::size_t max_operations{0};       ///< Upper bound on request size; 0 = unlimited.
    std::shared_ptr<Logger> logger{};    ///< Optional log sink.
};

/// Build options from a JSON configuration object.
///
/// Recognized keys, all optional: `label_field`, `payload_field` (non-empty,
/// distinct strings), `max_operations` (non-negative integer), `log_level`
/// ("error", "warn", "info", "debug") and `log_format` ("text", "json").
/// A `log_level` installs a stderr logger. Unknown keys are ignored.
///
/// @code
/// auto options = load_options(nlohmann::json::parse(R"({
///     "payload_field": "payload",
///     "max_operations": 64,
///     "log_level": "warn"
/// })"));
/// @endcode
/// @throws std::invalid_argument on a bad value.
auto load_options(const nlohmann::json& config) -> PatchOptions;

/// Check the constraints load_options() enforces.
/// @throws std::invalid_argument
void validate_options(const PatchOptions& options);

}  // namespace entitypatch_cpp
