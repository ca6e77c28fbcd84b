#include <entitypatch-cpp/error.hpp>

#include <fmt/format.h>

#include <array>
#include <utility>

namespace entitypatch_cpp {

namespace {

constexpr auto all_kinds = std::array{
    ErrorKind::invalid_pointer,
    ErrorKind::unsupported_operation,
    ErrorKind::malformed_operation,
    ErrorKind::invalid_request,
    ErrorKind::invalid_path,
    ErrorKind::path_not_found,
    ErrorKind::invalid_index,
    ErrorKind::not_traversable,
    ErrorKind::invalid_label_value,
    ErrorKind::label_not_removable,
    ErrorKind::source_not_copyable,
    ErrorKind::source_not_movable,
    ErrorKind::test_failed,
};

}  // anonymous namespace

auto error_kind_from_string(std::string_view name) -> std::optional<ErrorKind> {
    for (auto kind : all_kinds) {
        if (to_string_view(kind) == name) return kind;
    }
    return std::nullopt;
}

PatchError::PatchError(Error error)
    : std::runtime_error{fmt::format("{}: {}", to_string_view(error.kind), error.message)},
      error_{std::move(error)} {}

PatchError::PatchError(ErrorKind kind, std::string message)
    : PatchError{Error{kind, std::move(message)}} {}

}  // namespace entitypatch_cpp
