/// @file error.hpp
/// @brief Error types for the entitypatch-cpp library.

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace entitypatch_cpp {

/// Categories of errors that can occur while validating or applying a patch.
enum class ErrorKind : std::uint8_t {
    invalid_pointer,        ///< A `path` or `from` string is not a usable JSON Pointer.
    unsupported_operation,  ///< `op` is not one of the six RFC 6902 kinds.
    malformed_operation,    ///< A field is missing or forbidden for the given `op`.
    invalid_request,        ///< The request is not a non-empty list of operations.
    invalid_path,           ///< The pointer does not start at a recognized root.
    path_not_found,         ///< A key or index along the pointer does not exist.
    invalid_index,          ///< An array segment is not a usable index here.
    not_traversable,        ///< Traversal tried to descend into a scalar or null.
    invalid_label_value,    ///< The label was set to a non-string or blank string.
    label_not_removable,    ///< The label was the target of a remove.
    source_not_copyable,    ///< A copy named the label as its source.
    source_not_movable,     ///< A move named the label as its source.
    test_failed,            ///< A test op did not match or could not resolve.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::invalid_pointer:       return "invalid_pointer";
        case ErrorKind::unsupported_operation: return "unsupported_operation";
        case ErrorKind::malformed_operation:   return "malformed_operation";
        case ErrorKind::invalid_request:       return "invalid_request";
        case ErrorKind::invalid_path:          return "invalid_path";
        case ErrorKind::path_not_found:        return "path_not_found";
        case ErrorKind::invalid_index:         return "invalid_index";
        case ErrorKind::not_traversable:       return "not_traversable";
        case ErrorKind::invalid_label_value:   return "invalid_label_value";
        case ErrorKind::label_not_removable:   return "label_not_removable";
        case ErrorKind::source_not_copyable:   return "source_not_copyable";
        case ErrorKind::source_not_movable:    return "source_not_movable";
        case ErrorKind::test_failed:           return "test_failed";
    }
    return "unknown";
}

/// Parse the string form produced by to_string_view().
auto error_kind_from_string(std::string_view name) -> std::optional<ErrorKind>;

/// True for kinds that describe a document-state conflict rather than a
/// structurally bad request. Only a failed `test` qualifies.
constexpr auto is_conflict(ErrorKind kind) noexcept -> bool {
    return kind == ErrorKind::test_failed;
}

/// A structured error with a category, a human-readable message and,
/// when raised while applying a request, the index of the failing operation.
struct Error {
    ErrorKind kind;                          ///< The category of this error.
    std::string message;                     ///< A human-readable description.
    std::optional<std::size_t> op_index{};   ///< 0-based index of the failing op.

    /// Construct an Error with the given kind and message.
    Error(ErrorKind k, std::string msg)
        : kind{k}, message{std::move(msg)} {}

    /// Construct an Error tagged with an operation index.
    Error(ErrorKind k, std::string msg, std::size_t index)
        : kind{k}, message{std::move(msg)}, op_index{index} {}

    auto operator==(const Error& other) const -> bool = default;
};

/// Exception carrying an Error.
///
/// Thrown by pointer parsing, operation construction, request validation
/// and document access. apply_patch() catches it and returns the Error.
class PatchError : public std::runtime_error {
public:
    explicit PatchError(Error error);
    PatchError(ErrorKind kind, std::string message);

    auto error() const noexcept -> const Error& { return error_; }
    auto kind() const noexcept -> ErrorKind { return error_.kind; }

private:
    Error error_;
};

}  // namespace entitypatch_cpp
