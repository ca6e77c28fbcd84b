/// @file operation.hpp
/// @brief JSON Patch (RFC 6902) operation model.
///
/// Each of the six operation kinds is its own struct carrying exactly the
/// fields that kind permits; Operation is the closed variant over them.
/// Raw records (op/path/from/value as received) are validated once by
/// make_operation() and never reach the patch engine unvalidated.

#pragma once

#include <entitypatch-cpp/pointer.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace entitypatch_cpp {

/// The six RFC 6902 operation kinds.
enum class OpType : std::uint8_t {
    add,      ///< Insert or upsert a value at `path`.
    remove,   ///< Delete the value at `path`.
    replace,  ///< Overwrite the value at `path`.
    move,     ///< Remove the value at `from` and add it at `path`.
    copy,     ///< Add a deep copy of the value at `from` at `path`.
    test,     ///< Assert the value at `path` equals `value`.
};

/// Convert an OpType to its RFC 6902 name.
constexpr auto to_string_view(OpType type) noexcept -> std::string_view {
    switch (type) {
        case OpType::add:     return "add";
        case OpType::remove:  return "remove";
        case OpType::replace: return "replace";
        case OpType::move:    return "move";
        case OpType::copy:    return "copy";
        case OpType::test:    return "test";
    }
    return "unknown";
}

/// Normalize (trim, lower-case) and look up an op name.
auto op_type_from_string(std::string_view name) -> std::optional<OpType>;

// -- Operation kinds ----------------------------------------------------------

struct AddOp {
    JsonPointer path;
    nlohmann::json value;

    auto operator==(const AddOp&) const -> bool = default;
};

struct RemoveOp {
    JsonPointer path;

    auto operator==(const RemoveOp&) const -> bool = default;
};

struct ReplaceOp {
    JsonPointer path;
    nlohmann::json value;

    auto operator==(const ReplaceOp&) const -> bool = default;
};

struct MoveOp {
    JsonPointer from;
    JsonPointer path;

    auto operator==(const MoveOp&) const -> bool = default;
};

struct CopyOp {
    JsonPointer from;
    JsonPointer path;

    auto operator==(const CopyOp&) const -> bool = default;
};

struct TestOp {
    JsonPointer path;
    nlohmann::json value;

    auto operator==(const TestOp&) const -> bool = default;
};

/// A validated patch operation.
using Operation = std::variant<AddOp, RemoveOp, ReplaceOp, MoveOp, CopyOp, TestOp>;

/// The kind of an operation.
auto op_type(const Operation& op) noexcept -> OpType;

/// The destination pointer (`path`) of an operation.
auto target_path(const Operation& op) noexcept -> const JsonPointer&;

// -- Raw records --------------------------------------------------------------

/// An operation as received, before validation.
///
/// An engaged `value` holding JSON null is an explicit null. It satisfies
/// the value requirement of add/replace/test and is tolerated (treated as
/// absent) by remove/move/copy.
struct RawOperation {
    std::string op;
    std::string path;
    std::optional<std::string> from{};
    std::optional<nlohmann::json> value{};
};

/// Validate a raw record and build the typed operation.
/// @throws PatchError with unsupported_operation, invalid_pointer or
///   malformed_operation.
auto make_operation(const RawOperation& raw) -> Operation;

// -- Construction helpers -----------------------------------------------------

/// Shorthands that parse their pointer arguments.
///
/// @code
/// auto request = PatchRequest{
///     ops::test("/name", "Old"),
///     ops::replace("/name", "New"),
/// };
/// @endcode
namespace ops {

auto add(std::string_view path, nlohmann::json value) -> Operation;
auto remove(std::string_view path) -> Operation;
auto replace(std::string_view path, nlohmann::json value) -> Operation;
auto move(std::string_view from, std::string_view path) -> Operation;
auto copy(std::string_view from, std::string_view path) -> Operation;
auto test(std::string_view path, nlohmann::json value) -> Operation;

}  // namespace ops

// -- Variant visitor helper ---------------------------------------------------

/// Helper for constructing ad-hoc visitors from lambdas.
template <typename... Ts>
struct overload : Ts... { using Ts::operator()...; };

template <typename... Ts>
overload(Ts...) -> overload<Ts...>;

}  // namespace entitypatch_cpp
