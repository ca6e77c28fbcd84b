/// @file document.hpp
/// @brief The two-root entity document and pointer-based access to it.

#pragma once

#include <entitypatch-cpp/options.hpp>
#include <entitypatch-cpp/pointer.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace entitypatch_cpp {

/// The entity being patched.
///
/// Only two roots are addressable: a required string label and a free-form
/// JSON payload. A null payload means "no payload".
struct Document {
    std::string label;                 ///< Always present; non-blank after any successful patch.
    nlohmann::json payload{nullptr};   ///< Any JSON value, or null.

    auto operator==(const Document&) const -> bool = default;
};

/// Which top-level root a pointer addresses.
enum class Root : std::uint8_t {
    label,
    payload,
};

/// Convert a Root to its string representation.
constexpr auto to_string_view(Root root) noexcept -> std::string_view {
    switch (root) {
        case Root::label:   return "label";
        case Root::payload: return "payload";
    }
    return "unknown";
}

/// The closed set of node shapes met while walking a payload.
enum class NodeKind : std::uint8_t {
    object,
    array,
    scalar,
    null,
};

/// Convert a NodeKind to its string representation.
constexpr auto to_string_view(NodeKind kind) noexcept -> std::string_view {
    switch (kind) {
        case NodeKind::object: return "object";
        case NodeKind::array:  return "array";
        case NodeKind::scalar: return "scalar";
        case NodeKind::null:   return "null";
    }
    return "unknown";
}

/// Classify a JSON value. Strings, numbers, booleans and binary are scalars.
auto node_kind(const nlohmann::json& node) noexcept -> NodeKind;

/// How many null slots set() may add when an intermediate array index lies
/// past the end. A larger gap is rejected with ErrorKind::invalid_index.
inline constexpr std::size_t max_array_padding = 1024;

/// How the last segment of a pointer into an array is interpreted by set().
enum class ListSemantics : std::uint8_t {
    append,  ///< add-style: "-" appends, an index in [0, size] inserts.
    strict,  ///< replace-style: an existing index is overwritten, "-" is rejected.
};

/// Reads and writes a Document through parsed JSON Pointers.
///
/// The first pointer segment selects a root (see PatchOptions). The label
/// root takes no further segments. Segments after the payload root walk
/// nested objects (by key) and arrays (by non-negative decimal index).
/// Every failure is reported by throwing PatchError.
///
/// The accessor holds references; the Document and options must outlive it.
class DocumentAccessor {
public:
    DocumentAccessor(Document& doc, const PatchOptions& options)
        : doc_{doc}, options_{options} {}

    /// Which root `ptr` addresses.
    /// @throws PatchError with ErrorKind::invalid_path.
    auto resolve_root(const JsonPointer& ptr) const -> Root;

    /// True if `ptr` addresses exactly the label root.
    auto is_label(const JsonPointer& ptr) const noexcept -> bool;

    /// A deep copy of the value at `ptr`. The label is returned as a JSON string.
    /// @throws PatchError (invalid_path, path_not_found, invalid_index, not_traversable).
    auto get(const JsonPointer& ptr) const -> nlohmann::json;

    /// Write `value` at `ptr`.
    ///
    /// Missing or null intermediate containers are created: an array when the
    /// following segment is "-" or a valid array index, an object otherwise.
    /// Intermediate array indices past the end pad the array with nulls, up to
    /// max_array_padding slots. The final segment follows `semantics` when its
    /// parent is an array.
    /// @throws PatchError (invalid_path, path_not_found, invalid_index,
    ///   not_traversable, invalid_label_value).
    void set(const JsonPointer& ptr, nlohmann::json value, ListSemantics semantics);

    /// Remove the value at `ptr`. Removing the payload root sets it to null.
    /// @throws PatchError (invalid_path, path_not_found, invalid_index,
    ///   not_traversable, label_not_removable).
    void remove(const JsonPointer& ptr);

private:
    Document& doc_;
    const PatchOptions& options_;
};

}  // namespace entitypatch_cpp
