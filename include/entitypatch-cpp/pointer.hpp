/// @file pointer.hpp
/// @brief JSON Pointer (RFC 6901) parsing and unparsing.

#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace entitypatch_cpp {

/// A parsed JSON Pointer: an ordered list of unescaped segments.
///
/// The raw form must be non-empty, start with '/', and (unless it is
/// exactly "/") must not end with '/'. A pointer is a coordinate only;
/// it holds no reference to any document. Segments are opaque strings:
/// whether "3" is an array index is decided during document access.
///
/// @code
/// auto ptr = JsonPointer::parse("/data/a~1b/0");
/// // ptr.segments() == {"data", "a/b", "0"}
/// @endcode
class JsonPointer {
public:
    JsonPointer() = default;

    /// Build a pointer from already-unescaped segments.
    explicit JsonPointer(std::vector<std::string> segments)
        : segments_{std::move(segments)} {}

    /// Parse a raw pointer string.
    /// @throws PatchError with ErrorKind::invalid_pointer on malformed input.
    static auto parse(std::string_view raw) -> JsonPointer;

    auto segments() const noexcept -> const std::vector<std::string>& { return segments_; }
    auto size() const noexcept -> std::size_t { return segments_.size(); }
    auto empty() const noexcept -> bool { return segments_.empty(); }
    auto front() const -> const std::string& { return segments_.front(); }
    auto back() const -> const std::string& { return segments_.back(); }

    /// Re-escape the segments into RFC 6901 form.
    auto to_string() const -> std::string;

    /// True if `other` is this pointer or lies beneath it.
    auto is_prefix_of(const JsonPointer& other) const -> bool;

    auto operator==(const JsonPointer&) const -> bool = default;

private:
    std::vector<std::string> segments_;
};

/// Escape a single segment: '~' -> "~0", '/' -> "~1".
auto escape_segment(std::string_view segment) -> std::string;

/// Unescape a single segment in one left-to-right scan.
/// A '~' not followed by '0' or '1' is kept literally.
auto unescape_segment(std::string_view segment) -> std::string;

}  // namespace entitypatch_cpp
