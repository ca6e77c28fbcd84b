#include <entitypatch-cpp/document.hpp>

#include <entitypatch-cpp/error.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace entitypatch_cpp {

namespace {

constexpr auto append_token = std::string_view{"-"};

auto is_digits(std::string_view segment) -> bool {
    return !segment.empty() &&
           std::all_of(segment.begin(), segment.end(),
                       [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; });
}

/// Parse an array index. Leading zeros are not allowed per RFC 6901
/// (except "0" itself).
auto try_parse_index(std::string_view segment) -> std::optional<std::size_t> {
    if (!is_digits(segment)) return std::nullopt;
    if (segment.size() > 1 && segment[0] == '0') return std::nullopt;
    auto result = std::size_t{0};
    auto [ptr, ec] = std::from_chars(segment.data(), segment.data() + segment.size(), result);
    if (ec == std::errc{} && ptr == segment.data() + segment.size()) return result;
    return std::nullopt;
}

/// Index for a segment that must address an existing or insertable position.
auto require_index(std::string_view segment, const JsonPointer& ptr) -> std::size_t {
    if (segment == append_token) {
        throw PatchError{ErrorKind::invalid_index,
                         fmt::format("'-' is not allowed in this context: '{}'", ptr.to_string())};
    }
    auto idx = try_parse_index(segment);
    if (!idx) {
        throw PatchError{ErrorKind::invalid_index,
                         fmt::format("invalid array index '{}' in '{}'", segment, ptr.to_string())};
    }
    return *idx;
}

/// True if a container created for this segment should be an array.
auto looks_like_index(std::string_view segment) -> bool {
    return segment == append_token || try_parse_index(segment).has_value();
}

[[noreturn]] void not_traversable(NodeKind kind, const JsonPointer& ptr) {
    throw PatchError{ErrorKind::not_traversable,
                     fmt::format("cannot traverse into {} value at '{}'",
                                 to_string_view(kind), ptr.to_string())};
}

[[noreturn]] void key_not_found(std::string_view key, const JsonPointer& ptr) {
    throw PatchError{ErrorKind::path_not_found,
                     fmt::format("key '{}' does not exist at '{}'", key, ptr.to_string())};
}

[[noreturn]] void index_out_of_range(std::size_t idx, std::size_t size, const JsonPointer& ptr) {
    throw PatchError{ErrorKind::path_not_found,
                     fmt::format("index {} out of range (size {}) at '{}'",
                                 idx, size, ptr.to_string())};
}

auto is_blank(std::string_view s) -> bool {
    return std::all_of(s.begin(), s.end(),
                       [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; });
}

/// Walk segments [1, end) beneath the payload without creating anything.
template <typename Json>
auto walk(Json* current, const JsonPointer& ptr, std::size_t end) -> Json* {
    const auto& segments = ptr.segments();
    for (std::size_t i = 1; i < end; ++i) {
        const auto& seg = segments[i];
        switch (node_kind(*current)) {
            case NodeKind::object: {
                auto it = current->find(seg);
                if (it == current->end()) key_not_found(seg, ptr);
                current = &*it;
                break;
            }
            case NodeKind::array: {
                auto idx = require_index(seg, ptr);
                if (idx >= current->size()) index_out_of_range(idx, current->size(), ptr);
                current = &(*current)[idx];
                break;
            }
            case NodeKind::scalar:
            case NodeKind::null:
                not_traversable(node_kind(*current), ptr);
        }
    }
    return current;
}

/// Fill a null slot with an empty container shaped for the next segment.
void ensure_container(nlohmann::json& slot, std::string_view next_segment) {
    if (!slot.is_null()) return;
    slot = looks_like_index(next_segment) ? nlohmann::json::array() : nlohmann::json::object();
}

}  // anonymous namespace

auto node_kind(const nlohmann::json& node) noexcept -> NodeKind {
    if (node.is_object()) return NodeKind::object;
    if (node.is_array()) return NodeKind::array;
    if (node.is_null()) return NodeKind::null;
    return NodeKind::scalar;
}

auto DocumentAccessor::resolve_root(const JsonPointer& ptr) const -> Root {
    if (!ptr.empty()) {
        if (ptr.front() == options_.label_field && ptr.size() == 1) return Root::label;
        if (ptr.front() == options_.payload_field) return Root::payload;
    }
    throw PatchError{ErrorKind::invalid_path,
                     fmt::format("invalid patch path: '{}'", ptr.to_string())};
}

auto DocumentAccessor::is_label(const JsonPointer& ptr) const noexcept -> bool {
    return ptr.size() == 1 && ptr.front() == options_.label_field;
}

auto DocumentAccessor::get(const JsonPointer& ptr) const -> nlohmann::json {
    switch (resolve_root(ptr)) {
        case Root::label:
            return doc_.label;
        case Root::payload:
            return *walk(static_cast<const nlohmann::json*>(&doc_.payload), ptr, ptr.size());
    }
    return nullptr;
}

void DocumentAccessor::set(const JsonPointer& ptr, nlohmann::json value,
                           ListSemantics semantics) {
    switch (resolve_root(ptr)) {
        case Root::label: {
            if (!value.is_string() || is_blank(value.get_ref<const std::string&>())) {
                throw PatchError{ErrorKind::invalid_label_value,
                                 fmt::format("'{}' must be a non-empty string",
                                             ptr.to_string())};
            }
            doc_.label = std::move(value.get_ref<std::string&>());
            return;
        }
        case Root::payload:
            break;
    }

    if (ptr.size() == 1) {
        doc_.payload = std::move(value);
        return;
    }

    if (doc_.payload.is_null()) doc_.payload = nlohmann::json::object();

    const auto& segments = ptr.segments();
    auto* current = &doc_.payload;
    for (std::size_t i = 1; i + 1 < segments.size(); ++i) {
        const auto& seg = segments[i];
        const auto& next = segments[i + 1];
        switch (node_kind(*current)) {
            case NodeKind::object: {
                auto& child = (*current)[seg];
                ensure_container(child, next);
                current = &child;
                break;
            }
            case NodeKind::array: {
                auto idx = require_index(seg, ptr);
                auto& items = current->get_ref<nlohmann::json::array_t&>();
                if (idx > items.size() && idx - items.size() > max_array_padding) {
                    throw PatchError{ErrorKind::invalid_index,
                                     fmt::format("index {} is more than {} past the end "
                                                 "(size {}) at '{}'",
                                                 idx, max_array_padding, items.size(),
                                                 ptr.to_string())};
                }
                if (idx >= items.size()) items.resize(idx + 1);
                ensure_container(items[idx], next);
                current = &items[idx];
                break;
            }
            case NodeKind::scalar:
            case NodeKind::null:
                not_traversable(node_kind(*current), ptr);
        }
    }

    const auto& last = segments.back();
    switch (node_kind(*current)) {
        case NodeKind::object:
            (*current)[last] = std::move(value);
            return;
        case NodeKind::array: {
            auto& items = current->get_ref<nlohmann::json::array_t&>();
            if (last == append_token) {
                if (semantics == ListSemantics::strict) {
                    throw PatchError{ErrorKind::invalid_index,
                                     fmt::format("'-' may only append with add: '{}'",
                                                 ptr.to_string())};
                }
                items.push_back(std::move(value));
                return;
            }
            auto idx = require_index(last, ptr);
            switch (semantics) {
                case ListSemantics::append:
                    if (idx > items.size()) index_out_of_range(idx, items.size(), ptr);
                    items.insert(items.begin() + static_cast<std::ptrdiff_t>(idx), std::move(value));
                    return;
                case ListSemantics::strict:
                    if (idx >= items.size()) index_out_of_range(idx, items.size(), ptr);
                    items[idx] = std::move(value);
                    return;
            }
            return;
        }
        case NodeKind::scalar:
        case NodeKind::null:
            not_traversable(node_kind(*current), ptr);
    }
}

void DocumentAccessor::remove(const JsonPointer& ptr) {
    switch (resolve_root(ptr)) {
        case Root::label:
            throw PatchError{ErrorKind::label_not_removable,
                             fmt::format("cannot remove required attribute '{}'",
                                         options_.label_field)};
        case Root::payload:
            break;
    }

    if (ptr.size() == 1) {
        doc_.payload = nullptr;
        return;
    }
    if (doc_.payload.is_null()) {
        throw PatchError{ErrorKind::path_not_found,
                         fmt::format("cannot remove '{}': payload is empty", ptr.to_string())};
    }

    auto* parent = walk(&doc_.payload, ptr, ptr.size() - 1);
    const auto& last = ptr.back();
    switch (node_kind(*parent)) {
        case NodeKind::object: {
            auto it = parent->find(last);
            if (it == parent->end()) key_not_found(last, ptr);
            parent->erase(it);
            return;
        }
        case NodeKind::array: {
            auto idx = require_index(last, ptr);
            if (idx >= parent->size()) index_out_of_range(idx, parent->size(), ptr);
            parent->erase(idx);
            return;
        }
        case NodeKind::scalar:
        case NodeKind::null:
            not_traversable(node_kind(*parent), ptr);
    }
}

}  // namespace entitypatch_cpp
