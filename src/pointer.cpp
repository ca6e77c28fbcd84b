#include <entitypatch-cpp/pointer.hpp>

#include <entitypatch-cpp/error.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace entitypatch_cpp {

auto JsonPointer::parse(std::string_view raw) -> JsonPointer {
    if (raw.empty()) {
        throw PatchError{ErrorKind::invalid_pointer, "JSON Pointer must not be empty"};
    }
    if (raw.front() != '/') {
        throw PatchError{ErrorKind::invalid_pointer,
                         fmt::format("JSON Pointer must start with '/': '{}'", raw)};
    }
    if (raw.size() > 1 && raw.back() == '/') {
        throw PatchError{ErrorKind::invalid_pointer,
                         fmt::format("JSON Pointer must not end with '/': '{}'", raw)};
    }

    auto segments = std::vector<std::string>{};
    segments.reserve(static_cast<std::size_t>(std::count(raw.begin(), raw.end(), '/')));
    auto pos = std::size_t{1};
    while (true) {
        auto next = raw.find('/', pos);
        segments.push_back(unescape_segment(raw.substr(pos, next - pos)));
        if (next == std::string_view::npos) break;
        pos = next + 1;
    }
    return JsonPointer{std::move(segments)};
}

auto JsonPointer::to_string() const -> std::string {
    if (segments_.empty()) return {};
    auto result = std::string{};
    for (const auto& seg : segments_) {
        result.push_back('/');
        result += escape_segment(seg);
    }
    return result;
}

auto JsonPointer::is_prefix_of(const JsonPointer& other) const -> bool {
    if (segments_.size() > other.segments_.size()) return false;
    return std::equal(segments_.begin(), segments_.end(), other.segments_.begin());
}

auto escape_segment(std::string_view segment) -> std::string {
    auto result = std::string{};
    result.reserve(segment.size());
    for (char c : segment) {
        if (c == '~') {
            result += "~0";
        } else if (c == '/') {
            result += "~1";
        } else {
            result.push_back(c);
        }
    }
    return result;
}

auto unescape_segment(std::string_view segment) -> std::string {
    auto result = std::string{};
    result.reserve(segment.size());
    for (std::size_t i = 0; i < segment.size(); ++i) {
        if (segment[i] == '~' && i + 1 < segment.size()) {
            if (segment[i + 1] == '1') {
                result.push_back('/');
                ++i;
                continue;
            }
            if (segment[i + 1] == '0') {
                result.push_back('~');
                ++i;
                continue;
            }
        }
        result.push_back(segment[i]);
    }
    return result;
}

}  // namespace entitypatch_cpp
