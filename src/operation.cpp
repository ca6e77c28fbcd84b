#include <entitypatch-cpp/operation.hpp>

#include <entitypatch-cpp/error.hpp>

#include <fmt/format.h>

#include <cctype>
#include <string>
#include <string_view>
#include <utility>

namespace entitypatch_cpp {

namespace {

auto normalize_op_name(std::string_view name) -> std::string {
    auto is_space = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
    while (!name.empty() && is_space(name.front())) name.remove_prefix(1);
    while (!name.empty() && is_space(name.back())) name.remove_suffix(1);
    auto result = std::string{};
    result.reserve(name.size());
    for (char c : name) {
        result.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return result;
}

auto parse_field(std::string_view field, std::string_view raw) -> JsonPointer {
    try {
        return JsonPointer::parse(raw);
    } catch (const PatchError& e) {
        throw PatchError{ErrorKind::invalid_pointer,
                         fmt::format("\"{}\": {}", field, e.error().message)};
    }
}

[[noreturn]] void malformed(OpType type, std::string_view detail) {
    throw PatchError{ErrorKind::malformed_operation,
                     fmt::format("{} for op=\"{}\"", detail, to_string_view(type))};
}

// A null value counts as absent for the kinds that forbid `value`.
auto has_non_null_value(const RawOperation& raw) -> bool {
    return raw.value.has_value() && !raw.value->is_null();
}

}  // anonymous namespace

auto op_type_from_string(std::string_view name) -> std::optional<OpType> {
    const auto normalized = normalize_op_name(name);
    if (normalized == "add")     return OpType::add;
    if (normalized == "remove")  return OpType::remove;
    if (normalized == "replace") return OpType::replace;
    if (normalized == "move")    return OpType::move;
    if (normalized == "copy")    return OpType::copy;
    if (normalized == "test")    return OpType::test;
    return std::nullopt;
}

auto op_type(const Operation& op) noexcept -> OpType {
    return std::visit(overload{
        [](const AddOp&) { return OpType::add; },
        [](const RemoveOp&) { return OpType::remove; },
        [](const ReplaceOp&) { return OpType::replace; },
        [](const MoveOp&) { return OpType::move; },
        [](const CopyOp&) { return OpType::copy; },
        [](const TestOp&) { return OpType::test; },
    }, op);
}

auto target_path(const Operation& op) noexcept -> const JsonPointer& {
    return std::visit([](const auto& o) -> const JsonPointer& { return o.path; }, op);
}

auto make_operation(const RawOperation& raw) -> Operation {
    const auto type = op_type_from_string(raw.op);
    if (!type) {
        throw PatchError{ErrorKind::unsupported_operation,
                         fmt::format("op must be one of \"add\", \"remove\", \"replace\", "
                                     "\"move\", \"copy\", \"test\" (got \"{}\")", raw.op)};
    }

    auto path = parse_field("path", raw.path);
    auto from = std::optional<JsonPointer>{};
    if (raw.from) from = parse_field("from", *raw.from);

    switch (*type) {
        case OpType::add:
        case OpType::replace:
        case OpType::test: {
            if (!raw.value) malformed(*type, "value is required");
            if (from) malformed(*type, "\"from\" is not allowed");
            if (*type == OpType::add) return AddOp{std::move(path), *raw.value};
            if (*type == OpType::replace) return ReplaceOp{std::move(path), *raw.value};
            return TestOp{std::move(path), *raw.value};
        }
        case OpType::remove:
            if (has_non_null_value(raw)) malformed(*type, "value must be omitted or null");
            if (from) malformed(*type, "\"from\" is not allowed");
            return RemoveOp{std::move(path)};
        case OpType::move:
        case OpType::copy:
            if (!from) malformed(*type, "\"from\" is required");
            if (has_non_null_value(raw)) malformed(*type, "value must be omitted or null");
            if (*type == OpType::move) return MoveOp{std::move(*from), std::move(path)};
            return CopyOp{std::move(*from), std::move(path)};
    }
    throw PatchError{ErrorKind::unsupported_operation, "unknown operation kind"};
}

namespace ops {

auto add(std::string_view path, nlohmann::json value) -> Operation {
    return AddOp{JsonPointer::parse(path), std::move(value)};
}

auto remove(std::string_view path) -> Operation {
    return RemoveOp{JsonPointer::parse(path)};
}

auto replace(std::string_view path, nlohmann::json value) -> Operation {
    return ReplaceOp{JsonPointer::parse(path), std::move(value)};
}

auto move(std::string_view from, std::string_view path) -> Operation {
    return MoveOp{JsonPointer::parse(from), JsonPointer::parse(path)};
}

auto copy(std::string_view from, std::string_view path) -> Operation {
    return CopyOp{JsonPointer::parse(from), JsonPointer::parse(path)};
}

auto test(std::string_view path, nlohmann::json value) -> Operation {
    return TestOp{JsonPointer::parse(path), std::move(value)};
}

}  // namespace ops

}  // namespace entitypatch_cpp
