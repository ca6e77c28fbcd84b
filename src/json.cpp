#include <entitypatch-cpp/json.hpp>

#include <fmt/format.h>

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace entitypatch_cpp {

// =============================================================================
// ADL serialization
// =============================================================================

void to_json(nlohmann::json& j, const JsonPointer& ptr) {
    j = ptr.to_string();
}

void from_json(const nlohmann::json& j, JsonPointer& ptr) {
    ptr = JsonPointer::parse(j.get<std::string>());
}

void to_json(nlohmann::json& j, const Error& e) {
    j = nlohmann::json{
        {"kind", std::string{to_string_view(e.kind)}},
        {"message", e.message},
    };
    if (e.op_index) j["op_index"] = *e.op_index;
}

void to_json(nlohmann::json& j, const AddOp& op) {
    j = nlohmann::json{{"op", "add"}, {"path", op.path}, {"value", op.value}};
}

void to_json(nlohmann::json& j, const RemoveOp& op) {
    j = nlohmann::json{{"op", "remove"}, {"path", op.path}};
}

void to_json(nlohmann::json& j, const ReplaceOp& op) {
    j = nlohmann::json{{"op", "replace"}, {"path", op.path}, {"value", op.value}};
}

void to_json(nlohmann::json& j, const MoveOp& op) {
    j = nlohmann::json{{"op", "move"}, {"from", op.from}, {"path", op.path}};
}

void to_json(nlohmann::json& j, const CopyOp& op) {
    j = nlohmann::json{{"op", "copy"}, {"from", op.from}, {"path", op.path}};
}

void to_json(nlohmann::json& j, const TestOp& op) {
    j = nlohmann::json{{"op", "test"}, {"path", op.path}, {"value", op.value}};
}

void to_json(nlohmann::json& j, const Operation& op) {
    std::visit([&j](const auto& o) { to_json(j, o); }, op);
}

void to_json(nlohmann::json& j, const PatchRequest& request) {
    j = nlohmann::json::array();
    for (const auto& op : request) {
        auto record = nlohmann::json{};
        to_json(record, op);
        j.push_back(std::move(record));
    }
}

void to_json(nlohmann::json& j, const Document& doc) {
    j = document_to_json(doc, PatchOptions{});
}

void from_json(const nlohmann::json& j, Document& doc) {
    doc = document_from_json(j, PatchOptions{});
}

void to_json(nlohmann::json& j, const ChangeSet& changes) {
    j = nlohmann::json::object();
    if (changes.label) j["label"] = *changes.label;
    if (changes.payload) j["payload"] = *changes.payload;
}

void from_json(const nlohmann::json& j, ChangeSet& changes) {
    changes = ChangeSet{};
    if (auto it = j.find("label"); it != j.end()) changes.label = it->get<std::string>();
    if (auto it = j.find("payload"); it != j.end()) changes.payload = *it;
}

auto document_to_json(const Document& doc, const PatchOptions& options) -> nlohmann::json {
    auto j = nlohmann::json::object();
    j[options.label_field] = doc.label;
    j[options.payload_field] = doc.payload;
    return j;
}

auto document_from_json(const nlohmann::json& j, const PatchOptions& options) -> Document {
    if (!j.is_object()) {
        throw std::invalid_argument{"document must be a JSON object"};
    }
    auto label = j.find(options.label_field);
    if (label == j.end() || !label->is_string()) {
        throw std::invalid_argument{
            fmt::format("document field '{}' must be a string", options.label_field)};
    }
    auto doc = Document{};
    doc.label = label->get<std::string>();
    if (auto payload = j.find(options.payload_field); payload != j.end()) {
        doc.payload = *payload;
    }
    return doc;
}

// =============================================================================
// Request validation
// =============================================================================

namespace {

[[noreturn]] void bad_field(std::string_view field, std::string_view expected) {
    throw PatchError{ErrorKind::malformed_operation,
                     fmt::format("\"{}\" must be {}", field, expected)};
}

auto required_string(const nlohmann::json& record, const char* field) -> std::string {
    auto it = record.find(field);
    if (it == record.end()) {
        throw PatchError{ErrorKind::malformed_operation,
                         fmt::format("\"{}\" is required", field)};
    }
    if (!it->is_string()) bad_field(field, "a string");
    return it->get<std::string>();
}

}  // anonymous namespace

auto parse_raw_operation(const nlohmann::json& record) -> RawOperation {
    if (!record.is_object()) {
        throw PatchError{ErrorKind::malformed_operation, "operation must be a JSON object"};
    }
    auto raw = RawOperation{};
    raw.op = required_string(record, "op");
    raw.path = required_string(record, "path");
    if (auto it = record.find("from"); it != record.end() && !it->is_null()) {
        if (!it->is_string()) bad_field("from", "a string");
        raw.from = it->get<std::string>();
    }
    if (auto it = record.find("value"); it != record.end()) {
        raw.value = *it;
    }
    return raw;
}

auto parse_operation(const nlohmann::json& record) -> Operation {
    return make_operation(parse_raw_operation(record));
}

auto parse_patch_request(const nlohmann::json& patch) -> PatchRequest {
    const auto* list = &patch;
    if (patch.is_object()) {
        auto it = patch.find("operations");
        if (it == patch.end()) {
            throw PatchError{ErrorKind::invalid_request,
                             "patch object must have an \"operations\" member"};
        }
        list = &*it;
    }
    if (!list->is_array()) {
        throw PatchError{ErrorKind::invalid_request, "JSON Patch must be an array"};
    }
    if (list->empty()) {
        throw PatchError{ErrorKind::invalid_request,
                         "a patch request needs at least one operation"};
    }

    auto records = std::vector<RawOperation>{};
    records.reserve(list->size());
    for (std::size_t i = 0; i < list->size(); ++i) {
        try {
            records.push_back(parse_raw_operation((*list)[i]));
        } catch (const PatchError& e) {
            throw PatchError{Error{e.kind(),
                                   fmt::format("operation {}: {}", i, e.error().message), i}};
        }
    }
    return PatchRequest::from_raw(records);
}

auto apply_json_patch(const Document& doc, const nlohmann::json& patch,
                      const PatchOptions& options) -> PatchOutcome {
    try {
        return apply_patch(doc, parse_patch_request(patch), options);
    } catch (const PatchError& e) {
        if (options.logger) {
            options.logger->logf(Verbosity::warn, "patch rejected: {}", e.what());
        }
        return e.error();
    }
}

}  // namespace entitypatch_cpp
