// json_patch_demo: entitypatch-cpp driven entirely by JSON
//
// Demonstrates:
//   - Loading PatchOptions from a JSON configuration object
//   - Reading a Document keyed by the configured root names
//   - Validating and applying RFC 6902 records with apply_json_patch()
//   - Serializing the ChangeSet and the typed Error back to JSON
//
// Build: cmake --build build -DENTITYPATCH_CPP_BUILD_EXAMPLES=ON
// Run:   ./build/json_patch_demo

#include <entitypatch-cpp/entitypatch.hpp>

#include <cstdio>
#include <variant>

namespace ep = entitypatch_cpp;
using json = nlohmann::json;

// Apply one patch and print the JSON the service layer would see.
static void run(const char* title, ep::Document& doc, const json& patch,
                const ep::PatchOptions& options) {
    std::printf("== %s\n", title);
    std::printf("patch:    %s\n", patch.dump().c_str());

    auto outcome = ep::apply_json_patch(doc, patch, options);
    if (auto* result = std::get_if<ep::PatchResult>(&outcome)) {
        std::printf("changes:  %s\n", json(result->changes).dump().c_str());
        doc = result->document;
    } else {
        std::printf("error:    %s\n", json(std::get<ep::Error>(outcome)).dump().c_str());
    }
    std::printf("document: %s\n\n", ep::document_to_json(doc, options).dump().c_str());
}

int main() {
    // Roots are addressed as /title and /payload/... in this service.
    const auto options = ep::load_options(json::parse(R"({
        "label_field": "title",
        "payload_field": "payload",
        "max_operations": 16,
        "log_level": "info",
        "log_format": "json"
    })"));

    auto doc = ep::document_from_json(json::parse(R"({
        "title": "Alpha",
        "payload": {"outer": {"inner": 1}, "tags": ["red"]}
    })"), options);

    run("nested add and replace", doc, json::parse(R"([
        {"op": "add", "path": "/payload/outer/new", "value": 2},
        {"op": "replace", "path": "/payload/outer/inner", "value": 3}
    ])"), options);

    run("wrapped request with array ops", doc, json::parse(R"({"operations": [
        {"op": "add", "path": "/payload/tags/-", "value": "blue"},
        {"op": "copy", "from": "/payload/tags/0", "path": "/payload/primary"},
        {"op": "move", "from": "/payload/outer/new", "path": "/payload/moved"}
    ]})"), options);

    run("guarded rename", doc, json::parse(R"([
        {"op": "test", "path": "/title", "value": "Alpha"},
        {"op": "replace", "path": "/title", "value": "Beta"}
    ])"), options);

    run("stale guard (conflict)", doc, json::parse(R"([
        {"op": "test", "path": "/title", "value": "Alpha"},
        {"op": "replace", "path": "/title", "value": "Gamma"}
    ])"), options);

    run("unknown root", doc, json::parse(R"([
        {"op": "add", "path": "/meta/owner", "value": "me"}
    ])"), options);

    run("malformed record", doc, json::parse(R"([
        {"op": "remove", "path": "/payload/tags/0"},
        {"op": "copy", "path": "/payload/x"}
    ])"), options);

    run("blank title", doc, json::parse(R"([
        {"op": "replace", "path": "/title", "value": "   "}
    ])"), options);

    return 0;
}
