// Fuzz target for apply_json_patch(): input is a JSON Patch document applied
// to a fixed entity. Every outcome must be a PatchResult or an Error, and a
// successful patch never leaves a blank label.

#include <entitypatch-cpp/entitypatch.hpp>

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <variant>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    namespace ep = entitypatch_cpp;
    using json = nlohmann::json;

    const auto patch = json::parse(data, data + size, nullptr, false);
    if (patch.is_discarded()) return 0;

    const auto doc = ep::Document{
        "fuzz",
        json::parse(R"({"outer": {"inner": 1}, "items": [1, 2, 3], "s": "x", "n": null})"),
    };
    const auto before = doc;

    const auto outcome = ep::apply_json_patch(doc, patch);
    if (auto* result = std::get_if<ep::PatchResult>(&outcome)) {
        const auto& label = result->document.label;
        const auto blank = std::all_of(label.begin(), label.end(),
                                       [](unsigned char c) { return std::isspace(c) != 0; });
        if (blank) __builtin_trap();
        if (ep::diff_documents(before, result->document) != result->changes) __builtin_trap();
    }
    if (doc != before) __builtin_trap();
    return 0;
}
