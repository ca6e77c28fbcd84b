// basic_usage: demonstrates the core entitypatch-cpp API
//
// Shows building requests with the ops:: helpers, applying them with
// apply_patch() and commit_patch(), reading the ChangeSet, and handling the
// typed error of an aborted request.
//
// Build: cmake --build build -DENTITYPATCH_CPP_BUILD_EXAMPLES=ON
// Run:   ./build/basic_usage

#include <entitypatch-cpp/entitypatch.hpp>

#include <cstdio>
#include <memory>
#include <string>
#include <variant>

namespace ep = entitypatch_cpp;
using json = nlohmann::json;

static void print_document(const char* heading, const ep::Document& doc) {
    std::printf("%s\n  name: %s\n  data: %s\n", heading, doc.label.c_str(),
                doc.payload.dump().c_str());
}

static void print_changes(const ep::ChangeSet& changes) {
    if (changes.empty()) {
        std::printf("  no changes\n");
        return;
    }
    if (changes.label) std::printf("  label   -> %s\n", changes.label->c_str());
    if (changes.payload) std::printf("  payload -> %s\n", changes.payload->dump().c_str());
}

static void print_error(const ep::Error& error) {
    std::printf("  rejected (%s) at operation %zu: %s\n",
                std::string{ep::to_string_view(error.kind)}.c_str(),
                error.op_index.value_or(0), error.message.c_str());
    std::printf("  conflict: %s\n", ep::is_conflict(error.kind) ? "yes" : "no");
}

int main() {
    auto doc = ep::Document{"Shopping List", json{{"items", {"Milk", "Eggs"}}}};
    print_document("Initial document:", doc);

    // Log every step to stderr.
    auto options = ep::PatchOptions{};
    options.logger = ep::make_stderr_logger(ep::Verbosity::debug);

    // -- Apply without committing ---------------------------------------------
    auto outcome = ep::apply_patch(doc, ep::PatchRequest{
        ep::ops::add("/data/items/-", "Bread"),
        ep::ops::add("/data/items/0", "Coffee"),
        ep::ops::add("/data/owner/name", "Alice"),
    }, options);
    if (auto* result = std::get_if<ep::PatchResult>(&outcome)) {
        print_document("Preview (caller's document untouched):", result->document);
        print_changes(result->changes);
    }

    // -- Guarded rename, committed --------------------------------------------
    std::printf("\nRename guarded by test:\n");
    auto committed = ep::commit_patch(doc, ep::PatchRequest{
        ep::ops::test("/name", "Shopping List"),
        ep::ops::replace("/name", "Groceries"),
        ep::ops::replace("/data/items/1", "Free-range Eggs"),
    }, options);
    if (auto* changes = std::get_if<ep::ChangeSet>(&committed)) print_changes(*changes);
    print_document("After commit:", doc);

    // -- Stale guard: the whole batch is rejected -----------------------------
    std::printf("\nStale rename:\n");
    auto stale = ep::commit_patch(doc, ep::PatchRequest{
        ep::ops::remove("/data/items/0"),
        ep::ops::test("/name", "Shopping List"),
        ep::ops::replace("/name", "Errands"),
    }, options);
    if (auto* error = std::get_if<ep::Error>(&stale)) print_error(*error);
    print_document("Unchanged:", doc);

    // -- Structural errors ----------------------------------------------------
    std::printf("\nMoving the label out:\n");
    auto bad = ep::apply_patch(doc, ep::PatchRequest{ep::ops::move("/name", "/data/old_name")});
    if (auto* error = std::get_if<ep::Error>(&bad)) print_error(*error);

    // -- No-op request --------------------------------------------------------
    std::printf("\nReplacing with the current value:\n");
    auto noop = ep::apply_patch(doc, ep::PatchRequest{ep::ops::replace("/name", "Groceries")});
    if (auto* result = std::get_if<ep::PatchResult>(&noop)) print_changes(result->changes);

    return 0;
}
