#include <entitypatch-cpp/patch.hpp>

#include <fmt/format.h>

#include <cstddef>
#include <string>
#include <utility>
#include <variant>

namespace entitypatch_cpp {

namespace {

void apply_test(const DocumentAccessor& accessor, const TestOp& op) {
    auto current = nlohmann::json{};
    try {
        current = accessor.get(op.path);
    } catch (const PatchError& e) {
        // An unresolvable path is a failed precondition, not a bad request.
        throw PatchError{ErrorKind::test_failed,
                         fmt::format("test failed: path not found ({})", e.error().message)};
    }
    if (current != op.value) {
        throw PatchError{ErrorKind::test_failed,
                         fmt::format("test failed: value mismatch at '{}'", op.path.to_string())};
    }
}

void apply_operation(DocumentAccessor& accessor, const Operation& operation) {
    std::visit(overload{
        [&](const AddOp& op) {
            accessor.set(op.path, op.value, ListSemantics::append);
        },
        [&](const RemoveOp& op) {
            accessor.remove(op.path);
        },
        [&](const ReplaceOp& op) {
            accessor.set(op.path, op.value, ListSemantics::strict);
        },
        [&](const MoveOp& op) {
            if (accessor.is_label(op.from)) {
                throw PatchError{ErrorKind::source_not_movable,
                                 fmt::format("cannot move from '{}'", op.from.to_string())};
            }
            if (op.from != op.path && op.from.is_prefix_of(op.path)) {
                throw PatchError{ErrorKind::source_not_movable,
                                 fmt::format("cannot move '{}' into its own child '{}'",
                                             op.from.to_string(), op.path.to_string())};
            }
            auto value = accessor.get(op.from);
            accessor.remove(op.from);
            accessor.set(op.path, std::move(value), ListSemantics::append);
        },
        [&](const CopyOp& op) {
            if (accessor.is_label(op.from)) {
                throw PatchError{ErrorKind::source_not_copyable,
                                 fmt::format("cannot copy from '{}'", op.from.to_string())};
            }
            accessor.set(op.path, accessor.get(op.from), ListSemantics::append);
        },
        [&](const TestOp& op) {
            apply_test(accessor, op);
        },
    }, operation);
}

auto describe_changes(const ChangeSet& changes) -> std::string {
    if (changes.label && changes.payload) return "label, payload";
    if (changes.label) return "label";
    return "payload";
}

}  // anonymous namespace

auto diff_documents(const Document& before, const Document& after) -> ChangeSet {
    auto changes = ChangeSet{};
    if (after.label != before.label) changes.label = after.label;
    if (after.payload != before.payload) changes.payload = after.payload;
    return changes;
}

auto apply_patch(const Document& doc, const PatchRequest& request,
                 const PatchOptions& options) -> PatchOutcome {
    auto* logger = options.logger.get();
    if (logger) {
        logger->logf(Verbosity::info, "processing JSON Patch: {} operation(s)", request.size());
    }

    if (options.max_operations != 0 && request.size() > options.max_operations) {
        auto error = Error{ErrorKind::invalid_request,
                           fmt::format("patch has {} operations; the limit is {}",
                                       request.size(), options.max_operations)};
        if (logger) logger->logf(Verbosity::warn, "patch rejected: {}", error.message);
        return error;
    }

    // All operations run against a working copy; `doc` is only read.
    auto working = doc;
    auto accessor = DocumentAccessor{working, options};
    for (std::size_t i = 0; i < request.size(); ++i) {
        const auto& operation = request[i];
        try {
            apply_operation(accessor, operation);
        } catch (const PatchError& e) {
            if (logger) {
                logger->logf(Verbosity::warn, "patch aborted at operation {} ({} {}): {}: {}",
                             i, to_string_view(op_type(operation)),
                             target_path(operation).to_string(),
                             to_string_view(e.kind()), e.error().message);
            }
            return Error{e.kind(), e.error().message, i};
        }
        if (logger) {
            logger->logf(Verbosity::debug, "applied operation {} ({} {})",
                         i, to_string_view(op_type(operation)),
                         target_path(operation).to_string());
        }
    }

    auto changes = diff_documents(doc, working);
    if (logger) {
        if (changes.empty()) {
            logger->log(Verbosity::info, "patch applied with no changes");
        } else {
            logger->logf(Verbosity::info, "patch applied; changed: {}", describe_changes(changes));
        }
    }
    return PatchResult{std::move(working), std::move(changes)};
}

auto commit_patch(Document& doc, const PatchRequest& request,
                  const PatchOptions& options) -> CommitOutcome {
    auto outcome = apply_patch(doc, request, options);
    if (auto* error = std::get_if<Error>(&outcome)) return std::move(*error);
    auto& result = std::get<PatchResult>(outcome);
    doc = std::move(result.document);
    return std::move(result.changes);
}

auto apply_patch_or_throw(const Document& doc, const PatchRequest& request,
                          const PatchOptions& options) -> PatchResult {
    auto outcome = apply_patch(doc, request, options);
    if (auto* error = std::get_if<Error>(&outcome)) throw PatchError{std::move(*error)};
    return std::move(std::get<PatchResult>(outcome));
}

}  // namespace entitypatch_cpp
