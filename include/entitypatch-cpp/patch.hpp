/// @file patch.hpp
/// @brief Atomic application of a PatchRequest to a Document.

#pragma once

#include <entitypatch-cpp/document.hpp>
#include <entitypatch-cpp/error.hpp>
#include <entitypatch-cpp/options.hpp>
#include <entitypatch-cpp/request.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <variant>

namespace entitypatch_cpp {

/// The top-level fields whose value differs after a successful patch.
///
/// A field is present only if its final value is not structurally equal to
/// its value before the request. An empty ChangeSet means the request was
/// a no-op (for example, only `test` operations, or a replace with the
/// current value).
struct ChangeSet {
    std::optional<std::string> label{};
    std::optional<nlohmann::json> payload{};

    auto empty() const noexcept -> bool { return !label && !payload; }

    auto operator==(const ChangeSet&) const -> bool = default;
};

/// Compare the two roots of `before` and `after`.
auto diff_documents(const Document& before, const Document& after) -> ChangeSet;

/// A successfully patched document and what changed in it.
struct PatchResult {
    Document document;
    ChangeSet changes;

    auto operator==(const PatchResult&) const -> bool = default;
};

/// Either the committed result or the error that aborted the request.
/// On abort, Error::op_index names the failing operation.
using PatchOutcome = std::variant<PatchResult, Error>;

/// Outcome of commit_patch(): the change set, or the aborting error.
using CommitOutcome = std::variant<ChangeSet, Error>;

/// Apply every operation of `request`, in order, to a private copy of `doc`.
///
/// The request is all-or-nothing: the first failing operation aborts the
/// whole batch and nothing from earlier operations is visible in the
/// outcome. `doc` itself is never modified.
///
/// @code
/// auto outcome = apply_patch(doc, PatchRequest{
///     ops::test("/name", "Old"),
///     ops::replace("/name", "New"),
/// });
/// if (auto* result = std::get_if<PatchResult>(&outcome)) {
///     persist(result->document);
///     if (!result->changes.empty()) notify(result->changes);
/// }
/// @endcode
auto apply_patch(const Document& doc, const PatchRequest& request,
                 const PatchOptions& options = {}) -> PatchOutcome;

/// Like apply_patch(), but commits into `doc` on success.
/// On failure `doc` is left exactly as it was.
auto commit_patch(Document& doc, const PatchRequest& request,
                  const PatchOptions& options = {}) -> CommitOutcome;

/// Like apply_patch(), but throws the aborting error as PatchError.
auto apply_patch_or_throw(const Document& doc, const PatchRequest& request,
                          const PatchOptions& options = {}) -> PatchResult;

}  // namespace entitypatch_cpp
