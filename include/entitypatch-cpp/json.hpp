/// @file json.hpp
/// @brief nlohmann/json interoperability for entitypatch-cpp.
///
/// Provides ADL serialization (to_json/from_json) for the library types,
/// the JSON entry points of request validation (RFC 6902 records in,
/// validated PatchRequest out), and a one-call apply for JSON input.

#pragma once

#include <entitypatch-cpp/document.hpp>
#include <entitypatch-cpp/error.hpp>
#include <entitypatch-cpp/operation.hpp>
#include <entitypatch-cpp/options.hpp>
#include <entitypatch-cpp/patch.hpp>
#include <entitypatch-cpp/pointer.hpp>
#include <entitypatch-cpp/request.hpp>

#include <nlohmann/json.hpp>

namespace entitypatch_cpp {

// =============================================================================
// ADL serialization: to_json / from_json
// =============================================================================

// -- Pointers and errors ------------------------------------------------------

void to_json(nlohmann::json& j, const JsonPointer& ptr);
void from_json(const nlohmann::json& j, JsonPointer& ptr);

/// `{"kind": "...", "message": "...", "op_index": N}`; op_index only when set.
void to_json(nlohmann::json& j, const Error& e);

// -- Operations ---------------------------------------------------------------

void to_json(nlohmann::json& j, const AddOp& op);
void to_json(nlohmann::json& j, const RemoveOp& op);
void to_json(nlohmann::json& j, const ReplaceOp& op);
void to_json(nlohmann::json& j, const MoveOp& op);
void to_json(nlohmann::json& j, const CopyOp& op);
void to_json(nlohmann::json& j, const TestOp& op);
void to_json(nlohmann::json& j, const Operation& op);
void to_json(nlohmann::json& j, const PatchRequest& request);

// -- Documents and change sets ------------------------------------------------

/// Uses the default root names: `{"name": label, "data": payload}`.
void to_json(nlohmann::json& j, const Document& doc);
void from_json(const nlohmann::json& j, Document& doc);

/// `{"label"?: string, "payload"?: any}`, present keys only.
void to_json(nlohmann::json& j, const ChangeSet& changes);
void from_json(const nlohmann::json& j, ChangeSet& changes);

/// Serialize with the root names configured in `options`.
auto document_to_json(const Document& doc, const PatchOptions& options) -> nlohmann::json;

/// Read a document keyed by the root names in `options`. The label key is
/// required and must be a string; a missing payload key means null.
/// @throws std::invalid_argument
auto document_from_json(const nlohmann::json& j, const PatchOptions& options) -> Document;

// =============================================================================
// Request validation
// =============================================================================

/// Read an RFC 6902 record without validating its semantics.
/// @throws PatchError with ErrorKind::malformed_operation if the record is
///   not an object or a field has the wrong JSON type.
auto parse_raw_operation(const nlohmann::json& record) -> RawOperation;

/// Read and validate one RFC 6902 record.
/// @throws PatchError
auto parse_operation(const nlohmann::json& record) -> Operation;

/// Read and validate a whole request.
///
/// Accepts either a JSON array of records or an object whose `operations`
/// member is that array. The first invalid record aborts validation, with
/// its index in Error::op_index.
/// @throws PatchError with ErrorKind::invalid_request for a non-array or
///   empty list, or the record's own error.
auto parse_patch_request(const nlohmann::json& patch) -> PatchRequest;

/// Validate `patch` and apply it. Validation failures are reported through
/// the returned outcome like application failures.
auto apply_json_patch(const Document& doc, const nlohmann::json& patch,
                      const PatchOptions& options = {}) -> PatchOutcome;

}  // namespace entitypatch_cpp
