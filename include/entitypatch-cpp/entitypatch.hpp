/// @file entitypatch.hpp
/// @brief Umbrella header for the entitypatch-cpp library.
///
/// Include this single header for access to all public types:
/// Document, JsonPointer, Operation, PatchRequest, PatchOptions,
/// ChangeSet, PatchResult, Error, Logger and the JSON interop functions.

#pragma once

#include <entitypatch-cpp/document.hpp>
#include <entitypatch-cpp/error.hpp>
#include <entitypatch-cpp/json.hpp>
#include <entitypatch-cpp/logging.hpp>
#include <entitypatch-cpp/operation.hpp>
#include <entitypatch-cpp/options.hpp>
#include <entitypatch-cpp/patch.hpp>
#include <entitypatch-cpp/pointer.hpp>
#include <entitypatch-cpp/request.hpp>
