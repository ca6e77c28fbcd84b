/// @file request.hpp
/// @brief PatchRequest: an ordered, non-empty list of operations.

#pragma once

#include <entitypatch-cpp/operation.hpp>

#include <cstddef>
#include <initializer_list>
#include <vector>

namespace entitypatch_cpp {

/// An ordered, non-empty sequence of validated operations.
///
/// Order is significant: operations are applied strictly in sequence and
/// each one observes the effects of all earlier operations in the request.
class PatchRequest {
public:
    /// @throws PatchError with ErrorKind::invalid_request if `operations` is empty.
    explicit PatchRequest(std::vector<Operation> operations);
    PatchRequest(std::initializer_list<Operation> operations);

    /// Validate raw records in order and build a request.
    /// The first invalid record aborts validation; its error carries the
    /// record's 0-based index.
    /// @throws PatchError
    static auto from_raw(const std::vector<RawOperation>& records) -> PatchRequest;

    auto operations() const noexcept -> const std::vector<Operation>& { return operations_; }
    auto size() const noexcept -> std::size_t { return operations_.size(); }
    auto operator[](std::size_t i) const -> const Operation& { return operations_[i]; }
    auto begin() const noexcept { return operations_.begin(); }
    auto end() const noexcept { return operations_.end(); }

    auto operator==(const PatchRequest&) const -> bool = default;

private:
    std::vector<Operation> operations_;
};

}  // namespace entitypatch_cpp
