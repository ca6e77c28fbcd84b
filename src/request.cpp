#include <entitypatch-cpp/request.hpp>

#include <entitypatch-cpp/error.hpp>

#include <fmt/format.h>

#include <utility>

namespace entitypatch_cpp {

PatchRequest::PatchRequest(std::vector<Operation> operations)
    : operations_(std::move(operations)) {
    if (operations_.empty()) {
        throw PatchError{ErrorKind::invalid_request,
                         "a patch request needs at least one operation"};
    }
}

PatchRequest::PatchRequest(std::initializer_list<Operation> operations)
    : PatchRequest(std::vector<Operation>(operations)) {}

auto PatchRequest::from_raw(const std::vector<RawOperation>& records) -> PatchRequest {
    auto operations = std::vector<Operation>{};
    operations.reserve(records.size());
    for (std::size_t i = 0; i < records.size(); ++i) {
        try {
            operations.push_back(make_operation(records[i]));
        } catch (const PatchError& e) {
            throw PatchError{Error{e.kind(),
                                   fmt::format("operation {}: {}", i, e.error().message), i}};
        }
    }
    return PatchRequest(std::move(operations));
}

}  // namespace entitypatch_cpp
