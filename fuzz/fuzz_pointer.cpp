// Fuzz target for JsonPointer::parse(). Any pointer that parses must
// survive a to_string() round trip unchanged.

#include <entitypatch-cpp/error.hpp>
#include <entitypatch-cpp/pointer.hpp>

#include <cstddef>
#include <cstdint>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto input = std::string_view{reinterpret_cast<const char*>(data), size};

    try {
        const auto ptr = entitypatch_cpp::JsonPointer::parse(input);
        const auto reparsed = entitypatch_cpp::JsonPointer::parse(ptr.to_string());
        if (reparsed != ptr) __builtin_trap();
    } catch (const entitypatch_cpp::PatchError& e) {
        if (e.kind() != entitypatch_cpp::ErrorKind::invalid_pointer) __builtin_trap();
    }
    return 0;
}
