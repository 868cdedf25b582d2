#ifndef MEMHIST_CORE_TYPES_H
#define MEMHIST_CORE_TYPES_H

#include <cstdint>
#include <cstddef>

namespace memhist {

// Identity of a tracked region: the numeric address of its first byte.
using TrackedAddress = std::uintptr_t;

inline TrackedAddress toTrackedAddress(const void* p) noexcept {
    return reinterpret_cast<TrackedAddress>(p);
}

inline std::uint8_t* fromTrackedAddress(TrackedAddress address) noexcept {
    return reinterpret_cast<std::uint8_t*>(address);
}

enum class HistoryError : std::uint32_t {
    Ok = 0,
    InvalidArgument = 1,
    RegionTooLarge = 2,
    OutOfMemory = 3,
    NotInitialized = 4,
    AlreadyInitialized = 5,
    InvalidConfig = 6,
    Destroyed = 7,
};

// Stable name for logs and test output.
const char* errorName(HistoryError error) noexcept;

} // namespace memhist

#endif // MEMHIST_CORE_TYPES_H
