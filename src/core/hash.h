#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>

// Core Hash subsystem
// Responsible for: cheap, well-mixed hashes of plain values (tile variants, scatter seeds).
// Should NOT do: cryptography, or promise stable values across builds or platforms.
namespace sprocket::core {

// splitmix64 finalizer.
inline constexpr std::uint64_t mix64(std::uint64_t value) {
    value ^= value >> 30u;
    value *= 0xbf58476d1ce4e5b9ULL;
    value ^= value >> 27u;
    value *= 0x94d049bb133111ebULL;
    value ^= value >> 31u;
    return value;
}

template <typename T, typename Hash = std::hash<T>>
inline std::size_t hashCombine(std::size_t seed, const T& value) {
    const std::uint64_t h = mix64(static_cast<std::uint64_t>(Hash{}(value)));
    return static_cast<std::size_t>(mix64(static_cast<std::uint64_t>(seed) ^ (h + 0x9e3779b97f4a7c15ULL)));
}

// Same input, same output for the lifetime of the process. std::hash of integers
// is usually the identity, so the result is always passed through mix64.
template <typename T, typename Hash = std::hash<T>>
inline std::uint64_t hashCode(const T& value) {
    return mix64(static_cast<std::uint64_t>(Hash{}(value)));
}

} // namespace sprocket::core
