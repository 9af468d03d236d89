/**
 * @file Fnv1a.hpp
 * @brief 64-bit FNV-1a, for values persisted across builds.
 *
 * std::hash is implementation-defined; anything written to disk uses this instead.
 */

#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

namespace imagescout::infrastructure {

constexpr std::uint64_t kFnvOffsetBasis = 14695981039346656037ull;
constexpr std::uint64_t kFnvPrime = 1099511628211ull;

/** @brief Folds bytes into a running hash; start from kFnvOffsetBasis. */
inline std::uint64_t Fnv1aUpdate(std::uint64_t h, const char* data, std::size_t size) {
    for (std::size_t i = 0; i < size; ++i) {
        h ^= static_cast<unsigned char>(data[i]);
        h *= kFnvPrime;
    }
    return h;
}

inline std::uint64_t Fnv1a(const std::string& data) {
    return Fnv1aUpdate(kFnvOffsetBasis, data.data(), data.size());
}

} // namespace imagescout::infrastructure
