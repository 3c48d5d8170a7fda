// tscore/basic/hash.hpp - Hash combination helpers
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>

namespace tscore
{

/// Mix `value` into `seed` (boost-style combine with a 64-bit constant).
inline void hash_combine(size_t & seed, size_t value) noexcept
{
  seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
}

template <typename T>
inline void hash_field(size_t & seed, const T & value)
{
  hash_combine(seed, std::hash<T>{}(value));
}

/// Finalizer used to spread low-entropy keys across interner shards.
[[nodiscard]] inline uint64_t hash_mix(uint64_t h) noexcept
{
  h ^= h >> 33;
  h *= 0xff51afd7ed558ccdULL;
  h ^= h >> 33;
  h *= 0xc4ceb9fe1a85ec53ULL;
  h ^= h >> 33;
  return h;
}

}  // namespace tscore
