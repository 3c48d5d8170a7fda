// tscore/types/sharded_store.hpp - Hash-sharded insert-if-absent storage
//
// Backing store for every interned table. Each shard owns its own
// reader-writer lock, so concurrent interning from many threads only
// contends when two values hash to the same shard.
//
#pragma once

#include <array>
#include <cstdint>
#include <deque>
#include <mutex>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>

#include "tscore/basic/hash.hpp"

namespace tscore
{

/**
 * Sharded, append-only interning table.
 *
 * Ids are never 0. An id encodes `(local_index + 1) << k_shard_bits | shard`,
 * so the smallest issued id is `1 << k_shard_bits`.
 *
 * Elements live in a per-shard deque and are never moved or mutated once
 * inserted, so references returned by get() stay valid for the store's
 * lifetime.
 *
 * @tparam T Stored value type (must be copy- or move-constructible)
 * @tparam Hash Hash functor over T
 * @tparam Eq Equality functor over T
 */
template <typename T, typename Hash, typename Eq = std::equal_to<T>>
class ShardedStore
{
public:
  static constexpr uint32_t k_shard_bits = 6;
  static constexpr uint32_t k_shard_count = 1u << k_shard_bits;

  ShardedStore() = default;

  ShardedStore(const ShardedStore &) = delete;
  ShardedStore & operator=(const ShardedStore &) = delete;

  /**
   * Return the id of a value equal to `value`, inserting it if absent.
   *
   * Lookup runs under the shard's shared lock first; only a miss takes the
   * exclusive lock, which re-checks before inserting. No lock is ever
   * upgraded in place.
   */
  uint32_t intern(T value)
  {
    const size_t h = Hash{}(value);
    const uint32_t shard_index = static_cast<uint32_t>(hash_mix(h) & (k_shard_count - 1));
    Shard & shard = shards_[shard_index];

    {
      std::shared_lock<std::shared_mutex> lock(shard.mutex);
      auto it = shard.index.find(&value);
      if (it != shard.index.end()) {
        return it->second;
      }
    }

    std::unique_lock<std::shared_mutex> lock(shard.mutex);
    auto it = shard.index.find(&value);
    if (it != shard.index.end()) {
      return it->second;
    }

    const auto local = static_cast<uint32_t>(shard.items.size());
    const uint32_t id = ((local + 1) << k_shard_bits) | shard_index;
    shard.items.push_back(std::move(value));
    shard.index.emplace(&shard.items.back(), id);
    return id;
  }

  /**
   * Access a value by id.
   *
   * @throws std::out_of_range if this store never issued `id`
   */
  [[nodiscard]] const T & get(uint32_t id) const
  {
    const uint32_t shard_index = id & (k_shard_count - 1);
    const uint32_t local_plus_one = id >> k_shard_bits;
    const Shard & shard = shards_[shard_index];

    std::shared_lock<std::shared_mutex> lock(shard.mutex);
    if (local_plus_one == 0 || local_plus_one > shard.items.size()) {
      throw std::out_of_range("unknown interned id " + std::to_string(id));
    }
    return shard.items[local_plus_one - 1];
  }

  [[nodiscard]] bool contains(uint32_t id) const
  {
    const uint32_t shard_index = id & (k_shard_count - 1);
    const uint32_t local_plus_one = id >> k_shard_bits;
    const Shard & shard = shards_[shard_index];

    std::shared_lock<std::shared_mutex> lock(shard.mutex);
    return local_plus_one != 0 && local_plus_one <= shard.items.size();
  }

  /// Total element count (a snapshot; other threads may be inserting).
  [[nodiscard]] size_t size() const
  {
    size_t total = 0;
    for (const auto & shard : shards_) {
      std::shared_lock<std::shared_mutex> lock(shard.mutex);
      total += shard.items.size();
    }
    return total;
  }

private:
  struct PtrHash
  {
    size_t operator()(const T * p) const noexcept { return Hash{}(*p); }
  };

  struct PtrEq
  {
    bool operator()(const T * a, const T * b) const noexcept { return Eq{}(*a, *b); }
  };

  struct Shard
  {
    mutable std::shared_mutex mutex;
    std::deque<T> items;
    std::unordered_map<const T *, uint32_t, PtrHash, PtrEq> index;
  };

  std::array<Shard, k_shard_count> shards_;
};

}  // namespace tscore
