/*
 *
 * claim_map.hpp
 * Ownership of graph nodes by neighborhoods
 *
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <mutex>
#include <vector>

#include "robin_hood.h"

// Node key -> index of the neighborhood which claimed it. Sharded by key so
// that claims from different threads rarely contend
class ClaimMap
{
public:
  static const uint32_t unclaimed = std::numeric_limits<uint32_t>::max();

  ClaimMap(const size_t n_shards = 64);

  // Atomic check-and-set. True if key was free and now belongs to owner
  bool try_claim(const uint64_t key, const uint32_t owner);
  // Owning neighborhood, or unclaimed
  uint32_t owner(const uint64_t key) const;
  bool is_claimed(const uint64_t key) const { return owner(key) != unclaimed; }

  size_t size() const;

private:
  struct Shard
  {
    mutable std::mutex lock;
    robin_hood::unordered_flat_map<uint64_t, uint32_t> owners;
  };

  Shard &shard(const uint64_t key) { return _shards[key % _shards.size()]; }
  const Shard &shard(const uint64_t key) const
  {
    return _shards[key % _shards.size()];
  }

  std::vector<Shard> _shards;
};
