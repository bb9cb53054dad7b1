/*
 *
 * claim_map.cpp
 * Ownership of graph nodes by neighborhoods
 *
 */

#include "claim_map.hpp"

#include <stdexcept>

const uint32_t ClaimMap::unclaimed;

ClaimMap::ClaimMap(const size_t n_shards) : _shards(n_shards)
{
  if (n_shards == 0)
  {
    throw std::invalid_argument("ClaimMap needs at least one shard");
  }
}

bool ClaimMap::try_claim(const uint64_t key, const uint32_t owner)
{
  Shard &key_shard = shard(key);
  std::lock_guard<std::mutex> guard(key_shard.lock);
  return (key_shard.owners.emplace(key, owner).second);
}

uint32_t ClaimMap::owner(const uint64_t key) const
{
  const Shard &key_shard = shard(key);
  std::lock_guard<std::mutex> guard(key_shard.lock);
  auto owner_it = key_shard.owners.find(key);
  if (owner_it == key_shard.owners.end())
  {
    return unclaimed;
  }
  return (owner_it->second);
}

size_t ClaimMap::size() const
{
  size_t n_claimed = 0;
  for (auto shard_it = _shards.cbegin(); shard_it != _shards.cend(); ++shard_it)
  {
    std::lock_guard<std::mutex> guard(shard_it->lock);
    n_claimed += shard_it->owners.size();
  }
  return (n_claimed);
}
