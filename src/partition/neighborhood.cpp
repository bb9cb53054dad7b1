/*
 *
 * neighborhood.cpp
 * Partition of the tagged graph into tag-rooted neighborhoods
 *
 */

#include "neighborhood.hpp"

#include <iostream>
#include <queue>
#include <stdexcept>
#include <utility>

#include <omp.h>

#include "robin_hood.h"
#include "sketch/bitfuncs.hpp"
#include "sketch/progress.hpp"

bool traverse_from_tag(const CountGraph &graph, const uint64_t tag,
                       const TraversalBounds &bounds, const ClaimMap *claims,
                       std::vector<uint64_t> &kmers)
{
  kmers.clear();
  if (graph.get_count(tag) <= bounds.min_abundance ||
      (claims != nullptr && claims->is_claimed(tag)) || bounds.max_size == 0)
  {
    return false;
  }

  bool truncated = false;
  robin_hood::unordered_flat_set<uint64_t> seen;
  std::queue<std::pair<uint64_t, size_t>> frontier; // (node, depth)
  std::vector<uint64_t> adjacent;

  seen.insert(tag);
  frontier.emplace(tag, 0);
  size_t n_claimed = 1;
  while (!frontier.empty())
  {
    const uint64_t node = frontier.front().first;
    const size_t depth = frontier.front().second;
    frontier.pop();
    kmers.push_back(node);
    if (depth >= bounds.radius)
    {
      continue;
    }

    graph.neighbors(node, adjacent);
    for (auto adj_it = adjacent.cbegin(); adj_it != adjacent.cend(); ++adj_it)
    {
      if (!seen.insert(*adj_it).second)
      {
        continue;
      }
      if (graph.get_count(*adj_it) <= bounds.min_abundance ||
          (claims != nullptr && claims->is_claimed(*adj_it)))
      {
        continue;
      }
      if (n_claimed >= bounds.max_size)
      {
        truncated = true;
        continue;
      }
      frontier.emplace(*adj_it, depth + 1);
      n_claimed++;
    }
  }
  return (truncated);
}

std::vector<Neighborhood> partition_neighborhoods(const CountGraph &graph,
                                                  const TagSet &tags,
                                                  const TraversalBounds &bounds,
                                                  const size_t num_threads,
                                                  const size_t block_size)
{
  if (block_size == 0)
  {
    throw std::invalid_argument("Traversal block size must be at least 1");
  }
  const std::vector<uint64_t> &tag_order = tags.tags();
  std::cerr << "Traversing from " << tag_order.size() << " tags using "
            << num_threads << " thread(s)" << std::endl;

  ClaimMap claims;
  std::vector<Neighborhood> neighborhoods;
  size_t n_retraversed = 0;
  ProgressMeter traverse_progress(tag_order.size(), "Traversing");
  std::vector<std::vector<uint64_t>> regions;
  std::vector<char> truncated;
  for (size_t block_start = 0; block_start < tag_order.size();
       block_start += block_size)
  {
    const size_t block_end = MIN(block_start + block_size, tag_order.size());

    // Traverse from every tag of the block around the claims committed so
    // far. Claims are read only here
    regions.assign(block_end - block_start, std::vector<uint64_t>());
    truncated.assign(block_end - block_start, 0);
    size_t done_count = block_start;
#pragma omp parallel for schedule(dynamic, 5) num_threads(num_threads)
    for (size_t tag_idx = block_start; tag_idx < block_end; tag_idx++)
    {
      truncated[tag_idx - block_start] =
          traverse_from_tag(graph, tag_order[tag_idx], bounds, &claims,
                            regions[tag_idx - block_start]);
#pragma omp atomic
      ++done_count;
      if (omp_get_thread_num() == 0)
      {
        traverse_progress.tick_count(done_count);
      }
    }

    // Commit in tag order. A region which met a claim made earlier in this
    // block, or which was cut off at the size cap, is traversed again
    for (size_t tag_idx = block_start; tag_idx < block_end; tag_idx++)
    {
      std::vector<uint64_t> &region = regions[tag_idx - block_start];
      const uint64_t tag = tag_order[tag_idx];
      if (claims.is_claimed(tag) || region.empty())
      {
        continue;
      }

      Neighborhood nbhd;
      nbhd.tag = tag;
      nbhd.partial = truncated[tag_idx - block_start];

      bool conflict = nbhd.partial;
      for (auto kmer_it = region.cbegin(); !conflict && kmer_it != region.cend();
           ++kmer_it)
      {
        conflict = claims.is_claimed(*kmer_it);
      }
      if (conflict)
      {
        nbhd.partial = traverse_from_tag(graph, tag, bounds, &claims, nbhd.kmers);
        n_retraversed++;
      }
      else
      {
        nbhd.kmers = std::move(region);
      }
      std::vector<uint64_t>().swap(region);

      const uint32_t nbhd_idx = neighborhoods.size();
      for (auto kmer_it = nbhd.kmers.cbegin(); kmer_it != nbhd.kmers.cend();
           ++kmer_it)
      {
        if (!claims.try_claim(*kmer_it, nbhd_idx))
        {
          throw std::runtime_error("Node claimed by two neighborhoods");
        }
      }
      neighborhoods.push_back(std::move(nbhd));
    }
  }
  traverse_progress.finalise();

  std::cerr << "Partitioned " << claims.size() << " k-mers into "
            << neighborhoods.size() << " neighborhoods (" << n_retraversed
            << " re-traversed around earlier claims)" << std::endl;
  return (neighborhoods);
}
