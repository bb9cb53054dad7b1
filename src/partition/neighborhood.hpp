/*
 *
 * neighborhood.hpp
 * Partition of the tagged graph into tag-rooted neighborhoods
 *
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "graph/countgraph.hpp"
#include "graph/tagging.hpp"
#include "claim_map.hpp"

const size_t def_max_nbhd_size = 100000;
const uint8_t def_min_abundance = 0;
// Tags traversed ahead of the ordered commit. Bounds the memory held in
// uncommitted regions to this many times max_size
const size_t def_traversal_block = 1024;

struct Neighborhood
{
  uint64_t tag;
  std::vector<uint64_t> kmers; // BFS order from the tag, tag first
  bool partial;                // truncated at the size cap

  size_t size() const { return kmers.size(); }
  bool empty() const { return kmers.empty(); }
};

// Tags sit every tag_density k-mers along a sequence, so one step less
// than the density reaches every k-mer between a tag and the next one
inline size_t default_radius(const size_t tag_density)
{
  return (tag_density > 0 ? tag_density - 1 : 0);
}

struct TraversalBounds
{
  size_t radius;         // max BFS depth from the tag
  size_t max_size;       // hard cap on claimed nodes
  uint8_t min_abundance; // nodes need count > min_abundance
};

// Breadth-first search from tag. Nodes already claimed in claims are not
// entered; with claims == nullptr the whole graph is open.
// Returns true if the traversal was truncated by bounds.max_size
bool traverse_from_tag(const CountGraph &graph, const uint64_t tag,
                       const TraversalBounds &bounds, const ClaimMap *claims,
                       std::vector<uint64_t> &kmers);

// Tags are processed in encounter order; each tag not yet claimed claims
// its reachable region. Claimed tags produce no neighborhood.
// The result does not depend on num_threads or block_size
std::vector<Neighborhood> partition_neighborhoods(const CountGraph &graph,
                                                  const TagSet &tags,
                                                  const TraversalBounds &bounds,
                                                  const size_t num_threads = 1,
                                                  const size_t block_size = def_traversal_block);
