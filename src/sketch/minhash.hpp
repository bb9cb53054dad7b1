/*
 *
 * minhash.hpp
 * Bottom-N MinHash sketch of a neighborhood
 *
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "bitfuncs.hpp"
#include "partition/neighborhood.hpp"

const size_t def_sketch_size = 20;
const uint64_t def_hash_modulus = 9999999967ULL; // prime
const uint64_t kmer_hash_seed = 42;

inline uint64_t hash_kmer(const uint64_t key, const uint64_t modulus)
{
  return (fmix64(key ^ kmer_hash_seed) % modulus);
}

// Owns its values, so it stays valid after the graph is gone
class NbhdSketch
{
public:
  NbhdSketch();
  NbhdSketch(const uint64_t tag, const std::vector<uint64_t> &mins,
             const size_t n_kmers, const bool partial);

  uint64_t tag() const { return _tag; }
  const std::vector<uint64_t> &mins() const { return _mins; }
  size_t size() const { return _mins.size(); }
  size_t n_kmers() const { return _n_kmers; }
  bool partial() const { return _partial; }
  // Fewer values than the sketch size: the whole k-mer set was hashed
  bool undersized(const size_t sketch_size) const { return _mins.size() < sketch_size; }

  friend bool operator==(NbhdSketch const &a, NbhdSketch const &b)
  {
    return a._tag == b._tag && a._mins == b._mins &&
           a._n_kmers == b._n_kmers && a._partial == b._partial;
  }
  friend bool operator!=(NbhdSketch const &a, NbhdSketch const &b)
  {
    return !(a == b);
  }

private:
  uint64_t _tag;
  std::vector<uint64_t> _mins; // ascending
  size_t _n_kmers;
  bool _partial;
};

NbhdSketch sketch_neighborhood(const Neighborhood &nbhd,
                               const size_t sketch_size,
                               const uint64_t hash_modulus);

std::vector<NbhdSketch> sketch_neighborhoods(const std::vector<Neighborhood> &nbhds,
                                             const size_t sketch_size,
                                             const uint64_t hash_modulus,
                                             const size_t num_threads = 1);

struct JaccardEstimate
{
  double jaccard;
  size_t shared;      // values in both, within the merged bottom-N
  size_t union_size;  // size of the merged bottom-N
  bool undersized;    // either input was undersized
};

// Bottom-N estimator. Exact when both sketches are undersized
JaccardEstimate jaccard(const NbhdSketch &a, const NbhdSketch &b,
                        const size_t sketch_size);
