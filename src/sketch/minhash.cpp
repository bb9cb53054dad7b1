/*
 *
 * minhash.cpp
 * Bottom-N MinHash sketch of a neighborhood
 *
 */

#include "minhash.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <utility>

#include <omp.h>

#include "progress.hpp"

NbhdSketch::NbhdSketch() : _tag(0), _n_kmers(0), _partial(false) {}

NbhdSketch::NbhdSketch(const uint64_t tag, const std::vector<uint64_t> &mins,
                       const size_t n_kmers, const bool partial)
    : _tag(tag), _mins(mins), _n_kmers(n_kmers), _partial(partial) {}

NbhdSketch sketch_neighborhood(const Neighborhood &nbhd,
                               const size_t sketch_size,
                               const uint64_t hash_modulus)
{
  if (sketch_size == 0 || hash_modulus < 2)
  {
    throw std::invalid_argument("Sketch size and hash modulus must be positive");
  }

  // (hash value, k-mer) so that equal values are ordered by k-mer
  std::vector<std::pair<uint64_t, uint64_t>> signs;
  signs.reserve(nbhd.kmers.size());
  for (auto kmer_it = nbhd.kmers.cbegin(); kmer_it != nbhd.kmers.cend();
       ++kmer_it)
  {
    signs.emplace_back(hash_kmer(*kmer_it, hash_modulus), *kmer_it);
  }
  std::sort(signs.begin(), signs.end());
  signs.erase(std::unique(signs.begin(), signs.end()), signs.end());

  const size_t n_mins = MIN(sketch_size, signs.size());
  std::vector<uint64_t> mins(n_mins);
  for (size_t i = 0; i < n_mins; i++)
  {
    mins[i] = signs[i].first;
  }
  return (NbhdSketch(nbhd.tag, mins, signs.size(), nbhd.partial));
}

std::vector<NbhdSketch> sketch_neighborhoods(const std::vector<Neighborhood> &nbhds,
                                             const size_t sketch_size,
                                             const uint64_t hash_modulus,
                                             const size_t num_threads)
{
  std::cerr << "Sketching " << nbhds.size() << " neighborhoods using "
            << num_threads << " thread(s)" << std::endl;

  std::vector<NbhdSketch> sketches(nbhds.size());
  ProgressMeter sketch_progress(nbhds.size(), "Sketching");
  size_t done_count = 0;
#pragma omp parallel for schedule(dynamic, 5) num_threads(num_threads)
  for (size_t i = 0; i < nbhds.size(); i++)
  {
    sketches[i] = sketch_neighborhood(nbhds[i], sketch_size, hash_modulus);
#pragma omp atomic
    ++done_count;
    if (omp_get_thread_num() == 0)
    {
      sketch_progress.tick_count(done_count);
    }
  }
  sketch_progress.finalise();
  return (sketches);
}

JaccardEstimate jaccard(const NbhdSketch &a, const NbhdSketch &b,
                        const size_t sketch_size)
{
  JaccardEstimate estimate;
  estimate.shared = 0;
  estimate.union_size = 0;
  estimate.undersized = a.undersized(sketch_size) || b.undersized(sketch_size);

  // Merge the two ascending lists, stopping after sketch_size values
  auto a_it = a.mins().cbegin();
  auto b_it = b.mins().cbegin();
  while (estimate.union_size < sketch_size &&
         (a_it != a.mins().cend() || b_it != b.mins().cend()))
  {
    if (b_it == b.mins().cend() || (a_it != a.mins().cend() && *a_it < *b_it))
    {
      ++a_it;
    }
    else if (a_it == a.mins().cend() || *b_it < *a_it)
    {
      ++b_it;
    }
    else
    {
      estimate.shared++;
      ++a_it;
      ++b_it;
    }
    estimate.union_size++;
  }

  estimate.jaccard = estimate.union_size > 0
                         ? estimate.shared / static_cast<double>(estimate.union_size)
                         : 0.0;
  return (estimate);
}
