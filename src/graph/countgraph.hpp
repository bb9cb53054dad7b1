/*
 *
 * countgraph.hpp
 * Approximate k-mer counting tables, with the de Bruijn graph implied
 * by the counted k-mers
 *
 */
#pragma once

// C/C++/C++11/C++17 headers
#include <stdint.h>
#include <atomic>
#include <cstddef>
#include <string>
#include <vector>

#include "kmer.hpp"

// Countgraph parameters
const uint64_t def_table_size = 500000000;
const size_t def_n_tables = 2;

// The n largest distinct primes <= x, descending
std::vector<uint64_t> primes_below(uint64_t x, const size_t n);

// Count-min style table: one 8-bit saturating counter per key in each of
// n_tables arrays of prime size. The reported count is the minimum over
// the arrays, so collisions can only inflate it
class CountTable
{
public:
  CountTable(const uint64_t table_size, const size_t n_tables);

  uint8_t add_count(const uint64_t key);
  uint8_t get_count(const uint64_t key) const;

  size_t n_tables() const { return _table_sizes.size(); }
  const std::vector<uint64_t> &table_sizes() const { return _table_sizes; }
  uint64_t n_occupied(const size_t table_idx) const
  {
    return _occupied[table_idx].load(std::memory_order_relaxed);
  }
  double estimated_fp_rate() const;

private:
  std::vector<uint64_t> _table_sizes;
  std::vector<std::vector<std::atomic<uint8_t>>> _tables;
  std::vector<std::atomic<uint64_t>> _occupied;
};

class CountGraph
{
public:
  CountGraph(const size_t ksize, const Alphabet alphabet,
             const uint64_t table_size = def_table_size,
             const size_t n_tables = def_n_tables);

  const KmerCodec &codec() const { return _codec; }
  size_t ksize() const { return _codec.k(); }
  Alphabet alphabet() const { return _codec.alphabet(); }

  // Count every valid k-mer of seq. Returns the number counted.
  // Safe to call from several threads at once
  size_t consume(const std::string &seq);
  // As consume, also tagging k-mers by position. Tags of this sequence
  // are appended to tags in sequence order
  size_t consume_and_tag(const std::string &seq, const size_t tag_density,
                         std::vector<uint64_t> &tags);

  uint8_t get_count(const uint64_t key) const { return _counts.get_count(key); }
  // Throws InvalidSymbolError
  uint8_t get_count(const std::string &kmer) const
  {
    return get_count(_codec.encode(kmer));
  }

  // Adjacent nodes (k-1 overlap) which have been seen
  void neighbors(const uint64_t key, std::vector<uint64_t> &out) const;

  uint64_t n_consumed() const { return _n_consumed.load(); }
  uint64_t n_invalid_symbols() const { return _n_invalid.load(); }
  const CountTable &counts() const { return _counts; }
  double estimated_fp_rate() const { return _counts.estimated_fp_rate(); }

private:
  KmerCodec _codec;
  CountTable _counts;
  std::atomic<uint64_t> _n_consumed;
  std::atomic<uint64_t> _n_invalid;
};
