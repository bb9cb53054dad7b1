/*
 *
 * countgraph.cpp
 * Approximate k-mer counting tables, with the de Bruijn graph implied
 * by the counted k-mers
 *
 */

#include "countgraph.hpp"

// C/C++/C++11/C++17 headers
#include <iterator>
#include <limits>
#include <stdexcept>

#include "tagging.hpp"

bool is_prime(const uint64_t n)
{
  if (n < 2)
  {
    return false;
  }
  if (n < 4)
  {
    return true;
  }
  if (n % 2 == 0)
  {
    return false;
  }
  for (uint64_t i = 3; i * i <= n; i += 2)
  {
    if (n % i == 0)
    {
      return false;
    }
  }
  return true;
}

std::vector<uint64_t> primes_below(uint64_t x, const size_t n)
{
  std::vector<uint64_t> primes;
  while (primes.size() < n && x >= 2)
  {
    if (is_prime(x))
    {
      primes.push_back(x);
    }
    x--;
  }
  if (primes.size() < n)
  {
    throw std::invalid_argument("Table size too small for " +
                                std::to_string(n) + " distinct prime tables");
  }
  return (primes);
}

// Constructors

CountTable::CountTable(const uint64_t table_size, const size_t n_tables)
    : _table_sizes(primes_below(table_size, n_tables)), _occupied(n_tables)
{
  if (n_tables == 0)
  {
    throw std::invalid_argument("Need at least one counting table");
  }
  _tables.reserve(n_tables);
  for (auto size_it = _table_sizes.cbegin(); size_it != _table_sizes.cend();
       ++size_it)
  {
    // value initialised, so all counters start at zero
    _tables.emplace_back(*size_it);
  }
}

uint8_t CountTable::add_count(const uint64_t key)
{
  uint8_t min_count = std::numeric_limits<uint8_t>::max();
  for (size_t table_idx = 0; table_idx < _tables.size(); table_idx++)
  {
    std::atomic<uint8_t> &cell =
        _tables[table_idx][key % _table_sizes[table_idx]];
    uint8_t current = cell.load(std::memory_order_relaxed);
    while (current < std::numeric_limits<uint8_t>::max() &&
           !cell.compare_exchange_weak(current, static_cast<uint8_t>(current + 1),
                                       std::memory_order_relaxed))
    {
    }
    if (current == 0)
    {
      _occupied[table_idx].fetch_add(1, std::memory_order_relaxed);
    }
    // current is the value before our increment, unless saturated
    const uint8_t new_count = current < std::numeric_limits<uint8_t>::max()
                                  ? static_cast<uint8_t>(current + 1)
                                  : current;
    if (new_count < min_count)
    {
      min_count = new_count;
    }
  }
  return (min_count);
}

uint8_t CountTable::get_count(const uint64_t key) const
{
  uint8_t min_count = std::numeric_limits<uint8_t>::max();
  for (size_t table_idx = 0; table_idx < _tables.size(); table_idx++)
  {
    const uint8_t count =
        _tables[table_idx][key % _table_sizes[table_idx]].load(
            std::memory_order_relaxed);
    if (count < min_count)
    {
      min_count = count;
    }
  }
  return (min_count);
}

// Chance an unseen k-mer hits occupied cells in every table
double CountTable::estimated_fp_rate() const
{
  double fp_rate = 1.0;
  for (size_t table_idx = 0; table_idx < _tables.size(); table_idx++)
  {
    fp_rate *= n_occupied(table_idx) / static_cast<double>(_table_sizes[table_idx]);
  }
  return (fp_rate);
}

CountGraph::CountGraph(const size_t ksize, const Alphabet alphabet,
                       const uint64_t table_size, const size_t n_tables)
    : _codec(ksize, alphabet), _counts(table_size, n_tables), _n_consumed(0),
      _n_invalid(0) {}

size_t CountGraph::consume(const std::string &seq)
{
  size_t n_kmers = 0;
  KmerIterator kmer_it(_codec, seq);
  while (kmer_it.next())
  {
    _counts.add_count(kmer_it.key());
    n_kmers++;
  }
  _n_consumed += n_kmers;
  _n_invalid += kmer_it.invalid_symbols();
  return (n_kmers);
}

size_t CountGraph::consume_and_tag(const std::string &seq,
                                   const size_t tag_density,
                                   std::vector<uint64_t> &tags)
{
  TagCursor tagger(tag_density);
  size_t n_kmers = 0;
  KmerIterator kmer_it(_codec, seq);
  while (kmer_it.next())
  {
    const uint64_t key = kmer_it.key();
    _counts.add_count(key);
    if (tagger.maybe_tag())
    {
      tags.push_back(key);
    }
    n_kmers++;
  }
  _n_consumed += n_kmers;
  _n_invalid += kmer_it.invalid_symbols();
  return (n_kmers);
}

void CountGraph::neighbors(const uint64_t key, std::vector<uint64_t> &out) const
{
  std::vector<uint64_t> candidates;
  _codec.extensions(key, candidates);
  out.clear();
  for (auto cand_it = candidates.cbegin(); cand_it != candidates.cend();
       ++cand_it)
  {
    if (get_count(*cand_it) > 0)
    {
      out.push_back(*cand_it);
    }
  }
}
