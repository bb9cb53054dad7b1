/*
 *
 * kmer.hpp
 * Encoding of k-mers into fixed width integer keys
 *
 */
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "errors.hpp"

enum class Alphabet
{
  DNA,
  Protein
};

const size_t max_dna_k = 32;     // 2 bits per base in a 64-bit key
const size_t max_protein_k = 12; // 5 bits per residue
const int invalid_symbol = -1;

std::string alphabet_name(const Alphabet alphabet);
Alphabet alphabet_from_name(const std::string &name);

std::string reverse_complement(const std::string &seq);

class KmerCodec
{
public:
  KmerCodec(const size_t k, const Alphabet alphabet);

  size_t k() const { return _k; }
  Alphabet alphabet() const { return _alphabet; }
  bool is_protein() const { return _alphabet == Alphabet::Protein; }
  unsigned int bits_per_symbol() const { return _bits; }
  size_t alphabet_size() const { return _symbols.size(); }
  uint64_t mask() const { return _mask; }

  // Symbol to code, or invalid_symbol
  int symbol_code(const char c) const { return _lookup[static_cast<unsigned char>(c)]; }

  // Canonical key of a window of exactly k symbols.
  // Throws InvalidSymbolError
  uint64_t encode(const std::string &window) const;
  // Symbols of the (forward) key
  std::string decode(const uint64_t key) const;

  uint64_t reverse_complement(const uint64_t fwd) const;
  uint64_t canonical(const uint64_t fwd) const
  {
    if (is_protein())
    {
      return fwd;
    }
    const uint64_t rc = reverse_complement(fwd);
    return rc < fwd ? rc : fwd;
  }

  // All one-symbol extensions to the right and left of key, canonicalised.
  // Existence in a graph is not checked here
  void extensions(const uint64_t key, std::vector<uint64_t> &out) const;

private:
  size_t _k;
  Alphabet _alphabet;
  unsigned int _bits;
  uint64_t _mask;
  std::string _symbols;
  std::array<int, 256> _lookup;
};

// Rolling encoder over a sequence. Windows containing a symbol outside the
// alphabet are skipped, the encoder restarts after the bad symbol
class KmerIterator
{
public:
  KmerIterator(const KmerCodec &codec, const std::string &seq);

  // Move to the next valid window. False once the sequence is exhausted
  bool next();

  uint64_t key() const { return _codec.canonical(_fwd); }
  uint64_t forward() const { return _fwd; }
  // Start of the current window in the sequence
  size_t position() const { return _pos - _codec.k(); }
  size_t invalid_symbols() const { return _invalid; }

private:
  const KmerCodec &_codec;
  const std::string &_seq;
  size_t _pos; // next symbol to read
  size_t _run; // valid symbols since the last invalid one
  size_t _invalid;
  uint64_t _fwd;
};
