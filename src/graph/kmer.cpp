/*
 *
 * kmer.cpp
 * Encoding of k-mers into fixed width integer keys
 *
 */

#include "kmer.hpp"

#include <algorithm>
#include <stdexcept>

#include "sketch/bitfuncs.hpp"

const std::string dna_symbols = "ACGT";
const std::string protein_symbols = "ACDEFGHIKLMNPQRSTVWY";

std::string alphabet_name(const Alphabet alphabet)
{
  return (alphabet == Alphabet::Protein ? "protein" : "dna");
}

Alphabet alphabet_from_name(const std::string &name)
{
  if (name == "dna")
  {
    return Alphabet::DNA;
  }
  else if (name == "protein")
  {
    return Alphabet::Protein;
  }
  throw std::runtime_error("Unknown alphabet " + name);
}

char complement_base(const char c)
{
  switch (c)
  {
  case 'A':
  case 'a':
    return 'T';
  case 'C':
  case 'c':
    return 'G';
  case 'G':
  case 'g':
    return 'C';
  case 'T':
  case 't':
  case 'U':
  case 'u':
    return 'A';
  default:
    return 'N';
  }
}

std::string reverse_complement(const std::string &seq)
{
  std::string rc(seq.size(), 'N');
  std::transform(seq.crbegin(), seq.crend(), rc.begin(), complement_base);
  return (rc);
}

KmerCodec::KmerCodec(const size_t k, const Alphabet alphabet)
    : _k(k), _alphabet(alphabet)
{
  if (_alphabet == Alphabet::Protein)
  {
    _bits = 5;
    _symbols = protein_symbols;
  }
  else
  {
    _bits = 2;
    _symbols = dna_symbols;
  }
  const size_t max_k = is_protein() ? max_protein_k : max_dna_k;
  if (_k < 1 || _k > max_k)
  {
    throw std::invalid_argument("k-mer length must be between 1 and " +
                                std::to_string(max_k) + " for " +
                                alphabet_name(_alphabet) + " sequence");
  }
  _mask = low_mask(_k * _bits);

  _lookup.fill(invalid_symbol);
  for (size_t code = 0; code < _symbols.size(); code++)
  {
    const char upper = _symbols[code];
    _lookup[static_cast<unsigned char>(upper)] = code;
    _lookup[static_cast<unsigned char>(upper | 0x20)] = code;
  }
  if (!is_protein())
  {
    // RNA input
    _lookup['U'] = _lookup['T'];
    _lookup['u'] = _lookup['T'];
  }
}

uint64_t KmerCodec::encode(const std::string &window) const
{
  if (window.size() != _k)
  {
    throw std::invalid_argument("Window of length " +
                                std::to_string(window.size()) +
                                " given to encoder for k=" + std::to_string(_k));
  }
  uint64_t fwd = 0;
  for (size_t i = 0; i < window.size(); i++)
  {
    const int code = symbol_code(window[i]);
    if (code == invalid_symbol)
    {
      throw InvalidSymbolError(window[i], i);
    }
    fwd = (fwd << _bits) | static_cast<uint64_t>(code);
  }
  return (canonical(fwd));
}

std::string KmerCodec::decode(const uint64_t key) const
{
  std::string kmer(_k, 'N');
  const uint64_t symbol_mask = low_mask(_bits);
  for (size_t i = 0; i < _k; i++)
  {
    const unsigned int shift = (_k - 1 - i) * _bits;
    kmer[i] = _symbols[(key >> shift) & symbol_mask];
  }
  return (kmer);
}

uint64_t KmerCodec::reverse_complement(const uint64_t fwd) const
{
  // Complement is 3 - x in the 2-bit code, then reverse the 2-bit groups
  uint64_t rc = ~fwd;
  rc = ((rc >> 2) & 0x3333333333333333ULL) | ((rc & 0x3333333333333333ULL) << 2);
  rc = ((rc >> 4) & 0x0F0F0F0F0F0F0F0FULL) | ((rc & 0x0F0F0F0F0F0F0F0FULL) << 4);
  rc = ((rc >> 8) & 0x00FF00FF00FF00FFULL) | ((rc & 0x00FF00FF00FF00FFULL) << 8);
  rc = ((rc >> 16) & 0x0000FFFF0000FFFFULL) | ((rc & 0x0000FFFF0000FFFFULL) << 16);
  rc = (rc >> 32) | (rc << 32);
  return ((rc >> (NBITS(uint64_t) - 2 * _k)) & _mask);
}

void KmerCodec::extensions(const uint64_t key, std::vector<uint64_t> &out) const
{
  out.clear();
  const unsigned int top_shift = (_k - 1) * _bits;
  for (uint64_t code = 0; code < _symbols.size(); code++)
  {
    out.push_back(canonical(((key << _bits) | code) & _mask));
    out.push_back(canonical((key >> _bits) | (code << top_shift)));
  }
}

KmerIterator::KmerIterator(const KmerCodec &codec, const std::string &seq)
    : _codec(codec), _seq(seq), _pos(0), _run(0), _invalid(0), _fwd(0) {}

bool KmerIterator::next()
{
  const unsigned int bits = _codec.bits_per_symbol();
  while (_pos < _seq.size())
  {
    const int code = _codec.symbol_code(_seq[_pos++]);
    if (code == invalid_symbol)
    {
      _run = 0;
      _invalid++;
      continue;
    }
    _fwd = ((_fwd << bits) | static_cast<uint64_t>(code)) & _codec.mask();
    if (++_run >= _codec.k())
    {
      return true;
    }
  }
  return false;
}
