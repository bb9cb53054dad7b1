/*
 *
 * bitfuncs.hpp
 * inline functions for bit manipulation
 *
 */
#pragma once

#include <cstdint>

#define NBITS(x) (8 * sizeof(x))
#define MIN(a, b) ((a) < (b) ? (a) : (b))
#define MAX(a, b) ((a) > (b) ? (a) : (b))

// Lowest n bits on. n may be the full word width
inline uint64_t low_mask(const unsigned int n)
{
  return n >= NBITS(uint64_t) ? ~0ULL : ((1ULL << n) - 1ULL);
}

// Finaliser from MurmurHash3 (public domain). A bijection on 64-bit words
inline uint64_t fmix64(uint64_t k)
{
  k ^= k >> 33;
  k *= 0xff51afd7ed558ccdULL;
  k ^= k >> 33;
  k *= 0xc4ceb9fe1a85ec53ULL;
  k ^= k >> 33;
  return k;
}
