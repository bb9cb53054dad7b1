/*
 *
 * database.hpp
 * Header file for database.cpp
 *
 */
#pragma once

#include <cstdint>
#include <cstddef>
#include <vector>
#include <string>

#include <highfive/H5File.hpp>

#include "graph/kmer.hpp"
#include "sketch/minhash.hpp"

// Parameters fixed for a whole index. Two indexes can only be compared
// if these agree
struct IndexHeader
{
  std::string version;
  size_t sketch_size;
  uint64_t hash_modulus;
  size_t ksize;
  Alphabet alphabet;
  size_t tag_density;
};

// why is set to the first mismatch found
bool compatible(const IndexHeader &a, const IndexHeader &b, std::string &why);

// Write the whole index to filename.tmp, then rename it over filename.
// On any failure nothing is left at either path. Throws IOError
void save_index(const std::string &filename, const IndexHeader &header,
                const std::vector<NbhdSketch> &sketches);

// A saved index, opened read only
class Database
{
public:
  // Throws IOError if missing or unreadable
  Database(const std::string &filename);

  const std::string &filename() const { return _filename; }
  const IndexHeader &header() const { return _header; }
  size_t n_sketches() const { return _n_sketches; }

  std::vector<NbhdSketch> load_sketches();
  bool check_compatible(const Database &other, std::string &why) const
  {
    return compatible(_header, other._header, why);
  }

private:
  std::string _filename;
  HighFive::File _h5_file;
  IndexHeader _header;
  size_t _n_sketches;
};

HighFive::File open_h5(const std::string &filename, const bool write);
