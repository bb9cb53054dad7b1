/*
 * File: database.cpp
 *
 * Interface between neighborhood sketches and HDF5 store
 *
 */

#include <cstdio>
#include <iostream>
#include <utility>

#include <sys/stat.h>

#include "database.hpp"
#include "hdf5_funcs.hpp"
#include "errors.hpp"
#include "version.h"

#include <highfive/H5Exception.hpp>

const std::string index_group_name = "index";

inline bool file_exists(const std::string &name)
{
  struct stat buffer;
  return (stat(name.c_str(), &buffer) == 0);
}

bool compatible(const IndexHeader &a, const IndexHeader &b, std::string &why)
{
  if (a.sketch_size != b.sketch_size)
  {
    why = "sketch sizes differ (" + std::to_string(a.sketch_size) + " vs " +
          std::to_string(b.sketch_size) + ")";
  }
  else if (a.hash_modulus != b.hash_modulus)
  {
    why = "hash moduli differ (" + std::to_string(a.hash_modulus) + " vs " +
          std::to_string(b.hash_modulus) + ")";
  }
  else if (a.ksize != b.ksize)
  {
    why = "k-mer lengths differ (" + std::to_string(a.ksize) + " vs " +
          std::to_string(b.ksize) + ")";
  }
  else if (a.alphabet != b.alphabet)
  {
    why = "alphabets differ (" + alphabet_name(a.alphabet) + " vs " +
          alphabet_name(b.alphabet) + ")";
  }
  else
  {
    why.clear();
    return true;
  }
  return false;
}

void write_index_h5(const std::string &filename, const IndexHeader &header,
                    const std::vector<NbhdSketch> &sketches)
{
  HighFive::File h5_file = HighFive::File(filename.c_str(),
                                          HighFive::File::Overwrite);
  HighFive::Group index_group = h5_file.createGroup(index_group_name);

  save_attribute<std::string>(index_group, "index_version", header.version);
  save_attribute<size_t>(index_group, "sketch_size", header.sketch_size);
  save_attribute<uint64_t>(index_group, "hash_modulus", header.hash_modulus);
  save_attribute<size_t>(index_group, "ksize", header.ksize);
  save_attribute<std::string>(index_group, "alphabet",
                              alphabet_name(header.alphabet));
  save_attribute<size_t>(index_group, "tag_density", header.tag_density);
  save_attribute<size_t>(index_group, "n_sketches", sketches.size());

  if (sketches.empty())
  {
    return;
  }

  // Sketches are stored flattened, each prefixed by its length
  std::vector<uint64_t> tags, lengths, n_kmers, hashes;
  std::vector<uint8_t> partial;
  for (auto sketch_it = sketches.cbegin(); sketch_it != sketches.cend();
       ++sketch_it)
  {
    tags.push_back(sketch_it->tag());
    lengths.push_back(sketch_it->size());
    n_kmers.push_back(sketch_it->n_kmers());
    partial.push_back(sketch_it->partial() ? 1 : 0);
    hashes.insert(hashes.end(), sketch_it->mins().cbegin(),
                  sketch_it->mins().cend());
  }
  save_vector(index_group, "tags", tags);
  save_vector(index_group, "lengths", lengths);
  save_vector(index_group, "hashes", hashes);
  save_vector(index_group, "n_kmers", n_kmers);
  save_vector(index_group, "partial", partial);
}

void save_index(const std::string &filename, const IndexHeader &header,
                const std::vector<NbhdSketch> &sketches)
{
  const std::string tmp_filename = filename + ".tmp";
  try
  {
    // File is closed when this returns
    write_index_h5(tmp_filename, header, sketches);
  }
  catch (const HighFive::Exception &e)
  {
    std::remove(tmp_filename.c_str());
    throw IOError("Could not write index to " + tmp_filename + ": " + e.what());
  }

  if (std::rename(tmp_filename.c_str(), filename.c_str()) != 0)
  {
    std::remove(tmp_filename.c_str());
    throw IOError("Could not move index into place at " + filename);
  }
}

HighFive::File open_index(const std::string &filename)
{
  if (!file_exists(filename))
  {
    throw IOError("Index " + filename + " does not exist");
  }
  try
  {
    return (open_h5(filename, false));
  }
  catch (const HighFive::Exception &e)
  {
    throw IOError("Could not open index " + filename + ": " + e.what());
  }
}

// Open an existing file
Database::Database(const std::string &filename)
    : _filename(filename), _h5_file(open_index(filename))
{
  try
  {
    if (!_h5_file.exist(index_group_name))
    {
      throw IOError(filename + " is not a neighborhood sketch index");
    }
    HighFive::Group index_group = _h5_file.getGroup(index_group_name);
    _header.version = load_attribute<std::string>(index_group, "index_version");
    _header.sketch_size = load_attribute<size_t>(index_group, "sketch_size");
    _header.hash_modulus = load_attribute<uint64_t>(index_group, "hash_modulus");
    _header.ksize = load_attribute<size_t>(index_group, "ksize");
    _header.alphabet = alphabet_from_name(
        load_attribute<std::string>(index_group, "alphabet"));
    _header.tag_density = load_attribute<size_t>(index_group, "tag_density",
                                                 0);
    _n_sketches = load_attribute<size_t>(index_group, "n_sketches");
  }
  catch (const HighFive::Exception &e)
  {
    throw IOError("Could not read index header from " + filename + ": " +
                  e.what());
  }

  if (_header.version != NBHD_INDEX_VERSION)
  {
    std::cerr << "NOTE: " << filename << " was written by version "
              << _header.version << ", this is " << NBHD_INDEX_VERSION
              << std::endl;
  }
}

std::vector<NbhdSketch> Database::load_sketches()
{
  std::vector<NbhdSketch> sketches;
  if (_n_sketches == 0)
  {
    return (sketches);
  }

  std::vector<uint64_t> tags, lengths, n_kmers, hashes;
  std::vector<uint8_t> partial;
  try
  {
    HighFive::Group index_group = _h5_file.getGroup(index_group_name);
    tags = load_vector<uint64_t>(index_group, "tags");
    lengths = load_vector<uint64_t>(index_group, "lengths");
    hashes = load_vector<uint64_t>(index_group, "hashes");
    n_kmers = load_vector<uint64_t>(index_group, "n_kmers");
    partial = load_vector<uint8_t>(index_group, "partial");
  }
  catch (const HighFive::Exception &e)
  {
    throw IOError("Could not read sketches from " + _filename + ": " +
                  e.what());
  }

  if (tags.size() != _n_sketches || lengths.size() != _n_sketches ||
      n_kmers.size() != _n_sketches || partial.size() != _n_sketches)
  {
    throw IOError("Sketch count mismatch in " + _filename);
  }

  sketches.reserve(_n_sketches);
  auto hash_it = hashes.cbegin();
  for (size_t i = 0; i < _n_sketches; i++)
  {
    if (lengths[i] > _header.sketch_size ||
        static_cast<size_t>(hashes.cend() - hash_it) < lengths[i])
    {
      throw IOError("Corrupt sketch lengths in " + _filename);
    }
    std::vector<uint64_t> mins(hash_it, hash_it + lengths[i]);
    hash_it += lengths[i];
    sketches.push_back(NbhdSketch(tags[i], mins, n_kmers[i], partial[i] != 0));
  }
  if (hash_it != hashes.cend())
  {
    throw IOError("Trailing sketch values in " + _filename);
  }
  return (sketches);
}

HighFive::File open_h5(const std::string &filename, const bool write)
{
  return (HighFive::File(filename.c_str(),
          write ? HighFive::File::ReadWrite : HighFive::File::ReadOnly));
}
