/*
 *
 * api.hpp
 * main functions for building and comparing neighborhood indexes
 *
 */
#pragma once

#include <vector>
#include <cstdint>
#include <cstddef>
#include <string>

#include "graph/countgraph.hpp"
#include "graph/tagging.hpp"
#include "partition/neighborhood.hpp"
#include "sketch/minhash.hpp"
#include "database/database.hpp"

const size_t def_dna_ksize = 32;
const size_t def_protein_ksize = max_protein_k;
const size_t def_tag_density = 200;
const double def_max_fp_rate = 0.2;
const size_t def_batch_size = 1000; // records read before each parallel consume
const std::string index_suffix = ".mhi";

struct BuildParams
{
  size_t ksize = def_dna_ksize;
  Alphabet alphabet = Alphabet::DNA;
  uint64_t table_size = def_table_size;
  size_t n_tables = def_n_tables;
  size_t tag_density = def_tag_density;
  size_t radius = 0; // 0: one less than the tag density
  size_t max_nbhd_size = def_max_nbhd_size;
  uint8_t min_abundance = def_min_abundance;
  size_t sketch_size = def_sketch_size;
  uint64_t hash_modulus = def_hash_modulus;
  double max_fp_rate = def_max_fp_rate;
  size_t num_threads = 1;
  size_t batch_size = def_batch_size;
};

// Throws std::invalid_argument on unusable parameters
void check_params(const BuildParams &params);
TraversalBounds traversal_bounds(const BuildParams &params);
IndexHeader index_header(const BuildParams &params);

// basename(seqfile) + index_suffix
std::string default_index_name(const std::string &seqfile);

// Count and tag every record of seqfile. Tags are added in record order
// whatever the number of threads
size_t ingest_file(const std::string &seqfile, CountGraph &graph,
                   TagSet &tags, const size_t tag_density,
                   const size_t num_threads,
                   const size_t batch_size = def_batch_size);

// Warn on stderr if the counting tables are too full. True if warned
bool check_fp_rate(const CountGraph &graph, const double max_fp_rate);

// Partition a fully ingested graph and sketch every neighborhood
std::vector<NbhdSketch> sketch_graph(const CountGraph &graph,
                                     const TagSet &tags,
                                     const BuildParams &params);

// Whole pipeline for one sequence file. The index is written only once
// everything else has succeeded
std::vector<NbhdSketch> build_index(const std::string &seqfile,
                                    const std::string &index_file,
                                    const BuildParams &params);

struct SimilarityHit
{
  uint64_t query_tag;
  uint64_t ref_tag;
  float jaccard;
  bool undersized; // estimate from a sketch shorter than the sketch size
};

// True if both paths name the same file
bool same_file(const std::string &a, const std::string &b);

// All neighborhood pairs with Jaccard >= min_jaccard. Throws
// std::runtime_error if the indexes were built with different parameters
std::vector<SimilarityHit> compare_indexes(const std::string &query_file,
                                           const std::string &ref_file,
                                           const float min_jaccard,
                                           const size_t num_threads);

void write_hits(const std::vector<SimilarityHit> &hits,
                const std::string &output);
