/*
 * api.cpp
 * Main functions for building and comparing neighborhood indexes
 *
 */

#include <cstdio>
#include <fstream>
#include <iostream>
#include <stdexcept>

#include <omp.h>
#include <sys/stat.h>

#include "api.hpp"
#include "dist/dist.hpp"
#include "errors.hpp"
#include "sketch/seqio.hpp"
#include "version.h"

void check_params(const BuildParams &params)
{
  if (params.tag_density == 0)
  {
    throw std::invalid_argument("Tag density must be at least 1");
  }
  if (params.sketch_size == 0)
  {
    throw std::invalid_argument("Sketch size must be at least 1");
  }
  if (params.hash_modulus < 2)
  {
    throw std::invalid_argument("Hash modulus must be at least 2");
  }
  if (params.n_tables == 0 || params.table_size < 2)
  {
    throw std::invalid_argument("Need at least one counting table of size > 1");
  }
  if (params.max_nbhd_size == 0)
  {
    throw std::invalid_argument("Maximum neighborhood size must be at least 1");
  }
  if (params.num_threads == 0 || params.batch_size == 0)
  {
    throw std::invalid_argument("Threads and batch size must be at least 1");
  }
}

TraversalBounds traversal_bounds(const BuildParams &params)
{
  TraversalBounds bounds;
  bounds.radius = params.radius > 0 ? params.radius
                                     : default_radius(params.tag_density);
  bounds.max_size = params.max_nbhd_size;
  bounds.min_abundance = params.min_abundance;
  return (bounds);
}

IndexHeader index_header(const BuildParams &params)
{
  IndexHeader header;
  header.version = NBHD_INDEX_VERSION;
  header.sketch_size = params.sketch_size;
  header.hash_modulus = params.hash_modulus;
  header.ksize = params.ksize;
  header.alphabet = params.alphabet;
  header.tag_density = params.tag_density;
  return (header);
}

std::string default_index_name(const std::string &seqfile)
{
  const size_t slash = seqfile.find_last_of('/');
  const std::string base =
      slash == std::string::npos ? seqfile : seqfile.substr(slash + 1);
  return (base + index_suffix);
}

size_t ingest_file(const std::string &seqfile, CountGraph &graph,
                   TagSet &tags, const size_t tag_density,
                   const size_t num_threads, const size_t batch_size)
{
  std::cerr << "Reading and tagging sequences from " << seqfile << " using "
            << num_threads << " thread(s)" << std::endl;

  SeqReader reader(seqfile);
  std::vector<SeqRecord> batch;
  size_t n_kmers = 0;
  while (reader.next_batch(batch, batch_size))
  {
    // Each record gets its own tag cursor, merged back in input order
    std::vector<std::vector<uint64_t>> batch_tags(batch.size());
#pragma omp parallel for schedule(dynamic, 1) num_threads(num_threads) reduction(+:n_kmers)
    for (size_t i = 0; i < batch.size(); i++)
    {
      n_kmers += graph.consume_and_tag(batch[i].seq, tag_density,
                                       batch_tags[i]);
    }
    for (size_t i = 0; i < batch.size(); i++)
    {
      if (batch[i].seq.size() < graph.ksize())
      {
        std::cerr << "NOTE: " << batch[i].name << " is shorter than k"
                  << std::endl;
      }
      tags.add(batch_tags[i]);
    }
    batch.clear();
    fprintf(stderr, "%cRead %zu sequences", 13, reader.n_records());
  }
  fprintf(stderr, "%cRead %zu sequences\n", 13, reader.n_records());

  std::cerr << "Counted " << n_kmers << " k-mers from "
            << reader.n_records() << " sequences (" << reader.n_bases()
            << " bases); " << tags.size() << " tags" << std::endl;
  if (graph.n_invalid_symbols() > 0)
  {
    std::cerr << "NOTE: skipped k-mers around " << graph.n_invalid_symbols()
              << " symbols outside the " << alphabet_name(graph.alphabet())
              << " alphabet" << std::endl;
  }
  return (n_kmers);
}

bool check_fp_rate(const CountGraph &graph, const double max_fp_rate)
{
  const double fp_rate = graph.estimated_fp_rate();
  std::cerr << "Estimated counting table false positive rate: " << fp_rate
            << std::endl;
  if (fp_rate > max_fp_rate)
  {
    std::cerr << "WARNING: counting tables are too small for this input "
                 "(false positive rate "
              << fp_rate << " > " << max_fp_rate
              << "); neighborhoods will be inflated. Increase --table-size"
              << std::endl;
    return true;
  }
  return false;
}

std::vector<NbhdSketch> sketch_graph(const CountGraph &graph,
                                     const TagSet &tags,
                                     const BuildParams &params)
{
  const TraversalBounds bounds = traversal_bounds(params);
  std::vector<Neighborhood> neighborhoods =
      partition_neighborhoods(graph, tags, bounds, params.num_threads);

  size_t n_partial = 0;
  for (auto nbhd_it = neighborhoods.cbegin(); nbhd_it != neighborhoods.cend();
       ++nbhd_it)
  {
    if (nbhd_it->partial)
    {
      n_partial++;
    }
  }
  if (n_partial > 0)
  {
    std::cerr << "WARNING: " << n_partial << " neighborhoods reached the size "
              << "cap of " << bounds.max_size
              << " k-mers and were truncated" << std::endl;
  }

  return (sketch_neighborhoods(neighborhoods, params.sketch_size,
                               params.hash_modulus, params.num_threads));
}

std::vector<NbhdSketch> build_index(const std::string &seqfile,
                                    const std::string &index_file,
                                    const BuildParams &params)
{
  check_params(params);

  std::cerr << "Allocating " << params.n_tables << " counting table(s) of "
            << params.table_size << " bytes" << std::endl;
  CountGraph graph(params.ksize, params.alphabet, params.table_size,
                   params.n_tables);
  TagSet tags;

  ingest_file(seqfile, graph, tags, params.tag_density, params.num_threads,
              params.batch_size);
  check_fp_rate(graph, params.max_fp_rate);

  std::vector<NbhdSketch> sketches = sketch_graph(graph, tags, params);

  std::cerr << "Writing " << sketches.size() << " sketches to " << index_file
            << std::endl;
  save_index(index_file, index_header(params), sketches);
  return (sketches);
}

bool same_file(const std::string &a, const std::string &b)
{
  struct stat a_stat, b_stat;
  if (stat(a.c_str(), &a_stat) != 0 || stat(b.c_str(), &b_stat) != 0)
  {
    return (a == b);
  }
  return (a_stat.st_dev == b_stat.st_dev && a_stat.st_ino == b_stat.st_ino);
}

std::vector<SimilarityHit> compare_indexes(const std::string &query_file,
                                           const std::string &ref_file,
                                           const float min_jaccard,
                                           const size_t num_threads)
{
  Database query_db(query_file);
  Database ref_db(ref_file);
  std::string why;
  if (!query_db.check_compatible(ref_db, why))
  {
    throw std::runtime_error("Cannot compare " + query_file + " with " +
                             ref_file + ": " + why);
  }

  std::vector<NbhdSketch> query = query_db.load_sketches();
  std::vector<NbhdSketch> ref = ref_db.load_sketches();
  const size_t sketch_size = query_db.header().sketch_size;
  NumpyMatrix simMat = query_sketches(ref, query, sketch_size, num_threads);

  // Same index both sides: each pair once, no self hits
  const bool self = same_file(query_file, ref_file);
  sparse_coo hits_coo =
      sparsify_by_threshold(simMat, min_jaccard, self, num_threads);

  const std::vector<long> &rows = std::get<0>(hits_coo);
  const std::vector<long> &cols = std::get<1>(hits_coo);
  const std::vector<float> &values = std::get<2>(hits_coo);
  std::vector<SimilarityHit> hits(values.size());
  for (size_t i = 0; i < values.size(); i++)
  {
    hits[i].query_tag = query[rows[i]].tag();
    hits[i].ref_tag = ref[cols[i]].tag();
    hits[i].jaccard = values[i];
    hits[i].undersized = query[rows[i]].undersized(sketch_size) ||
                         ref[cols[i]].undersized(sketch_size);
  }
  return (hits);
}

void write_hits(const std::vector<SimilarityHit> &hits,
                const std::string &output)
{
  std::ofstream outfile;
  if (output != "-")
  {
    outfile.open(output);
    if (!outfile)
    {
      throw IOError("Could not open " + output + " for writing");
    }
  }
  std::ostream &out = output == "-" ? std::cout : outfile;
  out << "query_tag\tref_tag\tjaccard\tundersized" << std::endl;
  for (auto hit_it = hits.cbegin(); hit_it != hits.cend(); ++hit_it)
  {
    out << hit_it->query_tag << "\t" << hit_it->ref_tag << "\t"
        << hit_it->jaccard << "\t" << (hit_it->undersized ? 1 : 0) << "\n";
  }
  out.flush();
  if (!out)
  {
    throw IOError("Error writing to " + output);
  }
}
