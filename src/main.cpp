/*
 *
 * main.cpp
 * nbhd-sketch command line: build and compare neighborhood indexes
 *
 */

#include <cstdint>
#include <iostream>
#include <string>

#include <CLI/CLI.hpp>

#include "api.hpp"
#include "version.h"

int main(int argc, char *argv[])
{
  CLI::App app{"Neighborhood MinHash index of sequence collections"};
  app.require_subcommand(1);
  app.set_version_flag("--version", std::string(NBHD_INDEX_VERSION));

  // build
  std::string seqfile, index_file;
  BuildParams params;
  size_t ksize = 0;
  bool protein = false;
  unsigned int min_abundance = def_min_abundance;
  CLI::App *build = app.add_subcommand(
      "build", "Count, tag and partition a sequence file, then sketch each "
               "neighborhood");
  build->add_option("seqfile", seqfile, "FASTA/FASTQ input, optionally gzipped")
      ->required();
  build->add_option("-o,--output", index_file,
                    "Index to write (default: basename of seqfile + " +
                        index_suffix + ")");
  build->add_option("-k,--ksize", ksize,
                    "k-mer length (default: " + std::to_string(def_dna_ksize) +
                        ", or " + std::to_string(def_protein_ksize) +
                        " with --protein)");
  build->add_flag("--protein", protein, "Input is amino acid sequence");
  build->add_option("--tag-density", params.tag_density,
                    "k-mers between tags along each sequence")
      ->capture_default_str()
      ->check(CLI::PositiveNumber);
  build->add_option("--table-size", params.table_size,
                    "Size of each counting table")
      ->capture_default_str();
  build->add_option("--n-tables", params.n_tables, "Number of counting tables")
      ->capture_default_str()
      ->check(CLI::PositiveNumber);
  build->add_option("--sketch-size", params.sketch_size,
                    "Hashes kept per neighborhood")
      ->capture_default_str()
      ->check(CLI::PositiveNumber);
  build->add_option("--hash-modulus", params.hash_modulus,
                    "Prime modulus applied to k-mer hashes")
      ->capture_default_str();
  build->add_option("--radius", params.radius,
                    "Maximum traversal depth from a tag (default: tag density "
                    "- 1)");
  build->add_option("--max-nbhd-size", params.max_nbhd_size,
                    "Hard cap on k-mers in one neighborhood")
      ->capture_default_str()
      ->check(CLI::PositiveNumber);
  build->add_option("--min-abundance", min_abundance,
                    "Only traverse k-mers seen more than this many times")
      ->capture_default_str()
      ->check(CLI::Range(0, 254));
  build->add_option("--max-fp-rate", params.max_fp_rate,
                    "Warn when the counting tables exceed this false "
                    "positive rate")
      ->capture_default_str();
  build->add_option("--threads", params.num_threads, "Number of threads")
      ->capture_default_str()
      ->check(CLI::PositiveNumber);

  // compare
  std::string query_index, ref_index, hits_file = "-";
  float min_jaccard = 0.2;
  size_t compare_threads = 1;
  CLI::App *compare = app.add_subcommand(
      "compare", "Similar neighborhoods between two indexes");
  compare->add_option("query", query_index, "Query index")->required();
  compare->add_option("ref", ref_index, "Reference index")->required();
  compare->add_option("-o,--output", hits_file, "Output table ('-' for stdout)")
      ->capture_default_str();
  compare->add_option("--threshold", min_jaccard,
                      "Minimum Jaccard similarity to report")
      ->capture_default_str()
      ->check(CLI::Range(0.0, 1.0));
  compare->add_option("--threads", compare_threads, "Number of threads")
      ->capture_default_str()
      ->check(CLI::PositiveNumber);

  CLI11_PARSE(app, argc, argv);

  try
  {
    if (*build)
    {
      params.alphabet = protein ? Alphabet::Protein : Alphabet::DNA;
      if (ksize > 0)
      {
        params.ksize = ksize;
      }
      else
      {
        params.ksize = protein ? def_protein_ksize : def_dna_ksize;
      }
      params.min_abundance = static_cast<uint8_t>(min_abundance);
      if (index_file.empty())
      {
        index_file = default_index_name(seqfile);
      }

      std::cerr << "Loading sequences from " << seqfile << std::endl;
      std::cerr << "Will save MinHash index to " << index_file << std::endl;
      build_index(seqfile, index_file, params);
      std::cerr << "Done! Index saved to " << index_file << std::endl;
    }
    else if (*compare)
    {
      std::vector<SimilarityHit> hits = compare_indexes(
          query_index, ref_index, min_jaccard, compare_threads);
      write_hits(hits, hits_file);
      std::cerr << hits.size() << " neighborhood pairs with Jaccard >= "
                << min_jaccard << std::endl;
    }
  }
  catch (const std::exception &e)
  {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
