/*
 *
 * seqio.hpp
 * Sequence reader
 *
 */
#pragma once

// C/C++/C++11/C++17 headers
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

struct SeqRecord
{
  std::string name;
  std::string seq;
};

// Reads fasta/fastq records one at a time, gzipped or not.
// Not restartable, open a new reader to read the file again
class SeqReader
{
public:
  // Throws IOError if the file cannot be opened
  SeqReader(const std::string &filename);
  ~SeqReader();

  SeqReader(const SeqReader &) = delete;
  SeqReader &operator=(const SeqReader &) = delete;

  // False at end of file. Throws IOError on a truncated record
  bool next(SeqRecord &record);
  // Up to max_records records appended to batch. False if none were read
  bool next_batch(std::vector<SeqRecord> &batch, const size_t max_records);

  const std::string &filename() const { return _filename; }
  size_t n_records() const { return _n_records; }
  size_t n_bases() const { return _n_bases; }
  bool is_reads() const { return _reads; }

private:
  // gzFile and kseq_t, which kseq.h only defines inside seqio.cpp
  struct KseqState;

  std::string _filename;
  std::unique_ptr<KseqState> _state;
  size_t _n_records;
  size_t _n_bases;
  bool _reads;
};
