/*
 *
 * seqio.cpp
 * Sequence reader
 *
 */

#include "seqio.hpp"

#include <zlib.h>
#include <stdio.h>
#include <string.h>
#include <stdint.h>
#include "kseq.h"
KSEQ_INIT(gzFile, gzread)

// C++ headers
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <utility>

#include "errors.hpp"

// code from
// https://stackoverflow.com/questions/735204/convert-a-string-in-c-to-upper-case
char ascii_toupper_char(char c) {
  return ('a' <= c && c <= 'z')
             ? c ^ 0x20
             : c; // ^ autovectorizes to PXOR: runs on more ports than paddb
}

struct SeqReader::KseqState {
  gzFile fp;
  kseq_t *seq;

  KseqState(gzFile fp_in) : fp(fp_in), seq(kseq_init(fp_in)) {}
  ~KseqState() {
    kseq_destroy(seq);
    gzclose(fp);
  }
};

SeqReader::SeqReader(const std::string &filename)
    : _filename(filename), _n_records(0), _n_bases(0), _reads(false) {
  // from kseq.h
  gzFile fp = gzopen(filename.c_str(), "r");
  if (fp == nullptr) {
    throw IOError("Could not open " + filename + ": " + strerror(errno));
  }
  _state.reset(new KseqState(fp));
}

// KseqState is complete here
SeqReader::~SeqReader() {}

bool SeqReader::next(SeqRecord &record) {
  kseq_t *seq = _state->seq;
  const int l = kseq_read(seq);
  if (l == -1) {
    return false;
  } else if (l < -1) {
    throw IOError("Truncated or malformed record after " +
                  std::to_string(_n_records) + " records in " + _filename);
  }

  record.name.assign(seq->name.s, seq->name.l);
  record.seq.assign(seq->seq.s, seq->seq.l);
  for (char &c : record.seq) {
    c = ascii_toupper_char(c);
  }

  // Presence of any quality scores - assume reads as input
  if (!_reads && seq->qual.l) {
    _reads = true;
  }
  _n_records++;
  _n_bases += record.seq.size();
  return true;
}

bool SeqReader::next_batch(std::vector<SeqRecord> &batch,
                           const size_t max_records) {
  const size_t start_size = batch.size();
  SeqRecord record;
  while (batch.size() - start_size < max_records && next(record)) {
    batch.push_back(std::move(record));
  }
  return batch.size() > start_size;
}
