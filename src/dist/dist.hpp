/*
 *
 * dist.hpp
 * Similarity between neighborhood sketches
 *
 */
#pragma once

#include <vector>
#include <cstdint>
#include <cstddef>

#include "matrix.hpp"
#include "sketch/minhash.hpp"

// Jaccard estimates, rows are queries and columns references
NumpyMatrix query_sketches(const std::vector<NbhdSketch> &ref_sketches,
                           const std::vector<NbhdSketch> &query_sketches,
                           const size_t sketch_size,
                           const size_t num_threads);
