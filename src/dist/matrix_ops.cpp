/*
 *
 * matrix_ops.cpp
 * Similarity matrix transformations
 *
 */
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <omp.h>
#include <stdexcept>
#include <vector>

#include "matrix.hpp"

template <typename T>
std::vector<T> combine_vectors(const std::vector<std::vector<T>> &vec,
                               const size_t len) {
  std::vector<T> all(len);
  auto all_it = all.begin();
  for (size_t i = 0; i < vec.size(); ++i) {
    std::copy(vec[i].cbegin(), vec[i].cend(), all_it);
    all_it += vec[i].size();
  }
  return all;
}

sparse_coo sparsify_by_threshold(const NumpyMatrix &denseMat,
                                 const float min_value,
                                 const bool upper_only,
                                 const size_t num_threads) {
  if (min_value < 0 || min_value > 1) {
    throw std::runtime_error("Similarity threshold must be between 0 and 1");
  }

  // Parallelisation parameter
  size_t len = 0;

  // ijv vectors, one per row
  std::vector<std::vector<float>> values(denseMat.rows());
  std::vector<std::vector<long>> i_vec(denseMat.rows());
  std::vector<std::vector<long>> j_vec(denseMat.rows());
#pragma omp parallel for schedule(static) num_threads(num_threads) reduction(+:len)
  for (long i = 0; i < denseMat.rows(); i++) {
    for (long j = upper_only ? i + 1 : 0; j < denseMat.cols(); j++) {
      if (denseMat(i, j) >= min_value) {
        values[i].push_back(denseMat(i, j));
        i_vec[i].push_back(i);
        j_vec[i].push_back(j);
      }
    }
    len += i_vec[i].size();
  }
  std::vector<float> values_all = combine_vectors(values, len);
  std::vector<long> i_vec_all = combine_vectors(i_vec, len);
  std::vector<long> j_vec_all = combine_vectors(j_vec, len);
  return (std::make_tuple(i_vec_all, j_vec_all, values_all));
}
