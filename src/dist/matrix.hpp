/*
 *
 * matrix.hpp
 * functions in matrix_ops.cpp
 *
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include <Eigen/Dense>

#include "matrix_types.hpp"

using NumpyMatrix =
    Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

// Entries >= min_value as (row, col, value). With upper_only only
// entries above the diagonal are kept
sparse_coo sparsify_by_threshold(const NumpyMatrix &denseMat,
                                 const float min_value,
                                 const bool upper_only,
                                 const size_t num_threads);
