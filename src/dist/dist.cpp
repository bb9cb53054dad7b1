/*
 *
 * dist.cpp
 * Similarity between neighborhood sketches
 *
 */

#include <cstdint>
#include <iostream>

#include <omp.h>

#include "dist.hpp"

#include "sketch/progress.hpp"

NumpyMatrix query_sketches(const std::vector<NbhdSketch> &ref_sketches,
                           const std::vector<NbhdSketch> &query_sketches,
                           const size_t sketch_size,
                           const size_t num_threads)
{
  std::cerr << "Comparing " << query_sketches.size() << " query against "
            << ref_sketches.size() << " reference neighborhoods using "
            << num_threads << " thread(s)" << std::endl;

  NumpyMatrix simMat(query_sketches.size(), ref_sketches.size());
  ProgressMeter dist_progress(query_sketches.size(), "Comparing");
  size_t done_count = 0;
#pragma omp parallel for schedule(dynamic, 5) num_threads(num_threads)
  for (size_t q_idx = 0; q_idx < query_sketches.size(); q_idx++)
  {
    for (size_t r_idx = 0; r_idx < ref_sketches.size(); r_idx++)
    {
      simMat(q_idx, r_idx) = static_cast<float>(
          jaccard(query_sketches[q_idx], ref_sketches[r_idx], sketch_size)
              .jaccard);
    }
#pragma omp atomic
    ++done_count;
    if (omp_get_thread_num() == 0)
    {
      dist_progress.tick_count(done_count);
    }
  }
  dist_progress.finalise();
  return (simMat);
}
