#pragma once

// Compound types used by many functions in api and dist

#include <vector>
#include <tuple>

using sparse_coo = std::tuple<std::vector<long>, std::vector<long>, std::vector<float>>;
