/*
 *
 * tagging.cpp
 * Sparse, position based tagging of graph nodes
 *
 */

#include "tagging.hpp"

#include <stdexcept>

TagCursor::TagCursor(const size_t density)
    : _density(density), _since_tag(density)
{
  if (_density == 0)
  {
    throw std::invalid_argument("Tag density must be at least 1");
  }
}

void TagSet::add(const std::vector<uint64_t> &keys)
{
  for (auto key_it = keys.cbegin(); key_it != keys.cend(); ++key_it)
  {
    add(*key_it);
  }
}
