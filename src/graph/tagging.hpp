/*
 *
 * tagging.hpp
 * Sparse, position based tagging of graph nodes
 *
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "robin_hood.h"

// Running position counter for one sequence. The first k-mer is tagged,
// then one k-mer every `density` k-mers consumed
class TagCursor
{
public:
  TagCursor(const size_t density);

  // Call once per consumed k-mer, in sequence order
  bool maybe_tag()
  {
    bool tag = false;
    if (_since_tag >= _density)
    {
      tag = true;
      _since_tag = 0;
    }
    _since_tag++;
    return tag;
  }

  size_t density() const { return _density; }

private:
  size_t _density;
  size_t _since_tag;
};

// Tags in the order they were first seen
class TagSet
{
public:
  TagSet() {}

  bool add(const uint64_t key)
  {
    if (_seen.insert(key).second)
    {
      _order.push_back(key);
      return true;
    }
    return false;
  }
  void add(const std::vector<uint64_t> &keys);

  bool contains(const uint64_t key) const { return _seen.count(key) > 0; }
  size_t size() const { return _order.size(); }
  bool empty() const { return _order.empty(); }
  const std::vector<uint64_t> &tags() const { return _order; }

  std::vector<uint64_t>::const_iterator begin() const { return _order.cbegin(); }
  std::vector<uint64_t>::const_iterator end() const { return _order.cend(); }

  friend bool operator==(TagSet const &a, TagSet const &b)
  {
    return a._order == b._order;
  }

private:
  std::vector<uint64_t> _order;
  robin_hood::unordered_flat_set<uint64_t> _seen;
};
