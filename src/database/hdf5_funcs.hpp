/*
 *
 * hdf5_funcs.hpp
 * Special functions for reading/writing to HDF5
 *
 */
#pragma once

#include <string>
#include <vector>

#include <highfive/H5File.hpp>
#include <highfive/H5Group.hpp>
#include <highfive/H5DataSet.hpp>
#include <highfive/H5DataSpace.hpp>

// Write a scalar or vector as an attribute of a group
template <typename T>
void save_attribute(HighFive::Group &group, const std::string &name,
                    const T &value)
{
  HighFive::Attribute attr =
      group.createAttribute<T>(name, HighFive::DataSpace::From(value));
  attr.write(value);
}

template <typename T>
T load_attribute(const HighFive::Group &group, const std::string &name)
{
  T value;
  group.getAttribute(name).read(value);
  return (value);
}

// Attribute which older files may not have
template <typename T>
T load_attribute(const HighFive::Group &group, const std::string &name,
                 const T &default_value)
{
  std::vector<std::string> attributes_keys = group.listAttributeNames();
  for (const auto &attr : attributes_keys)
  {
    if (attr == name)
    {
      return (load_attribute<T>(group, name));
    }
  }
  return (default_value);
}

template <typename T>
void save_vector(HighFive::Group &group, const std::string &dataset_name,
                 const std::vector<T> &values)
{
  HighFive::DataSet dataset = group.createDataSet<T>(
      dataset_name, HighFive::DataSpace::From(values));
  dataset.write(values);
}

template <typename T>
std::vector<T> load_vector(const HighFive::Group &group,
                           const std::string &dataset_name)
{
  std::vector<T> values;
  group.getDataSet(dataset_name).read(values);
  return (values);
}
