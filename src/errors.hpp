/*
 *
 * errors.hpp
 * Exception types reported by the library
 *
 */
#pragma once

#include <stdexcept>
#include <string>

// A symbol outside the declared alphabet
class InvalidSymbolError : public std::runtime_error
{
public:
  InvalidSymbolError(const char symbol, const size_t position)
      : std::runtime_error("Invalid symbol '" + std::string(1, symbol) +
                           "' at position " + std::to_string(position)),
        _symbol(symbol), _position(position) {}

  char symbol() const { return _symbol; }
  size_t position() const { return _position; }

private:
  char _symbol;
  size_t _position;
};

// Input unreadable or output unwritable. Always fatal
class IOError : public std::runtime_error
{
public:
  explicit IOError(const std::string &what) : std::runtime_error(what) {}
};
