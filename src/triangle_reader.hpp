#pragma once

#include <cstddef>
#include <optional>

#include "triangle.hpp"

// Pull-based sequence of unindexed triangles decoded from a borrowed std::istream.
// Not restartable: once next() has returned std::nullopt or thrown, every later call returns std::nullopt.
class Triangle_Reader {
public:
  Triangle_Reader() = default;
  Triangle_Reader(const Triangle_Reader &) = delete;
  Triangle_Reader &operator=(const Triangle_Reader &) = delete;
  virtual ~Triangle_Reader() = default;

  // Throws a StlBox_Error subclass on malformed or truncated input, Io_Error if the stream itself fails
  [[nodiscard]] virtual std::optional<Triangle> next() = 0;

  // Exact number of triangles still to come, if the format declares it up front
  [[nodiscard]] virtual std::optional<size_t> count_remaining() const { return std::nullopt; }
};
