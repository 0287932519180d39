#pragma once

#include <cstddef>
#include <cstdint>
#include <istream>
#include <optional>

#include "triangle.hpp"
#include "triangle_reader.hpp"

constexpr size_t BINARY_STL_HEADER_SIZE = 80;
// Normal + 3 vertices (12 floats) + "attribute byte count"
constexpr size_t BINARY_STL_TRIANGLE_RECORD_SIZE = sizeof(float[4][3]) + sizeof(uint16_t);

class Binary_Stl_Reader final : public Triangle_Reader {
private:
  std::istream &m_is;
  uint32_t m_num_triangles = 0;
  uint32_t m_index = 0;
  bool m_done = false;

public:
  // Reads the header and triangle count eagerly, triangles are read one record per next() call
  explicit Binary_Stl_Reader(std::istream &is);

  [[nodiscard]] std::optional<Triangle> next() override;

  [[nodiscard]] std::optional<size_t> count_remaining() const override;

  [[nodiscard]] uint32_t get_num_triangles() const { return m_num_triangles; }
};
