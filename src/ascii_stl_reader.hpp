#pragma once

#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "triangle.hpp"
#include "triangle_reader.hpp"

constexpr std::string_view ASCII_STL_SOLID_PREFIX = "solid ";

class Ascii_Stl_Reader final : public Triangle_Reader {
private:
  std::istream &m_is;
  bool m_done = false;

  // Next non-blank line split on whitespace, std::nullopt at end of stream
  std::optional<std::vector<std::string>> next_tokens();
  void expect_tokens(const std::vector<std::string_view> &expected);
  glm::vec3 parse_vec3(const std::vector<std::string> &tokens, size_t first);
  Triangle read_facet(const std::vector<std::string> &facet_header);

public:
  // Validates the leading "solid " line eagerly
  explicit Ascii_Stl_Reader(std::istream &is);

  [[nodiscard]] std::optional<Triangle> next() override;
};

// Parses a finite float, throws Invalid_Numeric_Error naming the token otherwise
[[nodiscard]] float parse_ascii_stl_float(std::string_view token);
