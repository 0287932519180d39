#pragma once

#include <array>
#include <cstddef>

#include <glm/vec3.hpp>

struct Triangle {
  glm::vec3 normal;
  std::array<glm::vec3, 3> vertices;

  bool operator==(const Triangle &) const = default;
};

// Same as Triangle, but vertices are indices into the vertex list of the owning Indexed_Mesh
struct Indexed_Triangle {
  glm::vec3 normal;
  std::array<size_t, 3> vertices;

  bool operator==(const Indexed_Triangle &) const = default;
};
