#include <glm/geometric.hpp>

#include "primitives.hpp"

float calc_triangle_area(const glm::vec3 &a, const glm::vec3 &b, const glm::vec3 &c) {
  return glm::length(glm::cross(c - b, a - b)) * 0.5f;
}

float calc_triangle_area(const Triangle &t) { return calc_triangle_area(t.vertices[0], t.vertices[1], t.vertices[2]); }

glm::vec3 calc_triangle_normal(const glm::vec3 &a, const glm::vec3 &b, const glm::vec3 &c) {
  glm::vec3 n = glm::cross(b - a, c - a);
  float length = glm::length(n);
  if (length == 0.0f) {
    return glm::vec3(0.0f);
  }
  return n / length;
}
