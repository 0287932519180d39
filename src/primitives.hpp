#pragma once

#include <glm/vec3.hpp>

#include "triangle.hpp"

[[nodiscard]] float calc_triangle_area(const glm::vec3 &a, const glm::vec3 &b, const glm::vec3 &c);

[[nodiscard]] float calc_triangle_area(const Triangle &t);

// Unit normal for counter-clockwise winding, zero vector for degenerate triangles
[[nodiscard]] glm::vec3 calc_triangle_normal(const glm::vec3 &a, const glm::vec3 &b, const glm::vec3 &c);
