#include <algorithm>
#include <cmath>

#include "math.hpp"

bool is_close(const Tolerance_Context &tc, float a, float b) {
  return std::abs(a - b) <= std::max(tc.m_rel_tol * std::max(std::abs(a), std::abs(b)), tc.m_abs_tol);
}

bool is_close(const Tolerance_Context &tc, const glm::vec3 &a, const glm::vec3 &b) {
  return is_close(tc, a.x, b.x) && is_close(tc, a.y, b.y) && is_close(tc, a.z, b.z);
}

bool is_close(const Tolerance_Context &tc, const Triangle &a, const Triangle &b) {
  if (!is_close(tc, a.normal, b.normal)) {
    return false;
  }
  for (int i = 0; i < 3; i++) {
    if (!is_close(tc, a.vertices[i], b.vertices[i])) {
      return false;
    }
  }
  return true;
}
