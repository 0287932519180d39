#pragma once

#include <array>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <functional>

#include <glm/vec3.hpp>

// Exact identity of a vertex: two vertices are the same only if all three components are bit-identical,
// so 0.0f and -0.0f are different vertices. Use is_close() from math.hpp for approximate comparison.
struct Vertex_Key {
  std::array<uint32_t, 3> bits;

  explicit Vertex_Key(const glm::vec3 &v)
      : bits{std::bit_cast<uint32_t>(v.x), std::bit_cast<uint32_t>(v.y), std::bit_cast<uint32_t>(v.z)} {}

  bool operator==(const Vertex_Key &) const = default;
};

struct Vertex_Key_Hash {
  size_t operator()(const Vertex_Key &key) const noexcept {
    size_t seed = 0;
    for (uint32_t b : key.bits) {
      // boost::hash_combine
      seed ^= std::hash<uint32_t>{}(b) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
    }
    return seed;
  }
};
