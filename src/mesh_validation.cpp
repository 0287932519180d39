#include <cstddef>
#include <functional>
#include <unordered_map>
#include <utility>

#include "mesh_validation.hpp"
#include "primitives.hpp"
#include "stlbox_exceptions.hpp"

// Directed edge between two vertex indices
using Edge = std::pair<size_t, size_t>;

struct Edge_Hash {
  size_t operator()(const Edge &e) const noexcept {
    size_t seed = std::hash<size_t>{}(e.first);
    seed ^= std::hash<size_t>{}(e.second) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
    return seed;
  }
};

struct Edge_Owner {
  size_t face_index;
  int from;
  int to;
};

void validate_manifold(const Indexed_Mesh &mesh) {
  const std::vector<glm::vec3> &vertices = mesh.get_vertices();
  std::unordered_map<Edge, Edge_Owner, Edge_Hash> unconnected_edges;

  const std::vector<Indexed_Triangle> &faces = mesh.get_faces();
  for (size_t fi = 0; fi < faces.size(); fi++) {
    const Indexed_Triangle &face = faces[fi];

    float area = calc_triangle_area(vertices[face.vertices[0]], vertices[face.vertices[1]], vertices[face.vertices[2]]);
    if (area < MIN_FACE_AREA) {
      throw Degenerate_Face_Error(fi, area);
    }

    for (int i = 0; i < 3; i++) {
      int j = (i + 1) % 3;
      size_t u = face.vertices[i];
      size_t v = face.vertices[j];
      // The reverse edge was left by a correctly oriented neighbour, both are now matched
      auto it = unconnected_edges.find(Edge(v, u));
      if (it != unconnected_edges.end()) {
        unconnected_edges.erase(it);
      } else {
        unconnected_edges.insert_or_assign(Edge(u, v), Edge_Owner{.face_index = fi, .from = i, .to = j});
      }
    }
  }

  if (!unconnected_edges.empty()) {
    const Edge_Owner &owner = unconnected_edges.begin()->second;
    throw Unmatched_Edge_Error(owner.face_index, owner.from, owner.to);
  }
}
