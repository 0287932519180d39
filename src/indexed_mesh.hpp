#pragma once

#include <span>
#include <vector>

#include <glm/vec3.hpp>

#include "triangle.hpp"
#include "triangle_reader.hpp"

// Deduplicated vertex list (in order of first occurrence) and faces referencing it.
// Immutable once built, copy it to get a mesh you can change.
class Indexed_Mesh {
private:
  friend class Indexed_Mesh_Creator;

  std::vector<glm::vec3> m_vertices;
  std::vector<Indexed_Triangle> m_faces;
  // Private default constructor to only allow creating meshes through public API,
  // which guarantees every face index is valid for m_vertices
  Indexed_Mesh() = default;

public:
  [[nodiscard]] const std::vector<glm::vec3> &get_vertices() const { return m_vertices; }

  [[nodiscard]] const std::vector<Indexed_Triangle> &get_faces() const { return m_faces; }

  [[nodiscard]] std::vector<Triangle> to_triangles() const;

  bool operator==(const Indexed_Mesh &) const = default;
};

class Indexed_Mesh_Creator {
public:
  // Consumes the reader to completion, decode errors propagate and no partial mesh is returned
  [[nodiscard]] static Indexed_Mesh create_indexed_mesh(Triangle_Reader &reader);

  [[nodiscard]] static Indexed_Mesh create_indexed_mesh(std::span<const Triangle> triangles);
  Indexed_Mesh_Creator() = delete;
};
