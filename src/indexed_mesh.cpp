#include <optional>
#include <unordered_map>
#include <utility>

#include "indexed_mesh.hpp"
#include "vertex_key.hpp"

class Mesh_Indexer {
private:
  std::unordered_map<Vertex_Key, size_t, Vertex_Key_Hash> m_vertex_to_index;
  std::vector<glm::vec3> m_vertices;
  std::vector<Indexed_Triangle> m_faces;

public:
  void add_triangle(const Triangle &t) {
    Indexed_Triangle face{.normal = t.normal, .vertices = {}};
    for (int i = 0; i < 3; i++) {
      const glm::vec3 &vertex = t.vertices[i];
      auto [it, inserted] = m_vertex_to_index.try_emplace(Vertex_Key(vertex), m_vertices.size());
      if (inserted) {
        m_vertices.push_back(vertex);
      }
      face.vertices[i] = it->second;
    }
    m_faces.push_back(face);
  }

  std::vector<glm::vec3> take_vertices() {
    m_vertices.shrink_to_fit();
    return std::move(m_vertices);
  }

  std::vector<Indexed_Triangle> take_faces() {
    m_faces.shrink_to_fit();
    return std::move(m_faces);
  }
};

Indexed_Mesh Indexed_Mesh_Creator::create_indexed_mesh(Triangle_Reader &reader) {
  // Do not reserve based on count_remaining(), the declared count might be bogus
  Mesh_Indexer indexer;
  while (std::optional<Triangle> t = reader.next()) {
    indexer.add_triangle(*t);
  }
  Indexed_Mesh mesh;
  mesh.m_vertices = indexer.take_vertices();
  mesh.m_faces = indexer.take_faces();
  return mesh;
}

Indexed_Mesh Indexed_Mesh_Creator::create_indexed_mesh(std::span<const Triangle> triangles) {
  Mesh_Indexer indexer;
  for (const Triangle &t : triangles) {
    indexer.add_triangle(t);
  }
  Indexed_Mesh mesh;
  mesh.m_vertices = indexer.take_vertices();
  mesh.m_faces = indexer.take_faces();
  return mesh;
}

std::vector<Triangle> Indexed_Mesh::to_triangles() const {
  std::vector<Triangle> triangles;
  triangles.reserve(m_faces.size());
  for (const Indexed_Triangle &face : m_faces) {
    Triangle &t = triangles.emplace_back();
    t.normal = face.normal;
    for (int i = 0; i < 3; i++) {
      t.vertices[i] = m_vertices[face.vertices[i]];
    }
  }
  return triangles;
}
