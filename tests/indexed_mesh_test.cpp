#include <sstream>
#include <vector>

#include <gtest/gtest.h>

#include "ascii_stl_reader.hpp"
#include "binary_stl_reader.hpp"
#include "indexed_mesh.hpp"
#include "stl_test_utils.hpp"
#include "stlbox_exceptions.hpp"

// Triangles that share no vertices with each other
static std::vector<Triangle> make_disjoint_triangles() {
  return {
      make_triangle(glm::vec3(0.0f, 0.0f, 0.0f), glm::vec3(1.0f, 0.0f, 0.0f), glm::vec3(0.0f, 1.0f, 0.0f)),
      make_triangle(glm::vec3(5.5f, 0.25f, -1.0f), glm::vec3(6.0f, 0.0f, 0.0f), glm::vec3(5.0f, 1.0f, 0.125f)),
      make_triangle(glm::vec3(-0.1f, 0.2f, 0.3f), glm::vec3(0.4f, -0.5f, 0.6f), glm::vec3(0.7f, 0.8f, -0.9f)),
  };
}

TEST(indexed_mesh, deduplicates_shared_vertices) {
  std::vector<Triangle> triangles = make_tetrahedron();
  Indexed_Mesh mesh = Indexed_Mesh_Creator::create_indexed_mesh(triangles);

  EXPECT_EQ(mesh.get_vertices().size(), 4u);
  ASSERT_EQ(mesh.get_faces().size(), triangles.size());
  for (size_t fi = 0; fi < triangles.size(); fi++) {
    const Indexed_Triangle &face = mesh.get_faces()[fi];
    EXPECT_EQ(face.normal, triangles[fi].normal);
    for (int i = 0; i < 3; i++) {
      ASSERT_LT(face.vertices[i], mesh.get_vertices().size());
      EXPECT_EQ(mesh.get_vertices()[face.vertices[i]], triangles[fi].vertices[i]);
    }
  }
}

TEST(indexed_mesh, first_occurrence_order) {
  std::vector<Triangle> triangles = make_tetrahedron();
  Indexed_Mesh mesh = Indexed_Mesh_Creator::create_indexed_mesh(triangles);
  // a, c, b from the first face, then d from the second
  EXPECT_EQ(mesh.get_vertices()[0], glm::vec3(0.0f, 0.0f, 0.0f));
  EXPECT_EQ(mesh.get_vertices()[1], glm::vec3(0.0f, 1.0f, 0.0f));
  EXPECT_EQ(mesh.get_vertices()[2], glm::vec3(1.0f, 0.0f, 0.0f));
  EXPECT_EQ(mesh.get_vertices()[3], glm::vec3(0.0f, 0.0f, 1.0f));
  EXPECT_EQ(mesh.get_faces()[0].vertices, (std::array<size_t, 3>{0, 1, 2}));
  EXPECT_EQ(mesh.get_faces()[1].vertices, (std::array<size_t, 3>{0, 2, 3}));
}

// Bit-exact identity on purpose: geometrically equal but bit-different vertices stay separate
TEST(indexed_mesh, signed_zero_is_not_merged) {
  std::vector<Triangle> triangles = {
      make_triangle(glm::vec3(0.0f, 0.0f, 0.0f), glm::vec3(1.0f, 0.0f, 0.0f), glm::vec3(0.0f, 1.0f, 0.0f)),
      make_triangle(glm::vec3(-0.0f, 0.0f, 0.0f), glm::vec3(0.0f, 1.0f, 0.0f), glm::vec3(1.0f, 0.0f, 0.0f)),
  };
  Indexed_Mesh mesh = Indexed_Mesh_Creator::create_indexed_mesh(triangles);
  EXPECT_EQ(mesh.get_vertices().size(), 4u);
  EXPECT_EQ(mesh.get_faces()[1].vertices, (std::array<size_t, 3>{3, 2, 1}));
}

TEST(indexed_mesh, degenerate_triangle_reuses_index) {
  std::vector<Triangle> triangles = {
      make_triangle(glm::vec3(1.0f, 2.0f, 3.0f), glm::vec3(1.0f, 2.0f, 3.0f), glm::vec3(1.0f, 2.0f, 3.0f)),
  };
  Indexed_Mesh mesh = Indexed_Mesh_Creator::create_indexed_mesh(triangles);
  EXPECT_EQ(mesh.get_vertices().size(), 1u);
  EXPECT_EQ(mesh.get_faces()[0].vertices, (std::array<size_t, 3>{0, 0, 0}));
}

TEST(indexed_mesh, empty_stream) {
  std::istringstream iss("solid empty\nendsolid empty\n");
  Ascii_Stl_Reader reader(iss);
  Indexed_Mesh mesh = Indexed_Mesh_Creator::create_indexed_mesh(reader);
  EXPECT_TRUE(mesh.get_vertices().empty());
  EXPECT_TRUE(mesh.get_faces().empty());
}

TEST(indexed_mesh, ascii_and_binary_give_equal_meshes) {
  std::vector<Triangle> triangles = make_disjoint_triangles();
  std::istringstream ascii(to_ascii_stl(triangles));
  std::istringstream binary(to_binary_stl(triangles));
  Ascii_Stl_Reader ascii_reader(ascii);
  Binary_Stl_Reader binary_reader(binary);

  Indexed_Mesh ascii_mesh = Indexed_Mesh_Creator::create_indexed_mesh(ascii_reader);
  Indexed_Mesh binary_mesh = Indexed_Mesh_Creator::create_indexed_mesh(binary_reader);
  EXPECT_EQ(ascii_mesh.get_vertices(), binary_mesh.get_vertices());
  EXPECT_EQ(ascii_mesh.get_faces(), binary_mesh.get_faces());
  EXPECT_EQ(ascii_mesh.get_vertices().size(), 9u);
}

TEST(indexed_mesh, indexing_is_repeatable) {
  std::string data = to_binary_stl(make_tetrahedron());
  std::istringstream first(data);
  std::istringstream second(data);
  Binary_Stl_Reader first_reader(first);
  Binary_Stl_Reader second_reader(second);
  EXPECT_EQ(Indexed_Mesh_Creator::create_indexed_mesh(first_reader),
            Indexed_Mesh_Creator::create_indexed_mesh(second_reader));
}

TEST(indexed_mesh, decode_error_propagates) {
  std::string ascii = to_ascii_stl(make_tetrahedron());
  // Drop "endsolid"
  ascii.resize(ascii.rfind("endsolid"));
  std::istringstream iss(ascii);
  Ascii_Stl_Reader reader(iss);
  EXPECT_THROW((void)Indexed_Mesh_Creator::create_indexed_mesh(reader), Unexpected_End_Error);
}

TEST(indexed_mesh, to_triangles_restores_input) {
  std::vector<Triangle> triangles = make_tetrahedron();
  Indexed_Mesh mesh = Indexed_Mesh_Creator::create_indexed_mesh(triangles);
  EXPECT_EQ(mesh.to_triangles(), triangles);
}

TEST(indexed_mesh, copy_is_independent_value) {
  Indexed_Mesh mesh = Indexed_Mesh_Creator::create_indexed_mesh(make_tetrahedron());
  Indexed_Mesh copy = mesh;
  EXPECT_EQ(copy, mesh);
  EXPECT_NE(copy.get_vertices().data(), mesh.get_vertices().data());
}
