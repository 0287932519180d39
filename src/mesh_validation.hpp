#pragma once

#include <limits>

#include "indexed_mesh.hpp"

// Faces with a smaller area are considered degenerate
constexpr float MIN_FACE_AREA = std::numeric_limits<float>::epsilon();

// Checks that the mesh is a closed, consistently oriented manifold without zero-area faces.
// Throws Degenerate_Face_Error or Unmatched_Edge_Error, the mesh is never modified.
// When several edges are unmatched, which one gets reported is unspecified.
void validate_manifold(const Indexed_Mesh &mesh);
