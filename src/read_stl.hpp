#pragma once

#include <istream>
#include <memory>

#include "indexed_mesh.hpp"
#include "triangle_reader.hpp"

// Peeks at the first line to decide whether the stream holds ASCII STL, then seeks back to where it started.
// Throws Io_Error if the stream position can not be determined or restored.
[[nodiscard]] bool probe_ascii_stl(std::istream &is);

// Picks the ASCII or binary decoder for the stream, the stream must outlive the returned reader
[[nodiscard]] std::unique_ptr<Triangle_Reader> create_stl_reader(std::istream &is);

// Decodes either ASCII or binary STL into an indexed mesh
[[nodiscard]] Indexed_Mesh read_stl(std::istream &is);
