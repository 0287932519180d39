#include <algorithm>
#include <iostream> // for std::cerr, std::endl, etc...
#include <string>

#include "ascii_stl_reader.hpp"
#include "binary_stl_reader.hpp"
#include "read_stl.hpp"
#include "stlbox_exceptions.hpp"

// Binary headers often start with "solid " too, but their zero padding or the triangle count following the
// header contains control bytes, which never appear on the first line of an ASCII file
[[nodiscard]] static bool is_ascii_stl_header(const std::string &line) {
  if (!line.starts_with(ASCII_STL_SOLID_PREFIX)) {
    return false;
  }
  return std::none_of(line.begin(), line.end(), [](char c) {
    auto u = static_cast<unsigned char>(c);
    return (u < 0x20 && c != '\t' && c != '\r') || u == 0x7f;
  });
}

bool probe_ascii_stl(std::istream &is) {
  auto start = is.tellg();
  if (start == std::istream::pos_type(-1)) {
    throw Io_Error("Failed to get stream position for probing");
  }

  std::string header;
  std::getline(is, header);
  bool is_read_error = is.bad();

  // Seek back to start before evaluating potential read errors
  is.clear();
  is.seekg(start);
  if (is.fail()) {
    throw Io_Error("Failed to seek back to start of stream after probing");
  }

  if (is_read_error) {
    return false;
  }
  return is_ascii_stl_header(header);
}

std::unique_ptr<Triangle_Reader> create_stl_reader(std::istream &is) {
  if (probe_ascii_stl(is)) {
    return std::make_unique<Ascii_Stl_Reader>(is);
  }
  return std::make_unique<Binary_Stl_Reader>(is);
}

Indexed_Mesh read_stl(std::istream &is) {
  try {
    std::unique_ptr<Triangle_Reader> reader = create_stl_reader(is);
    return Indexed_Mesh_Creator::create_indexed_mesh(*reader);
  } catch (const StlBox_Error &e) {
    std::cerr << "Failed to read STL: " << e.what() << std::endl;
    throw; // rethrows original error
  }
}
