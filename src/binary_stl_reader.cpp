#include <array>
#include <format>

#include "binary_io.hpp"
#include "binary_stl_reader.hpp"
#include "stlbox_exceptions.hpp"

// Returns the number of bytes read, throws Io_Error if the stream itself failed
static size_t read_bytes(std::istream &is, unsigned char *buffer, size_t size) {
  is.read(reinterpret_cast<char *>(buffer), static_cast<std::streamsize>(size));
  if (is.bad()) {
    throw Io_Error("Failed to read from stream");
  }
  return static_cast<size_t>(is.gcount());
}

Binary_Stl_Reader::Binary_Stl_Reader(std::istream &is) : m_is(is) {
  std::array<unsigned char, BINARY_STL_HEADER_SIZE + sizeof(uint32_t)> buffer;
  size_t num_read = read_bytes(m_is, buffer.data(), buffer.size());
  if (num_read < BINARY_STL_HEADER_SIZE) {
    throw Unexpected_End_Error(
        std::format("Truncated binary STL header, expected {} bytes, got {}", BINARY_STL_HEADER_SIZE, num_read));
  }
  if (num_read < buffer.size()) {
    throw Unexpected_End_Error("Truncated binary STL, missing triangle count");
  }
  // Header content is opaque and ignored
  m_num_triangles = load_u32_le(buffer.data() + BINARY_STL_HEADER_SIZE);
}

std::optional<Triangle> Binary_Stl_Reader::next() {
  if (m_done || m_index >= m_num_triangles) {
    m_done = true;
    return std::nullopt;
  }

  std::array<unsigned char, BINARY_STL_TRIANGLE_RECORD_SIZE> record;
  size_t num_read;
  try {
    num_read = read_bytes(m_is, record.data(), record.size());
  } catch (const Io_Error &) {
    m_done = true;
    throw;
  }
  if (num_read < record.size()) {
    m_done = true;
    throw Unexpected_End_Error(std::format("Truncated binary STL, triangle #{} of {}: expected {} bytes, got {}",
                                           m_index, m_num_triangles, record.size(), num_read));
  }

  const unsigned char *p = record.data();
  Triangle t;
  t.normal = glm::vec3(load_f32_le(p), load_f32_le(p + 4), load_f32_le(p + 8));
  p += sizeof(glm::vec3);
  for (glm::vec3 &vertex : t.vertices) {
    vertex = glm::vec3(load_f32_le(p), load_f32_le(p + 4), load_f32_le(p + 8));
    p += sizeof(glm::vec3);
  }
  // Skip "attribute byte count"

  m_index++;
  return t;
}

std::optional<size_t> Binary_Stl_Reader::count_remaining() const {
  if (m_done) {
    return 0;
  }
  return m_num_triangles - m_index;
}
