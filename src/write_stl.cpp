#include <array>
#include <cstdint>
#include <format>
#include <limits>
#include <optional>

#include "binary_io.hpp"
#include "binary_stl_reader.hpp"
#include "stlbox_exceptions.hpp"
#include "write_stl.hpp"

static void write_bytes(std::ostream &os, const unsigned char *data, size_t size) {
  os.write(reinterpret_cast<const char *>(data), static_cast<std::streamsize>(size));
  if (!os) {
    throw Io_Error("Failed to write to stream");
  }
}

static void write_header(std::ostream &os, size_t num_triangles) {
  if (num_triangles > std::numeric_limits<uint32_t>::max()) {
    throw Overflow_Check_Error(
        std::format("Aborting binary STL export, too many triangles ({}) for 32 bit count", num_triangles));
  }
  std::array<unsigned char, BINARY_STL_HEADER_SIZE + sizeof(uint32_t)> header{};
  store_u32_le(header.data() + BINARY_STL_HEADER_SIZE, static_cast<uint32_t>(num_triangles));
  write_bytes(os, header.data(), header.size());
}

static void write_record(std::ostream &os, const Triangle &t) {
  // "Attribute byte count" stays zero from initialization
  std::array<unsigned char, BINARY_STL_TRIANGLE_RECORD_SIZE> record{};
  unsigned char *p = record.data();
  for (int i = 0; i < 3; i++) {
    store_f32_le(p, t.normal[i]);
    p += sizeof(float);
  }
  for (const glm::vec3 &vertex : t.vertices) {
    for (int i = 0; i < 3; i++) {
      store_f32_le(p, vertex[i]);
      p += sizeof(float);
    }
  }
  write_bytes(os, record.data(), record.size());
}

static void flush_stream(std::ostream &os) {
  os.flush();
  if (!os) {
    throw Io_Error("Failed to flush stream");
  }
}

void write_stl_binary(std::ostream &os, std::span<const Triangle> triangles) {
  write_header(os, triangles.size());
  for (const Triangle &t : triangles) {
    write_record(os, t);
  }
  flush_stream(os);
}

void write_stl_binary(std::ostream &os, Triangle_Reader &reader) {
  std::optional<size_t> num_triangles = reader.count_remaining();
  if (!num_triangles) {
    throw Invalid_Data_Error("Triangle count must be known before writing binary STL");
  }
  write_header(os, *num_triangles);
  for (size_t i = 0; i < *num_triangles; i++) {
    std::optional<Triangle> t = reader.next();
    if (!t) {
      throw Unexpected_End_Error(
          std::format("Triangle reader ended after {} of {} announced triangles", i, *num_triangles));
    }
    write_record(os, *t);
  }
  flush_stream(os);
}
