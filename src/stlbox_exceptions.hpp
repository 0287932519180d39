#pragma once

#include <cstddef>
#include <format>
#include <stdexcept>
#include <string>

#define custom_exception(name, base)                                                                                   \
  class name : public base {                                                                                           \
  public:                                                                                                              \
    name() : base(#name) {}                                                                                            \
    explicit name(const char *message) : base(message) {}                                                              \
    explicit name(const std::string &message) : base(message) {}                                                       \
  }

custom_exception(StlBox_Error, std::runtime_error);
custom_exception(Io_Error, StlBox_Error);
custom_exception(Unexpected_End_Error, StlBox_Error);
custom_exception(Invalid_Data_Error, StlBox_Error);
custom_exception(Malformed_Structure_Error, Invalid_Data_Error);
custom_exception(Invalid_Numeric_Error, Invalid_Data_Error);
custom_exception(Invalid_Mesh_Error, StlBox_Error);
custom_exception(Overflow_Check_Error, StlBox_Error);

class Degenerate_Face_Error : public Invalid_Mesh_Error {
private:
  size_t m_face_index;
  float m_area;

public:
  Degenerate_Face_Error(size_t face_index, float area)
      : Invalid_Mesh_Error(std::format("face #{} has a zero-area face (area = {})", face_index, area)),
        m_face_index(face_index), m_area(area) {}

  [[nodiscard]] size_t get_face_index() const { return m_face_index; }

  [[nodiscard]] float get_area() const { return m_area; }
};

// Edge positions are local to the face: `from` -> `to` with `to == (from + 1) % 3`
class Unmatched_Edge_Error : public Invalid_Mesh_Error {
private:
  size_t m_face_index;
  int m_from;
  int m_to;

public:
  Unmatched_Edge_Error(size_t face_index, int from, int to)
      : Invalid_Mesh_Error(
            std::format("did not find facing edge for face #{}, edge #v{} -> #v{}", face_index, from, to)),
        m_face_index(face_index), m_from(from), m_to(to) {}

  [[nodiscard]] size_t get_face_index() const { return m_face_index; }

  [[nodiscard]] int get_from() const { return m_from; }

  [[nodiscard]] int get_to() const { return m_to; }
};
