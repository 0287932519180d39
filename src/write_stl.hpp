#pragma once

#include <ostream>
#include <span>

#include "triangle.hpp"
#include "triangle_reader.hpp"

// Writes binary STL: zeroed 80 byte header, triangle count, then one record per triangle with a zero
// "attribute byte count". The stream is flushed before returning.
// Throws Overflow_Check_Error if the count does not fit in 32 bits (nothing is written),
// Io_Error if writing fails (whatever was written stays in the stream).
void write_stl_binary(std::ostream &os, std::span<const Triangle> triangles);

// Same as above, but pulls triangles from the reader one at a time instead of holding them all in memory.
// The reader must know its exact count up front, otherwise Invalid_Data_Error is thrown before anything is written.
// Decode errors from the reader propagate, leaving the stream as written so far.
void write_stl_binary(std::ostream &os, Triangle_Reader &reader);
