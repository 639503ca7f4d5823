#ifndef FLUXED_SHAPE_IO_HPP
#define FLUXED_SHAPE_IO_HPP

#include "fluxed/shape.hpp"

#include <istream>
#include <memory>
#include <ostream>
#include <string>

namespace fluxed {

// Text layout:
//   # comment
//   dims 7 7
//   1111111
//   1000001
//   ...
// Cells are 0/1 in row-major order; whitespace and commas are ignored.
bool read_shape_text(std::istream& is, std::unique_ptr<NdShape>& out, std::string& error);
void write_shape_text(std::ostream& os, const NdShape& shape);

// Binary layout: magic 'FLXS', version, ndim, extents (u64), cells (u8).
bool read_shape_binary(std::istream& is, std::unique_ptr<NdShape>& out, std::string& error);
bool write_shape_binary(std::ostream& os, const NdShape& shape);

// Dispatch on extension: ".bin" is binary, anything else is text.
// Errors are printed to std::cerr.
bool load_shape(const std::string& path, std::unique_ptr<NdShape>& out);
bool save_shape(const std::string& path, const NdShape& shape);

// "box:5x5x5" builds a hollow box; anything else is loaded as a path.
bool parse_shape_spec(const std::string& spec, std::unique_ptr<NdShape>& out);

// Raw dump of the current intensity field: ndim (i32), extents (i64), doubles.
bool dump_intensity(const std::string& path, const NdShape& shape);

} // namespace fluxed

#endif // FLUXED_SHAPE_IO_HPP
