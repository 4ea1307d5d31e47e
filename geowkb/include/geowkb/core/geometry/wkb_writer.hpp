#pragma once
#include "geowkb/common.hpp"
#include "geowkb/core/geometry/geometry.hpp"
#include "geowkb/core/geometry/wkb_options.hpp"

namespace geowkb {

namespace core {

struct WKBWriter {
	// Write a geometry to a WKB blob into a buffer
	static void Write(const Geometry &geometry, vector<data_t> &buffer,
	                  const WKBWriterOptions &options = WKBWriterOptions());

	static vector<data_t> Write(const Geometry &geometry, const WKBWriterOptions &options);

	// Write a geometry to a WKB blob into an arena allocator
	static const_data_ptr_t Write(const Geometry &geometry, uint32_t *size, ArenaAllocator &allocator,
	                              const WKBWriterOptions &options = WKBWriterOptions());

	// Write a geometry as a HEXWKB string, regardless of the hex option
	static string WriteHex(const Geometry &geometry, const WKBWriterOptions &options = WKBWriterOptions());

	// Write a geometry in the representation the options ask for: raw bytes, or hex text if options.hex is set
	static string Dumps(const Geometry &geometry, const WKBWriterOptions &options = WKBWriterOptions());
};

} // namespace core

} // namespace geowkb
