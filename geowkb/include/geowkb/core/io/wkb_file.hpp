#pragma once
#include "geowkb/common.hpp"
#include "geowkb/core/geometry/geometry.hpp"
#include "geowkb/core/geometry/wkb_options.hpp"

namespace geowkb {

namespace core {

// Write and read WKB through file handles owned by the caller.
// The handle is never opened, closed or rewound here; reads and writes start at its current position.
struct WKBFile {
	// Write the geometry as raw WKB, or as HEXWKB text if options.hex is set
	static void Dump(const Geometry &geometry, FileHandle &handle,
	                 const WKBWriterOptions &options = WKBWriterOptions());

	// Read everything from the current position to the end of the file and decode it.
	// In hex mode trailing whitespace (e.g. a final newline) is ignored.
	static Geometry Load(FileHandle &handle, ArenaAllocator &arena, bool hex = false);
};

} // namespace core

} // namespace geowkb
