#include "geowkb/common.hpp"
#include "geowkb/geos/geos_wrappers.hpp"
#include "geowkb/core/geometry/wkb_reader.hpp"
#include "geowkb/core/geometry/wkb_writer.hpp"

#include <cstdio>

namespace geowkb {

namespace geos {

using namespace core;

//------------------------------------------------------------------------------
// Capabilities
//------------------------------------------------------------------------------
bool GeometryEngineCapabilities::AtLeast(int major_p, int minor_p, int patch_p) const {
	if (major != major_p) {
		return major > major_p;
	}
	if (minor != minor_p) {
		return minor > minor_p;
	}
	return patch >= patch_p;
}

GeometryEngineCapabilities GeometryEngineCapabilities::FromVersion(const string &version) {
	GeometryEngineCapabilities result;
	result.version = version;
	// The patch level may carry a suffix, e.g. "3.13.0dev"
	if (sscanf(version.c_str(), "%d.%d.%d", &result.major, &result.minor, &result.patch) < 2) {
		throw InvalidInputException("Could not parse GEOS version \"%s\"", version);
	}
	result.empty_point_wkb = result.AtLeast(3, 9, 0);
	result.wkb_m_ordinates = result.AtLeast(3, 12, 0);
	return result;
}

GeometryEngineCapabilities GeosContextWrapper::GetCapabilities() {
	// The linked library does not change at runtime, parse its version once
	static const GeometryEngineCapabilities capabilities = GeometryEngineCapabilities::FromVersion(GEOSversion());
	return capabilities;
}

//------------------------------------------------------------------------------
// Conversion
//------------------------------------------------------------------------------
// Geometries travel to and from GEOS as extended WKB in host byte order

GeometryPtr GeosContextWrapper::ToGEOS(const Geometry &geom) const {
	WKBWriterOptions options;
	options.include_srid = true;

	vector<data_t> buffer;
	core::WKBWriter::Write(geom, buffer, options);

	auto reader = CreateWKBReader();
	return reader.Read(buffer);
}

Geometry GeosContextWrapper::FromGEOS(const GEOSGeometry *geom, ArenaAllocator &arena) const {
	auto capabilities = GetCapabilities();
	auto writer = CreateWKBWriter();
	writer.SetByteOrder(WKBByteOrderUtil::Native());
	writer.SetIncludeSRID(GEOSGetSRID_r(ctx, geom) != 0);
	writer.SetOutputDimension(capabilities.wkb_m_ordinates ? 4 : 3);

	auto buffer = writer.Write(geom);
	core::WKBReader reader(arena);
	return reader.Deserialize(buffer);
}

} // namespace geos

} // namespace geowkb
