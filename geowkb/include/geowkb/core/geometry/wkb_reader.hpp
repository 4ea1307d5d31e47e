#pragma once
#include "geowkb/common.hpp"
#include "geowkb/core/geometry/geometry.hpp"
#include "geowkb/core/util/cursor.hpp"

namespace geowkb {

namespace core {

class WKBReader {
private:
	ArenaAllocator &arena;
	bool has_any_z;
	bool has_any_m;

	struct WKBType {
		GeometryType type;
		bool has_z;
		bool has_m;
		bool has_srid;
	};

	// Primitives
	void Require(Cursor &cursor, uint64_t bytes);
	WKBByteOrder ReadByteOrder(Cursor &cursor);
	uint32_t ReadInt(Cursor &cursor, WKBByteOrder order);
	double ReadDouble(Cursor &cursor, WKBByteOrder order);
	WKBType ReadType(Cursor &cursor, WKBByteOrder order);
	void ReadVertices(Cursor &cursor, WKBByteOrder order, Geometry &geometry);

	// Geometries
	Geometry ReadPoint(Cursor &cursor, WKBByteOrder order, bool has_z, bool has_m);
	Geometry ReadLineString(Cursor &cursor, WKBByteOrder order, bool has_z, bool has_m);
	Geometry ReadPolygon(Cursor &cursor, WKBByteOrder order, bool has_z, bool has_m);
	Geometry ReadCollection(Cursor &cursor, WKBByteOrder order, GeometryType type, bool has_z, bool has_m,
	                        uint32_t depth);
	Geometry ReadGeometry(Cursor &cursor, uint32_t depth);

public:
	// Collections nested deeper than this are rejected
	static constexpr uint32_t MAX_DEPTH = 256;

public:
	explicit WKBReader(ArenaAllocator &arena) : arena(arena), has_any_z(false), has_any_m(false) {
	}
	// Inputs larger than 4 GiB are rejected
	Geometry Deserialize(const_data_ptr_t wkb, idx_t size);
	Geometry Deserialize(const vector<data_t> &wkb);
	Geometry Deserialize(const string &wkb);
	Geometry DeserializeHex(const string &hex);
	bool GeomHasZ() const {
		return has_any_z;
	}
	bool GeomHasM() const {
		return has_any_m;
	};
};

} // namespace core

} // namespace geowkb
