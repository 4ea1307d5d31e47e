#include "geowkb/common.hpp"
#include "geowkb/core/exception.hpp"
#include "geowkb/core/geometry/geometry.hpp"
#include "geowkb/core/geometry/wkb_reader.hpp"
#include "geowkb/core/util/hex.hpp"

namespace geowkb {

namespace core {

Geometry WKBReader::Deserialize(const vector<data_t> &wkb) {
	return Deserialize(wkb.data(), wkb.size());
}

Geometry WKBReader::Deserialize(const string &wkb) {
	return Deserialize(const_data_ptr_cast(wkb.c_str()), wkb.size());
}

Geometry WKBReader::DeserializeHex(const string &hex) {
	auto blob = HexUtil::Decode(hex);
	return Deserialize(blob);
}

Geometry WKBReader::Deserialize(const_data_ptr_t wkb, idx_t size) {
	if (size > NumericLimits<uint32_t>::Maximum()) {
		throw WKBReadingException("Input of %d bytes exceeds the maximum WKB size of 4 GiB", size);
	}
	Cursor cursor(const_cast<data_ptr_t>(wkb), const_cast<data_ptr_t>(wkb + size));

	has_any_m = false;
	has_any_z = false;

	auto geom = ReadGeometry(cursor, 0);
	if (cursor.Remaining() != 0) {
		throw WKBReadingException("Unexpected %d trailing bytes after %s geometry", cursor.Remaining(),
		                          GeometryTypes::ToString(geom.GetType()));
	}
	return geom;
}

void WKBReader::Require(Cursor &cursor, uint64_t bytes) {
	if (cursor.Remaining() < bytes) {
		throw WKBReadingException("Unexpected end of input at byte %d, %d more bytes expected", cursor.Position(),
		                          bytes);
	}
}

WKBByteOrder WKBReader::ReadByteOrder(Cursor &cursor) {
	Require(cursor, sizeof(uint8_t));
	auto position = cursor.Position();
	auto flag = cursor.Read<uint8_t>();
	if (!WKBByteOrderUtil::IsValidFlag(flag)) {
		throw WKBReadingException("Invalid byte order flag %d at byte %d", flag, position);
	}
	return static_cast<WKBByteOrder>(flag);
}

uint32_t WKBReader::ReadInt(Cursor &cursor, WKBByteOrder order) {
	Require(cursor, sizeof(uint32_t));
	return cursor.Read<uint32_t>(order);
}

double WKBReader::ReadDouble(Cursor &cursor, WKBByteOrder order) {
	Require(cursor, sizeof(double));
	return cursor.Read<double>(order);
}

WKBReader::WKBType WKBReader::ReadType(Cursor &cursor, WKBByteOrder order) {
	auto position = cursor.Position();
	auto wkb_type = ReadInt(cursor, order);

	// Check for ISO WKB Z and M flags
	auto iso_code = wkb_type & 0x0fffffff;
	uint32_t iso_wkb_props = iso_code / 1000;
	auto base_code = iso_code % 1000;
	if (!GeometryTypes::IsValidWKBCode(base_code) || iso_wkb_props > 3) {
		throw WKBReadingException("Unknown WKB geometry type %d at byte %d", wkb_type, position);
	}

	bool has_z = (iso_wkb_props == 1) || (iso_wkb_props == 3);
	bool has_m = (iso_wkb_props == 2) || (iso_wkb_props == 3);

	// Check for EWKB Z, M and SRID flags
	has_z = has_z || ((wkb_type & 0x80000000) != 0);
	has_m = has_m || ((wkb_type & 0x40000000) != 0);
	bool has_srid = (wkb_type & 0x20000000) != 0;
	if ((wkb_type & 0x10000000) != 0) {
		throw WKBReadingException("Unknown WKB geometry type %d at byte %d", wkb_type, position);
	}

	has_any_z |= has_z;
	has_any_m |= has_m;

	return {GeometryTypes::FromWKBCode(base_code), has_z, has_m, has_srid};
}

Geometry WKBReader::ReadPoint(Cursor &cursor, WKBByteOrder order, bool has_z, bool has_m) {
	uint32_t dims = 2 + has_z + has_m;
	bool all_nan = true;
	double coords[4];
	for (uint32_t i = 0; i < dims; i++) {
		coords[i] = ReadDouble(cursor, order);
		if (!std::isnan(coords[i])) {
			all_nan = false;
		}
	}
	if (all_nan) {
		return Point::CreateEmpty(has_z, has_m);
	}
	auto point = Point::CreateEmpty(has_z, has_m);
	SinglePartGeometry::CopyData(point, arena, const_data_ptr_cast(coords), 1);
	return point;
}

void WKBReader::ReadVertices(Cursor &cursor, WKBByteOrder order, Geometry &geometry) {
	auto dims = geometry.GetProperties().Dimensions();
	for (uint32_t i = 0; i < geometry.Count(); i++) {
		for (uint32_t d = 0; d < dims; d++) {
			SinglePartGeometry::SetOrdinate(geometry, i, d, ReadDouble(cursor, order));
		}
	}
}

Geometry WKBReader::ReadLineString(Cursor &cursor, WKBByteOrder order, bool has_z, bool has_m) {
	auto count = ReadInt(cursor, order);
	// Make sure the input can hold the vertices before allocating them
	Require(cursor, static_cast<uint64_t>(count) * GeometryProperties(has_z, has_m).VertexSize());
	auto line = LineString::Create(arena, count, has_z, has_m);
	ReadVertices(cursor, order, line);
	return line;
}

Geometry WKBReader::ReadPolygon(Cursor &cursor, WKBByteOrder order, bool has_z, bool has_m) {
	auto ring_count = ReadInt(cursor, order);
	// Every ring has at least a vertex count
	Require(cursor, static_cast<uint64_t>(ring_count) * sizeof(uint32_t));
	auto polygon = Polygon::Create(arena, ring_count, has_z, has_m);
	for (uint32_t i = 0; i < ring_count; i++) {
		Polygon::Part(polygon, i) = ReadLineString(cursor, order, has_z, has_m);
	}
	return polygon;
}

Geometry WKBReader::ReadCollection(Cursor &cursor, WKBByteOrder order, GeometryType type, bool has_z, bool has_m,
                                   uint32_t depth) {
	if (depth >= MAX_DEPTH) {
		throw WKBReadingException("%s is nested deeper than 256 levels", GeometryTypes::ToString(type));
	}
	auto count = ReadInt(cursor, order);
	// Every part has at least a byte order flag and a type
	Require(cursor, static_cast<uint64_t>(count) * (sizeof(uint8_t) + sizeof(uint32_t)));
	auto collection = Geometry::Create(arena, type, count, has_z, has_m);
	for (uint32_t i = 0; i < count; i++) {
		auto part = ReadGeometry(cursor, depth + 1);
		auto expected = type;
		switch (type) {
		case GeometryType::MULTIPOINT:
			expected = GeometryType::POINT;
			break;
		case GeometryType::MULTILINESTRING:
			expected = GeometryType::LINESTRING;
			break;
		case GeometryType::MULTIPOLYGON:
			expected = GeometryType::POLYGON;
			break;
		default:
			expected = part.GetType();
			break;
		}
		if (part.GetType() != expected) {
			throw WKBReadingException("%s can not contain a %s", GeometryTypes::ToString(type),
			                          GeometryTypes::ToString(part.GetType()));
		}
		MultiPartGeometry::Part(collection, i) = part;
	}
	return collection;
}

Geometry WKBReader::ReadGeometry(Cursor &cursor, uint32_t depth) {
	auto order = ReadByteOrder(cursor);
	auto type = ReadType(cursor, order);

	int32_t srid = 0;
	if (type.has_srid) {
		srid = static_cast<int32_t>(ReadInt(cursor, order));
	}

	Geometry result;
	switch (type.type) {
	case GeometryType::POINT:
		result = ReadPoint(cursor, order, type.has_z, type.has_m);
		break;
	case GeometryType::LINESTRING:
		result = ReadLineString(cursor, order, type.has_z, type.has_m);
		break;
	case GeometryType::POLYGON:
		result = ReadPolygon(cursor, order, type.has_z, type.has_m);
		break;
	default:
		result = ReadCollection(cursor, order, type.type, type.has_z, type.has_m, depth);
		break;
	}

	// Nested geometries inherit the SRID of the root, a nested SRID is skipped
	if (type.has_srid && depth == 0) {
		result.SetSRID(srid);
	}
	return result;
}

} // namespace core

} // namespace geowkb
