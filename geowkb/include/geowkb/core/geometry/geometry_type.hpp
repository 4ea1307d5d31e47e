#pragma once
#include "geowkb/common.hpp"

namespace geowkb {

namespace core {

enum class GeometryType : uint8_t {
	POINT = 0,
	LINESTRING,
	POLYGON,
	MULTIPOINT,
	MULTILINESTRING,
	MULTIPOLYGON,
	GEOMETRYCOLLECTION
};

struct GeometryTypes {
	static bool IsSinglePart(GeometryType type) {
		return type == GeometryType::POINT || type == GeometryType::LINESTRING;
	}

	static bool IsMultiPart(GeometryType type) {
		return type == GeometryType::POLYGON || type == GeometryType::MULTIPOINT ||
		       type == GeometryType::MULTILINESTRING || type == GeometryType::MULTIPOLYGON ||
		       type == GeometryType::GEOMETRYCOLLECTION;
	}

	static bool IsCollection(GeometryType type) {
		return type == GeometryType::MULTIPOINT || type == GeometryType::MULTILINESTRING ||
		       type == GeometryType::MULTIPOLYGON || type == GeometryType::GEOMETRYCOLLECTION;
	}

	// WKB type codes are 1-indexed
	static uint32_t ToWKBCode(GeometryType type) {
		return static_cast<uint32_t>(type) + 1;
	}

	static bool IsValidWKBCode(uint32_t code) {
		return code >= 1 && code <= 7;
	}

	static GeometryType FromWKBCode(uint32_t code) {
		D_ASSERT(IsValidWKBCode(code));
		return static_cast<GeometryType>(code - 1);
	}

	static string ToString(GeometryType type) {
		switch (type) {
		case GeometryType::POINT:
			return "POINT";
		case GeometryType::LINESTRING:
			return "LINESTRING";
		case GeometryType::POLYGON:
			return "POLYGON";
		case GeometryType::MULTIPOINT:
			return "MULTIPOINT";
		case GeometryType::MULTILINESTRING:
			return "MULTILINESTRING";
		case GeometryType::MULTIPOLYGON:
			return "MULTIPOLYGON";
		case GeometryType::GEOMETRYCOLLECTION:
			return "GEOMETRYCOLLECTION";
		default:
			return StringUtil::Format("UNKNOWN(%d)", static_cast<int>(type));
		}
	}
};

} // namespace core

} // namespace geowkb
