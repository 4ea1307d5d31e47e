#include "geowkb/common.hpp"
#include "geowkb/core/exception.hpp"
#include "geowkb/core/geometry/geometry.hpp"
#include "geowkb/core/geometry/wkb_writer.hpp"
#include "geowkb/core/util/cursor.hpp"
#include "geowkb/core/util/hex.hpp"

namespace geowkb {

namespace core {

void WKBWriterOptions::Verify() const {
	if (output_dimension < 2 || output_dimension > 4) {
		throw EncodingException("Output dimension must be 2, 3 or 4, got %d", output_dimension);
	}
	if (flavor == WKBFlavor::ISO && (has_srid || include_srid)) {
		throw EncodingException("ISO WKB can not carry an SRID, use the extended flavor instead");
	}
}

//------------------------------------------------------------------------------
// Layout
//------------------------------------------------------------------------------
// The ordinates actually written for a geometry, after applying the output dimension
struct WKBLayout {
	bool has_z;
	bool has_m;

	WKBLayout(const GeometryProperties &props, uint32_t output_dimension) {
		has_z = props.HasZ() && output_dimension >= 3;
		has_m = props.HasM() && output_dimension >= 3u + (has_z ? 1 : 0);
	}

	uint32_t Dimensions() const {
		return 2 + (has_z ? 1 : 0) + (has_m ? 1 : 0);
	}
};

static void VerifyPart(const Geometry &parent, const Geometry &part, GeometryType expected) {
	if (part.GetType() != expected) {
		throw EncodingException("%s can not contain a %s", GeometryTypes::ToString(parent.GetType()),
		                        GeometryTypes::ToString(part.GetType()));
	}
}

static void VerifyGeometry(const Geometry &geom) {
	switch (geom.GetType()) {
	case GeometryType::POINT:
		if (geom.Count() > 1) {
			throw EncodingException("POINT must have at most one vertex, got %d", geom.Count());
		}
		break;
	case GeometryType::POLYGON:
		for (auto &ring : MultiPartGeometry::Parts(geom)) {
			VerifyPart(geom, ring, GeometryType::LINESTRING);
			// Rings have no header of their own, they are always read with the layout of the polygon
			if (!ring.GetProperties().SameLayout(geom.GetProperties())) {
				throw EncodingException("POLYGON ring must have the same Z and M layout as the polygon");
			}
		}
		break;
	case GeometryType::MULTIPOINT:
		for (auto &part : MultiPartGeometry::Parts(geom)) {
			VerifyPart(geom, part, GeometryType::POINT);
		}
		break;
	case GeometryType::MULTILINESTRING:
		for (auto &part : MultiPartGeometry::Parts(geom)) {
			VerifyPart(geom, part, GeometryType::LINESTRING);
		}
		break;
	case GeometryType::MULTIPOLYGON:
		for (auto &part : MultiPartGeometry::Parts(geom)) {
			VerifyPart(geom, part, GeometryType::POLYGON);
		}
		break;
	default:
		break;
	}
}

//------------------------------------------------------------------------------
// Size Calculator
//------------------------------------------------------------------------------
class WKBSizeCalculator {
private:
	const WKBWriterOptions &options;

	uint32_t VertexBytes(const Geometry &geom) const {
		return sizeof(double) * WKBLayout(geom.GetProperties(), options.output_dimension).Dimensions();
	}

public:
	explicit WKBSizeCalculator(const WKBWriterOptions &options) : options(options) {
	}

	uint32_t Execute(const Geometry &geom, bool with_srid) {
		VerifyGeometry(geom);

		// <byte order> + <type> (+ <srid>)
		uint32_t size = sizeof(uint8_t) + sizeof(uint32_t) + (with_srid ? sizeof(uint32_t) : 0);
		switch (geom.GetType()) {
		case GeometryType::POINT:
			// WKB Points always write points even if empty
			return size + VertexBytes(geom);
		case GeometryType::LINESTRING:
			// <count> + <points>
			return size + sizeof(uint32_t) + geom.Count() * VertexBytes(geom);
		case GeometryType::POLYGON: {
			// <ring_count> + (<count> + <points>) for every ring
			size += sizeof(uint32_t);
			for (auto &ring : MultiPartGeometry::Parts(geom)) {
				size += sizeof(uint32_t) + ring.Count() * VertexBytes(ring);
			}
			return size;
		}
		default: {
			// <geometry_count> + <geometry> for every part
			size += sizeof(uint32_t);
			for (auto &part : MultiPartGeometry::Parts(geom)) {
				size += Execute(part, false);
			}
			return size;
		}
		}
	}
};

//------------------------------------------------------------------------------
// Serializer
//------------------------------------------------------------------------------
class WKBSerializer {
private:
	const WKBWriterOptions &options;

	void WriteHeader(Cursor &cursor, const Geometry &geom, const WKBLayout &layout, bool with_srid, int32_t srid) {
		auto order = options.byte_order;
		// <byte order>
		cursor.Write<uint8_t>(static_cast<uint8_t>(order));

		uint32_t type_id = GeometryTypes::ToWKBCode(geom.GetType());
		if (options.flavor == WKBFlavor::ISO) {
			if (layout.has_z) {
				type_id += 1000;
			}
			if (layout.has_m) {
				type_id += 2000;
			}
		} else {
			if (layout.has_z) {
				type_id |= 0x80000000;
			}
			if (layout.has_m) {
				type_id |= 0x40000000;
			}
			if (with_srid) {
				type_id |= 0x20000000;
			}
		}
		// <type>
		cursor.Write<uint32_t>(type_id, order);

		if (with_srid) {
			// <srid>
			cursor.Write<int32_t>(srid, order);
		}
	}

	void WriteVertices(Cursor &cursor, const Geometry &geom, const WKBLayout &layout) {
		auto order = options.byte_order;
		auto has_z = geom.GetProperties().HasZ();
		for (uint32_t i = 0; i < geom.Count(); i++) {
			cursor.Write<double>(SinglePartGeometry::GetOrdinate(geom, i, 0), order);
			cursor.Write<double>(SinglePartGeometry::GetOrdinate(geom, i, 1), order);
			if (layout.has_z) {
				cursor.Write<double>(SinglePartGeometry::GetOrdinate(geom, i, 2), order);
			}
			if (layout.has_m) {
				// M is stored after Z, if there is one
				cursor.Write<double>(SinglePartGeometry::GetOrdinate(geom, i, has_z ? 3 : 2), order);
			}
		}
	}

public:
	explicit WKBSerializer(const WKBWriterOptions &options) : options(options) {
	}

	void Execute(Cursor &cursor, const Geometry &geom, bool with_srid, int32_t srid) {
		WKBLayout layout(geom.GetProperties(), options.output_dimension);
		WriteHeader(cursor, geom, layout, with_srid, srid);

		switch (geom.GetType()) {
		case GeometryType::POINT:
			if (SinglePartGeometry::IsEmpty(geom)) {
				// Empty points are written as a vertex with all ordinates set to NaN
				for (uint32_t i = 0; i < layout.Dimensions(); i++) {
					cursor.Write<double>(std::numeric_limits<double>::quiet_NaN(), options.byte_order);
				}
			} else {
				WriteVertices(cursor, geom, layout);
			}
			break;
		case GeometryType::LINESTRING:
			cursor.Write<uint32_t>(geom.Count(), options.byte_order);
			WriteVertices(cursor, geom, layout);
			break;
		case GeometryType::POLYGON:
			cursor.Write<uint32_t>(geom.Count(), options.byte_order);
			for (auto &ring : MultiPartGeometry::Parts(geom)) {
				cursor.Write<uint32_t>(ring.Count(), options.byte_order);
				WriteVertices(cursor, ring, WKBLayout(ring.GetProperties(), options.output_dimension));
			}
			break;
		default:
			cursor.Write<uint32_t>(geom.Count(), options.byte_order);
			for (auto &part : MultiPartGeometry::Parts(geom)) {
				// Only the root geometry carries an SRID
				Execute(cursor, part, false, 0);
			}
			break;
		}
	}
};

//------------------------------------------------------------------------------
// WKBWriter
//------------------------------------------------------------------------------
static bool ResolveSRID(const Geometry &geometry, const WKBWriterOptions &options, int32_t &srid) {
	if (options.has_srid) {
		srid = options.srid;
		return true;
	}
	if (options.include_srid && geometry.HasSRID()) {
		srid = geometry.GetSRID();
		return true;
	}
	return false;
}

void WKBWriter::Write(const Geometry &geometry, vector<data_t> &buffer, const WKBWriterOptions &options) {
	options.Verify();
	int32_t srid = 0;
	auto with_srid = ResolveSRID(geometry, options, srid);

	WKBSizeCalculator size_processor(options);
	WKBSerializer serializer(options);
	auto size = size_processor.Execute(geometry, with_srid);
	buffer.resize(size);
	Cursor cursor(buffer.data(), buffer.data() + size);
	serializer.Execute(cursor, geometry, with_srid, srid);
	D_ASSERT(cursor.Remaining() == 0);
}

vector<data_t> WKBWriter::Write(const Geometry &geometry, const WKBWriterOptions &options) {
	vector<data_t> buffer;
	Write(geometry, buffer, options);
	return buffer;
}

const_data_ptr_t WKBWriter::Write(const Geometry &geometry, uint32_t *size, ArenaAllocator &allocator,
                                  const WKBWriterOptions &options) {
	options.Verify();
	int32_t srid = 0;
	auto with_srid = ResolveSRID(geometry, options, srid);

	WKBSizeCalculator size_processor(options);
	WKBSerializer serializer(options);
	auto blob_size = size_processor.Execute(geometry, with_srid);
	auto blob = allocator.AllocateAligned(blob_size);
	Cursor cursor(blob, blob + blob_size);
	serializer.Execute(cursor, geometry, with_srid, srid);
	*size = blob_size;
	return blob;
}

string WKBWriter::WriteHex(const Geometry &geometry, const WKBWriterOptions &options) {
	vector<data_t> buffer;
	Write(geometry, buffer, options);
	return HexUtil::Encode(buffer);
}

string WKBWriter::Dumps(const Geometry &geometry, const WKBWriterOptions &options) {
	if (options.hex) {
		return WriteHex(geometry, options);
	}
	vector<data_t> buffer;
	Write(geometry, buffer, options);
	return string(const_char_ptr_cast(buffer.data()), buffer.size());
}

} // namespace core

} // namespace geowkb
