#include "geowkb/common.hpp"
#include "geowkb/core/geometry/geometry.hpp"

namespace geowkb {

namespace core {

//------------------------------------------------------------------------------
// Single Part Geometry
//------------------------------------------------------------------------------
void SinglePartGeometry::CopyData(Geometry &geom, ArenaAllocator &alloc, const_data_ptr_t data, uint32_t count) {
	D_ASSERT(GeometryTypes::IsSinglePart(geom.type));
	if (count == 0) {
		geom.data_ptr = nullptr;
		geom.data_count = 0;
		return;
	}
	auto byte_size = count * geom.properties.VertexSize();
	geom.data_ptr = alloc.AllocateAligned(byte_size);
	memcpy(geom.data_ptr, data, byte_size);
	geom.data_count = count;
}

//------------------------------------------------------------------------------
// Geometry
//------------------------------------------------------------------------------
bool Geometry::IsEmpty(const Geometry &geom) {
	struct op {
		static bool Case(Geometry::Tags::SinglePartGeometry, const Geometry &geom) {
			return SinglePartGeometry::IsEmpty(geom);
		}
		static bool Case(Geometry::Tags::MultiPartGeometry, const Geometry &geom) {
			return MultiPartGeometry::IsEmpty(geom);
		}
	};
	return Geometry::Match<op>(geom);
}

bool Geometry::Equals(const Geometry &lhs, const Geometry &rhs) {
	if (lhs.GetType() != rhs.GetType() || lhs.Count() != rhs.Count()) {
		return false;
	}
	if (!lhs.GetProperties().SameLayout(rhs.GetProperties()) || lhs.HasSRID() != rhs.HasSRID()) {
		return false;
	}
	if (lhs.HasSRID() && lhs.GetSRID() != rhs.GetSRID()) {
		return false;
	}

	struct op {
		static bool Case(Geometry::Tags::SinglePartGeometry, const Geometry &lhs, const Geometry &rhs) {
			// Compare the raw bits, so that NaN and signed zero ordinates round trip exactly
			auto byte_size = SinglePartGeometry::ByteSize(lhs);
			return byte_size == 0 || memcmp(lhs.GetData(), rhs.GetData(), byte_size) == 0;
		}
		static bool Case(Geometry::Tags::MultiPartGeometry, const Geometry &lhs, const Geometry &rhs) {
			for (uint32_t i = 0; i < lhs.Count(); i++) {
				if (!Geometry::Equals(MultiPartGeometry::Part(lhs, i), MultiPartGeometry::Part(rhs, i))) {
					return false;
				}
			}
			return true;
		}
	};
	return Geometry::Match<op>(lhs, rhs);
}

string Geometry::ToString(const Geometry &geom) {
	auto &props = geom.GetProperties();
	string result = GeometryTypes::ToString(geom.GetType());
	if (props.HasZ() && props.HasM()) {
		result += " ZM";
	} else if (props.HasZ()) {
		result += " Z";
	} else if (props.HasM()) {
		result += " M";
	}

	if (Geometry::IsEmpty(geom)) {
		result += " EMPTY";
	} else if (geom.IsSinglePart()) {
		auto count = geom.Count();
		result += StringUtil::Format(" (%d %s)", count, count == 1 ? "vertex" : "vertices");
	} else {
		auto count = geom.Count();
		auto part_name = geom.GetType() == GeometryType::POLYGON ? "ring" : "part";
		result += StringUtil::Format(" (%d %s%s)", count, part_name, count == 1 ? "" : "s");
	}

	if (geom.HasSRID()) {
		result += StringUtil::Format(" SRID=%d", geom.GetSRID());
	}
	return result;
}

} // namespace core

} // namespace geowkb
