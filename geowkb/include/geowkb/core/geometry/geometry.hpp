#pragma once

#include "geowkb/common.hpp"
#include "geowkb/core/geometry/geometry_properties.hpp"
#include "geowkb/core/geometry/geometry_type.hpp"
#include "geowkb/core/geometry/vertex.hpp"

#include <new>

namespace geowkb {

namespace core {

//------------------------------------------------------------------------------
// Geometry
//------------------------------------------------------------------------------
// A geometry is a small handle into memory owned by an ArenaAllocator.
// Single part geometries (points, linestrings) point to interleaved vertex data,
// multi part geometries (polygons, collections) point to an array of child geometries.
// Copies are shallow, the arena must outlive every handle into it.
class Geometry {
	friend struct SinglePartGeometry;
	friend struct MultiPartGeometry;

private:
	GeometryType type;
	GeometryProperties properties;
	int32_t srid;
	uint32_t data_count;
	data_ptr_t data_ptr;

	Geometry(GeometryType type, GeometryProperties props, data_ptr_t data, uint32_t count)
	    : type(type), properties(props), srid(0), data_count(count), data_ptr(data) {
	}

public:
	// By default, create an empty point
	Geometry()
	    : type(GeometryType::POINT), properties(false, false), srid(0), data_count(0), data_ptr(nullptr) {
	}

	Geometry(GeometryType type, bool has_z, bool has_m)
	    : type(type), properties(has_z, has_m), srid(0), data_count(0), data_ptr(nullptr) {
	}

public:
	GeometryType GetType() const {
		return type;
	}
	GeometryProperties &GetProperties() {
		return properties;
	}
	const GeometryProperties &GetProperties() const {
		return properties;
	}
	const_data_ptr_t GetData() const {
		return data_ptr;
	}
	data_ptr_t GetData() {
		return data_ptr;
	}
	uint32_t Count() const {
		return data_count;
	}

	bool IsCollection() const {
		return GeometryTypes::IsCollection(type);
	}
	bool IsMultiPart() const {
		return GeometryTypes::IsMultiPart(type);
	}
	bool IsSinglePart() const {
		return GeometryTypes::IsSinglePart(type);
	}

	bool HasSRID() const {
		return properties.HasSRID();
	}
	int32_t GetSRID() const {
		D_ASSERT(HasSRID());
		return srid;
	}
	void SetSRID(int32_t srid_p) {
		srid = srid_p;
		properties.SetSRID(true);
	}
	void ClearSRID() {
		srid = 0;
		properties.SetSRID(false);
	}

public:
	// Used for tag dispatching
	struct Tags {
		// Base types
		struct AnyGeometry {};
		struct SinglePartGeometry : public AnyGeometry {};
		struct MultiPartGeometry : public AnyGeometry {};
		struct CollectionGeometry : public MultiPartGeometry {};
		// Concrete types
		struct Point : public SinglePartGeometry {};
		struct LineString : public SinglePartGeometry {};
		struct Polygon : public MultiPartGeometry {};
		struct MultiPoint : public CollectionGeometry {};
		struct MultiLineString : public CollectionGeometry {};
		struct MultiPolygon : public CollectionGeometry {};
		struct GeometryCollection : public CollectionGeometry {};
	};

	template <class T, class... ARGS>
	static auto Match(const Geometry &geom, ARGS &&...args)
	    -> decltype(T::Case(std::declval<Tags::Point>(), std::declval<const Geometry &>(),
	                        std::declval<ARGS>()...)) {
		switch (geom.type) {
		case GeometryType::POINT:
			return T::Case(Tags::Point {}, geom, std::forward<ARGS>(args)...);
		case GeometryType::LINESTRING:
			return T::Case(Tags::LineString {}, geom, std::forward<ARGS>(args)...);
		case GeometryType::POLYGON:
			return T::Case(Tags::Polygon {}, geom, std::forward<ARGS>(args)...);
		case GeometryType::MULTIPOINT:
			return T::Case(Tags::MultiPoint {}, geom, std::forward<ARGS>(args)...);
		case GeometryType::MULTILINESTRING:
			return T::Case(Tags::MultiLineString {}, geom, std::forward<ARGS>(args)...);
		case GeometryType::MULTIPOLYGON:
			return T::Case(Tags::MultiPolygon {}, geom, std::forward<ARGS>(args)...);
		case GeometryType::GEOMETRYCOLLECTION:
			return T::Case(Tags::GeometryCollection {}, geom, std::forward<ARGS>(args)...);
		default:
			throw NotImplementedException("Geometry::Match");
		}
	}

	static Geometry Create(ArenaAllocator &alloc, GeometryType type, uint32_t count, bool has_z, bool has_m);
	static Geometry CreateEmpty(GeometryType type, bool has_z, bool has_m);

	static bool IsEmpty(const Geometry &geom);

	// Exact comparison: type, vertex layout, SRID and every ordinate bit-for-bit
	static bool Equals(const Geometry &lhs, const Geometry &rhs);

	// Short description for diagnostics, e.g. "POINT Z (1 vertex, SRID=4326)"
	static string ToString(const Geometry &geom);
};

inline Geometry Geometry::Create(ArenaAllocator &alloc, GeometryType type, uint32_t count, bool has_z, bool has_m) {
	if (count == 0) {
		return CreateEmpty(type, has_z, has_m);
	}
	GeometryProperties props(has_z, has_m);
	auto single_part = GeometryTypes::IsSinglePart(type);
	auto elem_size = single_part ? props.VertexSize() : sizeof(Geometry);
	auto data = alloc.AllocateAligned(count * elem_size);
	if (single_part) {
		memset(data, 0, count * elem_size);
	} else {
		auto parts = reinterpret_cast<Geometry *>(data);
		for (uint32_t i = 0; i < count; i++) {
			new (parts + i) Geometry();
		}
	}
	return Geometry(type, props, data, count);
}

inline Geometry Geometry::CreateEmpty(GeometryType type, bool has_z, bool has_m) {
	GeometryProperties props(has_z, has_m);
	return Geometry(type, props, nullptr, 0);
}

//------------------------------------------------------------------------------
// Iterators
//------------------------------------------------------------------------------
class PartView {
private:
	Geometry *beg_ptr;
	Geometry *end_ptr;

public:
	PartView(Geometry *beg, Geometry *end) : beg_ptr(beg), end_ptr(end) {
	}
	Geometry *begin() {
		return beg_ptr;
	}
	Geometry *end() {
		return end_ptr;
	}
	Geometry &operator[](uint32_t index) {
		return beg_ptr[index];
	}
};

class ConstPartView {
private:
	const Geometry *beg_ptr;
	const Geometry *end_ptr;

public:
	ConstPartView(const Geometry *beg, const Geometry *end) : beg_ptr(beg), end_ptr(end) {
	}
	const Geometry *begin() {
		return beg_ptr;
	}
	const Geometry *end() {
		return end_ptr;
	}
	const Geometry &operator[](uint32_t index) {
		return beg_ptr[index];
	}
};

//------------------------------------------------------------------------------
// SinglePartGeometry
//------------------------------------------------------------------------------
struct SinglePartGeometry {

	// Replace the vertex data with an owning copy of raw interleaved vertices
	static void CopyData(Geometry &geom, ArenaAllocator &alloc, const_data_ptr_t data, uint32_t count);

	static bool IsEmpty(const Geometry &geom);

	static double GetOrdinate(const Geometry &geom, uint32_t index, uint32_t ordinate);
	static void SetOrdinate(Geometry &geom, uint32_t index, uint32_t ordinate, double value);

	static VertexXY GetVertex(const Geometry &geom, uint32_t index);

	template <class V>
	static V GetVertex(const Geometry &geom, uint32_t index);

	template <class V>
	static void SetVertex(Geometry &geom, uint32_t index, const V &vertex);

	static uint32_t VertexSize(const Geometry &geom);
	static uint32_t ByteSize(const Geometry &geom);
};

inline bool SinglePartGeometry::IsEmpty(const Geometry &geom) {
	D_ASSERT(GeometryTypes::IsSinglePart(geom.GetType()));
	return geom.data_count == 0;
}

inline double SinglePartGeometry::GetOrdinate(const Geometry &geom, uint32_t index, uint32_t ordinate) {
	D_ASSERT(GeometryTypes::IsSinglePart(geom.GetType()));
	D_ASSERT(index < geom.data_count);
	D_ASSERT(ordinate < geom.properties.Dimensions());
	return Load<double>(geom.data_ptr + index * geom.properties.VertexSize() + ordinate * sizeof(double));
}

inline void SinglePartGeometry::SetOrdinate(Geometry &geom, uint32_t index, uint32_t ordinate, double value) {
	D_ASSERT(GeometryTypes::IsSinglePart(geom.GetType()));
	D_ASSERT(index < geom.data_count);
	D_ASSERT(ordinate < geom.properties.Dimensions());
	Store<double>(value, geom.data_ptr + index * geom.properties.VertexSize() + ordinate * sizeof(double));
}

inline VertexXY SinglePartGeometry::GetVertex(const Geometry &geom, uint32_t index) {
	return VertexXY(GetOrdinate(geom, index, 0), GetOrdinate(geom, index, 1));
}

template <class V>
inline V SinglePartGeometry::GetVertex(const Geometry &geom, uint32_t index) {
	D_ASSERT(GeometryTypes::IsSinglePart(geom.GetType()));
	D_ASSERT(V::HAS_Z == geom.GetProperties().HasZ());
	D_ASSERT(V::HAS_M == geom.GetProperties().HasM());
	D_ASSERT(index < geom.data_count);
	return Load<V>(geom.GetData() + index * sizeof(V));
}

template <class V>
inline void SinglePartGeometry::SetVertex(Geometry &geom, uint32_t index, const V &vertex) {
	D_ASSERT(GeometryTypes::IsSinglePart(geom.GetType()));
	D_ASSERT(V::HAS_Z == geom.GetProperties().HasZ());
	D_ASSERT(V::HAS_M == geom.GetProperties().HasM());
	D_ASSERT(index < geom.data_count);
	Store(vertex, geom.GetData() + index * sizeof(V));
}

inline uint32_t SinglePartGeometry::VertexSize(const Geometry &geom) {
	D_ASSERT(GeometryTypes::IsSinglePart(geom.GetType()));
	return geom.GetProperties().VertexSize();
}

inline uint32_t SinglePartGeometry::ByteSize(const Geometry &geom) {
	D_ASSERT(GeometryTypes::IsSinglePart(geom.GetType()));
	return geom.data_count * geom.GetProperties().VertexSize();
}

//------------------------------------------------------------------------------
// MultiPartGeometry
//------------------------------------------------------------------------------
struct MultiPartGeometry {
	static uint32_t PartCount(const Geometry &geom);
	static Geometry &Part(Geometry &geom, uint32_t index);
	static const Geometry &Part(const Geometry &geom, uint32_t index);
	static PartView Parts(Geometry &geom);
	static ConstPartView Parts(const Geometry &geom);

	static bool IsEmpty(const Geometry &geom) {
		D_ASSERT(GeometryTypes::IsMultiPart(geom.GetType()));
		for (uint32_t i = 0; i < geom.data_count; i++) {
			if (!Geometry::IsEmpty(Part(geom, i))) {
				return false;
			}
		}
		return true;
	}
};

inline uint32_t MultiPartGeometry::PartCount(const Geometry &geom) {
	D_ASSERT(GeometryTypes::IsMultiPart(geom.GetType()));
	return geom.data_count;
}

inline Geometry &MultiPartGeometry::Part(Geometry &geom, uint32_t index) {
	D_ASSERT(GeometryTypes::IsMultiPart(geom.GetType()));
	D_ASSERT(index < geom.data_count);
	return *reinterpret_cast<Geometry *>(geom.GetData() + index * sizeof(Geometry));
}

inline const Geometry &MultiPartGeometry::Part(const Geometry &geom, uint32_t index) {
	D_ASSERT(GeometryTypes::IsMultiPart(geom.GetType()));
	D_ASSERT(index < geom.data_count);
	return *reinterpret_cast<const Geometry *>(geom.GetData() + index * sizeof(Geometry));
}

inline PartView MultiPartGeometry::Parts(Geometry &geom) {
	D_ASSERT(GeometryTypes::IsMultiPart(geom.GetType()));
	auto ptr = reinterpret_cast<Geometry *>(geom.GetData());
	return {ptr, ptr + geom.data_count};
}

inline ConstPartView MultiPartGeometry::Parts(const Geometry &geom) {
	D_ASSERT(GeometryTypes::IsMultiPart(geom.GetType()));
	auto ptr = reinterpret_cast<const Geometry *>(geom.GetData());
	return {ptr, ptr + geom.data_count};
}

//------------------------------------------------------------------------------
// CollectionGeometry
//------------------------------------------------------------------------------
struct CollectionGeometry : public MultiPartGeometry {
protected:
	static Geometry Create(ArenaAllocator &alloc, GeometryType type, vector<Geometry> &items, bool has_z, bool has_m) {
		D_ASSERT(GeometryTypes::IsCollection(type));
		auto collection = Geometry::Create(alloc, type, items.size(), has_z, has_m);
		for (uint32_t i = 0; i < items.size(); i++) {
			CollectionGeometry::Part(collection, i) = items[i];
		}
		return collection;
	}
};

//------------------------------------------------------------------------------
// Point
//------------------------------------------------------------------------------
struct Point : public SinglePartGeometry {
	static Geometry Create(ArenaAllocator &alloc, bool has_z, bool has_m);
	static Geometry CreateEmpty(bool has_z, bool has_m);

	template <class V>
	static Geometry CreateFromVertex(ArenaAllocator &alloc, const V &vertex);

	template <class V = VertexXY>
	static V GetVertex(const Geometry &geom);

	// Constants
	static const constexpr GeometryType TYPE = GeometryType::POINT;
};

inline Geometry Point::Create(ArenaAllocator &alloc, bool has_z, bool has_m) {
	return Geometry::Create(alloc, TYPE, 1, has_z, has_m);
}

inline Geometry Point::CreateEmpty(bool has_z, bool has_m) {
	return Geometry::CreateEmpty(TYPE, has_z, has_m);
}

template <class V>
inline Geometry Point::CreateFromVertex(ArenaAllocator &alloc, const V &vertex) {
	auto point = Create(alloc, V::HAS_Z, V::HAS_M);
	SinglePartGeometry::SetVertex(point, 0, vertex);
	return point;
}

template <class V>
inline V Point::GetVertex(const Geometry &geom) {
	D_ASSERT(geom.GetType() == TYPE);
	D_ASSERT(geom.Count() == 1);
	return SinglePartGeometry::GetVertex<V>(geom, 0);
}

//------------------------------------------------------------------------------
// LineString
//------------------------------------------------------------------------------
struct LineString : public SinglePartGeometry {
	static Geometry Create(ArenaAllocator &alloc, uint32_t count, bool has_z, bool has_m);
	static Geometry CreateEmpty(bool has_z, bool has_m);

	template <class V>
	static Geometry CreateFromVertices(ArenaAllocator &alloc, const vector<V> &vertices);

	// Constants
	static const constexpr GeometryType TYPE = GeometryType::LINESTRING;
};

inline Geometry LineString::Create(ArenaAllocator &alloc, uint32_t count, bool has_z, bool has_m) {
	return Geometry::Create(alloc, TYPE, count, has_z, has_m);
}

inline Geometry LineString::CreateEmpty(bool has_z, bool has_m) {
	return Geometry::CreateEmpty(TYPE, has_z, has_m);
}

template <class V>
inline Geometry LineString::CreateFromVertices(ArenaAllocator &alloc, const vector<V> &vertices) {
	auto line = Create(alloc, vertices.size(), V::HAS_Z, V::HAS_M);
	for (uint32_t i = 0; i < vertices.size(); i++) {
		SinglePartGeometry::SetVertex(line, i, vertices[i]);
	}
	return line;
}

//------------------------------------------------------------------------------
// Polygon
//------------------------------------------------------------------------------
// The parts of a polygon are its rings, stored as linestrings
struct Polygon : public MultiPartGeometry {
	static Geometry Create(ArenaAllocator &alloc, uint32_t ring_count, bool has_z, bool has_m);
	static Geometry CreateEmpty(bool has_z, bool has_m);

	// Constants
	static const constexpr GeometryType TYPE = GeometryType::POLYGON;
};

inline Geometry Polygon::Create(ArenaAllocator &alloc, uint32_t ring_count, bool has_z, bool has_m) {
	auto polygon = Geometry::Create(alloc, TYPE, ring_count, has_z, has_m);
	for (auto &ring : Parts(polygon)) {
		ring = LineString::CreateEmpty(has_z, has_m);
	}
	return polygon;
}

inline Geometry Polygon::CreateEmpty(bool has_z, bool has_m) {
	return Geometry::CreateEmpty(TYPE, has_z, has_m);
}

//------------------------------------------------------------------------------
// MultiPoint
//------------------------------------------------------------------------------
struct MultiPoint : public CollectionGeometry {
	static Geometry Create(ArenaAllocator &alloc, uint32_t count, bool has_z, bool has_m);
	static Geometry Create(ArenaAllocator &alloc, vector<Geometry> &items, bool has_z, bool has_m);
	static Geometry CreateEmpty(bool has_z, bool has_m);

	// Constants
	static const constexpr GeometryType TYPE = GeometryType::MULTIPOINT;
};

inline Geometry MultiPoint::Create(ArenaAllocator &alloc, uint32_t count, bool has_z, bool has_m) {
	return Geometry::Create(alloc, TYPE, count, has_z, has_m);
}

inline Geometry MultiPoint::Create(ArenaAllocator &alloc, vector<Geometry> &items, bool has_z, bool has_m) {
	return CollectionGeometry::Create(alloc, TYPE, items, has_z, has_m);
}

inline Geometry MultiPoint::CreateEmpty(bool has_z, bool has_m) {
	return Geometry::CreateEmpty(TYPE, has_z, has_m);
}

//------------------------------------------------------------------------------
// MultiLineString
//------------------------------------------------------------------------------
struct MultiLineString : public CollectionGeometry {
	static Geometry Create(ArenaAllocator &alloc, uint32_t count, bool has_z, bool has_m);
	static Geometry Create(ArenaAllocator &alloc, vector<Geometry> &items, bool has_z, bool has_m);
	static Geometry CreateEmpty(bool has_z, bool has_m);

	// Constants
	static const constexpr GeometryType TYPE = GeometryType::MULTILINESTRING;
};

inline Geometry MultiLineString::Create(ArenaAllocator &alloc, uint32_t count, bool has_z, bool has_m) {
	return Geometry::Create(alloc, TYPE, count, has_z, has_m);
}

inline Geometry MultiLineString::Create(ArenaAllocator &alloc, vector<Geometry> &items, bool has_z, bool has_m) {
	return CollectionGeometry::Create(alloc, TYPE, items, has_z, has_m);
}

inline Geometry MultiLineString::CreateEmpty(bool has_z, bool has_m) {
	return Geometry::CreateEmpty(TYPE, has_z, has_m);
}

//------------------------------------------------------------------------------
// MultiPolygon
//------------------------------------------------------------------------------
struct MultiPolygon : public CollectionGeometry {
	static Geometry Create(ArenaAllocator &alloc, uint32_t count, bool has_z, bool has_m);
	static Geometry Create(ArenaAllocator &alloc, vector<Geometry> &items, bool has_z, bool has_m);
	static Geometry CreateEmpty(bool has_z, bool has_m);

	// Constants
	static const constexpr GeometryType TYPE = GeometryType::MULTIPOLYGON;
};

inline Geometry MultiPolygon::Create(ArenaAllocator &alloc, uint32_t count, bool has_z, bool has_m) {
	return Geometry::Create(alloc, TYPE, count, has_z, has_m);
}

inline Geometry MultiPolygon::Create(ArenaAllocator &alloc, vector<Geometry> &items, bool has_z, bool has_m) {
	return CollectionGeometry::Create(alloc, TYPE, items, has_z, has_m);
}

inline Geometry MultiPolygon::CreateEmpty(bool has_z, bool has_m) {
	return Geometry::CreateEmpty(TYPE, has_z, has_m);
}

//------------------------------------------------------------------------------
// GeometryCollection
//------------------------------------------------------------------------------
struct GeometryCollection : public CollectionGeometry {
	static Geometry Create(ArenaAllocator &alloc, uint32_t count, bool has_z, bool has_m);
	static Geometry Create(ArenaAllocator &alloc, vector<Geometry> &items, bool has_z, bool has_m);
	static Geometry CreateEmpty(bool has_z, bool has_m);

	// Constants
	static const constexpr GeometryType TYPE = GeometryType::GEOMETRYCOLLECTION;
};

inline Geometry GeometryCollection::Create(ArenaAllocator &alloc, uint32_t count, bool has_z, bool has_m) {
	return Geometry::Create(alloc, TYPE, count, has_z, has_m);
}

inline Geometry GeometryCollection::Create(ArenaAllocator &alloc, vector<Geometry> &items, bool has_z, bool has_m) {
	return CollectionGeometry::Create(alloc, TYPE, items, has_z, has_m);
}

inline Geometry GeometryCollection::CreateEmpty(bool has_z, bool has_m) {
	return Geometry::CreateEmpty(TYPE, has_z, has_m);
}

} // namespace core

} // namespace geowkb
