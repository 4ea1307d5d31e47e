#include "catch.hpp"
#include "test_helpers.hpp"
#include "geowkb/core/exception.hpp"
#include "geowkb/core/geometry/wkb_reader.hpp"
#include "geowkb/core/geometry/wkb_writer.hpp"

using namespace geowkb;
using namespace geowkb::core;

static const string POINT_NDR = "0101000000333333333333F33F3333333333330B40";
static const string POINT_NDR_4326 = "0101000020E6100000333333333333F33F3333333333330B40";
static const string POINT_NDR_27700 = "0101000020346C0000333333333333F33F3333333333330B40";

//------------------------------------------------------------------------------
// Sample geometries
//------------------------------------------------------------------------------
static void FillVertices(Geometry &geom, double seed) {
	auto dims = geom.GetProperties().Dimensions();
	for (uint32_t i = 0; i < geom.Count(); i++) {
		for (uint32_t d = 0; d < dims; d++) {
			SinglePartGeometry::SetOrdinate(geom, i, d, seed + i * 10 + d + 0.125);
		}
	}
}

static Geometry MakePoint(ArenaAllocator &arena, bool has_z, bool has_m, double seed) {
	auto point = Point::Create(arena, has_z, has_m);
	FillVertices(point, seed);
	return point;
}

static Geometry MakeLine(ArenaAllocator &arena, uint32_t count, bool has_z, bool has_m, double seed) {
	auto line = LineString::Create(arena, count, has_z, has_m);
	FillVertices(line, seed);
	return line;
}

static Geometry MakePolygon(ArenaAllocator &arena, bool has_z, bool has_m, double seed) {
	auto polygon = Polygon::Create(arena, 2, has_z, has_m);
	Polygon::Part(polygon, 0) = MakeLine(arena, 4, has_z, has_m, seed);
	Polygon::Part(polygon, 1) = MakeLine(arena, 4, has_z, has_m, seed + 100);
	return polygon;
}

static Geometry MakeSample(ArenaAllocator &arena, GeometryType type, bool has_z, bool has_m) {
	switch (type) {
	case GeometryType::POINT:
		return MakePoint(arena, has_z, has_m, 1);
	case GeometryType::LINESTRING:
		return MakeLine(arena, 3, has_z, has_m, 2);
	case GeometryType::POLYGON:
		return MakePolygon(arena, has_z, has_m, 3);
	case GeometryType::MULTIPOINT: {
		vector<Geometry> parts {MakePoint(arena, has_z, has_m, 4), Point::CreateEmpty(has_z, has_m)};
		return MultiPoint::Create(arena, parts, has_z, has_m);
	}
	case GeometryType::MULTILINESTRING: {
		vector<Geometry> parts {MakeLine(arena, 2, has_z, has_m, 5), MakeLine(arena, 5, has_z, has_m, 6)};
		return MultiLineString::Create(arena, parts, has_z, has_m);
	}
	case GeometryType::MULTIPOLYGON: {
		vector<Geometry> parts {MakePolygon(arena, has_z, has_m, 7), Polygon::CreateEmpty(has_z, has_m)};
		return MultiPolygon::Create(arena, parts, has_z, has_m);
	}
	default: {
		vector<Geometry> nested {MakePoint(arena, has_z, has_m, 8)};
		vector<Geometry> parts {MakePoint(arena, has_z, has_m, 9), MakeLine(arena, 2, has_z, has_m, 10),
		                        MakePolygon(arena, has_z, has_m, 11),
		                        MultiPoint::Create(arena, nested, has_z, has_m)};
		return GeometryCollection::Create(arena, parts, has_z, has_m);
	}
	}
}

//------------------------------------------------------------------------------
// Tests
//------------------------------------------------------------------------------
TEST_CASE("Loads an SRID and dumps it on request", "[wkb]") {
	ArenaAllocator arena(Allocator::DefaultAllocator());
	WKBReader reader(arena);

	auto geom = reader.Deserialize(Hex2Bin(POINT_NDR_4326));
	REQUIRE(geom.GetType() == GeometryType::POINT);
	REQUIRE(geom.HasSRID());
	REQUIRE(geom.GetSRID() == 4326);
	REQUIRE(Point::GetVertex(geom).x == 1.2);
	REQUIRE(Point::GetVertex(geom).y == 3.4);

	// by default the SRID is not exported
	REQUIRE(Bin2Hex(WKBWriter::Write(geom, WKBWriterOptions())) == HostOrder("BIdd", POINT_NDR));

	// include the SRID in the output
	WKBWriterOptions include;
	include.include_srid = true;
	REQUIRE(Bin2Hex(WKBWriter::Write(geom, include)) == HostOrder("BIIdd", POINT_NDR_4326));

	// replace the SRID with another
	WKBWriterOptions replace;
	replace.SetSRID(27700);
	REQUIRE(Bin2Hex(WKBWriter::Write(geom, replace)) == HostOrder("BIIdd", POINT_NDR_27700));
	REQUIRE(geom.GetSRID() == 4326);
}

TEST_CASE("Loads either byte order on any host", "[wkb]") {
	ArenaAllocator arena(Allocator::DefaultAllocator());
	WKBReader reader(arena);

	auto little = reader.DeserializeHex(POINT_NDR);
	auto big = reader.DeserializeHex("00000000013FF3333333333333400B333333333333");
	REQUIRE(Geometry::Equals(little, big));
	REQUIRE(Point::GetVertex(big).x == 1.2);
	REQUIRE(!big.HasSRID());

	// hex digits may be lowercase
	auto lower = reader.DeserializeHex("0101000000333333333333f33f3333333333330b40");
	REQUIRE(Geometry::Equals(little, lower));
}

TEST_CASE("Loads hex dumps", "[wkb][hex]") {
	ArenaAllocator arena(Allocator::DefaultAllocator());
	WKBReader reader(arena);
	auto point = Point::CreateFromVertex(arena, VertexXY(1.2, 3.4));

	WKBWriterOptions options;
	options.hex = true;
	auto restored = reader.DeserializeHex(WKBWriter::Dumps(point, options));
	REQUIRE(Geometry::Equals(point, restored));
}

TEST_CASE("Round trip every geometry type", "[wkb]") {
	ArenaAllocator arena(Allocator::DefaultAllocator());
	WKBReader reader(arena);

	vector<GeometryType> types {GeometryType::POINT,           GeometryType::LINESTRING,   GeometryType::POLYGON,
	                            GeometryType::MULTIPOINT,      GeometryType::MULTILINESTRING,
	                            GeometryType::MULTIPOLYGON,    GeometryType::GEOMETRYCOLLECTION};
	for (auto type : types) {
		for (uint32_t layout = 0; layout < 4; layout++) {
			bool has_z = (layout & 1) != 0;
			bool has_m = (layout & 2) != 0;
			auto geom = MakeSample(arena, type, has_z, has_m);
			auto empty = Geometry::CreateEmpty(type, has_z, has_m);
			INFO(Geometry::ToString(geom));

			for (auto big_endian : {false, true}) {
				WKBWriterOptions options;
				options.SetBigEndian(big_endian);

				REQUIRE(Geometry::Equals(geom, reader.Deserialize(WKBWriter::Write(geom, options))));
				REQUIRE(Geometry::Equals(geom, reader.DeserializeHex(WKBWriter::WriteHex(geom, options))));
				REQUIRE(Geometry::Equals(empty, reader.Deserialize(WKBWriter::Write(empty, options))));
				REQUIRE(reader.GeomHasZ() == has_z);
				REQUIRE(reader.GeomHasM() == has_m);

				auto with_srid = geom;
				with_srid.SetSRID(4326);
				options.include_srid = true;
				REQUIRE(Geometry::Equals(with_srid, reader.Deserialize(WKBWriter::Write(with_srid, options))));
			}
		}
	}
}

TEST_CASE("Loads empty points", "[wkb]") {
	ArenaAllocator arena(Allocator::DefaultAllocator());
	WKBReader reader(arena);

	auto empty = reader.DeserializeHex("0101000000000000000000F87F000000000000F87F");
	REQUIRE(empty.GetType() == GeometryType::POINT);
	REQUIRE(Geometry::IsEmpty(empty));
	REQUIRE(empty.Count() == 0);

	auto empty_z = reader.DeserializeHex("0101000080000000000000F87F000000000000F87F000000000000F87F");
	REQUIRE(Geometry::IsEmpty(empty_z));
	REQUIRE(empty_z.GetProperties().HasZ());
	REQUIRE(Geometry::ToString(empty_z) == "POINT Z EMPTY");

	// a single NaN ordinate does not make a point empty
	auto half_nan = reader.DeserializeHex("0101000000000000000000F87F0000000000000000");
	REQUIRE(half_nan.Count() == 1);
	REQUIRE(std::isnan(Point::GetVertex(half_nan).x));
}

TEST_CASE("Loads ISO type codes", "[wkb]") {
	ArenaAllocator arena(Allocator::DefaultAllocator());
	WKBReader reader(arena);
	auto point_zm = Point::CreateFromVertex(arena, VertexXYZM(1, 2, 3, 4));

	WKBWriterOptions options;
	options.flavor = WKBFlavor::ISO;
	options.SetBigEndian(false);
	auto hex = WKBWriter::WriteHex(point_zm, options);
	REQUIRE(hex.substr(0, 10) == "01B90B0000");
	REQUIRE(Geometry::Equals(point_zm, reader.DeserializeHex(hex)));

	auto point_z = reader.DeserializeHex("01E9030000000000000000F03F00000000000000400000000000000840");
	REQUIRE(point_z.GetProperties().HasZ());
	REQUIRE(!point_z.GetProperties().HasM());
	REQUIRE(Point::GetVertex<VertexXYZ>(point_z).z == 3);
}

TEST_CASE("Nested SRIDs are skipped", "[wkb]") {
	ArenaAllocator arena(Allocator::DefaultAllocator());
	WKBReader reader(arena);

	// MULTIPOINT without SRID holding a POINT with SRID 3857
	auto geom = reader.DeserializeHex("000000000400000001"
	                                  "0020000001"
	                                  "00000F11"
	                                  "3FF00000000000004000000000000000");
	REQUIRE(!geom.HasSRID());
	REQUIRE(geom.Count() == 1);
	REQUIRE(!MultiPoint::Part(geom, 0).HasSRID());
	REQUIRE(Point::GetVertex(MultiPoint::Part(geom, 0)).y == 2);
}

TEST_CASE("Malformed input raises a WKBReadingException", "[wkb]") {
	ArenaAllocator arena(Allocator::DefaultAllocator());
	WKBReader reader(arena);

	// empty and truncated input
	REQUIRE_THROWS_AS(reader.Deserialize(vector<data_t>()), WKBReadingException);
	REQUIRE_THROWS_AS(reader.DeserializeHex(POINT_NDR.substr(0, POINT_NDR.size() - 2)), WKBReadingException);
	REQUIRE_THROWS_AS(reader.DeserializeHex("0101000000"), WKBReadingException);

	// bad byte order flag
	REQUIRE_THROWS_AS(reader.DeserializeHex("02" + POINT_NDR.substr(2)), WKBReadingException);

	// unknown type codes
	REQUIRE_THROWS_AS(reader.DeserializeHex("0108000000"), WKBReadingException);
	REQUIRE_THROWS_AS(reader.DeserializeHex("0100000000"), WKBReadingException);
	REQUIRE_THROWS_AS(reader.DeserializeHex("01A10F0000"), WKBReadingException);

	// trailing bytes
	REQUIRE_THROWS_AS(reader.DeserializeHex(POINT_NDR + "00"), WKBReadingException);

	// a vertex count far larger than the input
	REQUIRE_THROWS_AS(reader.DeserializeHex("0102000000FFFFFFFF"), WKBReadingException);

	// a multipoint holding an empty linestring
	REQUIRE_THROWS_AS(reader.DeserializeHex("010400000001000000010200000000000000"), WKBReadingException);

	// hex problems
	REQUIRE_THROWS_AS(reader.DeserializeHex(POINT_NDR + "0"), WKBReadingException);
	REQUIRE_THROWS_AS(reader.DeserializeHex("XX" + POINT_NDR.substr(2)), WKBReadingException);
}

// Geometry collections nested inside each other, the innermost one empty
static string NestedCollections(uint32_t levels) {
	string hex;
	for (uint32_t i = 1; i < levels; i++) {
		hex += "010700000001000000";
	}
	return hex + "010700000000000000";
}

TEST_CASE("Deeply nested collections are rejected", "[wkb]") {
	ArenaAllocator arena(Allocator::DefaultAllocator());
	WKBReader reader(arena);

	auto deepest = reader.DeserializeHex(NestedCollections(WKBReader::MAX_DEPTH));
	REQUIRE(deepest.GetType() == GeometryType::GEOMETRYCOLLECTION);
	uint32_t levels = 1;
	for (auto geom = deepest; geom.Count() > 0; geom = GeometryCollection::Part(geom, 0)) {
		levels++;
	}
	REQUIRE(levels == WKBReader::MAX_DEPTH);

	REQUIRE_THROWS_AS(reader.DeserializeHex(NestedCollections(WKBReader::MAX_DEPTH + 1)), WKBReadingException);
	// far too deep to recurse through
	REQUIRE_THROWS_AS(reader.DeserializeHex(NestedCollections(100000)), WKBReadingException);
}

TEST_CASE("Inputs beyond 4 GiB are rejected", "[wkb]") {
	ArenaAllocator arena(Allocator::DefaultAllocator());
	WKBReader reader(arena);

	// the size is checked before any byte is read
	auto bytes = Hex2Bin(POINT_NDR);
	auto too_large = idx_t(NumericLimits<uint32_t>::Maximum()) + 1;
	REQUIRE_THROWS_AS(reader.Deserialize(bytes.data(), too_large), WKBReadingException);
	REQUIRE(Point::GetVertex(reader.Deserialize(bytes.data(), bytes.size())).x == 1.2);
}

TEST_CASE("Bytes and hex do not pass for each other", "[wkb][hex]") {
	ArenaAllocator arena(Allocator::DefaultAllocator());
	WKBReader reader(arena);

	// hex text handed to the binary path: '0' is not a byte order flag
	REQUIRE_THROWS_AS(reader.Deserialize(POINT_NDR), WKBReadingException);

	// raw bytes handed to the hex path
	auto bytes = Hex2Bin(POINT_NDR);
	REQUIRE_THROWS_AS(reader.DeserializeHex(string(const_char_ptr_cast(bytes.data()), bytes.size())),
	                  WKBReadingException);
}
