#pragma once
#include "geowkb/common.hpp"
#include "geowkb/core/geometry/geometry.hpp"
#include "geowkb/core/util/byte_order.hpp"
#include "geos_c.h"

namespace geowkb {

namespace geos {

using namespace core;

template <class T>
struct GeosDeleter {
	GEOSContextHandle_t ctx;
	void operator()(T *ptr) const = delete;
};

template <>
struct GeosDeleter<GEOSGeometry> {
	GEOSContextHandle_t ctx;
	void operator()(GEOSGeometry *ptr) const {
		GEOSGeom_destroy_r(ctx, ptr);
	}
};

template <class T>
unique_ptr<T, GeosDeleter<T>> make_uniq_geos(GEOSContextHandle_t ctx, T *ptr) {
	return unique_ptr<T, GeosDeleter<T>>(ptr, GeosDeleter<T> {ctx});
}

using GeometryPtr = unique_ptr<GEOSGeometry, GeosDeleter<GEOSGeometry>>;

//------------------------------------------------------------------------------
// Capabilities
//------------------------------------------------------------------------------
// What the linked GEOS library can do, derived from its runtime version
struct GeometryEngineCapabilities {
	string version;
	int major = 0;
	int minor = 0;
	int patch = 0;
	// POINT EMPTY can be written to WKB (as NaN ordinates) and read back, GEOS >= 3.9.0
	bool empty_point_wkb = false;
	// M ordinates survive a WKB round trip through GEOS, GEOS >= 3.12.0
	bool wkb_m_ordinates = false;

	bool AtLeast(int major_p, int minor_p, int patch_p) const;

	// Parse a GEOSversion() string such as "3.12.1-CAPI-1.18.1"
	static GeometryEngineCapabilities FromVersion(const string &version);
};

//------------------------------------------------------------------------------
// WKB Reader / Writer
//------------------------------------------------------------------------------
struct WKBReader {
	GEOSContextHandle_t ctx;
	GEOSWKBReader_t *reader;

	explicit WKBReader(GEOSContextHandle_t ctx) : ctx(ctx) {
		reader = GEOSWKBReader_create_r(ctx);
	}

	WKBReader(const WKBReader &) = delete;
	WKBReader(WKBReader &&other) noexcept : ctx(other.ctx), reader(other.reader) {
		other.reader = nullptr;
	}

	GeometryPtr Read(const_data_ptr_t wkb, size_t size) const {
		auto geom = GEOSWKBReader_read_r(ctx, reader, wkb, size);
		if (!geom) {
			throw InvalidInputException("Could not read WKB");
		}
		return make_uniq_geos(ctx, geom);
	}

	GeometryPtr Read(const vector<data_t> &wkb) const {
		return Read(wkb.data(), wkb.size());
	}

	~WKBReader() {
		if (reader) {
			GEOSWKBReader_destroy_r(ctx, reader);
		}
	}
};

struct WKBWriter {
	GEOSContextHandle_t ctx;
	GEOSWKBWriter_t *writer;

	explicit WKBWriter(GEOSContextHandle_t ctx) : ctx(ctx) {
		writer = GEOSWKBWriter_create_r(ctx);
	}

	WKBWriter(const WKBWriter &) = delete;
	WKBWriter(WKBWriter &&other) noexcept : ctx(other.ctx), writer(other.writer) {
		other.writer = nullptr;
	}

	void SetOutputDimension(int dimension) const {
		GEOSWKBWriter_setOutputDimension_r(ctx, writer, dimension);
	}

	void SetByteOrder(WKBByteOrder order) const {
		GEOSWKBWriter_setByteOrder_r(ctx, writer, static_cast<int>(order));
	}

	void SetIncludeSRID(bool include_srid) const {
		GEOSWKBWriter_setIncludeSRID_r(ctx, writer, include_srid ? 1 : 0);
	}

	vector<data_t> Write(const GEOSGeometry *geom) const {
		size_t size = 0;
		auto wkb = GEOSWKBWriter_write_r(ctx, writer, geom, &size);
		if (!wkb) {
			throw InvalidInputException("Could not write WKB");
		}
		vector<data_t> result(wkb, wkb + size);
		GEOSFree_r(ctx, wkb);
		return result;
	}

	~WKBWriter() {
		if (writer) {
			GEOSWKBWriter_destroy_r(ctx, writer);
		}
	}
};

//------------------------------------------------------------------------------
// Context
//------------------------------------------------------------------------------
struct GeosContextWrapper {
private:
	GEOSContextHandle_t ctx;

public:
	GeosContextWrapper() {
		ctx = GEOS_init_r();
		GEOSContext_setErrorMessageHandler_r(ctx, ErrorHandler, (void *)nullptr);
	}
	~GeosContextWrapper() {
		GEOS_finish_r(ctx);
	}

	GeosContextWrapper(const GeosContextWrapper &) = delete;
	GeosContextWrapper &operator=(const GeosContextWrapper &) = delete;

	static void ErrorHandler(const char *message, void *userdata) {
		throw InvalidInputException(message);
	}

	inline const GEOSContextHandle_t &GetCtx() {
		return ctx;
	}

	// Capabilities of the linked GEOS library, computed on first use
	static GeometryEngineCapabilities GetCapabilities();

	WKBReader CreateWKBReader() const {
		return WKBReader(ctx);
	}

	WKBWriter CreateWKBWriter() const {
		return WKBWriter(ctx);
	}

	// Hand a geometry to GEOS, keeping its SRID
	GeometryPtr ToGEOS(const Geometry &geom) const;

	// Take a geometry back from GEOS, allocating it in the arena
	Geometry FromGEOS(const GEOSGeometry *geom, ArenaAllocator &arena) const;
};

} // namespace geos

} // namespace geowkb
