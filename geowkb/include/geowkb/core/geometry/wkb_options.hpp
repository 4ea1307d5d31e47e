#pragma once
#include "geowkb/common.hpp"
#include "geowkb/core/util/byte_order.hpp"

namespace geowkb {

namespace core {

enum class WKBFlavor : uint8_t {
	// PostGIS style: Z, M and SRID are flagged in the high bits of the type code
	EXTENDED = 0,
	// ISO SQL/MM: Z and M add 1000, 2000 or 3000 to the type code, no SRID
	ISO = 1,
};

struct WKBWriterOptions {
	// Byte order of everything after the flag byte, defaults to the host order
	WKBByteOrder byte_order = WKBByteOrderUtil::Native();
	// Render the output as uppercase hex digit pairs instead of raw bytes
	bool hex = false;
	// Emit the SRID the geometry already carries
	bool include_srid = false;
	// Emit this SRID instead of the one the geometry carries
	bool has_srid = false;
	int32_t srid = 0;
	// Number of ordinates written per vertex (2, 3 or 4). Ordinates the geometry lacks are never made up,
	// and when the dimension is lowered Z is kept before M.
	uint32_t output_dimension = 4;
	WKBFlavor flavor = WKBFlavor::EXTENDED;

	void SetBigEndian(bool big_endian) {
		byte_order = WKBByteOrderUtil::FromBigEndian(big_endian);
	}

	void SetSRID(int32_t srid_p) {
		srid = srid_p;
		has_srid = true;
	}

	// Throws an EncodingException if the combination of options can not be written
	void Verify() const;
};

} // namespace core

} // namespace geowkb
