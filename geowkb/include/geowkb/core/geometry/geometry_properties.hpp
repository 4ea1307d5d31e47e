#pragma once
#include "geowkb/common.hpp"

namespace geowkb {

namespace core {

struct GeometryProperties {
private:
	static constexpr const uint8_t Z = 0x01;
	static constexpr const uint8_t M = 0x02;
	static constexpr const uint8_t SRID = 0x04;
	uint8_t flags = 0;

public:
	explicit GeometryProperties(uint8_t flags = 0) : flags(flags) {
	}
	GeometryProperties(bool has_z, bool has_m) {
		SetZ(has_z);
		SetM(has_m);
	}

	inline bool HasZ() const {
		return (flags & Z) != 0;
	}
	inline bool HasM() const {
		return (flags & M) != 0;
	}
	inline bool HasSRID() const {
		return (flags & SRID) != 0;
	}
	inline void SetZ(bool value) {
		flags = value ? (flags | Z) : (flags & ~Z);
	}
	inline void SetM(bool value) {
		flags = value ? (flags | M) : (flags & ~M);
	}
	inline void SetSRID(bool value) {
		flags = value ? (flags | SRID) : (flags & ~SRID);
	}

	uint32_t Dimensions() const {
		return 2 + HasZ() + HasM();
	}

	uint32_t VertexSize() const {
		return sizeof(double) * Dimensions();
	}

	// Same vertex layout, the SRID flag is not part of it
	bool SameLayout(const GeometryProperties &other) const {
		return HasZ() == other.HasZ() && HasM() == other.HasM();
	}
};

} // namespace core

} // namespace geowkb
