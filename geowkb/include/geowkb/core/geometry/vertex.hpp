#pragma once

#include "geowkb/common.hpp"

namespace geowkb {

namespace core {

struct VertexXY {
	static const constexpr bool HAS_Z = false;
	static const constexpr bool HAS_M = false;

	double x;
	double y;

	VertexXY() = default;
	VertexXY(double x, double y) : x(x), y(y) {
	}
};

struct VertexXYZ {
	static const constexpr bool HAS_Z = true;
	static const constexpr bool HAS_M = false;

	double x;
	double y;
	double z;

	VertexXYZ() = default;
	VertexXYZ(double x, double y, double z) : x(x), y(y), z(z) {
	}
};

struct VertexXYM {
	static const constexpr bool HAS_Z = false;
	static const constexpr bool HAS_M = true;

	double x;
	double y;
	double m;

	VertexXYM() = default;
	VertexXYM(double x, double y, double m) : x(x), y(y), m(m) {
	}
};

struct VertexXYZM {
	static const constexpr bool HAS_Z = true;
	static const constexpr bool HAS_M = true;

	double x;
	double y;
	double z;
	double m;

	VertexXYZM() = default;
	VertexXYZM(double x, double y, double z, double m) : x(x), y(y), z(z), m(m) {
	}
};

static_assert(sizeof(VertexXY) == 2 * sizeof(double), "VertexXY must be tightly packed");
static_assert(sizeof(VertexXYZ) == 3 * sizeof(double), "VertexXYZ must be tightly packed");
static_assert(sizeof(VertexXYM) == 3 * sizeof(double), "VertexXYM must be tightly packed");
static_assert(sizeof(VertexXYZM) == 4 * sizeof(double), "VertexXYZM must be tightly packed");

} // namespace core

} // namespace geowkb
