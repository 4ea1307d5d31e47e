#pragma once
#include "geowkb/common.hpp"

namespace geowkb {

namespace core {

// The values match the byte order flag stored in the first byte of every WKB geometry
enum class WKBByteOrder : uint8_t {
	XDR = 0, // Big endian
	NDR = 1, // Little endian
};

struct WKBByteOrderUtil {
	static WKBByteOrder Native() {
		const uint16_t probe = 1;
		uint8_t first_byte;
		memcpy(&first_byte, &probe, sizeof(uint8_t));
		return first_byte == 1 ? WKBByteOrder::NDR : WKBByteOrder::XDR;
	}

	static bool IsNative(WKBByteOrder order) {
		return order == Native();
	}

	static WKBByteOrder FromBigEndian(bool big_endian) {
		return big_endian ? WKBByteOrder::XDR : WKBByteOrder::NDR;
	}

	static bool IsValidFlag(uint8_t flag) {
		return flag == static_cast<uint8_t>(WKBByteOrder::XDR) || flag == static_cast<uint8_t>(WKBByteOrder::NDR);
	}

	static string ToString(WKBByteOrder order) {
		switch (order) {
		case WKBByteOrder::XDR:
			return "XDR";
		case WKBByteOrder::NDR:
			return "NDR";
		default:
			return StringUtil::Format("UNKNOWN(%d)", static_cast<int>(order));
		}
	}
};

} // namespace core

} // namespace geowkb
