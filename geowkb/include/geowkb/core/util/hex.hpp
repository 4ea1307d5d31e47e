#pragma once
#include "geowkb/common.hpp"

namespace geowkb {

namespace core {

struct HexUtil {
	// Render every byte as two uppercase hex digits, no separators and no prefix
	static string Encode(const_data_ptr_t data, idx_t size);
	static string Encode(const vector<data_t> &data);

	// Parse hex digit pairs (either case) back into bytes.
	// Throws a WKBReadingException on odd length or non-hex characters.
	static vector<data_t> Decode(const char *hex, idx_t size);
	static vector<data_t> Decode(const string &hex);
};

} // namespace core

} // namespace geowkb
