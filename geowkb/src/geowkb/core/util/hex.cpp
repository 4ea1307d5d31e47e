#include "geowkb/common.hpp"
#include "geowkb/core/util/hex.hpp"
#include "geowkb/core/exception.hpp"

namespace geowkb {

namespace core {

string HexUtil::Encode(const_data_ptr_t data, idx_t size) {
	string result;
	result.resize(size * 2); // every byte is rendered as two characters

	idx_t str_idx = 0;
	for (idx_t i = 0; i < size; i++) {
		auto byte = data[i];
		result[str_idx++] = Blob::HEX_TABLE[byte >> 4];
		result[str_idx++] = Blob::HEX_TABLE[byte & 0x0F];
	}
	return result;
}

string HexUtil::Encode(const vector<data_t> &data) {
	return Encode(data.data(), data.size());
}

vector<data_t> HexUtil::Decode(const char *hex, idx_t size) {
	if (size % 2 == 1) {
		throw WKBReadingException("Invalid HEX WKB string, length must be even.");
	}

	auto hex_ptr = const_data_ptr_cast(hex);
	vector<data_t> result(size / 2);
	idx_t blob_idx = 0;
	for (idx_t hex_idx = 0; hex_idx < size; hex_idx += 2) {
		auto byte_a = Blob::HEX_MAP[hex_ptr[hex_idx]];
		auto byte_b = Blob::HEX_MAP[hex_ptr[hex_idx + 1]];
		if (byte_a == -1 || byte_b == -1) {
			throw WKBReadingException("Invalid HEX WKB string, non-hex character at position %d", hex_idx);
		}
		result[blob_idx++] = static_cast<data_t>((byte_a << 4) + byte_b);
	}
	return result;
}

vector<data_t> HexUtil::Decode(const string &hex) {
	return Decode(hex.c_str(), hex.size());
}

} // namespace core

} // namespace geowkb
