#pragma once
#include "geowkb/common.hpp"
#include "geowkb/core/util/byte_order.hpp"

namespace geowkb {

namespace core {

// Bounded read/write position over a byte buffer.
// Multi-byte values can be read and written in either byte order, independent of the host order.
class Cursor {
private:
	data_ptr_t start;
	data_ptr_t ptr;
	data_ptr_t end;

	template <class T>
	static T Swap(T value) {
		uint8_t in[sizeof(T)];
		uint8_t out[sizeof(T)];
		memcpy(in, &value, sizeof(T));
		for (size_t i = 0; i < sizeof(T); i++) {
			out[i] = in[sizeof(T) - i - 1];
		}
		T swapped;
		memcpy(&swapped, out, sizeof(T));
		return swapped;
	}

public:
	explicit Cursor(data_ptr_t start, data_ptr_t end) : start(start), ptr(start), end(end) {
	}

	uint32_t Remaining() const {
		D_ASSERT(ptr <= end);
		return static_cast<uint32_t>(end - ptr);
	}

	uint32_t Position() const {
		return static_cast<uint32_t>(ptr - start);
	}

	template <class T>
	T Read() {
		static_assert(std::is_trivially_copyable<T>::value, "T must be trivially copyable");
		if (ptr + sizeof(T) > end) {
			throw SerializationException("Trying to read past end of buffer");
		}
		auto result = Load<T>(ptr);
		ptr += sizeof(T);
		return result;
	}

	template <class T>
	T Read(WKBByteOrder order) {
		static_assert(std::is_floating_point<T>::value || std::is_integral<T>::value,
		              "T must be a floating point or integral type");
		auto value = Read<T>();
		return WKBByteOrderUtil::IsNative(order) ? value : Swap(value);
	}

	template <class T>
	void Write(T value) {
		static_assert(std::is_trivially_copyable<T>::value, "T must be trivially copyable");
		if (ptr + sizeof(T) > end) {
			throw SerializationException("Trying to write past end of buffer");
		}
		Store<T>(value, ptr);
		ptr += sizeof(T);
	}

	template <class T>
	void Write(T value, WKBByteOrder order) {
		static_assert(std::is_floating_point<T>::value || std::is_integral<T>::value,
		              "T must be a floating point or integral type");
		Write<T>(WKBByteOrderUtil::IsNative(order) ? value : Swap(value));
	}
};

} // namespace core

} // namespace geowkb
