#pragma once
#include "geowkb/common.hpp"

namespace geowkb {

namespace core {

// Raised by the WKB writer when a geometry or a set of writer options cannot be encoded
class EncodingException : public InvalidInputException {
public:
	explicit EncodingException(const string &msg) : InvalidInputException("WKB encoding error: " + msg) {
	}

	template <typename... ARGS>
	explicit EncodingException(const string &msg, ARGS... params)
	    : EncodingException(ConstructMessage(msg, params...)) {
	}
};

// Raised by the WKB reader on malformed, truncated or otherwise undecodable input
class WKBReadingException : public InvalidInputException {
public:
	explicit WKBReadingException(const string &msg) : InvalidInputException("WKB reading error: " + msg) {
	}

	template <typename... ARGS>
	explicit WKBReadingException(const string &msg, ARGS... params)
	    : WKBReadingException(ConstructMessage(msg, params...)) {
	}
};

} // namespace core

} // namespace geowkb
