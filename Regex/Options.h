#ifndef OPTIONS_H_
#define OPTIONS_H_

#include <cstdint>

// Option bits accepted by the Regex constructor.
enum RE_OPTION : uint32_t {
	RE_OPTION_NONE               = 0,
	RE_OPTION_SINGLELINE         = 1u << 0, // '^' and '$' only match at the buffer boundaries
	RE_OPTION_IGNORECASE         = 1u << 1,
	RE_OPTION_NEGATE_SINGLELINE  = 1u << 2, // multiline: '^' and '$' match at line boundaries
	RE_OPTION_DONT_CAPTURE_GROUP = 1u << 3, // plain (...) does not capture, named groups still do
	RE_OPTION_CAPTURE_GROUP      = 1u << 4, // plain (...) captures; this is also the default, the bit only conflicts with DONT_CAPTURE_GROUP
};

// Rule set used to compare characters regardless of case.
enum class CaseFold {
	Ascii,  // only [A-Za-z]
	Simple, // one-to-one mappings for Latin, Greek and Cyrillic
};

#endif
