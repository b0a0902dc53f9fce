#ifndef UTILS_H_
#define UTILS_H_

#include <cstdint>
#include <type_traits>

// Character predicates that are safe for UTF-16 code units. The <cctype>
// family is only defined for values representable as unsigned char, so these
// are written out for the ranges the engine cares about.

template <class Integer>
using IsInteger = std::enable_if_t<std::is_integral<Integer>::value>;

template <class Ch, class = IsInteger<Ch>>
constexpr bool safe_isascii(Ch ch) noexcept {
	return static_cast<uint32_t>(ch) < 0x80;
}

template <class Ch, class = IsInteger<Ch>>
constexpr bool safe_isdigit(Ch ch) noexcept {
	return ch >= '0' && ch <= '9';
}

template <class Ch, class = IsInteger<Ch>>
constexpr bool safe_isoctal(Ch ch) noexcept {
	return ch >= '0' && ch <= '7';
}

template <class Ch, class = IsInteger<Ch>>
constexpr bool safe_isxdigit(Ch ch) noexcept {
	return safe_isdigit(ch) || (ch >= 'a' && ch <= 'f') || (ch >= 'A' && ch <= 'F');
}

template <class Ch, class = IsInteger<Ch>>
constexpr bool safe_isalpha(Ch ch) noexcept {
	return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z');
}

/**
 * @brief Word characters as seen by `\w` and `\b`, i.e. [A-Za-z0-9_].
 */
template <class Ch, class = IsInteger<Ch>>
constexpr bool safe_isword(Ch ch) noexcept {
	return safe_isalpha(ch) || safe_isdigit(ch) || ch == '_';
}

/**
 * @brief Line terminators as seen by `.`, `^` and `$` in multiline mode.
 */
template <class Ch, class = IsInteger<Ch>>
constexpr bool is_line_terminator(Ch ch) noexcept {
	return ch == '\n' || ch == '\r' || ch == 0x2028 || ch == 0x2029;
}

/**
 * @brief White space and line terminators as seen by `\s`.
 */
template <class Ch, class = IsInteger<Ch>>
constexpr bool safe_isspace(Ch ch) noexcept {
	switch (static_cast<uint32_t>(ch)) {
	case 0x0009:
	case 0x000a:
	case 0x000b:
	case 0x000c:
	case 0x000d:
	case 0x0020:
	case 0x00a0:
	case 0x1680:
	case 0x2028:
	case 0x2029:
	case 0x202f:
	case 0x205f:
	case 0x3000:
	case 0xfeff:
		return true;
	default:
		return ch >= 0x2000 && ch <= 0x200a;
	}
}

/**
 * @brief Returns the value of a hexadecimal digit, or -1 if `ch` is not one.
 */
template <class Ch, class = IsInteger<Ch>>
constexpr int hex_value(Ch ch) noexcept {
	if (safe_isdigit(ch)) {
		return ch - '0';
	}

	if (ch >= 'a' && ch <= 'f') {
		return ch - 'a' + 10;
	}

	if (ch >= 'A' && ch <= 'F') {
		return ch - 'A' + 10;
	}

	return -1;
}

#endif
