
#include "CaseFold.h"

namespace {

/*
 * Latin Extended-A is organized as upper/lower pairs. Most blocks put the
 * upper case letter on the even code point, 0x0139-0x0148 and 0x0179-0x017E
 * put it on the odd one. 0x0130, 0x0131, 0x0138, 0x0149 and 0x017F have no
 * partner that is allowed by the canonicalization rules.
 */
bool isLatinExtendedPair(char16_t ch) noexcept {
	return (ch >= 0x0100 && ch <= 0x012f) ||
		   (ch >= 0x0132 && ch <= 0x0137) ||
		   (ch >= 0x0139 && ch <= 0x0148) ||
		   (ch >= 0x014a && ch <= 0x0177) ||
		   (ch >= 0x0179 && ch <= 0x017e);
}

bool isOddUpper(char16_t ch) noexcept {
	return (ch >= 0x0139 && ch <= 0x0148) || (ch >= 0x0179 && ch <= 0x017e);
}

}

/**
 * @brief Maps a code unit to its upper case form.
 *
 * @param ch The code unit.
 * @param mode The case folding rules.
 * @return The upper case form, or `ch` if it has none. Non-ASCII characters
 * never map to ASCII ones.
 */
char16_t ToUpperCase(char16_t ch, CaseFold mode) noexcept {

	if (ch >= 'a' && ch <= 'z') {
		return static_cast<char16_t>(ch - 0x20);
	}

	if (ch < 0x80 || mode == CaseFold::Ascii) {
		return ch;
	}

	// Latin-1 Supplement
	if (ch >= 0x00e0 && ch <= 0x00fe && ch != 0x00f7) {
		return static_cast<char16_t>(ch - 0x20);
	}

	switch (ch) {
	case 0x00b5: // micro sign
		return 0x039c;
	case 0x00ff:
		return 0x0178;
	case 0x03c2: // final sigma
		return 0x03a3;
	default:
		break;
	}

	if (isLatinExtendedPair(ch)) {
		const bool odd = (ch & 1) != 0;
		if (isOddUpper(ch)) {
			return odd ? ch : static_cast<char16_t>(ch - 1);
		}

		return odd ? static_cast<char16_t>(ch - 1) : ch;
	}

	// Greek
	if (ch >= 0x03b1 && ch <= 0x03c9) {
		return static_cast<char16_t>(ch - 0x20);
	}

	// Cyrillic
	if (ch >= 0x0430 && ch <= 0x044f) {
		return static_cast<char16_t>(ch - 0x20);
	}

	if (ch >= 0x0450 && ch <= 0x045f) {
		return static_cast<char16_t>(ch - 0x50);
	}

	return ch;
}

/**
 * @brief Maps a code unit to its lower case form.
 *
 * @param ch The code unit.
 * @param mode The case folding rules.
 * @return The lower case form, or `ch` if it has none.
 */
char16_t ToLowerCase(char16_t ch, CaseFold mode) noexcept {

	if (ch >= 'A' && ch <= 'Z') {
		return static_cast<char16_t>(ch + 0x20);
	}

	if (ch < 0x80 || mode == CaseFold::Ascii) {
		return ch;
	}

	if (ch >= 0x00c0 && ch <= 0x00de && ch != 0x00d7) {
		return static_cast<char16_t>(ch + 0x20);
	}

	if (ch == 0x0178) {
		return 0x00ff;
	}

	if (isLatinExtendedPair(ch)) {
		const bool odd = (ch & 1) != 0;
		if (isOddUpper(ch)) {
			return odd ? static_cast<char16_t>(ch + 1) : ch;
		}

		return odd ? ch : static_cast<char16_t>(ch + 1);
	}

	if (ch >= 0x0391 && ch <= 0x03a9 && ch != 0x03a2) {
		return static_cast<char16_t>(ch + 0x20);
	}

	if (ch >= 0x0410 && ch <= 0x042f) {
		return static_cast<char16_t>(ch + 0x20);
	}

	if (ch >= 0x0400 && ch <= 0x040f) {
		return static_cast<char16_t>(ch + 0x50);
	}

	return ch;
}
