#ifndef CASE_FOLD_H_
#define CASE_FOLD_H_

#include "Options.h"

char16_t ToUpperCase(char16_t ch, CaseFold mode) noexcept;
char16_t ToLowerCase(char16_t ch, CaseFold mode) noexcept;

/**
 * @brief The canonical form used for case-insensitive comparison. Like
 * ECMAScript's Canonicalize(), this is the upper case form.
 */
inline char16_t FoldCase(char16_t ch, CaseFold mode) noexcept {
	return ToUpperCase(ch, mode);
}

inline bool EqualsIgnoreCase(char16_t a, char16_t b, CaseFold mode) noexcept {
	return a == b || FoldCase(a, mode) == FoldCase(b, mode);
}

#endif
