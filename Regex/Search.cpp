
#include "Search.h"
#include "CaseFold.h"

#include <algorithm>

namespace {

constexpr size_t npos = std::u16string_view::npos;

/**
 * @brief Clamps the last candidate so that a run of `length` code units
 * starting there still fits in the text.
 *
 * @return false if no candidate remains.
 */
bool ClampLast(std::u16string_view text, size_t from, size_t length, size_t &last) noexcept {
	if (length > text.size()) {
		return false;
	}

	last = std::min(last, text.size() - length);
	return from <= last;
}

}

size_t FindExactSlow(std::u16string_view text, size_t from, size_t last, const SearchExactSlow &search) noexcept {
	const std::u16string_view exact = search.exact;

	if (!ClampLast(text, from, exact.size(), last)) {
		return npos;
	}

	for (size_t q = from; q <= last; ++q) {
		if (text.compare(q, exact.size(), exact) == 0) {
			return q;
		}
	}

	return npos;
}

size_t FindExactSlowIC(std::u16string_view text, size_t from, size_t last, const SearchExactSlowIC &search, CaseFold caseFold) noexcept {
	const std::u16string_view exact = search.exact;

	if (!ClampLast(text, from, exact.size(), last)) {
		return npos;
	}

	for (size_t q = from; q <= last; ++q) {
		size_t i = 0;
		while (i < exact.size() && FoldCase(text[q + i], caseFold) == exact[i]) {
			++i;
		}

		if (i == exact.size()) {
			return q;
		}
	}

	return npos;
}

/**
 * @brief Boyer-Moore-Horspool search. The window is compared right to left;
 * on a mismatch it shifts by the skip entry of the code unit under the last
 * position of the window.
 */
size_t FindBoyerMoore(std::u16string_view text, size_t from, size_t last, const SearchBoyerMoore &search) noexcept {
	const std::u16string_view exact = search.exact;
	const size_t length             = exact.size();

	if (length == 0 || !ClampLast(text, from, length, last)) {
		return npos;
	}

	size_t q = from;
	while (q <= last) {
		size_t i = length - 1;
		while (text[q + i] == exact[i]) {
			if (i == 0) {
				return q;
			}
			--i;
		}

		q += search.skip[text[q + length - 1] & 0xff];
	}

	return npos;
}

size_t FindCharacterMap(std::u16string_view text, size_t from, size_t last, const SearchCharacterMap &search) noexcept {
	if (!ClampLast(text, from, 1, last)) {
		return npos;
	}

	for (size_t q = from; q <= last; ++q) {
		if (search.map.test(text[q] & 0xff)) {
			return q;
		}
	}

	return npos;
}
