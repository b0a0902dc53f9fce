#ifndef SEARCH_H_
#define SEARCH_H_

#include "Options.h"
#include "SearchStrategy.h"

#include <cstddef>
#include <string_view>

// Each function returns the first position q in [from, last] at which the
// searched item starts, or std::u16string_view::npos.

size_t FindExactSlow(std::u16string_view text, size_t from, size_t last, const SearchExactSlow &search) noexcept;
size_t FindExactSlowIC(std::u16string_view text, size_t from, size_t last, const SearchExactSlowIC &search, CaseFold caseFold) noexcept;
size_t FindBoyerMoore(std::u16string_view text, size_t from, size_t last, const SearchBoyerMoore &search) noexcept;
size_t FindCharacterMap(std::u16string_view text, size_t from, size_t last, const SearchCharacterMap &search) noexcept;

#endif
