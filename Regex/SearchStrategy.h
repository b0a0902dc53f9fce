#ifndef SEARCH_STRATEGY_H_
#define SEARCH_STRATEGY_H_

#include "Constants.h"

#include <array>
#include <bitset>
#include <cstdint>
#include <string>
#include <variant>

enum class SearchAlgorithm {
	None,
	ExactSlow,
	ExactSlowCaseInsensitive,
	BoyerMoore,
	CharacterMap,
};

// Every position is a candidate.
struct SearchNone {
};

// Candidates are found by comparing the exact run at each position.
struct SearchExactSlow {
	std::u16string exact;
};

// Like SearchExactSlow, `exact` holds case folded code units.
struct SearchExactSlowIC {
	std::u16string exact;
};

// Boyer-Moore-Horspool over the exact run. The skip table is indexed by the
// low byte of a code unit.
struct SearchBoyerMoore {
	std::u16string exact;
	std::array<uint32_t, CharTableSize> skip;
};

// A candidate must have a code unit whose low byte is in `map`.
struct SearchCharacterMap {
	std::bitset<CharTableSize> map;
};

// The alternatives are in the order of SearchAlgorithm.
using SearchStrategy = std::variant<SearchNone, SearchExactSlow, SearchExactSlowIC, SearchBoyerMoore, SearchCharacterMap>;

inline SearchAlgorithm AlgorithmOf(const SearchStrategy &strategy) noexcept {
	return static_cast<SearchAlgorithm>(strategy.index());
}

const char *AlgorithmName(SearchAlgorithm algorithm) noexcept;

#endif
