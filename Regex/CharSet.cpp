
#include "CharSet.h"
#include "CaseFold.h"

#include <algorithm>
#include <cstdint>
#include <utility>

/**
 * @brief Adds a single code unit to the set.
 *
 * @param ch The code unit.
 */
void CharSet::add(char16_t ch) {
	addRange(ch, ch);
}

/**
 * @brief Adds the inclusive range [first, last] to the set.
 *
 * @param first The first code unit of the range.
 * @param last The last code unit of the range.
 */
void CharSet::addRange(char16_t first, char16_t last) {
	if (first > last) {
		std::swap(first, last);
	}

	ranges_.push_back(Range{first, last});
	normalize();
}

/**
 * @brief Adds every member of `other` to this set. The negation flag of
 * `other` is ignored.
 *
 * @param other The set to merge.
 */
void CharSet::addSet(const CharSet &other) {
	ranges_.insert(ranges_.end(), other.ranges_.begin(), other.ranges_.end());
	normalize();
}

/**
 * @brief Adds every code unit that is NOT a member of `other`.
 *
 * @param other The set whose complement is merged.
 */
void CharSet::addComplement(const CharSet &other) {
	uint32_t next = 0;
	for (const Range &r : other.ranges_) {
		if (r.first > next) {
			ranges_.push_back(Range{static_cast<char16_t>(next), static_cast<char16_t>(r.first - 1)});
		}
		next = static_cast<uint32_t>(r.last) + 1;
	}

	if (next <= 0xffff) {
		ranges_.push_back(Range{static_cast<char16_t>(next), char16_t(0xffff)});
	}

	normalize();
}

/**
 * @brief Adds the upper and lower case forms of every member. After this,
 * case-insensitive membership only needs to check a character and its
 * canonical (upper case) form.
 *
 * @param mode The case folding rules.
 */
void CharSet::closeOverCase(CaseFold mode) {
	std::vector<Range> extra;

	for (const Range &r : ranges_) {
		for (uint32_t ch = r.first; ch <= r.last; ++ch) {
			const auto c     = static_cast<char16_t>(ch);
			const char16_t u = ToUpperCase(c, mode);
			const char16_t l = ToLowerCase(c, mode);

			if (u != c) {
				extra.push_back(Range{u, u});
			}

			if (l != c) {
				extra.push_back(Range{l, l});
			}
		}
	}

	ranges_.insert(ranges_.end(), extra.begin(), extra.end());
	normalize();
}

/**
 * @brief Tests raw membership, ignoring the negation flag.
 *
 * @param ch The code unit to look up.
 * @return `true` if `ch` is in one of the ranges.
 */
bool CharSet::contains(char16_t ch) const noexcept {
	auto it = std::upper_bound(ranges_.begin(), ranges_.end(), ch, [](char16_t c, const Range &r) {
		return c < r.first;
	});

	if (it == ranges_.begin()) {
		return false;
	}

	--it;
	return ch <= it->last;
}

/**
 * @brief Tests whether `ch` is matched by this class, honoring negation.
 *
 * @param ch The code unit to test.
 * @param ignoreCase Whether to compare case-insensitively. The set must
 * have been passed through `closeOverCase` for this to be exact.
 * @param mode The case folding rules.
 * @return `true` if the class matches `ch`.
 */
bool CharSet::matches(char16_t ch, bool ignoreCase, CaseFold mode) const noexcept {
	bool found = contains(ch);
	if (!found && ignoreCase) {
		found = contains(FoldCase(ch, mode));
	}

	return found != negated_;
}

/**
 * @brief Returns the number of code units in the set.
 */
size_t CharSet::count() const noexcept {
	size_t n = 0;
	for (const Range &r : ranges_) {
		n += static_cast<size_t>(r.last - r.first) + 1;
	}
	return n;
}

/**
 * @brief Sorts the ranges and coalesces overlapping or adjacent ones.
 */
void CharSet::normalize() {
	if (ranges_.size() < 2) {
		return;
	}

	std::sort(ranges_.begin(), ranges_.end(), [](const Range &a, const Range &b) {
		return a.first < b.first;
	});

	std::vector<Range> merged;
	merged.reserve(ranges_.size());

	for (const Range &r : ranges_) {
		if (!merged.empty() && static_cast<uint32_t>(r.first) <= static_cast<uint32_t>(merged.back().last) + 1) {
			merged.back().last = std::max(merged.back().last, r.last);
		} else {
			merged.push_back(r);
		}
	}

	ranges_ = std::move(merged);
}

CharSet CharSet::digits() {
	CharSet set;
	set.addRange('0', '9');
	return set;
}

CharSet CharSet::wordChars() {
	CharSet set;
	set.addRange('0', '9');
	set.addRange('A', 'Z');
	set.add('_');
	set.addRange('a', 'z');
	return set;
}

CharSet CharSet::spaces() {
	CharSet set;
	set.addRange(0x0009, 0x000d);
	set.add(0x0020);
	set.add(0x00a0);
	set.add(0x1680);
	set.addRange(0x2000, 0x200a);
	set.addRange(0x2028, 0x2029);
	set.add(0x202f);
	set.add(0x205f);
	set.add(0x3000);
	set.add(0xfeff);
	return set;
}

CharSet CharSet::lineTerminators() {
	CharSet set;
	set.add('\n');
	set.add('\r');
	set.addRange(0x2028, 0x2029);
	return set;
}
