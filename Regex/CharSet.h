#ifndef CHAR_SET_H_
#define CHAR_SET_H_

#include "Options.h"

#include <cstddef>
#include <vector>

/**
 * @brief A set of UTF-16 code units stored as sorted, disjoint ranges, plus a
 * negation flag. The negation flag is not applied by `contains`, it is up to
 * `matches` to honor it.
 */
class CharSet {
public:
	struct Range {
		char16_t first;
		char16_t last;
	};

public:
	void add(char16_t ch);
	void addRange(char16_t first, char16_t last);
	void addSet(const CharSet &other);
	void addComplement(const CharSet &other);
	void closeOverCase(CaseFold mode);

public:
	bool contains(char16_t ch) const noexcept;
	bool matches(char16_t ch, bool ignoreCase, CaseFold mode) const noexcept;
	bool empty() const noexcept { return ranges_.empty(); }
	size_t count() const noexcept;
	const std::vector<Range> &ranges() const noexcept { return ranges_; }

public:
	bool negated() const noexcept { return negated_; }
	void setNegated(bool negated) noexcept { negated_ = negated; }

public:
	static CharSet digits();
	static CharSet wordChars();
	static CharSet spaces();
	static CharSet lineTerminators();

private:
	void normalize();

private:
	std::vector<Range> ranges_;
	bool negated_ = false;
};

#endif
