#ifndef MATCH_RESULT_H_
#define MATCH_RESULT_H_

#include <cstddef>
#include <string_view>
#include <utility>
#include <vector>

/**
 * @brief The outcome of a successful match: the span of the whole match
 * (group 0) and of every capture group. Offsets are in code units. Groups
 * that did not participate report `npos` for both ends.
 */
class MatchResult {
public:
	static constexpr size_t npos = static_cast<size_t>(-1);

public:
	explicit MatchResult(std::vector<size_t> slots)
		: slots_(std::move(slots)) {
	}

public:
	size_t size() const noexcept { return slots_.size() / 2; }
	size_t begin(size_t group = 0) const noexcept { return group < size() ? slots_[group * 2] : npos; }
	size_t end(size_t group = 0) const noexcept { return group < size() ? slots_[group * 2 + 1] : npos; }
	bool matched(size_t group) const noexcept { return begin(group) != npos && end(group) != npos; }

	size_t length(size_t group = 0) const noexcept {
		return matched(group) ? end(group) - begin(group) : 0;
	}

	std::u16string_view str(std::u16string_view input, size_t group = 0) const {
		if (!matched(group)) {
			return {};
		}

		return input.substr(begin(group), length(group));
	}

private:
	std::vector<size_t> slots_;
};

#endif
