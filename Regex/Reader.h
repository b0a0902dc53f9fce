#ifndef READER_H_
#define READER_H_

#include <cstddef>
#include <string_view>

template <class Ch>
class BasicReader {
public:
	/**
	 * @brief Construct a new Basic Reader object for scanning a pattern.
	 *
	 * @param input The string to read from
	 *
	 * @note The string must remain valid for the lifetime of the reader.
	 */
	explicit BasicReader(std::basic_string_view<Ch> input) noexcept
		: input_(input) {
	}

	BasicReader()                                  = default;
	BasicReader(const BasicReader &other)          = default;
	BasicReader &operator=(const BasicReader &rhs) = default;
	~BasicReader()                                 = default;

public:
	/**
	 * @brief Determines if the reader has reached the end of the input string.
	 *
	 * @return `true` if the end of the input string has been reached, `false` otherwise.
	 */
	bool eof() const noexcept {
		return index_ == input_.size();
	}

	/**
	 * @brief Returns the next character in the string without advancing the position.
	 *
	 * @return The next character in the string, or '\0' if at the end of the string.
	 */
	Ch peek() const noexcept {
		if (eof()) {
			return '\0';
		}

		return input_[index_];
	}

	/**
	 * @brief Returns a character in the string without advancing the position.
	 *
	 * @param n The index of the character to peek at relative to the current point in the input.
	 * @return The character in the string, or '\0' if past the end of the string.
	 */
	Ch peek(size_t n) const noexcept {
		if (n >= input_.size() - index_) {
			return '\0';
		}

		return input_[index_ + n];
	}

	/**
	 * @brief Determines if the next character in the string matches `ch`.
	 */
	bool next_is(Ch ch) const noexcept {
		return !eof() && input_[index_] == ch;
	}

	/**
	 * @brief Reads the next character in the string and advances the position.
	 *
	 * @return The next character in the string, or '\0' if at the end of the string.
	 */
	Ch read() noexcept {
		if (eof()) {
			return '\0';
		}

		return input_[index_++];
	}

	/**
	 * @brief If `ch` matches the char at the current position, consume it and advance the position.
	 *
	 * @param ch The character to match.
	 * @return `true` if the next character matches `ch`, `false` otherwise.
	 */
	bool match(Ch ch) noexcept {
		if (!next_is(ch)) {
			return false;
		}

		++index_;
		return true;
	}

	/**
	 * @brief Consumes while a given predicate function returns `true`
	 * and returns the consumed characters.
	 *
	 * @param pred A predicate function that takes a character and returns `true` if it should be consumed.
	 * @return The consumed characters, possibly empty.
	 */
	template <class Pred>
	std::basic_string_view<Ch> match_while(Pred pred) noexcept(noexcept(pred)) {
		const size_t start = index_;
		while (!eof() && pred(input_[index_])) {
			++index_;
		}

		return input_.substr(start, index_ - start);
	}

	/**
	 * @brief Puts back the last read character, effectively moving the position back by one.
	 */
	void putback() noexcept {
		if (index_ > 0) {
			--index_;
		}
	}

	/**
	 * @brief Get the current position in the string
	 */
	size_t index() const noexcept {
		return index_;
	}

	/**
	 * @brief Get the whole string being read.
	 */
	std::basic_string_view<Ch> input() const noexcept {
		return input_;
	}

private:
	std::basic_string_view<Ch> input_;
	size_t index_ = 0;
};

using Reader = BasicReader<char16_t>;

#endif
