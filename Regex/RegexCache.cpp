
#include "RegexCache.h"

/**
 * @brief Constructor.
 *
 * @param compiler Builds a Regex from a pattern and flags.
 * @param capacity Maximum number of entries, 0 for no limit.
 */
RegexCache::RegexCache(Compiler compiler, size_t capacity)
	: compiler_(std::move(compiler)), capacity_(capacity) {
}

/**
 * @brief Checks that a pattern and flags compile.
 *
 * @throws RegexSyntaxError (possibly the stored one) if they do not.
 * @throws RegexFatalError if compiling hits a structural limit.
 */
void RegexCache::validate(std::u16string_view pattern, std::u16string_view flags) {
	lookup(pattern, flags);
}

/**
 * @brief Returns the compiled expression for a pattern and flags, compiling
 * it on the first request.
 *
 * @throws RegexSyntaxError (possibly the stored one) for an invalid pattern.
 * @throws RegexFatalError if compiling hits a structural limit.
 */
std::shared_ptr<const Regex> RegexCache::create(std::u16string_view pattern, std::u16string_view flags) {
	return lookup(pattern, flags);
}

std::shared_ptr<const Regex> RegexCache::lookup(std::u16string_view pattern, std::u16string_view flags) {
	std::lock_guard<std::mutex> lock(mutex_);

	Key key{std::u16string(pattern), std::u16string(flags)};

	auto it = entries_.find(key);
	if (it != entries_.end()) {
		++hits_;
		recent_.splice(recent_.begin(), recent_, it->second.position);

		if (it->second.error) {
			throw *it->second.error;
		}

		return it->second.regex;
	}

	++misses_;
	++compiles_;

	Entry entry;
	try {
		entry.regex = compiler_(pattern, flags);
	} catch (const RegexSyntaxError &e) {
		entry.error = e;
		insert(std::move(key), std::move(entry));
		throw;
	}

	std::shared_ptr<const Regex> regex = entry.regex;
	insert(std::move(key), std::move(entry));
	return regex;
}

void RegexCache::insert(Key key, Entry entry) {
	if (capacity_ != 0 && entries_.size() >= capacity_) {
		entries_.erase(recent_.back());
		recent_.pop_back();
	}

	recent_.push_front(key);
	entry.position = recent_.begin();
	entries_.emplace(std::move(key), std::move(entry));
}

/**
 * @brief Forgets every entry. The statistics are kept.
 */
void RegexCache::clear() {
	std::lock_guard<std::mutex> lock(mutex_);
	entries_.clear();
	recent_.clear();
}

size_t RegexCache::compileCount() const {
	std::lock_guard<std::mutex> lock(mutex_);
	return compiles_;
}

size_t RegexCache::hits() const {
	std::lock_guard<std::mutex> lock(mutex_);
	return hits_;
}

size_t RegexCache::misses() const {
	std::lock_guard<std::mutex> lock(mutex_);
	return misses_;
}

size_t RegexCache::size() const {
	std::lock_guard<std::mutex> lock(mutex_);
	return entries_.size();
}
