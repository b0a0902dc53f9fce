#ifndef REGEX_CACHE_H_
#define REGEX_CACHE_H_

#include "Regex.h"
#include "RegexError.h"

#include <cstddef>
#include <functional>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

/**
 * @brief Remembers the outcome of compiling a (pattern, flags) pair: either
 * the compiled Regex or the syntax error it raised. Fatal errors are not
 * remembered. Lookups and compiles are serialized by one mutex, so a pair
 * is compiled at most once while it stays cached.
 */
class RegexCache {
public:
	using Compiler = std::function<std::shared_ptr<const Regex>(std::u16string_view pattern, std::u16string_view flags)>;

public:
	RegexCache(Compiler compiler, size_t capacity);
	RegexCache(const RegexCache &)            = delete;
	RegexCache &operator=(const RegexCache &) = delete;
	~RegexCache()                             = default;

public:
	void validate(std::u16string_view pattern, std::u16string_view flags);
	std::shared_ptr<const Regex> create(std::u16string_view pattern, std::u16string_view flags);
	void clear();

public:
	size_t compileCount() const;
	size_t hits() const;
	size_t misses() const;
	size_t size() const;
	size_t capacity() const noexcept { return capacity_; }

private:
	using Key = std::pair<std::u16string, std::u16string>;

	struct Entry {
		std::shared_ptr<const Regex> regex;
		std::optional<RegexSyntaxError> error;
		std::list<Key>::iterator position;
	};

private:
	std::shared_ptr<const Regex> lookup(std::u16string_view pattern, std::u16string_view flags);
	void insert(Key key, Entry entry);

private:
	Compiler compiler_;
	size_t capacity_;
	size_t compiles_ = 0;
	size_t hits_     = 0;
	size_t misses_   = 0;
	std::map<Key, Entry> entries_;
	std::list<Key> recent_; // most recently used first
	mutable std::mutex mutex_;
};

#endif
