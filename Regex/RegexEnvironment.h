#ifndef REGEX_ENVIRONMENT_H_
#define REGEX_ENVIRONMENT_H_

#include "MatchResult.h"
#include "Regex.h"
#include "RegexCache.h"

#include <cstddef>
#include <memory>
#include <optional>
#include <string_view>

std::shared_ptr<const Regex> CompileRegex(std::u16string_view pattern, std::u16string_view flags);

/**
 * @brief The entry points a scripting runtime uses. Each environment owns
 * its own cache; environments share nothing.
 */
class RegexEnvironment {
public:
	RegexEnvironment();
	explicit RegexEnvironment(RegexCache::Compiler compiler);
	RegexEnvironment(const RegexEnvironment &)            = delete;
	RegexEnvironment &operator=(const RegexEnvironment &) = delete;
	~RegexEnvironment()                                   = default;

public:
	void validate(std::u16string_view pattern, std::u16string_view flags);
	std::shared_ptr<const Regex> create(std::u16string_view pattern, std::u16string_view flags);
	std::shared_ptr<const Regex> compile(std::u16string_view pattern, std::u16string_view flags);
	std::optional<MatchResult> match(const Regex &regex, std::u16string_view input, size_t startOffset) const;

public:
	RegexCache &cache() noexcept { return cache_; }
	const RegexCache &cache() const noexcept { return cache_; }

private:
	RegexCache::Compiler compiler_;
	RegexCache cache_;
};

#endif
