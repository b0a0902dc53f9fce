
#include "RegexEnvironment.h"
#include "Flags.h"
#include "Settings/Settings.h"

#include <QString>
#include <QtDebug>

#include <utility>

namespace {

void LogFatal(std::u16string_view pattern, const RegexFatalError &e) {
	qCritical("nregex: unable to compile /%s/: %s", qPrintable(QString::fromStdU16String(std::u16string(pattern))), e.what());
}

}

/**
 * @brief Compiles a pattern with flags given as text.
 *
 * @throws RegexSyntaxError for invalid flags or an invalid pattern.
 * @throws RegexFatalError if the pattern exceeds a structural limit.
 */
std::shared_ptr<const Regex> CompileRegex(std::u16string_view pattern, std::u16string_view flags) {
	const RegexFlags parsed = ParseFlags(flags);
	return std::make_shared<Regex>(pattern, parsed.options);
}

RegexEnvironment::RegexEnvironment()
	: RegexEnvironment(CompileRegex) {
}

/**
 * @brief Constructor.
 *
 * @param compiler Used for every compile, cached or not.
 */
RegexEnvironment::RegexEnvironment(RegexCache::Compiler compiler)
	: compiler_(std::move(compiler)), cache_(compiler_, static_cast<size_t>(Settings::cacheCapacity)) {
}

/**
 * @brief Checks a pattern and flags, answering from the cache when possible.
 */
void RegexEnvironment::validate(std::u16string_view pattern, std::u16string_view flags) {
	try {
		cache_.validate(pattern, flags);
	} catch (const RegexFatalError &e) {
		LogFatal(pattern, e);
		throw;
	}
}

/**
 * @brief Returns a compiled expression, shared with earlier requests for the
 * same pattern and flags.
 */
std::shared_ptr<const Regex> RegexEnvironment::create(std::u16string_view pattern, std::u16string_view flags) {
	try {
		return cache_.create(pattern, flags);
	} catch (const RegexFatalError &e) {
		LogFatal(pattern, e);
		throw;
	}
}

/**
 * @brief Compiles a pattern without consulting the cache.
 */
std::shared_ptr<const Regex> RegexEnvironment::compile(std::u16string_view pattern, std::u16string_view flags) {
	try {
		return compiler_(pattern, flags);
	} catch (const RegexFatalError &e) {
		LogFatal(pattern, e);
		throw;
	}
}

std::optional<MatchResult> RegexEnvironment::match(const Regex &regex, std::u16string_view input, size_t startOffset) const {
	return regex.execute(input, startOffset);
}
