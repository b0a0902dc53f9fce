
#include "Regex.h"
#include "Compile.h"
#include "Execute.h"
#include "Parser.h"
#include "Settings/Settings.h"
#include "Util/Raise.h"

#include <QtDebug>

#include <algorithm>

namespace {

/**
 * @brief Validates the option bits and applies the implied ones.
 * Multiline mode turns off single line mode.
 */
uint32_t NormalizeOptions(uint32_t options) {
	if ((options & RE_OPTION_DONT_CAPTURE_GROUP) && (options & RE_OPTION_CAPTURE_GROUP)) {
		Raise<RegexSyntaxError>(ErrorId::InvalidCombinationOfOptions);
	}

	if (options & RE_OPTION_NEGATE_SINGLELINE) {
		options &= ~RE_OPTION_SINGLELINE;
	}

	return options;
}

}

/**
 * @brief Compiles a regular expression.
 *
 * @param pattern The pattern text.
 * @param options RE_OPTION bits.
 * @param caseFold Rules used when RE_OPTION_IGNORECASE is set.
 * @throws RegexSyntaxError for an invalid pattern or option combination.
 * @throws RegexFatalError if the pattern exceeds a structural limit.
 */
Regex::Regex(std::u16string_view pattern, uint32_t options, CaseFold caseFold)
	: pattern_(pattern), options_(NormalizeOptions(options)), caseFold_(caseFold) {

	const ParseTree tree = ParsePattern(pattern_, options_, caseFold_, Settings::nestingLimit);

	CompileLimits limits;
	limits.programLimit = Settings::programLimit;

	program_ = CompileProgram(tree, options_, caseFold_, limits);
	info_    = Optimize(tree, options_, caseFold_, Settings::boyerMoore);
	names_   = tree.names;

	if (Settings::traceOptimizer) {
		qDebug("nregex: /%s/\n%s", qPrintable(QString::fromStdU16String(pattern_)), qPrintable(optimizeInfoToString()));
	}
}

/**
 * @brief Searches `input` for the leftmost match.
 *
 * @param input The text to search.
 * @param start Offset of the first candidate position.
 * @return The match, if there is one.
 */
std::optional<MatchResult> Regex::execute(std::u16string_view input, size_t start) const {
	return Execute(*this, input, start);
}

/**
 * @brief Looks up the capture number of a named group.
 */
std::optional<uint32_t> Regex::groupNumber(std::u16string_view name) const {
	auto it = std::find_if(names_.begin(), names_.end(), [name](const GroupName &entry) {
		return entry.name == name;
	});

	if (it == names_.end()) {
		return {};
	}

	return it->number;
}

/**
 * @brief The number of capture groups whose slots are saved and restored
 * while backtracking.
 */
uint32_t Regex::backtrackCount() const noexcept {
	return static_cast<uint32_t>(std::count(program_.backtrackGroups.begin(), program_.backtrackGroups.end(), true));
}

QString Regex::optimizeInfoToString() const {
	return OptimizeInfoToString(info_);
}
