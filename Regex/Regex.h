#ifndef REGEX_H_
#define REGEX_H_

#include "Ast.h"
#include "MatchResult.h"
#include "Optimizer.h"
#include "Options.h"
#include "Program.h"
#include "RegexError.h"
#include "SearchStrategy.h"

#include <QString>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

/**
 * @brief A compiled regular expression.
 *
 * All of the work (parsing, optimizing, lowering) happens in the constructor,
 * which either yields a complete object or throws a RegexError. A Regex is
 * never modified afterwards, so one instance may be matched from any number
 * of threads at once.
 */
class Regex {
public:
	Regex(std::u16string_view pattern, uint32_t options, CaseFold caseFold = CaseFold::Simple);
	Regex(const Regex &)            = delete;
	Regex &operator=(const Regex &) = delete;
	~Regex()                        = default;

public:
	std::optional<MatchResult> execute(std::u16string_view input, size_t start = 0) const;
	std::optional<uint32_t> groupNumber(std::u16string_view name) const;
	QString optimizeInfoToString() const;

public:
	const std::u16string &pattern() const noexcept { return pattern_; }
	uint32_t options() const noexcept { return options_; }
	CaseFold caseFold() const noexcept { return caseFold_; }
	const Program &program() const noexcept { return program_; }
	const OptimizeInfo &optimizeInfo() const noexcept { return info_; }
	const SearchStrategy &strategy() const noexcept { return info_.strategy; }
	SearchAlgorithm searchAlgorithm() const noexcept { return AlgorithmOf(info_.strategy); }
	uint32_t anchor() const noexcept { return info_.anchor; }
	uint32_t anchorDmin() const noexcept { return info_.anchorDmin; }
	uint32_t anchorDmax() const noexcept { return info_.anchorDmax; }
	uint32_t subAnchor() const noexcept { return info_.subAnchor; }
	uint32_t dMin() const noexcept { return info_.dMin; }
	uint32_t dMax() const noexcept { return info_.dMax; }
	uint32_t thresholdLength() const noexcept { return info_.thresholdLength; }
	uint32_t captureCount() const noexcept { return program_.captureCount; }
	uint32_t backtrackCount() const noexcept;

private:
	std::u16string pattern_;
	uint32_t options_;
	CaseFold caseFold_;
	OptimizeInfo info_;
	Program program_;
	std::vector<GroupName> names_;
};

#endif
