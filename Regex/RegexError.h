#ifndef REGEX_ERROR_H_
#define REGEX_ERROR_H_

#include "Util/Compiler.h"

#include <exception>
#include <string>

enum class ErrorId {
	// option and flag errors
	InvalidCombinationOfOptions,
	UnsupportedFlag,
	RepeatedFlag,

	// syntax errors
	EndPatternAtEscape,
	EndPatternAtControl,
	EndPatternInGroup,
	UnmatchedParenthesis,
	UnmatchedCloseParenthesis,
	PrematureEndOfCharClass,
	EmptyRangeInCharClass,
	InvalidRangeInCharClass,
	TargetOfRepeatNotSpecified,
	TargetOfRepeatInvalid,
	UpperSmallerThanLowerInRepeatRange,
	TooBigNumberForRepeatRange,
	InvalidBackref,
	UndefinedNameReference,
	MultiplexDefinedName,
	InvalidGroupName,
	EmptyGroupName,
	UndefinedGroupOption,
	InvalidLookBehindPattern,
	TooManyCaptureGroups,

	// fatal errors
	NestingTooDeep,
	ProgramTooLarge,
};

/**
 * @brief Base class of every error raised while building a Regex.
 */
class RegexError : public std::exception {
public:
	explicit RegexError(ErrorId id, std::string detail = std::string());

public:
	const char *what() const noexcept override;
	ErrorId id() const noexcept { return id_; }
	const std::string &detail() const noexcept { return detail_; }

private:
	ErrorId id_;
	std::string detail_;
	std::string message_;
};

/**
 * @brief A malformed pattern, flag string or option set. The caller may
 * simply retry with a different pattern.
 */
class RegexSyntaxError final : public RegexError {
public:
	using RegexError::RegexError;
};

/**
 * @brief The pattern exceeded a structural limit of the engine.
 */
class RegexFatalError final : public RegexError {
public:
	using RegexError::RegexError;
};

const char *ErrorMessage(ErrorId id) noexcept;

COLD_CODE
std::string FormatDetail(const char *fmt, ...);

COLD_CODE
void ReportError(const char *str);

#endif
