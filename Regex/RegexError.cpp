
#include "RegexError.h"

#include <QtDebug>
#include <QtGlobal>

#include <cstdarg>
#include <cstdio>
#include <utility>

/**
 * @brief RegexError constructor.
 *
 * @param id The kind of error.
 * @param detail Information about the offending construct.
 */
RegexError::RegexError(ErrorId id, std::string detail)
	: id_(id), detail_(std::move(detail)) {

	message_ = ErrorMessage(id_);
	if (!detail_.empty()) {
		message_.append(": ");
		message_.append(detail_);
	}
}

/**
 * @brief Returns the error message.
 *
 * @return The error message string.
 */
const char *RegexError::what() const noexcept {
	return message_.c_str();
}

/**
 * @brief Returns the fixed message associated with an error identifier.
 *
 * @param id The error identifier.
 * @return The message.
 */
const char *ErrorMessage(ErrorId id) noexcept {
	switch (id) {
	case ErrorId::InvalidCombinationOfOptions:
		return "invalid combination of options";
	case ErrorId::UnsupportedFlag:
		return "unsupported regular expression flag";
	case ErrorId::RepeatedFlag:
		return "repeated regular expression flag";
	case ErrorId::EndPatternAtEscape:
		return "end pattern at escape";
	case ErrorId::EndPatternAtControl:
		return "end pattern at control";
	case ErrorId::EndPatternInGroup:
		return "end pattern in group";
	case ErrorId::UnmatchedParenthesis:
		return "end pattern with unmatched parenthesis";
	case ErrorId::UnmatchedCloseParenthesis:
		return "unmatched close parenthesis";
	case ErrorId::PrematureEndOfCharClass:
		return "premature end of char-class";
	case ErrorId::EmptyRangeInCharClass:
		return "empty range in char class";
	case ErrorId::InvalidRangeInCharClass:
		return "invalid range in char class";
	case ErrorId::TargetOfRepeatNotSpecified:
		return "target of repeat operator is not specified";
	case ErrorId::TargetOfRepeatInvalid:
		return "target of repeat operator is invalid";
	case ErrorId::UpperSmallerThanLowerInRepeatRange:
		return "upper is smaller than lower in repeat range";
	case ErrorId::TooBigNumberForRepeatRange:
		return "too big number for repeat range";
	case ErrorId::InvalidBackref:
		return "invalid backref number/name";
	case ErrorId::UndefinedNameReference:
		return "undefined name reference";
	case ErrorId::MultiplexDefinedName:
		return "multiplex defined name";
	case ErrorId::InvalidGroupName:
		return "invalid group name";
	case ErrorId::EmptyGroupName:
		return "group name is empty";
	case ErrorId::UndefinedGroupOption:
		return "undefined group option";
	case ErrorId::InvalidLookBehindPattern:
		return "invalid pattern in look-behind";
	case ErrorId::TooManyCaptureGroups:
		return "too many capture groups are specified";
	case ErrorId::NestingTooDeep:
		return "pattern nesting is too deep";
	case ErrorId::ProgramTooLarge:
		return "compiled pattern is too large";
	}

	return "unknown error";
}

/**
 * @brief Formats the detail part of an error message.
 *
 * @param fmt Format string for the detail.
 * @param ... Variable arguments for the format string.
 * @return The formatted detail.
 */
std::string FormatDetail(const char *fmt, ...) {
	char buf[1024];
	va_list ap;
	va_start(ap, fmt);
	QT_WARNING_PUSH
	QT_WARNING_DISABLE_GCC("-Wformat-security")
	QT_WARNING_DISABLE_GCC("-Wformat-nonliteral")
	QT_WARNING_DISABLE_CLANG("-Wformat-security")
	QT_WARNING_DISABLE_CLANG("-Wformat-nonliteral")
	vsnprintf(buf, sizeof(buf), fmt, ap);
	QT_WARNING_POP
	// NOTE: callers always pass string constants as the format.
	va_end(ap);
	return buf;
}

/**
 * @brief Logs an internal error of the engine.
 *
 * @param str The error message string.
 */
void ReportError(const char *str) {
	qCritical("nregex: Internal error processing regular expression (%s)", str);
}
