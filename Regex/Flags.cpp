
#include "Flags.h"
#include "RegexError.h"
#include "Util/Raise.h"

#include <QString>

#include <string>

namespace {

std::string FlagText(char16_t ch) {
	return QString(QChar(ch)).toStdString();
}

}

/**
 * @brief Converts a flag string to option bits. Recognized flags are
 * `g` (global), `i` (ignore case) and `m` (multiline). Single line mode is
 * the default and `m` turns it off.
 *
 * @param flags The flag text.
 * @return The options.
 * @throws RegexSyntaxError for an unknown or repeated flag.
 */
RegexFlags ParseFlags(std::u16string_view flags) {
	RegexFlags result;

	bool ignoreCase = false;
	bool multiline  = false;

	for (char16_t ch : flags) {
		bool *seen = nullptr;

		switch (ch) {
		case 'g':
			seen = &result.global;
			break;
		case 'i':
			seen = &ignoreCase;
			break;
		case 'm':
			seen = &multiline;
			break;
		default:
			Raise<RegexSyntaxError>(ErrorId::UnsupportedFlag, FlagText(ch));
		}

		if (*seen) {
			Raise<RegexSyntaxError>(ErrorId::RepeatedFlag, FlagText(ch));
		}

		*seen = true;
	}

	if (ignoreCase) {
		result.options |= RE_OPTION_IGNORECASE;
	}

	if (multiline) {
		result.options &= ~RE_OPTION_SINGLELINE;
		result.options |= RE_OPTION_NEGATE_SINGLELINE;
	}

	return result;
}
