
#include "Main.h"
#include "Regex/Decompile.h"
#include "Regex/Flags.h"
#include "Regex/Regex.h"
#include "Regex/RegexEnvironment.h"
#include "Settings/Settings.h"

#include <QTextStream>

#include <cstdio>
#include <cstdlib>
#include <memory>
#include <optional>
#include <string>

namespace {

constexpr const char cmdLineHelp[] =
	"Usage: nregex-tool [-flags f] [-offset n] [-dump] [-config file]\n"
	"                   [-h|-help] [--] pattern [text...]\n"
	"\n"
	"Searches every text (or every line of standard input when no text is\n"
	"given) for the pattern and prints the match and its groups.\n";

/**
 * @brief Gets the index of the next argument parameter.
 *
 * @param args The command line arguments.
 * @param argIndex The current argument index.
 * @return The next argument index.
 */
int getArgumentParameter(const QStringList &args, int argIndex) {
	if (argIndex + 1 >= args.size()) {
		fprintf(stderr, "nregex: %s requires an argument\n%s", qPrintable(args[argIndex]), cmdLineHelp);
		exit(EXIT_FAILURE);
	}

	return ++argIndex;
}

std::u16string ToUtf16(const QString &s) {
	return s.toStdU16String();
}

QString FromUtf16(std::u16string_view s) {
	return QString::fromStdU16String(std::u16string(s));
}

}

/**
 * @brief Constructor for Main class.
 *
 * @param args The command line arguments.
 */
Main::Main(const QStringList &args) {

	bool opts = true;

	for (int i = 1; i < args.size(); ++i) {
		const QString &arg = args[i];

		if (opts && arg == QLatin1String("--")) {
			opts = false; // treat all remaining arguments as pattern and texts
			continue;
		}

		if (opts && arg == QLatin1String("-flags")) {
			i      = getArgumentParameter(args, i);
			flags_ = args[i];
		} else if (opts && arg == QLatin1String("-offset")) {
			i       = getArgumentParameter(args, i);
			bool ok = false;
			offset_ = args[i].toInt(&ok);
			if (!ok || offset_ < 0) {
				fprintf(stderr, "nregex: argument to -offset should be a non negative number\n");
				exit(EXIT_FAILURE);
			}
		} else if (opts && arg == QLatin1String("-dump")) {
			dump_ = true;
		} else if (opts && arg == QLatin1String("-config")) {
			i           = getArgumentParameter(args, i);
			configFile_ = args[i];
		} else if (opts && (arg == QLatin1String("-h") || arg == QLatin1String("-help"))) {
			fprintf(stdout, "%s", cmdLineHelp);
			exit(EXIT_SUCCESS);
		} else if (opts && arg.startsWith(QLatin1Char('-')) && pattern_.isNull()) {
			fprintf(stderr, "nregex: Unrecognized option %s\n%s", qPrintable(arg), cmdLineHelp);
			exit(EXIT_FAILURE);
		} else if (pattern_.isNull()) {
			pattern_ = arg;
		} else {
			texts_.push_back(arg);
		}
	}

	if (pattern_.isNull()) {
		fprintf(stderr, "nregex: no pattern given\n%s", cmdLineHelp);
		exit(EXIT_FAILURE);
	}
}

/**
 * @brief Compiles the pattern and searches every text.
 *
 * @return 0 if anything matched, 1 if nothing did, 2 for an invalid pattern
 * and 3 if the pattern hit an engine limit.
 */
int Main::exec() {

	if (!configFile_.isEmpty()) {
		Settings::Load(configFile_);
	}

	RegexEnvironment environment;
	std::shared_ptr<const Regex> regex;

	try {
		regex = environment.create(ToUtf16(pattern_), ToUtf16(flags_));
	} catch (const RegexSyntaxError &e) {
		fprintf(stderr, "nregex: %s\n", e.what());
		return 2;
	} catch (const RegexFatalError &) {
		return 3;
	}

	if (dump_) {
		printf("%s\n", qPrintable(regex->optimizeInfoToString()));
		printf("%s\n\n", qPrintable(Disassemble(regex->program())));
	}

	bool found = false;

	if (texts_.isEmpty()) {
		QTextStream in(stdin);
		QString line;
		while (in.readLineInto(&line)) {
			found |= search(*regex, line);
		}
	} else {
		for (const QString &text : texts_) {
			found |= search(*regex, text);
		}
	}

	return found ? 0 : 1;
}

/**
 * @brief Prints the matches of `regex` in `text`. With the `g` flag every
 * match is printed, otherwise only the first.
 *
 * @return true if there was at least one match.
 */
bool Main::search(const Regex &regex, const QString &text) const {
	const std::u16string input = ToUtf16(text);
	const bool global          = ParseFlags(ToUtf16(flags_)).global;

	size_t pos = static_cast<size_t>(offset_);
	bool found = false;

	while (std::optional<MatchResult> match = regex.execute(input, pos)) {
		found = true;

		printf("%zu-%zu: \"%s\"\n", match->begin(), match->end(), qPrintable(FromUtf16(match->str(input))));

		for (size_t group = 1; group < match->size(); ++group) {
			if (match->matched(group)) {
				printf("  $%zu = %zu-%zu: \"%s\"\n", group, match->begin(group), match->end(group), qPrintable(FromUtf16(match->str(input, group))));
			} else {
				printf("  $%zu = undefined\n", group);
			}
		}

		if (!global) {
			break;
		}

		// step over empty matches so the search makes progress
		pos = (match->end() == match->begin()) ? match->end() + 1 : match->end();
		if (pos > input.size()) {
			break;
		}
	}

	if (!found) {
		printf("no match: \"%s\"\n", qPrintable(text));
	}

	return found;
}
