
#include "Settings.h"
#include "Regex/Constants.h"

#include <QFileInfo>
#include <QSettings>
#include <QtDebug>
#include <QtGlobal>

namespace Settings {

namespace {

const auto NESTING_LIMIT   = QLatin1String("Compiler/nestingLimit");
const auto PROGRAM_LIMIT   = QLatin1String("Compiler/programLimit");
const auto BOYER_MOORE     = QLatin1String("Optimizer/boyerMoore");
const auto TRACE_OPTIMIZER = QLatin1String("Optimizer/trace");
const auto CACHE_CAPACITY  = QLatin1String("Cache/capacity");

/**
 * @brief Reads a positive integer, falling back to `defaultValue` (with a
 * warning) when the stored value is not one.
 */
int ReadLimit(QSettings &settings, const QString &key, int defaultValue) {
	bool ok         = false;
	const int value = settings.value(key, defaultValue).toInt(&ok);
	if (!ok || value <= 0) {
		qWarning("nregex: ignoring invalid value for %s", qPrintable(key));
		return defaultValue;
	}

	return value;
}

}

int nestingLimit    = DefaultNestingLimit;
int programLimit    = DefaultProgramLimit;
bool boyerMoore     = true;
bool traceOptimizer = false;
int cacheCapacity   = 0;

/**
 * @brief Restores every setting to its built in default.
 */
void Reset() {
	nestingLimit   = DefaultNestingLimit;
	programLimit   = DefaultProgramLimit;
	boyerMoore     = true;
	traceOptimizer = false;
	cacheCapacity  = 0;
}

/**
 * @brief Loads the engine settings from an INI file. Missing keys keep their
 * defaults.
 *
 * @param filename The configuration file.
 */
void Load(const QString &filename) {

	Reset();

	if (!QFileInfo::exists(filename)) {
		qWarning("nregex: configuration file %s does not exist, using defaults", qPrintable(filename));
		return;
	}

	QSettings settings(filename, QSettings::IniFormat);

	nestingLimit   = ReadLimit(settings, NESTING_LIMIT, DefaultNestingLimit);
	programLimit   = ReadLimit(settings, PROGRAM_LIMIT, DefaultProgramLimit);
	boyerMoore     = settings.value(BOYER_MOORE, true).toBool();
	traceOptimizer = settings.value(TRACE_OPTIMIZER, false).toBool();
	cacheCapacity  = settings.value(CACHE_CAPACITY, 0).toInt();

	if (cacheCapacity < 0) {
		qWarning("nregex: ignoring negative cache capacity");
		cacheCapacity = 0;
	}
}

/**
 * @brief Writes the engine settings to an INI file.
 *
 * @param filename The configuration file.
 * @return true on success.
 */
bool Save(const QString &filename) {
	QSettings settings(filename, QSettings::IniFormat);

	settings.setValue(NESTING_LIMIT, nestingLimit);
	settings.setValue(PROGRAM_LIMIT, programLimit);
	settings.setValue(BOYER_MOORE, boyerMoore);
	settings.setValue(TRACE_OPTIMIZER, traceOptimizer);
	settings.setValue(CACHE_CAPACITY, cacheCapacity);

	settings.sync();
	if (settings.status() != QSettings::NoError) {
		qWarning("nregex: unable to save settings to %s", qPrintable(filename));
		return false;
	}

	return true;
}

}
