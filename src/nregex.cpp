
#include "Main.h"

#include <QCoreApplication>
#include <QStringList>

#include <cstdio>
#include <cstdlib>

namespace {

/**
 * @brief Custom message handler for Qt logging.
 *
 * @param type The type of the message (debug, warning, info, critical, fatal).
 * @param context The context of the message, including file, function, and line number.
 * @param msg The message to log.
 */
void MessageHandler(QtMsgType type, const QMessageLogContext &context, const QString &msg) {

	Q_UNUSED(context);

	switch (type) {
	case QtDebugMsg:
		fprintf(stderr, "Debug: %s\n", qPrintable(msg));
		break;
	case QtWarningMsg:
		fprintf(stderr, "Warning: %s\n", qPrintable(msg));
		break;
	case QtInfoMsg:
		fprintf(stderr, "Info: %s\n", qPrintable(msg));
		break;
	case QtCriticalMsg:
		fprintf(stderr, "Critical: %s\n", qPrintable(msg));
		break;
	case QtFatalMsg:
		fprintf(stderr, "Fatal: %s\n", qPrintable(msg));
		abort();
	}
}

}

/**
 * @brief Main entry point for nregex-tool.
 *
 * @param argc The number of command line arguments.
 * @param argv The command line arguments as an array of strings.
 * @return The exit code of the application.
 */
int main(int argc, char *argv[]) {

	qInstallMessageHandler(MessageHandler);

	QCoreApplication app(argc, argv);
	QCoreApplication::setApplicationName(QLatin1String("nregex-tool"));

	Main main(QCoreApplication::arguments());
	return main.exec();
}
