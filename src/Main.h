#ifndef MAIN_H_
#define MAIN_H_

#include <QCoreApplication>
#include <QString>
#include <QStringList>

class Regex;

class Main {
	Q_DECLARE_TR_FUNCTIONS(Main)

public:
	explicit Main(const QStringList &args);
	~Main() = default;

public:
	int exec();

private:
	bool search(const Regex &regex, const QString &text) const;

private:
	QString pattern_;
	QString flags_;
	QString configFile_;
	QStringList texts_;
	int offset_ = 0;
	bool dump_  = false;
};

#endif
