
#ifndef SETTINGS_H_
#define SETTINGS_H_

#include <QString>

namespace Settings {

void Load(const QString &filename);
bool Save(const QString &filename);
void Reset();

// Compiler
extern int nestingLimit;
extern int programLimit;

// Optimizer
extern bool boyerMoore;
extern bool traceOptimizer;

// Cache
extern int cacheCapacity;

}

#endif
