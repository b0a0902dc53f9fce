#ifndef COMPILE_H_
#define COMPILE_H_

#include "Ast.h"
#include "Constants.h"
#include "Options.h"
#include "Program.h"

#include <cstdint>

struct CompileLimits {
	int programLimit = DefaultProgramLimit;
};

Program CompileProgram(const ParseTree &tree, uint32_t options, CaseFold caseFold, const CompileLimits &limits);

#endif
