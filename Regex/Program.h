#ifndef PROGRAM_H_
#define PROGRAM_H_

#include "CharSet.h"
#include "Opcodes.h"

#include <cstdint>
#include <string>
#include <vector>

struct Program {
	std::vector<Instruction> code;
	std::vector<std::u16string> strings;
	std::vector<CharSet> classes;
	uint32_t captureCount = 0; // not counting the implicit group 0
	uint32_t counterCount = 0; // number of RepeatInit counters
	std::vector<bool> backtrackGroups; // indexed by group number, group 0 unused
};

#endif
