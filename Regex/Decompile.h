#ifndef DECOMPILE_H_
#define DECOMPILE_H_

#include "Opcodes.h"

#include <boost/variant.hpp>

#include <QString>

#include <cstdint>
#include <string>
#include <vector>

struct Program;

struct Instruction1 {
	uint32_t address;
	Opcode opcode;
};

struct Instruction2 {
	uint32_t address;
	Opcode opcode;
	std::u16string text; // literal, or a class in [...] notation
};

struct Instruction3 {
	uint32_t address;
	Opcode opcode;
	uint32_t target1;
	uint32_t target2;
};

struct Instruction4 {
	uint32_t address;
	Opcode opcode;
	uint32_t index; // group or counter
};

struct Instruction5 {
	uint32_t address;
	Opcode opcode;
	uint32_t index;
	uint32_t min;
	uint32_t max;
	uint32_t target;
	uint32_t greed;
};

using DecodedInstruction = boost::variant<Instruction1, Instruction2, Instruction3, Instruction4, Instruction5>;

std::vector<DecodedInstruction> DecompileProgram(const Program &program);
QString Disassemble(const Program &program);

#endif
