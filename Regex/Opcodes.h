#ifndef OPCODES_H_
#define OPCODES_H_

#include <cstdint>

/* STRUCTURE OF A COMPILED PROGRAM
 *
 * A program is a linear sequence of instructions executed by a backtracking
 * machine. Control flow is explicit: SPLIT records a choice point and
 * continues with its first target, JUMP transfers control. Literal strings
 * and character classes live in side tables of the program and are referred
 * to by index.
 *
 * The opcodes are: */

enum class Opcode : uint8_t {
	Match, // Success.

	// Code unit matchers. Each consumes exactly one code unit, which makes
	// them valid operands of REPEAT_CHAR.
	Char,    // a: code unit
	CharIC,  // a: canonical (upper case) code unit
	Any,     // Any code unit except a line terminator.
	Class,   // a: class index
	ClassIC, // a: class index, class is closed over case

	// Multi code unit literals.
	String,   // a: string index
	StringIC, // a: string index, string holds canonical code units

	// Zero width positional assertions.
	BeginBuf,
	EndBuf,
	SemiEndBuf, // End of buffer, or before a final newline.
	BeginLine,
	EndLine,
	WordBoundary,
	NotWordBoundary,

	// Control flow.
	Split, // a: first choice, b: second choice (pushed on the backtrack stack)
	Jump,  // a: target

	// Captures. The UNDO variants log the old value on the backtrack stack.
	SaveStart,     // a: group
	SaveEnd,       // a: group
	SaveStartUndo, // a: group
	SaveEndUndo,   // a: group

	BackRef,   // a: group
	BackRefIC, // a: group

	// Simple repetition of the single code unit matcher that follows.
	// a: min, b: max, c: Greed; continues at pc + 2.
	RepeatChar,

	// General {m,n} loops.
	RepeatInit,      // a: counter
	RepeatLoop,      // a: counter, b: min, c: max, d: exit; e: Greed
	RepeatEnter,     // a: counter, b: first group to reset, c: one past the last group to reset
	RepeatIncrement, // a: counter, b: address of the RepeatLoop

	// Look-around and atomic groups.
	LookStart, // a: LookKind or Atomic, b: continuation, c: min length, d: max length (look-behind)
	LookEnd,

	Fail,
};

// LookStart operand for atomic groups (used by possessive quantifiers).
constexpr uint32_t AtomicGroup = 0xff;

struct Instruction {
	Opcode op;
	uint32_t a = 0;
	uint32_t b = 0;
	uint32_t c = 0;
	uint32_t d = 0;
	uint32_t e = 0;
};

const char *OpcodeName(Opcode op) noexcept;

#endif
