#ifndef CONSTANTS_H_
#define CONSTANTS_H_

#include <cstddef>
#include <cstdint>
#include <limits>

// Marker for an unbounded length or distance ("infinite").
constexpr uint32_t InfiniteDistance = std::numeric_limits<uint32_t>::max();

// Number of entries in the skip table and the character map. Code units are
// folded onto this table by their low byte.
constexpr size_t CharTableSize = 256;

// Longest exact run the optimizer keeps.
constexpr uint32_t OptExactMaxLength = 24;

// Number of capturing parentheses allowed.
constexpr uint32_t MaxCaptureGroups = 32767;

// Largest count accepted in a {m,n} quantifier.
constexpr uint32_t MaxRepeatCount = 100000;

// Deepest group nesting the parser accepts by default.
constexpr int DefaultNestingLimit = 10000;

// Largest program (in instructions) the compiler will produce by default.
constexpr int DefaultProgramLimit = 1000000;

#endif
