#ifndef AST_H_
#define AST_H_

#include "CharSet.h"
#include "Constants.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Nodes live in an arena (ParseTree::nodes) and refer to each other by index.
using NodeIndex = uint32_t;

constexpr NodeIndex InvalidNode = static_cast<NodeIndex>(-1);

enum class NodeType : uint8_t {
	Empty,
	String,        // operand: index into ParseTree::strings
	CharClass,     // operand: index into ParseTree::classes
	AnyChar,       // any code unit except a line terminator
	Anchor,        // operand: AnchorType
	LookAround,    // operand: LookKind, one child
	Group,         // operand: capture number, 0 if non-capturing, one child
	Alternation,   // children tried first to last
	Concatenation, // children matched in sequence
	Quantifier,    // min/max/greed, one child
	BackReference, // operand: capture number
};

enum class AnchorType : uint8_t {
	BeginBuf,
	BeginLine,
	EndBuf,
	SemiEndBuf,
	EndLine,
	WordBoundary,
	NotWordBoundary,
};

enum class LookKind : uint8_t {
	Ahead,
	NegativeAhead,
	Behind,
	NegativeBehind,
};

enum class Greed : uint8_t {
	Greedy,
	Lazy,
	Possessive,
};

struct Node {
	NodeType type;
	uint32_t operand = 0;
	uint32_t min     = 0;
	uint32_t max     = 0;
	Greed greed      = Greed::Greedy;
	std::vector<NodeIndex> children;
};

struct GroupName {
	std::u16string name;
	uint32_t number;
};

// Minimum and maximum number of code units a node can consume.
struct MinMaxLength {
	uint32_t min = 0;
	uint32_t max = 0;
};

uint32_t AddDistance(uint32_t a, uint32_t b) noexcept;
uint32_t MultiplyDistance(uint32_t a, uint32_t b) noexcept;

struct ParseTree {
	std::vector<Node> nodes;
	std::vector<std::u16string> strings;
	std::vector<CharSet> classes;
	std::vector<GroupName> names;
	NodeIndex root         = InvalidNode;
	uint32_t captureCount  = 0;

	NodeIndex add(Node node);
	Node &operator[](NodeIndex index) { return nodes[index]; }
	const Node &operator[](NodeIndex index) const { return nodes[index]; }

	std::optional<uint32_t> groupNumber(std::u16string_view name) const;
	std::vector<NodeIndex> postOrder() const;
	std::vector<MinMaxLength> lengths() const;
};

#endif
