
#include "Compile.h"
#include "CaseFold.h"
#include "RegexError.h"
#include "Util/Raise.h"

#include <gsl/gsl_util>

#include <algorithm>
#include <utility>

namespace {

// Pending work for the lowering loop. Instead of recursing into children,
// the compiler pushes tasks and runs them in LIFO order.
struct Task {
	enum Kind {
		Visit,     // lower a node
		Emit,      // emit `instr`
		AltBranch, // before alternative `index`
		AltJoin,   // after alternative `index`
		AltEnd,    // after the last alternative
		LoopEnd,   // after the body of a counted loop
		LookEnd,   // after the body of a look-around or atomic group
	};

	Kind kind;
	NodeIndex node      = InvalidNode;
	uint32_t fixup      = 0;
	uint32_t index      = 0;
	Instruction instr   = {Opcode::Fail};
};

// Addresses that have to be patched once the target is known.
struct Fixup {
	uint32_t pc = 0;
	std::vector<uint32_t> splits;
	std::vector<uint32_t> jumps;
};

// Range of capture numbers [first, end) found inside a node.
struct GroupRange {
	uint32_t first = 0;
	uint32_t end   = 0;
};

class CompileContext {
public:
	CompileContext(const ParseTree &tree, uint32_t options, CaseFold caseFold, const CompileLimits &limits)
		: tree_(tree), caseFold_(caseFold), limits_(limits), ignoreCase_((options & RE_OPTION_IGNORECASE) != 0) {
	}

public:
	Program compile();

private:
	void analyze();
	void computeGroupRanges();
	void visit(NodeIndex index);
	void visitQuantifier(NodeIndex index, const Node &node);
	void runTask(const Task &task);
	uint32_t emit(const Instruction &instr);
	uint32_t pc() const noexcept { return gsl::narrow_cast<uint32_t>(program_.code.size()); }
	uint32_t newFixup();
	bool isSingleUnit(NodeIndex index) const;

private:
	const ParseTree &tree_;
	CaseFold caseFold_;
	CompileLimits limits_;
	bool ignoreCase_;
	Program program_;
	std::vector<Task> tasks_;
	std::vector<Fixup> fixups_;
	std::vector<MinMaxLength> lengths_;
	std::vector<GroupRange> groups_;
};

/**
 * @brief Lowers the tree into a program.
 */
Program CompileContext::compile() {

	program_.captureCount = tree_.captureCount;
	program_.backtrackGroups.assign(tree_.captureCount + 1, false);

	analyze();
	lengths_ = tree_.lengths();
	computeGroupRanges();

	tasks_.push_back(Task{Task::Visit, tree_.root});

	while (!tasks_.empty()) {
		const Task task = std::move(tasks_.back());
		tasks_.pop_back();
		runTask(task);
	}

	emit(Instruction{Opcode::Match});
	return std::move(program_);
}

/**
 * @brief Walks the tree top down to find the groups whose captures must be restored when backtracking: those in a
 * quantifier, an alternative or a look-around, and those referenced by a
 * backreference.
 */
void CompileContext::analyze() {

	struct Item {
		NodeIndex node;
		bool volatileCapture;
	};

	std::vector<Item> stack;
	stack.push_back(Item{tree_.root, false});

	while (!stack.empty()) {
		const Item item = stack.back();
		stack.pop_back();

		const Node &node = tree_[item.node];

		bool inherit = item.volatileCapture;
		switch (node.type) {
		case NodeType::Group:
			if (node.operand != 0 && item.volatileCapture) {
				program_.backtrackGroups[node.operand] = true;
			}
			break;
		case NodeType::BackReference:
			if (node.operand < program_.backtrackGroups.size()) {
				program_.backtrackGroups[node.operand] = true;
			}
			break;
		case NodeType::Quantifier:
		case NodeType::Alternation:
		case NodeType::LookAround:
			inherit = true;
			break;
		default:
			break;
		}

		for (NodeIndex child : node.children) {
			stack.push_back(Item{child, inherit});
		}
	}
}

/**
 * @brief Records which capture numbers occur inside each node. Captures are
 * numbered in order of their opening parenthesis, so the groups of any
 * subtree form a contiguous range.
 */
void CompileContext::computeGroupRanges() {
	groups_.assign(tree_.nodes.size(), GroupRange{});

	for (NodeIndex index : tree_.postOrder()) {
		const Node &node = tree_[index];
		GroupRange range{InfiniteDistance, 0};

		if (node.type == NodeType::Group && node.operand != 0) {
			range.first = node.operand;
			range.end   = node.operand + 1;
		}

		for (NodeIndex child : node.children) {
			const GroupRange &inner = groups_[child];
			if (inner.first < inner.end) {
				range.first = std::min(range.first, inner.first);
				range.end   = std::max(range.end, inner.end);
			}
		}

		if (range.first >= range.end) {
			range = GroupRange{};
		}

		groups_[index] = range;
	}
}

uint32_t CompileContext::emit(const Instruction &instr) {
	if (program_.code.size() >= static_cast<size_t>(limits_.programLimit)) {
		Raise<RegexFatalError>(ErrorId::ProgramTooLarge, FormatDetail("limit is %d instructions", limits_.programLimit));
	}

	program_.code.push_back(instr);
	return gsl::narrow_cast<uint32_t>(program_.code.size() - 1);
}

uint32_t CompileContext::newFixup() {
	fixups_.emplace_back();
	return gsl::narrow_cast<uint32_t>(fixups_.size() - 1);
}

/**
 * @brief Determines whether a node compiles to exactly one instruction that
 * consumes exactly one code unit.
 */
bool CompileContext::isSingleUnit(NodeIndex index) const {
	const Node &node = tree_[index];
	switch (node.type) {
	case NodeType::CharClass:
	case NodeType::AnyChar:
		return true;
	case NodeType::String:
		return tree_.strings[node.operand].size() == 1;
	default:
		return false;
	}
}

void CompileContext::runTask(const Task &task) {
	switch (task.kind) {
	case Task::Visit:
		visit(task.node);
		break;
	case Task::Emit:
		emit(task.instr);
		break;
	case Task::AltBranch: {
		Fixup &fixup         = fixups_[task.fixup];
		const size_t count   = tree_[task.node].children.size();

		if (task.index > 0) {
			program_.code[fixup.splits.back()].b = pc();
		}

		if (task.index + 1 < count) {
			fixup.splits.push_back(emit(Instruction{Opcode::Split, pc() + 1}));
		}
		break;
	}
	case Task::AltJoin: {
		const size_t count = tree_[task.node].children.size();
		if (task.index + 1 < count) {
			const uint32_t jump = emit(Instruction{Opcode::Jump});
			fixups_[task.fixup].jumps.push_back(jump);
		}
		break;
	}
	case Task::AltEnd:
		for (uint32_t jump : fixups_[task.fixup].jumps) {
			program_.code[jump].a = pc();
		}
		break;
	case Task::LoopEnd: {
		const uint32_t loop = fixups_[task.fixup].pc;
		emit(Instruction{Opcode::RepeatIncrement, program_.code[loop].a, loop});
		program_.code[loop].d = pc();
		break;
	}
	case Task::LookEnd: {
		const uint32_t start = fixups_[task.fixup].pc;
		emit(Instruction{Opcode::LookEnd});
		program_.code[start].b = pc();
		break;
	}
	}
}

void CompileContext::visit(NodeIndex index) {
	const Node &node = tree_[index];

	switch (node.type) {
	case NodeType::Empty:
		break;

	case NodeType::String: {
		std::u16string text = tree_.strings[node.operand];
		if (ignoreCase_) {
			std::transform(text.begin(), text.end(), text.begin(), [this](char16_t ch) {
				return FoldCase(ch, caseFold_);
			});
		}

		if (text.size() == 1) {
			emit(Instruction{ignoreCase_ ? Opcode::CharIC : Opcode::Char, text[0]});
		} else {
			program_.strings.push_back(std::move(text));
			emit(Instruction{ignoreCase_ ? Opcode::StringIC : Opcode::String, gsl::narrow_cast<uint32_t>(program_.strings.size() - 1)});
		}
		break;
	}

	case NodeType::CharClass:
		program_.classes.push_back(tree_.classes[node.operand]);
		emit(Instruction{ignoreCase_ ? Opcode::ClassIC : Opcode::Class, gsl::narrow_cast<uint32_t>(program_.classes.size() - 1)});
		break;

	case NodeType::AnyChar:
		emit(Instruction{Opcode::Any});
		break;

	case NodeType::Anchor:
		switch (static_cast<AnchorType>(node.operand)) {
		case AnchorType::BeginBuf:
			emit(Instruction{Opcode::BeginBuf});
			break;
		case AnchorType::BeginLine:
			emit(Instruction{Opcode::BeginLine});
			break;
		case AnchorType::EndBuf:
			emit(Instruction{Opcode::EndBuf});
			break;
		case AnchorType::SemiEndBuf:
			emit(Instruction{Opcode::SemiEndBuf});
			break;
		case AnchorType::EndLine:
			emit(Instruction{Opcode::EndLine});
			break;
		case AnchorType::WordBoundary:
			emit(Instruction{Opcode::WordBoundary});
			break;
		case AnchorType::NotWordBoundary:
			emit(Instruction{Opcode::NotWordBoundary});
			break;
		}
		break;

	case NodeType::BackReference:
		emit(Instruction{ignoreCase_ ? Opcode::BackRefIC : Opcode::BackRef, node.operand});
		break;

	case NodeType::Group: {
		const uint32_t group = node.operand;
		if (group == 0) {
			tasks_.push_back(Task{Task::Visit, node.children[0]});
			break;
		}

		const bool undo = program_.backtrackGroups[group];
		emit(Instruction{undo ? Opcode::SaveStartUndo : Opcode::SaveStart, group});

		Task end{Task::Emit};
		end.instr = Instruction{undo ? Opcode::SaveEndUndo : Opcode::SaveEnd, group};
		tasks_.push_back(end);
		tasks_.push_back(Task{Task::Visit, node.children[0]});
		break;
	}

	case NodeType::Alternation: {
		const uint32_t fixup = newFixup();
		const auto count     = gsl::narrow_cast<uint32_t>(node.children.size());

		tasks_.push_back(Task{Task::AltEnd, index, fixup});
		for (uint32_t i = count; i-- > 0;) {
			tasks_.push_back(Task{Task::AltJoin, index, fixup, i});
			tasks_.push_back(Task{Task::Visit, node.children[i]});
			tasks_.push_back(Task{Task::AltBranch, index, fixup, i});
		}
		break;
	}

	case NodeType::Quantifier:
		visitQuantifier(index, node);
		break;

	case NodeType::LookAround: {
		const auto kind = static_cast<LookKind>(node.operand);
		Instruction start{Opcode::LookStart, node.operand};

		if (kind == LookKind::Behind || kind == LookKind::NegativeBehind) {
			const MinMaxLength &len = lengths_[node.children[0]];
			if (len.max == InfiniteDistance) {
				Raise<RegexSyntaxError>(ErrorId::InvalidLookBehindPattern);
			}

			start.c = len.min;
			start.d = len.max;
		}

		const uint32_t fixup = newFixup();
		fixups_[fixup].pc    = emit(start);

		tasks_.push_back(Task{Task::LookEnd, index, fixup});
		tasks_.push_back(Task{Task::Visit, node.children[0]});
		break;
	}

	case NodeType::Concatenation:
		for (auto it = node.children.rbegin(); it != node.children.rend(); ++it) {
			tasks_.push_back(Task{Task::Visit, *it});
		}
		break;
	}
}

/**
 * @brief Lowers a quantifier. Single code unit bodies become one REPEAT_CHAR
 * instruction; everything else becomes a counted loop. Possessive loops are
 * wrapped in an atomic group.
 */
void CompileContext::visitQuantifier(NodeIndex index, const Node &node) {
	const NodeIndex body = node.children[0];

	if (node.max == 0) {
		return;
	}

	if (node.min == 1 && node.max == 1 && node.greed != Greed::Possessive) {
		tasks_.push_back(Task{Task::Visit, body});
		return;
	}

	if (isSingleUnit(body)) {
		emit(Instruction{Opcode::RepeatChar, node.min, node.max, static_cast<uint32_t>(node.greed)});
		tasks_.push_back(Task{Task::Visit, body});
		return;
	}

	const bool possessive = (node.greed == Greed::Possessive);

	if (possessive) {
		const uint32_t fixup = newFixup();
		fixups_[fixup].pc    = emit(Instruction{Opcode::LookStart, AtomicGroup});
		tasks_.push_back(Task{Task::LookEnd, index, fixup});
	}

	if (node.min == 1 && node.max == 1) {
		tasks_.push_back(Task{Task::Visit, body});
		return;
	}

	const uint32_t counter = program_.counterCount++;
	const Greed greed      = possessive ? Greed::Greedy : node.greed;
	const GroupRange &reset = groups_[body];

	emit(Instruction{Opcode::RepeatInit, counter});

	const uint32_t fixup = newFixup();
	fixups_[fixup].pc    = emit(Instruction{Opcode::RepeatLoop, counter, node.min, node.max, 0, static_cast<uint32_t>(greed)});
	emit(Instruction{Opcode::RepeatEnter, counter, reset.first, reset.end});

	tasks_.push_back(Task{Task::LoopEnd, index, fixup});
	tasks_.push_back(Task{Task::Visit, body});
}

}

/**
 * @brief Lowers a parse tree into a linear program for the backtracking
 * matcher and allocates capture slots and loop counters.
 *
 * @param tree The parse tree.
 * @param options RE_OPTION bits.
 * @param caseFold Rules used to fold literals of case-insensitive patterns.
 * @param limits Structural limits.
 * @return The program.
 * @throws RegexFatalError if a structural limit is exceeded.
 * @throws RegexSyntaxError for a look-behind of unbounded length.
 */
Program CompileProgram(const ParseTree &tree, uint32_t options, CaseFold caseFold, const CompileLimits &limits) {
	CompileContext context(tree, options, caseFold, limits);
	return context.compile();
}
