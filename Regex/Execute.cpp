
#include "Execute.h"
#include "CaseFold.h"
#include "Optimizer.h"
#include "Program.h"
#include "Regex.h"
#include "Search.h"
#include "Util/utils.h"

#include <gsl/gsl_util>

#include <algorithm>
#include <vector>

namespace {

constexpr size_t npos = MatchResult::npos;

// Entries of the backtrack stack.
enum class FrameKind : uint8_t {
	Choice,         // resume at pc/pos
	UndoSlot,       // slots[a] = b
	UndoCounter,    // counters[a] = {b, c}
	RepeatGreedy,   // give back one code unit, pos may not drop below b
	RepeatLazy,     // take one more code unit, pos may not exceed b
	Look,           // look-around marker, pc is the LookStart
	LookBehindNext, // retry the look-behind at pc with the shorter length a
};

struct Frame {
	FrameKind kind;
	uint32_t pc = 0;
	size_t pos  = 0;
	uint32_t a  = 0;
	size_t b    = 0;
	size_t c    = 0;
};

struct Counter {
	size_t count = 0;
	size_t start = npos; // input position at the start of the current iteration
};

bool IsUndo(const Frame &frame) noexcept {
	return frame.kind == FrameKind::UndoSlot || frame.kind == FrameKind::UndoCounter;
}

bool IsBehind(uint32_t kind) noexcept {
	return kind == static_cast<uint32_t>(LookKind::Behind) || kind == static_cast<uint32_t>(LookKind::NegativeBehind);
}

bool IsNegative(uint32_t kind) noexcept {
	return kind == static_cast<uint32_t>(LookKind::NegativeAhead) || kind == static_cast<uint32_t>(LookKind::NegativeBehind);
}

/**
 * @brief The per-call state of the backtracking machine. Nothing in here is
 * shared with the Regex, so any number of these may run concurrently.
 */
class MatchState {
public:
	MatchState(const Regex &re, std::u16string_view input)
		: program_(re.program()), input_(input), caseFold_(re.caseFold()) {
		slots_.resize((program_.captureCount + 1) * 2);
		counters_.resize(program_.counterCount);
	}

public:
	bool run(size_t start);
	std::vector<size_t> slots() const { return slots_; }

private:
	bool backtrack(uint32_t &pc, size_t &pos);
	bool matchUnit(const Instruction &atom, char16_t ch) const noexcept;
	bool matchString(const std::u16string &str, bool ignoreCase, size_t &pos) const noexcept;
	bool matchBackRef(uint32_t group, bool ignoreCase, size_t &pos) const noexcept;
	bool isWordAt(size_t pos) const noexcept;
	bool startLookBehind(uint32_t pc, size_t savedPos, uint32_t length, uint32_t &nextPc, size_t &nextPos);
	bool lookEnd(uint32_t &pc, size_t &pos);
	void setSlot(uint32_t slot, size_t value, bool undo);
	void setCounter(uint32_t index, Counter value);

private:
	const Program &program_;
	std::u16string_view input_;
	CaseFold caseFold_;
	std::vector<size_t> slots_;
	std::vector<Counter> counters_;
	std::vector<Frame> stack_;
};

bool MatchState::isWordAt(size_t pos) const noexcept {
	return pos < input_.size() && safe_isword(input_[pos]);
}

bool MatchState::matchUnit(const Instruction &atom, char16_t ch) const noexcept {
	switch (atom.op) {
	case Opcode::Char:
		return ch == atom.a;
	case Opcode::CharIC:
		return FoldCase(ch, caseFold_) == atom.a;
	case Opcode::Any:
		return !is_line_terminator(ch);
	case Opcode::Class:
		return program_.classes[atom.a].matches(ch, false, caseFold_);
	case Opcode::ClassIC:
		return program_.classes[atom.a].matches(ch, true, caseFold_);
	default:
		ReportError("non unit instruction in REPEAT_CHAR");
		return false;
	}
}

bool MatchState::matchString(const std::u16string &str, bool ignoreCase, size_t &pos) const noexcept {
	if (input_.size() - pos < str.size()) {
		return false;
	}

	for (size_t i = 0; i < str.size(); ++i) {
		const char16_t ch = input_[pos + i];
		if ((ignoreCase ? FoldCase(ch, caseFold_) : ch) != str[i]) {
			return false;
		}
	}

	pos += str.size();
	return true;
}

/**
 * @brief Compares the input at `pos` with the text last captured by `group`.
 * A group that has not captured anything makes the reference fail.
 */
bool MatchState::matchBackRef(uint32_t group, bool ignoreCase, size_t &pos) const noexcept {
	const size_t begin = slots_[group * 2];
	const size_t end   = slots_[group * 2 + 1];

	if (begin == npos || end == npos || end < begin) {
		return false;
	}

	const size_t length = end - begin;
	if (input_.size() - pos < length) {
		return false;
	}

	for (size_t i = 0; i < length; ++i) {
		const char16_t a = input_[begin + i];
		const char16_t b = input_[pos + i];
		if (ignoreCase ? !EqualsIgnoreCase(a, b, caseFold_) : a != b) {
			return false;
		}
	}

	pos += length;
	return true;
}

void MatchState::setSlot(uint32_t slot, size_t value, bool undo) {
	if (undo) {
		Frame frame{FrameKind::UndoSlot};
		frame.a = slot;
		frame.b = slots_[slot];
		stack_.push_back(frame);
	}

	slots_[slot] = value;
}

void MatchState::setCounter(uint32_t index, Counter value) {
	Frame frame{FrameKind::UndoCounter};
	frame.a = index;
	frame.b = counters_[index].count;
	frame.c = counters_[index].start;
	stack_.push_back(frame);

	counters_[index] = value;
}

/**
 * @brief Positions a look-behind body so that it has to end at `savedPos`
 * after consuming `length` code units, and queues the next shorter length.
 * Lengths are tried longest first so the body matches greedily backward.
 *
 * @return false if no length in range fits before `savedPos`.
 */
bool MatchState::startLookBehind(uint32_t pc, size_t savedPos, uint32_t length, uint32_t &nextPc, size_t &nextPos) {
	const Instruction &start = program_.code[pc];

	if (length > savedPos) {
		length = gsl::narrow_cast<uint32_t>(savedPos);
	}

	if (length < start.c || length > start.d) {
		return false;
	}

	if (length > start.c) {
		Frame next{FrameKind::LookBehindNext, pc, savedPos};
		next.a = length - 1;
		stack_.push_back(next);
	}

	nextPc  = pc + 1;
	nextPos = savedPos - length;
	return true;
}

/**
 * @brief Handles the end of a look-around or atomic body.
 *
 * @return false if matching has to backtrack.
 */
bool MatchState::lookEnd(uint32_t &pc, size_t &pos) {

	auto it = std::find_if(stack_.rbegin(), stack_.rend(), [](const Frame &frame) {
		return frame.kind == FrameKind::Look;
	});

	if (it == stack_.rend()) {
		ReportError("LOOK_END without a matching LOOK_START");
		return false;
	}

	const size_t marker      = gsl::narrow_cast<size_t>(std::distance(it, stack_.rend()) - 1);
	const Frame look         = stack_[marker];
	const Instruction &start = program_.code[look.pc];

	// a look-behind body has to end where the assertion started
	if (start.a != AtomicGroup && IsBehind(start.a) && pos != look.pos) {
		return false;
	}

	if (start.a != AtomicGroup && IsNegative(start.a)) {
		// the body matched, so the assertion fails; forget its side effects
		while (stack_.size() > marker) {
			const Frame frame = stack_.back();
			stack_.pop_back();

			if (frame.kind == FrameKind::UndoSlot) {
				slots_[frame.a] = frame.b;
			} else if (frame.kind == FrameKind::UndoCounter) {
				counters_[frame.a] = Counter{frame.b, frame.c};
			}
		}

		return false;
	}

	// commit: drop the choice points of the body but keep its undo records
	auto first = std::next(stack_.begin(), static_cast<std::ptrdiff_t>(marker));
	stack_.erase(std::remove_if(first, stack_.end(), [](const Frame &frame) { return !IsUndo(frame); }), stack_.end());

	if (start.a != AtomicGroup) {
		pos = look.pos;
	}

	pc = start.b;
	return true;
}

/**
 * @brief Pops the backtrack stack until a choice point can be resumed.
 *
 * @return false if there is nothing left to try.
 */
bool MatchState::backtrack(uint32_t &pc, size_t &pos) {

	while (!stack_.empty()) {
		Frame frame = stack_.back();
		stack_.pop_back();

		switch (frame.kind) {
		case FrameKind::Choice:
			pc  = frame.pc;
			pos = frame.pos;
			return true;

		case FrameKind::UndoSlot:
			slots_[frame.a] = frame.b;
			break;

		case FrameKind::UndoCounter:
			counters_[frame.a] = Counter{frame.b, frame.c};
			break;

		case FrameKind::RepeatGreedy:
			pos = frame.pos - 1;
			if (pos > frame.b) {
				frame.pos = pos;
				stack_.push_back(frame);
			}

			pc = frame.pc;
			return true;

		case FrameKind::RepeatLazy: {
			const Instruction &atom = program_.code[frame.pc + 1];
			if (frame.pos < frame.b && frame.pos < input_.size() && matchUnit(atom, input_[frame.pos])) {
				pos = frame.pos + 1;
				if (pos < frame.b) {
					frame.pos = pos;
					stack_.push_back(frame);
				}

				pc = frame.pc + 2;
				return true;
			}
			break;
		}

		case FrameKind::Look: {
			const Instruction &start = program_.code[frame.pc];
			if (start.a != AtomicGroup && IsNegative(start.a)) {
				// the body failed everywhere, so the negative assertion holds
				pc  = start.b;
				pos = frame.pos;
				return true;
			}
			break;
		}

		case FrameKind::LookBehindNext:
			if (startLookBehind(frame.pc, frame.pos, frame.a, pc, pos)) {
				return true;
			}
			break;
		}
	}

	return false;
}

/**
 * @brief Runs the program anchored at `start`.
 *
 * @return true on a match, the spans are then in slots().
 */
bool MatchState::run(size_t start) {

	std::fill(slots_.begin(), slots_.end(), npos);
	std::fill(counters_.begin(), counters_.end(), Counter{});
	stack_.clear();

	const std::vector<Instruction> &code = program_.code;
	const size_t end                     = input_.size();

	uint32_t pc = 0;
	size_t pos  = start;

	for (;;) {
		const Instruction &instr = code[pc];
		bool ok                  = true;

		switch (instr.op) {
		case Opcode::Match:
			slots_[0] = start;
			slots_[1] = pos;
			return true;

		case Opcode::Char:
		case Opcode::CharIC:
		case Opcode::Any:
		case Opcode::Class:
		case Opcode::ClassIC:
			ok = pos < end && matchUnit(instr, input_[pos]);
			if (ok) {
				++pos;
				++pc;
			}
			break;

		case Opcode::String:
		case Opcode::StringIC:
			ok = matchString(program_.strings[instr.a], instr.op == Opcode::StringIC, pos);
			++pc;
			break;

		case Opcode::BeginBuf:
			ok = (pos == 0);
			++pc;
			break;

		case Opcode::EndBuf:
			ok = (pos == end);
			++pc;
			break;

		case Opcode::SemiEndBuf:
			ok = (pos == end) || (pos + 1 == end && input_[pos] == u'\n');
			++pc;
			break;

		case Opcode::BeginLine:
			ok = (pos == 0) || is_line_terminator(input_[pos - 1]);
			++pc;
			break;

		case Opcode::EndLine:
			ok = (pos == end) || is_line_terminator(input_[pos]);
			++pc;
			break;

		case Opcode::WordBoundary:
		case Opcode::NotWordBoundary: {
			const bool before   = pos > 0 && isWordAt(pos - 1);
			const bool boundary = before != isWordAt(pos);
			ok                  = (instr.op == Opcode::WordBoundary) ? boundary : !boundary;
			++pc;
			break;
		}

		case Opcode::Split:
			stack_.push_back(Frame{FrameKind::Choice, instr.b, pos});
			pc = instr.a;
			break;

		case Opcode::Jump:
			pc = instr.a;
			break;

		case Opcode::SaveStart:
		case Opcode::SaveStartUndo:
			setSlot(instr.a * 2, pos, instr.op == Opcode::SaveStartUndo);
			++pc;
			break;

		case Opcode::SaveEnd:
		case Opcode::SaveEndUndo:
			setSlot(instr.a * 2 + 1, pos, instr.op == Opcode::SaveEndUndo);
			++pc;
			break;

		case Opcode::BackRef:
		case Opcode::BackRefIC:
			ok = matchBackRef(instr.a, instr.op == Opcode::BackRefIC, pos);
			++pc;
			break;

		case Opcode::RepeatChar: {
			const Instruction &atom = code[pc + 1];
			const auto greed        = static_cast<Greed>(instr.c);
			const size_t limit      = (instr.b == InfiniteDistance) ? npos : pos + instr.b;

			if (greed == Greed::Lazy) {
				size_t count = 0;
				while (count < instr.a && pos + count < end && matchUnit(atom, input_[pos + count])) {
					++count;
				}

				ok = (count == instr.a);
				if (ok) {
					pos += count;
					if (pos < limit) {
						Frame frame{FrameKind::RepeatLazy, pc, pos};
						frame.b = limit;
						stack_.push_back(frame);
					}
				}
			} else {
				size_t count = 0;
				while (count < instr.b && pos + count < end && matchUnit(atom, input_[pos + count])) {
					++count;
				}

				ok = (count >= instr.a);
				if (ok) {
					if (greed == Greed::Greedy && count > instr.a) {
						Frame frame{FrameKind::RepeatGreedy, pc + 2, pos + count};
						frame.b = pos + instr.a;
						stack_.push_back(frame);
					}

					pos += count;
				}
			}

			pc += 2;
			break;
		}

		case Opcode::RepeatInit:
			setCounter(instr.a, Counter{});
			++pc;
			break;

		case Opcode::RepeatLoop: {
			const size_t count = counters_[instr.a].count;
			const auto greed   = static_cast<Greed>(instr.e);

			if (count < instr.b) {
				++pc;
			} else if (instr.c != InfiniteDistance && count >= instr.c) {
				pc = instr.d;
			} else if (greed == Greed::Lazy) {
				stack_.push_back(Frame{FrameKind::Choice, pc + 1, pos});
				pc = instr.d;
			} else {
				stack_.push_back(Frame{FrameKind::Choice, instr.d, pos});
				++pc;
			}
			break;
		}

		case Opcode::RepeatEnter:
			setCounter(instr.a, Counter{counters_[instr.a].count, pos});
			for (uint32_t group = instr.b; group < instr.c; ++group) {
				if (slots_[group * 2] != npos) {
					setSlot(group * 2, npos, true);
				}

				if (slots_[group * 2 + 1] != npos) {
					setSlot(group * 2 + 1, npos, true);
				}
			}
			++pc;
			break;

		case Opcode::RepeatIncrement: {
			const Counter &counter  = counters_[instr.a];
			const Instruction &loop = code[instr.b];

			// an iteration past the minimum that consumed nothing ends the loop
			if (counter.count >= loop.b && counter.start == pos) {
				ok = false;
				break;
			}

			setCounter(instr.a, Counter{counter.count + 1, counter.start});
			pc = instr.b;
			break;
		}

		case Opcode::LookStart: {
			Frame marker{FrameKind::Look, pc, pos};
			stack_.push_back(marker);

			if (instr.a != AtomicGroup && IsBehind(instr.a)) {
				ok = startLookBehind(pc, pos, instr.d, pc, pos);
			} else {
				++pc;
			}
			break;
		}

		case Opcode::LookEnd:
			ok = lookEnd(pc, pos);
			break;

		case Opcode::Fail:
			ok = false;
			break;
		}

		if (!ok && !backtrack(pc, pos)) {
			return false;
		}
	}
}

/**
 * @brief Computes the range of start positions worth trying.
 *
 * @return false if no position can match.
 */
bool CandidateRange(const OptimizeInfo &info, size_t length, size_t start, size_t &low, size_t &high) {
	low  = start;
	high = length;

	if (info.anchor & ANCHOR_BEGIN_BUF) {
		if (start > 0) {
			return false;
		}

		high = 0;
	}

	if ((info.anchor & ANCHOR_END_BUF_MASK) && info.length.max != InfiniteDistance) {
		const size_t matchEnd = length >= info.anchorDmax ? length - info.anchorDmax : 0;
		if (matchEnd > info.length.max) {
			low = std::max(low, matchEnd - info.length.max);
		}
	}

	if (info.thresholdLength > length) {
		return false;
	}

	high = std::min(high, length - info.thresholdLength);
	return low <= high;
}

bool AtLineStart(std::u16string_view input, size_t pos) noexcept {
	return pos == 0 || is_line_terminator(input[pos - 1]);
}

}

/**
 * @brief Searches `input` for the leftmost match of `re` starting at or
 * after `start`.
 *
 * @param re The compiled expression.
 * @param input The text to search.
 * @param start Offset of the first candidate position.
 * @return The match, if there is one.
 */
std::optional<MatchResult> Execute(const Regex &re, std::u16string_view input, size_t start) {

	if (start > input.size()) {
		return {};
	}

	const OptimizeInfo &info = re.optimizeInfo();

	size_t low;
	size_t high;
	if (!CandidateRange(info, input.size(), start, low, high)) {
		return {};
	}

	MatchState state(re, input);
	const bool lineStarts = (info.subAnchor & ANCHOR_BEGIN_LINE) != 0;

	auto attempt = [&](size_t pos) {
		if (lineStarts && !AtLineStart(input, pos)) {
			return false;
		}

		return state.run(pos);
	};

	if (AlgorithmOf(info.strategy) == SearchAlgorithm::None) {
		for (size_t pos = low; pos <= high; ++pos) {
			if (attempt(pos)) {
				return MatchResult(state.slots());
			}
		}

		return {};
	}

	// Find the next occurrence q of the searched item, then try every start
	// s with q - dMax <= s <= q - dMin that has not been tried yet.
	size_t pos = low;
	while (pos <= high) {
		const size_t from = (info.dMin == InfiniteDistance) ? input.size() : pos + info.dMin;
		const size_t last = (info.dMax == InfiniteDistance) ? input.size() : high + info.dMax;

		size_t q = MatchResult::npos;
		switch (AlgorithmOf(info.strategy)) {
		case SearchAlgorithm::ExactSlow:
			q = FindExactSlow(input, from, last, std::get<SearchExactSlow>(info.strategy));
			break;
		case SearchAlgorithm::ExactSlowCaseInsensitive:
			q = FindExactSlowIC(input, from, last, std::get<SearchExactSlowIC>(info.strategy), re.caseFold());
			break;
		case SearchAlgorithm::BoyerMoore:
			q = FindBoyerMoore(input, from, last, std::get<SearchBoyerMoore>(info.strategy));
			break;
		case SearchAlgorithm::CharacterMap:
			q = FindCharacterMap(input, from, last, std::get<SearchCharacterMap>(info.strategy));
			break;
		case SearchAlgorithm::None:
			break;
		}

		if (q == MatchResult::npos) {
			break;
		}

		const size_t lowStart  = (info.dMax == InfiniteDistance || q < info.dMax) ? pos : std::max(pos, q - info.dMax);
		const size_t highStart = std::min(high, q - info.dMin);

		for (size_t s = lowStart; s <= highStart; ++s) {
			if (attempt(s)) {
				return MatchResult(state.slots());
			}
		}

		pos = highStart + 1;
	}

	return {};
}
