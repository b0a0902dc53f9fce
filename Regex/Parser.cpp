
#include "Parser.h"
#include "Reader.h"
#include "RegexError.h"
#include "Util/Raise.h"
#include "Util/utils.h"

#include <QString>

#include <gsl/gsl_util>

#include <string>
#include <utility>

namespace {

std::string ToUtf8(std::u16string_view text) {
	return QString::fromStdU16String(std::u16string(text)).toStdString();
}

bool isGroupNameStart(char16_t ch) noexcept {
	return safe_isalpha(ch) || ch == '_' || ch == '$' || ch > 0x7f;
}

bool isGroupNameChar(char16_t ch) noexcept {
	return isGroupNameStart(ch) || safe_isdigit(ch);
}

/**
 * @brief Builds the set for \d, \D, \w, \W, \s or \S. The upper case
 * forms are stored as the complement rather than as a negated set so that
 * they can be merged into an enclosing class.
 */
CharSet ShorthandClass(char16_t e) {
	const auto lower   = static_cast<char16_t>(e | 0x20);
	const CharSet base = (lower == 'd') ? CharSet::digits() : (lower == 'w') ? CharSet::wordChars() : CharSet::spaces();

	if (e == lower) {
		return base;
	}

	CharSet set;
	set.addComplement(base);
	return set;
}

// One entry per open parenthesis, plus one for the whole pattern.
struct Frame {
	enum Kind {
		TopLevel,
		Capture,
		NonCapture,
		Look,
	};

	Kind kind;
	size_t open;          // offset of the '(' for diagnostics
	uint32_t operand = 0; // capture number or LookKind
	std::vector<NodeIndex> alternatives;
	std::vector<NodeIndex> terms;
};

// Result of scanning one member of a [...] class.
struct ClassAtom {
	bool isSet = false;
	char16_t ch = 0;
	CharSet set;
};

class Parser {
public:
	Parser(std::u16string_view pattern, uint32_t options, CaseFold caseFold, int nestingLimit)
		: in_(pattern), options_(options), caseFold_(caseFold), nestingLimit_(nestingLimit) {
	}

public:
	ParseTree parse();

private:
	uint32_t countCaptures() const;
	uint32_t newCapture();
	NodeIndex finishDisjunction(Frame &frame);
	NodeIndex makeSequence(std::vector<NodeIndex> &terms);
	NodeIndex addAnchor(AnchorType type);
	NodeIndex addClass(CharSet set);
	bool scanBrace(Reader &reader, uint32_t *min, uint32_t *max) const;
	bool atQuantifier() const;
	bool parseQuantifier(uint32_t *min, uint32_t *max, Greed *greed);
	char16_t parseCharacterEscape(char16_t ch);
	ClassAtom parseClassAtom(char16_t ch);
	std::u16string parseGroupName(size_t at);
	void appendAtom(NodeIndex atom, bool quantifiable);
	void appendLiteral(char16_t ch);
	void openGroup(size_t at);
	void closeGroup();
	void parseClass(size_t at);
	void parseEscape(size_t at);

private:
	bool ignoreCase() const noexcept { return (options_ & RE_OPTION_IGNORECASE) != 0; }
	bool multiline() const noexcept { return (options_ & RE_OPTION_NEGATE_SINGLELINE) != 0; }

private:
	Reader in_;
	uint32_t options_;
	CaseFold caseFold_;
	int nestingLimit_;
	ParseTree tree_;
	std::vector<Frame> frames_;
	std::vector<std::pair<NodeIndex, std::u16string>> namedReferences_;
	uint32_t totalCaptures_ = 0;
};

/**
 * @brief Parses the whole pattern. Groups are tracked on an explicit stack
 * of frames rather than by recursion.
 *
 * @return The parse tree.
 */
ParseTree Parser::parse() {

	totalCaptures_ = countCaptures();

	frames_.push_back(Frame{Frame::TopLevel, 0});

	while (!in_.eof()) {
		const size_t at   = in_.index();
		const char16_t ch = in_.read();

		switch (ch) {
		case '|': {
			Frame &frame = frames_.back();
			frame.alternatives.push_back(makeSequence(frame.terms));
			break;
		}
		case '(':
			openGroup(at);
			break;
		case ')':
			if (frames_.size() == 1) {
				Raise<RegexSyntaxError>(ErrorId::UnmatchedCloseParenthesis, FormatDetail("at offset %zu", at));
			}
			closeGroup();
			break;
		case '^':
			appendAtom(addAnchor(multiline() ? AnchorType::BeginLine : AnchorType::BeginBuf), false);
			break;
		case '$':
			if (multiline()) {
				appendAtom(addAnchor(AnchorType::EndLine), false);
			} else if (options_ & RE_OPTION_SINGLELINE) {
				appendAtom(addAnchor(AnchorType::EndBuf), false);
			} else {
				appendAtom(addAnchor(AnchorType::SemiEndBuf), false);
			}
			break;
		case '.':
			appendAtom(tree_.add(Node{NodeType::AnyChar}), true);
			break;
		case '[':
			parseClass(at);
			break;
		case '\\':
			parseEscape(at);
			break;
		case '*':
		case '+':
		case '?':
			Raise<RegexSyntaxError>(ErrorId::TargetOfRepeatNotSpecified, FormatDetail("at offset %zu", at));
		case '{':
			in_.putback();
			if (atQuantifier()) {
				Raise<RegexSyntaxError>(ErrorId::TargetOfRepeatNotSpecified, FormatDetail("at offset %zu", at));
			}
			in_.read();
			appendLiteral(ch);
			break;
		default:
			appendLiteral(ch);
			break;
		}
	}

	if (frames_.size() > 1) {
		Raise<RegexSyntaxError>(ErrorId::UnmatchedParenthesis, FormatDetail("'(' at offset %zu", frames_.back().open));
	}

	tree_.root = finishDisjunction(frames_.back());
	frames_.clear();

	for (auto &[index, name] : namedReferences_) {
		const std::optional<uint32_t> number = tree_.groupNumber(name);
		if (!number) {
			Raise<RegexSyntaxError>(ErrorId::UndefinedNameReference, FormatDetail("\\k<%s>", ToUtf8(name).c_str()));
		}

		tree_[index].operand = *number;
	}

	return std::move(tree_);
}

/**
 * @brief Counts the capturing groups of the pattern ahead of parsing so that
 * backreferences to groups which have not been opened yet can be validated.
 */
uint32_t Parser::countCaptures() const {
	const std::u16string_view p = in_.input();
	const bool plainCaptures    = (options_ & RE_OPTION_DONT_CAPTURE_GROUP) == 0;

	uint32_t count = 0;
	bool inClass   = false;

	for (size_t i = 0; i < p.size(); ++i) {
		const char16_t ch = p[i];

		if (ch == '\\') {
			++i;
		} else if (inClass) {
			inClass = (ch != ']');
		} else if (ch == '[') {
			inClass = true;
		} else if (ch == '(') {
			if (i + 1 < p.size() && p[i + 1] == '?') {
				if (i + 3 < p.size() && p[i + 2] == '<' && p[i + 3] != '=' && p[i + 3] != '!') {
					++count;
				}
			} else if (plainCaptures) {
				++count;
			}
		}
	}

	return count;
}

/**
 * @brief Allocates the next capture number.
 */
uint32_t Parser::newCapture() {
	if (tree_.captureCount >= MaxCaptureGroups) {
		Raise<RegexSyntaxError>(ErrorId::TooManyCaptureGroups, FormatDetail("more than %u groups", MaxCaptureGroups));
	}

	return ++tree_.captureCount;
}

/**
 * @brief Turns the alternatives collected in a frame into a single node.
 */
NodeIndex Parser::finishDisjunction(Frame &frame) {
	frame.alternatives.push_back(makeSequence(frame.terms));

	if (frame.alternatives.size() == 1) {
		return frame.alternatives.front();
	}

	Node node{NodeType::Alternation};
	node.children = std::move(frame.alternatives);
	frame.alternatives.clear();
	return tree_.add(std::move(node));
}

/**
 * @brief Turns the terms of one alternative into a single node and clears
 * the term list.
 */
NodeIndex Parser::makeSequence(std::vector<NodeIndex> &terms) {
	NodeIndex result;

	if (terms.empty()) {
		result = tree_.add(Node{NodeType::Empty});
	} else if (terms.size() == 1) {
		result = terms.front();
	} else {
		Node node{NodeType::Concatenation};
		node.children = terms;
		result        = tree_.add(std::move(node));
	}

	terms.clear();
	return result;
}

NodeIndex Parser::addAnchor(AnchorType type) {
	Node node{NodeType::Anchor};
	node.operand = static_cast<uint32_t>(type);
	return tree_.add(std::move(node));
}

NodeIndex Parser::addClass(CharSet set) {
	if (ignoreCase()) {
		set.closeOverCase(caseFold_);
	}

	tree_.classes.push_back(std::move(set));

	Node node{NodeType::CharClass};
	node.operand = gsl::narrow_cast<uint32_t>(tree_.classes.size() - 1);
	return tree_.add(std::move(node));
}

/**
 * @brief Scans a {m}, {m,} or {m,n} quantifier starting at the '{' under
 * `reader`. On success `reader` is left after the '}'.
 *
 * @return `false` if the text is not a quantifier, in which case the '{'
 * is an ordinary character.
 */
bool Parser::scanBrace(Reader &reader, uint32_t *min, uint32_t *max) const {

	if (!reader.match('{')) {
		return false;
	}

	auto toNumber = [](std::u16string_view digits) {
		uint64_t value = 0;
		for (char16_t ch : digits) {
			value = value * 10 + static_cast<uint64_t>(ch - '0');
			if (value > MaxRepeatCount) {
				Raise<RegexSyntaxError>(ErrorId::TooBigNumberForRepeatRange, FormatDetail("%s", ToUtf8(digits).c_str()));
			}
		}
		return gsl::narrow_cast<uint32_t>(value);
	};

	const std::u16string_view lower = reader.match_while([](char16_t ch) { return safe_isdigit(ch); });
	if (lower.empty()) {
		return false;
	}

	std::u16string_view upper;
	const bool comma = reader.match(',');
	if (comma) {
		upper = reader.match_while([](char16_t ch) { return safe_isdigit(ch); });
	}

	if (!reader.match('}')) {
		return false;
	}

	*min = toNumber(lower);
	if (!comma) {
		*max = *min;
	} else if (upper.empty()) {
		*max = InfiniteDistance;
	} else {
		*max = toNumber(upper);
		if (*max < *min) {
			Raise<RegexSyntaxError>(ErrorId::UpperSmallerThanLowerInRepeatRange, FormatDetail("{%u,%u}", *min, *max));
		}
	}

	return true;
}

bool Parser::atQuantifier() const {
	switch (in_.peek()) {
	case '*':
	case '+':
	case '?':
		return !in_.eof();
	case '{': {
		Reader scan = in_;
		uint32_t min;
		uint32_t max;
		return scanBrace(scan, &min, &max);
	}
	default:
		return false;
	}
}

/**
 * @brief Consumes a quantifier and its lazy ('?') or possessive ('+') suffix.
 *
 * @return `false` if no quantifier follows.
 */
bool Parser::parseQuantifier(uint32_t *min, uint32_t *max, Greed *greed) {
	if (in_.eof()) {
		return false;
	}

	switch (in_.peek()) {
	case '*':
		in_.read();
		*min = 0;
		*max = InfiniteDistance;
		break;
	case '+':
		in_.read();
		*min = 1;
		*max = InfiniteDistance;
		break;
	case '?':
		in_.read();
		*min = 0;
		*max = 1;
		break;
	case '{': {
		// a brace that is not a valid range stays literal text
		Reader scan = in_;
		if (!scanBrace(scan, min, max)) {
			return false;
		}
		in_ = scan;
		break;
	}
	default:
		return false;
	}

	if (in_.match('?')) {
		*greed = Greed::Lazy;
	} else if (in_.match('+')) {
		*greed = Greed::Possessive;
	} else {
		*greed = Greed::Greedy;
	}

	return true;
}

/**
 * @brief Adds an atom to the current alternative, wrapping it in a
 * quantifier node if one follows.
 *
 * @param atom The atom.
 * @param quantifiable Whether a quantifier may be applied to it.
 */
void Parser::appendAtom(NodeIndex atom, bool quantifiable) {
	const size_t at = in_.index();

	uint32_t min;
	uint32_t max;
	Greed greed;

	if (parseQuantifier(&min, &max, &greed)) {
		if (!quantifiable) {
			Raise<RegexSyntaxError>(ErrorId::TargetOfRepeatInvalid, FormatDetail("at offset %zu", at));
		}

		Node node{NodeType::Quantifier};
		node.min      = min;
		node.max      = max;
		node.greed    = greed;
		node.children = {atom};
		atom          = tree_.add(std::move(node));

		if (atQuantifier()) {
			Raise<RegexSyntaxError>(ErrorId::TargetOfRepeatNotSpecified, FormatDetail("at offset %zu", in_.index()));
		}
	}

	frames_.back().terms.push_back(atom);
}

/**
 * @brief Adds a literal character. Consecutive literals are merged into one
 * String node unless the character is the target of a quantifier.
 */
void Parser::appendLiteral(char16_t ch) {
	std::vector<NodeIndex> &terms = frames_.back().terms;

	if (!atQuantifier() && !terms.empty() && tree_[terms.back()].type == NodeType::String) {
		tree_.strings[tree_[terms.back()].operand].push_back(ch);
		return;
	}

	tree_.strings.emplace_back(1, ch);

	Node node{NodeType::String};
	node.operand = gsl::narrow_cast<uint32_t>(tree_.strings.size() - 1);
	appendAtom(tree_.add(std::move(node)), true);
}

/**
 * @brief Reads the name of a named group or a \k<name> reference. The '<'
 * has already been consumed; the '>' is consumed here.
 */
std::u16string Parser::parseGroupName(size_t at) {
	std::u16string name;

	if (in_.eof()) {
		Raise<RegexSyntaxError>(ErrorId::EndPatternInGroup, FormatDetail("at offset %zu", at));
	}

	if (in_.next_is('>')) {
		Raise<RegexSyntaxError>(ErrorId::EmptyGroupName, FormatDetail("at offset %zu", at));
	}

	if (!isGroupNameStart(in_.peek())) {
		Raise<RegexSyntaxError>(ErrorId::InvalidGroupName, FormatDetail("at offset %zu", in_.index()));
	}

	name = std::u16string(in_.match_while(isGroupNameChar));

	if (!in_.match('>')) {
		Raise<RegexSyntaxError>(ErrorId::InvalidGroupName, FormatDetail("<%s at offset %zu", ToUtf8(name).c_str(), at));
	}

	return name;
}

/**
 * @brief Handles an opening parenthesis: reads the group kind and pushes a
 * new frame.
 *
 * @param at Offset of the '('.
 */
void Parser::openGroup(size_t at) {
	if (frames_.size() > static_cast<size_t>(nestingLimit_)) {
		Raise<RegexFatalError>(ErrorId::NestingTooDeep, FormatDetail("more than %d levels at offset %zu", nestingLimit_, at));
	}

	Frame frame{Frame::Capture, at};

	if (in_.match('?')) {
		const char16_t kind = in_.read();
		switch (kind) {
		case ':':
			frame.kind = Frame::NonCapture;
			break;
		case '=':
			frame.kind    = Frame::Look;
			frame.operand = static_cast<uint32_t>(LookKind::Ahead);
			break;
		case '!':
			frame.kind    = Frame::Look;
			frame.operand = static_cast<uint32_t>(LookKind::NegativeAhead);
			break;
		case '<':
			if (in_.match('=')) {
				frame.kind    = Frame::Look;
				frame.operand = static_cast<uint32_t>(LookKind::Behind);
			} else if (in_.match('!')) {
				frame.kind    = Frame::Look;
				frame.operand = static_cast<uint32_t>(LookKind::NegativeBehind);
			} else {
				std::u16string name = parseGroupName(at);
				if (tree_.groupNumber(name)) {
					Raise<RegexSyntaxError>(ErrorId::MultiplexDefinedName, FormatDetail("<%s>", ToUtf8(name).c_str()));
				}

				frame.operand = newCapture();
				tree_.names.push_back(GroupName{std::move(name), frame.operand});
			}
			break;
		case '\0':
			if (in_.eof()) {
				Raise<RegexSyntaxError>(ErrorId::EndPatternInGroup, FormatDetail("at offset %zu", at));
			}
			[[fallthrough]];
		default:
			Raise<RegexSyntaxError>(ErrorId::UndefinedGroupOption, FormatDetail("(?%s at offset %zu", ToUtf8(std::u16string(1, kind)).c_str(), at));
		}
	} else if (options_ & RE_OPTION_DONT_CAPTURE_GROUP) {
		frame.kind = Frame::NonCapture;
	} else {
		frame.operand = newCapture();
	}

	frames_.push_back(std::move(frame));
}

/**
 * @brief Handles a closing parenthesis: pops the frame and adds the group
 * to the enclosing alternative.
 */
void Parser::closeGroup() {
	Frame frame          = std::move(frames_.back());
	frames_.pop_back();

	const NodeIndex body = finishDisjunction(frame);

	Node node{frame.kind == Frame::Look ? NodeType::LookAround : NodeType::Group};
	node.operand  = frame.operand;
	node.children = {body};

	bool quantifiable = true;
	if (frame.kind == Frame::Look) {
		const auto kind = static_cast<LookKind>(frame.operand);
		quantifiable    = (kind == LookKind::Ahead || kind == LookKind::NegativeAhead);
	}

	appendAtom(tree_.add(std::move(node)), quantifiable);
}

/**
 * @brief Decodes a character escape. `ch` is the character after the
 * backslash and has already been consumed.
 *
 * @return The code unit the escape stands for.
 */
char16_t Parser::parseCharacterEscape(char16_t ch) {
	switch (ch) {
	case 'n':
		return '\n';
	case 'r':
		return '\r';
	case 't':
		return '\t';
	case 'v':
		return 0x0b;
	case 'f':
		return 0x0c;
	case '0': {
		// \0 is NUL, \0ddd is a legacy octal escape no greater than \0377
		uint32_t value = 0;
		for (int i = 0; i < 3 && safe_isoctal(in_.peek()) && !in_.eof(); ++i) {
			const uint32_t next = value * 8 + static_cast<uint32_t>(in_.peek() - '0');
			if (next > 0377) {
				break;
			}
			value = next;
			in_.read();
		}
		return static_cast<char16_t>(value);
	}
	case 'c': {
		if (in_.eof()) {
			Raise<RegexSyntaxError>(ErrorId::EndPatternAtControl, FormatDetail("at offset %zu", in_.index()));
		}

		if (safe_isalpha(in_.peek())) {
			return static_cast<char16_t>(in_.read() % 32);
		}

		// not a control escape, the backslash stands for itself
		in_.putback();
		return '\\';
	}
	case 'x':
	case 'u': {
		const int width = (ch == 'x') ? 2 : 4;
		Reader scan     = in_;
		uint32_t value  = 0;

		for (int i = 0; i < width; ++i) {
			const int digit = hex_value(scan.read());
			if (digit < 0) {
				return ch; // identity escape
			}
			value = (value << 4) | static_cast<uint32_t>(digit);
		}

		in_ = scan;
		return static_cast<char16_t>(value);
	}
	default:
		return ch;
	}
}

/**
 * @brief Reads one member of a [...] class. `ch` has already been consumed.
 */
ClassAtom Parser::parseClassAtom(char16_t ch) {
	ClassAtom atom;

	if (ch != '\\') {
		atom.ch = ch;
		return atom;
	}

	if (in_.eof()) {
		Raise<RegexSyntaxError>(ErrorId::EndPatternAtEscape, FormatDetail("at offset %zu", in_.index()));
	}

	const char16_t e = in_.read();
	switch (e) {
	case 'd':
	case 'D':
	case 'w':
	case 'W':
	case 's':
	case 'S':
		atom.isSet = true;
		atom.set   = ShorthandClass(e);
		return atom;
	case 'b':
		atom.ch = 0x08;
		return atom;
	case '-':
		atom.ch = '-';
		return atom;
	default:
		if (safe_isdigit(e) && e != '0') {
			// no backreferences inside a class: legacy octal or identity escape
			if (safe_isoctal(e)) {
				uint32_t value = static_cast<uint32_t>(e - '0');
				while (safe_isoctal(in_.peek()) && !in_.eof() && value * 8 + static_cast<uint32_t>(in_.peek() - '0') <= 0377) {
					value = value * 8 + static_cast<uint32_t>(in_.read() - '0');
				}
				atom.ch = static_cast<char16_t>(value);
			} else {
				atom.ch = e;
			}
			return atom;
		}

		atom.ch = parseCharacterEscape(e);
		return atom;
	}
}

/**
 * @brief Parses a [...] character class. The '[' has already been consumed.
 *
 * @param at Offset of the '['.
 */
void Parser::parseClass(size_t at) {
	CharSet set;
	set.setNegated(in_.match('^'));

	for (;;) {
		if (in_.eof()) {
			Raise<RegexSyntaxError>(ErrorId::PrematureEndOfCharClass, FormatDetail("'[' at offset %zu", at));
		}

		const char16_t ch = in_.read();
		if (ch == ']') {
			break;
		}

		ClassAtom first = parseClassAtom(ch);

		// a '-' right before the closing ']' is literal
		const bool range = in_.next_is('-') && in_.index() + 1 < in_.input().size() && in_.peek(1) != ']';
		if (!range) {
			if (first.isSet) {
				set.addSet(first.set);
			} else {
				set.add(first.ch);
			}
			continue;
		}

		in_.read(); // '-'
		const size_t rangeAt = in_.index();
		ClassAtom last       = parseClassAtom(in_.read());

		if (first.isSet || last.isSet) {
			// [\d-z] is a union of \d, '-' and 'z'
			for (const ClassAtom *a : {&first, &last}) {
				if (a->isSet) {
					set.addSet(a->set);
				} else {
					set.add(a->ch);
				}
			}
			set.add('-');
			continue;
		}

		if (first.ch > last.ch) {
			Raise<RegexSyntaxError>(ErrorId::EmptyRangeInCharClass, FormatDetail("at offset %zu", rangeAt));
		}

		set.addRange(first.ch, last.ch);
	}

	appendAtom(addClass(std::move(set)), true);
}

/**
 * @brief Parses an escape outside of a class. The '\' has already been
 * consumed.
 *
 * @param at Offset of the '\'.
 */
void Parser::parseEscape(size_t at) {
	if (in_.eof()) {
		Raise<RegexSyntaxError>(ErrorId::EndPatternAtEscape, FormatDetail("at offset %zu", at));
	}

	const char16_t ch = in_.read();
	switch (ch) {
	case 'b':
		appendAtom(addAnchor(AnchorType::WordBoundary), false);
		return;
	case 'B':
		appendAtom(addAnchor(AnchorType::NotWordBoundary), false);
		return;
	case 'A':
		appendAtom(addAnchor(AnchorType::BeginBuf), false);
		return;
	case 'z':
		appendAtom(addAnchor(AnchorType::EndBuf), false);
		return;
	case 'Z':
		appendAtom(addAnchor(AnchorType::SemiEndBuf), false);
		return;
	case 'd':
	case 'D':
	case 'w':
	case 'W':
	case 's':
	case 'S':
		appendAtom(addClass(ShorthandClass(ch)), true);
		return;
	case 'k':
		if (in_.match('<')) {
			std::u16string name = parseGroupName(at);

			Node node{NodeType::BackReference};
			const NodeIndex index = tree_.add(std::move(node));
			namedReferences_.emplace_back(index, std::move(name));
			appendAtom(index, true);
			return;
		}
		appendLiteral(ch);
		return;
	default:
		break;
	}

	if (safe_isdigit(ch) && ch != '0') {
		in_.putback();
		const std::u16string_view digits = in_.match_while([](char16_t c) { return safe_isdigit(c); });

		uint64_t number = 0;
		for (char16_t d : digits) {
			number = number * 10 + static_cast<uint64_t>(d - '0');
			if (number > totalCaptures_) {
				Raise<RegexSyntaxError>(ErrorId::InvalidBackref, FormatDetail("\\%s", ToUtf8(digits).c_str()));
			}
		}

		Node node{NodeType::BackReference};
		node.operand = gsl::narrow_cast<uint32_t>(number);
		appendAtom(tree_.add(std::move(node)), true);
		return;
	}

	appendLiteral(parseCharacterEscape(ch));
}

}

/**
 * @brief Parses `pattern` into a tree.
 *
 * @param pattern The pattern text in the engine's syntax.
 * @param options RE_OPTION bits; they decide what '^', '$' and '(' mean.
 * @param caseFold Rules used to close character classes over case when the
 * pattern is case-insensitive.
 * @param nestingLimit Deepest group nesting accepted.
 * @return The parse tree.
 * @throws RegexSyntaxError if the pattern is malformed.
 * @throws RegexFatalError if groups nest deeper than `nestingLimit`.
 */
ParseTree ParsePattern(std::u16string_view pattern, uint32_t options, CaseFold caseFold, int nestingLimit) {
	Parser parser(pattern, options, caseFold, nestingLimit);
	return parser.parse();
}
