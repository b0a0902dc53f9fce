#include "gtest/gtest.h"
#include "Regex/Compile.h"
#include "Regex/Decompile.h"
#include "Regex/Parser.h"
#include "Regex/Regex.h"
#include "Regex/RegexError.h"

#include <string>

namespace {

Program Compile(std::u16string_view pattern, uint32_t options = RE_OPTION_SINGLELINE, CompileLimits limits = CompileLimits()) {
	const ParseTree tree = ParsePattern(pattern, options, CaseFold::Simple);
	return CompileProgram(tree, options, CaseFold::Simple, limits);
}

std::u16string NestedGroups(int depth, std::u16string_view open) {
	std::u16string pattern;
	for (int i = 0; i < depth; ++i) {
		pattern += open;
	}
	pattern += u"a";
	for (int i = 0; i < depth; ++i) {
		pattern += u")";
	}
	return pattern;
}

}

TEST(Compile, Literal) {
	const Program program = Compile(u"abc");
	ASSERT_EQ(program.code.size(), 2u);
	EXPECT_EQ(program.code[0].op, Opcode::String);
	EXPECT_EQ(program.strings[program.code[0].a], u"abc");
	EXPECT_EQ(program.code[1].op, Opcode::Match);
}

TEST(Compile, IgnoreCaseLiteralsAreFolded) {
	const Program program = Compile(u"x", RE_OPTION_SINGLELINE | RE_OPTION_IGNORECASE);
	ASSERT_EQ(program.code.size(), 2u);
	EXPECT_EQ(program.code[0].op, Opcode::CharIC);
	EXPECT_EQ(program.code[0].a, static_cast<uint32_t>(u'X'));
}

TEST(Compile, SingleUnitRepeat) {
	const Program program = Compile(u"a*?");
	ASSERT_EQ(program.code.size(), 3u);
	EXPECT_EQ(program.code[0].op, Opcode::RepeatChar);
	EXPECT_EQ(program.code[0].a, 0u);
	EXPECT_EQ(program.code[0].b, InfiniteDistance);
	EXPECT_EQ(program.code[0].c, static_cast<uint32_t>(Greed::Lazy));
	EXPECT_EQ(program.code[1].op, Opcode::Char);
	EXPECT_EQ(program.counterCount, 0u);
}

TEST(Compile, CountedLoop) {
	const Program program = Compile(u"(?:ab){2,4}");
	ASSERT_EQ(program.code.size(), 6u);
	EXPECT_EQ(program.code[0].op, Opcode::RepeatInit);
	EXPECT_EQ(program.code[1].op, Opcode::RepeatLoop);
	EXPECT_EQ(program.code[1].b, 2u);
	EXPECT_EQ(program.code[1].c, 4u);
	EXPECT_EQ(program.code[1].d, 5u);
	EXPECT_EQ(program.code[2].op, Opcode::RepeatEnter);
	EXPECT_EQ(program.code[3].op, Opcode::String);
	EXPECT_EQ(program.code[4].op, Opcode::RepeatIncrement);
	EXPECT_EQ(program.code[4].b, 1u);
	EXPECT_EQ(program.code[5].op, Opcode::Match);
	EXPECT_EQ(program.counterCount, 1u);
}

TEST(Compile, LoopResetsInnerGroups) {
	const Program program = Compile(u"(?:(a)|(b))+");
	ASSERT_EQ(program.code[2].op, Opcode::RepeatEnter);
	EXPECT_EQ(program.code[2].b, 1u);
	EXPECT_EQ(program.code[2].c, 3u);
}

TEST(Compile, ZeroRepeatEmitsNothing) {
	const Program program = Compile(u"a{0}");
	ASSERT_EQ(program.code.size(), 1u);
	EXPECT_EQ(program.code[0].op, Opcode::Match);
}

TEST(Compile, PossessiveLoopIsAtomic) {
	const Program program = Compile(u"(?:ab)++");
	ASSERT_GE(program.code.size(), 2u);
	EXPECT_EQ(program.code.front().op, Opcode::LookStart);
	EXPECT_EQ(program.code.front().a, AtomicGroup);
	EXPECT_EQ(program.code[program.code.size() - 2].op, Opcode::LookEnd);
}

TEST(Compile, Alternation) {
	const Program program = Compile(u"a|b|c");

	// SPLIT 1,3; CHAR a; JUMP 7; SPLIT 4,6; CHAR b; JUMP 7; CHAR c; MATCH
	ASSERT_EQ(program.code.size(), 8u);
	EXPECT_EQ(program.code[0].op, Opcode::Split);
	EXPECT_EQ(program.code[0].a, 1u);
	EXPECT_EQ(program.code[0].b, 3u);
	EXPECT_EQ(program.code[2].op, Opcode::Jump);
	EXPECT_EQ(program.code[2].a, 7u);
	EXPECT_EQ(program.code[3].op, Opcode::Split);
	EXPECT_EQ(program.code[3].b, 6u);
	EXPECT_EQ(program.code[5].a, 7u);
	EXPECT_EQ(program.code[6].op, Opcode::Char);
	EXPECT_EQ(program.code[7].op, Opcode::Match);
}

TEST(Compile, BacktrackGroups) {
	const Program plain = Compile(u"(a)b");
	EXPECT_FALSE(plain.backtrackGroups[1]);
	EXPECT_EQ(plain.code[0].op, Opcode::SaveStart);

	const Program alternative = Compile(u"(a)|(b)");
	EXPECT_TRUE(alternative.backtrackGroups[1]);
	EXPECT_TRUE(alternative.backtrackGroups[2]);

	const Program repeated = Compile(u"(?:(a)b)*");
	EXPECT_TRUE(repeated.backtrackGroups[1]);

	const Program referenced = Compile(u"(a)\\1");
	EXPECT_TRUE(referenced.backtrackGroups[1]);
	EXPECT_EQ(referenced.code[0].op, Opcode::SaveStartUndo);
}

TEST(Compile, LookBehindBounds) {
	const Program program = Compile(u"(?<=ab|c)d");
	ASSERT_EQ(program.code[0].op, Opcode::LookStart);
	EXPECT_EQ(program.code[0].a, static_cast<uint32_t>(LookKind::Behind));
	EXPECT_EQ(program.code[0].c, 1u);
	EXPECT_EQ(program.code[0].d, 2u);
}

TEST(Compile, UnboundedLookBehindIsRejected) {
	try {
		Compile(u"(?<=a+)b");
		FAIL() << "unbounded look-behind was accepted";
	} catch (const RegexSyntaxError &e) {
		EXPECT_EQ(e.id(), ErrorId::InvalidLookBehindPattern);
	}
}

TEST(Compile, ProgramLimit) {
	CompileLimits limits;
	limits.programLimit = 5;

	EXPECT_NO_THROW(Compile(u"abc", RE_OPTION_SINGLELINE, limits));

	try {
		Compile(u"a|b|c|d", RE_OPTION_SINGLELINE, limits);
		FAIL() << "program limit was not enforced";
	} catch (const RegexFatalError &e) {
		EXPECT_EQ(e.id(), ErrorId::ProgramTooLarge);
	}
}

TEST(Compile, DeeplyNestedGroupsAreFatal) {
	const std::u16string pattern = NestedGroups(100000, u"(");

	try {
		Regex regex(pattern, RE_OPTION_SINGLELINE);
		FAIL() << "nesting limit was not enforced";
	} catch (const RegexSyntaxError &) {
		FAIL() << "nesting is not a syntax error";
	} catch (const RegexFatalError &e) {
		EXPECT_EQ(e.id(), ErrorId::NestingTooDeep);
	}
}

TEST(Compile, NestingBelowTheLimitCompiles) {
	const Regex regex(NestedGroups(2000, u"(?:"), RE_OPTION_SINGLELINE);
	const std::optional<MatchResult> m = regex.execute(u"xa");
	ASSERT_TRUE(m);
	EXPECT_EQ(m->begin(0), 1u);
}

TEST(Compile, ConflictingCaptureOptions) {
	// rejected before parsing, so even an invalid pattern reports the options
	for (const char16_t *pattern : {u"(a)", u"", u"(", u"a**", u"[z-a]"}) {
		try {
			Regex regex(pattern, RE_OPTION_CAPTURE_GROUP | RE_OPTION_DONT_CAPTURE_GROUP);
			FAIL() << "conflicting options were accepted";
		} catch (const RegexSyntaxError &e) {
			EXPECT_EQ(e.id(), ErrorId::InvalidCombinationOfOptions);
		}
	}
}

TEST(Compile, CaptureGroupOptionIsTheDefault) {
	const Regex plain(u"(a)(?<n>b)", RE_OPTION_SINGLELINE);
	const Regex explicitCapture(u"(a)(?<n>b)", RE_OPTION_SINGLELINE | RE_OPTION_CAPTURE_GROUP);
	const Regex noCapture(u"(a)(?<n>b)", RE_OPTION_SINGLELINE | RE_OPTION_DONT_CAPTURE_GROUP);

	EXPECT_EQ(plain.program().captureCount, 2u);
	EXPECT_EQ(explicitCapture.program().captureCount, 2u);
	EXPECT_EQ(noCapture.program().captureCount, 1u);
}

TEST(Compile, Disassemble) {
	const Program program    = Compile(u"(a)x*|\\1");
	const std::string listing = Disassemble(program).toStdString();

	EXPECT_NE(listing.find("SAVE_START_UNDO"), std::string::npos);
	EXPECT_NE(listing.find("REPEAT_CHAR"), std::string::npos);
	EXPECT_NE(listing.find("SPLIT"), std::string::npos);
	EXPECT_NE(listing.find("BACKREF"), std::string::npos);
	EXPECT_NE(listing.find("MATCH"), std::string::npos);
	EXPECT_EQ(DecompileProgram(program).size(), program.code.size());
}
