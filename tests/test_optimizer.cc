#include "gtest/gtest.h"
#include "Regex/Optimizer.h"
#include "Regex/Parser.h"
#include "Regex/Regex.h"
#include "Settings/Settings.h"

#include <string>

namespace {

OptimizeInfo OptimizePattern(std::u16string_view pattern, uint32_t options = RE_OPTION_SINGLELINE, bool allowBoyerMoore = true) {
	const ParseTree tree = ParsePattern(pattern, options, CaseFold::Simple);
	return Optimize(tree, options, CaseFold::Simple, allowBoyerMoore);
}

std::u16string ExactOf(const OptimizeInfo &info) {
	if (auto bm = std::get_if<SearchBoyerMoore>(&info.strategy)) {
		return bm->exact;
	}

	if (auto slow = std::get_if<SearchExactSlow>(&info.strategy)) {
		return slow->exact;
	}

	if (auto slowIC = std::get_if<SearchExactSlowIC>(&info.strategy)) {
		return slowIC->exact;
	}

	return std::u16string();
}

}

TEST(Optimizer, BoyerMooreForLiteral) {
	const Regex regex(u"abc", RE_OPTION_SINGLELINE);
	ASSERT_EQ(regex.searchAlgorithm(), SearchAlgorithm::BoyerMoore);

	const auto &bm = std::get<SearchBoyerMoore>(regex.strategy());
	EXPECT_EQ(bm.exact, u"abc");
	EXPECT_EQ(bm.skip[u'a'], 2u);
	EXPECT_EQ(bm.skip[u'b'], 1u);
	EXPECT_EQ(bm.skip[u'c'], 3u);
	EXPECT_EQ(bm.skip[u'z'], 3u);
	EXPECT_EQ(bm.skip[0], 3u);

	EXPECT_EQ(regex.dMin(), 0u);
	EXPECT_EQ(regex.dMax(), 0u);
	EXPECT_EQ(regex.thresholdLength(), 3u);
	EXPECT_EQ(regex.anchor(), 0u);
}

TEST(Optimizer, CaseInsensitiveLiteral) {
	const Regex regex(u"abc", RE_OPTION_SINGLELINE | RE_OPTION_IGNORECASE);
	ASSERT_EQ(regex.searchAlgorithm(), SearchAlgorithm::ExactSlowCaseInsensitive);
	EXPECT_EQ(std::get<SearchExactSlowIC>(regex.strategy()).exact, u"ABC");
	EXPECT_EQ(regex.thresholdLength(), 3u);
}

TEST(Optimizer, BothBufferAnchors) {
	const Regex regex(u"^abc$", RE_OPTION_SINGLELINE);
	EXPECT_EQ(regex.anchor(), ANCHOR_BEGIN_BUF | ANCHOR_END_BUF);
	EXPECT_EQ(regex.anchorDmin(), 0u);
	EXPECT_EQ(regex.anchorDmax(), 0u);
	EXPECT_EQ(regex.subAnchor(), 0u);
}

TEST(Optimizer, SemiEndAnchor) {
	const OptimizeInfo info = OptimizePattern(u"abc$", RE_OPTION_NONE);
	EXPECT_EQ(info.anchor, static_cast<uint32_t>(ANCHOR_SEMI_END_BUF));
	EXPECT_EQ(info.anchorDmin, 0u);
	EXPECT_EQ(info.anchorDmax, 1u);
}

TEST(Optimizer, LineAnchorsAreSubAnchors) {
	const OptimizeInfo info = OptimizePattern(u"^abc$", RE_OPTION_NEGATE_SINGLELINE);
	EXPECT_EQ(info.anchor, 0u);
	EXPECT_EQ(info.subAnchor, ANCHOR_BEGIN_LINE | ANCHOR_END_LINE);
}

TEST(Optimizer, AnchorMustHoldInEveryAlternative) {
	EXPECT_EQ(OptimizePattern(u"^a|^b").anchor, static_cast<uint32_t>(ANCHOR_BEGIN_BUF));
	EXPECT_EQ(OptimizePattern(u"^a|b").anchor, 0u);
}

TEST(Optimizer, SingleCharacterUsesMap) {
	const OptimizeInfo info = OptimizePattern(u"x");
	ASSERT_EQ(AlgorithmOf(info.strategy), SearchAlgorithm::CharacterMap);
	const auto &map = std::get<SearchCharacterMap>(info.strategy).map;
	EXPECT_EQ(map.count(), 1u);
	EXPECT_TRUE(map.test(u'x'));
	EXPECT_EQ(info.thresholdLength, 1u);
}

TEST(Optimizer, ClassUsesMapOfFirstCharacters) {
	const OptimizeInfo info = OptimizePattern(u"[ab]c?");
	ASSERT_EQ(AlgorithmOf(info.strategy), SearchAlgorithm::CharacterMap);
	const auto &map = std::get<SearchCharacterMap>(info.strategy).map;
	EXPECT_EQ(map.count(), 2u);
	EXPECT_TRUE(map.test(u'a'));
	EXPECT_TRUE(map.test(u'b'));
	EXPECT_EQ(info.dMin, 0u);
	EXPECT_EQ(info.dMax, 0u);
	EXPECT_EQ(info.thresholdLength, 1u);
}

TEST(Optimizer, OptionalPrefixExtendsTheMap) {
	const OptimizeInfo info = OptimizePattern(u"[ab]?[cd]");
	ASSERT_EQ(AlgorithmOf(info.strategy), SearchAlgorithm::CharacterMap);
	EXPECT_EQ(std::get<SearchCharacterMap>(info.strategy).map.count(), 4u);
}

TEST(Optimizer, NoStrategy) {
	const OptimizeInfo negated = OptimizePattern(u"[^a]b?");
	EXPECT_EQ(AlgorithmOf(negated.strategy), SearchAlgorithm::None);
	EXPECT_EQ(negated.thresholdLength, 1u);

	const OptimizeInfo empty = OptimizePattern(u".*");
	EXPECT_EQ(AlgorithmOf(empty.strategy), SearchAlgorithm::None);
	EXPECT_EQ(empty.thresholdLength, 0u);

	const OptimizeInfo ignoreCase = OptimizePattern(u"[a-c]", RE_OPTION_SINGLELINE | RE_OPTION_IGNORECASE);
	EXPECT_EQ(AlgorithmOf(ignoreCase.strategy), SearchAlgorithm::None);
}

TEST(Optimizer, ExactRunAfterVariablePart) {
	const OptimizeInfo info = OptimizePattern(u"x*abcd");
	ASSERT_EQ(AlgorithmOf(info.strategy), SearchAlgorithm::BoyerMoore);
	EXPECT_EQ(ExactOf(info), u"abcd");
	EXPECT_EQ(info.dMin, 0u);
	EXPECT_EQ(info.dMax, InfiniteDistance);
	EXPECT_EQ(info.thresholdLength, 4u);
}

TEST(Optimizer, LongerRunWins) {
	const OptimizeInfo info = OptimizePattern(u"ab[0-9]cde");
	EXPECT_EQ(ExactOf(info), u"cde");
	EXPECT_EQ(info.dMin, 3u);
	EXPECT_EQ(info.dMax, 3u);
	EXPECT_EQ(info.thresholdLength, 6u);
}

TEST(Optimizer, RunSpansGroupsAndAnchors) {
	const OptimizeInfo info = OptimizePattern(u"a(b)(?:c)\\bd");
	EXPECT_EQ(ExactOf(info), u"abcd");
	EXPECT_EQ(info.dMin, 0u);
}

TEST(Optimizer, CommonPrefixOfAlternatives) {
	const OptimizeInfo info = OptimizePattern(u"abc|abd");
	ASSERT_EQ(AlgorithmOf(info.strategy), SearchAlgorithm::BoyerMoore);
	EXPECT_EQ(ExactOf(info), u"ab");
}

TEST(Optimizer, FixedRepeatExpandsPrefix) {
	EXPECT_EQ(ExactOf(OptimizePattern(u"(?:ab){3}")), u"ababab");
	EXPECT_EQ(ExactOf(OptimizePattern(u"(?:ab)+c")), u"ab");
}

TEST(Optimizer, RunsAreTruncated) {
	const std::u16string pattern(40, u'q');
	const OptimizeInfo info = OptimizePattern(pattern);
	EXPECT_EQ(ExactOf(info).size(), OptExactMaxLength);
	EXPECT_EQ(info.thresholdLength, OptExactMaxLength);
}

TEST(Optimizer, BoyerMooreCanBeDisabled) {
	EXPECT_EQ(AlgorithmOf(OptimizePattern(u"abc", RE_OPTION_SINGLELINE, false).strategy), SearchAlgorithm::ExactSlow);

	Settings::boyerMoore = false;
	const Regex regex(u"abc", RE_OPTION_SINGLELINE);
	Settings::Reset();

	EXPECT_EQ(regex.searchAlgorithm(), SearchAlgorithm::ExactSlow);
	EXPECT_EQ(std::get<SearchExactSlow>(regex.strategy()).exact, u"abc");
}

TEST(Optimizer, SkipTable) {
	const std::u16string samples[] = {u"ab", u"abcab", u"hello world", u"aaaa", u"xyzzy"};

	for (const std::u16string &exact : samples) {
		const auto skip = BuildSkipTable(exact);
		const size_t len = exact.size();

		for (size_t c = 0; c < CharTableSize; ++c) {
			size_t expected = len;
			for (size_t i = 0; i + 1 < len; ++i) {
				if ((exact[i] & 0xff) == c) {
					expected = len - 1 - i;
				}
			}

			EXPECT_EQ(skip[c], expected) << "character " << c;
		}
	}
}

TEST(Optimizer, SelectionIsDeterministic) {
	const std::u16string patterns[] = {u"abc", u"^a+b$", u"(?:x|y)z", u"[a-f]\\d+", u".*end"};

	for (const std::u16string &pattern : patterns) {
		const Regex first(pattern, RE_OPTION_SINGLELINE);
		const Regex second(pattern, RE_OPTION_SINGLELINE);
		EXPECT_EQ(first.optimizeInfoToString(), second.optimizeInfoToString());
		EXPECT_EQ(first.searchAlgorithm(), second.searchAlgorithm());
		EXPECT_EQ(first.anchor(), second.anchor());
	}
}

TEST(Optimizer, InfoToString) {
	const OptimizeInfo exact = OptimizePattern(u"abc");
	EXPECT_EQ(OptimizeInfoToString(exact).toStdString(),
			  "optimize: BoyerMoore\n"
			  "  anchor:     []\n"
			  "  sub anchor: []\n"
			  "dmin: 0 dmax: 0\n"
			  "threshold length: 3\n"
			  "exact: [abc]: length: 3\n");

	const OptimizeInfo none = OptimizePattern(u"^.*$");
	EXPECT_EQ(OptimizeInfoToString(none).toStdString(),
			  "optimize: None\n"
			  "  anchor:     [begin-buf end-buf](0, 0)\n"
			  "dmin: 0 dmax: 0\n"
			  "threshold length: 0\n");

	const OptimizeInfo map = OptimizePattern(u"[xy]");
	EXPECT_EQ(OptimizeInfoToString(map).toStdString(),
			  "optimize: CharacterMap\n"
			  "  anchor:     []\n"
			  "  sub anchor: []\n"
			  "dmin: 0 dmax: 0\n"
			  "threshold length: 1\n"
			  "map: n = 2\n"
			  "[x, y]\n");
}

TEST(Optimizer, DistanceToString) {
	EXPECT_EQ(DistanceToString(InfiniteDistance).toStdString(), "inf");
	EXPECT_EQ(DistanceToString(7).toStdString(), "7");
}
