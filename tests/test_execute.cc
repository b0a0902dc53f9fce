#include "gtest/gtest.h"
#include "Regex/Regex.h"

#include <string>
#include <thread>
#include <vector>

namespace {

constexpr uint32_t Default    = RE_OPTION_SINGLELINE;
constexpr uint32_t IgnoreCase = RE_OPTION_SINGLELINE | RE_OPTION_IGNORECASE;
constexpr uint32_t Multiline  = RE_OPTION_NEGATE_SINGLELINE;

// The text of group 0, or "<none>" if there is no match.
std::u16string Find(std::u16string_view pattern, std::u16string_view input, uint32_t options = Default, size_t start = 0) {
	const Regex regex(pattern, options);
	const std::optional<MatchResult> m = regex.execute(input, start);
	if (!m) {
		return u"<none>";
	}

	return std::u16string(m->str(input));
}

// The text of a capture group, or "<unset>" if it did not participate.
std::u16string Group(const MatchResult &m, std::u16string_view input, size_t group) {
	if (!m.matched(group)) {
		return u"<unset>";
	}

	return std::u16string(m.str(input, group));
}

}

TEST(Execute, GreedyRepeatSpansInput) {
	const Regex regex(u"a+b", Default);
	const std::optional<MatchResult> m = regex.execute(u"aaab", 0);
	ASSERT_TRUE(m);
	EXPECT_EQ(m->begin(), 0u);
	EXPECT_EQ(m->end(), 4u);
	EXPECT_EQ(m->size(), 1u);
}

TEST(Execute, Leftmost) {
	EXPECT_EQ(Find(u"b+", u"aabbbab"), u"bbb");
	EXPECT_EQ(Find(u"needle", u"haystack with needle inside"), u"needle");
	EXPECT_EQ(Find(u"x", u"abc"), u"<none>");
	EXPECT_EQ(Find(u"abcd", u"abc"), u"<none>");
}

TEST(Execute, StrategiesAgree) {
	// BoyerMoore, ExactSlow, ExactSlowCaseInsensitive, CharacterMap, None
	EXPECT_EQ(Find(u"ab[0-9]cde", u"xxab5cdeab6cde"), u"ab5cde");
	EXPECT_EQ(Find(u"x*abcd", u"zzxxabcd"), u"xxabcd");
	EXPECT_EQ(Find(u"NEEDLE", u"a needle", IgnoreCase), u"needle");
	EXPECT_EQ(Find(u"[ab]c?", u"xxbc"), u"bc");
	EXPECT_EQ(Find(u"[^x]+", u"xxyz"), u"yz");
}

TEST(Execute, EmptyPattern) {
	const Regex regex(u"", Default);
	const std::optional<MatchResult> m = regex.execute(u"abc", 3);
	ASSERT_TRUE(m);
	EXPECT_EQ(m->begin(), 3u);
	EXPECT_EQ(m->length(), 0u);
}

TEST(Execute, StartOffset) {
	EXPECT_EQ(Find(u"a.", u"a1a2", Default, 1), u"a2");

	const Regex regex(u"a", Default);
	EXPECT_FALSE(regex.execute(u"abc", 4));

	const std::optional<MatchResult> m = regex.execute(u"aXa", 1);
	ASSERT_TRUE(m);
	EXPECT_EQ(m->begin(), 2u);
}

TEST(Execute, LazyRepeat) {
	EXPECT_EQ(Find(u"a+?", u"aaa"), u"a");
	EXPECT_EQ(Find(u"a*?b", u"aab"), u"aab");
	EXPECT_EQ(Find(u"<.+?>", u"<a><b>"), u"<a>");
	EXPECT_EQ(Find(u"(?:ab)*?c", u"ababc"), u"ababc");
	EXPECT_EQ(Find(u"(?:ab){1,3}?", u"ababab"), u"ab");
}

TEST(Execute, PossessiveRepeat) {
	EXPECT_EQ(Find(u"a*+a", u"aaa"), u"<none>");
	EXPECT_EQ(Find(u"a++b", u"aab"), u"aab");
	EXPECT_EQ(Find(u"(?:ab)++ab", u"ababab"), u"<none>");
	EXPECT_EQ(Find(u"(?:ab)++c", u"ababc"), u"ababc");
}

TEST(Execute, CountedRepeat) {
	EXPECT_EQ(Find(u"a{2,3}", u"aaaa"), u"aaa");
	EXPECT_EQ(Find(u"a{2}", u"a"), u"<none>");
	EXPECT_EQ(Find(u"(?:ab){2}", u"abababx"), u"abab");
	EXPECT_EQ(Find(u"(?:ab){2,}", u"ab abababx"), u"ababab");
	EXPECT_EQ(Find(u"a.*c", u"abcbc"), u"abcbc");
}

TEST(Execute, AlternationOrder) {
	EXPECT_EQ(Find(u"a|ab", u"ab"), u"a");
	EXPECT_EQ(Find(u"(?:ab|a)c", u"ac"), u"ac");
	EXPECT_EQ(Find(u"cat|dog", u"hotdog"), u"dog");
}

TEST(Execute, Captures) {
	const std::u16string input = u"a";
	const Regex regex(u"(a)(b)?", Default);
	const std::optional<MatchResult> m = regex.execute(input);
	ASSERT_TRUE(m);
	EXPECT_EQ(m->size(), 3u);
	EXPECT_EQ(Group(*m, input, 1), u"a");
	EXPECT_EQ(Group(*m, input, 2), u"<unset>");
	EXPECT_EQ(m->begin(2), MatchResult::npos);
}

TEST(Execute, LastIterationWins) {
	const std::u16string input = u"abac";
	const Regex regex(u"(a|b)*c", Default);
	const std::optional<MatchResult> m = regex.execute(input);
	ASSERT_TRUE(m);
	EXPECT_EQ(Group(*m, input, 0), u"abac");
	EXPECT_EQ(m->begin(1), 2u);
	EXPECT_EQ(m->end(1), 3u);
}

TEST(Execute, CapturesResetOnEachIteration) {
	const std::u16string input = u"ab";
	const Regex regex(u"(?:(a)|(b))+", Default);
	const std::optional<MatchResult> m = regex.execute(input);
	ASSERT_TRUE(m);
	EXPECT_EQ(Group(*m, input, 0), u"ab");
	EXPECT_EQ(Group(*m, input, 1), u"<unset>");
	EXPECT_EQ(Group(*m, input, 2), u"b");
}

TEST(Execute, EmptyIterationIsRejected) {
	const std::u16string input = u"b";
	const Regex regex(u"(a*)*b", Default);
	const std::optional<MatchResult> m = regex.execute(input);
	ASSERT_TRUE(m);
	EXPECT_EQ(Group(*m, input, 0), u"b");
	EXPECT_EQ(Group(*m, input, 1), u"<unset>");
}

TEST(Execute, BackReference) {
	const std::u16string input = u"aaabaa";
	const Regex regex(u"(a+)b\\1", Default);
	const std::optional<MatchResult> m = regex.execute(input);
	ASSERT_TRUE(m);
	EXPECT_EQ(m->begin(), 1u);
	EXPECT_EQ(m->end(), 6u);
	EXPECT_EQ(Group(*m, input, 1), u"aa");

	EXPECT_EQ(Find(u"(a)\\1", u"aA", IgnoreCase), u"aA");
	EXPECT_EQ(Find(u"(a)\\1", u"aA"), u"<none>");
}

TEST(Execute, BackReferenceToUnsetGroupFails) {
	EXPECT_EQ(Find(u"(?:(a)|b)\\1", u"bx"), u"<none>");
	EXPECT_EQ(Find(u"(?:(a)|b)\\1", u"aa"), u"aa");
}

TEST(Execute, NamedGroups) {
	const Regex regex(u"(?<x>ab)\\k<x>", Default);
	ASSERT_TRUE(regex.groupNumber(u"x"));
	EXPECT_EQ(*regex.groupNumber(u"x"), 1u);
	EXPECT_FALSE(regex.groupNumber(u"y"));

	const std::optional<MatchResult> m = regex.execute(u"xabab");
	ASSERT_TRUE(m);
	EXPECT_EQ(m->begin(), 1u);
	EXPECT_EQ(m->end(), 5u);
}

TEST(Execute, LookAhead) {
	EXPECT_EQ(Find(u"a(?=b)", u"acab"), u"a");
	EXPECT_EQ(Find(u"\\w+(?=!)", u"hey you!"), u"you");

	const Regex negative(u"a(?!b)", Default);
	const std::optional<MatchResult> m = negative.execute(u"abac");
	ASSERT_TRUE(m);
	EXPECT_EQ(m->begin(), 2u);
}

TEST(Execute, LookAheadKeepsCaptures) {
	const std::u16string input = u"aaa";
	const Regex regex(u"(?=(a+))a", Default);
	const std::optional<MatchResult> m = regex.execute(input);
	ASSERT_TRUE(m);
	EXPECT_EQ(Group(*m, input, 0), u"a");
	EXPECT_EQ(Group(*m, input, 1), u"aaa");
}

TEST(Execute, NegativeLookAheadDropsCaptures) {
	const std::u16string input = u"ac";
	const Regex regex(u"(?!(a)b)a", Default);
	const std::optional<MatchResult> m = regex.execute(input);
	ASSERT_TRUE(m);
	EXPECT_EQ(Group(*m, input, 0), u"a");
	EXPECT_EQ(Group(*m, input, 1), u"<unset>");
}

TEST(Execute, LookBehind) {
	EXPECT_EQ(Find(u"(?<=\\$)\\d+", u"cost 7 or $42"), u"42");
	EXPECT_EQ(Find(u"(?<=ab|c)d", u"abd"), u"d");
	EXPECT_EQ(Find(u"(?<=ab|c)d", u"bd cd"), u"d");
	EXPECT_EQ(Find(u"(?<=^a)b", u"ab"), u"b");

	const Regex negative(u"(?<!a)b", Default);
	const std::optional<MatchResult> m = negative.execute(u"abcb");
	ASSERT_TRUE(m);
	EXPECT_EQ(m->begin(), 3u);

	const Regex atStart(u"(?<!a)b", Default);
	EXPECT_EQ(atStart.execute(u"b")->begin(), 0u);
}

TEST(Execute, LookBehindMatchesLongestFirst) {
	const std::u16string input = u"123x";
	const Regex regex(u"(?<=(\\d{1,3}))x", Default);
	const std::optional<MatchResult> m = regex.execute(input);
	ASSERT_TRUE(m);
	EXPECT_EQ(m->begin(), 3u);
	EXPECT_EQ(Group(*m, input, 1), u"123");

	// fewer code units than the longest length are available at the start
	const std::u16string shortInput = u"9x";
	const std::optional<MatchResult> n = regex.execute(shortInput);
	ASSERT_TRUE(n);
	EXPECT_EQ(Group(*n, shortInput, 1), u"9");

	const std::u16string alternatives = u"abcd";
	const Regex choice(u"(?<=(c|bc|abc))d", Default);
	const std::optional<MatchResult> c = choice.execute(alternatives);
	ASSERT_TRUE(c);
	EXPECT_EQ(Group(*c, alternatives, 1), u"abc");
}

TEST(Execute, BraceThatIsNotAQuantifierMatchesLiterally) {
	EXPECT_EQ(Find(u"a{2", u"xa{2"), u"a{2");
	EXPECT_EQ(Find(u"a{2", u"aa"), u"<none>");
	EXPECT_EQ(Find(u"a{,5}", u"a{,5}"), u"a{,5}");
	EXPECT_EQ(Find(u"(x){y}", u"x{y}"), u"x{y}");
	EXPECT_EQ(Find(u".{foo", u"z{foo"), u"z{foo");
	EXPECT_EQ(Find(u"[ab]{c", u"b{c"), u"b{c");
	EXPECT_EQ(Find(u"a{2}", u"a{2}aa"), u"aa");
}

TEST(Execute, BufferAnchors) {
	EXPECT_EQ(Find(u"^abc", u"xabc"), u"<none>");
	EXPECT_EQ(Find(u"^abc", u"abcabc"), u"abc");
	EXPECT_EQ(Find(u"^abc", u"abcabc", Default, 1), u"<none>");
	EXPECT_EQ(Find(u"abc$", u"abcx"), u"<none>");
	EXPECT_EQ(Find(u"abc$", u"xabc"), u"abc");
	EXPECT_EQ(Find(u"^abc$", u"abc"), u"abc");
	EXPECT_EQ(Find(u"^abc$", u"abcd"), u"<none>");
	EXPECT_EQ(Find(u"a|b$", u"xb"), u"b");
	EXPECT_EQ(Find(u"\\Aab\\z", u"ab"), u"ab");
}

TEST(Execute, SemiEndAnchor) {
	EXPECT_EQ(Find(u"a$", u"a\n", RE_OPTION_NONE), u"a");
	EXPECT_EQ(Find(u"a$", u"a\n", Default), u"<none>");
	EXPECT_EQ(Find(u"a\\Z", u"ba\n"), u"a");
}

TEST(Execute, LineAnchors) {
	EXPECT_EQ(Find(u"^b", u"a\nb", Multiline), u"b");
	EXPECT_EQ(Find(u"a$", u"a\nb", Multiline), u"a");
	EXPECT_EQ(Find(u"^b", u"a\nb", Default), u"<none>");
	EXPECT_EQ(Find(u"^\\d+$", u"x1\n23\n4y", Multiline), u"23");
}

TEST(Execute, DotStopsAtLineTerminators) {
	EXPECT_EQ(Find(u"a.c", u"a\nc"), u"<none>");
	EXPECT_EQ(Find(u"a.c", u"a\u2028c"), u"<none>");
	EXPECT_EQ(Find(u"a.c", u"abc"), u"abc");
}

TEST(Execute, WordBoundary) {
	const Regex regex(u"\\bcat\\b", Default);
	const std::optional<MatchResult> m = regex.execute(u"concat cat");
	ASSERT_TRUE(m);
	EXPECT_EQ(m->begin(), 7u);

	EXPECT_EQ(Find(u"\\Bcat", u"cat concat"), u"cat");
	EXPECT_EQ(Find(u"\\Bcat", u"cat"), u"<none>");
}

TEST(Execute, IgnoreCase) {
	EXPECT_EQ(Find(u"hello", u"say HeLLo", IgnoreCase), u"HeLLo");
	EXPECT_EQ(Find(u"[a-c]+", u"xABCa", IgnoreCase), u"ABCa");
	EXPECT_EQ(Find(u"é", u"É", IgnoreCase), u"É");
	EXPECT_EQ(Find(u"x", u"X"), u"<none>");
}

TEST(Execute, ShorthandClasses) {
	EXPECT_EQ(Find(u"\\d+", u"abc123def"), u"123");
	EXPECT_EQ(Find(u"\\s\\S", u"a b"), u" b");
	EXPECT_EQ(Find(u"\\W", u"a_b-c"), u"-");
	EXPECT_EQ(Find(u"[\\D]+", u"12ab3"), u"ab");
}

TEST(Execute, LongInputDoesNotRecurse) {
	std::u16string input;
	for (int i = 0; i < 50000; ++i) {
		input += u"ab";
	}
	input += u"c";

	const Regex regex(u"(?:ab)*c", Default);
	const std::optional<MatchResult> m = regex.execute(input);
	ASSERT_TRUE(m);
	EXPECT_EQ(m->begin(), 0u);
	EXPECT_EQ(m->end(), input.size());

	EXPECT_EQ(Find(u"a*", std::u16string(200000, u'a')).size(), 200000u);
}

TEST(Execute, ConcurrentMatching) {
	const Regex regex(u"(\\d+)-(\\d+)", Default);
	const std::u16string input = u"range 10-20 and 30-40";

	std::vector<std::thread> threads;
	std::vector<size_t> begins(8, MatchResult::npos);

	for (size_t i = 0; i < begins.size(); ++i) {
		threads.emplace_back([&regex, &input, &begins, i]() {
			for (int n = 0; n < 200; ++n) {
				const std::optional<MatchResult> m = regex.execute(input, i % 2 ? 12 : 0);
				if (m) {
					begins[i] = m->begin();
				}
			}
		});
	}

	for (std::thread &t : threads) {
		t.join();
	}

	for (size_t i = 0; i < begins.size(); ++i) {
		EXPECT_EQ(begins[i], i % 2 ? 16u : 6u);
	}
}
