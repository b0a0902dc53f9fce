#include "gtest/gtest.h"
#include "Regex/CharSet.h"

TEST(CharSet, RangesAreMerged) {
	CharSet set;
	set.addRange(u'a', u'c');
	set.addRange(u'd', u'f');
	set.add(u'b');
	set.addRange(u'x', u'z');

	ASSERT_EQ(set.ranges().size(), 2u);
	EXPECT_EQ(set.ranges()[0].first, u'a');
	EXPECT_EQ(set.ranges()[0].last, u'f');
	EXPECT_EQ(set.ranges()[1].first, u'x');
	EXPECT_EQ(set.count(), 9u);
}

TEST(CharSet, ReversedRangeIsSwapped) {
	CharSet set;
	set.addRange(u'9', u'0');
	EXPECT_TRUE(set.contains(u'5'));
	EXPECT_EQ(set.count(), 10u);
}

TEST(CharSet, Contains) {
	CharSet set = CharSet::wordChars();
	EXPECT_TRUE(set.contains(u'a'));
	EXPECT_TRUE(set.contains(u'Z'));
	EXPECT_TRUE(set.contains(u'_'));
	EXPECT_TRUE(set.contains(u'7'));
	EXPECT_FALSE(set.contains(u'-'));
	EXPECT_FALSE(set.contains(u' '));
	EXPECT_FALSE(set.contains(u'é'));
}

TEST(CharSet, NegationIsAppliedByMatches) {
	CharSet set = CharSet::digits();
	set.setNegated(true);

	EXPECT_TRUE(set.contains(u'4'));
	EXPECT_FALSE(set.matches(u'4', false, CaseFold::Simple));
	EXPECT_TRUE(set.matches(u'x', false, CaseFold::Simple));
}

TEST(CharSet, Complement) {
	CharSet set;
	set.addComplement(CharSet::digits());

	EXPECT_FALSE(set.contains(u'0'));
	EXPECT_FALSE(set.contains(u'9'));
	EXPECT_TRUE(set.contains(u'/'));
	EXPECT_TRUE(set.contains(u':'));
	EXPECT_TRUE(set.contains(u'\0'));
	EXPECT_TRUE(set.contains(u'\uffff'));
	EXPECT_EQ(set.count(), 0x10000u - 10u);
}

TEST(CharSet, CloseOverCase) {
	CharSet set;
	set.addRange(u'a', u'c');
	set.closeOverCase(CaseFold::Simple);

	EXPECT_TRUE(set.contains(u'B'));
	EXPECT_TRUE(set.contains(u'b'));
	EXPECT_FALSE(set.contains(u'D'));
	EXPECT_EQ(set.count(), 6u);
}

TEST(CharSet, MatchesIgnoreCase) {
	CharSet set;
	set.add(u'K');

	EXPECT_FALSE(set.matches(u'k', false, CaseFold::Simple));
	EXPECT_TRUE(set.matches(u'k', true, CaseFold::Simple));
}

TEST(CharSet, Spaces) {
	CharSet set = CharSet::spaces();
	EXPECT_TRUE(set.contains(u' '));
	EXPECT_TRUE(set.contains(u'\t'));
	EXPECT_TRUE(set.contains(u'\u00a0'));
	EXPECT_TRUE(set.contains(u'\ufeff'));
	EXPECT_FALSE(set.contains(u'x'));
}

TEST(CharSet, LineTerminators) {
	CharSet set = CharSet::lineTerminators();
	EXPECT_TRUE(set.contains(u'\n'));
	EXPECT_TRUE(set.contains(u'\r'));
	EXPECT_TRUE(set.contains(u'\u2028'));
	EXPECT_TRUE(set.contains(u'\u2029'));
	EXPECT_FALSE(set.contains(u'\t'));
	EXPECT_EQ(set.count(), 4u);
}
