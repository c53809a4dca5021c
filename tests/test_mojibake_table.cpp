#include <stdexcept>
#include "gtest/gtest.h"
#include "charset/MojibakeTable.hpp"

using namespace encfix::charset;
using patterns_t = std::vector<MojibakeTable::pattern_t>;

TEST(MojibakeTable, default_table)
{
	const MojibakeTable table(MojibakeTable::default_patterns());

	ASSERT_EQ(table.apply("cafÃ©.txt"), "café.txt");
	ASSERT_EQ(table.apply("Ã¼ber Ã¤rger Ã¶l"), "über ärger öl");
	ASSERT_EQ(table.apply("voilÃ .txt"), "voilà.txt");
	ASSERT_EQ(table.apply("æ–‡ä»¶.doc"), "文件.doc");
	ASSERT_EQ(table.apply("Ã©Ã©Ã©"), "ééé");
}

TEST(MojibakeTable, untouched)
{
	const MojibakeTable table(MojibakeTable::default_patterns());

	for(const std::string name : {"", "plain.txt", "café.txt", "冲锋线.txt", "Ã"})
	{
		ASSERT_FALSE(table.matches(name)) << name;
		ASSERT_EQ(table.apply(name), name);
	}
}

TEST(MojibakeTable, idempotence)
{
	const MojibakeTable table(MojibakeTable::default_patterns());

	for(const std::string name : {"cafÃ©.txt", "Ã  la carte Ã±", "æ–‡ä»¶Ã¨"})
	{
		const auto once = table.apply(name);
		ASSERT_EQ(table.apply(once), once);
	}
}

TEST(MojibakeTable, declared_order)
{
	// "ab" comes first, so "abc" never gets the chance to match
	const MojibakeTable ab_first(patterns_t{{"ab", "X"}, {"abc", "Y"}});
	ASSERT_EQ(ab_first.apply("abcabc"), "XcXc");

	const MojibakeTable abc_first(patterns_t{{"abc", "Y"}, {"ab", "X"}});
	ASSERT_EQ(abc_first.apply("abcabc"), "YY");

	// A replacement may feed a later pattern
	const MojibakeTable chained(patterns_t{{"a", "b"}, {"bb", "c"}});
	ASSERT_EQ(chained.apply("ab"), "c");
}

TEST(MojibakeTable, empty_table)
{
	const MojibakeTable table(patterns_t{});
	ASSERT_FALSE(table.matches("cafÃ©"));
	ASSERT_EQ(table.apply("cafÃ©"), "cafÃ©");
}

TEST(MojibakeTable, empty_pattern)
{
	ASSERT_THROW((MojibakeTable(patterns_t{{"", "x"}})), std::invalid_argument);
}
