#include "gtest/gtest.h"
#include "fs_fixture.hpp"
#include "repair/ContentRepairEngine.hpp"
#include "charset/transcode.hpp"

using namespace encfix;
namespace fs = std::filesystem;

static const std::string french_text =
		"Le café de la gare est très agréable: on y déguste des crêpes à la crème, des gâteaux et un thé glacé. "
		"Où êtes-vous allé cet été? Nous sommes allés à la plage près de la forêt, où les élèves étudiaient la "
		"géographie. Le garçon a déjà mangé son goûter, et sa soeur préfère lire un livre à côté de la fenêtre.\n";

static const std::string chinese_text =
		"在很久很久以前，有一个美丽的村庄，村庄里住着一位勤劳的老人。他每天早上都会去山上砍柴，然后把柴火背到集市上去卖。"
		"村里的孩子们都很喜欢听他讲故事，因为他的故事总是充满了智慧和乐趣。\n";

struct ContentRepairTest: public FsTest
{
	ContentRepairEngine engine;
};

TEST_F(ContentRepairTest, latin1_to_utf8)
{
	write_file(dir/"story.txt", charset::from_utf8(french_text, "ISO-8859-1"));

	ASSERT_TRUE(engine.repair(dir/"story.txt"));
	ASSERT_EQ(read_file(dir/"story.txt"), french_text);

	ASSERT_EQ(engine.get_records().size(), 1u);
	ASSERT_EQ(engine.get_records()[0].path, (dir/"story.txt").native());
	ASSERT_FALSE(charset::same_charset(engine.get_records()[0].detected_encoding, "UTF-8"));
	ASSERT_EQ(engine.get_records()[0].target_encoding, "UTF-8");
}

TEST_F(ContentRepairTest, short_latin1)
{
	write_file(dir/"café.txt", "caf\xe9\n");
	write_file(dir/"menu.txt", "cr\xe8me br\xfbl\xe9e");

	ASSERT_TRUE(engine.repair(dir/"café.txt"));
	ASSERT_EQ(read_file(dir/"café.txt"), "café\n");

	ASSERT_TRUE(engine.repair(dir/"menu.txt"));
	ASSERT_EQ(read_file(dir/"menu.txt"), "crème brûlée");

	ASSERT_EQ(engine.get_records().size(), 2u);
	for(const auto& record : engine.get_records())
	{
		ASSERT_NE(record.detected_encoding.rfind("UTF-16", 0), 0u) << record.detected_encoding;
		ASSERT_NE(record.detected_encoding.rfind("UTF-32", 0), 0u) << record.detected_encoding;
	}

	// Already fixed
	ASSERT_FALSE(engine.repair(dir/"café.txt"));
}

TEST_F(ContentRepairTest, gb18030_to_utf8)
{
	write_file(dir/"story.txt", charset::from_utf8(chinese_text, "GB18030"));

	ASSERT_TRUE(engine.repair(dir/"story.txt"));
	ASSERT_EQ(read_file(dir/"story.txt"), chinese_text);
}

TEST_F(ContentRepairTest, already_utf8)
{
	write_file(dir/"french.txt", french_text);
	write_file(dir/"chinese.txt", chinese_text);
	write_file(dir/"ascii.txt", "nothing special here\n");

	for(const auto *name : {"french.txt", "chinese.txt", "ascii.txt"})
	{
		const auto before = read_file(dir/name);
		ASSERT_FALSE(engine.repair(dir/name)) << name;
		ASSERT_EQ(read_file(dir/name), before) << name;
	}

	ASSERT_TRUE(engine.get_records().empty());
}

TEST_F(ContentRepairTest, binary)
{
	std::string bytes = charset::from_utf8(french_text, "ISO-8859-1");
	bytes[100] = '\0';
	write_file(dir/"blob.txt", bytes);

	ASSERT_FALSE(engine.repair(dir/"blob.txt"));
	ASSERT_EQ(read_file(dir/"blob.txt"), bytes);
}

TEST_F(ContentRepairTest, looks_binary)
{
	std::string bytes(2048, 'a');
	ASSERT_FALSE(looks_binary(reinterpret_cast<const uint8_t *>(bytes.data()), bytes.size()));

	bytes[1500] = '\0';
	ASSERT_FALSE(looks_binary(reinterpret_cast<const uint8_t *>(bytes.data()), bytes.size()));

	bytes[1023] = '\0';
	ASSERT_TRUE(looks_binary(reinterpret_cast<const uint8_t *>(bytes.data()), bytes.size()));

	ASSERT_FALSE(looks_binary(nullptr, 0));
}

TEST_F(ContentRepairTest, nothing_to_read)
{
	write_file(dir/"empty.txt", "");
	fs::create_directory(dir/"folder.txt");

	ASSERT_FALSE(engine.repair(dir/"empty.txt"));
	ASSERT_FALSE(engine.repair(dir/"folder.txt"));
	ASSERT_FALSE(engine.repair(dir/"missing.txt"));
	ASSERT_TRUE(fs::is_regular_file(dir/"empty.txt"));
	ASSERT_TRUE(engine.get_records().empty());
}

TEST_F(ContentRepairTest, other_target)
{
	RepairConfig config = RepairConfig::defaults();
	config.target_encoding = "GB18030";
	ContentRepairEngine gb_engine(config);

	write_file(dir/"story.txt", chinese_text);

	ASSERT_TRUE(gb_engine.repair(dir/"story.txt"));
	ASSERT_EQ(read_file(dir/"story.txt"), charset::from_utf8(chinese_text, "GB18030"));
}
