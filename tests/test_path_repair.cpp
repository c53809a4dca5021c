#include "gtest/gtest.h"
#include "fs_fixture.hpp"
#include "repair/PathRepairEngine.hpp"
#include "charset/transcode.hpp"

using namespace encfix;
namespace fs = std::filesystem;

struct PathRepairTest: public FsTest
{};

TEST_F(PathRepairTest, clean_name)
{
	PathRepairEngine engine;
	write_file(dir/"report_2024.txt", "data");

	ASSERT_EQ(engine.repair(dir/"report_2024.txt"), dir/"report_2024.txt");
	ASSERT_TRUE(fs::exists(dir/"report_2024.txt"));
	ASSERT_TRUE(engine.get_records().empty());
}

TEST_F(PathRepairTest, escapes)
{
	PathRepairEngine engine;
	write_file(dir/"#U51b2#U950b#U7ebf.txt", "data");

	const auto repaired = engine.repair(dir/"#U51b2#U950b#U7ebf.txt");

	ASSERT_EQ(repaired, dir/"冲锋线.txt");
	ASSERT_TRUE(fs::exists(dir/"冲锋线.txt"));
	ASSERT_FALSE(fs::exists(dir/"#U51b2#U950b#U7ebf.txt"));
	ASSERT_EQ(read_file(repaired), "data");

	ASSERT_EQ(engine.get_records().size(), 1u);
	ASSERT_EQ(engine.get_records()[0].original, (dir/"#U51b2#U950b#U7ebf.txt").native());
	ASSERT_EQ(engine.get_records()[0].renamed, (dir/"冲锋线.txt").native());
}

TEST_F(PathRepairTest, directory)
{
	PathRepairEngine engine;
	fs::create_directory(dir/"#U6d4b#U8bd5#U6587#U4ef6#U5939");

	ASSERT_EQ(engine.repair(dir/"#U6d4b#U8bd5#U6587#U4ef6#U5939"), dir/"测试文件夹");
	ASSERT_TRUE(fs::is_directory(dir/"测试文件夹"));
}

TEST_F(PathRepairTest, mojibake)
{
	PathRepairEngine engine;
	write_file(dir/"cafÃ©.txt", "data");

	ASSERT_EQ(engine.repair(dir/"cafÃ©.txt"), dir/"café.txt");
	ASSERT_TRUE(fs::exists(dir/"café.txt"));
	ASSERT_EQ(engine.get_records().size(), 1u);
}

TEST_F(PathRepairTest, recoding)
{
	// "测试" written in GBK and read back as latin1
	PathRepairEngine engine;
	const std::string garbled = "²âÊÔ.txt";
	write_file(dir/garbled, "data");

	ASSERT_EQ(engine.repair(dir/garbled), dir/"测试.txt");
	ASSERT_FALSE(fs::exists(dir/garbled));
}

TEST_F(PathRepairTest, never_overwrites)
{
	PathRepairEngine engine(RepairConfig::escapes_only());
	write_file(dir/"#U6d4b#U8bd5.txt", "garbled");
	write_file(dir/"测试.txt", "already there");

	ASSERT_EQ(engine.repair(dir/"#U6d4b#U8bd5.txt"), dir/"#U6d4b#U8bd5.txt");
	ASSERT_EQ(read_file(dir/"#U6d4b#U8bd5.txt"), "garbled");
	ASSERT_EQ(read_file(dir/"测试.txt"), "already there");
	ASSERT_TRUE(engine.get_records().empty());
}

TEST_F(PathRepairTest, collision_falls_through)
{
	// The table's answer is taken, the next strategy gets its chance
	RepairConfig config = RepairConfig::defaults();
	config.candidate_encodings = {"ISO-8859-1", "GBK"};
	PathRepairEngine engine(config);

	write_file(dir/"cafÃ©.txt", "garbled");
	write_file(dir/"café.txt", "already there");

	const std::string expected = charset::to_utf8("caf\xc3\xa9.txt", "GBK", charset::on_invalid::SKIP);
	ASSERT_NE(expected, "cafÃ©.txt");

	ASSERT_EQ(engine.repair(dir/"cafÃ©.txt"), dir/expected);
	ASSERT_EQ(read_file(dir/expected), "garbled");
	ASSERT_EQ(read_file(dir/"café.txt"), "already there");
}

TEST_F(PathRepairTest, escape_collision_falls_through)
{
	PathRepairEngine engine;

	write_file(dir/"#U0041cafÃ©.txt", "garbled");
	write_file(dir/"AcafÃ©.txt", "already there");

	// Decoding the placeholder collides, the table is applied to the original name
	ASSERT_EQ(engine.repair(dir/"#U0041cafÃ©.txt"), dir/"#U0041café.txt");
	ASSERT_EQ(read_file(dir/"#U0041café.txt"), "garbled");
	ASSERT_EQ(read_file(dir/"AcafÃ©.txt"), "already there");

	ASSERT_EQ(engine.get_records().size(), 1u);
	ASSERT_EQ(engine.get_records()[0].renamed, (dir/"#U0041café.txt").native());
}

TEST_F(PathRepairTest, nothing_works)
{
	PathRepairEngine engine;
	write_file(dir/"冲锋线.txt", "data");

	// Proper unicode has no latin1 view, there's nothing to recode
	ASSERT_EQ(engine.repair(dir/"冲锋线.txt"), dir/"冲锋线.txt");
	ASSERT_TRUE(engine.get_records().empty());
}

TEST_F(PathRepairTest, stays_in_parent)
{
	PathRepairEngine engine;
	write_file(dir/"a#U002fb", "data");

	ASSERT_EQ(engine.repair(dir/"a#U002fb"), dir/"a#U002fb");
	ASSERT_TRUE(fs::exists(dir/"a#U002fb"));
	ASSERT_FALSE(fs::exists(dir/"a"));
}

TEST_F(PathRepairTest, try_rename)
{
	PathRepairEngine engine;
	write_file(dir/"one", "1");
	write_file(dir/"two", "2");

	ASSERT_EQ(engine.try_rename(dir/"one", "one").status, RenameOutcome::NO_CHANGE);
	ASSERT_EQ(engine.try_rename(dir/"one", "").status, RenameOutcome::NO_CHANGE);
	ASSERT_EQ(engine.try_rename(dir/"one", "two").status, RenameOutcome::REJECTED);
	ASSERT_EQ(engine.try_rename(dir/"one", "..").status, RenameOutcome::REJECTED);

	const auto outcome = engine.try_rename(dir/"one", "three");
	ASSERT_EQ(outcome.status, RenameOutcome::RENAMED);
	ASSERT_EQ(outcome.path, dir/"three");
	ASSERT_EQ(read_file(dir/"three"), "1");
	ASSERT_EQ(read_file(dir/"two"), "2");
}

TEST_F(PathRepairTest, dangling_link_is_taken)
{
	PathRepairEngine engine(RepairConfig::escapes_only());
	write_file(dir/"#U0041", "data");
	fs::create_symlink(dir/"nowhere", dir/"A");

	ASSERT_EQ(engine.repair(dir/"#U0041"), dir/"#U0041");
	ASSERT_TRUE(fs::is_symlink(dir/"A"));
}

TEST_F(PathRepairTest, vanished_entry)
{
	PathRepairEngine engine;

	ASSERT_EQ(engine.repair(dir/"#U6d4b.txt"), dir/"#U6d4b.txt");
	ASSERT_TRUE(engine.get_records().empty());
}
