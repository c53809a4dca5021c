#pragma once
#include <string>
#include <vector>
#include <filesystem>

struct fixer_options
{
	std::filesystem::path root = ".";
	bool root_given = false;
	bool repair_folders = true;
	bool repair_content = true;
	std::vector<std::string> text_extensions = {".txt"};
	bool help = false;
	bool bad_usage = false;

	fixer_options(int argc, char **argv);
};

// escfix only touches names, it has no content options
struct escape_options
{
	std::filesystem::path root = ".";
	bool repair_folders = true;
	bool help = false;
	bool bad_usage = false;

	escape_options(int argc, char **argv);
};

struct compare_options
{
	std::filesystem::path old_dir;
	std::filesystem::path new_dir;
	std::string size_pattern = "*鬼穴*.pdf";
	bool help = false;
	bool bad_usage = false;

	compare_options(int argc, char **argv);
};

/**
 * Checks that path exists and is a directory, complaining on stderr otherwise
 * @return false if the program can't go on
 */
bool check_directory(const std::filesystem::path& path);
