#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <ostream>
#include <string>

namespace encfix::audit
{

/** Hex MD5 digest of a file's content, "" if it can't be read */
std::string file_md5(const std::filesystem::path& path);

/** Size in bytes of a file, 0 if it can't be read */
uintmax_t file_size(const std::filesystem::path& path);

struct FileComparison
{
	std::string file_name;
	std::filesystem::path old_path;
	std::optional<std::filesystem::path> new_path; // nullopt if missing in the new tree
	uintmax_t old_size = 0;
	uintmax_t new_size = 0;
	std::string old_hash;
	std::string new_hash;
	bool size_match = false;
	bool hash_match = false;
	bool identical = false;

	bool exists_in_new() const { return new_path.has_value(); }
};

struct SizeComparison
{
	std::filesystem::path old_file;
	std::filesystem::path new_file;
	uintmax_t old_size = 0;
	uintmax_t new_size = 0;
	bool size_match = false;
	uintmax_t size_difference = 0;
};

/**
 * Audits two copies of the same tree (say before and after a repair run): text files are
 * compared by size and MD5, the files matching a name pattern by size only.
 * Only the top level of each directory is looked at.
 */
class DirComparator
{
	std::filesystem::path old_dir;
	std::filesystem::path new_dir;

	std::map<std::string, FileComparison> text_results;
	std::optional<SizeComparison> size_result;
	std::string size_pattern;

public:
	/** @param size_pattern shell pattern (fnmatch) of the files compared by size */
	DirComparator(std::filesystem::path old_dir, std::filesystem::path new_dir,
				  std::string size_pattern = "*鬼穴*.pdf");

	/** Compares every *.txt in old_dir with its namesake in new_dir */
	const std::map<std::string, FileComparison>& compare_text_files();

	/** Compares the first match of the pattern in each directory, nullopt if either has none */
	const std::optional<SizeComparison>& compare_pattern_files();

	/** A textual summary of what was compared so far */
	std::string summary_report() const;

	/** Runs both comparisons, printing progress to out, and returns the summary */
	std::string run(std::ostream& out);
};

}
