#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace encfix
{

/*
	RepairConfig holds the constant data the engines work with:
	- 'mojibake_patterns': ordered (corrupted, correct) substrings, see charset::MojibakeTable
	- 'candidate_encodings': legacy charsets tried, in order, when recovering a garbled name
	- 'target_encoding': the charset text files are converted to
	- 'text_extensions': lower case extensions (dot included) of the files whose content is repaired
*/
struct RepairConfig
{
	std::vector<std::pair<std::string, std::string>> mojibake_patterns;
	std::vector<std::string> candidate_encodings;
	std::string target_encoding = "UTF-8";
	std::vector<std::string> text_extensions = {".txt"};

	/** Every strategy enabled, with the default table and candidates */
	static RepairConfig defaults();

	/** Only "#Uxxxx" placeholders are decoded: no table, no candidates */
	static RepairConfig escapes_only();
};

// A name changed on disk. Both are full paths
struct RepairRecord
{
	std::string original;
	std::string renamed;
};

// A file's content converted from 'detected_encoding' to 'target_encoding'
struct ContentRecord
{
	std::string path;
	std::string detected_encoding;
	std::string target_encoding;
};

/*
	Result of a single rename attempt:
	- NO_CHANGE: the candidate is the name itself (or empty), nothing to do
	- RENAMED: the entry now lives at 'path'
	- REJECTED: the candidate collides, isn't a valid name or the rename failed
*/
struct RenameOutcome
{
	enum status_t {NO_CHANGE, RENAMED, REJECTED};

	status_t status;
	std::filesystem::path path;
};

struct ScanStats
{
	size_t items_processed = 0;
	size_t names_fixed = 0;
	size_t contents_fixed = 0;
	size_t skipped = 0;
};

/** A name needs no repair when it's plain 7-bit ASCII */
bool is_clean(const std::string& name);

}
