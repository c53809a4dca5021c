#pragma once

#include <filesystem>
#include <ostream>
#include <string>
#include <vector>
#include "types.hpp"
#include "PathRepairEngine.hpp"
#include "ContentRepairEngine.hpp"

namespace encfix
{

/**
 * Walks a tree top-down: the names of a directory's entries are repaired first, then the content
 * of its text files, then the walk goes down into its (possibly renamed) subdirectories.
 * Symbolic links are never followed.
 */
class TreeScanner
{
	PathRepairEngine& names;
	ContentRepairEngine *contents;
	std::vector<std::string> text_extensions;
	bool repair_folders;

	ScanStats stats;

	void scan_directory(const std::filesystem::path& dir);
	bool is_text_file(const std::filesystem::path& path) const;

public:
	/**
	 * @param contents nullptr to leave file contents alone
	 * @param repair_folders false to leave directory names alone
	 */
	TreeScanner(PathRepairEngine& names, ContentRepairEngine *contents, std::vector<std::string> text_extensions,
				bool repair_folders = true);

	/** Scans root's content, root itself is never renamed */
	ScanStats scan(const std::filesystem::path& root);
};

/** Prints what a scan changed: counters, then every rename and every content conversion */
void print_summary(std::ostream& out, const ScanStats& stats, const std::vector<RepairRecord>& renames,
				   const std::vector<ContentRecord>& conversions);

}
