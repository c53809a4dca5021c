#include <algorithm>
#include <cctype>
#include <iostream>
#include "TreeScanner.hpp"

namespace encfix
{

TreeScanner::TreeScanner(PathRepairEngine& names, ContentRepairEngine *contents,
						 std::vector<std::string> text_extensions, bool repair_folders):
	names(names), contents(contents), text_extensions(std::move(text_extensions)), repair_folders(repair_folders)
{
	// Extensions are matched lower case
	for(auto& ext : this->text_extensions)
		std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return std::tolower(c); });
}

bool TreeScanner::is_text_file(const std::filesystem::path& path) const
{
	// @FIXME This stuff works only for ASCII extensions
	std::string ext = path.extension().native();
	std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return std::tolower(c); });

	return std::find(text_extensions.begin(), text_extensions.end(), ext) != text_extensions.end();
}

ScanStats TreeScanner::scan(const std::filesystem::path& root)
{
	stats = {};

	std::cout << "Scanning directory: " << root.native() << '\n'
		<< std::string(50, '-') << std::endl;

	scan_directory(root);
	return stats;
}

void TreeScanner::scan_directory(const std::filesystem::path& dir)
{
	std::vector<std::filesystem::path> subdirs;
	std::vector<std::filesystem::path> files;

	// Take a snapshot first, renaming invalidates the iterator
	try
	{
		for(const auto& entry : std::filesystem::directory_iterator(dir))
		{
			if(entry.is_directory() and not entry.is_symlink())
				subdirs.push_back(entry.path());
			else
				files.push_back(entry.path());
		}
	}
	catch(const std::filesystem::filesystem_error& e)
	{
		std::clog << "ERROR: unable to list " << dir << ": " << e.what() << '\n';
		stats.skipped += 1;
		return;
	}

	for(auto& subdir : subdirs)
	{
		if(not repair_folders)
			continue;

		stats.items_processed += 1;
		auto repaired = names.repair(subdir);
		if(repaired != subdir)
		{
			stats.names_fixed += 1;
			subdir = repaired;
		}
	}

	for(const auto& file : files)
	{
		stats.items_processed += 1;
		auto repaired = names.repair(file);
		if(repaired != file)
			stats.names_fixed += 1;

		std::error_code ec;
		if(contents != nullptr and is_text_file(repaired) and not std::filesystem::is_symlink(repaired, ec)
			and contents->repair(repaired))
			stats.contents_fixed += 1;
	}

	// Go down using the new names
	for(const auto& subdir : subdirs)
		scan_directory(subdir);
}

void print_summary(std::ostream& out, const ScanStats& stats, const std::vector<RepairRecord>& renames,
				   const std::vector<ContentRecord>& conversions)
{
	out << '\n' << std::string(50, '=') << '\n'
		<< "Scan completed!\n"
		<< "Items processed: " << stats.items_processed << '\n'
		<< "Names fixed: " << stats.names_fixed << '\n'
		<< "Contents fixed: " << stats.contents_fixed << '\n';

	if(stats.skipped > 0)
		out << "Directories skipped: " << stats.skipped << '\n';

	if(not renames.empty())
	{
		out << "\nFixed " << renames.size() << " name(s):\n";
		for(const auto& [original, renamed] : renames)
			out << "  " << original << " -> " << renamed << '\n';
	}

	if(not conversions.empty())
	{
		out << "\nFixed " << conversions.size() << " content encoding(s):\n";
		for(const auto& [path, from, to] : conversions)
			out << "  " << path << ": " << from << " -> " << to << '\n';
	}

	if(renames.empty() and conversions.empty())
		out << "No encoding issues found!\n";

	out.flush();
}

}
