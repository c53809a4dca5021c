#include <iostream>
#include <system_error>
#include "PathRepairEngine.hpp"
#include "charset/EscapeDecoder.hpp"
#include "charset/transcode.hpp"
#include "charset/utf8_utils.hpp"

namespace encfix
{

PathRepairEngine::PathRepairEngine(RepairConfig config_):
	config(std::move(config_)), table(config.mojibake_patterns)
{
	strategies = {
			[this](const std::string& name) { return escape_candidates(name); },
			[this](const std::string& name) { return mojibake_candidates(name); },
			[this](const std::string& name) { return recoding_candidates(name); },
	};
}

std::vector<std::string> PathRepairEngine::escape_candidates(const std::string& name) const
{
	if(not charset::contains_escape(name))
		return {};

	return {charset::decode_escapes(name)};
}

std::vector<std::string> PathRepairEngine::mojibake_candidates(const std::string& name) const
{
	auto fixed = table.apply(name);
	if(fixed == name)
		return {};

	return {fixed};
}

std::vector<std::string> PathRepairEngine::recoding_candidates(const std::string& name) const
{
	// The bytes the name was made of, assuming it was decoded as latin1
	auto latin1 = charset::utf8_to_latin1(name);
	if(not latin1)
		return {};

	std::vector<std::string> candidates;
	for(const auto& encoding : config.candidate_encodings)
	{
		try
		{
			candidates.push_back(charset::to_utf8(*latin1, encoding, charset::on_invalid::SKIP));
		}
		catch(const charset::charset_error& e)
		{
			std::clog << "WARNING: skipping candidate encoding " << encoding << ": " << e.what() << '\n';
		}
	}

	return candidates;
}

// A candidate must stay a single name in the same directory
static bool is_single_component(const std::string& name)
{
	return name != "." and name != ".." and name.find('/') == std::string::npos
		and name.find('\0') == std::string::npos;
}

RenameOutcome PathRepairEngine::try_rename(const std::filesystem::path& path, const std::string& candidate)
{
	const std::string name = path.filename().native();

	if(candidate.empty() or candidate == name)
		return {RenameOutcome::NO_CHANGE, path};

	if(not is_single_component(candidate))
	{
		std::clog << "WARNING: refusing to rename " << path << " to `" << candidate << "': not a plain name\n";
		return {RenameOutcome::REJECTED, path};
	}

	const auto new_path = path.parent_path() / candidate;

	// symlink_status so that a dangling link counts as taken, anything but "not found" is taken
	std::error_code ec;
	if(std::filesystem::symlink_status(new_path, ec).type() != std::filesystem::file_type::not_found)
	{
		std::clog << "WARNING: target name already exists: " << new_path << '\n';
		return {RenameOutcome::REJECTED, path};
	}

	try
	{
		std::filesystem::rename(path, new_path);
	}
	catch(const std::filesystem::filesystem_error& e)
	{
		std::clog << "ERROR: renaming " << path << ": " << e.what() << '\n';
		return {RenameOutcome::REJECTED, path};
	}

	records.push_back({path.native(), new_path.native()});
	std::cout << "Fixed " << (std::filesystem::is_directory(new_path, ec) ? "directory" : "filename") << ": "
		<< name << " -> " << candidate << std::endl;

	return {RenameOutcome::RENAMED, new_path};
}

std::filesystem::path PathRepairEngine::repair(const std::filesystem::path& path)
{
	const std::string name = path.filename().native();

	// Placeholders are plain ASCII, so look for them before trusting a clean name
	if(is_clean(name) and not charset::contains_escape(name))
		return path;

	try
	{
		for(const auto& strategy : strategies)
		{
			for(const auto& candidate : strategy(name))
			{
				auto outcome = try_rename(path, candidate);
				if(outcome.status == RenameOutcome::RENAMED)
					return outcome.path;
			}
		}
	}
	catch(const std::exception& e)
	{
		std::clog << "ERROR: repairing " << path << ": " << e.what() << '\n';
		return path;
	}

	std::clog << "Could not fix name: " << name << '\n';
	return path;
}

}
