#pragma once

#include <filesystem>
#include <functional>
#include <string>
#include <vector>
#include "types.hpp"
#include "charset/MojibakeTable.hpp"

namespace encfix
{

/**
 * Repairs the last component of a path: "#Uxxxx" placeholders, known mojibake and
 * names garbled by a wrong charset. The parent directory is never touched.
 */
class PathRepairEngine
{
public:
	// A strategy proposes candidate names for a name, best first
	using strategy_t = std::function<std::vector<std::string>(const std::string&)>;

private:
	const RepairConfig config;
	const charset::MojibakeTable table;
	std::vector<strategy_t> strategies;

	std::vector<RepairRecord> records;

	std::vector<std::string> escape_candidates(const std::string& name) const;
	std::vector<std::string> mojibake_candidates(const std::string& name) const;
	std::vector<std::string> recoding_candidates(const std::string& name) const;

public:
	/** @throws std::runtime_error if the mojibake table can't be compiled */
	explicit PathRepairEngine(RepairConfig config = RepairConfig::defaults());

	/**
	 * Tries the strategies in order (escapes, mojibake table, recoding) and renames the entry
	 * to the first candidate accepted. Never throws: failures are logged and leave the entry as is.
	 * @param path an existing file or directory
	 * @return the path the entry lives at now, path itself if it wasn't renamed
	 */
	std::filesystem::path repair(const std::filesystem::path& path);

	/**
	 * Renames path to parent/candidate unless something already lives there.
	 * Never overwrites, never throws.
	 */
	RenameOutcome try_rename(const std::filesystem::path& path, const std::string& candidate);

	/** Every rename done so far, in order */
	const std::vector<RepairRecord>& get_records() const { return records; }
};

}
