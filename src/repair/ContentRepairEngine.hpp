#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include "types.hpp"
#include "charset/EncodingProber.hpp"

namespace encfix
{

/**
 * Converts text files written in a legacy charset to the target charset, in place
 */
class ContentRepairEngine
{
	const std::string target_encoding;
	charset::EncodingProber prober;

	std::vector<ContentRecord> records;

public:
	// Bytes looked at by the binary sniff
	static constexpr size_t BINARY_SNIFF_SIZE = 1024;

	explicit ContentRepairEngine(const RepairConfig& config = RepairConfig::defaults());

	/**
	 * Detects the charset of path and rewrites it in the target charset. Files with a NUL byte
	 * in their first BINARY_SNIFF_SIZE bytes, files already in the target charset and files whose
	 * charset can't be guessed are left alone. Never throws: failures are logged.
	 * The original bytes are lost once rewritten.
	 * @return true if the file was rewritten
	 */
	bool repair(const std::filesystem::path& path);

	const std::vector<ContentRecord>& get_records() const { return records; }
};

/** true if a NUL byte shows up among the first ContentRepairEngine::BINARY_SNIFF_SIZE bytes */
bool looks_binary(const uint8_t *buffer, size_t size);

}
