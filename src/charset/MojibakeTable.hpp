#pragma once

#include <string>
#include <utility>
#include <vector>
#include <hs/hs.h>

namespace encfix::charset
{

/**
 * An ordered list of (corrupted, correct) substrings. Corrupted substrings are what a multi-byte
 * utf8 sequence looks like once its bytes are read as single byte chars, eg "Ã©" for "é".
 */
class MojibakeTable
{
public:
	using pattern_t = std::pair<std::string, std::string>;

private:
	std::vector<pattern_t> patterns;

	// Literal database of the corrupted substrings, null when the table is empty
	hs_database_t *db = nullptr;
	hs_scratch_t *scratch = nullptr;

public:
	/**
	 * Compiles the table. Patterns are applied in the given order.
	 * @throws std::invalid_argument on an empty corrupted substring
	 * @throws std::runtime_error if hyperscan can't build the database
	 */
	explicit MojibakeTable(std::vector<pattern_t> patterns);
	~MojibakeTable();

	MojibakeTable(const MojibakeTable&) = delete;
	MojibakeTable& operator=(const MojibakeTable&) = delete;

	/** true if str contains at least one corrupted substring */
	bool matches(const std::string& str) const;

	/**
	 * Replaces all occurrences of each corrupted substring, one pattern at the time in table order
	 * @return the repaired string, str itself if nothing matched
	 */
	std::string apply(const std::string& str) const;

	/** The table of the common latin1 and chinese corruptions */
	static std::vector<pattern_t> default_patterns();
};

}
