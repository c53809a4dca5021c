#include <stdexcept>
#include <iostream>
#include "MojibakeTable.hpp"

namespace encfix::charset
{

std::vector<MojibakeTable::pattern_t> MojibakeTable::default_patterns()
{
	// Order matters, keep it
	return {
			{"æ–‡ä»¶", "文件"},
			{"Ã©", "é"},
			{"Ã¨", "è"},
			{"Ã ", "à"}, // the second utf8 byte of à is 0xa0, often turned into a plain space
			{"Ã±", "ñ"},
			{"Ã¤", "ä"},
			{"Ã¶", "ö"},
			{"Ã¼", "ü"},
	};
}

MojibakeTable::MojibakeTable(std::vector<pattern_t> patterns_):
	patterns(std::move(patterns_))
{
	for(const auto& [corrupted, correct] : patterns)
		if(corrupted.empty())
			throw std::invalid_argument("mojibake pattern can't be empty");

	if(patterns.empty())
		return;

	// Build arrays for the library
	std::vector<const char*> hs_rules;
	std::vector<unsigned int> hs_rules_flags;
	std::vector<unsigned int> hs_rules_ids;
	std::vector<size_t> hs_rules_lens;
	for(unsigned int i = 0; i < patterns.size(); ++i)
	{
		hs_rules.push_back(patterns[i].first.data());
		hs_rules_flags.push_back(HS_FLAG_SINGLEMATCH);
		hs_rules_ids.push_back(i);
		hs_rules_lens.push_back(patterns[i].first.size());
	}

	hs_compile_error_t *compile_err;
	auto res = hs_compile_lit_multi(
			hs_rules.data(), hs_rules_flags.data(), hs_rules_ids.data(), hs_rules_lens.data(),
			hs_rules.size(), HS_MODE_BLOCK, nullptr, &db, &compile_err
	);

	if(res != HS_SUCCESS)
	{
		std::string message = "unable to compile mojibake table: ";
		message += compile_err->message;
		hs_free_compile_error(compile_err);
		throw std::runtime_error(message);
	}

	res = hs_alloc_scratch(db, &scratch);
	if(res != HS_SUCCESS)
	{
		hs_free_database(db);
		throw std::runtime_error("unable to allocate hyperscan scratch");
	}
}

MojibakeTable::~MojibakeTable()
{
	hs_free_scratch(scratch);
	hs_free_database(db);
}

// Called by hs_scan on the first match, stops the scan
static int stop_at_first_match(
		[[maybe_unused]] unsigned int id,
		[[maybe_unused]] unsigned long long from, [[maybe_unused]] unsigned long long to,
		[[maybe_unused]] unsigned int flags, void *context)
{
	*static_cast<bool*>(context) = true;
	return 1;
}

bool MojibakeTable::matches(const std::string& str) const
{
	if(db == nullptr or str.empty())
		return false;

	bool found = false;
	auto ret = hs_scan(db, str.data(), str.size(), 0, scratch, stop_at_first_match, &found);

	if(ret != HS_SUCCESS and ret != HS_SCAN_TERMINATED)
	{
		std::clog << "ERROR: mojibake scan failed on `" << str << "'\n";
		return false;
	}

	return found;
}

std::string MojibakeTable::apply(const std::string& str) const
{
	// No corrupted substring at all, nothing any replacement could change
	if(not matches(str))
		return str;

	std::string fixed = str;
	for(const auto& [corrupted, correct] : patterns)
	{
		for(size_t pos = fixed.find(corrupted); pos != std::string::npos; pos = fixed.find(corrupted, pos))
		{
			fixed.replace(pos, corrupted.size(), correct);
			pos += correct.size();
		}
	}

	return fixed;
}

}
