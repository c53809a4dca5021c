#include "types.hpp"
#include "charset/MojibakeTable.hpp"
#include "charset/utf8_utils.hpp"

namespace encfix
{

RepairConfig RepairConfig::defaults()
{
	RepairConfig config;
	config.mojibake_patterns = charset::MojibakeTable::default_patterns();
	config.candidate_encodings = {"ISO-8859-1", "windows-1252", "GBK", "GB2312", "Big5"};
	return config;
}

RepairConfig RepairConfig::escapes_only()
{
	return RepairConfig{};
}

bool is_clean(const std::string& name)
{
	return charset::is_ascii(name);
}

}
