#include "utf8_utils.hpp"

namespace encfix::charset
{

// Number of bytes of the sequence introduced by lead, 0 if lead can't start a sequence
static inline size_t sequence_length(uint8_t lead)
{
	if(lead < 0x80)
		return 1;
	if((lead & 0b11100000) == 0b11000000)
		return 2;
	if((lead & 0b11110000) == 0b11100000)
		return 3;
	if((lead & 0b11111000) == 0b11110000)
		return 4;

	return 0;
}

std::optional<uint32_t> utf8_next(const uint8_t *buffer, size_t size, size_t& pos)
{
	if(pos >= size)
		return std::nullopt;

	const size_t len = sequence_length(buffer[pos]);
	if(len == 0 or pos + len > size)
		return std::nullopt;

	if(len == 1)
		return buffer[pos++];

	// The lead byte keeps 7 - len payload bits
	uint32_t cp = buffer[pos] & (0x7f >> len);
	for(size_t i = 1; i < len; ++i)
	{
		if((buffer[pos + i] & 0b11000000) != 0b10000000)
			return std::nullopt;
		cp = (cp << 6) | (buffer[pos + i] & 0b00111111);
	}

	// Reject overlong forms, surrogates and what's beyond the unicode range
	static constexpr uint32_t min_cp[] = {0, 0, 0x80, 0x800, 0x10000};
	if(cp < min_cp[len] or (cp >= 0xd800 and cp <= 0xdfff) or cp > 0x10ffff)
		return std::nullopt;

	pos += len;
	return cp;
}

bool utf8_is_valid(const uint8_t *buffer, size_t size)
{
	size_t pos = 0;
	while(pos < size)
	{
		// Fast path for ASCII
		if(buffer[pos] < 0x80)
		{
			++pos;
			continue;
		}

		if(not utf8_next(buffer, size, pos))
			return false;
	}

	return true;
}

bool utf8_append(std::string& out, uint32_t cp)
{
	if((cp >= 0xd800 and cp <= 0xdfff) or cp > 0x10ffff)
		return false;

	if(cp < 0x80)
	{
		out += static_cast<char>(cp);
	}
	else if(cp < 0x800)
	{
		out += static_cast<char>(0b11000000 | (cp >> 6));
		out += static_cast<char>(0b10000000 | (cp & 0b00111111));
	}
	else if(cp < 0x10000)
	{
		out += static_cast<char>(0b11100000 | (cp >> 12));
		out += static_cast<char>(0b10000000 | ((cp >> 6) & 0b00111111));
		out += static_cast<char>(0b10000000 | (cp & 0b00111111));
	}
	else
	{
		out += static_cast<char>(0b11110000 | (cp >> 18));
		out += static_cast<char>(0b10000000 | ((cp >> 12) & 0b00111111));
		out += static_cast<char>(0b10000000 | ((cp >> 6) & 0b00111111));
		out += static_cast<char>(0b10000000 | (cp & 0b00111111));
	}

	return true;
}

std::optional<std::string> utf8_to_latin1(const std::string& str)
{
	const auto *buffer = reinterpret_cast<const uint8_t *>(str.data());
	std::string latin1;
	latin1.reserve(str.size());

	size_t pos = 0;
	while(pos < str.size())
	{
		auto cp = utf8_next(buffer, str.size(), pos);
		if(not cp or *cp > 0xff)
			return std::nullopt;

		latin1 += static_cast<char>(*cp);
	}

	return latin1;
}

}
