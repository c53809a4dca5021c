#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace encfix::charset
{

/**
 * Checks that the buffer is well formed utf8: no stray continuation bytes, no truncated sequences,
 * no overlong forms, no surrogates and nothing above U+10FFFF
 * @param buffer
 * @param size buffer's length in bytes
 * @return true if the whole buffer is valid utf8 (an empty buffer is valid)
 */
bool utf8_is_valid(const uint8_t *buffer, size_t size);

inline bool utf8_is_valid(const std::string& str)
{
	return utf8_is_valid(reinterpret_cast<const uint8_t *>(str.data()), str.size());
}

/**
 * Appends the utf8 representation of a code point to out
 * @return false if cp is a surrogate or out of the unicode range, out is left untouched
 */
bool utf8_append(std::string& out, uint32_t cp);

/**
 * Decodes the code point starting at buffer[pos] and advances pos past it
 * @return the code point, nullopt on a malformed sequence (pos is not advanced)
 */
std::optional<uint32_t> utf8_next(const uint8_t *buffer, size_t size, size_t& pos);

/**
 * A proper UNICODE string like "cafÃ©" that only contains chars up to U+00FF can be turned back into the
 * latin1 bytes it was decoded from: each 2 bytes utf8 sequence collapses into one byte.
 * @param str a valid utf8 string
 * @return the latin1 bytes, nullopt if str is not utf8 or contains a char above U+00FF
 */
std::optional<std::string> utf8_to_latin1(const std::string& str);

/** true if every byte is 7-bit ASCII */
inline bool is_ascii(const std::string& str)
{
	for(unsigned char c : str)
		if(c >= 0x80)
			return false;

	return true;
}

}
