#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace encfix::charset
{

/** Thrown when ICU can't open a converter or convert */
struct charset_error: public std::runtime_error
{
	using std::runtime_error::runtime_error;
};

enum class on_invalid
{
	SUBSTITUTE, // unmappable input becomes U+FFFD
	SKIP        // unmappable input is dropped
};

/**
 * Decodes a buffer encoded in charset into utf8. Never fails because of bad input bytes.
 * @throws charset_error if charset is unknown to ICU
 */
std::string to_utf8(const uint8_t *buffer, size_t size, const std::string& charset, on_invalid policy);

inline std::string to_utf8(const std::string& bytes, const std::string& charset, on_invalid policy)
{
	return to_utf8(reinterpret_cast<const uint8_t *>(bytes.data()), bytes.size(), charset, policy);
}

/**
 * Encodes a utf8 string into charset, chars charset can't represent become its substitution char
 * @throws charset_error if charset is unknown to ICU
 */
std::string from_utf8(const std::string& utf8, const std::string& charset);

/** Compares two charset names the way ICU does: case, '-' and '_' don't matter ("utf8" == "UTF-8") */
bool same_charset(const std::string& a, const std::string& b);

}
