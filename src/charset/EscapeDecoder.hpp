#pragma once

#include <string>

namespace encfix::charset
{

/**
 * Some tools store non-ASCII names as placeholders made of "#U" and 4 hex digits,
 * e.g. "#U51b2#U950b#U7ebf.txt" for "冲锋线.txt".
 * @return true if str contains at least one such placeholder
 */
bool contains_escape(const std::string& str);

/**
 * Replaces every "#Uxxxx" placeholder with the utf8 encoding of the U+xxxx code point.
 * Placeholders naming a surrogate are kept verbatim.
 * @param str A string to decode
 * @return the decoded string, str itself if no placeholder is found
 */
std::string decode_escapes(const std::string& str);

}
