#include <pcrecpp.h>
#include "EscapeDecoder.hpp"
#include "utf8_utils.hpp"

namespace encfix::charset
{

// Byte mode: '#' and 'U' never show up inside a utf8 multibyte sequence,
// and names that aren't valid utf8 must still match
static const pcrecpp::RE_Options escape_options = pcrecpp::RE_Options().set_dotall(true);

// One placeholder anywhere
static const pcrecpp::RE escape_re("#U[0-9A-Fa-f]{4}", escape_options);

// Shortest prefix followed by a placeholder, anchored at the start of the input when consumed
static const pcrecpp::RE prefix_escape_re("(.*?)#U([0-9A-Fa-f]{4})", escape_options);

bool contains_escape(const std::string& str)
{
	return escape_re.PartialMatch(str);
}

std::string decode_escapes(const std::string& str)
{
	if(not contains_escape(str))
		return str;

	pcrecpp::StringPiece input(str);
	std::string decoded;
	std::string prefix;
	unsigned int cp = 0;

	decoded.reserve(str.size());

	// Each Consume() eats "<prefix>#Uxxxx" from the front of input
	while(prefix_escape_re.Consume(&input, &prefix, pcrecpp::Hex(&cp)))
	{
		decoded += prefix;

		if(not utf8_append(decoded, cp))
		{
			// The 6 bytes we've just eaten, as they were
			decoded.append(input.data() - 6, 6);
		}
	}

	// Whatever follows the last placeholder
	decoded.append(input.data(), input.size());

	return decoded;
}

}
