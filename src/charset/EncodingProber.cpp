#include <algorithm>
#include <iostream>
#include <limits>
#include <strings.h>
#include "EncodingProber.hpp"
#include "transcode.hpp"
#include "utf8_utils.hpp"

namespace encfix::charset
{

EncodingProber::EncodingProber(std::string target_charset):
	target(std::move(target_charset)), target_is_utf8(same_charset(target, "UTF-8"))
{
	UErrorCode status = U_ZERO_ERROR;
	detector.reset(ucsdet_open(&status));

	if(U_FAILURE(status))
		throw charset_error(std::string("unable to open charset detector: ") + u_errorName(status));
}

// Text without a BOM or NUL bytes is never UTF-16 or UTF-32, ICU still ranks them high on short inputs
static bool is_wide_charset(const char *name)
{
	return strncasecmp(name, "UTF-16", 6) == 0 or strncasecmp(name, "UTF-32", 6) == 0;
}

std::optional<std::string> EncodingProber::detect(const uint8_t *buffer, size_t size)
{
	if(buffer == nullptr or size == 0)
		return std::nullopt;

	if(target_is_utf8 and utf8_is_valid(buffer, size))
		return std::nullopt;

	// ICU takes an int32_t length, the head of a huge file is plenty for a guess
	const auto len = static_cast<int32_t>(std::min<size_t>(size, std::numeric_limits<int32_t>::max()));

	UErrorCode status = U_ZERO_ERROR;
	ucsdet_setText(detector.get(), reinterpret_cast<const char *>(buffer), len, &status);

	int32_t n_matches = 0;
	const UCharsetMatch **matches = ucsdet_detectAll(detector.get(), &n_matches, &status);
	if(U_FAILURE(status))
	{
		std::clog << "ERROR: charset detection failed: " << u_errorName(status) << '\n';
		return std::nullopt;
	}

	// Matches come sorted by confidence
	for(int32_t i = 0; i < n_matches; i++)
	{
		const char *name = ucsdet_getName(matches[i], &status);
		if(U_FAILURE(status))
			return std::nullopt;

		if(name != nullptr and not is_wide_charset(name))
			return std::string(name);
	}

	// Every byte sequence is valid latin1, the usual answer for a few accented letters
	if(utf8_is_valid(buffer, size))
		return std::nullopt;

	return FALLBACK_CHARSET;
}

}
