#include <limits>
#include <memory>
#include <unicode/ucnv.h>
#include <unicode/ucnv_cb.h>
#include <unicode/unistr.h>
#include "transcode.hpp"

namespace encfix::charset
{

struct converter_deleter
{
	void operator()(UConverter *cnv) const { ucnv_close(cnv); }
};

using converter_ptr = std::unique_ptr<UConverter, converter_deleter>;

// ICU lengths are int32_t
static void check_length(size_t size)
{
	if(size > static_cast<size_t>(std::numeric_limits<int32_t>::max()))
		throw charset_error("text of " + std::to_string(size) + " bytes is too large to convert");
}

static converter_ptr open_converter(const std::string& charset)
{
	UErrorCode status = U_ZERO_ERROR;
	converter_ptr cnv(ucnv_open(charset.c_str(), &status));

	if(U_FAILURE(status))
		throw charset_error("unknown charset " + charset + ": " + u_errorName(status));

	return cnv;
}

std::string to_utf8(const uint8_t *buffer, size_t size, const std::string& charset, on_invalid policy)
{
	check_length(size);
	auto cnv = open_converter(charset);
	UErrorCode status = U_ZERO_ERROR;

	if(policy == on_invalid::SKIP)
	{
		ucnv_setToUCallBack(cnv.get(), UCNV_TO_U_CALLBACK_SKIP, nullptr, nullptr, nullptr, &status);
		if(U_FAILURE(status))
			throw charset_error(std::string("unable to set skip callback: ") + u_errorName(status));
	}

	// The default callback substitutes U+FFFD
	icu::UnicodeString decoded(reinterpret_cast<const char *>(buffer), static_cast<int32_t>(size), cnv.get(), status);
	if(U_FAILURE(status))
		throw charset_error("unable to decode " + charset + ": " + u_errorName(status));

	std::string utf8;
	decoded.toUTF8String(utf8);
	return utf8;
}

std::string from_utf8(const std::string& utf8, const std::string& charset)
{
	check_length(utf8.size());
	auto cnv = open_converter(charset);
	auto text = icu::UnicodeString::fromUTF8(utf8);

	// Preflight to get the size
	UErrorCode status = U_ZERO_ERROR;
	int32_t needed = text.extract(nullptr, 0, cnv.get(), status);
	if(status != U_BUFFER_OVERFLOW_ERROR and U_FAILURE(status))
		throw charset_error("unable to encode " + charset + ": " + u_errorName(status));

	std::string encoded(needed, '\0');
	status = U_ZERO_ERROR;
	ucnv_reset(cnv.get());
	text.extract(encoded.data(), needed, cnv.get(), status);
	// No room for the terminator is fine, we don't want it
	if(U_FAILURE(status))
		throw charset_error("unable to encode " + charset + ": " + u_errorName(status));

	return encoded;
}

bool same_charset(const std::string& a, const std::string& b)
{
	return ucnv_compareNames(a.c_str(), b.c_str()) == 0;
}

}
