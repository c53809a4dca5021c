#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unicode/ucsdet.h>

namespace encfix::charset
{

/**
 * Best effort guess of the charset a text was written in. The guess is a statistical plurality
 * vote, don't expect it to be right on short inputs. UTF-16 and UTF-32 are never answered, the
 * binary sniff upstream already rules them out.
 */
class EncodingProber
{
	struct detector_deleter
	{
		void operator()(UCharsetDetector *csd) const { ucsdet_close(csd); }
	};

	std::unique_ptr<UCharsetDetector, detector_deleter> detector;
	std::string target;
	bool target_is_utf8;

public:
	/// Answer for non utf8 text ICU has no opinion on
	static constexpr const char *FALLBACK_CHARSET = "ISO-8859-1";

	/**
	 * @param target_charset the charset texts are meant to end up in, buffers already valid
	 *                       utf8 are not probed when it's utf8
	 * @throws charset_error if ICU can't open a detector
	 */
	explicit EncodingProber(std::string target_charset = "UTF-8");

	/**
	 * @return the name of the most likely single or multi byte charset, FALLBACK_CHARSET if ICU
	 *         has no such match, nullopt if the buffer is empty or already valid in the target
	 *         charset
	 */
	std::optional<std::string> detect(const uint8_t *buffer, size_t size);

	std::optional<std::string> detect(const std::string& bytes)
	{
		return detect(reinterpret_cast<const uint8_t *>(bytes.data()), bytes.size());
	}
};

}
