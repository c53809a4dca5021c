#include <algorithm>
#include <cstring>
#include <fstream>
#include <iostream>
#include "ContentRepairEngine.hpp"
#include "charset/transcode.hpp"
#include "util/memory.hpp"

namespace encfix
{

bool looks_binary(const uint8_t *buffer, size_t size)
{
	const size_t sniff = std::min(size, ContentRepairEngine::BINARY_SNIFF_SIZE);
	return sniff > 0 and std::memchr(buffer, 0, sniff) != nullptr;
}

ContentRepairEngine::ContentRepairEngine(const RepairConfig& config):
	target_encoding(config.target_encoding), prober(config.target_encoding)
{}

bool ContentRepairEngine::repair(const std::filesystem::path& path)
{
	try
	{
		if(not std::filesystem::is_regular_file(path))
			return false;

		memory_mmap file(path.native());
		const auto [buffer, size] = file.get();

		if(looks_binary(buffer, size))
			return false;

		auto guess = prober.detect(buffer, size);
		if(not guess or charset::same_charset(*guess, target_encoding))
			return false;

		const std::string detected = *guess;
		auto converted = charset::to_utf8(buffer, size, detected, charset::on_invalid::SUBSTITUTE);

		// The file is about to be truncated under the mapping
		file.release();

		if(not charset::same_charset(target_encoding, "UTF-8"))
			converted = charset::from_utf8(converted, target_encoding);

		std::ofstream out(path, std::ios::binary | std::ios::trunc);
		out.write(converted.data(), static_cast<std::streamsize>(converted.size()));
		out.close();
		if(not out)
		{
			std::clog << "ERROR: writing " << path << " failed, its content may be lost\n";
			return false;
		}

		records.push_back({path.native(), detected, target_encoding});
		std::cout << "Fixed content encoding: " << path.filename().native()
			<< " (" << detected << " -> " << target_encoding << ")" << std::endl;
		return true;
	}
	catch(const std::exception& e)
	{
		std::clog << "ERROR: fixing content encoding of " << path << ": " << e.what() << '\n';
		return false;
	}
}

}
