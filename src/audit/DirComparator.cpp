#include <algorithm>
#include <array>
#include <fnmatch.h>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <vector>
#include <openssl/evp.h>
#include "DirComparator.hpp"

namespace encfix::audit
{

struct md_ctx_deleter
{
	void operator()(EVP_MD_CTX *ctx) const { EVP_MD_CTX_free(ctx); }
};

std::string file_md5(const std::filesystem::path& path)
{
	std::ifstream in(path, std::ios::binary);
	if(not in)
	{
		std::clog << "ERROR: unable to read " << path << " for hashing\n";
		return "";
	}

	std::unique_ptr<EVP_MD_CTX, md_ctx_deleter> ctx(EVP_MD_CTX_new());
	if(not ctx or EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1)
	{
		std::clog << "ERROR: unable to init MD5\n";
		return "";
	}

	std::array<char, 4096> chunk{};
	while(in.read(chunk.data(), chunk.size()) or in.gcount() > 0)
	{
		if(EVP_DigestUpdate(ctx.get(), chunk.data(), in.gcount()) != 1)
		{
			std::clog << "ERROR: MD5 update failed on " << path << '\n';
			return "";
		}
	}

	if(in.bad())
	{
		std::clog << "ERROR: reading " << path << " failed\n";
		return "";
	}

	std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
	unsigned int digest_len = 0;
	if(EVP_DigestFinal_ex(ctx.get(), digest.data(), &digest_len) != 1)
	{
		std::clog << "ERROR: MD5 final failed on " << path << '\n';
		return "";
	}

	std::ostringstream hex;
	hex << std::hex << std::setfill('0');
	for(unsigned int i = 0; i < digest_len; ++i)
		hex << std::setw(2) << static_cast<unsigned>(digest[i]);

	return hex.str();
}

uintmax_t file_size(const std::filesystem::path& path)
{
	std::error_code ec;
	auto size = std::filesystem::file_size(path, ec);
	if(ec)
	{
		std::clog << "ERROR: unable to get size of " << path << ": " << ec.message() << '\n';
		return 0;
	}

	return size;
}

// Regular files directly under dir whose name matches pattern, sorted by name
static std::vector<std::filesystem::path> glob_files(const std::filesystem::path& dir, const std::string& pattern)
{
	std::vector<std::filesystem::path> matches;
	std::error_code ec;

	for(const auto& entry : std::filesystem::directory_iterator(dir, ec))
	{
		std::error_code type_ec;
		if(entry.is_regular_file(type_ec)
			and fnmatch(pattern.c_str(), entry.path().filename().c_str(), 0) == 0)
			matches.push_back(entry.path());
	}

	if(ec)
		std::clog << "ERROR: unable to list " << dir << ": " << ec.message() << '\n';

	std::sort(matches.begin(), matches.end());
	return matches;
}

DirComparator::DirComparator(std::filesystem::path old_dir, std::filesystem::path new_dir, std::string size_pattern):
	old_dir(std::move(old_dir)), new_dir(std::move(new_dir)), size_pattern(std::move(size_pattern))
{}

const std::map<std::string, FileComparison>& DirComparator::compare_text_files()
{
	text_results.clear();

	for(const auto& old_file : glob_files(old_dir, "*.txt"))
	{
		FileComparison result;
		result.file_name = old_file.filename().native();
		result.old_path = old_file;
		result.old_size = encfix::audit::file_size(old_file);

		const auto new_file = new_dir / result.file_name;
		std::error_code ec;
		if(std::filesystem::exists(new_file, ec))
		{
			result.new_path = new_file;
			result.new_size = encfix::audit::file_size(new_file);
			result.old_hash = file_md5(old_file);
			result.new_hash = file_md5(new_file);

			result.size_match = result.old_size == result.new_size;
			result.hash_match = result.old_hash == result.new_hash;
			result.identical = result.size_match and result.hash_match;
		}

		text_results[result.file_name] = std::move(result);
	}

	return text_results;
}

const std::optional<SizeComparison>& DirComparator::compare_pattern_files()
{
	size_result.reset();

	const auto old_matches = glob_files(old_dir, size_pattern);
	const auto new_matches = glob_files(new_dir, size_pattern);
	if(old_matches.empty() or new_matches.empty())
		return size_result;

	SizeComparison result;
	result.old_file = old_matches.front();
	result.new_file = new_matches.front();
	result.old_size = encfix::audit::file_size(result.old_file);
	result.new_size = encfix::audit::file_size(result.new_file);
	result.size_match = result.old_size == result.new_size;
	result.size_difference = result.old_size > result.new_size
		? result.old_size - result.new_size
		: result.new_size - result.old_size;

	size_result = result;
	return size_result;
}

std::string DirComparator::summary_report() const
{
	std::ostringstream report;

	size_t identical = 0, missing = 0, different = 0;
	for(const auto& [name, result] : text_results)
	{
		if(not result.exists_in_new())
			missing += 1;
		else if(result.identical)
			identical += 1;
		else
			different += 1;
	}

	report << "File comparison report\n"
		<< std::string(60, '=') << "\n\n"
		<< "Text files:\n"
		<< "Total in " << old_dir.native() << ": " << text_results.size() << '\n'
		<< "Identical: " << identical << '\n'
		<< "Missing in " << new_dir.native() << ": " << missing << '\n'
		<< "Different: " << different << '\n';

	if(missing > 0)
	{
		report << "\nMissing files:\n";
		for(const auto& [name, result] : text_results)
			if(not result.exists_in_new())
				report << "  - " << name << '\n';
	}

	if(different > 0)
	{
		report << "\nDifferent files:\n";
		for(const auto& [name, result] : text_results)
			if(result.exists_in_new() and not result.identical)
				report << "  - " << name << '\n';
	}

	if(size_result)
	{
		report << "\nFiles matching " << size_pattern << ":\n";
		if(size_result->size_match)
			report << "  same size (" << size_result->old_size << " bytes)\n";
		else
			report << "  different size (difference: " << size_result->size_difference << " bytes)\n";
	}

	return report.str();
}

std::string DirComparator::run(std::ostream& out)
{
	out << "Comparing text files...\n" << std::string(60, '-') << '\n';
	for(const auto& [name, result] : compare_text_files())
	{
		if(not result.exists_in_new())
			out << "MISSING   " << name << '\n';
		else if(result.identical)
			out << "IDENTICAL " << name << '\n';
		else
		{
			out << "DIFFERENT " << name << ':';
			if(not result.size_match)
				out << " size (" << result.old_size << " vs " << result.new_size << " bytes)";
			if(not result.hash_match)
				out << " content";
			out << '\n';
		}
	}

	out << "\nComparing files matching " << size_pattern << " by size...\n" << std::string(60, '-') << '\n';
	if(const auto& result = compare_pattern_files())
		out << (result->size_match ? "SAME SIZE " : "DIFFERENT SIZE ")
			<< result->old_file.filename().native() << " (" << result->old_size << " vs " << result->new_size << " bytes)\n";
	else
		out << "No file matching " << size_pattern << " in both directories\n";

	auto report = summary_report();
	out << '\n' << report;
	out.flush();
	return report;
}

}
