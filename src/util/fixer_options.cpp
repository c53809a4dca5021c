#include <unistd.h>
#include <getopt.h>
#include <iostream>
#include "fixer_options.hpp"

fixer_options::fixer_options(int argc, char **argv)
{
	static const option long_options[] = {
			/*   NAME       ARGUMENT           FLAG  SHORTNAME */
			{"no-folders",	no_argument,       nullptr, 'F'},
			{"no-content",	no_argument,       nullptr, 'C'},
			{"ext",		required_argument, nullptr, 'e'},
			{"help",	no_argument,       nullptr, 'h'},
			{nullptr, 0, nullptr, 0}
	};

	bool default_extensions = true;

	// Parsing may happen more than once in a process (tests)
	optind = 0;

	int c;
	int option_index = 0;
	while ((c = getopt_long(argc, argv, "FCe:h", long_options, &option_index)) != -1)
	{
		switch (c)
		{
			case 'F':
				repair_folders = false;
				break;
			case 'C':
				repair_content = false;
				break;
			case 'e':
				if(default_extensions)
				{
					text_extensions.clear();
					default_extensions = false;
				}
				// Accept both "txt" and ".txt"
				text_extensions.push_back(optarg[0] == '.' ? std::string(optarg) : "." + std::string(optarg));
				break;
			case 'h':
				help = true;
				break;
			default:
				bad_usage = true;
				break;
		}
	}

	if(optind < argc)
	{
		root = argv[optind];
		root_given = true;
	}
}

escape_options::escape_options(int argc, char **argv)
{
	static const option long_options[] = {
			/*   NAME       ARGUMENT           FLAG  SHORTNAME */
			{"no-folders",	no_argument,       nullptr, 'F'},
			{"help",	no_argument,       nullptr, 'h'},
			{nullptr, 0, nullptr, 0}
	};

	optind = 0;

	int c;
	int option_index = 0;
	while ((c = getopt_long(argc, argv, "Fh", long_options, &option_index)) != -1)
	{
		switch (c)
		{
			case 'F':
				repair_folders = false;
				break;
			case 'h':
				help = true;
				break;
			default:
				bad_usage = true;
				break;
		}
	}

	if(optind < argc)
		root = argv[optind++];

	if(optind < argc)
		bad_usage = true;
}

compare_options::compare_options(int argc, char **argv)
{
	static const option long_options[] = {
			/*   NAME       ARGUMENT           FLAG  SHORTNAME */
			{"pattern",	required_argument, nullptr, 'p'},
			{"help",	no_argument,       nullptr, 'h'},
			{nullptr, 0, nullptr, 0}
	};

	optind = 0;

	int c;
	int option_index = 0;
	while ((c = getopt_long(argc, argv, "p:h", long_options, &option_index)) != -1)
	{
		switch (c)
		{
			case 'p':
				size_pattern = optarg;
				break;
			case 'h':
				help = true;
				break;
			default:
				bad_usage = true;
				break;
		}
	}

	if(argc - optind != 2)
	{
		bad_usage = bad_usage or not help;
		return;
	}

	old_dir = argv[optind];
	new_dir = argv[optind + 1];
}

bool check_directory(const std::filesystem::path& path)
{
	std::error_code ec;
	if(not std::filesystem::exists(path, ec))
	{
		std::cerr << "Error: path " << path << " does not exist!" << std::endl;
		return false;
	}

	if(not std::filesystem::is_directory(path, ec))
	{
		std::cerr << "Error: " << path << " is not a directory!" << std::endl;
		return false;
	}

	return true;
}
