#include <iostream>
#include <unistd.h>
#include "repair/PathRepairEngine.hpp"
#include "repair/ContentRepairEngine.hpp"
#include "repair/TreeScanner.hpp"
#include "util/fixer_options.hpp"

static void usage(const char *argv0)
{
	std::cout << "Usage: " << argv0 << " [OPTIONS] [DIRECTORY]\n"
		<< "Fixes mangled file and folder names and converts text files to UTF-8.\n\n"
		<< "  -F, --no-folders   leave folder names alone\n"
		<< "  -C, --no-content   leave file contents alone\n"
		<< "  -e, --ext EXT      extension of the text files to convert (repeatable, default .txt)\n"
		<< "  -h, --help         show this help\n";
}

int main(int argc, char** argv)
{
	// Parse command line options
	fixer_options options(argc, argv);

	if(options.help or options.bad_usage)
	{
		usage(argv[0]);
		return options.bad_usage ? 1 : 0;
	}

	std::cout << "Encoding Fixer Tool\n" << std::string(30, '=') << '\n';

	// Ask for the directory when run by hand without one
	if(not options.root_given and isatty(STDIN_FILENO))
	{
		std::string answer;
		std::cout << "Enter directory path to scan (default: current directory): ";
		std::getline(std::cin, answer);
		if(not answer.empty())
			options.root = answer;
	}

	std::error_code ec;
	auto root = std::filesystem::absolute(options.root, ec);
	if(ec or not check_directory(root))
		return 1;

	auto config = encfix::RepairConfig::defaults();
	config.text_extensions = options.text_extensions;

	encfix::PathRepairEngine names(config);
	encfix::ContentRepairEngine contents(config);
	encfix::TreeScanner scanner(names, options.repair_content ? &contents : nullptr,
								config.text_extensions, options.repair_folders);

	auto stats = scanner.scan(root);
	encfix::print_summary(std::cout, stats, names.get_records(), contents.get_records());

	return 0;
}
