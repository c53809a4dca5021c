#include <iostream>
#include "repair/PathRepairEngine.hpp"
#include "repair/TreeScanner.hpp"
#include "util/fixer_options.hpp"

static void usage(const char *argv0)
{
	std::cout << "Usage: " << argv0 << " [OPTIONS] [DIRECTORY]\n"
		<< "Decodes #Uxxxx placeholders in file and folder names.\n"
		<< "Example: #U51b2#U950b#U7ebf.txt -> 冲锋线.txt\n\n"
		<< "  -F, --no-folders   only fix file names, leave folder names alone\n"
		<< "  -h, --help         show this help\n";
}

int main(int argc, char** argv)
{
	const escape_options options(argc, argv);

	if(options.help or options.bad_usage)
	{
		usage(argv[0]);
		return options.bad_usage ? 1 : 0;
	}

	std::error_code ec;
	const auto root = std::filesystem::absolute(options.root, ec);
	if(ec or not check_directory(root))
		return 1;

	std::cout << "Unicode Filename and Folder Fixer Tool\n" << std::string(50, '=') << '\n';

	encfix::PathRepairEngine names(encfix::RepairConfig::escapes_only());
	encfix::TreeScanner scanner(names, nullptr, {}, options.repair_folders);

	auto stats = scanner.scan(root);
	encfix::print_summary(std::cout, stats, names.get_records(), {});

	return 0;
}
