#include <iostream>
#include "audit/DirComparator.hpp"
#include "util/fixer_options.hpp"

int main(int argc, char** argv)
{
	const compare_options options(argc, argv);

	if(options.help or options.bad_usage)
	{
		std::cout << "Usage: " << argv[0] << " [-p|--pattern GLOB] OLD_DIR NEW_DIR\n"
			<< "Compares the .txt files of two directories by size and MD5,\n"
			<< "and the files matching GLOB (default *鬼穴*.pdf) by size.\n";
		return options.bad_usage ? 1 : 0;
	}

	if(not check_directory(options.old_dir) or not check_directory(options.new_dir))
		return 1;

	encfix::audit::DirComparator comparator(options.old_dir, options.new_dir, options.size_pattern);
	comparator.run(std::cout);

	return 0;
}
