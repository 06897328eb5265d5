#include <cstdlib>
#include <fstream>
#include <iostream>

#include <trawl/cli/command.hpp>
#include <trawl/cli/recipe.hpp>

int main(int argc, char** argv)
{
	trawl::recipe opt;

	int result = trawl::read_options(opt, argc, argv, std::cout, std::cerr);
	if(result != EXIT_SUCCESS)
		return result;

	if(opt.input == "-")
		return trawl::run(opt, std::cin, std::cout);

	std::ifstream is(opt.input, std::ios::binary);
	if(!is)
	{
		std::cerr << "Could not open " << opt.input << std::endl;
		return EXIT_FAILURE;
	}

	return trawl::run(opt, is, std::cout);
}
