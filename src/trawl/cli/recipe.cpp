#include <trawl/cli/recipe.hpp>

#include <cstdlib>
#include <fstream>
#include <boost/algorithm/string.hpp>
#include <boost/program_options.hpp>

namespace po = boost::program_options;

namespace trawl
{
	/* Recipe files hold "key = value" lines. Lines starting with '#' or ';' are
	 * comments; a '#' inside a value is kept, templates need it.
	 */
	static std::vector<std::string> read_recipe(std::istream& is)
	{
		std::vector<std::string> args;

		std::string line;
		while(std::getline(is, line))
		{
			boost::algorithm::trim(line);
			if(line.empty() || line[0] == '#' || line[0] == ';')
				continue;

			size_t eq = line.find('=');
			if(eq == std::string::npos)
				throw po::invalid_config_file_syntax(line, po::invalid_syntax::unrecognized_line);

			std::string key = boost::algorithm::trim_copy(line.substr(0, eq));
			std::string value = boost::algorithm::trim_copy(line.substr(eq + 1));
			args.push_back("--" + key + "=" + value);
		}

		return args;
	}

	int read_options(recipe& opt, int argc, char const* const* argv, std::ostream& out, std::ostream& err)
	{
		std::string config_path;

		po::options_description o_general("General options");
		o_general.add_options()
				("help,h", "display this message")
				("config,c", po::value(&config_path), "read a recipe file (selector, field, template, ...)")
				("silent,s", "do not write status reports to cerr");

		po::options_description o_recipe("Recipe options");
		o_recipe.add_options()
				("template,t", po::value<std::string>(), "render each fragment, e.g. '<a href=\"{#url#}\">{#title#}</a>'")
				("reverse,r", po::value<bool>()->implicit_value(true), "emit fragments in reverse document order")
				("keep-whitespace,k", po::value<bool>()->implicit_value(true), "do not collapse whitespace in field values")
				("plain,p", po::value<bool>()->implicit_value(true), "strip markup from field values")
				("charset", po::value<std::string>(), "charset of the input (default: UTF-8)");

		po::options_description o_hidden;
		o_hidden.add_options()
				("input", po::value<std::string>(), "input html file, - for stdin")
				("selector", po::value<std::string>(), "CSS selector, e.g. article.entry")
				("field", po::value<std::vector<std::string>>(), "field as name:regex");

		po::positional_options_description pos;
		pos.add("input", 1);
		pos.add("selector", 1);
		pos.add("field", -1);

		po::options_description options("Allowed options");
		options.add(o_general).add(o_recipe).add(o_hidden);

		po::options_description file_options;
		file_options.add(o_recipe).add(o_hidden);

		po::variables_map vm;

		try
		{
			po::store(po::command_line_parser(argc, argv).options(options).positional(pos).run(), vm);
			po::notify(vm);
		} catch(po::unknown_option const& e)
		{
			err << "Unknown option " << e.get_option_name() << ", see --help." << std::endl;
			return EXIT_FAILURE;
		} catch(po::error const& e)
		{
			err << e.what() << ", see --help." << std::endl;
			return EXIT_FAILURE;
		}

		if(vm.count("help"))
		{
			out
					<< "Extracts repeated fragments of an HTML page and the fields inside them." << std::endl
					<< "Usage: trawl [options] FILE SELECTOR [NAME:REGEX...]" << std::endl
					<< std::endl
					<< o_general << std::endl
					<< o_recipe;

			return EXIT_FAILURE;
		}

		if(vm.count("config"))
		{
			std::ifstream is(config_path);
			if(!is)
			{
				err << "Could not open recipe " << config_path << std::endl;
				return EXIT_FAILURE;
			}

			try
			{
				// Values already given on the command line are kept
				po::store(po::command_line_parser(read_recipe(is)).options(file_options).run(), vm);
				po::notify(vm);
			} catch(po::error const& e)
			{
				err << "Invalid recipe " << config_path << ": " << e.what() << std::endl;
				return EXIT_FAILURE;
			}
		}

		if(!vm.count("selector"))
		{
			err << "You forgot this: selector, see --help." << std::endl;
			return EXIT_FAILURE;
		}

		opt.selector = vm["selector"].as<std::string>();

		if(vm.count("input"))
			opt.input = vm["input"].as<std::string>();

		if(vm.count("field"))
			opt.fields = vm["field"].as<std::vector<std::string>>();

		if(vm.count("template"))
			opt.tpl = vm["template"].as<std::string>();

		if(vm.count("reverse"))
			opt.reverse = vm["reverse"].as<bool>();

		if(vm.count("keep-whitespace"))
			opt.keep_whitespace = vm["keep-whitespace"].as<bool>();

		if(vm.count("plain"))
			opt.plain = vm["plain"].as<bool>();

		if(vm.count("charset"))
			opt.charset = vm["charset"].as<std::string>();

		opt.silent = vm.count("silent");

		return EXIT_SUCCESS;
	}
}
