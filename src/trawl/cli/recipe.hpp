#pragma once

#include <ostream>
#include <string>
#include <vector>
#include <boost/optional.hpp>

namespace trawl
{
	/* Everything needed to scrape one kind of page. Comes from the command
	 * line, from a recipe file given with --config, or both.
	 */
	struct recipe
	{
		std::string input = "-";
		std::string selector;
		std::vector<std::string> fields; // "name:regex"
		boost::optional<std::string> tpl;

		bool reverse = false;
		bool keep_whitespace = false;
		bool plain = false;
		std::string charset = "UTF-8";

		bool silent = false;
	};

	/* Returns EXIT_SUCCESS when the caller should go on scraping. Help and
	 * usage errors are written to out and err respectively.
	 */
	int read_options(recipe& opt, int argc, char const* const* argv, std::ostream& out, std::ostream& err);
}
