#pragma once

#include <istream>
#include <ostream>

#include <trawl/cli/recipe.hpp>

namespace trawl
{
	/* Runs a recipe against one input and writes the result to out: a JSON
	 * list of fragments, a JSON list of field objects, or one rendered
	 * template per line.
	 */
	int run(recipe const& opt, std::istream& in, std::ostream& out);
}
