#pragma once

#include <stdexcept>
#include <string>

namespace trawl
{
	// Invalid selector, regex, field specification or recipe.
	class configuration_error : public std::invalid_argument
	{
	public:
		explicit configuration_error(std::string const& what)
		: std::invalid_argument(what)
		{}
	};

	// Unknown field name in a lookup or template.
	class lookup_error : public std::out_of_range
	{
	public:
		explicit lookup_error(std::string const& what)
		: std::out_of_range(what)
		{}
	};

	// Closing tag without a matching open tag anywhere on the stack.
	class unbalanced_markup_error : public lookup_error
	{
	public:
		explicit unbalanced_markup_error(std::string const& tag)
		: lookup_error("Closing tag </" + tag + "> without matching open tag")
		{}
	};

	// The selector matched an element inside an already matched element.
	class nested_match_error : public std::runtime_error
	{
	public:
		explicit nested_match_error(std::string const& selector)
		: std::runtime_error("No nested matches! Adjust your selector \"" + selector + "\"")
		{}
	};
}
