#include <trawl/css_selector.hpp>

#include <cctype>
#include <set>
#include <boost/algorithm/string.hpp>

#include <trawl/error.hpp>
#include <trawl/util/util.hpp>

namespace trawl
{
	css_selector::css_selector(std::string const& selector)
	: text(selector)
	, tag()
	, classes()
	{
		if(selector.empty())
			throw configuration_error("Empty selector");

		for(char c : selector)
			if(c == '>' || c == '+' || std::isspace(static_cast<unsigned char>(c)))
				throw configuration_error("No support for nested tags. \"" + selector + "\"");

		std::vector<std::string> parts;
		boost::algorithm::split(parts, selector, boost::algorithm::is_any_of("."));

		tag = parts.front();
		classes.assign(parts.begin() + 1, parts.end());

		for(auto const& c : classes)
			if(c.empty())
				throw configuration_error("Empty class name in selector \"" + selector + "\"");
	}

	bool css_selector::matches(std::string const& tag_name, attributes_t const& atts) const
	{
		if(!tag.empty() && tag_name != tag)
			return false;

		if(classes.empty())
			return true;

		for(auto const& att : atts)
		{
			if(att.first != "class")
				continue;

			std::set<std::string> const present(util::split_classes(att.second));
			for(auto const& c : classes)
				if(present.find(c) == present.end())
					return false;

			return true;
		}

		return false;
	}
}
