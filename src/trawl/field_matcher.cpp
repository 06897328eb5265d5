#include <trawl/field_matcher.hpp>

#include <trawl/error.hpp>
#include <trawl/util/util.hpp>

namespace trawl
{
	static boost::regex compile(std::string const& regex)
	{
		try
		{
			return boost::regex(regex, boost::regex::perl | boost::regex::no_mod_s);
		} catch(boost::regex_error const& e)
		{
			throw configuration_error("Invalid regex '" + regex + "': " + e.what());
		}
	}

	field_matcher::field_matcher(std::string const& regex, bool _cleanup)
	: pattern(regex)
	, rgx(compile(regex))
	, cleanup(_cleanup)
	{
		if(rgx.mark_count() < 1)
			throw configuration_error("Regex '" + regex + "' has no capture group");
	}

	boost::optional<std::string> field_matcher::find(std::string const& text) const
	{
		boost::smatch what;
		if(!boost::regex_search(text, what, rgx))
			return boost::none;

		std::string value = what[1];
		if(cleanup)
			return util::sanitize(value);

		return value;
	}

	plain_field_matcher::plain_field_matcher(std::string const& regex, bool _cleanup)
	: field_matcher(regex, false)
	, plain_cleanup(_cleanup)
	{}

	boost::optional<std::string> plain_field_matcher::find(std::string const& text) const
	{
		boost::optional<std::string> value = field_matcher::find(text);
		if(!value)
			return value;

		std::string plain = util::strip_html(*value);
		if(plain_cleanup)
			return util::sanitize(plain);

		return plain;
	}
}
