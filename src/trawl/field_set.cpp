#include <trawl/field_set.hpp>

#include <boost/regex.hpp>

#include <trawl/error.hpp>

namespace trawl
{
	field_set::field_set()
	: names()
	, matchers()
	, cache()
	, html()
	{}

	field_set::field_set(std::vector<std::pair<std::string, std::string>> const& fields, bool cleanup)
	: field_set()
	{
		for(auto const& f : fields)
			add(f.first, f.second, cleanup);
	}

	void field_set::add(std::string const& name, std::string const& regex, bool cleanup)
	{
		add(name, std::make_shared<const field_matcher>(regex, cleanup));
	}

	void field_set::add(std::string const& name, matcher_ptr matcher)
	{
		if(name.empty())
			throw configuration_error("Field without a name");

		if(!matcher)
			throw configuration_error("Field '" + name + "' without a matcher");

		if(matchers.find(name) == matchers.end())
			names.push_back(name);

		matchers[name] = matcher;
		cache[name] = field_result();
	}

	std::pair<std::string, std::string> field_set::split_spec(std::string const& spec)
	{
		size_t colon = spec.find(':');
		if(colon == std::string::npos || colon == 0)
			throw configuration_error("Did you forget to prefix a field name? `" + spec + "`");

		return std::make_pair(spec.substr(0, colon), spec.substr(colon + 1));
	}

	void field_set::add_spec(std::string const& spec, bool cleanup)
	{
		auto field = split_spec(spec);
		add(field.first, field.second, cleanup);
	}

	field_set& field_set::bind(std::string text)
	{
		html = std::move(text);
		for(auto& entry : cache)
			entry.second = field_result();

		return *this;
	}

	bool field_set::contains(std::string const& name) const
	{
		return matchers.find(name) != matchers.end();
	}

	field_set::field_result& field_set::lookup(std::string const& name)
	{
		auto it = cache.find(name);
		if(it == cache.end())
			throw lookup_error("Unknown field '" + name + "'");

		field_result& result = it->second;
		if(result.state != field_result::S_UNRESOLVED)
			return result;

		boost::optional<std::string> found = matchers.at(name)->find(html);
		if(found)
		{
			result.state = field_result::S_VALUE;
			result.value = std::move(*found);
		}
		else
			result.state = field_result::S_NO_MATCH;

		return result;
	}

	boost::optional<std::string> field_set::get(std::string const& name)
	{
		field_result const& result = lookup(name);
		if(result.state == field_result::S_VALUE)
			return result.value;

		return boost::none;
	}

	field_set::values_t field_set::resolve_all()
	{
		values_t values;
		values.reserve(names.size());
		for(auto const& name : names)
			values.emplace_back(name, get(name));

		return values;
	}

	std::string field_set::apply_template(std::string const& tpl)
	{
		static const boost::regex match_placeholder("\\{#(.*?)#\\}", boost::regex::perl | boost::regex::no_mod_s);

		std::string result;
		auto last = tpl.begin();

		boost::sregex_iterator it(tpl.begin(), tpl.end(), match_placeholder), end;
		for(; it != end; ++it)
		{
			boost::smatch const& what = *it;
			result.append(last, what[0].first);
			last = what[0].second;

			boost::optional<std::string> value = get(what[1]);
			if(value)
				result.append(*value);
		}

		result.append(last, tpl.end());
		return result;
	}

	std::ostream& operator<<(std::ostream& os, field_set const& fs)
	{
		bool first = true;
		for(auto const& name : fs.names)
		{
			if(!first)
				os << '\n';
			first = false;

			field_set::field_result const& result = fs.cache.at(name);
			os << name << ": ";
			switch(result.state)
			{
			case field_set::field_result::S_UNRESOLVED:
				os << "<?>";
			break;
			case field_set::field_result::S_NO_MATCH:
				os << "None";
			break;
			case field_set::field_result::S_VALUE:
				os << result.value;
			break;
			}
		}

		return os;
	}
}
