#pragma once

#include <map>
#include <utility>
#include <memory>
#include <ostream>
#include <string>
#include <vector>
#include <boost/optional.hpp>

#include <trawl/field_matcher.hpp>

namespace trawl
{
	/* Named field matchers bound to one fragment at a time. Every field is
	 * looked up lazily and at most once per binding. Templates refer to
	 * fields as {#name#}.
	 */
	class field_set
	{
	public:
		typedef std::shared_ptr<const field_matcher> matcher_ptr;
		typedef std::vector<std::pair<std::string, boost::optional<std::string>>> values_t;

	private:
		struct field_result
		{
			enum state_e {
				S_UNRESOLVED,
				S_NO_MATCH,
				S_VALUE
			};

			state_e state = S_UNRESOLVED;
			std::string value;
		};

		std::vector<std::string> names;
		std::map<std::string, matcher_ptr> matchers;
		std::map<std::string, field_result> cache;
		std::string html;

		field_result& lookup(std::string const& name);

	public:
		field_set();
		field_set(std::vector<std::pair<std::string, std::string>> const& fields, bool cleanup = true);

		void add(std::string const& name, std::string const& regex, bool cleanup = true);
		void add(std::string const& name, matcher_ptr matcher);

		// Adds a field written as "name:regex".
		void add_spec(std::string const& spec, bool cleanup = true);
		static std::pair<std::string, std::string> split_spec(std::string const& spec);

		field_set& bind(std::string text);
		std::string const& text() const { return html; }

		std::vector<std::string> const& keys() const { return names; }
		bool contains(std::string const& name) const;

		boost::optional<std::string> get(std::string const& name);
		boost::optional<std::string> operator[](std::string const& name) { return get(name); }

		values_t resolve_all();

		std::string apply_template(std::string const& tpl);

		friend std::ostream& operator<<(std::ostream& os, field_set const& fs);
	};
}
