#pragma once

#include <string>
#include <boost/optional.hpp>
#include <boost/regex.hpp>

namespace trawl
{
	/* One regex whose first capture group is the extracted value. Use
	 * "[\s\S]*?" to match across lines. With cleanup enabled every whitespace
	 * run, newlines included, becomes a single space and the value is trimmed.
	 */
	class field_matcher
	{
	private:
		std::string pattern;
		boost::regex rgx;
		bool cleanup;

	public:
		field_matcher(std::string const& regex, bool cleanup = true);
		virtual ~field_matcher() = default;

		virtual boost::optional<std::string> find(std::string const& text) const;

		std::string const& str() const { return pattern; }
		bool cleans_up() const { return cleanup; }
	};

	// Like field_matcher, but reduces the captured markup to plain text first.
	class plain_field_matcher : public field_matcher
	{
	private:
		bool plain_cleanup;

	public:
		plain_field_matcher(std::string const& regex, bool cleanup = true);

		boost::optional<std::string> find(std::string const& text) const override;
	};
}
