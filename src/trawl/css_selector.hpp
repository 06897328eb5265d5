#pragma once

#include <string>
#include <utility>
#include <vector>

namespace trawl
{
	typedef std::vector<std::pair<std::string, std::string>> attributes_t;

	/* Limited CSS selector: a single tag with any number of classes, as in
	 * "article", ".entry" or "li.result-row.active". Combinators are rejected.
	 */
	class css_selector
	{
	private:
		std::string text;
		std::string tag;
		std::vector<std::string> classes;

	public:
		explicit css_selector(std::string const& selector);

		bool matches(std::string const& tag_name, attributes_t const& atts) const;

		std::string const& str() const { return text; }
		std::string const& tag_name() const { return tag; }
		std::vector<std::string> const& required_classes() const { return classes; }
	};
}
