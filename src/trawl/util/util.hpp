#pragma once

#include <set>
#include <string>

namespace trawl
{
	class util
	{
		util() = delete;
		util(util&) = delete;
		void operator=(util&) = delete;

	public:
		// Collapses every whitespace run to a single space and trims both ends.
		static std::string sanitize(const std::string& str);

		static std::set<std::string> split_classes(const std::string& value);
		static std::string to_lower(std::string str);

		static void str_replace(std::string& s, std::string const& search, std::string const& replace);

		/* Decodes &amp; &lt; &gt; &quot; &apos; &nbsp; and numeric references.
		 * Unknown entities are kept as written.
		 */
		static std::string unescape_entities(const std::string& str);

		/* Converts an HTML snippet into plain text: images and links keep their
		 * target in the text, line breaks and paragraphs become newlines.
		 */
		static std::string strip_html(const std::string& str);
	};
}
