#pragma once

#include <functional>
#include <string>
#include <vector>

#include <trawl/css_selector.hpp>
#include <trawl/html_tokenizer.hpp>

namespace trawl
{
	/* Isolates every element matching a selector, together with all of its
	 * descendants, without building a document tree. Only an explicit stack of
	 * open tag names is kept. Matches may not be nested in each other.
	 */
	class fragment_extractor
	{
	public:
		typedef std::function<void(std::string)> fragment_callback_t;

	private:
		css_selector selector;
		fragment_callback_t callback;

		std::vector<std::string> stack;
		bool matching;
		size_t target_depth;
		std::string buffer;

		void close_tag(std::string const& tag);

	public:
		fragment_extractor(css_selector const& selector, fragment_callback_t callback);

		fragment_extractor(fragment_extractor&) = delete;
		void operator=(fragment_extractor&) = delete;

		void handle(html_event const& ev);

		/* End of input. Returns true when an unterminated match was dropped;
		 * partial fragments are never emitted.
		 */
		bool finish();

		std::string const& selector_str() const { return selector.str(); }
		size_t depth() const { return stack.size(); }
		bool inside_match() const { return matching; }
	};
}
