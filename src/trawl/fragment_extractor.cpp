#include <trawl/fragment_extractor.hpp>

#include <algorithm>
#include <iterator>

#include <trawl/error.hpp>

namespace trawl
{
	fragment_extractor::fragment_extractor(css_selector const& _selector, fragment_callback_t _callback)
	: selector(_selector)
	, callback(_callback)
	, stack()
	, matching(false)
	, target_depth(0)
	, buffer()
	{}

	void fragment_extractor::handle(html_event const& ev)
	{
		switch(ev.kind)
		{
		case html_event::START_TAG:
			stack.push_back(ev.name);
			if(selector.matches(ev.name, ev.atts))
			{
				if(matching)
					throw nested_match_error(selector.str());

				matching = true;
				target_depth = stack.size() - 1;
			}

			if(matching)
				buffer.append(ev.raw);
		break;
		case html_event::SELF_CLOSING_TAG:
			// Opened and closed at the same level
			if(matching)
				buffer.append(ev.raw);
		break;
		case html_event::TEXT:
			if(matching)
				buffer.append(ev.raw);
		break;
		case html_event::END_TAG:
			close_tag(ev.name);
		break;
		}
	}

	void fragment_extractor::close_tag(std::string const& tag)
	{
		auto it = std::find(stack.rbegin(), stack.rend(), tag);
		if(it == stack.rend())
			throw unbalanced_markup_error(tag);

		if(matching)
			buffer.append("</" + tag + ">");

		// Drops unclosed tags above it, e.g. <img> not written as <img/>
		stack.erase(std::prev(it.base()), stack.end());

		if(!matching || stack.size() > target_depth)
			return;

		matching = false;
		if(stack.size() < target_depth)
		{
			// An ancestor closed before the matched element did
			buffer.clear();
			return;
		}

		if(!buffer.empty())
		{
			std::string fragment;
			fragment.swap(buffer);
			callback(std::move(fragment));
		}
	}

	bool fragment_extractor::finish()
	{
		bool const dropped = matching;

		matching = false;
		buffer.clear();
		stack.clear();

		return dropped;
	}
}
