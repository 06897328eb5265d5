#pragma once

#include <functional>
#include <string>

#include <trawl/css_selector.hpp>

namespace trawl
{
	struct html_event
	{
		enum kind_e {
			START_TAG,
			END_TAG,
			SELF_CLOSING_TAG,
			TEXT
		};

		kind_e kind;
		std::string name; // lower-cased, empty for TEXT
		attributes_t atts;
		std::string raw; // source text of the token
	};

	/* Forward-only tokenizer. Text is fed in arbitrary chunks; every complete
	 * token is handed to the handler as soon as it is seen, an unfinished tag
	 * or comment at the end of a chunk is kept until the next feed.
	 */
	class html_tokenizer
	{
	public:
		typedef std::function<void(html_event const&)> handler_t;

	private:
		handler_t handler;
		std::string pending;
		std::string raw_text_tag; // set while inside <script> or <style>

		void emit_text(std::string::const_iterator first, std::string::const_iterator last);

		size_t consume_raw_text(size_t pos);
		size_t consume_markup(size_t pos);
		size_t consume_start_tag(size_t pos);
		size_t consume_end_tag(size_t pos);

		static attributes_t parse_attributes(std::string const& body);

	public:
		explicit html_tokenizer(handler_t handler);

		html_tokenizer(html_tokenizer&) = delete;
		void operator=(html_tokenizer&) = delete;

		void feed(std::string const& chunk);

		// Flushes trailing text. An unfinished tag is dropped.
		void close();
	};
}
