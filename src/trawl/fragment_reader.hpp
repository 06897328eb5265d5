#pragma once

#include <deque>
#include <exception>
#include <istream>
#include <string>
#include <vector>
#include <boost/optional.hpp>

#include <trawl/css_selector.hpp>
#include <trawl/fragment_extractor.hpp>
#include <trawl/html_tokenizer.hpp>

namespace trawl
{
	/* Pulls fragments out of a byte stream, one chunk at a time. The stream is
	 * only read when no extracted fragment is waiting, so a caller that stops
	 * early leaves the rest of the input untouched. The reader does not close
	 * the stream.
	 */
	class fragment_reader
	{
	public:
		typedef fragment_extractor::fragment_callback_t fragment_callback_t;

		static const size_t chunk_size = 65536;
		static const size_t grow_size = 256;

	private:
		std::istream& source;
		std::string charset;
		bool utf8;

		std::deque<std::string> ready;
		fragment_extractor extractor;
		html_tokenizer tokenizer;

		bool exhausted;
		bool read_failed;
		std::exception_ptr pending_error;

		std::string read_bytes(size_t n);
		bool convert(std::string const& data, std::string& out) const;
		std::string salvage(std::string const& data) const;
		std::string decode(std::string data);
		bool pump();

	public:
		fragment_reader(std::istream& source, css_selector const& selector, std::string const& charset = "UTF-8");

		fragment_reader(fragment_reader&) = delete;
		void operator=(fragment_reader&) = delete;

		/* Next fragment in document order, none once the input is exhausted.
		 * Errors found while scanning (nested matches, unbalanced markup) are
		 * thrown after the fragments preceding them have been returned.
		 */
		boost::optional<std::string> next();

		std::vector<std::string> collect();

		// True when reading the input failed; earlier fragments stay valid.
		bool failed() const { return read_failed; }

		static void parse(std::istream& is, css_selector const& selector, fragment_callback_t f, std::string const& charset = "UTF-8");
		static std::vector<std::string> parse(std::string const& src, css_selector const& selector);
	};
}
