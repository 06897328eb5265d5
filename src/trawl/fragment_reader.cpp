#include <trawl/fragment_reader.hpp>

#include <sstream>
#include <boost/algorithm/string.hpp>
#include <boost/locale/encoding.hpp>
#include <boost/locale/encoding_utf.hpp>

#include <trawl/error.hpp>
#include <trawl/util/logger.hpp>

namespace trawl
{
	const size_t fragment_reader::chunk_size;
	const size_t fragment_reader::grow_size;

	static bool is_utf8(std::string charset)
	{
		boost::algorithm::to_lower(charset);
		boost::algorithm::erase_all(charset, "-");
		return charset == "utf8";
	}

	fragment_reader::fragment_reader(std::istream& _source, css_selector const& selector, std::string const& _charset)
	: source(_source)
	, charset(_charset)
	, utf8(is_utf8(_charset))
	, ready()
	, extractor(selector, [this](std::string fragment) { ready.push_back(std::move(fragment)); })
	, tokenizer([this](html_event const& ev) { extractor.handle(ev); })
	, exhausted(false)
	, read_failed(false)
	, pending_error()
	{
		if(utf8)
			return;

		try
		{
			boost::locale::conv::to_utf<char>("a", charset, boost::locale::conv::stop);
		} catch(boost::locale::conv::invalid_charset_error const&)
		{
			throw configuration_error("Unknown charset \"" + charset + "\"");
		}
	}

	std::string fragment_reader::read_bytes(size_t n)
	{
		if(read_failed)
			return std::string();

		std::string buf(n, '\0');

		try
		{
			source.read(&buf[0], n);
		} catch(std::ios_base::failure const& e)
		{
			// Streams with exceptions enabled also throw on a plain end of file
			if(source.bad() || !source.eof())
			{
				logger::error(std::string("Reading input failed: ") + e.what());
				read_failed = true;
				return std::string();
			}
		}

		if(source.bad())
		{
			logger::error("Reading input failed");
			read_failed = true;
			return std::string();
		}

		buf.resize(static_cast<size_t>(source.gcount()));
		return buf;
	}

	bool fragment_reader::convert(std::string const& data, std::string& out) const
	{
		try
		{
			if(utf8)
				out = boost::locale::conv::utf_to_utf<char>(data, boost::locale::conv::stop);
			else
				out = boost::locale::conv::to_utf<char>(data, charset, boost::locale::conv::stop);
		} catch(boost::locale::conv::conversion_error const&)
		{
			return false;
		}

		return true;
	}

	std::string fragment_reader::salvage(std::string const& data) const
	{
		// Invalid UTF-8 passes through; other charsets lose only the bad bytes
		if(utf8)
			return data;

		return boost::locale::conv::to_utf<char>(data, charset, boost::locale::conv::skip);
	}

	std::string fragment_reader::decode(std::string data)
	{
		std::string out;
		while(!convert(data, out))
		{
			// Only a sequence cut at the end of the window is worth waiting for
			bool cut = false;
			for(size_t tail = 1; tail <= 3 && tail < data.size() && !cut; ++tail)
				cut = convert(data.substr(0, data.size() - tail), out);

			if(!cut)
				return salvage(data);

			std::string extra = read_bytes(grow_size);
			if(extra.empty())
				return salvage(data);

			data.append(extra);
		}

		return out;
	}

	bool fragment_reader::pump()
	{
		if(exhausted)
			return false;

		try
		{
			std::string data = read_bytes(chunk_size);
			if(data.empty())
			{
				exhausted = true;
				if(read_failed)
					return false;

				tokenizer.close();
				if(extractor.finish())
					logger::info("Dropped unterminated match for \"" + extractor.selector_str() + "\" at end of input");

				return false;
			}

			tokenizer.feed(decode(std::move(data)));
		} catch(...)
		{
			// Raised from next() once the fragments found before it are delivered
			exhausted = true;
			pending_error = std::current_exception();
			return false;
		}

		return true;
	}

	boost::optional<std::string> fragment_reader::next()
	{
		while(ready.empty() && pump())
			;

		if(ready.empty())
		{
			if(pending_error)
			{
				std::exception_ptr e = pending_error;
				pending_error = nullptr;
				std::rethrow_exception(e);
			}

			return boost::none;
		}

		std::string fragment(std::move(ready.front()));
		ready.pop_front();
		return fragment;
	}

	std::vector<std::string> fragment_reader::collect()
	{
		std::vector<std::string> result;
		while(auto fragment = next())
			result.push_back(std::move(*fragment));

		return result;
	}

	void fragment_reader::parse(std::istream& is, css_selector const& selector, fragment_callback_t f, std::string const& charset)
	{
		fragment_reader reader(is, selector, charset);
		while(auto fragment = reader.next())
			f(std::move(*fragment));
	}

	std::vector<std::string> fragment_reader::parse(std::string const& src, css_selector const& selector)
	{
		std::istringstream ss(src);
		fragment_reader reader(ss, selector);
		return reader.collect();
	}
}
