#include <trawl/html_tokenizer.hpp>

#include <cctype>

#include <trawl/util/util.hpp>

namespace trawl
{
	static const size_t need_more = std::string::npos;

	static bool is_space(char c)
	{
		return std::isspace(static_cast<unsigned char>(c)) != 0;
	}

	static bool is_name_start(char c)
	{
		return std::isalpha(static_cast<unsigned char>(c)) != 0;
	}

	// True when the rest of s, starting at pos, is a strict prefix of literal.
	static bool could_become(std::string const& s, size_t pos, std::string const& literal)
	{
		size_t const remaining = s.size() - pos;
		return remaining < literal.size() && s.compare(pos, remaining, literal, 0, remaining) == 0;
	}

	static bool starts_with_at(std::string const& s, size_t pos, std::string const& literal)
	{
		return s.compare(pos, literal.size(), literal) == 0;
	}

	static size_t ifind(std::string const& haystack, std::string const& needle, size_t from)
	{
		for(size_t i = from; i + needle.size() <= haystack.size(); ++i)
		{
			size_t j = 0;
			while(j < needle.size() && std::tolower(static_cast<unsigned char>(haystack[i + j])) == needle[j])
				++j;

			if(j == needle.size())
				return i;
		}

		return std::string::npos;
	}

	html_tokenizer::html_tokenizer(handler_t _handler)
	: handler(_handler)
	, pending()
	, raw_text_tag()
	{}

	void html_tokenizer::emit_text(std::string::const_iterator first, std::string::const_iterator last)
	{
		if(first == last)
			return;

		html_event ev;
		ev.kind = html_event::TEXT;
		ev.raw.assign(first, last);
		handler(ev);
	}

	void html_tokenizer::feed(std::string const& chunk)
	{
		pending.append(chunk);

		size_t pos = 0;
		while(pos < pending.size())
		{
			size_t next;

			if(!raw_text_tag.empty())
				next = consume_raw_text(pos);
			else if(pending[pos] == '<')
				next = consume_markup(pos);
			else
			{
				next = pending.find('<', pos);
				if(next == std::string::npos)
					next = pending.size();

				emit_text(pending.begin() + pos, pending.begin() + next);
			}

			if(next == need_more)
				break;

			pos = next;
		}

		pending.erase(0, pos);
	}

	void html_tokenizer::close()
	{
		if(!raw_text_tag.empty() || pending == "<")
			emit_text(pending.begin(), pending.end());

		pending.clear();
		raw_text_tag.clear();
	}

	size_t html_tokenizer::consume_raw_text(size_t pos)
	{
		std::string const closing = "</" + raw_text_tag;

		size_t search = pos;
		while(true)
		{
			size_t i = ifind(pending, closing, search);
			if(i == std::string::npos)
			{
				// Hold back a tail that might be the start of the closing tag
				size_t safe = pending.size() > closing.size() ? pending.size() - closing.size() : 0;
				if(safe <= pos)
					return need_more;

				emit_text(pending.begin() + pos, pending.begin() + safe);
				return safe;
			}

			size_t after = i + closing.size();
			if(after >= pending.size())
			{
				if(i <= pos)
					return need_more;

				emit_text(pending.begin() + pos, pending.begin() + i);
				return i;
			}

			char c = pending[after];
			if(c == '>' || c == '/' || is_space(c))
			{
				emit_text(pending.begin() + pos, pending.begin() + i);
				raw_text_tag.clear();
				return i;
			}

			search = i + 1;
		}
	}

	size_t html_tokenizer::consume_markup(size_t pos)
	{
		static const std::string comment_open = "<!--";
		static const std::string cdata_open = "<![CDATA[";

		if(pos + 1 >= pending.size())
			return need_more;

		auto skip_past = [&](size_t from, std::string const& terminator) -> size_t {
			size_t i = pending.find(terminator, from);
			return i == std::string::npos ? need_more : i + terminator.size();
		};

		char c = pending[pos + 1];
		switch(c)
		{
		case '!':
			if(starts_with_at(pending, pos, comment_open))
				return skip_past(pos + comment_open.size(), "-->");
			if(starts_with_at(pending, pos, cdata_open))
				return skip_past(pos + cdata_open.size(), "]]>");
			if(could_become(pending, pos, comment_open) || could_become(pending, pos, cdata_open))
				return need_more;
			return skip_past(pos + 2, ">");
		case '?':
			return skip_past(pos + 2, ">");
		case '/':
			return consume_end_tag(pos);
		default:
			if(is_name_start(c))
				return consume_start_tag(pos);

			// A lone '<' is ordinary text
			emit_text(pending.begin() + pos, pending.begin() + pos + 1);
			return pos + 1;
		}
	}

	size_t html_tokenizer::consume_end_tag(size_t pos)
	{
		if(pos + 2 >= pending.size())
			return need_more;

		size_t close = pending.find('>', pos + 2);
		if(close == std::string::npos)
			return need_more;

		// "</>" and "</ ...>" carry no tag
		if(!is_name_start(pending[pos + 2]))
			return close + 1;

		size_t name_end = pos + 2;
		while(name_end < close && !is_space(pending[name_end]) && pending[name_end] != '/')
			++name_end;

		html_event ev;
		ev.kind = html_event::END_TAG;
		ev.name = util::to_lower(pending.substr(pos + 2, name_end - pos - 2));
		ev.raw = pending.substr(pos, close + 1 - pos);
		handler(ev);

		return close + 1;
	}

	size_t html_tokenizer::consume_start_tag(size_t pos)
	{
		size_t end = std::string::npos;
		char quote = 0;
		char last_significant = 0;

		for(size_t i = pos + 1; i < pending.size(); ++i)
		{
			char c = pending[i];
			if(quote)
			{
				if(c == quote)
					quote = 0;
				continue;
			}

			if(c == '>')
			{
				end = i;
				break;
			}

			// Quotes only open a value directly after '='
			if((c == '"' || c == '\'') && last_significant == '=')
				quote = c;

			if(!is_space(c))
				last_significant = c;
		}

		if(end == std::string::npos)
			return need_more;

		std::string inner = pending.substr(pos + 1, end - pos - 1);

		size_t name_end = 0;
		while(name_end < inner.size() && !is_space(inner[name_end]) && inner[name_end] != '/')
			++name_end;

		html_event ev;
		ev.name = util::to_lower(inner.substr(0, name_end));
		ev.raw = pending.substr(pos, end + 1 - pos);

		std::string body = inner.substr(name_end);
		if(!inner.empty() && inner.back() == '/')
		{
			ev.kind = html_event::SELF_CLOSING_TAG;
			if(!body.empty())
				body.pop_back();
		}
		else
			ev.kind = html_event::START_TAG;

		ev.atts = parse_attributes(body);
		handler(ev);

		if(ev.kind == html_event::START_TAG && (ev.name == "script" || ev.name == "style"))
			raw_text_tag = ev.name;

		return end + 1;
	}

	attributes_t html_tokenizer::parse_attributes(std::string const& body)
	{
		attributes_t atts;

		size_t i = 0;
		size_t const n = body.size();
		while(i < n)
		{
			while(i < n && (is_space(body[i]) || body[i] == '/'))
				++i;

			if(i >= n)
				break;

			size_t start = i;
			while(i < n && !is_space(body[i]) && body[i] != '=' && body[i] != '/')
				++i;

			if(i == start)
				++i; // stray '='

			std::string name = util::to_lower(body.substr(start, i - start));
			std::string value;

			size_t j = i;
			while(j < n && is_space(body[j]))
				++j;

			if(j < n && body[j] == '=')
			{
				++j;
				while(j < n && is_space(body[j]))
					++j;

				if(j < n && (body[j] == '"' || body[j] == '\''))
				{
					size_t close = body.find(body[j], j + 1);
					if(close == std::string::npos)
						close = n;

					value = body.substr(j + 1, close - j - 1);
					i = close < n ? close + 1 : n;
				}
				else
				{
					size_t value_start = j;
					while(j < n && !is_space(body[j]))
						++j;

					value = body.substr(value_start, j - value_start);
					i = j;
				}

				value = util::unescape_entities(value);
			}

			atts.emplace_back(name, value);
		}

		return atts;
	}
}
