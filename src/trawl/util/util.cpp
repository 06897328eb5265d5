#include <trawl/util/util.hpp>

#include <cstdlib>
#include <map>
#include <sstream>
#include <vector>
#include <boost/algorithm/string.hpp>
#include <boost/locale/encoding_utf.hpp>
#include <boost/regex.hpp>

namespace trawl
{
	static const std::string nbsp_utf8 = "\xC2\xA0";

	std::string util::sanitize(const std::string& str)
	{
		std::stringstream is(str);
		std::string result;

		while(is.peek() != std::char_traits<char>::eof())
		{
			std::string tmp;
			is >> tmp;

			if(tmp.empty())
				continue;

			if(!result.empty())
				result.append(" ");

			result.append(tmp);
		}

		return result;
	}

	std::set<std::string> util::split_classes(const std::string& value)
	{
		std::vector<std::string> parts;
		boost::algorithm::split(parts, value, boost::algorithm::is_space(), boost::algorithm::token_compress_on);

		std::set<std::string> result(parts.begin(), parts.end());
		result.erase("");
		return result;
	}

	std::string util::to_lower(std::string str)
	{
		boost::algorithm::to_lower(str, std::locale::classic());
		return str;
	}

	void util::str_replace(std::string& s, std::string const& search, std::string const& replace)
	{
		if(search.empty())
			return;

		for(size_t pos = 0; ; pos += replace.length())
		{
			pos = s.find(search, pos);
			if(pos == std::string::npos)
				break;

			s.erase(pos, search.length());
			s.insert(pos, replace);
		}
	}

	static std::string encode_utf8(char32_t code)
	{
		char32_t cp[] = { code };
		return boost::locale::conv::utf_to_utf<char>(cp, cp + 1);
	}

	static bool decode_numeric(std::string const& body, std::string& out)
	{
		// body is what follows "&#", e.g. "x27" or "39"
		if(body.empty())
			return false;

		bool hex = body[0] == 'x' || body[0] == 'X';
		std::string digits = hex ? body.substr(1) : body;
		if(digits.empty() || digits.size() > 8)
			return false;

		char* end = nullptr;
		unsigned long code = std::strtoul(digits.c_str(), &end, hex ? 16 : 10);
		if(*end != '\0')
			return false;

		if(code == 0 || code > 0x10FFFF || (code >= 0xD800 && code <= 0xDFFF))
			return false;

		out = encode_utf8(static_cast<char32_t>(code));
		return true;
	}

	static std::map<std::string, char32_t> make_entity_table()
	{
		// ISO 8859-1 entities, U+00A0 to U+00FF in order
		static const char* const latin1[] = {
			"nbsp", "iexcl", "cent", "pound", "curren", "yen", "brvbar", "sect",
			"uml", "copy", "ordf", "laquo", "not", "shy", "reg", "macr",
			"deg", "plusmn", "sup2", "sup3", "acute", "micro", "para", "middot",
			"cedil", "sup1", "ordm", "raquo", "frac14", "frac12", "frac34", "iquest",
			"Agrave", "Aacute", "Acirc", "Atilde", "Auml", "Aring", "AElig", "Ccedil",
			"Egrave", "Eacute", "Ecirc", "Euml", "Igrave", "Iacute", "Icirc", "Iuml",
			"ETH", "Ntilde", "Ograve", "Oacute", "Ocirc", "Otilde", "Ouml", "times",
			"Oslash", "Ugrave", "Uacute", "Ucirc", "Uuml", "Yacute", "THORN", "szlig",
			"agrave", "aacute", "acirc", "atilde", "auml", "aring", "aelig", "ccedil",
			"egrave", "eacute", "ecirc", "euml", "igrave", "iacute", "icirc", "iuml",
			"eth", "ntilde", "ograve", "oacute", "ocirc", "otilde", "ouml", "divide",
			"oslash", "ugrave", "uacute", "ucirc", "uuml", "yacute", "thorn", "yuml"
		};

		std::map<std::string, char32_t> table = {
			{"amp", U'&'}, {"lt", U'<'}, {"gt", U'>'}, {"quot", U'"'}, {"apos", U'\''},
			{"OElig", 0x152}, {"oelig", 0x153}, {"Scaron", 0x160}, {"scaron", 0x161},
			{"Yuml", 0x178}, {"fnof", 0x192}, {"circ", 0x2C6}, {"tilde", 0x2DC},
			{"ensp", 0x2002}, {"emsp", 0x2003}, {"thinsp", 0x2009},
			{"ndash", 0x2013}, {"mdash", 0x2014},
			{"lsquo", 0x2018}, {"rsquo", 0x2019}, {"sbquo", 0x201A},
			{"ldquo", 0x201C}, {"rdquo", 0x201D}, {"bdquo", 0x201E},
			{"dagger", 0x2020}, {"Dagger", 0x2021}, {"bull", 0x2022}, {"hellip", 0x2026},
			{"permil", 0x2030}, {"prime", 0x2032}, {"Prime", 0x2033},
			{"lsaquo", 0x2039}, {"rsaquo", 0x203A}, {"euro", 0x20AC}, {"trade", 0x2122},
			{"larr", 0x2190}, {"uarr", 0x2191}, {"rarr", 0x2192}, {"darr", 0x2193}
		};

		for(size_t i = 0; i < sizeof(latin1) / sizeof(latin1[0]); ++i)
			table[latin1[i]] = static_cast<char32_t>(0xA0 + i);

		return table;
	}

	std::string util::unescape_entities(const std::string& str)
	{
		static const boost::regex match_entity("&(#?[A-Za-z0-9]+);");
		static const std::map<std::string, char32_t> entities = make_entity_table();

		std::string result;
		result.reserve(str.size());

		auto last = str.begin();
		boost::sregex_iterator it(str.begin(), str.end(), match_entity), end;
		for(; it != end; ++it)
		{
			boost::smatch const& what = *it;
			result.append(last, what[0].first);
			last = what[0].second;

			std::string const name = what[1];
			std::string decoded;

			if(name[0] == '#')
			{
				if(decode_numeric(name.substr(1), decoded))
					result.append(decoded);
				else
					result.append(what[0].first, what[0].second);

				continue;
			}

			auto entity = entities.find(name);
			if(entity != entities.end())
				result.append(encode_utf8(entity->second));
			else
				result.append(what[0].first, what[0].second);
		}

		result.append(last, str.end());
		return result;
	}

	std::string util::strip_html(const std::string& str)
	{
		static const auto flags = boost::regex::perl | boost::regex::no_mod_s;
		static const boost::regex match_img(
			"<img [^>]*?(?:alt=\"([^\"]*?)\"[^>]*)?src=\"([^\"]*?)\"(?:[^>]*?alt=\"([^\"]*?)\")?[^>]*?/>", flags);
		static const boost::regex match_href("<a [^>]*href=\"([^\"]*?)\"[^>]*?>(.*?)</a>", flags);
		static const boost::regex match_br("<br[^>]*>|</p>", flags);
		static const boost::regex match_tags("<[^>]*>", flags);
		static const boost::regex match_crlf("[\\n\\r]{2,}", flags);

		std::string text = boost::regex_replace(str, match_img, "[IMG: $2, $1$3]");
		text = boost::regex_replace(text, match_href, "$2 ($1)");
		text = boost::regex_replace(text, match_br, std::string("\n"));
		text = boost::regex_replace(text, match_tags, "");
		text = boost::regex_replace(text, match_crlf, std::string("\n\n"));

		text = unescape_entities(text);
		str_replace(text, nbsp_utf8, " ");
		boost::algorithm::trim(text);
		return text;
	}
}
