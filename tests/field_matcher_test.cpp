#include <trawl/error.hpp>
#include <trawl/field_matcher.hpp>

#include <gtest/gtest.h>
#include <boost/optional/optional_io.hpp>

#include <cctype>
#include <string>

using namespace trawl;

namespace {

bool follows_cleanup_law(std::string const& s)
{
	if(s.empty())
		return true;

	auto space = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
	if(space(s.front()) || space(s.back()))
		return false;

	for(size_t i = 1; i < s.size(); ++i)
		if(space(s[i - 1]) && space(s[i]))
			return false;

	return true;
}

}  // namespace

TEST(FieldMatcher, ReturnsFirstGroup)
{
	field_matcher m("<a href=\"([^\"]*)\">(.*?)</a>");
	EXPECT_EQ(m.find("<p><a href=\"/x\">X</a><a href=\"/y\">Y</a></p>"), boost::optional<std::string>("/x"));
}

TEST(FieldMatcher, NoMatchIsNone)
{
	field_matcher m("<a xref=\"([\\s\\S]*?)\"");
	EXPECT_FALSE(m.find("<a href=\"/x\">"));
}

TEST(FieldMatcher, CleanupCollapsesWhitespace)
{
	field_matcher m("<h3>([\\s\\S]*?)</h3>");
	EXPECT_EQ(m.find("<h3>\n\t  Hello \r\n  world\t</h3>"), boost::optional<std::string>("Hello world"));
}

TEST(FieldMatcher, WithoutCleanupKeepsRawCapture)
{
	field_matcher m("<h3>([\\s\\S]*?)</h3>", false);
	EXPECT_EQ(m.find("<h3>\n Hello\n</h3>"), boost::optional<std::string>("\n Hello\n"));
}

TEST(FieldMatcher, DotDoesNotCrossLines)
{
	field_matcher m("<p>(.*?)</p>");
	EXPECT_FALSE(m.find("<p>one\ntwo</p>"));
}

TEST(FieldMatcher, UnmatchedOptionalGroupIsEmpty)
{
	field_matcher m("<b>(x)?</b>");
	EXPECT_EQ(m.find("<b></b>"), boost::optional<std::string>(""));
}

TEST(FieldMatcher, CleanupLawHolds)
{
	field_matcher m("^([\\s\\S]*)$");
	char const* inputs[] = {
		"", " ", "\n\n", "a", " a ", "a  b", "\ta\r\n\tb\n", "x \f\v y", "  many   gaps   here  ",
	};

	for(char const* input : inputs)
	{
		auto value = m.find(input);
		ASSERT_TRUE(value) << input;
		EXPECT_TRUE(follows_cleanup_law(*value)) << "'" << *value << "'";
	}
}

TEST(FieldMatcher, RejectsInvalidRegex)
{
	EXPECT_THROW(field_matcher("<a href=\"(["), configuration_error);
}

TEST(FieldMatcher, RejectsRegexWithoutGroup)
{
	EXPECT_THROW(field_matcher("<a href=\"[^\"]*\">"), configuration_error);
	EXPECT_THROW(field_matcher("(?:x)"), configuration_error);
}

TEST(PlainFieldMatcher, StripsMarkup)
{
	plain_field_matcher m("<div>([\\s\\S]*?)</div>");
	EXPECT_EQ(m.find("<div><a href=\"/u\">User</a> says &amp;<br>hi</div>"),
		boost::optional<std::string>("User (/u) says & hi"));
}

TEST(PlainFieldMatcher, KeepsLineBreaksWithoutCleanup)
{
	plain_field_matcher m("<div>([\\s\\S]*?)</div>", false);
	EXPECT_EQ(m.find("<div><p>one</p><p>two</p></div>"), boost::optional<std::string>("one\ntwo"));
}
