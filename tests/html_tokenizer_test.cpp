#include <trawl/html_tokenizer.hpp>

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace trawl;

namespace {

std::vector<html_event> tokenize(std::vector<std::string> const& chunks)
{
	std::vector<html_event> events;
	html_tokenizer t([&](html_event const& ev) { events.push_back(ev); });

	for(auto const& chunk : chunks)
		t.feed(chunk);

	t.close();
	return events;
}

std::vector<html_event> tokenize(std::string const& html)
{
	return tokenize(std::vector<std::string>{html});
}

// Joins adjacent text events, chunking may split text anywhere.
std::vector<html_event> merged(std::vector<html_event> const& events)
{
	std::vector<html_event> result;
	for(auto const& ev : events)
	{
		if(ev.kind == html_event::TEXT && !result.empty() && result.back().kind == html_event::TEXT)
			result.back().raw += ev.raw;
		else
			result.push_back(ev);
	}

	return result;
}

std::string describe(std::vector<html_event> const& events)
{
	std::string out;
	for(auto const& ev : events)
	{
		switch(ev.kind)
		{
		case html_event::START_TAG:
			out += "S(" + ev.name + ")";
		break;
		case html_event::END_TAG:
			out += "E(" + ev.name + ")";
		break;
		case html_event::SELF_CLOSING_TAG:
			out += "C(" + ev.name + ")";
		break;
		case html_event::TEXT:
			out += "T(" + ev.raw + ")";
		break;
		}
	}

	return out;
}

}  // namespace

TEST(HtmlTokenizer, EmitsEventsInOrder)
{
	auto events = tokenize("<ul><li class=\"x\">A</li><br/></ul>");
	EXPECT_EQ(describe(events), "S(ul)S(li)T(A)E(li)C(br)E(ul)");
}

TEST(HtmlTokenizer, KeepsRawStartTag)
{
	auto events = tokenize("<A HREF='/x' Class=\"a  b\">t</A>");
	ASSERT_EQ(events.size(), 3u);
	EXPECT_EQ(events[0].name, "a");
	EXPECT_EQ(events[0].raw, "<A HREF='/x' Class=\"a  b\">");
	EXPECT_EQ(events[2].name, "a");
	EXPECT_EQ(events[2].raw, "</A>");
}

TEST(HtmlTokenizer, ParsesAttributes)
{
	auto events = tokenize("<input type=checkbox checked value=\"a &amp; b\" data-x = 'q>r'>");
	ASSERT_EQ(events.size(), 1u);
	auto const& atts = events[0].atts;
	ASSERT_EQ(atts.size(), 4u);
	EXPECT_EQ(atts[0], std::make_pair(std::string("type"), std::string("checkbox")));
	EXPECT_EQ(atts[1], std::make_pair(std::string("checked"), std::string()));
	EXPECT_EQ(atts[2], std::make_pair(std::string("value"), std::string("a & b")));
	EXPECT_EQ(atts[3], std::make_pair(std::string("data-x"), std::string("q>r")));
}

TEST(HtmlTokenizer, SelfClosingTagWithAttributes)
{
	auto events = tokenize("<img src=\"a.png\" alt=\"x\" />");
	ASSERT_EQ(events.size(), 1u);
	EXPECT_EQ(events[0].kind, html_event::SELF_CLOSING_TAG);
	ASSERT_EQ(events[0].atts.size(), 2u);
	EXPECT_EQ(events[0].atts[1].second, "x");
}

TEST(HtmlTokenizer, SkipsCommentsAndDeclarations)
{
	auto events = tokenize("<!DOCTYPE html><!-- <p>no</p> --><?xml x?><p>yes</p><![CDATA[ <b> ]]>");
	EXPECT_EQ(describe(events), "S(p)T(yes)E(p)");
}

TEST(HtmlTokenizer, ScriptContentIsRawText)
{
	auto events = merged(tokenize("<script>if(a<b && c>d) x='</p>';</SCRIPT><p>z</p>"));
	EXPECT_EQ(describe(events), "S(script)T(if(a<b && c>d) x='</p>';)E(script)S(p)T(z)E(p)");
}

TEST(HtmlTokenizer, LoneLessThanIsText)
{
	auto events = merged(tokenize("<p>1 < 2</p>"));
	EXPECT_EQ(describe(events), "S(p)T(1 < 2)E(p)");
}

TEST(HtmlTokenizer, SameEventsForAnyChunking)
{
	std::string const html =
		"<!-- c --><div class=\"a b\" data-v='1>2'>Hello <b>world</b><br/>"
		"<script>var s = '</div>';</script><img src=x.png></div>";

	std::string const expected = describe(merged(tokenize(html)));

	for(size_t size = 1; size <= html.size(); ++size)
	{
		std::vector<std::string> chunks;
		for(size_t i = 0; i < html.size(); i += size)
			chunks.push_back(html.substr(i, size));

		EXPECT_EQ(describe(merged(tokenize(chunks))), expected) << "chunk size " << size;
	}
}

TEST(HtmlTokenizer, UnfinishedTagAtEndIsDropped)
{
	auto events = tokenize("<p>a</p><div class=\"x");
	EXPECT_EQ(describe(events), "S(p)T(a)E(p)");
}

TEST(HtmlTokenizer, UnterminatedScriptIsFlushedAsText)
{
	auto events = merged(tokenize(std::vector<std::string>{"<script>var a", " = 1;"}));
	EXPECT_EQ(describe(events), "S(script)T(var a = 1;)");
}
