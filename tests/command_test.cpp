#include <trawl/cli/command.hpp>

#include <gtest/gtest.h>

#include <cstdlib>
#include <sstream>
#include <string>

using namespace trawl;

namespace {

std::string const listing =
	"<html><body><ul class=\"rows\">\n"
	"<li class=\"result-row\"><a href=\"/boat/1\">Canoe</a> <span class=\"result-price\">$300</span></li>\n"
	"<li class=\"result-row\"><a href=\"/boat/2\">Kayak</a></li>\n"
	"</ul></body></html>\n";

recipe make_recipe(std::string const& selector)
{
	recipe opt;
	opt.selector = selector;
	opt.silent = true;
	return opt;
}

int run_on(recipe const& opt, std::string const& html, std::string& output)
{
	std::istringstream in(html);
	std::ostringstream out;
	int status = run(opt, in, out);
	output = out.str();
	return status;
}

}  // namespace

TEST(Command, RawFragmentsAsJson)
{
	recipe opt = make_recipe("li");

	std::string output;
	ASSERT_EQ(run_on(opt, "<ul><li>a</li><li>\"b\"</li></ul>", output), EXIT_SUCCESS);
	EXPECT_EQ(output, "[\"<li>a</li>\",\"<li>\\\"b\\\"</li>\"]\n");
}

TEST(Command, FieldsAsJsonObjects)
{
	recipe opt = make_recipe("li.result-row");
	opt.fields = {
		"url:<a href=\"([^\"]*)\"",
		"price:<span class=\"result-price\">([\\s\\S]*?)</span>",
	};

	std::string output;
	ASSERT_EQ(run_on(opt, listing, output), EXIT_SUCCESS);
	EXPECT_EQ(output, "[{\"price\":\"$300\",\"url\":\"/boat/1\"},{\"price\":null,\"url\":\"/boat/2\"}]\n");
}

TEST(Command, TemplateLinesInReverse)
{
	recipe opt = make_recipe("li.result-row");
	opt.fields = {"url:<a href=\"([^\"]*)\"", "title:<a [^>]*>(.*?)</a>"};
	opt.tpl = std::string("{#title#} ({#url#})");
	opt.reverse = true;

	std::string output;
	ASSERT_EQ(run_on(opt, listing, output), EXIT_SUCCESS);
	EXPECT_EQ(output, "Kayak (/boat/2)\nCanoe (/boat/1)\n");
}

TEST(Command, TemplateWithUnknownFieldFails)
{
	recipe opt = make_recipe("li.result-row");
	opt.fields = {"title:<a [^>]*>(.*?)</a>"};
	opt.tpl = std::string("{#title#}: {#missing#}");

	std::string output;
	EXPECT_EQ(run_on(opt, listing, output), EXIT_FAILURE);
	EXPECT_EQ(output, "");
}

TEST(Command, PlainFieldValues)
{
	recipe opt = make_recipe("div.post");
	opt.fields = {"body:<div class=\"post\">([\\s\\S]*)</div>"};
	opt.plain = true;
	opt.tpl = std::string("{#body#}");

	std::string output;
	ASSERT_EQ(run_on(opt, "<div class=\"post\"><p>Fish &amp; <a href=\"/c\">chips</a></p></div>", output), EXIT_SUCCESS);
	EXPECT_EQ(output, "Fish & chips (/c)\n");
}

TEST(Command, InvalidSelectorFails)
{
	recipe opt = make_recipe("ul li");

	std::string output;
	EXPECT_EQ(run_on(opt, listing, output), EXIT_FAILURE);
}

TEST(Command, FieldWithoutNameFails)
{
	recipe opt = make_recipe("li");
	opt.fields = {"<a href=\"(.*?)\">"};

	std::string output;
	EXPECT_EQ(run_on(opt, listing, output), EXIT_FAILURE);
}

TEST(Command, NestedMatchFails)
{
	recipe opt = make_recipe("div");

	std::string output;
	EXPECT_EQ(run_on(opt, "<div><div></div></div>", output), EXIT_FAILURE);
}

TEST(Command, RegexTooComplexToMatchFails)
{
	recipe opt = make_recipe("p");
	opt.fields = {"x:((a*)*)*b"};

	std::string output;
	EXPECT_EQ(run_on(opt, "<p>" + std::string(40, 'a') + "c</p>", output), EXIT_FAILURE);
	EXPECT_EQ(output, "");
}
