#include <trawl/cli/command.hpp>

#include <algorithm>
#include <cstdlib>
#include <memory>
#include <stdexcept>
#include <jsoncpp/json/json.h>

#include <trawl/css_selector.hpp>
#include <trawl/error.hpp>
#include <trawl/field_set.hpp>
#include <trawl/fragment_reader.hpp>
#include <trawl/util/logger.hpp>

namespace trawl
{
	static void add_fields(field_set& fields, recipe const& opt)
	{
		for(auto const& spec : opt.fields)
		{
			auto field = field_set::split_spec(spec);
			if(opt.plain)
				fields.add(field.first, std::make_shared<const plain_field_matcher>(field.second, !opt.keep_whitespace));
			else
				fields.add(field.first, field.second, !opt.keep_whitespace);
		}
	}

	static void write_json(std::ostream& out, Json::Value const& root)
	{
		Json::StreamWriterBuilder builder;
		builder["indentation"] = "";

		std::unique_ptr<Json::StreamWriter> writer(builder.newStreamWriter());
		writer->write(root, &out);
		out << std::endl;
	}

	static Json::Value to_json(field_set::values_t const& values)
	{
		Json::Value obj(Json::objectValue);
		for(auto const& kvp : values)
			obj[kvp.first] = kvp.second ? Json::Value(*kvp.second) : Json::Value();

		return obj;
	}

	int run(recipe const& opt, std::istream& in, std::ostream& out)
	{
		logger::set_silent(opt.silent);

		try
		{
			css_selector selector(opt.selector);

			field_set fields;
			add_fields(fields, opt);

			fragment_reader reader(in, selector, opt.charset);
			size_t count = 0;

			if(opt.tpl && !opt.reverse)
			{
				// Nothing to reorder, render while reading
				while(auto fragment = reader.next())
				{
					out << fields.bind(std::move(*fragment)).apply_template(*opt.tpl) << std::endl;
					count++;
				}
			}
			else
			{
				std::vector<std::string> fragments(reader.collect());
				count = fragments.size();

				if(opt.reverse)
					std::reverse(fragments.begin(), fragments.end());

				if(opt.tpl)
				{
					for(auto& fragment : fragments)
						out << fields.bind(std::move(fragment)).apply_template(*opt.tpl) << std::endl;
				}
				else
				{
					Json::Value root(Json::arrayValue);
					for(auto& fragment : fragments)
					{
						if(fields.keys().empty())
							root.append(Json::Value(fragment));
						else
							root.append(to_json(fields.bind(std::move(fragment)).resolve_all()));
					}

					write_json(out, root);
				}
			}

			logger::info("Extracted " + std::to_string(count) + " fragments matching \"" + selector.str() + "\"");

			return reader.failed() ? EXIT_FAILURE : EXIT_SUCCESS;
		} catch(configuration_error const& e)
		{
			logger::error(e.what());
		} catch(unbalanced_markup_error const& e)
		{
			logger::error(std::string("Malformed input: ") + e.what());
		} catch(lookup_error const& e)
		{
			logger::error(std::string("Did you forget a field name? ") + e.what());
		} catch(nested_match_error const& e)
		{
			logger::error(e.what());
		} catch(std::runtime_error const& e)
		{
			// e.g. a field regex too complex to match
			logger::error(e.what());
		}

		return EXIT_FAILURE;
	}
}
