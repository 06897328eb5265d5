#pragma once

#include <string>

namespace trawl
{
	/* Status reports go to cerr, prefixed with the local time. Informational
	 * lines can be silenced, errors are always written.
	 */
	class logger
	{
		logger() = delete;
		logger(logger&) = delete;
		void operator=(logger&) = delete;

		static bool& silent_flag();

	public:
		static void set_silent(bool silent);
		static bool silent();

		static void info(std::string const& message);
		static void error(std::string const& message);
	};
}
