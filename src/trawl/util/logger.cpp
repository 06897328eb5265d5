#include <trawl/util/logger.hpp>

#include <iostream>
#include <boost/date_time/posix_time/posix_time.hpp>

namespace trawl
{
	static std::string timestamp()
	{
		return boost::posix_time::to_simple_string(boost::posix_time::second_clock::local_time());
	}

	bool& logger::silent_flag()
	{
		static bool flag = false;
		return flag;
	}

	void logger::set_silent(bool silent)
	{
		silent_flag() = silent;
	}

	bool logger::silent()
	{
		return silent_flag();
	}

	void logger::info(std::string const& message)
	{
		if(silent_flag())
			return;

		std::cerr << timestamp() << ' ' << message << std::endl;
	}

	void logger::error(std::string const& message)
	{
		std::cerr << timestamp() << " [ERROR] " << message << std::endl;
	}
}
