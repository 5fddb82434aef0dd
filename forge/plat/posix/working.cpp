#include <forge/node/working.hpp>

#include <pwd.h>
#include <sys/types.h>
#include <unistd.h>

#include <cstdlib>
#include <stdexcept>

namespace forge
{
boost::filesystem::path app_path ()
{
	boost::filesystem::path result;
	auto data_home (std::getenv ("XDG_DATA_HOME"));
	if (data_home != nullptr && *data_home != '\0')
	{
		result = data_home;
	}
	else
	{
		auto entry (getpwuid (getuid ()));
		if (entry == nullptr)
		{
			throw std::runtime_error ("Unable to determine the home directory of the current user");
		}
		result = entry->pw_dir;
	}
	return result;
}
}
