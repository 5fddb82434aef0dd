#pragma once

#include <boost/filesystem.hpp>

namespace forge
{
// $XDG_DATA_HOME if set, otherwise the home directory of the current user
boost::filesystem::path app_path ();
}
