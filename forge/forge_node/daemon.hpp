#pragma once

#include <forge/node/logging.hpp>
#include <forge/spv.hpp>

namespace forge_daemon
{
class daemon_config
{
public:
	daemon_config (boost::filesystem::path const &);
	bool deserialize_json (bool &, boost::property_tree::ptree &);
	void serialize_json (boost::property_tree::ptree &);
	bool upgrade_json (unsigned, boost::property_tree::ptree &);
	boost::filesystem::path data_path;
	forge::logging logging;
	forge::constants constants;
	// Public keys of the wallets allowed to hold a negative balance
	std::vector<forge::public_key> genesis;
	static unsigned constexpr json_version = 1;
};
}
