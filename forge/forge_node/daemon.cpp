#include <forge/forge_node/daemon.hpp>

unsigned constexpr forge_daemon::daemon_config::json_version;

forge_daemon::daemon_config::daemon_config (boost::filesystem::path const & data_path_a) :
data_path (data_path_a),
genesis ({ forge::genesis_public_key })
{
}

void forge_daemon::daemon_config::serialize_json (boost::property_tree::ptree & tree_a)
{
	tree_a.put ("version", std::to_string (json_version));
	boost::property_tree::ptree logging_l;
	logging.serialize_json (logging_l);
	tree_a.add_child ("logging", logging_l);
	boost::property_tree::ptree constants_l;
	constants.serialize_json (constants_l);
	tree_a.add_child ("constants", constants_l);
	boost::property_tree::ptree genesis_l;
	for (auto & i : genesis)
	{
		boost::property_tree::ptree entry;
		entry.put ("", i.to_string ());
		genesis_l.push_back (std::make_pair ("", entry));
	}
	tree_a.add_child ("genesis", genesis_l);
}

bool forge_daemon::daemon_config::upgrade_json (unsigned version_a, boost::property_tree::ptree & tree_a)
{
	auto result (false);
	switch (version_a)
	{
		case 1:
			break;
		default:
			throw std::runtime_error ("Unknown daemon_config version");
	}
	return result;
}

bool forge_daemon::daemon_config::deserialize_json (bool & upgraded_a, boost::property_tree::ptree & tree_a)
{
	auto error (false);
	try
	{
		if (!tree_a.empty ())
		{
			auto version_l (tree_a.get_optional<std::string> ("version"));
			if (!version_l)
			{
				tree_a.put ("version", "1");
				version_l = "1";
				upgraded_a = true;
			}
			upgraded_a |= upgrade_json (std::stoull (version_l.get ()), tree_a);
			auto & logging_l (tree_a.get_child ("logging"));
			error |= logging.deserialize_json (upgraded_a, logging_l);
			auto & constants_l (tree_a.get_child ("constants"));
			error |= constants.deserialize_json (constants_l);
			std::vector<forge::public_key> genesis_l;
			for (auto & i : tree_a.get_child ("genesis"))
			{
				forge::public_key key;
				error |= key.decode_hex (i.second.get<std::string> (""));
				genesis_l.push_back (key);
			}
			error |= genesis_l.empty ();
			if (!error)
			{
				genesis = genesis_l;
			}
		}
		else
		{
			serialize_json (tree_a);
			upgraded_a = true;
		}
	}
	catch (std::logic_error const &)
	{
		error = true;
	}
	catch (std::runtime_error const &)
	{
		error = true;
	}
	return error;
}
