#include <gtest/gtest.h>

#include <forge/node/logging.hpp>
#include <forge/node/testing.hpp>

#include <boost/property_tree/json_parser.hpp>

TEST (logging, serialization)
{
	forge::logging logging1;
	logging1.spv_logging_value = false;
	logging1.anomaly_logging_value = false;
	logging1.log_to_cerr_value = true;
	logging1.max_size = 10;
	logging1.rotation_size = 20;
	boost::property_tree::ptree tree;
	logging1.serialize_json (tree);
	forge::logging logging2;
	auto upgraded (false);
	ASSERT_FALSE (logging2.deserialize_json (upgraded, tree));
	ASSERT_FALSE (upgraded);
	ASSERT_EQ (logging1.spv_logging_value, logging2.spv_logging_value);
	ASSERT_EQ (logging1.anomaly_logging_value, logging2.anomaly_logging_value);
	ASSERT_EQ (logging1.log_to_cerr_value, logging2.log_to_cerr_value);
	ASSERT_EQ (logging1.max_size, logging2.max_size);
	ASSERT_EQ (logging1.rotation_size, logging2.rotation_size);
}

// A config without a version is stamped with the current one
TEST (logging, missing_version)
{
	forge::logging logging1;
	logging1.max_size = 10;
	boost::property_tree::ptree tree;
	logging1.serialize_json (tree);
	tree.erase ("version");
	forge::logging logging2;
	auto upgraded (false);
	ASSERT_FALSE (logging2.deserialize_json (upgraded, tree));
	ASSERT_TRUE (upgraded);
	ASSERT_EQ ("1", tree.get<std::string> ("version"));
	ASSERT_EQ (10, logging2.max_size);
}

TEST (logging, unknown_version)
{
	forge::logging logging1;
	boost::property_tree::ptree tree;
	logging1.serialize_json (tree);
	tree.put ("version", "2");
	forge::logging logging2;
	auto upgraded (false);
	ASSERT_TRUE (logging2.deserialize_json (upgraded, tree));
}

TEST (logging, missing_field)
{
	forge::logging logging1;
	boost::property_tree::ptree tree;
	logging1.serialize_json (tree);
	tree.erase ("flush");
	forge::logging logging2;
	auto upgraded (false);
	ASSERT_TRUE (logging2.deserialize_json (upgraded, tree));
}

// An old config file is upgraded and written back
TEST (logging, fetch_object_upgrades)
{
	auto path (forge::unique_path ());
	boost::filesystem::create_directories (path);
	auto file (path / "config.json");
	forge::logging logging1;
	{
		boost::property_tree::ptree tree;
		logging1.serialize_json (tree);
		std::ofstream out (file.string ());
		tree.erase ("version");
		boost::property_tree::write_json (out, tree);
	}
	forge::logging logging2;
	std::fstream stream;
	ASSERT_FALSE (forge::fetch_object (logging2, file, stream));
	stream.close ();
	ASSERT_EQ (logging1.max_size, logging2.max_size);
	boost::property_tree::ptree tree;
	std::ifstream in (file.string ());
	boost::property_tree::read_json (in, tree);
	ASSERT_EQ ("1", tree.get<std::string> ("version"));
}

TEST (logging, fetch_object_malformed)
{
	auto path (forge::unique_path ());
	boost::filesystem::create_directories (path);
	auto file (path / "config.json");
	{
		std::ofstream out (file.string ());
		out << "{ \"version\": ";
	}
	forge::logging logging1;
	std::fstream stream;
	ASSERT_TRUE (forge::fetch_object (logging1, file, stream));
}

TEST (logging, tracker_disabled)
{
	forge::logging logging;
	logging.spv_logging_value = false;
	ASSERT_FALSE (logging.spv_logging ());
	logging.print_tracker ("SPV Building", 1, 8, "Received Transactions");
	logging.stop_tracker ("SPV Building", 8, 8);
}
