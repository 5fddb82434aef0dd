#pragma once

#include <boost/filesystem.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/trivial.hpp>
#include <boost/property_tree/ptree.hpp>

#include <string>

namespace forge
{
class logging
{
public:
	logging ();
	void serialize_json (boost::property_tree::ptree &) const;
	bool deserialize_json (bool &, boost::property_tree::ptree &);
	bool upgrade_json (unsigned, boost::property_tree::ptree &);
	bool spv_logging () const;
	bool anomaly_logging () const;
	bool log_to_cerr () const;
	void init (boost::filesystem::path const &);
	// Progress line for `step' of `total' in a multi step operation named `title'
	void print_tracker (std::string const &, unsigned, unsigned, std::string const &);
	void stop_tracker (std::string const &, unsigned, unsigned);
	bool spv_logging_value;
	bool anomaly_logging_value;
	bool log_to_cerr_value;
	bool flush;
	uintmax_t max_size;
	uintmax_t rotation_size;
	boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level> log;
	static unsigned constexpr json_version = 1;
};
}
