#include <forge/node/logging.hpp>

#include <boost/format.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>

#include <atomic>
#include <iostream>

unsigned constexpr forge::logging::json_version;

forge::logging::logging () :
spv_logging_value (true),
anomaly_logging_value (true),
log_to_cerr_value (false),
flush (true),
max_size (128 * 1024 * 1024),
rotation_size (4 * 1024 * 1024)
{
}

void forge::logging::init (boost::filesystem::path const & application_path_a)
{
	static std::atomic_flag logging_already_added = ATOMIC_FLAG_INIT;
	if (!logging_already_added.test_and_set ())
	{
		boost::log::add_common_attributes ();
		auto format (boost::log::expressions::stream << "[" << boost::log::expressions::format_date_time<boost::posix_time::ptime> ("TimeStamp", "%Y-%m-%d %H:%M:%S") << "] " << boost::log::expressions::attr<boost::log::trivial::severity_level> ("Severity") << ": " << boost::log::expressions::smessage);
		if (log_to_cerr ())
		{
			boost::log::add_console_log (std::cerr, boost::log::keywords::format = format);
		}
		boost::log::add_file_log (boost::log::keywords::target = application_path_a / "log", boost::log::keywords::file_name = application_path_a / "log" / "log_%Y-%m-%d_%H-%M-%S.%N.log", boost::log::keywords::rotation_size = rotation_size, boost::log::keywords::auto_flush = flush, boost::log::keywords::scan_method = boost::log::sinks::file::scan_method::scan_matching, boost::log::keywords::max_size = max_size, boost::log::keywords::format = format);
	}
}

void forge::logging::serialize_json (boost::property_tree::ptree & tree_a) const
{
	tree_a.put ("version", std::to_string (json_version));
	tree_a.put ("spv", spv_logging_value);
	tree_a.put ("anomaly", anomaly_logging_value);
	tree_a.put ("log_to_cerr", log_to_cerr_value);
	tree_a.put ("flush", flush);
	tree_a.put ("max_size", max_size);
	tree_a.put ("rotation_size", rotation_size);
}

bool forge::logging::upgrade_json (unsigned version_a, boost::property_tree::ptree & tree_a)
{
	auto result (false);
	switch (version_a)
	{
		case 1:
			break;
		default:
			throw std::runtime_error ("Unknown logging_config version");
			break;
	}
	return result;
}

bool forge::logging::deserialize_json (bool & upgraded_a, boost::property_tree::ptree & tree_a)
{
	auto result (false);
	try
	{
		auto version_l (tree_a.get_optional<std::string> ("version"));
		if (!version_l)
		{
			tree_a.put ("version", "1");
			version_l = "1";
			upgraded_a = true;
		}
		upgraded_a |= upgrade_json (std::stoull (version_l.get ()), tree_a);
		spv_logging_value = tree_a.get<bool> ("spv");
		anomaly_logging_value = tree_a.get<bool> ("anomaly");
		log_to_cerr_value = tree_a.get<bool> ("log_to_cerr");
		flush = tree_a.get<bool> ("flush");
		max_size = tree_a.get<uintmax_t> ("max_size");
		rotation_size = tree_a.get<uintmax_t> ("rotation_size");
	}
	catch (std::logic_error const &)
	{
		result = true;
	}
	catch (std::runtime_error const &)
	{
		result = true;
	}
	return result;
}

bool forge::logging::spv_logging () const
{
	return spv_logging_value;
}

bool forge::logging::anomaly_logging () const
{
	return anomaly_logging_value;
}

bool forge::logging::log_to_cerr () const
{
	return log_to_cerr_value;
}

void forge::logging::print_tracker (std::string const & title_a, unsigned step_a, unsigned total_a, std::string const & label_a)
{
	if (spv_logging ())
	{
		BOOST_LOG_SEV (log, boost::log::trivial::info) << boost::str (boost::format ("%1% [%2%/%3%] %4%") % title_a % step_a % total_a % label_a);
	}
}

void forge::logging::stop_tracker (std::string const & title_a, unsigned step_a, unsigned total_a)
{
	if (spv_logging ())
	{
		BOOST_LOG_SEV (log, boost::log::trivial::info) << boost::str (boost::format ("%1% [%2%/%3%] done") % title_a % step_a % total_a);
	}
}
