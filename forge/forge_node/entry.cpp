#include <forge/forge_node/daemon.hpp>
#include <forge/node/import.hpp>

#include <boost/format.hpp>
#include <boost/program_options.hpp>
#include <boost/property_tree/json_parser.hpp>

#include <iostream>

namespace
{
// Seed the ledger with the address of every wallet in the persisted snapshot
void seed_snapshot (forge::block_store & store_a, forge::ledger & ledger_a)
{
	forge::db_transaction transaction (store_a.environment, nullptr, false);
	for (auto i (store_a.wallets_begin (transaction)), n (store_a.wallets_end ()); i != n; ++i)
	{
		ledger_a.wallet_by_address (i->first.uint256 ());
	}
}
}

int main (int argc, char * const * argv)
{
	boost::program_options::options_description description ("Command line options");
	// clang-format off
	description.add_options ()
		("help", "Print out options")
		("version", "Prints out version")
		("data_path", boost::program_options::value<std::string> (), "Use the supplied path as the data directory")
		("import", boost::program_options::value<std::string> (), "Append the blocks and wallet snapshot of a JSON chain export to the store")
		("rebuild", "Rebuild the wallet ledger from the stored history")
		("height", boost::program_options::value<uint64_t> (), "Height whose network constants apply to --rebuild, defaults to the chain height")
		("dump", "Print the rebuilt wallets as JSON")
		("debug_block_count", "Display the number of blocks and transactions");
	// clang-format on

	boost::program_options::variables_map vm;
	try
	{
		boost::program_options::store (boost::program_options::parse_command_line (argc, argv, description), vm);
	}
	catch (boost::program_options::error const & err)
	{
		std::cerr << err.what () << std::endl;
		return 1;
	}
	boost::program_options::notify (vm);
	int result (0);
	boost::filesystem::path data_path = vm.count ("data_path") ? boost::filesystem::path (vm["data_path"].as<std::string> ()) : forge::working_path ();
	if (vm.count ("help"))
	{
		std::cout << description << std::endl;
	}
	else if (vm.count ("version"))
	{
		std::cout << boost::str (boost::format ("Version %1%.%2%\n") % FORGE_VERSION_MAJOR % FORGE_VERSION_MINOR);
	}
	else if (vm.count ("import") || vm.count ("rebuild") || vm.count ("debug_block_count"))
	{
		boost::system::error_code error_chmod;
		boost::filesystem::create_directories (data_path, error_chmod);
		forge_daemon::daemon_config config (data_path);
		std::fstream config_file;
		auto error (forge::fetch_object (config, data_path / "config.json", config_file));
		config_file.close ();
		if (!error)
		{
			config.logging.init (data_path);
			auto init (false);
			forge::block_store store (init, data_path / "data.ldb");
			if (!init)
			{
				{
					forge::db_transaction transaction (store.environment, nullptr, true);
					init = store.do_upgrades (transaction);
				}
				if (init)
				{
					std::cerr << "Store was written by a newer version\n";
					result = 1;
				}
			}
			else
			{
				std::cerr << boost::str (boost::format ("Error opening store at %1%\n") % (data_path / "data.ldb").string ());
				result = 1;
			}
			if (result == 0 && vm.count ("import"))
			{
				forge::import_stats stats;
				if (!forge::import_chain (store, boost::filesystem::path (vm["import"].as<std::string> ()), stats))
				{
					std::cout << boost::str (boost::format ("Imported %1% blocks, %2% transactions, %3% wallets\n") % stats.blocks % stats.transactions % stats.wallets);
				}
				else
				{
					std::cerr << boost::str (boost::format ("Error importing %1%\n") % vm["import"].as<std::string> ());
					result = 1;
				}
			}
			if (result == 0 && vm.count ("debug_block_count"))
			{
				forge::db_transaction transaction (store.environment, nullptr, false);
				std::cout << boost::str (boost::format ("Block count: %1%\n") % store.block_count (transaction));
				std::cout << boost::str (boost::format ("Transaction count: %1%\n") % store.transaction_count (transaction));
			}
			if (result == 0 && vm.count ("rebuild"))
			{
				uint64_t height;
				{
					forge::db_transaction transaction (store.environment, nullptr, false);
					height = vm.count ("height") ? vm["height"].as<uint64_t> () : store.height (transaction);
				}
				forge::ledger ledger (config.genesis);
				seed_snapshot (store, ledger);
				forge::spv spv (store, ledger, config.constants, config.logging);
				if (!spv.build (height))
				{
					std::cout << boost::str (boost::format ("Rebuilt %1% wallets at height %2%\n") % spv.stats.wallets % height);
					std::cout << boost::str (boost::format ("Registered delegates: %1%, active: %2%\n") % spv.stats.delegates % spv.stats.active_delegates);
					std::cout << boost::str (boost::format ("Cold wallets: %1%, negative balances: %2%\n") % spv.stats.cold_wallets % spv.stats.negative_balances);
					if (vm.count ("dump"))
					{
						boost::property_tree::ptree tree;
						ledger.serialize_json (tree);
						boost::property_tree::write_json (std::cout, tree);
					}
				}
				else
				{
					std::cerr << "Rebuild failed, see the log for details\n";
					result = 1;
				}
			}
		}
		else
		{
			std::cerr << "Error deserializing config\n";
			result = 1;
		}
	}
	else
	{
		std::cout << description << std::endl;
	}
	return result;
}
