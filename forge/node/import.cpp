#include <forge/node/import.hpp>

namespace
{
bool parse_block (boost::property_tree::ptree const & tree_a, forge::public_key & generator_a, uint32_t & timestamp_a, forge::amount & reward_a, std::vector<std::unique_ptr<forge::transaction>> & transactions_a)
{
	auto result (false);
	try
	{
		result = generator_a.decode_hex (tree_a.get<std::string> ("generator"));
		if (!result)
		{
			timestamp_a = std::stoul (tree_a.get<std::string> ("timestamp"));
			reward_a = std::stoll (tree_a.get<std::string> ("reward"));
			auto transactions_l (tree_a.get_child_optional ("transactions"));
			if (transactions_l)
			{
				for (auto i (transactions_l->begin ()), n (transactions_l->end ()); !result && i != n; ++i)
				{
					auto transaction (forge::deserialize_transaction_json (i->second));
					result = transaction == nullptr;
					if (!result)
					{
						transactions_a.push_back (std::move (transaction));
					}
				}
			}
		}
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

bool parse_wallet (boost::property_tree::ptree const & tree_a, forge::wallet_info & wallet_a)
{
	auto result (false);
	try
	{
		result = wallet_a.address.decode_account (tree_a.get<std::string> ("address"));
		if (!result)
		{
			auto public_key_l (tree_a.get<std::string> ("public_key", ""));
			wallet_a.public_key.clear ();
			if (!public_key_l.empty ())
			{
				result = wallet_a.public_key.decode_hex (public_key_l);
			}
			wallet_a.balance = std::stoll (tree_a.get<std::string> ("balance"));
			wallet_a.vote_balance = std::stoll (tree_a.get<std::string> ("vote_balance", "0"));
			wallet_a.username = tree_a.get<std::string> ("username", "");
			result = result || wallet_a.username.size () > forge::delegate_transaction::username_max;
		}
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
}

forge::import_stats::import_stats () :
blocks (0),
transactions (0),
wallets (0)
{
}

bool forge::import_chain (forge::block_store & store_a, boost::property_tree::ptree const & tree_a, forge::import_stats & stats_a)
{
	auto error (false);
	uint64_t height;
	{
		forge::db_transaction transaction (store_a.environment, nullptr, false);
		height = store_a.height (transaction);
	}
	std::vector<forge::block_info> blocks;
	std::vector<forge::transaction_info> transactions;
	auto blocks_l (tree_a.get_child_optional ("blocks"));
	if (blocks_l)
	{
		for (auto i (blocks_l->begin ()), n (blocks_l->end ()); !error && i != n; ++i)
		{
			forge::public_key generator;
			uint32_t timestamp;
			forge::amount reward;
			std::vector<std::unique_ptr<forge::transaction>> block_transactions;
			error = parse_block (i->second, generator, timestamp, reward, block_transactions);
			if (!error)
			{
				blocks.push_back (forge::make_block (height + blocks.size () + 1, timestamp, generator, reward, block_transactions, transactions));
			}
		}
	}
	std::vector<forge::wallet_info> wallets;
	auto wallets_l (tree_a.get_child_optional ("wallets"));
	if (!error && wallets_l)
	{
		for (auto i (wallets_l->begin ()), n (wallets_l->end ()); !error && i != n; ++i)
		{
			forge::wallet_info wallet;
			error = parse_wallet (i->second, wallet);
			if (!error)
			{
				wallets.push_back (wallet);
			}
		}
	}
	if (!error)
	{
		forge::db_transaction transaction (store_a.environment, nullptr, true);
		for (auto & i : blocks)
		{
			store_a.block_put (transaction, i);
		}
		for (auto & i : transactions)
		{
			store_a.transaction_put (transaction, i);
		}
		for (auto & i : wallets)
		{
			store_a.wallet_put (transaction, i);
		}
		stats_a.blocks += blocks.size ();
		stats_a.transactions += transactions.size ();
		stats_a.wallets += wallets.size ();
	}
	return error;
}

bool forge::import_chain (forge::block_store & store_a, boost::filesystem::path const & path_a, forge::import_stats & stats_a)
{
	auto error (false);
	std::ifstream stream (path_a.string ());
	error = stream.fail ();
	if (!error)
	{
		boost::property_tree::ptree tree;
		try
		{
			boost::property_tree::read_json (stream, tree);
		}
		catch (std::runtime_error const &)
		{
			error = true;
		}
		if (!error)
		{
			error = forge::import_chain (store_a, tree, stats_a);
		}
	}
	return error;
}
