#include <gtest/gtest.h>

#include <forge/node/import.hpp>
#include <forge/node/testing.hpp>

#include <boost/property_tree/json_parser.hpp>

namespace
{
boost::property_tree::ptree transaction_tree (forge::transaction const & transaction_a)
{
	boost::property_tree::ptree result;
	std::stringstream stream (transaction_a.to_json ());
	boost::property_tree::read_json (stream, result);
	return result;
}

boost::property_tree::ptree block_tree (forge::public_key const & generator_a, uint32_t timestamp_a, forge::amount reward_a, std::vector<boost::property_tree::ptree> const & transactions_a)
{
	boost::property_tree::ptree result;
	result.put ("generator", generator_a.to_string ());
	result.put ("timestamp", std::to_string (timestamp_a));
	result.put ("reward", std::to_string (reward_a));
	boost::property_tree::ptree transactions;
	for (auto & i : transactions_a)
	{
		transactions.push_back (std::make_pair ("", i));
	}
	result.add_child ("transactions", transactions);
	return result;
}

boost::property_tree::ptree chain_tree ()
{
	forge::transfer_transaction transfer (forge::transaction_header (1, forge::test_key (0), forge::account_for (forge::test_key (1)), 5000, 10));
	forge::delegate_transaction delegate (forge::transaction_header (2, forge::test_key (1), 0, 0, 2500), "delegate_1");
	forge::vote_transaction vote (forge::transaction_header (4, forge::test_key (1), 0, 0, 100), { forge::vote_entry (true, forge::test_key (1)) });
	boost::property_tree::ptree blocks;
	blocks.push_back (std::make_pair ("", block_tree (forge::test_key (0), 3, 0, { transaction_tree (transfer), transaction_tree (delegate) })));
	blocks.push_back (std::make_pair ("", block_tree (forge::test_key (1), 5, 200000000, { transaction_tree (vote) })));
	boost::property_tree::ptree wallet;
	wallet.put ("address", forge::account_for (forge::test_key (1)).to_account ());
	wallet.put ("public_key", forge::test_key (1).to_string ());
	wallet.put ("balance", "2390");
	wallet.put ("vote_balance", "2390");
	wallet.put ("username", "delegate_1");
	boost::property_tree::ptree wallets;
	wallets.push_back (std::make_pair ("", wallet));
	boost::property_tree::ptree result;
	result.add_child ("blocks", blocks);
	result.add_child ("wallets", wallets);
	return result;
}
}

TEST (import, chain)
{
	bool init (false);
	forge::block_store store (init, forge::unique_path ());
	ASSERT_TRUE (!init);
	forge::import_stats stats;
	ASSERT_FALSE (forge::import_chain (store, chain_tree (), stats));
	ASSERT_EQ (2, stats.blocks);
	ASSERT_EQ (3, stats.transactions);
	ASSERT_EQ (1, stats.wallets);
	forge::db_transaction transaction (store.environment, nullptr, false);
	ASSERT_EQ (2, store.height (transaction));
	forge::block_info block;
	ASSERT_FALSE (store.block_get (transaction, 2, block));
	ASSERT_EQ (forge::test_key (1), block.generator);
	ASSERT_EQ (200000000, block.reward);
	ASSERT_EQ (100, block.total_fee);
	ASSERT_EQ (1, block.transaction_count);
	forge::transaction_info info;
	ASSERT_FALSE (store.transaction_get (transaction, 1, 1, info));
	ASSERT_EQ (forge::transaction_type::delegate_registration, info.type);
	ASSERT_EQ (forge::test_key (1), info.sender);
	forge::wallet_info wallet;
	ASSERT_FALSE (store.wallet_get (transaction, forge::account_for (forge::test_key (1)), wallet));
	ASSERT_EQ ("delegate_1", wallet.username);
	ASSERT_EQ (2390, wallet.vote_balance);
}

// A second import continues after the current chain height
TEST (import, append)
{
	bool init (false);
	forge::block_store store (init, forge::unique_path ());
	ASSERT_TRUE (!init);
	forge::import_stats stats;
	ASSERT_FALSE (forge::import_chain (store, chain_tree (), stats));
	ASSERT_FALSE (forge::import_chain (store, chain_tree (), stats));
	ASSERT_EQ (4, stats.blocks);
	forge::db_transaction transaction (store.environment, nullptr, false);
	ASSERT_EQ (4, store.height (transaction));
	ASSERT_EQ (6, store.transaction_count (transaction));
	// Snapshot rows are keyed by address so the second import replaces the first
	ASSERT_EQ (1, store.wallet_count (transaction));
	forge::transaction_info info;
	ASSERT_FALSE (store.transaction_get (transaction, 4, 0, info));
	ASSERT_EQ (forge::transaction_type::vote, info.type);
}

TEST (import, malformed_transaction)
{
	bool init (false);
	forge::block_store store (init, forge::unique_path ());
	ASSERT_TRUE (!init);
	auto tree (chain_tree ());
	auto & first (tree.get_child ("blocks").back ().second.get_child ("transactions").front ().second);
	first.erase ("votes");
	forge::import_stats stats;
	ASSERT_TRUE (forge::import_chain (store, tree, stats));
	ASSERT_EQ (0, stats.blocks);
	forge::db_transaction transaction (store.environment, nullptr, false);
	ASSERT_EQ (0, store.block_count (transaction));
	ASSERT_EQ (0, store.transaction_count (transaction));
}

TEST (import, malformed_wallet)
{
	bool init (false);
	forge::block_store store (init, forge::unique_path ());
	ASSERT_TRUE (!init);
	auto tree (chain_tree ());
	tree.get_child ("wallets").front ().second.put ("address", "frg_1");
	forge::import_stats stats;
	ASSERT_TRUE (forge::import_chain (store, tree, stats));
	forge::db_transaction transaction (store.environment, nullptr, false);
	ASSERT_EQ (0, store.block_count (transaction));
}

TEST (import, file)
{
	bool init (false);
	auto path (forge::unique_path ());
	forge::block_store store (init, path / "data.ldb");
	ASSERT_TRUE (!init);
	auto file (path / "chain.json");
	{
		std::ofstream out (file.string ());
		boost::property_tree::write_json (out, chain_tree ());
	}
	forge::import_stats stats;
	ASSERT_FALSE (forge::import_chain (store, file, stats));
	ASSERT_EQ (3, stats.transactions);
	ASSERT_TRUE (forge::import_chain (store, path / "missing.json", stats));
}
