#include <gtest/gtest.h>

#include <forge/node/testing.hpp>

TEST (block_store, construction)
{
	bool init (false);
	forge::block_store store (init, forge::unique_path ());
	ASSERT_TRUE (!init);
	forge::db_transaction transaction (store.environment, nullptr, false);
	ASSERT_EQ (0, store.block_count (transaction));
	ASSERT_EQ (0, store.height (transaction));
	ASSERT_EQ (forge::block_store::version_current, store.version_get (transaction));
}

// Init returns an error if it can't open files at the path
TEST (block_store, bad_path)
{
	bool init (false);
	forge::block_store store (init, boost::filesystem::path ("/"));
	ASSERT_TRUE (init);
}

TEST (block_store, add_block)
{
	bool init (false);
	forge::block_store store (init, forge::unique_path ());
	ASSERT_TRUE (!init);
	forge::block_info block (1, 100, forge::test_key (0), 200000000, 30, 1000, 3);
	forge::db_transaction transaction (store.environment, nullptr, true);
	forge::block_info block1;
	ASSERT_TRUE (store.block_get (transaction, 1, block1));
	ASSERT_FALSE (store.block_exists (transaction, 1));
	store.block_put (transaction, block);
	ASSERT_FALSE (store.block_get (transaction, 1, block1));
	ASSERT_EQ (block, block1);
	ASSERT_EQ (block.compute_id (), block1.id);
	ASSERT_TRUE (store.block_exists (transaction, 1));
	ASSERT_FALSE (store.block_exists (transaction, 2));
	ASSERT_EQ (1, store.block_count (transaction));
}

TEST (block_store, height_is_last_block)
{
	bool init (false);
	forge::block_store store (init, forge::unique_path ());
	ASSERT_TRUE (!init);
	forge::db_transaction transaction (store.environment, nullptr, true);
	// Big endian keys keep 256 after 2 in cursor order
	store.block_put (transaction, forge::block_info (256, 3, forge::test_key (0), 0, 0, 0, 0));
	store.block_put (transaction, forge::block_info (2, 2, forge::test_key (0), 0, 0, 0, 0));
	ASSERT_EQ (256, store.height (transaction));
	std::vector<uint64_t> heights;
	for (auto i (store.blocks_begin (transaction)), n (store.blocks_end ()); i != n; ++i)
	{
		forge::block_info block;
		forge::bufferstream stream (reinterpret_cast<uint8_t const *> (i->second.data ()), i->second.size ());
		ASSERT_FALSE (block.deserialize (stream));
		heights.push_back (block.height);
	}
	ASSERT_EQ (std::vector<uint64_t> ({ 2, 256 }), heights);
}

TEST (block_store, add_transactions)
{
	bool init (false);
	forge::block_store store (init, forge::unique_path ());
	ASSERT_TRUE (!init);
	forge::test_chain chain;
	chain.transfer (forge::test_key (0), forge::account_for (forge::test_key (1)), 500);
	chain.delegate (forge::test_key (1), "delegate_1");
	chain.forge_block (forge::test_key (0), 0);
	chain.populate (store);
	forge::db_transaction transaction (store.environment, nullptr, false);
	ASSERT_EQ (2, store.transaction_count (transaction));
	forge::transaction_info info;
	ASSERT_FALSE (store.transaction_get (transaction, 1, 1, info));
	ASSERT_EQ (chain.transactions[1], info);
	ASSERT_EQ (forge::transaction_type::delegate_registration, info.type);
	auto decoded (info.decode ());
	ASSERT_NE (nullptr, decoded);
	ASSERT_EQ (forge::transaction_type::delegate_registration, decoded->type ());
	ASSERT_EQ (forge::test_key (1), decoded->header.sender);
	ASSERT_TRUE (store.transaction_get (transaction, 1, 2, info));
}

TEST (block_store, wallets)
{
	bool init (false);
	forge::block_store store (init, forge::unique_path ());
	ASSERT_TRUE (!init);
	forge::wallet_info wallet (forge::account_for (forge::test_key (3)), forge::test_key (3), 1000, 500, "delegate_3");
	forge::db_transaction transaction (store.environment, nullptr, true);
	store.wallet_put (transaction, wallet);
	forge::wallet_info wallet1;
	ASSERT_FALSE (store.wallet_get (transaction, wallet.address, wallet1));
	ASSERT_EQ (wallet, wallet1);
	ASSERT_TRUE (store.wallet_get (transaction, forge::account_for (forge::test_key (4)), wallet1));
	ASSERT_EQ (1, store.wallet_count (transaction));
}

TEST (block_store, scan_chain_order)
{
	bool init (false);
	forge::block_store store (init, forge::unique_path ());
	ASSERT_TRUE (!init);
	forge::test_chain chain;
	for (auto i (0); i < 3; ++i)
	{
		chain.transfer (forge::test_key (0), forge::account_for (forge::test_key (i + 1)), 100 + i);
		chain.transfer (forge::test_key (0), forge::account_for (forge::test_key (i + 4)), 200 + i);
		chain.forge_block (forge::test_key (0), 0);
	}
	chain.snapshot (forge::wallet_info (forge::account_for (forge::test_key (1)), 0, 100, 0, ""));
	chain.populate (store);
	forge::memory_history memory;
	chain.populate (memory);
	for (auto table : { "blocks", "transactions", "wallets" })
	{
		std::vector<forge::row> stored;
		ASSERT_FALSE (store.scan (table, [&stored](forge::row const & row_a) { stored.push_back (row_a); }));
		std::vector<forge::row> expected;
		ASSERT_FALSE (memory.scan (table, [&expected](forge::row const & row_a) { expected.push_back (row_a); }));
		ASSERT_EQ (expected.size (), stored.size ());
		ASSERT_TRUE (expected == stored);
	}
	ASSERT_TRUE (store.scan ("accounts", [](forge::row const &) {}));
}

TEST (block_store, newer_version)
{
	auto path (forge::unique_path ());
	{
		bool init (false);
		forge::block_store store (init, path);
		ASSERT_TRUE (!init);
		forge::db_transaction transaction (store.environment, nullptr, true);
		store.version_put (transaction, forge::block_store::version_current + 1);
	}
	bool init (false);
	forge::block_store store (init, path);
	ASSERT_TRUE (init);
}
