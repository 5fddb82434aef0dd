#pragma once

#include <forge/common.hpp>
#include <forge/node/utility.hpp>

namespace forge
{
/**
 * The value produced when iterating with \ref store_iterator
 */
class store_entry
{
public:
	store_entry ();
	void clear ();
	store_entry * operator-> ();
	forge::mdb_val first;
	forge::mdb_val second;
};

/**
 * Iterates the key/value pairs of a transaction
 */
class store_iterator
{
public:
	store_iterator (MDB_txn *, MDB_dbi);
	store_iterator (std::nullptr_t);
	store_iterator (forge::store_iterator &&);
	store_iterator (forge::store_iterator const &) = delete;
	~store_iterator ();
	forge::store_iterator & operator++ ();
	forge::store_iterator & operator= (forge::store_iterator &&);
	forge::store_iterator & operator= (forge::store_iterator const &) = delete;
	forge::store_entry & operator-> ();
	bool operator== (forge::store_iterator const &) const;
	bool operator!= (forge::store_iterator const &) const;
	MDB_cursor * cursor;
	forge::store_entry current;
};

/**
 * Persisted chain history, blocks and transactions in chain order and the last wallet snapshot
 */
class block_store : public forge::history
{
public:
	block_store (bool &, boost::filesystem::path const &, int lmdb_max_dbs = 128);

	void block_put (MDB_txn *, forge::block_info const &);
	bool block_get (MDB_txn *, uint64_t, forge::block_info &);
	bool block_exists (MDB_txn *, uint64_t);
	size_t block_count (MDB_txn *);
	// Height of the last block, 0 for an empty store
	uint64_t height (MDB_txn *);
	forge::store_iterator blocks_begin (MDB_txn *);
	forge::store_iterator blocks_end ();

	void transaction_put (MDB_txn *, forge::transaction_info const &);
	bool transaction_get (MDB_txn *, uint64_t, uint32_t, forge::transaction_info &);
	size_t transaction_count (MDB_txn *);
	forge::store_iterator transactions_begin (MDB_txn *);
	forge::store_iterator transactions_end ();

	void wallet_put (MDB_txn *, forge::wallet_info const &);
	bool wallet_get (MDB_txn *, forge::account const &, forge::wallet_info &);
	size_t wallet_count (MDB_txn *);
	forge::store_iterator wallets_begin (MDB_txn *);
	forge::store_iterator wallets_end ();

	bool scan (std::string const &, std::function<void(forge::row const &)> const &) override;

	void version_put (MDB_txn *, int);
	int version_get (MDB_txn *);
	// True if the store was written by a newer schema
	bool do_upgrades (MDB_txn *);

	forge::mdb_env environment;
	/**
	 * Big endian height -> forge::block_info
	 */
	MDB_dbi blocks;
	/**
	 * Big endian height, big endian sequence -> forge::transaction_info
	 */
	MDB_dbi transactions;
	/**
	 * forge::account -> forge::wallet_info
	 */
	MDB_dbi wallets;
	/**
	 * Meta information about block store
	 */
	MDB_dbi meta;
	static int constexpr version_current = 1;
};
}
