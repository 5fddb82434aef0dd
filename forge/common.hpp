#pragma once

#include <forge/config.hpp>
#include <forge/lib/transactions.hpp>
#include <forge/query.hpp>

#include <boost/property_tree/ptree.hpp>

#include <vector>

namespace forge
{
/**
 * A forged block as persisted in the history
 */
class block_info
{
public:
	block_info ();
	block_info (uint64_t, uint32_t, forge::public_key const &, forge::amount, forge::amount, forge::amount, uint32_t);
	void serialize (forge::stream &) const;
	bool deserialize (forge::stream &);
	bool operator== (forge::block_info const &) const;
	bool operator!= (forge::block_info const &) const;
	// Digest of every field except the id itself
	forge::block_hash compute_id () const;
	forge::row row () const;
	forge::block_hash id;
	uint64_t height;
	uint32_t timestamp;
	forge::public_key generator;
	forge::amount reward;
	forge::amount total_fee;
	forge::amount total_amount;
	uint32_t transaction_count;
};

/**
 * A transaction as persisted in the history, keyed by block height and position inside the block
 */
class transaction_info
{
public:
	transaction_info ();
	transaction_info (forge::transaction const &, forge::block_info const &, uint32_t);
	void serialize (forge::stream &) const;
	bool deserialize (forge::stream &);
	bool operator== (forge::transaction_info const &) const;
	// Decode the stored payload, nullptr if it is malformed
	std::unique_ptr<forge::transaction> decode () const;
	forge::row row () const;
	forge::block_hash id;
	forge::block_hash block_id;
	uint64_t height;
	uint32_t sequence;
	uint32_t timestamp;
	forge::transaction_type type;
	forge::public_key sender;
	forge::account recipient;
	forge::amount amount;
	forge::amount fee;
	// Type prefixed binary transaction
	std::vector<uint8_t> serialized;
};

/**
 * Last persisted snapshot of a wallet
 */
class wallet_info
{
public:
	wallet_info ();
	wallet_info (forge::account const &, forge::public_key const &, forge::amount, forge::amount, std::string const &);
	void serialize (forge::stream &) const;
	bool deserialize (forge::stream &);
	bool operator== (forge::wallet_info const &) const;
	forge::row row () const;
	forge::account address;
	// Zero if the wallet never sent
	forge::public_key public_key;
	forge::amount balance;
	forge::amount vote_balance;
	std::string username;
};

/**
 * Network constants in force from `height' onwards
 */
class milestone
{
public:
	milestone ();
	milestone (uint64_t, uint32_t, forge::amount, uint32_t);
	void serialize_json (boost::property_tree::ptree &) const;
	bool deserialize_json (boost::property_tree::ptree const &);
	bool operator== (forge::milestone const &) const;
	uint64_t height;
	uint32_t active_delegates;
	forge::amount reward;
	// Seconds between blocks
	uint32_t block_time;
};
class constants
{
public:
	// Milestones of the active network
	constants ();
	constants (std::vector<forge::milestone> const &);
	// Milestone in force at `height', the first milestone for heights before it
	forge::milestone const & get (uint64_t) const;
	void serialize_json (boost::property_tree::ptree &) const;
	bool deserialize_json (boost::property_tree::ptree const &);
	// Sorted by ascending height, never empty
	std::vector<forge::milestone> milestones;
};

// Assemble the block at `height' holding `transactions' in order and append their records to `infos'
forge::block_info make_block (uint64_t, uint32_t, forge::public_key const &, forge::amount, std::vector<std::unique_ptr<forge::transaction>> const &, std::vector<forge::transaction_info> &);

extern forge::public_key const & forge_test_genesis;
extern forge::public_key const & forge_beta_genesis;
extern forge::public_key const & forge_live_genesis;
// Genesis wallet public key of the active network
extern forge::public_key const & genesis_public_key;
}
