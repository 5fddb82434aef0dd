#pragma once

#include <forge/common.hpp>

#include <boost/optional.hpp>

#include <map>
#include <memory>
#include <unordered_map>

namespace forge
{
/**
 * Most recent block forged by a wallet
 */
class forged_block
{
public:
	forged_block ();
	forged_block (forge::block_hash const &, forge::public_key const &, uint32_t);
	bool operator== (forge::forged_block const &) const;
	forge::block_hash id;
	forge::public_key generator;
	uint32_t timestamp;
};
class wallet
{
public:
	wallet (forge::account const &);
	// Apply the asset of a transaction, balances are left untouched
	void apply (forge::transaction const &);
	bool is_delegate () const;
	void serialize_json (boost::property_tree::ptree &) const;
	bool operator== (forge::wallet const &) const;
	bool operator!= (forge::wallet const &) const;
	forge::account address;
	// Zero until the wallet is known to have sent a transaction
	forge::public_key public_key;
	forge::amount balance;
	forge::public_key second_public_key;
	std::string username;
	// Vote state was set during the current rebuild
	bool voted;
	// Delegate this wallet votes for, zero if none
	forge::public_key vote;
	forge::amount vote_balance;
	forge::amount forged_fees;
	forge::amount forged_rewards;
	int64_t produced_blocks;
	// Position in the delegate ranking starting at 1, 0 if unranked
	uint32_t rate;
	boost::optional<forge::multisignature_asset> multisignature;
	boost::optional<forge::forged_block> last_block;
};
/**
 * In memory wallets indexed by address, public key and delegate username
 */
class ledger
{
public:
	ledger (std::vector<forge::public_key> const &);
	// Drop every wallet and seed the genesis wallets again
	void reset ();
	forge::wallet & wallet_by_address (forge::account const &);
	// Returns nullptr instead of creating the wallet
	forge::wallet * find_by_address (forge::account const &);
	forge::wallet & wallet_by_public_key (forge::public_key const &);
	forge::wallet * wallet_by_username (std::string const &);
	bool is_genesis (forge::wallet const &) const;
	// Refresh the secondary indices of a wallet after its public key or username changed
	void reindex (forge::wallet &);
	// True if the wallet is the one its username resolves to
	bool holds_username (forge::wallet const &) const;
	// Assign ranks in the order given, the first `active' form the active delegate list
	void rank (std::vector<forge::public_key> const &, size_t);
	// Recompute every delegate vote balance from its voters and rank all delegates again
	void update_delegates (size_t);
	std::vector<forge::wallet const *> delegates () const;
	size_t wallet_count () const;
	size_t delegate_count () const;
	void serialize_json (boost::property_tree::ptree &) const;
	bool operator== (forge::ledger const &) const;
	std::vector<forge::public_key> genesis;
	std::map<forge::account, std::shared_ptr<forge::wallet>> wallets_by_address;
	std::unordered_map<forge::public_key, std::shared_ptr<forge::wallet>> wallets_by_public_key;
	std::map<std::string, std::shared_ptr<forge::wallet>> wallets_by_username;
	// Username each wallet was last indexed under
	std::unordered_map<forge::account, std::string> indexed_usernames;
	std::vector<std::shared_ptr<forge::wallet>> active;
};
}
