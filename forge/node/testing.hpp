#pragma once

#include <forge/blockstore.hpp>

namespace forge
{
// Public key number `index' of the deterministic fixture keys
forge::public_key test_key (uint32_t);
/**
 * Builds a synthetic chain history, transactions are collected until a block is forged around them
 * Every transaction and block gets the next timestamp so creation order is unambiguous
 */
class test_chain
{
public:
	test_chain ();
	forge::transfer_transaction & transfer (forge::public_key const &, forge::account const &, forge::amount, forge::amount = 10);
	forge::second_signature_transaction & second_signature (forge::public_key const &, forge::public_key const &, forge::amount = 500);
	forge::delegate_transaction & delegate (forge::public_key const &, std::string const &, forge::amount = 2500);
	forge::vote_transaction & vote (forge::public_key const &, std::vector<forge::vote_entry> const &, forge::amount = 100);
	forge::multisignature_transaction & multisignature (forge::public_key const &, forge::multisignature_asset const &, forge::amount = 500);
	// Close the pending transactions into the next block
	forge::block_info const & forge_block (forge::public_key const &, forge::amount);
	// Add a row to the wallet snapshot
	void snapshot (forge::wallet_info const &);
	void populate (forge::memory_history &) const;
	void populate (forge::block_store &) const;
	uint32_t timestamp;
	std::vector<std::unique_ptr<forge::transaction>> pending;
	std::vector<forge::block_info> blocks;
	std::vector<forge::transaction_info> transactions;
	std::vector<forge::wallet_info> wallets;

private:
	forge::transaction_header header (forge::public_key const &, forge::account const &, forge::amount, forge::amount);
	template <typename T>
	T & add (std::unique_ptr<T>);
};
}
