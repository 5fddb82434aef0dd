#include <forge/node/testing.hpp>

forge::public_key forge::test_key (uint32_t index_a)
{
	forge::public_key result;
	forge::deterministic_key (forge::uint256_union (0xf0f0f0f0), index_a, result);
	return result;
}

forge::test_chain::test_chain () :
timestamp (0)
{
}

forge::transaction_header forge::test_chain::header (forge::public_key const & sender_a, forge::account const & recipient_a, forge::amount amount_a, forge::amount fee_a)
{
	return forge::transaction_header (++timestamp, sender_a, recipient_a, amount_a, fee_a);
}

template <typename T>
T & forge::test_chain::add (std::unique_ptr<T> transaction_a)
{
	auto & result (*transaction_a);
	pending.push_back (std::move (transaction_a));
	return result;
}

forge::transfer_transaction & forge::test_chain::transfer (forge::public_key const & sender_a, forge::account const & recipient_a, forge::amount amount_a, forge::amount fee_a)
{
	return add (std::unique_ptr<forge::transfer_transaction> (new forge::transfer_transaction (header (sender_a, recipient_a, amount_a, fee_a))));
}

forge::second_signature_transaction & forge::test_chain::second_signature (forge::public_key const & sender_a, forge::public_key const & second_public_key_a, forge::amount fee_a)
{
	return add (std::unique_ptr<forge::second_signature_transaction> (new forge::second_signature_transaction (header (sender_a, 0, 0, fee_a), second_public_key_a)));
}

forge::delegate_transaction & forge::test_chain::delegate (forge::public_key const & sender_a, std::string const & username_a, forge::amount fee_a)
{
	return add (std::unique_ptr<forge::delegate_transaction> (new forge::delegate_transaction (header (sender_a, 0, 0, fee_a), username_a)));
}

forge::vote_transaction & forge::test_chain::vote (forge::public_key const & sender_a, std::vector<forge::vote_entry> const & votes_a, forge::amount fee_a)
{
	return add (std::unique_ptr<forge::vote_transaction> (new forge::vote_transaction (header (sender_a, 0, 0, fee_a), votes_a)));
}

forge::multisignature_transaction & forge::test_chain::multisignature (forge::public_key const & sender_a, forge::multisignature_asset const & asset_a, forge::amount fee_a)
{
	return add (std::unique_ptr<forge::multisignature_transaction> (new forge::multisignature_transaction (header (sender_a, 0, 0, fee_a), asset_a)));
}

forge::block_info const & forge::test_chain::forge_block (forge::public_key const & generator_a, forge::amount reward_a)
{
	blocks.push_back (forge::make_block (blocks.size () + 1, ++timestamp, generator_a, reward_a, pending, transactions));
	pending.clear ();
	return blocks.back ();
}

void forge::test_chain::snapshot (forge::wallet_info const & wallet_a)
{
	wallets.push_back (wallet_a);
}

void forge::test_chain::populate (forge::memory_history & history_a) const
{
	for (auto & i : blocks)
	{
		history_a.add ("blocks", i.row ());
	}
	for (auto & i : transactions)
	{
		history_a.add ("transactions", i.row ());
	}
	for (auto & i : wallets)
	{
		history_a.add ("wallets", i.row ());
	}
}

void forge::test_chain::populate (forge::block_store & store_a) const
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
}
