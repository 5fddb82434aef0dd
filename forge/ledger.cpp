#include <forge/ledger.hpp>

#include <algorithm>
#include <cassert>

namespace
{
/**
 * Applies the asset of a transaction to the sender's wallet
 */
class apply_visitor : public forge::transaction_visitor
{
public:
	apply_visitor (forge::wallet & wallet_a) :
	wallet (wallet_a)
	{
	}
	virtual ~apply_visitor () = default;
	void transfer (forge::transfer_transaction const &) override
	{
		// Transfers only move balance
	}
	void second_signature (forge::second_signature_transaction const & transaction_a) override
	{
		wallet.second_public_key = transaction_a.second_public_key;
	}
	void delegate_registration (forge::delegate_transaction const & transaction_a) override
	{
		wallet.username = transaction_a.username;
	}
	void vote (forge::vote_transaction const & transaction_a) override
	{
		for (auto & i : transaction_a.votes)
		{
			if (i.add)
			{
				wallet.vote = i.delegate;
			}
			else if (wallet.vote == i.delegate)
			{
				wallet.vote.clear ();
			}
		}
	}
	void multisignature (forge::multisignature_transaction const & transaction_a) override
	{
		wallet.multisignature = transaction_a.asset;
	}
	forge::wallet & wallet;
};
}

forge::forged_block::forged_block () :
id (0),
generator (0),
timestamp (0)
{
}

forge::forged_block::forged_block (forge::block_hash const & id_a, forge::public_key const & generator_a, uint32_t timestamp_a) :
id (id_a),
generator (generator_a),
timestamp (timestamp_a)
{
}

bool forge::forged_block::operator== (forge::forged_block const & other_a) const
{
	return id == other_a.id && generator == other_a.generator && timestamp == other_a.timestamp;
}

forge::wallet::wallet (forge::account const & address_a) :
address (address_a),
public_key (0),
balance (0),
second_public_key (0),
voted (false),
vote (0),
vote_balance (0),
forged_fees (0),
forged_rewards (0),
produced_blocks (0),
rate (0)
{
}

void forge::wallet::apply (forge::transaction const & transaction_a)
{
	apply_visitor visitor (*this);
	transaction_a.visit (visitor);
}

bool forge::wallet::is_delegate () const
{
	return !username.empty ();
}

void forge::wallet::serialize_json (boost::property_tree::ptree & tree_a) const
{
	tree_a.put ("address", address.to_account ());
	if (!public_key.is_zero ())
	{
		tree_a.put ("public_key", public_key.to_string ());
	}
	tree_a.put ("balance", std::to_string (balance));
	if (!second_public_key.is_zero ())
	{
		tree_a.put ("second_public_key", second_public_key.to_string ());
	}
	if (is_delegate ())
	{
		tree_a.put ("username", username);
		tree_a.put ("vote_balance", std::to_string (vote_balance));
		tree_a.put ("forged_fees", std::to_string (forged_fees));
		tree_a.put ("forged_rewards", std::to_string (forged_rewards));
		tree_a.put ("produced_blocks", std::to_string (produced_blocks));
		tree_a.put ("rate", std::to_string (rate));
	}
	if (!vote.is_zero ())
	{
		tree_a.put ("vote", vote.to_string ());
	}
	if (multisignature)
	{
		boost::property_tree::ptree multisignature_l;
		multisignature->serialize_json (multisignature_l);
		tree_a.add_child ("multisignature", multisignature_l);
	}
	if (last_block)
	{
		boost::property_tree::ptree last_block_l;
		last_block_l.put ("id", last_block->id.to_string ());
		last_block_l.put ("generator_public_key", last_block->generator.to_string ());
		last_block_l.put ("timestamp", std::to_string (last_block->timestamp));
		tree_a.add_child ("last_block", last_block_l);
	}
}

bool forge::wallet::operator== (forge::wallet const & other_a) const
{
	return address == other_a.address && public_key == other_a.public_key && balance == other_a.balance && second_public_key == other_a.second_public_key && username == other_a.username && voted == other_a.voted && vote == other_a.vote && vote_balance == other_a.vote_balance && forged_fees == other_a.forged_fees && forged_rewards == other_a.forged_rewards && produced_blocks == other_a.produced_blocks && rate == other_a.rate && multisignature == other_a.multisignature && last_block == other_a.last_block;
}

bool forge::wallet::operator!= (forge::wallet const & other_a) const
{
	return !(*this == other_a);
}

forge::ledger::ledger (std::vector<forge::public_key> const & genesis_a) :
genesis (genesis_a)
{
	reset ();
}

void forge::ledger::reset ()
{
	active.clear ();
	wallets_by_username.clear ();
	indexed_usernames.clear ();
	wallets_by_public_key.clear ();
	wallets_by_address.clear ();
	for (auto & i : genesis)
	{
		wallet_by_public_key (i);
	}
}

forge::wallet & forge::ledger::wallet_by_address (forge::account const & address_a)
{
	auto existing (wallets_by_address.find (address_a));
	if (existing == wallets_by_address.end ())
	{
		existing = wallets_by_address.insert (std::make_pair (address_a, std::make_shared<forge::wallet> (address_a))).first;
	}
	return *existing->second;
}

forge::wallet * forge::ledger::find_by_address (forge::account const & address_a)
{
	forge::wallet * result (nullptr);
	auto existing (wallets_by_address.find (address_a));
	if (existing != wallets_by_address.end ())
	{
		result = existing->second.get ();
	}
	return result;
}

forge::wallet & forge::ledger::wallet_by_public_key (forge::public_key const & public_key_a)
{
	auto existing (wallets_by_public_key.find (public_key_a));
	forge::wallet * result;
	if (existing == wallets_by_public_key.end ())
	{
		auto & wallet (wallet_by_address (forge::account_for (public_key_a)));
		if (wallet.public_key.is_zero ())
		{
			wallet.public_key = public_key_a;
		}
		reindex (wallet);
		result = &wallet;
	}
	else
	{
		result = existing->second.get ();
	}
	return *result;
}

forge::wallet * forge::ledger::wallet_by_username (std::string const & username_a)
{
	forge::wallet * result (nullptr);
	auto existing (wallets_by_username.find (username_a));
	if (existing != wallets_by_username.end ())
	{
		result = existing->second.get ();
	}
	return result;
}

bool forge::ledger::is_genesis (forge::wallet const & wallet_a) const
{
	return std::any_of (genesis.begin (), genesis.end (), [&wallet_a](forge::public_key const & key_a) {
		return forge::account_for (key_a) == wallet_a.address;
	});
}

void forge::ledger::reindex (forge::wallet & wallet_a)
{
	auto existing (wallets_by_address.find (wallet_a.address));
	assert (existing != wallets_by_address.end ());
	assert (existing->second.get () == &wallet_a);
	auto & wallet (existing->second);
	if (!wallet->public_key.is_zero ())
	{
		wallets_by_public_key[wallet->public_key] = wallet;
	}
	auto previous (indexed_usernames.find (wallet->address));
	if (previous != indexed_usernames.end () && previous->second != wallet->username)
	{
		auto entry (wallets_by_username.find (previous->second));
		if (entry != wallets_by_username.end () && entry->second == wallet)
		{
			wallets_by_username.erase (entry);
		}
		indexed_usernames.erase (previous);
	}
	if (wallet->is_delegate ())
	{
		// A later registration of a taken username takes the entry over
		wallets_by_username[wallet->username] = wallet;
		indexed_usernames[wallet->address] = wallet->username;
	}
}

bool forge::ledger::holds_username (forge::wallet const & wallet_a) const
{
	auto existing (wallet_a.is_delegate () ? wallets_by_username.find (wallet_a.username) : wallets_by_username.end ());
	return existing != wallets_by_username.end () && existing->second.get () == &wallet_a;
}

void forge::ledger::rank (std::vector<forge::public_key> const & delegates_a, size_t active_a)
{
	active.clear ();
	for (auto & i : wallets_by_address)
	{
		i.second->rate = 0;
	}
	uint32_t rate (0);
	for (auto & i : delegates_a)
	{
		auto existing (wallets_by_public_key.find (i));
		if (existing != wallets_by_public_key.end () && holds_username (*existing->second) && existing->second->rate == 0)
		{
			existing->second->rate = ++rate;
			if (active.size () < active_a)
			{
				active.push_back (existing->second);
			}
		}
	}
}

void forge::ledger::update_delegates (size_t active_a)
{
	std::vector<std::shared_ptr<forge::wallet>> delegates_l;
	for (auto & i : wallets_by_address)
	{
		if (i.second->is_delegate ())
		{
			i.second->vote_balance = 0;
		}
	}
	for (auto & i : wallets_by_username)
	{
		delegates_l.push_back (i.second);
	}
	for (auto & i : wallets_by_address)
	{
		if (!i.second->vote.is_zero ())
		{
			auto existing (wallets_by_public_key.find (i.second->vote));
			if (existing != wallets_by_public_key.end () && holds_username (*existing->second))
			{
				existing->second->vote_balance += i.second->balance;
			}
		}
	}
	std::sort (delegates_l.begin (), delegates_l.end (), [](std::shared_ptr<forge::wallet> const & lhs, std::shared_ptr<forge::wallet> const & rhs) {
		return lhs->vote_balance > rhs->vote_balance || (lhs->vote_balance == rhs->vote_balance && lhs->public_key < rhs->public_key);
	});
	std::vector<forge::public_key> ordered;
	for (auto & i : delegates_l)
	{
		ordered.push_back (i->public_key);
	}
	rank (ordered, active_a);
}

std::vector<forge::wallet const *> forge::ledger::delegates () const
{
	std::vector<forge::wallet const *> result;
	for (auto & i : active)
	{
		result.push_back (i.get ());
	}
	return result;
}

size_t forge::ledger::wallet_count () const
{
	return wallets_by_address.size ();
}

size_t forge::ledger::delegate_count () const
{
	return wallets_by_username.size ();
}

void forge::ledger::serialize_json (boost::property_tree::ptree & tree_a) const
{
	boost::property_tree::ptree wallets_l;
	for (auto & i : wallets_by_address)
	{
		boost::property_tree::ptree entry;
		i.second->serialize_json (entry);
		wallets_l.push_back (std::make_pair ("", entry));
	}
	tree_a.add_child ("wallets", wallets_l);
	boost::property_tree::ptree delegates_l;
	for (auto & i : active)
	{
		boost::property_tree::ptree entry;
		entry.put ("", i->username);
		delegates_l.push_back (std::make_pair ("", entry));
	}
	tree_a.add_child ("delegates", delegates_l);
}

bool forge::ledger::operator== (forge::ledger const & other_a) const
{
	auto result (wallets_by_address.size () == other_a.wallets_by_address.size () && active.size () == other_a.active.size ());
	for (auto i (wallets_by_address.begin ()), j (other_a.wallets_by_address.begin ()), n (wallets_by_address.end ()); result && i != n; ++i, ++j)
	{
		result = *i->second == *j->second;
	}
	for (size_t i (0); result && i < active.size (); ++i)
	{
		result = active[i]->address == other_a.active[i]->address;
	}
	return result;
}
