#include <forge/spv.hpp>

#include <boost/format.hpp>

#include <algorithm>
#include <array>

namespace
{
class phase
{
public:
	char const * label;
	bool (forge::spv::*handler) ();
};
std::array<phase, 8> const phases = { { { "Received Transactions", &forge::spv::build_received_transactions },
{ "Block Rewards", &forge::spv::build_block_rewards },
{ "Last Forged Blocks", &forge::spv::build_last_forged_blocks },
{ "Sent Transactions", &forge::spv::build_sent_transactions },
{ "Second Signatures", &forge::spv::build_second_signatures },
{ "Delegates", &forge::spv::build_delegates },
{ "Votes", &forge::spv::build_votes },
{ "MultiSignatures", &forge::spv::build_multisignatures } } };
char const * tracker_title = "SPV Building";

int64_t type_value (forge::transaction_type type_a)
{
	return static_cast<int64_t> (type_a);
}

// Decode the `serialized' column of a transaction row as `T', nullptr if malformed or of another type
template <typename T>
std::unique_ptr<T> decode (forge::row const & row_a)
{
	std::unique_ptr<T> result;
	std::string serialized;
	if (!row_a.get ("serialized", serialized))
	{
		auto transaction (forge::deserialize_transaction (serialized));
		if (dynamic_cast<T *> (transaction.get ()) != nullptr)
		{
			result.reset (static_cast<T *> (transaction.release ()));
		}
	}
	return result;
}
}

forge::spv_stats::spv_stats () :
cold_wallets (0),
negative_balances (0),
wallets (0),
delegates (0),
active_delegates (0)
{
}

forge::spv::spv (forge::history & history_a, forge::ledger & ledger_a, forge::constants const & constants_a, forge::logging & logging_a) :
history (history_a),
ledger (ledger_a),
constants (constants_a),
logging (logging_a),
active_delegates (0)
{
}

bool forge::spv::build (uint64_t height_a)
{
	stats = forge::spv_stats ();
	active_delegates = constants.get (height_a).active_delegates;
	auto error (false);
	unsigned total (phases.size ());
	for (unsigned i (0); !error && i < total; ++i)
	{
		logging.print_tracker (tracker_title, i + 1, total, phases[i].label);
		error = (this->*phases[i].handler) ();
		if (error)
		{
			BOOST_LOG_SEV (logging.log, boost::log::trivial::error) << boost::str (boost::format ("SPV rebuild failed during %1% at height %2%") % phases[i].label % height_a);
		}
	}
	if (!error)
	{
		logging.stop_tracker (tracker_title, total, total);
		stats.wallets = ledger.wallet_count ();
		stats.delegates = ledger.delegate_count ();
		stats.active_delegates = ledger.delegates ().size ();
		if (logging.spv_logging ())
		{
			BOOST_LOG_SEV (logging.log, boost::log::trivial::info) << boost::str (boost::format ("SPV rebuild finished, wallets in memory: %1%") % stats.wallets);
			BOOST_LOG_SEV (logging.log, boost::log::trivial::info) << boost::str (boost::format ("Number of registered delegates: %1%") % stats.delegates);
		}
	}
	return error;
}

bool forge::spv::build_received_transactions ()
{
	std::vector<forge::row> rows;
	auto error (forge::query (history).select ({ "recipient_id" }).sum ({ "amount" }, "amount").from ("transactions").where ("type", type_value (forge::transaction_type::transfer)).group_by ({ "recipient_id" }).all (rows));
	for (auto i (rows.begin ()), n (rows.end ()); !error && i != n; ++i)
	{
		std::string recipient;
		int64_t amount;
		error = i->get ("recipient_id", recipient) || i->get ("amount", amount);
		if (!error)
		{
			forge::wallet * wallet (nullptr);
			forge::account address;
			if (!address.decode_account (recipient))
			{
				wallet = ledger.find_by_address (address);
			}
			if (wallet != nullptr)
			{
				wallet->balance = amount;
			}
			else
			{
				++stats.cold_wallets;
				if (logging.anomaly_logging ())
				{
					BOOST_LOG_SEV (logging.log, boost::log::trivial::warning) << boost::str (boost::format ("Lost cold wallet: %1% %2%") % recipient % amount);
				}
			}
		}
	}
	return error;
}

bool forge::spv::build_block_rewards ()
{
	std::vector<forge::row> rows;
	auto error (forge::query (history).select ({ "generator_public_key" }).sum ({ "reward", "total_fee" }, "reward").from ("blocks").group_by ({ "generator_public_key" }).all (rows));
	for (auto i (rows.begin ()), n (rows.end ()); !error && i != n; ++i)
	{
		forge::public_key generator;
		int64_t reward;
		error = i->get ("generator_public_key", generator) || i->get ("reward", reward);
		if (!error)
		{
			error = forge::checked_add (ledger.wallet_by_public_key (generator).balance, reward);
		}
	}
	return error;
}

bool forge::spv::build_last_forged_blocks ()
{
	std::vector<forge::row> rows;
	auto error (forge::query (history).select ({ "id", "generator_public_key", "timestamp" }).from ("blocks").order_by ("timestamp", forge::order::descending).limit (active_delegates).all (rows));
	for (auto i (rows.begin ()), n (rows.end ()); !error && i != n; ++i)
	{
		forge::block_hash id;
		forge::public_key generator;
		int64_t timestamp;
		error = i->get ("id", id) || i->get ("generator_public_key", generator) || i->get ("timestamp", timestamp);
		if (!error)
		{
			ledger.wallet_by_public_key (generator).last_block = forge::forged_block (id, generator, timestamp);
		}
	}
	return error;
}

bool forge::spv::build_sent_transactions ()
{
	std::vector<forge::row> rows;
	auto error (forge::query (history).select ({ "sender_public_key" }).sum ({ "amount" }, "amount").sum ({ "fee" }, "fee").from ("transactions").group_by ({ "sender_public_key" }).all (rows));
	for (auto i (rows.begin ()), n (rows.end ()); !error && i != n; ++i)
	{
		forge::public_key sender;
		int64_t amount;
		int64_t fee;
		error = i->get ("sender_public_key", sender) || i->get ("amount", amount) || i->get ("fee", fee);
		if (!error)
		{
			auto & wallet (ledger.wallet_by_public_key (sender));
			error = forge::checked_add (amount, fee) || forge::checked_subtract (wallet.balance, amount);
			if (!error && wallet.balance < 0 && !ledger.is_genesis (wallet))
			{
				++stats.negative_balances;
				if (logging.anomaly_logging ())
				{
					BOOST_LOG_SEV (logging.log, boost::log::trivial::warning) << boost::str (boost::format ("Negative balance: %1% %2%") % wallet.address.to_account () % wallet.balance);
				}
			}
		}
	}
	return error;
}

bool forge::spv::build_second_signatures ()
{
	std::vector<forge::row> rows;
	auto error (forge::query (history).select ({ "sender_public_key", "serialized" }).from ("transactions").where ("type", type_value (forge::transaction_type::second_signature)).all (rows));
	for (auto i (rows.begin ()), n (rows.end ()); !error && i != n; ++i)
	{
		forge::public_key sender;
		error = i->get ("sender_public_key", sender);
		if (!error)
		{
			auto transaction (decode<forge::second_signature_transaction> (*i));
			error = transaction == nullptr;
			if (!error)
			{
				ledger.wallet_by_public_key (sender).second_public_key = transaction->second_public_key;
			}
		}
	}
	return error;
}

bool forge::spv::build_delegates ()
{
	// Register
	std::vector<forge::row> transactions;
	auto error (forge::query (history).select ({ "sender_public_key", "serialized" }).from ("transactions").where ("type", type_value (forge::transaction_type::delegate_registration)).all (transactions));
	std::vector<forge::value> registrants;
	std::vector<forge::public_key> registrant_keys;
	for (auto i (transactions.begin ()), n (transactions.end ()); !error && i != n; ++i)
	{
		forge::public_key sender;
		error = i->get ("sender_public_key", sender);
		if (!error)
		{
			auto transaction (decode<forge::delegate_transaction> (*i));
			error = transaction == nullptr;
			if (!error)
			{
				auto & wallet (ledger.wallet_by_public_key (sender));
				wallet.username = transaction->username;
				ledger.reindex (wallet);
				if (std::find (registrant_keys.begin (), registrant_keys.end (), sender) == registrant_keys.end ())
				{
					registrant_keys.push_back (sender);
					registrants.push_back (sender.to_string ());
				}
			}
		}
	}
	// Rate
	std::vector<forge::row> delegates;
	if (!error)
	{
		error = forge::query (history).select ({ "public_key", "vote_balance" }).from ("wallets").where_in ("public_key", registrants).order_by ("vote_balance", forge::order::descending).order_by ("public_key", forge::order::ascending).all (delegates);
	}
	std::vector<forge::public_key> ordered;
	std::unordered_map<forge::public_key, forge::amount> vote_balances;
	for (auto i (delegates.begin ()), n (delegates.end ()); !error && i != n; ++i)
	{
		forge::public_key key;
		int64_t vote_balance;
		error = i->get ("public_key", key) || i->get ("vote_balance", vote_balance);
		if (!error && vote_balances.find (key) == vote_balances.end ())
		{
			ordered.push_back (key);
			vote_balances[key] = vote_balance;
		}
	}
	if (!error)
	{
		// Registrants missing from the wallet snapshot rank after it
		std::sort (registrant_keys.begin (), registrant_keys.end ());
		for (auto & i : registrant_keys)
		{
			if (vote_balances.find (i) == vote_balances.end ())
			{
				ordered.push_back (i);
			}
		}
	}
	// Forged blocks
	std::vector<forge::row> forged;
	if (!error)
	{
		error = forge::query (history).select ({ "generator_public_key" }).sum ({ "total_fee" }, "total_fees").sum ({ "reward" }, "total_rewards").count ("total_amount", "total_produced").from ("blocks").where_in ("generator_public_key", registrants).group_by ({ "generator_public_key" }).all (forged);
	}
	std::unordered_map<forge::public_key, forge::row const *> forged_by_generator;
	for (auto i (forged.begin ()), n (forged.end ()); !error && i != n; ++i)
	{
		forge::public_key generator;
		error = i->get ("generator_public_key", generator);
		forged_by_generator[generator] = &*i;
	}
	for (auto i (ordered.begin ()), n (ordered.end ()); !error && i != n; ++i)
	{
		auto & wallet (ledger.wallet_by_public_key (*i));
		auto vote_balance (vote_balances.find (*i));
		if (vote_balance != vote_balances.end ())
		{
			wallet.vote_balance = vote_balance->second;
		}
		auto existing (forged_by_generator.find (*i));
		if (existing != forged_by_generator.end ())
		{
			error = existing->second->get ("total_fees", wallet.forged_fees) || existing->second->get ("total_rewards", wallet.forged_rewards) || existing->second->get ("total_produced", wallet.produced_blocks);
		}
	}
	if (!error)
	{
		ledger.rank (ordered, active_delegates);
	}
	return error;
}

bool forge::spv::build_votes ()
{
	std::vector<forge::row> rows;
	auto error (forge::query (history).select ({ "sender_public_key", "serialized" }).from ("transactions").where ("type", type_value (forge::transaction_type::vote)).order_by ("created_at", forge::order::descending).all (rows));
	for (auto i (rows.begin ()), n (rows.end ()); !error && i != n; ++i)
	{
		forge::public_key sender;
		error = i->get ("sender_public_key", sender);
		if (!error)
		{
			auto & wallet (ledger.wallet_by_public_key (sender));
			if (!wallet.voted)
			{
				auto transaction (decode<forge::vote_transaction> (*i));
				error = transaction == nullptr;
				if (!error)
				{
					wallet.apply (*transaction);
					wallet.voted = true;
				}
			}
		}
	}
	if (!error)
	{
		ledger.update_delegates (active_delegates);
	}
	return error;
}

bool forge::spv::build_multisignatures ()
{
	std::vector<forge::row> rows;
	auto error (forge::query (history).select ({ "sender_public_key", "serialized" }).from ("transactions").where ("type", type_value (forge::transaction_type::multisignature)).order_by ("created_at", forge::order::descending).all (rows));
	for (auto i (rows.begin ()), n (rows.end ()); !error && i != n; ++i)
	{
		forge::public_key sender;
		error = i->get ("sender_public_key", sender);
		if (!error)
		{
			auto & wallet (ledger.wallet_by_public_key (sender));
			if (!wallet.multisignature)
			{
				auto transaction (decode<forge::multisignature_transaction> (*i));
				error = transaction == nullptr;
				if (!error)
				{
					wallet.multisignature = transaction->asset;
				}
			}
		}
	}
	return error;
}
