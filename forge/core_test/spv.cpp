#include <gtest/gtest.h>

#include <forge/node/testing.hpp>
#include <forge/spv.hpp>

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/utility/setup/console.hpp>

#include <limits>
#include <set>
#include <sstream>

namespace
{
/**
 * Collects warning and error records emitted while it is alive
 */
class log_capture
{
public:
	log_capture () :
	sink (boost::log::add_console_log (stream, boost::log::keywords::format = boost::log::expressions::stream << boost::log::expressions::smessage, boost::log::keywords::filter = boost::log::expressions::attr<boost::log::trivial::severity_level> ("Severity") >= boost::log::trivial::warning))
	{
	}
	~log_capture ()
	{
		boost::log::core::get ()->remove_sink (sink);
	}
	size_t count (std::string const & text_a)
	{
		sink->flush ();
		size_t result (0);
		std::stringstream lines (stream.str ());
		std::string line;
		while (std::getline (lines, line))
		{
			result += line.find (text_a) != std::string::npos ? 1 : 0;
		}
		return result;
	}
	std::stringstream stream;
	boost::shared_ptr<boost::log::sinks::synchronous_sink<boost::log::sinks::text_ostream_backend>> sink;
};

forge::public_key const & genesis_key ()
{
	static forge::public_key result (forge::test_key (0));
	return result;
}

forge::account address (uint32_t index_a)
{
	return forge::account_for (forge::test_key (index_a));
}

// Pre-seed wallets by address the way the node does from its wallet snapshot
void seed (forge::ledger & ledger_a, std::vector<uint32_t> const & indices_a)
{
	for (auto i : indices_a)
	{
		ledger_a.wallet_by_address (address (i));
	}
}

bool rebuild (forge::test_chain const & chain_a, forge::ledger & ledger_a, forge::spv_stats & stats_a, uint32_t active_a = 51)
{
	forge::memory_history history;
	chain_a.populate (history);
	forge::constants constants ({ forge::milestone (1, active_a, 0, 8) });
	forge::logging logging;
	forge::spv spv (history, ledger_a, constants, logging);
	auto result (spv.build (1));
	stats_a = spv.stats;
	return result;
}

// One block holding 153 transactions, 51 of them delegate registrations
void end_to_end_chain (forge::test_chain & chain_a)
{
	for (uint32_t i (0); i < 90; ++i)
	{
		chain_a.transfer (genesis_key (), address (100 + i % 51), 10000);
	}
	for (uint32_t i (0); i < 51; ++i)
	{
		chain_a.delegate (forge::test_key (100 + i), "delegate_" + std::to_string (i));
	}
	for (uint32_t i (0); i < 10; ++i)
	{
		chain_a.second_signature (forge::test_key (100 + i), forge::test_key (200 + i));
	}
	chain_a.vote (forge::test_key (100), { forge::vote_entry (true, forge::test_key (101)) });
	chain_a.multisignature (forge::test_key (102), forge::multisignature_asset (2, 24, { forge::test_key (300), forge::test_key (301) }));
	chain_a.forge_block (forge::test_key (100), 0);
}

void end_to_end_seed (forge::ledger & ledger_a)
{
	for (uint32_t i (0); i < 51; ++i)
	{
		seed (ledger_a, { 100 + i });
	}
}
}

// Received totals overwrite, rewards add and sends subtract
TEST (spv, balance_composition)
{
	forge::test_chain chain;
	chain.transfer (genesis_key (), address (1), 1000);
	chain.transfer (genesis_key (), address (2), 500);
	chain.forge_block (forge::test_key (9), 0);
	chain.transfer (forge::test_key (1), address (2), 300);
	chain.forge_block (forge::test_key (9), 200);
	forge::ledger ledger ({ genesis_key () });
	seed (ledger, { 1, 2 });
	ledger.wallet_by_address (address (1)).balance = 77;
	forge::spv_stats stats;
	ASSERT_FALSE (rebuild (chain, ledger, stats));
	ASSERT_EQ (1000 - 300 - 10, ledger.wallet_by_address (address (1)).balance);
	ASSERT_EQ (500 + 300, ledger.wallet_by_address (address (2)).balance);
	// Rewards plus the fees of both blocks
	ASSERT_EQ (200 + 20 + 10, ledger.wallet_by_public_key (forge::test_key (9)).balance);
	ASSERT_EQ (-(1000 + 500 + 20), ledger.wallet_by_public_key (genesis_key ()).balance);
	ASSERT_EQ (forge::test_key (1), ledger.wallet_by_address (address (1)).public_key);
	ASSERT_TRUE (ledger.wallet_by_address (address (2)).public_key.is_zero ());
	ASSERT_EQ (0, stats.cold_wallets);
	ASSERT_EQ (0, stats.negative_balances);
	ASSERT_EQ (4, stats.wallets);
}

TEST (spv, cold_wallet)
{
	forge::test_chain chain;
	chain.transfer (genesis_key (), address (1), 1000);
	chain.transfer (genesis_key (), address (3), 250);
	chain.forge_block (genesis_key (), 0);
	forge::ledger ledger ({ genesis_key () });
	seed (ledger, { 1 });
	forge::spv_stats stats;
	log_capture capture;
	ASSERT_FALSE (rebuild (chain, ledger, stats));
	ASSERT_EQ (1, stats.cold_wallets);
	ASSERT_EQ (1, capture.count ("Lost cold wallet"));
	ASSERT_EQ (nullptr, ledger.find_by_address (address (3)));
	ASSERT_EQ (1000, ledger.wallet_by_address (address (1)).balance);
	ASSERT_EQ (2, ledger.wallet_count ());
}

TEST (spv, negative_balance)
{
	forge::test_chain chain;
	chain.transfer (genesis_key (), address (1), 100);
	chain.transfer (forge::test_key (1), address (2), 300);
	chain.forge_block (forge::test_key (9), 0);
	forge::ledger ledger ({ genesis_key () });
	seed (ledger, { 1, 2 });
	forge::spv_stats stats;
	log_capture capture;
	ASSERT_FALSE (rebuild (chain, ledger, stats));
	ASSERT_EQ (100 - 300 - 10, ledger.wallet_by_address (address (1)).balance);
	// The genesis wallet is negative too but is exempt
	ASSERT_GT (0, ledger.wallet_by_public_key (genesis_key ()).balance);
	ASSERT_EQ (1, stats.negative_balances);
	ASSERT_EQ (1, capture.count ("Negative balance"));
	ASSERT_EQ (1, capture.count (address (1).to_account ()));
}

TEST (spv, anomaly_logging_disabled)
{
	forge::test_chain chain;
	chain.transfer (genesis_key (), address (3), 250);
	chain.forge_block (genesis_key (), 0);
	forge::ledger ledger ({ genesis_key () });
	forge::memory_history history;
	chain.populate (history);
	forge::constants constants ({ forge::milestone (1, 51, 0, 8) });
	forge::logging logging;
	logging.anomaly_logging_value = false;
	forge::spv spv (history, ledger, constants, logging);
	log_capture capture;
	ASSERT_FALSE (spv.build (1));
	ASSERT_EQ (1, spv.stats.cold_wallets);
	ASSERT_EQ (0, capture.count ("Lost cold wallet"));
}

// Generators recurring among the most recent blocks keep the last block visited
TEST (spv, last_forged_blocks)
{
	forge::test_chain chain;
	chain.forge_block (forge::test_key (1), 0);
	chain.forge_block (forge::test_key (2), 0);
	chain.forge_block (forge::test_key (3), 0);
	chain.forge_block (forge::test_key (2), 0);
	forge::ledger ledger ({ genesis_key () });
	forge::spv_stats stats;
	ASSERT_FALSE (rebuild (chain, ledger, stats, 3));
	ASSERT_FALSE (!!ledger.wallet_by_public_key (forge::test_key (1)).last_block);
	auto & wallet2 (ledger.wallet_by_public_key (forge::test_key (2)));
	ASSERT_TRUE (!!wallet2.last_block);
	ASSERT_EQ (chain.blocks[1].id, wallet2.last_block->id);
	ASSERT_EQ (chain.blocks[1].timestamp, wallet2.last_block->timestamp);
	ASSERT_EQ (forge::test_key (2), wallet2.last_block->generator);
	auto & wallet3 (ledger.wallet_by_public_key (forge::test_key (3)));
	ASSERT_TRUE (!!wallet3.last_block);
	ASSERT_EQ (chain.blocks[2].id, wallet3.last_block->id);
}

// The last registration in natural order wins regardless of its timestamp
TEST (spv, second_signature_last_write)
{
	forge::test_chain chain;
	auto & first (chain.second_signature (forge::test_key (1), forge::test_key (20)));
	auto & second (chain.second_signature (forge::test_key (1), forge::test_key (21)));
	second.header.timestamp = first.header.timestamp - 1;
	chain.forge_block (forge::test_key (9), 0);
	forge::ledger ledger ({ genesis_key () });
	forge::spv_stats stats;
	ASSERT_FALSE (rebuild (chain, ledger, stats));
	ASSERT_EQ (forge::test_key (21), ledger.wallet_by_public_key (forge::test_key (1)).second_public_key);
}

TEST (spv, delegate_registration)
{
	forge::test_chain chain;
	chain.delegate (forge::test_key (1), "first_name");
	chain.delegate (forge::test_key (1), "second_name");
	chain.delegate (forge::test_key (2), "other");
	chain.forge_block (forge::test_key (1), 200);
	chain.forge_block (forge::test_key (1), 200);
	chain.forge_block (forge::test_key (9), 200);
	forge::ledger ledger ({ genesis_key () });
	forge::spv_stats stats;
	ASSERT_FALSE (rebuild (chain, ledger, stats));
	ASSERT_EQ (nullptr, ledger.wallet_by_username ("first_name"));
	auto wallet1 (ledger.wallet_by_username ("second_name"));
	ASSERT_NE (nullptr, wallet1);
	ASSERT_EQ (forge::test_key (1), wallet1->public_key);
	ASSERT_EQ (2500 * 3, wallet1->forged_fees);
	ASSERT_EQ (400, wallet1->forged_rewards);
	ASSERT_EQ (2, wallet1->produced_blocks);
	auto wallet2 (ledger.wallet_by_username ("other"));
	ASSERT_NE (nullptr, wallet2);
	ASSERT_EQ (0, wallet2->produced_blocks);
	// The generator of the third block never registered
	ASSERT_FALSE (ledger.wallet_by_public_key (forge::test_key (9)).is_delegate ());
	ASSERT_EQ (2, stats.delegates);
	ASSERT_EQ (2, stats.active_delegates);
}

// Registrants are ranked by the vote balance of the persisted wallet snapshot
TEST (spv, delegates_snapshot_rank)
{
	forge::test_chain chain;
	chain.delegate (forge::test_key (1), "one");
	chain.delegate (forge::test_key (2), "two");
	chain.delegate (forge::test_key (3), "three");
	chain.forge_block (forge::test_key (9), 0);
	chain.snapshot (forge::wallet_info (address (1), forge::test_key (1), 0, 100, "one"));
	chain.snapshot (forge::wallet_info (address (2), forge::test_key (2), 0, 500, "two"));
	forge::memory_history history;
	chain.populate (history);
	forge::ledger ledger ({ genesis_key () });
	forge::constants constants ({ forge::milestone (1, 2, 0, 8) });
	forge::logging logging;
	forge::spv spv (history, ledger, constants, logging);
	spv.active_delegates = 2;
	ASSERT_FALSE (spv.build_delegates ());
	ASSERT_EQ (500, ledger.wallet_by_public_key (forge::test_key (2)).vote_balance);
	ASSERT_EQ (1, ledger.wallet_by_public_key (forge::test_key (2)).rate);
	ASSERT_EQ (2, ledger.wallet_by_public_key (forge::test_key (1)).rate);
	// Missing from the snapshot, ranked after it
	ASSERT_EQ (3, ledger.wallet_by_public_key (forge::test_key (3)).rate);
	ASSERT_EQ (2, ledger.delegates ().size ());
}

// Only the most recent vote of a sender applies
TEST (spv, vote_latest_wins)
{
	forge::test_chain chain;
	chain.transfer (genesis_key (), address (3), 1000);
	chain.delegate (forge::test_key (1), "delegate_1");
	chain.delegate (forge::test_key (2), "delegate_2");
	auto & later (chain.vote (forge::test_key (3), { forge::vote_entry (true, forge::test_key (2)) }));
	auto & earlier (chain.vote (forge::test_key (3), { forge::vote_entry (true, forge::test_key (1)) }));
	earlier.header.timestamp = later.header.timestamp - 1;
	chain.forge_block (forge::test_key (9), 0);
	forge::ledger ledger ({ genesis_key () });
	seed (ledger, { 3 });
	forge::spv_stats stats;
	ASSERT_FALSE (rebuild (chain, ledger, stats));
	auto & voter (ledger.wallet_by_public_key (forge::test_key (3)));
	ASSERT_TRUE (voter.voted);
	ASSERT_EQ (forge::test_key (2), voter.vote);
	ASSERT_EQ (1000 - 200, voter.balance);
	ASSERT_EQ (1000 - 200, ledger.wallet_by_public_key (forge::test_key (2)).vote_balance);
	ASSERT_EQ (0, ledger.wallet_by_public_key (forge::test_key (1)).vote_balance);
	ASSERT_EQ (1, ledger.wallet_by_public_key (forge::test_key (2)).rate);
	ASSERT_EQ (2, ledger.wallet_by_public_key (forge::test_key (1)).rate);
}

TEST (spv, unvote_latest_wins)
{
	forge::test_chain chain;
	chain.delegate (forge::test_key (1), "delegate_1");
	chain.vote (forge::test_key (3), { forge::vote_entry (true, forge::test_key (1)) });
	chain.forge_block (forge::test_key (9), 0);
	chain.vote (forge::test_key (3), { forge::vote_entry (false, forge::test_key (1)) });
	chain.forge_block (forge::test_key (9), 0);
	forge::ledger ledger ({ genesis_key () });
	forge::spv_stats stats;
	ASSERT_FALSE (rebuild (chain, ledger, stats));
	auto & voter (ledger.wallet_by_public_key (forge::test_key (3)));
	ASSERT_TRUE (voter.voted);
	ASSERT_TRUE (voter.vote.is_zero ());
}

// Older duplicates are skipped by the guard without being decoded
TEST (spv, vote_older_not_decoded)
{
	forge::test_chain chain;
	chain.delegate (forge::test_key (1), "delegate_1");
	chain.vote (forge::test_key (3), { forge::vote_entry (true, forge::test_key (1)) });
	chain.vote (forge::test_key (3), { forge::vote_entry (true, forge::test_key (1)) });
	chain.forge_block (forge::test_key (9), 0);
	forge::memory_history history;
	chain.populate (history);
	history.tables["transactions"][1].put ("serialized", "03");
	forge::ledger ledger ({ genesis_key () });
	forge::constants constants;
	forge::logging logging;
	forge::spv spv (history, ledger, constants, logging);
	ASSERT_FALSE (spv.build (1));
	ASSERT_EQ (forge::test_key (1), ledger.wallet_by_public_key (forge::test_key (3)).vote);
}

// The most recent registration applies and older ones are ignored
TEST (spv, multisignature_latest_wins)
{
	forge::multisignature_asset asset1 (1, 24, { forge::test_key (20) });
	forge::multisignature_asset asset2 (2, 48, { forge::test_key (21), forge::test_key (22) });
	forge::test_chain chain;
	chain.multisignature (forge::test_key (3), asset1);
	chain.forge_block (forge::test_key (9), 0);
	chain.multisignature (forge::test_key (3), asset2);
	chain.forge_block (forge::test_key (9), 0);
	forge::ledger ledger ({ genesis_key () });
	forge::spv_stats stats;
	ASSERT_FALSE (rebuild (chain, ledger, stats));
	auto & wallet (ledger.wallet_by_public_key (forge::test_key (3)));
	ASSERT_TRUE (!!wallet.multisignature);
	ASSERT_EQ (asset2, *wallet.multisignature);
}

// Equal vote balances rank by ascending public key
TEST (spv, ranking_tie_break)
{
	forge::test_chain chain;
	chain.transfer (genesis_key (), address (10), 1000);
	chain.transfer (genesis_key (), address (11), 1000);
	chain.transfer (genesis_key (), address (12), 5000);
	chain.delegate (forge::test_key (1), "delegate_1");
	chain.delegate (forge::test_key (2), "delegate_2");
	chain.delegate (forge::test_key (3), "delegate_3");
	chain.vote (forge::test_key (10), { forge::vote_entry (true, forge::test_key (1)) });
	chain.vote (forge::test_key (11), { forge::vote_entry (true, forge::test_key (2)) });
	chain.vote (forge::test_key (12), { forge::vote_entry (true, forge::test_key (3)) });
	chain.forge_block (forge::test_key (9), 0);
	forge::ledger ledger ({ genesis_key () });
	seed (ledger, { 10, 11, 12 });
	forge::spv_stats stats;
	ASSERT_FALSE (rebuild (chain, ledger, stats));
	auto & delegate1 (ledger.wallet_by_public_key (forge::test_key (1)));
	auto & delegate2 (ledger.wallet_by_public_key (forge::test_key (2)));
	ASSERT_EQ (delegate1.vote_balance, delegate2.vote_balance);
	ASSERT_EQ (1, ledger.wallet_by_public_key (forge::test_key (3)).rate);
	auto lower (forge::test_key (1) < forge::test_key (2) ? &delegate1 : &delegate2);
	auto higher (lower == &delegate1 ? &delegate2 : &delegate1);
	ASSERT_EQ (2, lower->rate);
	ASSERT_EQ (3, higher->rate);
	auto delegates (ledger.delegates ());
	ASSERT_EQ (3, delegates.size ());
	ASSERT_EQ (lower, delegates[1]);
}

TEST (spv, end_to_end)
{
	forge::test_chain chain;
	end_to_end_chain (chain);
	ASSERT_EQ (153, chain.transactions.size ());
	ASSERT_EQ (1, chain.blocks.size ());
	forge::ledger ledger ({ genesis_key () });
	end_to_end_seed (ledger);
	forge::spv_stats stats;
	ASSERT_FALSE (rebuild (chain, ledger, stats));
	size_t named (0);
	size_t voted (0);
	size_t multisignatures (0);
	std::set<uint32_t> rates;
	for (auto & i : ledger.wallets_by_address)
	{
		auto & wallet (*i.second);
		if (!wallet.username.empty ())
		{
			++named;
			rates.insert (wallet.rate);
		}
		voted += wallet.voted ? 1 : 0;
		multisignatures += wallet.multisignature ? 1 : 0;
	}
	ASSERT_EQ (51, named);
	ASSERT_EQ (1, voted);
	ASSERT_EQ (1, multisignatures);
	ASSERT_EQ (51, rates.size ());
	ASSERT_EQ (1, *rates.begin ());
	ASSERT_EQ (51, *rates.rbegin ());
	auto delegates (ledger.delegates ());
	ASSERT_LE (delegates.size (), 51);
	ASSERT_EQ (51, delegates.size ());
	// The only voted delegate leads the ranking
	ASSERT_EQ (forge::test_key (101), delegates[0]->public_key);
	ASSERT_EQ (ledger.wallet_by_public_key (forge::test_key (100)).balance, delegates[0]->vote_balance);
	ASSERT_EQ (0, stats.cold_wallets);
	ASSERT_EQ (0, stats.negative_balances);
	ASSERT_EQ (51, stats.delegates);
	ASSERT_EQ (51, stats.active_delegates);
}

TEST (spv, active_delegates_by_height)
{
	forge::test_chain chain;
	for (uint32_t i (0); i < 5; ++i)
	{
		chain.delegate (forge::test_key (100 + i), "delegate_" + std::to_string (i));
	}
	chain.forge_block (forge::test_key (9), 0);
	forge::memory_history history;
	chain.populate (history);
	forge::constants constants ({ forge::milestone (1, 2, 0, 8), forge::milestone (10, 4, 200000000, 8) });
	forge::logging logging;
	forge::ledger ledger ({ genesis_key () });
	forge::spv spv (history, ledger, constants, logging);
	ASSERT_FALSE (spv.build (9));
	ASSERT_EQ (2, ledger.delegates ().size ());
	ledger.reset ();
	ASSERT_FALSE (spv.build (10));
	ASSERT_EQ (4, ledger.delegates ().size ());
	ASSERT_EQ (5, spv.stats.delegates);
}

TEST (spv, deterministic)
{
	forge::test_chain chain;
	end_to_end_chain (chain);
	chain.transfer (genesis_key (), address (3), 250);
	chain.transfer (forge::test_key (150), address (100), 10);
	chain.forge_block (forge::test_key (101), 200000000);
	forge::ledger ledger1 ({ genesis_key () });
	end_to_end_seed (ledger1);
	forge::spv_stats stats1;
	ASSERT_FALSE (rebuild (chain, ledger1, stats1));
	forge::ledger ledger2 ({ genesis_key () });
	end_to_end_seed (ledger2);
	forge::spv_stats stats2;
	ASSERT_FALSE (rebuild (chain, ledger2, stats2));
	ASSERT_TRUE (ledger1 == ledger2);
	// A reset ledger rebuilds to the same state
	ledger1.reset ();
	end_to_end_seed (ledger1);
	ASSERT_FALSE (rebuild (chain, ledger1, stats1));
	ASSERT_TRUE (ledger1 == ledger2);
	ASSERT_EQ (stats2.cold_wallets, stats1.cold_wallets);
	ASSERT_EQ (1, stats1.cold_wallets);
	ASSERT_EQ (1, stats1.negative_balances);
}

TEST (spv, malformed_payload)
{
	forge::test_chain chain;
	chain.second_signature (forge::test_key (1), forge::test_key (20));
	chain.forge_block (forge::test_key (9), 0);
	forge::memory_history history;
	chain.populate (history);
	history.tables["transactions"][0].put ("serialized", "01FF");
	forge::ledger ledger ({ genesis_key () });
	forge::constants constants;
	forge::logging logging;
	forge::spv spv (history, ledger, constants, logging);
	log_capture capture;
	ASSERT_TRUE (spv.build (1));
	ASSERT_EQ (1, capture.count ("SPV rebuild failed during Second Signatures"));
}

// A payload decoding to another type than its row claims is fatal too
TEST (spv, mismatched_payload)
{
	forge::test_chain chain;
	chain.delegate (forge::test_key (1), "delegate_1");
	chain.forge_block (forge::test_key (9), 0);
	forge::test_chain other;
	other.second_signature (forge::test_key (1), forge::test_key (20));
	other.forge_block (forge::test_key (9), 0);
	forge::memory_history history;
	chain.populate (history);
	history.tables["transactions"][0].put ("serialized", forge::to_string_hex (other.transactions[0].serialized));
	forge::ledger ledger ({ genesis_key () });
	forge::constants constants;
	forge::logging logging;
	forge::spv spv (history, ledger, constants, logging);
	ASSERT_TRUE (spv.build (1));
}

TEST (spv, missing_table)
{
	forge::test_chain chain;
	chain.forge_block (forge::test_key (9), 0);
	forge::memory_history history;
	chain.populate (history);
	history.tables.erase ("wallets");
	forge::ledger ledger ({ genesis_key () });
	forge::constants constants;
	forge::logging logging;
	forge::spv spv (history, ledger, constants, logging);
	ASSERT_TRUE (spv.build (1));
}

// The engine reads a persisted store the same way as an in memory history
TEST (spv, block_store_history)
{
	forge::test_chain chain;
	end_to_end_chain (chain);
	bool init (false);
	forge::block_store store (init, forge::unique_path ());
	ASSERT_TRUE (!init);
	chain.populate (store);
	forge::ledger ledger1 ({ genesis_key () });
	end_to_end_seed (ledger1);
	forge::constants constants ({ forge::milestone (1, 51, 0, 8) });
	forge::logging logging;
	forge::spv spv (store, ledger1, constants, logging);
	ASSERT_FALSE (spv.build (1));
	forge::ledger ledger2 ({ genesis_key () });
	end_to_end_seed (ledger2);
	forge::spv_stats stats;
	ASSERT_FALSE (rebuild (chain, ledger2, stats));
	ASSERT_TRUE (ledger1 == ledger2);
}

// The latest registration of a contested username holds it, only that wallet is ranked
TEST (spv, duplicate_username)
{
	forge::test_chain chain;
	chain.delegate (forge::test_key (1), "same");
	chain.delegate (forge::test_key (2), "same");
	chain.delegate (forge::test_key (3), "other");
	chain.forge_block (forge::test_key (9), 0);
	chain.snapshot (forge::wallet_info (address (1), forge::test_key (1), 0, 900, "same"));
	forge::ledger ledger ({ genesis_key () });
	forge::spv_stats stats;
	ASSERT_FALSE (rebuild (chain, ledger, stats));
	auto & wallet1 (ledger.wallet_by_public_key (forge::test_key (1)));
	auto & wallet2 (ledger.wallet_by_public_key (forge::test_key (2)));
	ASSERT_EQ (&wallet2, ledger.wallet_by_username ("same"));
	ASSERT_EQ (0, wallet1.rate);
	ASSERT_EQ (0, wallet1.vote_balance);
	ASSERT_NE (0, wallet2.rate);
	size_t ranked (0);
	for (auto & i : ledger.wallets_by_address)
	{
		ranked += i.second->username == "same" && i.second->rate != 0 ? 1 : 0;
	}
	ASSERT_EQ (1, ranked);
	ASSERT_EQ (2, stats.delegates);
	ASSERT_EQ (2, ledger.delegates ().size ());
}

// Balance arithmetic leaving the 64 bit range is fatal
TEST (spv, sent_overflow)
{
	forge::test_chain chain;
	chain.transfer (genesis_key (), address (1), std::numeric_limits<forge::amount>::max ());
	chain.forge_block (forge::test_key (9), 0);
	forge::ledger ledger ({ genesis_key () });
	seed (ledger, { 1 });
	forge::spv_stats stats;
	log_capture capture;
	ASSERT_TRUE (rebuild (chain, ledger, stats));
	ASSERT_EQ (1, capture.count ("SPV rebuild failed during Sent Transactions"));
}
