#pragma once

#include <forge/ledger.hpp>
#include <forge/node/logging.hpp>

namespace forge
{
class spv_stats
{
public:
	spv_stats ();
	// Recipients without a wallet, their received total is dropped
	size_t cold_wallets;
	// Non genesis wallets left with a negative balance
	size_t negative_balances;
	size_t wallets;
	size_t delegates;
	size_t active_delegates;
};
/**
 * Rebuilds the in memory ledger from the persisted history without validating it
 * Phases run in a fixed order, received and reward totals must be in place before sent totals are subtracted
 */
class spv
{
public:
	spv (forge::history &, forge::ledger &, forge::constants const &, forge::logging &);
	// True on a fatal error, the ledger must then be reset before another attempt
	bool build (uint64_t);
	bool build_received_transactions ();
	bool build_block_rewards ();
	bool build_last_forged_blocks ();
	bool build_sent_transactions ();
	bool build_second_signatures ();
	bool build_delegates ();
	bool build_votes ();
	bool build_multisignatures ();
	forge::history & history;
	forge::ledger & ledger;
	forge::constants const & constants;
	forge::logging & logging;
	forge::spv_stats stats;
	// Active delegate count at the rebuild height
	size_t active_delegates;
};
}
