#include <gtest/gtest.h>

#include <forge/ledger.hpp>
#include <forge/node/testing.hpp>

#include <algorithm>

// Genesis wallets exist right after construction and again after a reset
TEST (ledger, genesis_seeded)
{
	forge::ledger ledger ({ forge::test_key (0) });
	ASSERT_EQ (1, ledger.wallet_count ());
	auto wallet (ledger.find_by_address (forge::account_for (forge::test_key (0))));
	ASSERT_NE (nullptr, wallet);
	ASSERT_EQ (forge::test_key (0), wallet->public_key);
	ASSERT_TRUE (ledger.is_genesis (*wallet));
	ledger.wallet_by_public_key (forge::test_key (1)).balance = 5;
	ASSERT_EQ (2, ledger.wallet_count ());
	ledger.reset ();
	ASSERT_EQ (1, ledger.wallet_count ());
	ASSERT_EQ (0, ledger.wallet_by_public_key (forge::test_key (0)).balance);
}

TEST (ledger, find_never_creates)
{
	forge::ledger ledger ({ forge::test_key (0) });
	ASSERT_EQ (nullptr, ledger.find_by_address (forge::account_for (forge::test_key (1))));
	ASSERT_EQ (1, ledger.wallet_count ());
	auto & wallet (ledger.wallet_by_address (forge::account_for (forge::test_key (1))));
	ASSERT_TRUE (wallet.public_key.is_zero ());
	ASSERT_EQ (&wallet, ledger.find_by_address (forge::account_for (forge::test_key (1))));
}

// A wallet first seen by address gets its public key once it is seen sending
TEST (ledger, bind_public_key)
{
	forge::ledger ledger ({ forge::test_key (0) });
	auto & wallet1 (ledger.wallet_by_address (forge::account_for (forge::test_key (1))));
	wallet1.balance = 100;
	auto & wallet2 (ledger.wallet_by_public_key (forge::test_key (1)));
	ASSERT_EQ (&wallet1, &wallet2);
	ASSERT_EQ (forge::test_key (1), wallet2.public_key);
	ASSERT_EQ (100, wallet2.balance);
	ASSERT_EQ (2, ledger.wallet_count ());
	ASSERT_FALSE (ledger.is_genesis (wallet2));
}

TEST (ledger, username_index)
{
	forge::ledger ledger ({ forge::test_key (0) });
	auto & wallet (ledger.wallet_by_public_key (forge::test_key (1)));
	ASSERT_EQ (nullptr, ledger.wallet_by_username ("alpha"));
	wallet.username = "alpha";
	ledger.reindex (wallet);
	ASSERT_EQ (&wallet, ledger.wallet_by_username ("alpha"));
	ASSERT_EQ (1, ledger.delegate_count ());
	wallet.username = "beta";
	ledger.reindex (wallet);
	ASSERT_EQ (nullptr, ledger.wallet_by_username ("alpha"));
	ASSERT_EQ (&wallet, ledger.wallet_by_username ("beta"));
	ASSERT_EQ (1, ledger.delegate_count ());
}

TEST (ledger, apply_vote)
{
	forge::wallet wallet (forge::account_for (forge::test_key (1)));
	forge::transaction_header header (1, forge::test_key (1), 0, 0, 100);
	wallet.apply (forge::vote_transaction (header, { forge::vote_entry (true, forge::test_key (2)) }));
	ASSERT_EQ (forge::test_key (2), wallet.vote);
	// Removing a vote for another delegate leaves the current one
	wallet.apply (forge::vote_transaction (header, { forge::vote_entry (false, forge::test_key (3)) }));
	ASSERT_EQ (forge::test_key (2), wallet.vote);
	wallet.apply (forge::vote_transaction (header, { forge::vote_entry (false, forge::test_key (2)) }));
	ASSERT_TRUE (wallet.vote.is_zero ());
	ASSERT_EQ (0, wallet.balance);
}

TEST (ledger, apply_assets)
{
	forge::wallet wallet (forge::account_for (forge::test_key (1)));
	forge::transaction_header header (1, forge::test_key (1), 0, 0, 100);
	wallet.apply (forge::second_signature_transaction (header, forge::test_key (9)));
	ASSERT_EQ (forge::test_key (9), wallet.second_public_key);
	wallet.apply (forge::delegate_transaction (header, "delegate"));
	ASSERT_TRUE (wallet.is_delegate ());
	forge::multisignature_asset asset (1, 24, { forge::test_key (9) });
	wallet.apply (forge::multisignature_transaction (header, asset));
	ASSERT_TRUE (!!wallet.multisignature);
	ASSERT_EQ (asset, *wallet.multisignature);
	wallet.apply (forge::transfer_transaction (forge::transaction_header (2, forge::test_key (1), forge::account_for (forge::test_key (2)), 50, 10)));
	ASSERT_EQ (0, wallet.balance);
}

TEST (ledger, rank_order)
{
	forge::ledger ledger ({ forge::test_key (0) });
	for (auto i (1); i <= 3; ++i)
	{
		auto & wallet (ledger.wallet_by_public_key (forge::test_key (i)));
		wallet.username = "delegate_" + std::to_string (i);
		ledger.reindex (wallet);
	}
	// Keys that are not delegates and duplicates are skipped
	ledger.rank ({ forge::test_key (3), forge::test_key (0), forge::test_key (1), forge::test_key (3), forge::test_key (2) }, 2);
	ASSERT_EQ (1, ledger.wallet_by_public_key (forge::test_key (3)).rate);
	ASSERT_EQ (2, ledger.wallet_by_public_key (forge::test_key (1)).rate);
	ASSERT_EQ (3, ledger.wallet_by_public_key (forge::test_key (2)).rate);
	ASSERT_EQ (0, ledger.wallet_by_public_key (forge::test_key (0)).rate);
	auto delegates (ledger.delegates ());
	ASSERT_EQ (2, delegates.size ());
	ASSERT_EQ ("delegate_3", delegates[0]->username);
	ASSERT_EQ ("delegate_1", delegates[1]->username);
}

TEST (ledger, update_delegates)
{
	forge::ledger ledger ({ forge::test_key (0) });
	for (auto i (1); i <= 3; ++i)
	{
		auto & wallet (ledger.wallet_by_public_key (forge::test_key (i)));
		wallet.username = "delegate_" + std::to_string (i);
		wallet.vote_balance = 1000000;
		ledger.reindex (wallet);
	}
	auto & voter1 (ledger.wallet_by_public_key (forge::test_key (10)));
	voter1.balance = 300;
	voter1.vote = forge::test_key (2);
	auto & voter2 (ledger.wallet_by_public_key (forge::test_key (11)));
	voter2.balance = 200;
	voter2.vote = forge::test_key (2);
	auto & voter3 (ledger.wallet_by_public_key (forge::test_key (12)));
	voter3.balance = 400;
	voter3.vote = forge::test_key (3);
	// Votes for a wallet that is not a delegate count for nobody
	auto & voter4 (ledger.wallet_by_public_key (forge::test_key (13)));
	voter4.balance = 900;
	voter4.vote = forge::test_key (11);
	ledger.update_delegates (2);
	ASSERT_EQ (500, ledger.wallet_by_public_key (forge::test_key (2)).vote_balance);
	ASSERT_EQ (400, ledger.wallet_by_public_key (forge::test_key (3)).vote_balance);
	ASSERT_EQ (0, ledger.wallet_by_public_key (forge::test_key (1)).vote_balance);
	ASSERT_EQ (0, ledger.wallet_by_public_key (forge::test_key (11)).vote_balance);
	auto delegates (ledger.delegates ());
	ASSERT_EQ (2, delegates.size ());
	ASSERT_EQ (forge::test_key (2), delegates[0]->public_key);
	ASSERT_EQ (forge::test_key (3), delegates[1]->public_key);
	ASSERT_EQ (3, ledger.wallet_by_public_key (forge::test_key (1)).rate);
}

// Equal vote balances rank by ascending public key
TEST (ledger, update_delegates_tie)
{
	forge::ledger ledger ({ forge::test_key (0) });
	std::vector<forge::public_key> keys;
	for (auto i (1); i <= 4; ++i)
	{
		keys.push_back (forge::test_key (i));
		auto & wallet (ledger.wallet_by_public_key (forge::test_key (i)));
		wallet.username = "delegate_" + std::to_string (i);
		ledger.reindex (wallet);
	}
	std::sort (keys.begin (), keys.end ());
	ledger.update_delegates (4);
	auto delegates (ledger.delegates ());
	ASSERT_EQ (4, delegates.size ());
	for (size_t i (0); i < keys.size (); ++i)
	{
		ASSERT_EQ (keys[i], delegates[i]->public_key);
		ASSERT_EQ (i + 1, delegates[i]->rate);
	}
}

TEST (ledger, serialize_json)
{
	forge::ledger ledger ({ forge::test_key (0) });
	auto & wallet (ledger.wallet_by_public_key (forge::test_key (1)));
	wallet.balance = 42;
	wallet.username = "delegate_1";
	ledger.reindex (wallet);
	ledger.update_delegates (1);
	boost::property_tree::ptree tree;
	ledger.serialize_json (tree);
	ASSERT_EQ (2, tree.get_child ("wallets").size ());
	ASSERT_EQ (1, tree.get_child ("delegates").size ());
	ASSERT_EQ ("delegate_1", tree.get_child ("delegates").front ().second.get<std::string> (""));
	auto found (false);
	for (auto & i : tree.get_child ("wallets"))
	{
		if (i.second.get<std::string> ("address") == wallet.address.to_account ())
		{
			found = true;
			ASSERT_EQ ("42", i.second.get<std::string> ("balance"));
			ASSERT_EQ ("1", i.second.get<std::string> ("rate"));
		}
	}
	ASSERT_TRUE (found);
}

TEST (ledger, equality)
{
	forge::ledger ledger1 ({ forge::test_key (0) });
	forge::ledger ledger2 ({ forge::test_key (0) });
	ASSERT_TRUE (ledger1 == ledger2);
	ledger1.wallet_by_public_key (forge::test_key (1)).balance = 10;
	ASSERT_FALSE (ledger1 == ledger2);
	ledger2.wallet_by_public_key (forge::test_key (1)).balance = 10;
	ASSERT_TRUE (ledger1 == ledger2);
}

// A second wallet registering a taken username takes the entry and the first drops out of the ranking
TEST (ledger, duplicate_username)
{
	forge::ledger ledger ({ forge::test_key (0) });
	auto & wallet1 (ledger.wallet_by_public_key (forge::test_key (1)));
	wallet1.username = "same";
	ledger.reindex (wallet1);
	auto & wallet2 (ledger.wallet_by_public_key (forge::test_key (2)));
	wallet2.username = "same";
	ledger.reindex (wallet2);
	ASSERT_EQ (&wallet2, ledger.wallet_by_username ("same"));
	ASSERT_FALSE (ledger.holds_username (wallet1));
	ASSERT_TRUE (ledger.holds_username (wallet2));
	ASSERT_EQ (1, ledger.delegate_count ());
	wallet1.rate = 7;
	wallet1.vote_balance = 500;
	ledger.rank ({ forge::test_key (1), forge::test_key (2) }, 2);
	ASSERT_EQ (0, wallet1.rate);
	ASSERT_EQ (1, wallet2.rate);
	ASSERT_EQ (1, ledger.delegates ().size ());
	ledger.update_delegates (2);
	ASSERT_EQ (0, wallet1.rate);
	ASSERT_EQ (0, wallet1.vote_balance);
	// Renaming the displaced wallet leaves the holder's entry alone
	wallet1.username = "other";
	ledger.reindex (wallet1);
	ASSERT_EQ (&wallet2, ledger.wallet_by_username ("same"));
	ASSERT_EQ (&wallet1, ledger.wallet_by_username ("other"));
	ASSERT_EQ (2, ledger.delegate_count ());
	ledger.reset ();
	ASSERT_TRUE (ledger.indexed_usernames.empty ());
}
