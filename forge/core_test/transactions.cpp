#include <gtest/gtest.h>

#include <forge/node/testing.hpp>

#include <boost/property_tree/json_parser.hpp>

namespace
{
forge::transaction_header test_header (forge::account const & recipient_a = forge::account (0))
{
	return forge::transaction_header (42, forge::test_key (0), recipient_a, recipient_a.is_zero () ? 0 : 1000, 10);
}

std::unique_ptr<forge::transaction> binary_copy (forge::transaction const & transaction_a)
{
	return forge::deserialize_transaction (forge::to_string_hex (forge::serialize_transaction (transaction_a)));
}

std::unique_ptr<forge::transaction> json_copy (forge::transaction const & transaction_a)
{
	boost::property_tree::ptree tree;
	std::stringstream stream (transaction_a.to_json ());
	boost::property_tree::read_json (stream, tree);
	return forge::deserialize_transaction_json (tree);
}
}

TEST (transactions, type_names)
{
	for (auto i (0); i <= 4; ++i)
	{
		auto type (static_cast<forge::transaction_type> (i));
		forge::transaction_type parsed;
		ASSERT_FALSE (forge::transaction_type_parse (forge::transaction_type_name (type), parsed));
		ASSERT_EQ (type, parsed);
	}
	forge::transaction_type parsed;
	ASSERT_TRUE (forge::transaction_type_parse ("timelock_transfer", parsed));
}

TEST (transactions, transfer_binary)
{
	forge::transfer_transaction transaction (test_header (forge::account_for (forge::test_key (1))), "invoice 12");
	auto copy (binary_copy (transaction));
	ASSERT_NE (nullptr, copy);
	ASSERT_EQ (forge::transaction_type::transfer, copy->type ());
	ASSERT_TRUE (transaction == *copy);
	ASSERT_EQ (transaction.hash (), copy->hash ());
}

TEST (transactions, transfer_json)
{
	forge::transfer_transaction transaction (test_header (forge::account_for (forge::test_key (1))));
	auto copy (json_copy (transaction));
	ASSERT_NE (nullptr, copy);
	ASSERT_TRUE (transaction == *copy);
}

TEST (transactions, transfer_json_requires_recipient)
{
	forge::transfer_transaction transaction (test_header (forge::account_for (forge::test_key (1))));
	boost::property_tree::ptree tree;
	std::stringstream stream (transaction.to_json ());
	boost::property_tree::read_json (stream, tree);
	tree.erase ("recipient");
	ASSERT_EQ (nullptr, forge::deserialize_transaction_json (tree));
}

TEST (transactions, second_signature_binary)
{
	forge::second_signature_transaction transaction (test_header (), forge::test_key (5));
	auto copy (binary_copy (transaction));
	ASSERT_NE (nullptr, copy);
	auto second (dynamic_cast<forge::second_signature_transaction *> (copy.get ()));
	ASSERT_NE (nullptr, second);
	ASSERT_EQ (forge::test_key (5), second->second_public_key);
	ASSERT_TRUE (transaction == *copy);
}

TEST (transactions, delegate_binary)
{
	forge::delegate_transaction transaction (test_header (), "genesis_7");
	auto copy (binary_copy (transaction));
	ASSERT_NE (nullptr, copy);
	auto delegate (dynamic_cast<forge::delegate_transaction *> (copy.get ()));
	ASSERT_NE (nullptr, delegate);
	ASSERT_EQ ("genesis_7", delegate->username);
}

TEST (transactions, delegate_json_username_too_long)
{
	forge::delegate_transaction transaction (test_header (), "delegate");
	boost::property_tree::ptree tree;
	std::stringstream stream (transaction.to_json ());
	boost::property_tree::read_json (stream, tree);
	tree.put ("username", std::string (forge::delegate_transaction::username_max + 1, 'a'));
	ASSERT_EQ (nullptr, forge::deserialize_transaction_json (tree));
}

TEST (transactions, vote_binary)
{
	forge::vote_transaction transaction (test_header (), { forge::vote_entry (false, forge::test_key (2)), forge::vote_entry (true, forge::test_key (3)) });
	auto copy (binary_copy (transaction));
	ASSERT_NE (nullptr, copy);
	auto vote (dynamic_cast<forge::vote_transaction *> (copy.get ()));
	ASSERT_NE (nullptr, vote);
	ASSERT_EQ (2, vote->votes.size ());
	ASSERT_FALSE (vote->votes[0].add);
	ASSERT_EQ (forge::test_key (3), vote->votes[1].delegate);
}

TEST (transactions, vote_json)
{
	forge::vote_transaction transaction (test_header (), { forge::vote_entry (true, forge::test_key (3)) });
	auto copy (json_copy (transaction));
	ASSERT_NE (nullptr, copy);
	ASSERT_TRUE (transaction == *copy);
}

TEST (transactions, vote_entry_text)
{
	forge::vote_entry entry (true, forge::test_key (3));
	auto text (entry.to_string ());
	ASSERT_EQ ('+', text[0]);
	forge::vote_entry decoded;
	ASSERT_FALSE (decoded.decode (text));
	ASSERT_EQ (entry, decoded);
	text[0] = '*';
	ASSERT_TRUE (decoded.decode (text));
	ASSERT_TRUE (decoded.decode ("-"));
}

TEST (transactions, multisignature_binary)
{
	forge::multisignature_asset asset (2, 24, { forge::test_key (4), forge::test_key (5), forge::test_key (6) });
	forge::multisignature_transaction transaction (test_header (), asset);
	auto copy (binary_copy (transaction));
	ASSERT_NE (nullptr, copy);
	auto multisignature (dynamic_cast<forge::multisignature_transaction *> (copy.get ()));
	ASSERT_NE (nullptr, multisignature);
	ASSERT_EQ (asset, multisignature->asset);
}

TEST (transactions, multisignature_json_min_exceeds_keys)
{
	forge::multisignature_asset asset (2, 24, { forge::test_key (4), forge::test_key (5) });
	forge::multisignature_transaction transaction (test_header (), asset);
	boost::property_tree::ptree tree;
	std::stringstream stream (transaction.to_json ());
	boost::property_tree::read_json (stream, tree);
	tree.put ("min", 3);
	ASSERT_EQ (nullptr, forge::deserialize_transaction_json (tree));
}

TEST (transactions, unknown_type_tag)
{
	forge::delegate_transaction transaction (test_header (), "delegate");
	auto bytes (forge::serialize_transaction (transaction));
	bytes[0] = 5;
	ASSERT_EQ (nullptr, forge::deserialize_transaction (forge::to_string_hex (bytes)));
}

TEST (transactions, truncated_payload)
{
	forge::delegate_transaction transaction (test_header (), "delegate");
	auto bytes (forge::serialize_transaction (transaction));
	bytes.pop_back ();
	ASSERT_EQ (nullptr, forge::deserialize_transaction (forge::to_string_hex (bytes)));
}

TEST (transactions, trailing_bytes)
{
	forge::second_signature_transaction transaction (test_header (), forge::test_key (5));
	auto bytes (forge::serialize_transaction (transaction));
	bytes.push_back (0);
	ASSERT_EQ (nullptr, forge::deserialize_transaction (forge::to_string_hex (bytes)));
}

TEST (transactions, malformed_hex)
{
	ASSERT_EQ (nullptr, forge::deserialize_transaction ("0"));
	ASSERT_EQ (nullptr, forge::deserialize_transaction ("zz"));
	ASSERT_EQ (nullptr, forge::deserialize_transaction (""));
}

TEST (transactions, hash_changes_with_asset)
{
	forge::delegate_transaction transaction1 (test_header (), "alpha");
	forge::delegate_transaction transaction2 (test_header (), "beta");
	ASSERT_NE (transaction1.hash (), transaction2.hash ());
}

TEST (transactions, type_mismatch_not_equal)
{
	forge::delegate_transaction transaction1 (test_header (), "alpha");
	forge::second_signature_transaction transaction2 (test_header (), forge::test_key (5));
	ASSERT_FALSE (transaction1 == static_cast<forge::transaction const &> (transaction2));
}

// A length prefix larger than the stream fails without allocating the claimed size
TEST (transactions, byte_vector_length_exceeds_stream)
{
	std::vector<uint8_t> bytes;
	{
		forge::vectorstream stream (bytes);
		forge::write (stream, uint32_t (0xfffffff0));
		forge::write (stream, uint8_t (7));
	}
	forge::bufferstream stream (bytes.data (), bytes.size ());
	std::vector<uint8_t> value;
	ASSERT_TRUE (forge::read (stream, value));
	ASSERT_LT (value.size (), 8192);
}

TEST (transactions, byte_vector_spans_chunks)
{
	std::vector<uint8_t> input (10000);
	for (size_t i (0); i < input.size (); ++i)
	{
		input[i] = static_cast<uint8_t> (i * 7);
	}
	std::vector<uint8_t> bytes;
	{
		forge::vectorstream stream (bytes);
		forge::write (stream, input);
	}
	forge::bufferstream stream (bytes.data (), bytes.size ());
	std::vector<uint8_t> output;
	ASSERT_FALSE (forge::read (stream, output));
	ASSERT_EQ (input, output);
	ASSERT_TRUE (forge::at_end (stream));
}
