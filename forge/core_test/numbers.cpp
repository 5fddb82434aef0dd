#include <gtest/gtest.h>

#include <forge/node/testing.hpp>

#include <limits>

TEST (uint256_union, parse_zero)
{
	forge::uint256_union input (forge::uint256_t (0));
	std::string text;
	input.encode_hex (text);
	ASSERT_EQ (64, text.size ());
	forge::uint256_union output;
	auto error (output.decode_hex (text));
	ASSERT_FALSE (error);
	ASSERT_EQ (input, output);
	ASSERT_TRUE (output.number ().is_zero ());
}

TEST (uint256_union, parse_zero_short)
{
	std::string text ("0");
	forge::uint256_union output;
	auto error (output.decode_hex (text));
	ASSERT_FALSE (error);
	ASSERT_TRUE (output.is_zero ());
}

TEST (uint256_union, parse_error_symbol)
{
	forge::uint256_union input (forge::uint256_t (1000));
	std::string text;
	input.encode_hex (text);
	text[5] = '!';
	forge::uint256_union output;
	ASSERT_TRUE (output.decode_hex (text));
}

TEST (uint256_union, parse_error_overflow)
{
	std::string text (65, '1');
	forge::uint256_union output;
	ASSERT_TRUE (output.decode_hex (text));
	ASSERT_TRUE (output.decode_hex (""));
}

TEST (uint256_union, hex_upper_case)
{
	forge::uint256_union value (0xabcdef);
	auto text (value.to_string ());
	ASSERT_EQ ("ABCDEF", text.substr (58));
	ASSERT_EQ (std::string (58, '0'), text.substr (0, 58));
}

TEST (uint256_union, ordering)
{
	forge::uint256_union small (1);
	forge::uint256_union large (forge::uint256_t (1) << 200);
	ASSERT_TRUE (small < large);
	ASSERT_FALSE (large < small);
	ASSERT_FALSE (small < small);
}

TEST (uint256_union, account_roundtrip)
{
	auto key (forge::test_key (0));
	auto text (key.to_account ());
	ASSERT_EQ (64, text.size ());
	ASSERT_EQ ("frg_", text.substr (0, 4));
	forge::account decoded;
	ASSERT_FALSE (decoded.decode_account (text));
	ASSERT_EQ (key, decoded);
}

TEST (uint256_union, account_bad_checksum)
{
	auto text (forge::test_key (0).to_account ());
	text[text.size () - 1] = text[text.size () - 1] == '1' ? '3' : '1';
	forge::account decoded;
	ASSERT_TRUE (decoded.decode_account (text));
}

TEST (uint256_union, account_bad_prefix)
{
	auto text (forge::test_key (0).to_account ());
	text[0] = 'x';
	forge::account decoded;
	ASSERT_TRUE (decoded.decode_account (text));
	ASSERT_TRUE (decoded.decode_account ("frg_1"));
}

// Digits outside the alphabet are rejected
TEST (uint256_union, account_bad_digit)
{
	auto text (forge::test_key (0).to_account ());
	text[10] = 'l';
	forge::account decoded;
	ASSERT_TRUE (decoded.decode_account (text));
	text[10] = '2';
	ASSERT_TRUE (decoded.decode_account (text));
}

TEST (uint256_union, account_top_bit)
{
	forge::account account (forge::uint256_t (1) << 255);
	auto text (account.to_account ());
	ASSERT_EQ ('3', text[4]);
	forge::account decoded;
	ASSERT_FALSE (decoded.decode_account (text));
	ASSERT_EQ (account, decoded);
	text[4] = '4';
	ASSERT_TRUE (decoded.decode_account (text));
}

TEST (uint512_union, signature_hex)
{
	forge::signature input (forge::uint512_t (12345) << 300);
	auto text (input.to_string ());
	ASSERT_EQ (128, text.size ());
	forge::signature output;
	ASSERT_FALSE (output.decode_hex (text));
	ASSERT_EQ (input, output);
	ASSERT_TRUE (output.decode_hex (std::string (129, '1')));
}

TEST (account_for, deterministic)
{
	auto key (forge::test_key (1));
	ASSERT_EQ (forge::account_for (key), forge::account_for (key));
	ASSERT_NE (key, forge::account_for (key));
	ASSERT_NE (forge::account_for (key), forge::account_for (forge::test_key (2)));
}

TEST (deterministic_key, distinct)
{
	ASSERT_EQ (forge::test_key (7), forge::test_key (7));
	ASSERT_NE (forge::test_key (7), forge::test_key (8));
	ASSERT_FALSE (forge::test_key (0).is_zero ());
}

TEST (amount, checked_arithmetic)
{
	auto max (std::numeric_limits<forge::amount>::max ());
	auto min (std::numeric_limits<forge::amount>::min ());
	forge::amount total (max - 1);
	ASSERT_FALSE (forge::checked_add (total, 1));
	ASSERT_EQ (max, total);
	ASSERT_TRUE (forge::checked_add (total, 1));
	ASSERT_EQ (max, total);
	total = min;
	ASSERT_TRUE (forge::checked_add (total, -1));
	ASSERT_TRUE (forge::checked_subtract (total, 1));
	ASSERT_FALSE (forge::checked_subtract (total, -1));
	ASSERT_EQ (min + 1, total);
	total = 0;
	ASSERT_TRUE (forge::checked_subtract (total, min));
	ASSERT_FALSE (forge::checked_subtract (total, max));
	ASSERT_EQ (-max, total);
}
