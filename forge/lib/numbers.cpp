#include <forge/lib/numbers.hpp>

#include <blake2.h>

#include <algorithm>
#include <cassert>
#include <iomanip>
#include <limits>
#include <sstream>
#include <vector>

namespace
{
char const * account_alphabet ("13456789abcdefghijkmnopqrstuwxyz");
std::string const account_prefix ("frg_");
// Four zero bits, the 256 account bits and a 40 bit checksum in 5 bit digits
size_t const account_digits (60);

std::array<uint8_t, 5> account_checksum (forge::uint256_union const & account_a)
{
	std::array<uint8_t, 5> result;
	blake2b_state hash;
	blake2b_init (&hash, result.size ());
	blake2b_update (&hash, account_a.bytes.data (), account_a.bytes.size ());
	blake2b_final (&hash, result.data (), result.size ());
	return result;
}

// 32 if `digit' is not part of the alphabet
uint8_t account_digit_value (char digit_a)
{
	auto end (account_alphabet + 32);
	return static_cast<uint8_t> (std::find (account_alphabet, end, digit_a) - account_alphabet);
}
}

void forge::uint256_union::encode_account (std::string & destination_a) const
{
	assert (destination_a.empty ());
	std::vector<uint8_t> payload (bytes.begin (), bytes.end ());
	auto checksum (account_checksum (*this));
	payload.insert (payload.end (), checksum.begin (), checksum.end ());
	destination_a.reserve (account_prefix.size () + account_digits);
	destination_a.append (account_prefix);
	uint32_t buffer (0);
	unsigned bits (4);
	for (auto byte : payload)
	{
		buffer = (buffer << 8) | byte;
		bits += 8;
		while (bits >= 5)
		{
			bits -= 5;
			destination_a.push_back (account_alphabet[(buffer >> bits) & 0x1f]);
		}
	}
}

std::string forge::uint256_union::to_account () const
{
	std::string result;
	encode_account (result);
	return result;
}

bool forge::uint256_union::decode_account (std::string const & source_a)
{
	auto error (source_a.size () != account_prefix.size () + account_digits || source_a.compare (0, account_prefix.size (), account_prefix) != 0);
	std::vector<uint8_t> payload;
	if (!error)
	{
		// The leading digit carries the padding and the top account bit
		uint32_t buffer (account_digit_value (source_a[account_prefix.size ()]));
		unsigned bits (1);
		error = buffer > 1;
		for (auto i (source_a.begin () + account_prefix.size () + 1), n (source_a.end ()); !error && i != n; ++i)
		{
			auto value (account_digit_value (*i));
			error = value >= 32;
			buffer = (buffer << 5) | value;
			bits += 5;
			if (bits >= 8)
			{
				bits -= 8;
				payload.push_back ((buffer >> bits) & 0xff);
			}
		}
	}
	if (!error)
	{
		assert (payload.size () == 37);
		forge::uint256_union account;
		std::copy (payload.begin (), payload.begin () + account.bytes.size (), account.bytes.begin ());
		auto checksum (account_checksum (account));
		error = !std::equal (checksum.begin (), checksum.end (), payload.begin () + account.bytes.size ());
		if (!error)
		{
			*this = account;
		}
	}
	return error;
}

forge::uint256_union::uint256_union (forge::uint256_t const & number_a)
{
	forge::uint256_t number_l (number_a);
	for (auto i (bytes.rbegin ()), n (bytes.rend ()); i != n; ++i)
	{
		*i = ((number_l)&0xff).convert_to<uint8_t> ();
		number_l >>= 8;
	}
}

bool forge::uint256_union::operator== (forge::uint256_union const & other_a) const
{
	return bytes == other_a.bytes;
}

bool forge::uint256_union::is_zero () const
{
	return qwords[0] == 0 && qwords[1] == 0 && qwords[2] == 0 && qwords[3] == 0;
}

std::string forge::uint256_union::to_string () const
{
	std::string result;
	encode_hex (result);
	return result;
}

bool forge::uint256_union::operator< (forge::uint256_union const & other_a) const
{
	return number () < other_a.number ();
}

forge::uint256_union::uint256_union (std::string const & hex_a)
{
	decode_hex (hex_a);
}

void forge::uint256_union::clear ()
{
	qwords.fill (0);
}

forge::uint256_t forge::uint256_union::number () const
{
	forge::uint256_t result;
	auto shift (0);
	for (auto i (bytes.begin ()), n (bytes.end ()); i != n; ++i)
	{
		result <<= shift;
		result |= *i;
		shift = 8;
	}
	return result;
}

void forge::uint256_union::encode_hex (std::string & text) const
{
	assert (text.empty ());
	std::stringstream stream;
	stream << std::hex << std::uppercase << std::noshowbase << std::setw (64) << std::setfill ('0');
	stream << number ();
	text = stream.str ();
}

bool forge::uint256_union::decode_hex (std::string const & text)
{
	auto error (false);
	if (!text.empty () && text.size () <= 64)
	{
		std::stringstream stream (text);
		stream << std::hex << std::noshowbase;
		forge::uint256_t number_l;
		try
		{
			stream >> number_l;
			*this = number_l;
			if (!stream.eof ())
			{
				error = true;
			}
		}
		catch (std::runtime_error &)
		{
			error = true;
		}
	}
	else
	{
		error = true;
	}
	return error;
}

forge::uint256_union::uint256_union (uint64_t value0)
{
	*this = forge::uint256_t (value0);
}

bool forge::uint256_union::operator!= (forge::uint256_union const & other_a) const
{
	return !(*this == other_a);
}

forge::uint512_union::uint512_union (forge::uint512_t const & number_a)
{
	forge::uint512_t number_l (number_a);
	for (auto i (bytes.rbegin ()), n (bytes.rend ()); i != n; ++i)
	{
		*i = ((number_l)&0xff).convert_to<uint8_t> ();
		number_l >>= 8;
	}
}

bool forge::uint512_union::operator== (forge::uint512_union const & other_a) const
{
	return bytes == other_a.bytes;
}

bool forge::uint512_union::operator!= (forge::uint512_union const & other_a) const
{
	return !(*this == other_a);
}

void forge::uint512_union::clear ()
{
	bytes.fill (0);
}

bool forge::uint512_union::is_zero () const
{
	return std::all_of (qwords.begin (), qwords.end (), [](uint64_t qword_a) { return qword_a == 0; });
}

forge::uint512_t forge::uint512_union::number () const
{
	forge::uint512_t result;
	for (auto i : bytes)
	{
		result <<= 8;
		result |= i;
	}
	return result;
}

void forge::uint512_union::encode_hex (std::string & text) const
{
	assert (text.empty ());
	std::stringstream stream;
	stream << std::hex << std::uppercase << std::noshowbase << std::setw (128) << std::setfill ('0');
	stream << number ();
	text = stream.str ();
}

bool forge::uint512_union::decode_hex (std::string const & text)
{
	auto error (text.empty () || text.size () > 128);
	if (!error)
	{
		std::stringstream stream (text);
		stream << std::hex << std::noshowbase;
		forge::uint512_t number_l;
		try
		{
			stream >> number_l;
			*this = number_l;
			error = !stream.eof ();
		}
		catch (std::runtime_error &)
		{
			error = true;
		}
	}
	return error;
}

std::string forge::uint512_union::to_string () const
{
	std::string result;
	encode_hex (result);
	return result;
}

bool forge::checked_add (forge::amount & total_a, forge::amount value_a)
{
	auto error (value_a > 0 ? total_a > std::numeric_limits<forge::amount>::max () - value_a : total_a < std::numeric_limits<forge::amount>::min () - value_a);
	if (!error)
	{
		total_a += value_a;
	}
	return error;
}

bool forge::checked_subtract (forge::amount & total_a, forge::amount value_a)
{
	auto error (value_a > 0 ? total_a < std::numeric_limits<forge::amount>::min () + value_a : total_a > std::numeric_limits<forge::amount>::max () + value_a);
	if (!error)
	{
		total_a -= value_a;
	}
	return error;
}

forge::account forge::account_for (forge::public_key const & key_a)
{
	forge::account result;
	blake2b_state hash;
	blake2b_init (&hash, result.bytes.size ());
	blake2b_update (&hash, key_a.bytes.data (), key_a.bytes.size ());
	blake2b_final (&hash, result.bytes.data (), result.bytes.size ());
	return result;
}

void forge::deterministic_key (forge::uint256_union const & seed_a, uint32_t index_a, forge::uint256_union & prv_a)
{
	blake2b_state hash;
	blake2b_init (&hash, prv_a.bytes.size ());
	blake2b_update (&hash, seed_a.bytes.data (), seed_a.bytes.size ());
	forge::uint256_union index (index_a);
	blake2b_update (&hash, reinterpret_cast<uint8_t *> (&index.dwords[7]), sizeof (uint32_t));
	blake2b_final (&hash, prv_a.bytes.data (), prv_a.bytes.size ());
}
