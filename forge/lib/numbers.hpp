#pragma once

#include <boost/multiprecision/cpp_int.hpp>

#include <array>
#include <string>

namespace forge
{
using uint256_t = boost::multiprecision::uint256_t;
using uint512_t = boost::multiprecision::uint512_t;
// Balances and fees are signed 64 bit counts of the minor unit, a balance may legitimately go negative
using amount = int64_t;
// Add or subtract in place, true if the result does not fit and `total' is left unchanged
bool checked_add (forge::amount & total, forge::amount);
bool checked_subtract (forge::amount & total, forge::amount);
union uint256_union
{
public:
	uint256_union () = default;
	uint256_union (std::string const &);
	uint256_union (uint64_t);
	uint256_union (forge::uint256_t const &);
	bool operator== (forge::uint256_union const &) const;
	bool operator!= (forge::uint256_union const &) const;
	bool operator< (forge::uint256_union const &) const;
	void encode_hex (std::string &) const;
	bool decode_hex (std::string const &);
	void encode_account (std::string &) const;
	std::string to_account () const;
	bool decode_account (std::string const &);
	std::array<uint8_t, 32> bytes;
	std::array<uint32_t, 8> dwords;
	std::array<uint64_t, 4> qwords;
	void clear ();
	bool is_zero () const;
	std::string to_string () const;
	forge::uint256_t number () const;
};
// All keys and hashes are 256 bit.
using block_hash = uint256_union;
using account = uint256_union;
using public_key = uint256_union;
union uint512_union
{
	uint512_union () = default;
	uint512_union (forge::uint512_t const &);
	bool operator== (forge::uint512_union const &) const;
	bool operator!= (forge::uint512_union const &) const;
	void encode_hex (std::string &) const;
	bool decode_hex (std::string const &);
	std::array<uint8_t, 64> bytes;
	std::array<uint64_t, 8> qwords;
	void clear ();
	bool is_zero () const;
	forge::uint512_t number () const;
	std::string to_string () const;
};
// Only signatures are 512 bit, they are carried through but never verified
using signature = uint512_union;

// Account number of the wallet owning public key, a one way BLAKE2b digest of the key
forge::account account_for (forge::public_key const &);
void deterministic_key (forge::uint256_union const &, uint32_t, forge::uint256_union &);
}

namespace std
{
template <>
struct hash<::forge::uint256_union>
{
	size_t operator() (::forge::uint256_union const & data_a) const
	{
		return *reinterpret_cast<size_t const *> (data_a.bytes.data ());
	}
};
}
