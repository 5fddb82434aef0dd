#pragma once

#include <forge/lib/numbers.hpp>

#include <boost/iostreams/device/array.hpp>
#include <boost/iostreams/device/back_inserter.hpp>
#include <boost/iostreams/stream_buffer.hpp>
#include <boost/property_tree/ptree.hpp>

#include <cassert>
#include <memory>
#include <streambuf>
#include <vector>

namespace forge
{
// We operate on streams of uint8_t by convention
using stream = std::basic_streambuf<uint8_t>;
using bufferstream = boost::iostreams::stream_buffer<boost::iostreams::basic_array_source<uint8_t>>;
using vectorstream = boost::iostreams::stream_buffer<boost::iostreams::back_insert_device<std::vector<uint8_t>>>;
// Read a raw byte stream the size of `T' and fill value.
template <typename T>
bool read (forge::stream & stream_a, T & value)
{
	static_assert (std::is_pod<T>::value, "Can't stream read non-standard layout types");
	auto amount_read (stream_a.sgetn (reinterpret_cast<uint8_t *> (&value), sizeof (value)));
	return amount_read != sizeof (value);
}
template <typename T>
void write (forge::stream & stream_a, T const & value)
{
	static_assert (std::is_pod<T>::value, "Can't stream write non-standard layout types");
	auto amount_written (stream_a.sputn (reinterpret_cast<uint8_t const *> (&value), sizeof (value)));
	assert (amount_written == sizeof (value));
}
// Length prefixed string, at most `max' bytes
bool read (forge::stream &, std::string &, size_t max);
void write (forge::stream &, std::string const &);
// Length prefixed byte vector with a 32 bit length
bool read (forge::stream &, std::vector<uint8_t> &);
void write (forge::stream &, std::vector<uint8_t> const &);
bool at_end (forge::stream &);
std::string to_string_hex (std::vector<uint8_t> const &);
bool from_string_hex (std::string const &, std::vector<uint8_t> &);

class transaction_visitor;
enum class transaction_type : uint8_t
{
	transfer = 0,
	second_signature = 1,
	delegate_registration = 2,
	vote = 3,
	multisignature = 4
};
std::string transaction_type_name (forge::transaction_type);
bool transaction_type_parse (std::string const &, forge::transaction_type &);
/**
 * Fields every transaction carries regardless of its type
 */
class transaction_header
{
public:
	transaction_header ();
	transaction_header (uint32_t, forge::public_key const &, forge::account const &, forge::amount, forge::amount);
	transaction_header (bool &, forge::stream &);
	transaction_header (bool &, boost::property_tree::ptree const &);
	void serialize (forge::stream &) const;
	void serialize_json (boost::property_tree::ptree &) const;
	bool operator== (forge::transaction_header const &) const;
	// Seconds since the network epoch
	uint32_t timestamp;
	forge::public_key sender;
	// Zero for types without a recipient
	forge::account recipient;
	forge::amount amount;
	forge::amount fee;
};
class transaction
{
public:
	transaction (forge::transaction_header const &);
	transaction (bool &, forge::stream &);
	transaction (bool &, boost::property_tree::ptree const &);
	virtual ~transaction () = default;
	// Return a digest of the serialized transaction, this is the transaction id
	forge::block_hash hash () const;
	std::string to_json () const;
	void serialize (forge::stream &) const;
	void serialize_json (std::string &) const;
	virtual void serialize_asset (forge::stream &) const = 0;
	virtual void serialize_asset_json (boost::property_tree::ptree &) const = 0;
	virtual void visit (forge::transaction_visitor &) const = 0;
	virtual forge::transaction_type type () const = 0;
	virtual bool operator== (forge::transaction const &) const = 0;
	forge::transaction_header header;
	forge::signature signature;
};
class transfer_transaction : public forge::transaction
{
public:
	transfer_transaction (forge::transaction_header const &, std::string const & = std::string ());
	transfer_transaction (bool &, forge::stream &);
	transfer_transaction (bool &, boost::property_tree::ptree const &);
	virtual ~transfer_transaction () = default;
	void serialize_asset (forge::stream &) const override;
	void serialize_asset_json (boost::property_tree::ptree &) const override;
	void visit (forge::transaction_visitor &) const override;
	forge::transaction_type type () const override;
	bool operator== (forge::transaction const &) const override;
	bool operator== (forge::transfer_transaction const &) const;
	static size_t constexpr vendor_field_max = 64;
	std::string vendor_field;
};
class second_signature_transaction : public forge::transaction
{
public:
	second_signature_transaction (forge::transaction_header const &, forge::public_key const &);
	second_signature_transaction (bool &, forge::stream &);
	second_signature_transaction (bool &, boost::property_tree::ptree const &);
	virtual ~second_signature_transaction () = default;
	void serialize_asset (forge::stream &) const override;
	void serialize_asset_json (boost::property_tree::ptree &) const override;
	void visit (forge::transaction_visitor &) const override;
	forge::transaction_type type () const override;
	bool operator== (forge::transaction const &) const override;
	bool operator== (forge::second_signature_transaction const &) const;
	forge::public_key second_public_key;
};
class delegate_transaction : public forge::transaction
{
public:
	delegate_transaction (forge::transaction_header const &, std::string const &);
	delegate_transaction (bool &, forge::stream &);
	delegate_transaction (bool &, boost::property_tree::ptree const &);
	virtual ~delegate_transaction () = default;
	void serialize_asset (forge::stream &) const override;
	void serialize_asset_json (boost::property_tree::ptree &) const override;
	void visit (forge::transaction_visitor &) const override;
	forge::transaction_type type () const override;
	bool operator== (forge::transaction const &) const override;
	bool operator== (forge::delegate_transaction const &) const;
	static size_t constexpr username_max = 20;
	std::string username;
};
/**
 * One entry of a vote transaction, `add' votes for the delegate, otherwise it removes the vote
 */
class vote_entry
{
public:
	vote_entry ();
	vote_entry (bool, forge::public_key const &);
	bool operator== (forge::vote_entry const &) const;
	// Textual form, "+" or "-" followed by the delegate public key
	std::string to_string () const;
	bool decode (std::string const &);
	bool add;
	forge::public_key delegate;
};
class vote_transaction : public forge::transaction
{
public:
	vote_transaction (forge::transaction_header const &, std::vector<forge::vote_entry> const &);
	vote_transaction (bool &, forge::stream &);
	vote_transaction (bool &, boost::property_tree::ptree const &);
	virtual ~vote_transaction () = default;
	void serialize_asset (forge::stream &) const override;
	void serialize_asset_json (boost::property_tree::ptree &) const override;
	void visit (forge::transaction_visitor &) const override;
	forge::transaction_type type () const override;
	bool operator== (forge::transaction const &) const override;
	bool operator== (forge::vote_transaction const &) const;
	std::vector<forge::vote_entry> votes;
};
class multisignature_asset
{
public:
	multisignature_asset ();
	multisignature_asset (uint8_t, uint8_t, std::vector<forge::public_key> const &);
	void serialize (forge::stream &) const;
	bool deserialize (forge::stream &);
	void serialize_json (boost::property_tree::ptree &) const;
	bool deserialize_json (boost::property_tree::ptree const &);
	bool operator== (forge::multisignature_asset const &) const;
	bool operator!= (forge::multisignature_asset const &) const;
	// Number of keysgroup signatures required
	uint8_t min;
	// Hours a pending multisignature transaction stays valid
	uint8_t lifetime;
	std::vector<forge::public_key> keysgroup;
};
class multisignature_transaction : public forge::transaction
{
public:
	multisignature_transaction (forge::transaction_header const &, forge::multisignature_asset const &);
	multisignature_transaction (bool &, forge::stream &);
	multisignature_transaction (bool &, boost::property_tree::ptree const &);
	virtual ~multisignature_transaction () = default;
	void serialize_asset (forge::stream &) const override;
	void serialize_asset_json (boost::property_tree::ptree &) const override;
	void visit (forge::transaction_visitor &) const override;
	forge::transaction_type type () const override;
	bool operator== (forge::transaction const &) const override;
	bool operator== (forge::multisignature_transaction const &) const;
	forge::multisignature_asset asset;
};
class transaction_visitor
{
public:
	virtual void transfer (forge::transfer_transaction const &) = 0;
	virtual void second_signature (forge::second_signature_transaction const &) = 0;
	virtual void delegate_registration (forge::delegate_transaction const &) = 0;
	virtual void vote (forge::vote_transaction const &) = 0;
	virtual void multisignature (forge::multisignature_transaction const &) = 0;
	virtual ~transaction_visitor () = default;
};
std::unique_ptr<forge::transaction> deserialize_transaction (forge::stream &);
std::unique_ptr<forge::transaction> deserialize_transaction (forge::stream &, forge::transaction_type);
// Decode the hex form of a serialized transaction, trailing bytes are rejected
std::unique_ptr<forge::transaction> deserialize_transaction (std::string const &);
std::unique_ptr<forge::transaction> deserialize_transaction_json (boost::property_tree::ptree const &);
void serialize_transaction (forge::stream &, forge::transaction const &);
std::vector<uint8_t> serialize_transaction (forge::transaction const &);
}
