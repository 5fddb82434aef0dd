#include <forge/lib/transactions.hpp>

#include <blake2.h>

#include <boost/property_tree/json_parser.hpp>

#include <algorithm>
#include <iomanip>
#include <sstream>

size_t constexpr forge::transfer_transaction::vendor_field_max;
size_t constexpr forge::delegate_transaction::username_max;

bool forge::read (forge::stream & stream_a, std::string & value_a, size_t max_a)
{
	uint8_t size;
	auto error (forge::read (stream_a, size));
	if (!error)
	{
		error = size > max_a;
		if (!error)
		{
			value_a.resize (size);
			auto amount_read (stream_a.sgetn (reinterpret_cast<uint8_t *> (&value_a[0]), size));
			error = amount_read != size;
		}
	}
	return error;
}

void forge::write (forge::stream & stream_a, std::string const & value_a)
{
	assert (value_a.size () <= std::numeric_limits<uint8_t>::max ());
	uint8_t size (value_a.size ());
	forge::write (stream_a, size);
	auto amount_written (stream_a.sputn (reinterpret_cast<uint8_t const *> (value_a.data ()), value_a.size ()));
	assert (amount_written == value_a.size ());
}

bool forge::read (forge::stream & stream_a, std::vector<uint8_t> & value_a)
{
	uint32_t size;
	auto error (forge::read (stream_a, size));
	value_a.clear ();
	// Grow chunk by chunk, a corrupt length runs out of stream before it runs out of memory
	size_t const chunk_max (4096);
	while (!error && value_a.size () < size)
	{
		auto offset (value_a.size ());
		auto chunk (std::min<size_t> (size - offset, chunk_max));
		value_a.resize (offset + chunk);
		auto amount_read (stream_a.sgetn (value_a.data () + offset, chunk));
		error = static_cast<size_t> (amount_read) != chunk;
	}
	return error;
}

void forge::write (forge::stream & stream_a, std::vector<uint8_t> const & value_a)
{
	uint32_t size (value_a.size ());
	forge::write (stream_a, size);
	auto amount_written (stream_a.sputn (value_a.data (), value_a.size ()));
	assert (amount_written == value_a.size ());
}

bool forge::at_end (forge::stream & stream_a)
{
	uint8_t junk;
	auto end (forge::read (stream_a, junk));
	return end;
}

std::string forge::to_string_hex (std::vector<uint8_t> const & bytes_a)
{
	std::stringstream stream;
	stream << std::hex << std::uppercase << std::noshowbase << std::setfill ('0');
	for (auto i : bytes_a)
	{
		stream << std::setw (2) << static_cast<unsigned> (i);
	}
	return stream.str ();
}

bool forge::from_string_hex (std::string const & text_a, std::vector<uint8_t> & bytes_a)
{
	auto error (text_a.size () % 2 != 0);
	if (!error)
	{
		bytes_a.clear ();
		bytes_a.reserve (text_a.size () / 2);
		for (size_t i (0), n (text_a.size ()); !error && i < n; i += 2)
		{
			auto pair (text_a.substr (i, 2));
			error = !std::isxdigit (static_cast<unsigned char> (pair[0])) || !std::isxdigit (static_cast<unsigned char> (pair[1]));
			if (!error)
			{
				bytes_a.push_back (static_cast<uint8_t> (std::stoul (pair, nullptr, 16)));
			}
		}
	}
	return error;
}

std::string forge::transaction_type_name (forge::transaction_type type_a)
{
	std::string result;
	switch (type_a)
	{
		case forge::transaction_type::transfer:
			result = "transfer";
			break;
		case forge::transaction_type::second_signature:
			result = "second_signature";
			break;
		case forge::transaction_type::delegate_registration:
			result = "delegate_registration";
			break;
		case forge::transaction_type::vote:
			result = "vote";
			break;
		case forge::transaction_type::multisignature:
			result = "multisignature";
			break;
	}
	return result;
}

bool forge::transaction_type_parse (std::string const & name_a, forge::transaction_type & type_a)
{
	auto error (false);
	if (name_a == "transfer")
	{
		type_a = forge::transaction_type::transfer;
	}
	else if (name_a == "second_signature")
	{
		type_a = forge::transaction_type::second_signature;
	}
	else if (name_a == "delegate_registration")
	{
		type_a = forge::transaction_type::delegate_registration;
	}
	else if (name_a == "vote")
	{
		type_a = forge::transaction_type::vote;
	}
	else if (name_a == "multisignature")
	{
		type_a = forge::transaction_type::multisignature;
	}
	else
	{
		error = true;
	}
	return error;
}

forge::transaction_header::transaction_header () :
timestamp (0),
sender (0),
recipient (0),
amount (0),
fee (0)
{
}

forge::transaction_header::transaction_header (uint32_t timestamp_a, forge::public_key const & sender_a, forge::account const & recipient_a, forge::amount amount_a, forge::amount fee_a) :
timestamp (timestamp_a),
sender (sender_a),
recipient (recipient_a),
amount (amount_a),
fee (fee_a)
{
}

forge::transaction_header::transaction_header (bool & error_a, forge::stream & stream_a)
{
	error_a = forge::read (stream_a, timestamp);
	if (!error_a)
	{
		error_a = forge::read (stream_a, sender.bytes);
		if (!error_a)
		{
			error_a = forge::read (stream_a, recipient.bytes);
			if (!error_a)
			{
				error_a = forge::read (stream_a, amount);
				if (!error_a)
				{
					error_a = forge::read (stream_a, fee);
				}
			}
		}
	}
}

forge::transaction_header::transaction_header (bool & error_a, boost::property_tree::ptree const & tree_a) :
recipient (0)
{
	try
	{
		timestamp = tree_a.get<uint32_t> ("timestamp");
		amount = tree_a.get<forge::amount> ("amount");
		fee = tree_a.get<forge::amount> ("fee");
		auto sender_l (tree_a.get<std::string> ("sender"));
		error_a = sender.decode_hex (sender_l);
		if (!error_a)
		{
			auto recipient_l (tree_a.get_optional<std::string> ("recipient"));
			if (recipient_l)
			{
				error_a = recipient.decode_account (*recipient_l);
			}
		}
	}
	catch (std::runtime_error const &)
	{
		error_a = true;
	}
}

void forge::transaction_header::serialize (forge::stream & stream_a) const
{
	forge::write (stream_a, timestamp);
	forge::write (stream_a, sender.bytes);
	forge::write (stream_a, recipient.bytes);
	forge::write (stream_a, amount);
	forge::write (stream_a, fee);
}

void forge::transaction_header::serialize_json (boost::property_tree::ptree & tree_a) const
{
	tree_a.put ("timestamp", timestamp);
	tree_a.put ("sender", sender.to_string ());
	if (!recipient.is_zero ())
	{
		tree_a.put ("recipient", recipient.to_account ());
	}
	tree_a.put ("amount", amount);
	tree_a.put ("fee", fee);
}

bool forge::transaction_header::operator== (forge::transaction_header const & other_a) const
{
	return timestamp == other_a.timestamp && sender == other_a.sender && recipient == other_a.recipient && amount == other_a.amount && fee == other_a.fee;
}

forge::transaction::transaction (forge::transaction_header const & header_a) :
header (header_a),
signature (0)
{
}

forge::transaction::transaction (bool & error_a, forge::stream & stream_a) :
header (error_a, stream_a)
{
	if (!error_a)
	{
		error_a = forge::read (stream_a, signature.bytes);
	}
}

forge::transaction::transaction (bool & error_a, boost::property_tree::ptree const & tree_a) :
header (error_a, tree_a),
signature (0)
{
	if (!error_a)
	{
		auto signature_l (tree_a.get_optional<std::string> ("signature"));
		if (signature_l)
		{
			error_a = signature.decode_hex (*signature_l);
		}
	}
}

forge::block_hash forge::transaction::hash () const
{
	forge::uint256_union result;
	auto bytes (forge::serialize_transaction (*this));
	blake2b_state hash_l;
	auto status (blake2b_init (&hash_l, sizeof (result.bytes)));
	assert (status == 0);
	status = blake2b_update (&hash_l, bytes.data (), bytes.size ());
	assert (status == 0);
	status = blake2b_final (&hash_l, result.bytes.data (), sizeof (result.bytes));
	assert (status == 0);
	return result;
}

std::string forge::transaction::to_json () const
{
	std::string result;
	serialize_json (result);
	return result;
}

void forge::transaction::serialize (forge::stream & stream_a) const
{
	header.serialize (stream_a);
	forge::write (stream_a, signature.bytes);
	serialize_asset (stream_a);
}

void forge::transaction::serialize_json (std::string & string_a) const
{
	boost::property_tree::ptree tree;
	tree.put ("type", forge::transaction_type_name (type ()));
	header.serialize_json (tree);
	tree.put ("signature", signature.to_string ());
	serialize_asset_json (tree);
	std::stringstream ostream;
	boost::property_tree::write_json (ostream, tree);
	string_a = ostream.str ();
}

forge::transfer_transaction::transfer_transaction (forge::transaction_header const & header_a, std::string const & vendor_field_a) :
transaction (header_a),
vendor_field (vendor_field_a)
{
	assert (vendor_field.size () <= vendor_field_max);
}

forge::transfer_transaction::transfer_transaction (bool & error_a, forge::stream & stream_a) :
transaction (error_a, stream_a)
{
	if (!error_a)
	{
		error_a = forge::read (stream_a, vendor_field, vendor_field_max);
	}
}

forge::transfer_transaction::transfer_transaction (bool & error_a, boost::property_tree::ptree const & tree_a) :
transaction (error_a, tree_a)
{
	if (!error_a)
	{
		vendor_field = tree_a.get<std::string> ("vendor_field", "");
		error_a = vendor_field.size () > vendor_field_max || header.recipient.is_zero ();
	}
}

void forge::transfer_transaction::serialize_asset (forge::stream & stream_a) const
{
	forge::write (stream_a, vendor_field);
}

void forge::transfer_transaction::serialize_asset_json (boost::property_tree::ptree & tree_a) const
{
	if (!vendor_field.empty ())
	{
		tree_a.put ("vendor_field", vendor_field);
	}
}

void forge::transfer_transaction::visit (forge::transaction_visitor & visitor_a) const
{
	visitor_a.transfer (*this);
}

forge::transaction_type forge::transfer_transaction::type () const
{
	return forge::transaction_type::transfer;
}

bool forge::transfer_transaction::operator== (forge::transaction const & other_a) const
{
	auto other_l (dynamic_cast<forge::transfer_transaction const *> (&other_a));
	auto result (other_l != nullptr);
	if (result)
	{
		result = *this == *other_l;
	}
	return result;
}

bool forge::transfer_transaction::operator== (forge::transfer_transaction const & other_a) const
{
	return header == other_a.header && signature == other_a.signature && vendor_field == other_a.vendor_field;
}

forge::second_signature_transaction::second_signature_transaction (forge::transaction_header const & header_a, forge::public_key const & second_public_key_a) :
transaction (header_a),
second_public_key (second_public_key_a)
{
}

forge::second_signature_transaction::second_signature_transaction (bool & error_a, forge::stream & stream_a) :
transaction (error_a, stream_a)
{
	if (!error_a)
	{
		error_a = forge::read (stream_a, second_public_key.bytes);
	}
}

forge::second_signature_transaction::second_signature_transaction (bool & error_a, boost::property_tree::ptree const & tree_a) :
transaction (error_a, tree_a)
{
	if (!error_a)
	{
		try
		{
			error_a = second_public_key.decode_hex (tree_a.get<std::string> ("public_key"));
		}
		catch (std::runtime_error const &)
		{
			error_a = true;
		}
	}
}

void forge::second_signature_transaction::serialize_asset (forge::stream & stream_a) const
{
	forge::write (stream_a, second_public_key.bytes);
}

void forge::second_signature_transaction::serialize_asset_json (boost::property_tree::ptree & tree_a) const
{
	tree_a.put ("public_key", second_public_key.to_string ());
}

void forge::second_signature_transaction::visit (forge::transaction_visitor & visitor_a) const
{
	visitor_a.second_signature (*this);
}

forge::transaction_type forge::second_signature_transaction::type () const
{
	return forge::transaction_type::second_signature;
}

bool forge::second_signature_transaction::operator== (forge::transaction const & other_a) const
{
	auto other_l (dynamic_cast<forge::second_signature_transaction const *> (&other_a));
	auto result (other_l != nullptr);
	if (result)
	{
		result = *this == *other_l;
	}
	return result;
}

bool forge::second_signature_transaction::operator== (forge::second_signature_transaction const & other_a) const
{
	return header == other_a.header && signature == other_a.signature && second_public_key == other_a.second_public_key;
}

forge::delegate_transaction::delegate_transaction (forge::transaction_header const & header_a, std::string const & username_a) :
transaction (header_a),
username (username_a)
{
	assert (!username.empty () && username.size () <= username_max);
}

forge::delegate_transaction::delegate_transaction (bool & error_a, forge::stream & stream_a) :
transaction (error_a, stream_a)
{
	if (!error_a)
	{
		error_a = forge::read (stream_a, username, username_max);
		if (!error_a)
		{
			error_a = username.empty ();
		}
	}
}

forge::delegate_transaction::delegate_transaction (bool & error_a, boost::property_tree::ptree const & tree_a) :
transaction (error_a, tree_a)
{
	if (!error_a)
	{
		username = tree_a.get<std::string> ("username", "");
		error_a = username.empty () || username.size () > username_max;
	}
}

void forge::delegate_transaction::serialize_asset (forge::stream & stream_a) const
{
	forge::write (stream_a, username);
}

void forge::delegate_transaction::serialize_asset_json (boost::property_tree::ptree & tree_a) const
{
	tree_a.put ("username", username);
}

void forge::delegate_transaction::visit (forge::transaction_visitor & visitor_a) const
{
	visitor_a.delegate_registration (*this);
}

forge::transaction_type forge::delegate_transaction::type () const
{
	return forge::transaction_type::delegate_registration;
}

bool forge::delegate_transaction::operator== (forge::transaction const & other_a) const
{
	auto other_l (dynamic_cast<forge::delegate_transaction const *> (&other_a));
	auto result (other_l != nullptr);
	if (result)
	{
		result = *this == *other_l;
	}
	return result;
}

bool forge::delegate_transaction::operator== (forge::delegate_transaction const & other_a) const
{
	return header == other_a.header && signature == other_a.signature && username == other_a.username;
}

forge::vote_entry::vote_entry () :
add (true),
delegate (0)
{
}

forge::vote_entry::vote_entry (bool add_a, forge::public_key const & delegate_a) :
add (add_a),
delegate (delegate_a)
{
}

bool forge::vote_entry::operator== (forge::vote_entry const & other_a) const
{
	return add == other_a.add && delegate == other_a.delegate;
}

std::string forge::vote_entry::to_string () const
{
	return (add ? "+" : "-") + delegate.to_string ();
}

bool forge::vote_entry::decode (std::string const & text_a)
{
	auto error (text_a.size () < 2 || (text_a[0] != '+' && text_a[0] != '-'));
	if (!error)
	{
		add = text_a[0] == '+';
		error = delegate.decode_hex (text_a.substr (1));
	}
	return error;
}

forge::vote_transaction::vote_transaction (forge::transaction_header const & header_a, std::vector<forge::vote_entry> const & votes_a) :
transaction (header_a),
votes (votes_a)
{
	assert (!votes.empty () && votes.size () <= std::numeric_limits<uint8_t>::max ());
}

forge::vote_transaction::vote_transaction (bool & error_a, forge::stream & stream_a) :
transaction (error_a, stream_a)
{
	if (!error_a)
	{
		uint8_t count;
		error_a = forge::read (stream_a, count);
		if (!error_a)
		{
			error_a = count == 0;
			for (auto i (0); !error_a && i < count; ++i)
			{
				uint8_t add;
				forge::vote_entry entry;
				error_a = forge::read (stream_a, add);
				if (!error_a)
				{
					error_a = add > 1;
					if (!error_a)
					{
						entry.add = add == 1;
						error_a = forge::read (stream_a, entry.delegate.bytes);
						if (!error_a)
						{
							votes.push_back (entry);
						}
					}
				}
			}
		}
	}
}

forge::vote_transaction::vote_transaction (bool & error_a, boost::property_tree::ptree const & tree_a) :
transaction (error_a, tree_a)
{
	if (!error_a)
	{
		try
		{
			for (auto & i : tree_a.get_child ("votes"))
			{
				forge::vote_entry entry;
				error_a = error_a || entry.decode (i.second.get<std::string> (""));
				votes.push_back (entry);
			}
			error_a = error_a || votes.empty () || votes.size () > std::numeric_limits<uint8_t>::max ();
		}
		catch (std::runtime_error const &)
		{
			error_a = true;
		}
	}
}

void forge::vote_transaction::serialize_asset (forge::stream & stream_a) const
{
	uint8_t count (votes.size ());
	forge::write (stream_a, count);
	for (auto & i : votes)
	{
		uint8_t add (i.add ? 1 : 0);
		forge::write (stream_a, add);
		forge::write (stream_a, i.delegate.bytes);
	}
}

void forge::vote_transaction::serialize_asset_json (boost::property_tree::ptree & tree_a) const
{
	boost::property_tree::ptree votes_l;
	for (auto & i : votes)
	{
		boost::property_tree::ptree entry;
		entry.put ("", i.to_string ());
		votes_l.push_back (std::make_pair ("", entry));
	}
	tree_a.add_child ("votes", votes_l);
}

void forge::vote_transaction::visit (forge::transaction_visitor & visitor_a) const
{
	visitor_a.vote (*this);
}

forge::transaction_type forge::vote_transaction::type () const
{
	return forge::transaction_type::vote;
}

bool forge::vote_transaction::operator== (forge::transaction const & other_a) const
{
	auto other_l (dynamic_cast<forge::vote_transaction const *> (&other_a));
	auto result (other_l != nullptr);
	if (result)
	{
		result = *this == *other_l;
	}
	return result;
}

bool forge::vote_transaction::operator== (forge::vote_transaction const & other_a) const
{
	return header == other_a.header && signature == other_a.signature && votes == other_a.votes;
}

forge::multisignature_asset::multisignature_asset () :
min (0),
lifetime (0)
{
}

forge::multisignature_asset::multisignature_asset (uint8_t min_a, uint8_t lifetime_a, std::vector<forge::public_key> const & keysgroup_a) :
min (min_a),
lifetime (lifetime_a),
keysgroup (keysgroup_a)
{
}

void forge::multisignature_asset::serialize (forge::stream & stream_a) const
{
	forge::write (stream_a, min);
	forge::write (stream_a, lifetime);
	uint8_t count (keysgroup.size ());
	forge::write (stream_a, count);
	for (auto & i : keysgroup)
	{
		forge::write (stream_a, i.bytes);
	}
}

bool forge::multisignature_asset::deserialize (forge::stream & stream_a)
{
	keysgroup.clear ();
	auto error (forge::read (stream_a, min));
	if (!error)
	{
		error = forge::read (stream_a, lifetime);
		if (!error)
		{
			uint8_t count;
			error = forge::read (stream_a, count);
			for (auto i (0); !error && i < count; ++i)
			{
				forge::public_key key;
				error = forge::read (stream_a, key.bytes);
				keysgroup.push_back (key);
			}
			if (!error)
			{
				error = min == 0 || min > keysgroup.size ();
			}
		}
	}
	return error;
}

void forge::multisignature_asset::serialize_json (boost::property_tree::ptree & tree_a) const
{
	tree_a.put ("min", min);
	tree_a.put ("lifetime", lifetime);
	boost::property_tree::ptree keysgroup_l;
	for (auto & i : keysgroup)
	{
		boost::property_tree::ptree entry;
		entry.put ("", i.to_string ());
		keysgroup_l.push_back (std::make_pair ("", entry));
	}
	tree_a.add_child ("keysgroup", keysgroup_l);
}

bool forge::multisignature_asset::deserialize_json (boost::property_tree::ptree const & tree_a)
{
	auto error (false);
	keysgroup.clear ();
	try
	{
		auto min_l (tree_a.get<unsigned> ("min"));
		auto lifetime_l (tree_a.get<unsigned> ("lifetime"));
		for (auto & i : tree_a.get_child ("keysgroup"))
		{
			forge::public_key key;
			error = error || key.decode_hex (i.second.get<std::string> (""));
			keysgroup.push_back (key);
		}
		error = error || min_l == 0 || min_l > keysgroup.size () || lifetime_l > std::numeric_limits<uint8_t>::max () || keysgroup.size () > std::numeric_limits<uint8_t>::max ();
		if (!error)
		{
			min = min_l;
			lifetime = lifetime_l;
		}
	}
	catch (std::runtime_error const &)
	{
		error = true;
	}
	return error;
}

bool forge::multisignature_asset::operator== (forge::multisignature_asset const & other_a) const
{
	return min == other_a.min && lifetime == other_a.lifetime && keysgroup == other_a.keysgroup;
}

bool forge::multisignature_asset::operator!= (forge::multisignature_asset const & other_a) const
{
	return !(*this == other_a);
}

forge::multisignature_transaction::multisignature_transaction (forge::transaction_header const & header_a, forge::multisignature_asset const & asset_a) :
transaction (header_a),
asset (asset_a)
{
}

forge::multisignature_transaction::multisignature_transaction (bool & error_a, forge::stream & stream_a) :
transaction (error_a, stream_a)
{
	if (!error_a)
	{
		error_a = asset.deserialize (stream_a);
	}
}

forge::multisignature_transaction::multisignature_transaction (bool & error_a, boost::property_tree::ptree const & tree_a) :
transaction (error_a, tree_a)
{
	if (!error_a)
	{
		error_a = asset.deserialize_json (tree_a);
	}
}

void forge::multisignature_transaction::serialize_asset (forge::stream & stream_a) const
{
	asset.serialize (stream_a);
}

void forge::multisignature_transaction::serialize_asset_json (boost::property_tree::ptree & tree_a) const
{
	asset.serialize_json (tree_a);
}

void forge::multisignature_transaction::visit (forge::transaction_visitor & visitor_a) const
{
	visitor_a.multisignature (*this);
}

forge::transaction_type forge::multisignature_transaction::type () const
{
	return forge::transaction_type::multisignature;
}

bool forge::multisignature_transaction::operator== (forge::transaction const & other_a) const
{
	auto other_l (dynamic_cast<forge::multisignature_transaction const *> (&other_a));
	auto result (other_l != nullptr);
	if (result)
	{
		result = *this == *other_l;
	}
	return result;
}

bool forge::multisignature_transaction::operator== (forge::multisignature_transaction const & other_a) const
{
	return header == other_a.header && signature == other_a.signature && asset == other_a.asset;
}

std::unique_ptr<forge::transaction> forge::deserialize_transaction (forge::stream & stream_a)
{
	std::unique_ptr<forge::transaction> result;
	uint8_t type;
	auto error (forge::read (stream_a, type));
	if (!error && type <= static_cast<uint8_t> (forge::transaction_type::multisignature))
	{
		result = forge::deserialize_transaction (stream_a, static_cast<forge::transaction_type> (type));
	}
	return result;
}

std::unique_ptr<forge::transaction> forge::deserialize_transaction (forge::stream & stream_a, forge::transaction_type type_a)
{
	std::unique_ptr<forge::transaction> result;
	bool error;
	switch (type_a)
	{
		case forge::transaction_type::transfer:
		{
			std::unique_ptr<forge::transfer_transaction> obj (new forge::transfer_transaction (error, stream_a));
			if (!error)
			{
				result = std::move (obj);
			}
			break;
		}
		case forge::transaction_type::second_signature:
		{
			std::unique_ptr<forge::second_signature_transaction> obj (new forge::second_signature_transaction (error, stream_a));
			if (!error)
			{
				result = std::move (obj);
			}
			break;
		}
		case forge::transaction_type::delegate_registration:
		{
			std::unique_ptr<forge::delegate_transaction> obj (new forge::delegate_transaction (error, stream_a));
			if (!error)
			{
				result = std::move (obj);
			}
			break;
		}
		case forge::transaction_type::vote:
		{
			std::unique_ptr<forge::vote_transaction> obj (new forge::vote_transaction (error, stream_a));
			if (!error)
			{
				result = std::move (obj);
			}
			break;
		}
		case forge::transaction_type::multisignature:
		{
			std::unique_ptr<forge::multisignature_transaction> obj (new forge::multisignature_transaction (error, stream_a));
			if (!error)
			{
				result = std::move (obj);
			}
			break;
		}
	}
	return result;
}

std::unique_ptr<forge::transaction> forge::deserialize_transaction (std::string const & hex_a)
{
	std::unique_ptr<forge::transaction> result;
	std::vector<uint8_t> bytes;
	if (!forge::from_string_hex (hex_a, bytes))
	{
		forge::bufferstream stream (bytes.data (), bytes.size ());
		result = forge::deserialize_transaction (stream);
		if (result != nullptr && !forge::at_end (stream))
		{
			result.reset ();
		}
	}
	return result;
}

std::unique_ptr<forge::transaction> forge::deserialize_transaction_json (boost::property_tree::ptree const & tree_a)
{
	std::unique_ptr<forge::transaction> result;
	forge::transaction_type type;
	auto error (forge::transaction_type_parse (tree_a.get<std::string> ("type", ""), type));
	if (!error)
	{
		switch (type)
		{
			case forge::transaction_type::transfer:
			{
				std::unique_ptr<forge::transfer_transaction> obj (new forge::transfer_transaction (error, tree_a));
				if (!error)
				{
					result = std::move (obj);
				}
				break;
			}
			case forge::transaction_type::second_signature:
			{
				std::unique_ptr<forge::second_signature_transaction> obj (new forge::second_signature_transaction (error, tree_a));
				if (!error)
				{
					result = std::move (obj);
				}
				break;
			}
			case forge::transaction_type::delegate_registration:
			{
				std::unique_ptr<forge::delegate_transaction> obj (new forge::delegate_transaction (error, tree_a));
				if (!error)
				{
					result = std::move (obj);
				}
				break;
			}
			case forge::transaction_type::vote:
			{
				std::unique_ptr<forge::vote_transaction> obj (new forge::vote_transaction (error, tree_a));
				if (!error)
				{
					result = std::move (obj);
				}
				break;
			}
			case forge::transaction_type::multisignature:
			{
				std::unique_ptr<forge::multisignature_transaction> obj (new forge::multisignature_transaction (error, tree_a));
				if (!error)
				{
					result = std::move (obj);
				}
				break;
			}
		}
	}
	return result;
}

void forge::serialize_transaction (forge::stream & stream_a, forge::transaction const & transaction_a)
{
	forge::write (stream_a, transaction_a.type ());
	transaction_a.serialize (stream_a);
}

std::vector<uint8_t> forge::serialize_transaction (forge::transaction const & transaction_a)
{
	std::vector<uint8_t> result;
	{
		forge::vectorstream stream (result);
		forge::serialize_transaction (stream, transaction_a);
	}
	return result;
}
