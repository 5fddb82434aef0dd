#include <forge/common.hpp>

#include <blake2.h>

#include <algorithm>

// Genesis keys for network variants
namespace
{
char const * test_public_key_data = "3B7F5E2C9A1D84F06E21C5B7A93D0E48F1C26A5B7D09E3F4A8B2C61D5E7F9031";
char const * beta_public_key_data = "A4D1C08E73B25F69E0D7C41B9F3A86E2D51C07B4F9E28A63C1D5B07E4F2A9C18";
char const * live_public_key_data = "6E9B3F14C8A27D05B1E64F93A0C28D7E5B19F4C63A0E87D2B5F1C49E7A36D0B2";

class ledger_constants
{
public:
	ledger_constants () :
	forge_test_genesis (test_public_key_data),
	forge_beta_genesis (beta_public_key_data),
	forge_live_genesis (live_public_key_data),
	genesis_public_key (forge::forge_network == forge::forge_networks::forge_test_network ? forge_test_genesis : forge::forge_network == forge::forge_networks::forge_beta_network ? forge_beta_genesis : forge_live_genesis)
	{
	}
	forge::public_key forge_test_genesis;
	forge::public_key forge_beta_genesis;
	forge::public_key forge_live_genesis;
	forge::public_key genesis_public_key;
};
ledger_constants globals;
}

forge::public_key const & forge::forge_test_genesis (globals.forge_test_genesis);
forge::public_key const & forge::forge_beta_genesis (globals.forge_beta_genesis);
forge::public_key const & forge::forge_live_genesis (globals.forge_live_genesis);
forge::public_key const & forge::genesis_public_key (globals.genesis_public_key);

forge::block_info::block_info () :
id (0),
height (0),
timestamp (0),
generator (0),
reward (0),
total_fee (0),
total_amount (0),
transaction_count (0)
{
}

forge::block_info::block_info (uint64_t height_a, uint32_t timestamp_a, forge::public_key const & generator_a, forge::amount reward_a, forge::amount total_fee_a, forge::amount total_amount_a, uint32_t transaction_count_a) :
height (height_a),
timestamp (timestamp_a),
generator (generator_a),
reward (reward_a),
total_fee (total_fee_a),
total_amount (total_amount_a),
transaction_count (transaction_count_a)
{
	id = compute_id ();
}

void forge::block_info::serialize (forge::stream & stream_a) const
{
	forge::write (stream_a, id.bytes);
	forge::write (stream_a, height);
	forge::write (stream_a, timestamp);
	forge::write (stream_a, generator.bytes);
	forge::write (stream_a, reward);
	forge::write (stream_a, total_fee);
	forge::write (stream_a, total_amount);
	forge::write (stream_a, transaction_count);
}

bool forge::block_info::deserialize (forge::stream & stream_a)
{
	auto error (forge::read (stream_a, id.bytes));
	if (!error)
	{
		error = forge::read (stream_a, height);
		if (!error)
		{
			error = forge::read (stream_a, timestamp);
			if (!error)
			{
				error = forge::read (stream_a, generator.bytes);
				if (!error)
				{
					error = forge::read (stream_a, reward);
					if (!error)
					{
						error = forge::read (stream_a, total_fee);
						if (!error)
						{
							error = forge::read (stream_a, total_amount);
							if (!error)
							{
								error = forge::read (stream_a, transaction_count);
							}
						}
					}
				}
			}
		}
	}
	return error;
}

bool forge::block_info::operator== (forge::block_info const & other_a) const
{
	return id == other_a.id && height == other_a.height && timestamp == other_a.timestamp && generator == other_a.generator && reward == other_a.reward && total_fee == other_a.total_fee && total_amount == other_a.total_amount && transaction_count == other_a.transaction_count;
}

bool forge::block_info::operator!= (forge::block_info const & other_a) const
{
	return !(*this == other_a);
}

forge::block_hash forge::block_info::compute_id () const
{
	forge::block_hash result;
	blake2b_state hash;
	auto status (blake2b_init (&hash, sizeof (result.bytes)));
	assert (status == 0);
	blake2b_update (&hash, reinterpret_cast<uint8_t const *> (&height), sizeof (height));
	blake2b_update (&hash, reinterpret_cast<uint8_t const *> (&timestamp), sizeof (timestamp));
	blake2b_update (&hash, generator.bytes.data (), generator.bytes.size ());
	blake2b_update (&hash, reinterpret_cast<uint8_t const *> (&reward), sizeof (reward));
	blake2b_update (&hash, reinterpret_cast<uint8_t const *> (&total_fee), sizeof (total_fee));
	blake2b_update (&hash, reinterpret_cast<uint8_t const *> (&total_amount), sizeof (total_amount));
	blake2b_update (&hash, reinterpret_cast<uint8_t const *> (&transaction_count), sizeof (transaction_count));
	status = blake2b_final (&hash, result.bytes.data (), sizeof (result.bytes));
	assert (status == 0);
	return result;
}

forge::row forge::block_info::row () const
{
	forge::row result;
	result.put ("id", id.to_string ());
	result.put ("height", static_cast<int64_t> (height));
	result.put ("timestamp", static_cast<int64_t> (timestamp));
	result.put ("generator_public_key", generator.to_string ());
	result.put ("reward", reward);
	result.put ("total_fee", total_fee);
	result.put ("total_amount", total_amount);
	result.put ("number_of_transactions", static_cast<int64_t> (transaction_count));
	return result;
}

forge::transaction_info::transaction_info () :
id (0),
block_id (0),
height (0),
sequence (0),
timestamp (0),
type (forge::transaction_type::transfer),
sender (0),
recipient (0),
amount (0),
fee (0)
{
}

forge::transaction_info::transaction_info (forge::transaction const & transaction_a, forge::block_info const & block_a, uint32_t sequence_a) :
id (transaction_a.hash ()),
block_id (block_a.id),
height (block_a.height),
sequence (sequence_a),
timestamp (transaction_a.header.timestamp),
type (transaction_a.type ()),
sender (transaction_a.header.sender),
recipient (transaction_a.header.recipient),
amount (transaction_a.header.amount),
fee (transaction_a.header.fee),
serialized (forge::serialize_transaction (transaction_a))
{
}

void forge::transaction_info::serialize (forge::stream & stream_a) const
{
	forge::write (stream_a, id.bytes);
	forge::write (stream_a, block_id.bytes);
	forge::write (stream_a, height);
	forge::write (stream_a, sequence);
	forge::write (stream_a, timestamp);
	forge::write (stream_a, type);
	forge::write (stream_a, sender.bytes);
	forge::write (stream_a, recipient.bytes);
	forge::write (stream_a, amount);
	forge::write (stream_a, fee);
	forge::write (stream_a, serialized);
}

bool forge::transaction_info::deserialize (forge::stream & stream_a)
{
	auto error (forge::read (stream_a, id.bytes));
	if (!error)
	{
		error = forge::read (stream_a, block_id.bytes);
		if (!error)
		{
			error = forge::read (stream_a, height);
			if (!error)
			{
				error = forge::read (stream_a, sequence);
				if (!error)
				{
					error = forge::read (stream_a, timestamp);
					if (!error)
					{
						uint8_t type_l;
						error = forge::read (stream_a, type_l);
						if (!error)
						{
							error = type_l > static_cast<uint8_t> (forge::transaction_type::multisignature);
							type = static_cast<forge::transaction_type> (type_l);
							if (!error)
							{
								error = forge::read (stream_a, sender.bytes);
								if (!error)
								{
									error = forge::read (stream_a, recipient.bytes);
									if (!error)
									{
										error = forge::read (stream_a, amount);
										if (!error)
										{
											error = forge::read (stream_a, fee);
											if (!error)
											{
												error = forge::read (stream_a, serialized);
											}
										}
									}
								}
							}
						}
					}
				}
			}
		}
	}
	return error;
}

bool forge::transaction_info::operator== (forge::transaction_info const & other_a) const
{
	return id == other_a.id && block_id == other_a.block_id && height == other_a.height && sequence == other_a.sequence && timestamp == other_a.timestamp && type == other_a.type && sender == other_a.sender && recipient == other_a.recipient && amount == other_a.amount && fee == other_a.fee && serialized == other_a.serialized;
}

std::unique_ptr<forge::transaction> forge::transaction_info::decode () const
{
	forge::bufferstream stream (serialized.data (), serialized.size ());
	auto result (forge::deserialize_transaction (stream));
	if (result != nullptr && !forge::at_end (stream))
	{
		result.reset ();
	}
	return result;
}

forge::row forge::transaction_info::row () const
{
	forge::row result;
	result.put ("id", id.to_string ());
	result.put ("block_id", block_id.to_string ());
	result.put ("height", static_cast<int64_t> (height));
	result.put ("sequence", static_cast<int64_t> (sequence));
	result.put ("timestamp", static_cast<int64_t> (timestamp));
	result.put ("created_at", static_cast<int64_t> (timestamp));
	result.put ("type", static_cast<int64_t> (type));
	result.put ("sender_public_key", sender.to_string ());
	result.put ("recipient_id", recipient.is_zero () ? std::string () : recipient.to_account ());
	result.put ("amount", amount);
	result.put ("fee", fee);
	result.put ("serialized", forge::to_string_hex (serialized));
	return result;
}

forge::wallet_info::wallet_info () :
address (0),
public_key (0),
balance (0),
vote_balance (0)
{
}

forge::wallet_info::wallet_info (forge::account const & address_a, forge::public_key const & public_key_a, forge::amount balance_a, forge::amount vote_balance_a, std::string const & username_a) :
address (address_a),
public_key (public_key_a),
balance (balance_a),
vote_balance (vote_balance_a),
username (username_a)
{
}

void forge::wallet_info::serialize (forge::stream & stream_a) const
{
	forge::write (stream_a, address.bytes);
	forge::write (stream_a, public_key.bytes);
	forge::write (stream_a, balance);
	forge::write (stream_a, vote_balance);
	forge::write (stream_a, username);
}

bool forge::wallet_info::deserialize (forge::stream & stream_a)
{
	auto error (forge::read (stream_a, address.bytes));
	if (!error)
	{
		error = forge::read (stream_a, public_key.bytes);
		if (!error)
		{
			error = forge::read (stream_a, balance);
			if (!error)
			{
				error = forge::read (stream_a, vote_balance);
				if (!error)
				{
					error = forge::read (stream_a, username, forge::delegate_transaction::username_max);
				}
			}
		}
	}
	return error;
}

bool forge::wallet_info::operator== (forge::wallet_info const & other_a) const
{
	return address == other_a.address && public_key == other_a.public_key && balance == other_a.balance && vote_balance == other_a.vote_balance && username == other_a.username;
}

forge::row forge::wallet_info::row () const
{
	forge::row result;
	result.put ("address", address.to_account ());
	result.put ("public_key", public_key.is_zero () ? std::string () : public_key.to_string ());
	result.put ("balance", balance);
	result.put ("vote_balance", vote_balance);
	result.put ("username", username);
	return result;
}

forge::milestone::milestone () :
height (1),
active_delegates (0),
reward (0),
block_time (0)
{
}

forge::milestone::milestone (uint64_t height_a, uint32_t active_delegates_a, forge::amount reward_a, uint32_t block_time_a) :
height (height_a),
active_delegates (active_delegates_a),
reward (reward_a),
block_time (block_time_a)
{
}

void forge::milestone::serialize_json (boost::property_tree::ptree & tree_a) const
{
	tree_a.put ("height", std::to_string (height));
	tree_a.put ("active_delegates", std::to_string (active_delegates));
	tree_a.put ("reward", std::to_string (reward));
	tree_a.put ("block_time", std::to_string (block_time));
}

bool forge::milestone::deserialize_json (boost::property_tree::ptree const & tree_a)
{
	auto result (false);
	try
	{
		height = std::stoull (tree_a.get<std::string> ("height"));
		active_delegates = std::stoul (tree_a.get<std::string> ("active_delegates"));
		reward = std::stoll (tree_a.get<std::string> ("reward"));
		block_time = std::stoul (tree_a.get<std::string> ("block_time"));
		result = active_delegates == 0;
	}
	catch (std::logic_error const &)
	{
		result = true;
	}
	catch (std::runtime_error const &)
	{
		result = true;
	}
	return result;
}

bool forge::milestone::operator== (forge::milestone const & other_a) const
{
	return height == other_a.height && active_delegates == other_a.active_delegates && reward == other_a.reward && block_time == other_a.block_time;
}

forge::constants::constants ()
{
	switch (forge::forge_network)
	{
		case forge::forge_networks::forge_test_network:
			milestones.push_back (forge::milestone (1, 51, 0, 8));
			milestones.push_back (forge::milestone (10, 51, 200000000, 8));
			break;
		case forge::forge_networks::forge_beta_network:
		case forge::forge_networks::forge_live_network:
			milestones.push_back (forge::milestone (1, 51, 0, 8));
			milestones.push_back (forge::milestone (75600, 51, 200000000, 8));
			break;
	}
}

forge::constants::constants (std::vector<forge::milestone> const & milestones_a) :
milestones (milestones_a)
{
	assert (!milestones.empty ());
	std::stable_sort (milestones.begin (), milestones.end (), [](forge::milestone const & lhs, forge::milestone const & rhs) {
		return lhs.height < rhs.height;
	});
}

forge::milestone const & forge::constants::get (uint64_t height_a) const
{
	assert (!milestones.empty ());
	auto result (milestones.begin ());
	for (auto i (milestones.begin ()), n (milestones.end ()); i != n && i->height <= height_a; ++i)
	{
		result = i;
	}
	return *result;
}

void forge::constants::serialize_json (boost::property_tree::ptree & tree_a) const
{
	boost::property_tree::ptree milestones_l;
	for (auto & i : milestones)
	{
		boost::property_tree::ptree entry;
		i.serialize_json (entry);
		milestones_l.push_back (std::make_pair ("", entry));
	}
	tree_a.add_child ("milestones", milestones_l);
}

bool forge::constants::deserialize_json (boost::property_tree::ptree const & tree_a)
{
	auto result (false);
	std::vector<forge::milestone> milestones_l;
	auto child (tree_a.get_child_optional ("milestones"));
	result = !child;
	if (!result)
	{
		for (auto i (child->begin ()), n (child->end ()); !result && i != n; ++i)
		{
			forge::milestone milestone;
			result = milestone.deserialize_json (i->second);
			milestones_l.push_back (milestone);
		}
		result = result || milestones_l.empty ();
		if (!result)
		{
			*this = forge::constants (milestones_l);
		}
	}
	return result;
}

forge::block_info forge::make_block (uint64_t height_a, uint32_t timestamp_a, forge::public_key const & generator_a, forge::amount reward_a, std::vector<std::unique_ptr<forge::transaction>> const & transactions_a, std::vector<forge::transaction_info> & infos_a)
{
	forge::amount total_fee (0);
	forge::amount total_amount (0);
	for (auto & i : transactions_a)
	{
		total_fee += i->header.fee;
		total_amount += i->header.amount;
	}
	forge::block_info result (height_a, timestamp_a, generator_a, reward_a, total_fee, total_amount, transactions_a.size ());
	uint32_t sequence (0);
	for (auto & i : transactions_a)
	{
		infos_a.push_back (forge::transaction_info (*i, result, sequence));
		++sequence;
	}
	return result;
}
