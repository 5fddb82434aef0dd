#include <forge/blockstore.hpp>

#include <boost/endian/conversion.hpp>

#include <array>

namespace
{
class height_key
{
public:
	height_key (uint64_t height_a) :
	value (boost::endian::native_to_big (height_a))
	{
	}
	forge::mdb_val val () const
	{
		return forge::mdb_val (sizeof (value), const_cast<uint64_t *> (&value));
	}
	uint64_t value;
};
class transaction_key
{
public:
	transaction_key (uint64_t height_a, uint32_t sequence_a)
	{
		auto height_l (boost::endian::native_to_big (height_a));
		auto sequence_l (boost::endian::native_to_big (sequence_a));
		std::copy (reinterpret_cast<uint8_t const *> (&height_l), reinterpret_cast<uint8_t const *> (&height_l) + sizeof (height_l), bytes.begin ());
		std::copy (reinterpret_cast<uint8_t const *> (&sequence_l), reinterpret_cast<uint8_t const *> (&sequence_l) + sizeof (sequence_l), bytes.begin () + sizeof (height_l));
	}
	forge::mdb_val val () const
	{
		return forge::mdb_val (bytes.size (), const_cast<uint8_t *> (bytes.data ()));
	}
	std::array<uint8_t, 12> bytes;
};
template <typename T>
void put_record (MDB_txn * transaction_a, MDB_dbi db_a, forge::mdb_val const & key_a, T const & record_a)
{
	std::vector<uint8_t> vector;
	{
		forge::vectorstream stream (vector);
		record_a.serialize (stream);
	}
	auto status (mdb_put (transaction_a, db_a, key_a, forge::mdb_val (vector.size (), vector.data ()), 0));
	assert (status == 0);
}
template <typename T>
bool get_record (MDB_txn * transaction_a, MDB_dbi db_a, forge::mdb_val const & key_a, T & record_a)
{
	forge::mdb_val value;
	auto status (mdb_get (transaction_a, db_a, key_a, value));
	assert (status == 0 || status == MDB_NOTFOUND);
	bool result;
	if (status == MDB_NOTFOUND)
	{
		result = true;
	}
	else
	{
		forge::bufferstream stream (reinterpret_cast<uint8_t const *> (value.data ()), value.size ());
		result = record_a.deserialize (stream);
	}
	return result;
}
template <typename T>
bool scan_records (forge::store_iterator i, forge::store_iterator const & n, std::function<void(forge::row const &)> const & visitor_a)
{
	auto error (false);
	for (; !error && i != n; ++i)
	{
		T record;
		forge::bufferstream stream (reinterpret_cast<uint8_t const *> (i->second.data ()), i->second.size ());
		error = record.deserialize (stream);
		if (!error)
		{
			visitor_a (record.row ());
		}
	}
	return error;
}
size_t entries (MDB_txn * transaction_a, MDB_dbi db_a)
{
	MDB_stat stats;
	auto status (mdb_stat (transaction_a, db_a, &stats));
	assert (status == 0);
	return stats.ms_entries;
}
}

int constexpr forge::block_store::version_current;

forge::store_entry::store_entry () :
first (0, nullptr),
second (0, nullptr)
{
}

void forge::store_entry::clear ()
{
	first = { 0, nullptr };
	second = { 0, nullptr };
}

forge::store_entry * forge::store_entry::operator-> ()
{
	return this;
}

forge::store_entry & forge::store_iterator::operator-> ()
{
	return current;
}

forge::store_iterator::store_iterator (MDB_txn * transaction_a, MDB_dbi db_a) :
cursor (nullptr)
{
	auto status (mdb_cursor_open (transaction_a, db_a, &cursor));
	assert (status == 0);
	auto status2 (mdb_cursor_get (cursor, &current.first.value, &current.second.value, MDB_FIRST));
	assert (status2 == 0 || status2 == MDB_NOTFOUND);
	if (status2 == MDB_NOTFOUND)
	{
		current.clear ();
	}
}

forge::store_iterator::store_iterator (std::nullptr_t) :
cursor (nullptr)
{
}

forge::store_iterator::store_iterator (forge::store_iterator && other_a)
{
	cursor = other_a.cursor;
	other_a.cursor = nullptr;
	current = other_a.current;
}

forge::store_iterator::~store_iterator ()
{
	if (cursor != nullptr)
	{
		mdb_cursor_close (cursor);
	}
}

forge::store_iterator & forge::store_iterator::operator++ ()
{
	assert (cursor != nullptr);
	auto status (mdb_cursor_get (cursor, &current.first.value, &current.second.value, MDB_NEXT));
	if (status == MDB_NOTFOUND)
	{
		current.clear ();
	}
	return *this;
}

forge::store_iterator & forge::store_iterator::operator= (forge::store_iterator && other_a)
{
	if (cursor != nullptr)
	{
		mdb_cursor_close (cursor);
	}
	cursor = other_a.cursor;
	other_a.cursor = nullptr;
	current = other_a.current;
	other_a.current.clear ();
	return *this;
}

bool forge::store_iterator::operator== (forge::store_iterator const & other_a) const
{
	auto result (current.first.data () == other_a.current.first.data ());
	assert (!result || (current.first.size () == other_a.current.first.size ()));
	assert (!result || (current.second.data () == other_a.current.second.data ()));
	assert (!result || (current.second.size () == other_a.current.second.size ()));
	return result;
}

bool forge::store_iterator::operator!= (forge::store_iterator const & other_a) const
{
	return !(*this == other_a);
}

forge::block_store::block_store (bool & error_a, boost::filesystem::path const & path_a, int lmdb_max_dbs) :
environment (error_a, path_a, lmdb_max_dbs),
blocks (0),
transactions (0),
wallets (0),
meta (0)
{
	if (!error_a)
	{
		forge::db_transaction transaction (environment, nullptr, true);
		error_a |= mdb_dbi_open (transaction, "blocks", MDB_CREATE, &blocks) != 0;
		error_a |= mdb_dbi_open (transaction, "transactions", MDB_CREATE, &transactions) != 0;
		error_a |= mdb_dbi_open (transaction, "wallets", MDB_CREATE, &wallets) != 0;
		error_a |= mdb_dbi_open (transaction, "meta", MDB_CREATE, &meta) != 0;
		if (!error_a)
		{
			error_a = do_upgrades (transaction);
		}
	}
}

void forge::block_store::version_put (MDB_txn * transaction_a, int version_a)
{
	forge::uint256_union version_key (1);
	forge::uint256_union version_value (version_a);
	auto status (mdb_put (transaction_a, meta, forge::mdb_val (version_key), forge::mdb_val (version_value), 0));
	assert (status == 0);
}

int forge::block_store::version_get (MDB_txn * transaction_a)
{
	forge::uint256_union version_key (1);
	forge::mdb_val data;
	auto error (mdb_get (transaction_a, meta, forge::mdb_val (version_key), data));
	int result;
	if (error == MDB_NOTFOUND)
	{
		result = 1;
	}
	else
	{
		forge::uint256_union version_value (data.uint256 ());
		assert (version_value.qwords[2] == 0 && version_value.qwords[1] == 0 && version_value.qwords[0] == 0);
		result = version_value.number ().convert_to<int> ();
	}
	return result;
}

bool forge::block_store::do_upgrades (MDB_txn * transaction_a)
{
	auto result (false);
	switch (version_get (transaction_a))
	{
		case 1:
			version_put (transaction_a, version_current);
			break;
		default:
			result = true;
			break;
	}
	return result;
}

void forge::block_store::block_put (MDB_txn * transaction_a, forge::block_info const & block_a)
{
	put_record (transaction_a, blocks, height_key (block_a.height).val (), block_a);
}

bool forge::block_store::block_get (MDB_txn * transaction_a, uint64_t height_a, forge::block_info & block_a)
{
	return get_record (transaction_a, blocks, height_key (height_a).val (), block_a);
}

bool forge::block_store::block_exists (MDB_txn * transaction_a, uint64_t height_a)
{
	forge::mdb_val value;
	auto status (mdb_get (transaction_a, blocks, height_key (height_a).val (), value));
	assert (status == 0 || status == MDB_NOTFOUND);
	return status == 0;
}

size_t forge::block_store::block_count (MDB_txn * transaction_a)
{
	return entries (transaction_a, blocks);
}

uint64_t forge::block_store::height (MDB_txn * transaction_a)
{
	uint64_t result (0);
	MDB_cursor * cursor;
	auto status (mdb_cursor_open (transaction_a, blocks, &cursor));
	assert (status == 0);
	forge::mdb_val key;
	forge::mdb_val value;
	auto status2 (mdb_cursor_get (cursor, key, value, MDB_LAST));
	assert (status2 == 0 || status2 == MDB_NOTFOUND);
	if (status2 == 0)
	{
		result = key.big_endian_uint64 ();
	}
	mdb_cursor_close (cursor);
	return result;
}

forge::store_iterator forge::block_store::blocks_begin (MDB_txn * transaction_a)
{
	forge::store_iterator result (transaction_a, blocks);
	return result;
}

forge::store_iterator forge::block_store::blocks_end ()
{
	forge::store_iterator result (nullptr);
	return result;
}

void forge::block_store::transaction_put (MDB_txn * transaction_a, forge::transaction_info const & transaction_info_a)
{
	put_record (transaction_a, transactions, transaction_key (transaction_info_a.height, transaction_info_a.sequence).val (), transaction_info_a);
}

bool forge::block_store::transaction_get (MDB_txn * transaction_a, uint64_t height_a, uint32_t sequence_a, forge::transaction_info & transaction_info_a)
{
	return get_record (transaction_a, transactions, transaction_key (height_a, sequence_a).val (), transaction_info_a);
}

size_t forge::block_store::transaction_count (MDB_txn * transaction_a)
{
	return entries (transaction_a, transactions);
}

forge::store_iterator forge::block_store::transactions_begin (MDB_txn * transaction_a)
{
	forge::store_iterator result (transaction_a, transactions);
	return result;
}

forge::store_iterator forge::block_store::transactions_end ()
{
	forge::store_iterator result (nullptr);
	return result;
}

void forge::block_store::wallet_put (MDB_txn * transaction_a, forge::wallet_info const & wallet_a)
{
	put_record (transaction_a, wallets, forge::mdb_val (wallet_a.address), wallet_a);
}

bool forge::block_store::wallet_get (MDB_txn * transaction_a, forge::account const & address_a, forge::wallet_info & wallet_a)
{
	return get_record (transaction_a, wallets, forge::mdb_val (address_a), wallet_a);
}

size_t forge::block_store::wallet_count (MDB_txn * transaction_a)
{
	return entries (transaction_a, wallets);
}

forge::store_iterator forge::block_store::wallets_begin (MDB_txn * transaction_a)
{
	forge::store_iterator result (transaction_a, wallets);
	return result;
}

forge::store_iterator forge::block_store::wallets_end ()
{
	forge::store_iterator result (nullptr);
	return result;
}

bool forge::block_store::scan (std::string const & table_a, std::function<void(forge::row const &)> const & visitor_a)
{
	auto result (false);
	forge::db_transaction transaction (environment, nullptr, false);
	if (table_a == "blocks")
	{
		result = scan_records<forge::block_info> (blocks_begin (transaction), blocks_end (), visitor_a);
	}
	else if (table_a == "transactions")
	{
		result = scan_records<forge::transaction_info> (transactions_begin (transaction), transactions_end (), visitor_a);
	}
	else if (table_a == "wallets")
	{
		result = scan_records<forge::wallet_info> (wallets_begin (transaction), wallets_end (), visitor_a);
	}
	else
	{
		result = true;
	}
	return result;
}
