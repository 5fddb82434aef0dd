#include <forge/config.hpp>
#include <forge/node/utility.hpp>
#include <forge/node/working.hpp>

#include <boost/endian/conversion.hpp>

#include <cassert>

boost::filesystem::path forge::working_path ()
{
	auto result (forge::app_path ());
	switch (forge::forge_network)
	{
		case forge::forge_networks::forge_test_network:
			result /= "ForgeTest";
			break;
		case forge::forge_networks::forge_beta_network:
			result /= "ForgeBeta";
			break;
		case forge::forge_networks::forge_live_network:
			result /= "Forge";
			break;
	}
	return result;
}

boost::filesystem::path forge::unique_path ()
{
	auto result (working_path () / boost::filesystem::unique_path ());
	return result;
}

forge::mdb_env::mdb_env (bool & error_a, boost::filesystem::path const & path_a, int max_dbs) :
environment (nullptr)
{
	boost::system::error_code error;
	if (path_a.has_parent_path ())
	{
		boost::filesystem::create_directories (path_a.parent_path (), error);
		if (!error)
		{
			auto status1 (mdb_env_create (&environment));
			error_a = status1 != 0;
			if (!error_a)
			{
				auto status2 (mdb_env_set_maxdbs (environment, max_dbs));
				auto status3 (mdb_env_set_mapsize (environment, 1ULL * 1024 * 1024 * 1024 * 64)); // 64 Gigabytes
				auto status4 (mdb_env_open (environment, path_a.string ().c_str (), MDB_NOSUBDIR | MDB_NOTLS, 00600));
				error_a = status2 != 0 || status3 != 0 || status4 != 0;
			}
		}
		else
		{
			error_a = true;
		}
	}
	else
	{
		error_a = true;
	}
}

forge::mdb_env::~mdb_env ()
{
	if (environment != nullptr)
	{
		mdb_env_close (environment);
	}
}

forge::mdb_env::operator MDB_env * () const
{
	return environment;
}

forge::mdb_val::mdb_val () :
value ({ 0, nullptr })
{
}

forge::mdb_val::mdb_val (MDB_val const & value_a) :
value (value_a)
{
}

forge::mdb_val::mdb_val (size_t size_a, void * data_a) :
value ({ size_a, data_a })
{
}

forge::mdb_val::mdb_val (forge::uint256_union const & val_a) :
mdb_val (sizeof (val_a), const_cast<forge::uint256_union *> (&val_a))
{
}

void * forge::mdb_val::data () const
{
	return value.mv_data;
}

size_t forge::mdb_val::size () const
{
	return value.mv_size;
}

forge::uint256_union forge::mdb_val::uint256 () const
{
	forge::uint256_union result;
	assert (size () == sizeof (result));
	std::copy (reinterpret_cast<uint8_t const *> (data ()), reinterpret_cast<uint8_t const *> (data ()) + sizeof (result), result.bytes.data ());
	return result;
}

uint64_t forge::mdb_val::big_endian_uint64 () const
{
	uint64_t result;
	assert (size () >= sizeof (result));
	std::copy (reinterpret_cast<uint8_t const *> (data ()), reinterpret_cast<uint8_t const *> (data ()) + sizeof (result), reinterpret_cast<uint8_t *> (&result));
	boost::endian::big_to_native_inplace (result);
	return result;
}

forge::mdb_val::operator MDB_val * () const
{
	// Allow passing a temporary to a non-c++ function which doesn't have constness
	return const_cast<MDB_val *> (&value);
}

forge::mdb_val::operator MDB_val const & () const
{
	return value;
}

forge::db_transaction::db_transaction (forge::mdb_env & environment_a, MDB_txn * parent_a, bool write) :
environment (environment_a)
{
	auto status (mdb_txn_begin (environment_a, parent_a, write ? 0 : MDB_RDONLY, &handle));
	assert (status == 0);
}

forge::db_transaction::~db_transaction ()
{
	auto status (mdb_txn_commit (handle));
	assert (status == 0);
}

forge::db_transaction::operator MDB_txn * () const
{
	return handle;
}

void forge::open_or_create (std::fstream & stream_a, std::string const & path_a)
{
	stream_a.open (path_a, std::ios_base::in);
	if (stream_a.fail ())
	{
		stream_a.open (path_a, std::ios_base::out);
	}
	stream_a.close ();
	stream_a.open (path_a, std::ios_base::in | std::ios_base::out);
}
