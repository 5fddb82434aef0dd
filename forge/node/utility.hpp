#pragma once

#include <forge/lib/numbers.hpp>

#include <boost/filesystem.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include <fstream>

#include <lmdb.h>

namespace forge
{
// Network dependent data directory under app_path
boost::filesystem::path working_path ();
// Get a unique path within the home directory, used for testing
boost::filesystem::path unique_path ();
/**
 * RAII wrapper for MDB_env
 */
class mdb_env
{
public:
	mdb_env (bool &, boost::filesystem::path const &, int max_dbs = 128);
	~mdb_env ();
	operator MDB_env * () const;
	MDB_env * environment;
};
/**
 * Encapsulates MDB_val and decodes the account and height keys of the store
 */
class mdb_val
{
public:
	mdb_val ();
	mdb_val (MDB_val const &);
	mdb_val (size_t, void *);
	mdb_val (forge::uint256_union const &);
	void * data () const;
	size_t size () const;
	forge::uint256_union uint256 () const;
	// Leading 8 bytes of a big endian key
	uint64_t big_endian_uint64 () const;
	operator MDB_val * () const;
	operator MDB_val const & () const;
	MDB_val value;
};
/**
 * RAII wrapper of MDB_txn where the constructor starts the transaction
 * and the destructor commits it.
 */
class db_transaction
{
public:
	db_transaction (forge::mdb_env &, MDB_txn *, bool);
	~db_transaction ();
	operator MDB_txn * () const;
	MDB_txn * handle;
	forge::mdb_env & environment;
};
void open_or_create (std::fstream &, std::string const &);
// Reads a json object from the stream and if was changed, write the object back to the stream
template <typename T>
bool fetch_object (T & object, boost::filesystem::path const & path_a, std::fstream & stream_a)
{
	bool error (false);
	forge::open_or_create (stream_a, path_a.string ());
	if (!stream_a.fail ())
	{
		boost::property_tree::ptree tree;
		try
		{
			boost::property_tree::read_json (stream_a, tree);
		}
		catch (std::runtime_error const &)
		{
			auto pos (stream_a.tellg ());
			if (pos != std::streampos (0))
			{
				error = true;
			}
		}
		if (!error)
		{
			auto updated (false);
			error = object.deserialize_json (updated, tree);
			if (!error && updated)
			{
				stream_a.close ();
				stream_a.open (path_a.string (), std::ios_base::out | std::ios_base::trunc);
				try
				{
					boost::property_tree::write_json (stream_a, tree);
				}
				catch (std::runtime_error const &)
				{
					error = true;
				}
			}
		}
	}
	else
	{
		error = true;
	}
	return error;
}
}
