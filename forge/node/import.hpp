#pragma once

#include <forge/blockstore.hpp>

namespace forge
{
class import_stats
{
public:
	import_stats ();
	size_t blocks;
	size_t transactions;
	size_t wallets;
};
/**
 * Appends the blocks of a JSON chain export after the current store height and replaces the matching wallet snapshot rows
 * {"blocks": [{"generator", "timestamp", "reward", "transactions": [...]}], "wallets": [{"address", "public_key", "balance", "vote_balance", "username"}]}
 * Nothing is written unless the whole document decodes, returns true on error
 */
bool import_chain (forge::block_store &, boost::property_tree::ptree const &, forge::import_stats &);
// Read a JSON chain export from `path' and import it
bool import_chain (forge::block_store &, boost::filesystem::path const &, forge::import_stats &);
}
