#pragma once

#include <forge/lib/numbers.hpp>

#include <boost/variant.hpp>

#include <functional>
#include <map>
#include <string>
#include <vector>

namespace forge
{
// A column value, integers for amounts and counters, text for keys, addresses and payloads
using value = boost::variant<int64_t, std::string>;
/**
 * One record produced by a table scan or an aggregate query, columns are addressed by name
 */
class row
{
public:
	void put (std::string const &, int64_t);
	void put (std::string const &, std::string const &);
	bool exists (std::string const &) const;
	// All getters return true if the column is missing or holds the other alternative
	bool get (std::string const &, forge::value &) const;
	bool get (std::string const &, int64_t &) const;
	bool get (std::string const &, std::string &) const;
	// Decode a hex encoded key column
	bool get (std::string const &, forge::uint256_union &) const;
	bool operator== (forge::row const &) const;
	std::map<std::string, forge::value> columns;
};
/**
 * Read only source of historical tables
 */
class history
{
public:
	virtual ~history () = default;
	// Visit every row of a table in its natural order, true if the table is unknown or could not be read
	virtual bool scan (std::string const &, std::function<void(forge::row const &)> const &) = 0;
};
/**
 * Table source kept in memory, natural order is insertion order
 */
class memory_history : public forge::history
{
public:
	memory_history ();
	void add (std::string const &, forge::row const &);
	bool scan (std::string const &, std::function<void(forge::row const &)> const &) override;
	std::map<std::string, std::vector<forge::row>> tables;
};
enum class order
{
	ascending,
	descending
};
/**
 * Aggregation over a single table of a history
 * Rows are filtered, optionally grouped and aggregated, sorted, limited and finally projected
 */
class query
{
public:
	query (forge::history &);
	forge::query & select (std::vector<std::string> const &);
	// Sum of one or more integer columns into `alias'
	forge::query & sum (std::vector<std::string> const &, std::string const &);
	// Number of rows in the group carrying `column'
	forge::query & count (std::string const &, std::string const &);
	forge::query & from (std::string const &);
	forge::query & where (std::string const &, forge::value const &);
	forge::query & where_in (std::string const &, std::vector<forge::value> const &);
	forge::query & group_by (std::vector<std::string> const &);
	forge::query & order_by (std::string const &, forge::order);
	forge::query & limit (size_t);
	// Run the query, true on error
	bool all (std::vector<forge::row> &);

private:
	class aggregate
	{
	public:
		bool count;
		std::vector<std::string> columns;
		std::string alias;
	};
	bool matches (bool &, forge::row const &) const;
	bool aggregate_rows (std::vector<forge::row> const &, std::vector<forge::row> &) const;
	bool sort (std::vector<forge::row> &) const;
	bool project (std::vector<forge::row> &) const;
	forge::history & history;
	std::string table;
	std::vector<std::string> columns;
	std::vector<aggregate> aggregates;
	std::vector<std::pair<std::string, forge::value>> equals;
	std::vector<std::pair<std::string, std::vector<forge::value>>> members;
	std::vector<std::string> groups;
	std::vector<std::pair<std::string, forge::order>> orders;
	size_t maximum;
};
}
