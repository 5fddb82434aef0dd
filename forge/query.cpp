#include <forge/query.hpp>

#include <algorithm>
#include <limits>

void forge::row::put (std::string const & column_a, int64_t value_a)
{
	columns[column_a] = value_a;
}

void forge::row::put (std::string const & column_a, std::string const & value_a)
{
	columns[column_a] = value_a;
}

bool forge::row::exists (std::string const & column_a) const
{
	return columns.find (column_a) != columns.end ();
}

bool forge::row::get (std::string const & column_a, forge::value & value_a) const
{
	auto existing (columns.find (column_a));
	auto result (existing == columns.end ());
	if (!result)
	{
		value_a = existing->second;
	}
	return result;
}

bool forge::row::get (std::string const & column_a, int64_t & value_a) const
{
	auto existing (columns.find (column_a));
	auto result (existing == columns.end ());
	if (!result)
	{
		auto value_l (boost::get<int64_t> (&existing->second));
		result = value_l == nullptr;
		if (!result)
		{
			value_a = *value_l;
		}
	}
	return result;
}

bool forge::row::get (std::string const & column_a, std::string & value_a) const
{
	auto existing (columns.find (column_a));
	auto result (existing == columns.end ());
	if (!result)
	{
		auto value_l (boost::get<std::string> (&existing->second));
		result = value_l == nullptr;
		if (!result)
		{
			value_a = *value_l;
		}
	}
	return result;
}

bool forge::row::get (std::string const & column_a, forge::uint256_union & value_a) const
{
	std::string text;
	auto result (get (column_a, text));
	if (!result)
	{
		result = value_a.decode_hex (text);
	}
	return result;
}

bool forge::row::operator== (forge::row const & other_a) const
{
	return columns == other_a.columns;
}

forge::memory_history::memory_history ()
{
	tables["blocks"];
	tables["transactions"];
	tables["wallets"];
}

void forge::memory_history::add (std::string const & table_a, forge::row const & row_a)
{
	tables[table_a].push_back (row_a);
}

bool forge::memory_history::scan (std::string const & table_a, std::function<void(forge::row const &)> const & visitor_a)
{
	auto existing (tables.find (table_a));
	auto result (existing == tables.end ());
	if (!result)
	{
		for (auto & i : existing->second)
		{
			visitor_a (i);
		}
	}
	return result;
}

forge::query::query (forge::history & history_a) :
history (history_a),
maximum (std::numeric_limits<size_t>::max ())
{
}

forge::query & forge::query::select (std::vector<std::string> const & columns_a)
{
	columns.insert (columns.end (), columns_a.begin (), columns_a.end ());
	return *this;
}

forge::query & forge::query::sum (std::vector<std::string> const & columns_a, std::string const & alias_a)
{
	aggregates.push_back (aggregate{ false, columns_a, alias_a });
	return *this;
}

forge::query & forge::query::count (std::string const & column_a, std::string const & alias_a)
{
	aggregates.push_back (aggregate{ true, { column_a }, alias_a });
	return *this;
}

forge::query & forge::query::from (std::string const & table_a)
{
	table = table_a;
	return *this;
}

forge::query & forge::query::where (std::string const & column_a, forge::value const & value_a)
{
	equals.push_back (std::make_pair (column_a, value_a));
	return *this;
}

forge::query & forge::query::where_in (std::string const & column_a, std::vector<forge::value> const & values_a)
{
	members.push_back (std::make_pair (column_a, values_a));
	return *this;
}

forge::query & forge::query::group_by (std::vector<std::string> const & columns_a)
{
	groups.insert (groups.end (), columns_a.begin (), columns_a.end ());
	return *this;
}

forge::query & forge::query::order_by (std::string const & column_a, forge::order order_a)
{
	orders.push_back (std::make_pair (column_a, order_a));
	return *this;
}

forge::query & forge::query::limit (size_t maximum_a)
{
	maximum = maximum_a;
	return *this;
}

bool forge::query::matches (bool & error_a, forge::row const & row_a) const
{
	auto result (true);
	for (auto i (equals.begin ()), n (equals.end ()); result && !error_a && i != n; ++i)
	{
		forge::value value;
		error_a = row_a.get (i->first, value);
		result = !error_a && value == i->second;
	}
	for (auto i (members.begin ()), n (members.end ()); result && !error_a && i != n; ++i)
	{
		forge::value value;
		error_a = row_a.get (i->first, value);
		result = !error_a && std::find (i->second.begin (), i->second.end (), value) != i->second.end ();
	}
	return result;
}

bool forge::query::aggregate_rows (std::vector<forge::row> const & rows_a, std::vector<forge::row> & result_a) const
{
	auto error (false);
	// Groups are kept in order of first appearance
	std::vector<std::vector<forge::row const *>> members_l;
	std::map<std::vector<forge::value>, size_t> index;
	for (auto i (rows_a.begin ()), n (rows_a.end ()); !error && i != n; ++i)
	{
		std::vector<forge::value> key;
		for (auto j (groups.begin ()), m (groups.end ()); !error && j != m; ++j)
		{
			forge::value value;
			error = i->get (*j, value);
			key.push_back (value);
		}
		if (!error)
		{
			auto existing (index.find (key));
			if (existing == index.end ())
			{
				index[key] = members_l.size ();
				members_l.push_back (std::vector<forge::row const *> ());
				members_l.back ().push_back (&*i);
			}
			else
			{
				members_l[existing->second].push_back (&*i);
			}
		}
	}
	for (auto i (members_l.begin ()), n (members_l.end ()); !error && i != n; ++i)
	{
		forge::row row_l;
		auto & first (*i->front ());
		for (auto j (groups.begin ()), m (groups.end ()); !error && j != m; ++j)
		{
			forge::value value;
			error = first.get (*j, value);
			row_l.columns[*j] = value;
		}
		for (auto j (columns.begin ()), m (columns.end ()); !error && j != m; ++j)
		{
			forge::value value;
			error = first.get (*j, value);
			row_l.columns[*j] = value;
		}
		for (auto j (aggregates.begin ()), m (aggregates.end ()); !error && j != m; ++j)
		{
			int64_t total (0);
			for (auto k (i->begin ()), o (i->end ()); !error && k != o; ++k)
			{
				if (j->count)
				{
					error = forge::checked_add (total, (*k)->exists (j->columns.front ()) ? 1 : 0);
				}
				else
				{
					for (auto & column : j->columns)
					{
						int64_t value;
						error = error || (*k)->get (column, value) || forge::checked_add (total, value);
					}
				}
			}
			row_l.put (j->alias, total);
		}
		if (!error)
		{
			result_a.push_back (row_l);
		}
	}
	return error;
}

bool forge::query::sort (std::vector<forge::row> & rows_a) const
{
	auto error (false);
	for (auto i (rows_a.begin ()), n (rows_a.end ()); !error && i != n; ++i)
	{
		for (auto j (orders.begin ()), m (orders.end ()); !error && j != m; ++j)
		{
			error = !i->exists (j->first);
		}
	}
	if (!error && !orders.empty ())
	{
		std::stable_sort (rows_a.begin (), rows_a.end (), [this](forge::row const & lhs, forge::row const & rhs) {
			auto result (false);
			auto decided (false);
			for (auto i (orders.begin ()), n (orders.end ()); !decided && i != n; ++i)
			{
				auto & left (lhs.columns.find (i->first)->second);
				auto & right (rhs.columns.find (i->first)->second);
				if (!(left == right))
				{
					decided = true;
					result = i->second == forge::order::ascending ? left < right : right < left;
				}
			}
			return result;
		});
	}
	return error;
}

bool forge::query::project (std::vector<forge::row> & rows_a) const
{
	auto error (false);
	if (!columns.empty ())
	{
		for (auto i (rows_a.begin ()), n (rows_a.end ()); !error && i != n; ++i)
		{
			forge::row row_l;
			for (auto j (columns.begin ()), m (columns.end ()); !error && j != m; ++j)
			{
				forge::value value;
				error = i->get (*j, value);
				row_l.columns[*j] = value;
			}
			*i = std::move (row_l);
		}
	}
	return error;
}

bool forge::query::all (std::vector<forge::row> & result_a)
{
	result_a.clear ();
	std::vector<forge::row> rows;
	auto filter_error (false);
	auto error (history.scan (table, [this, &rows, &filter_error](forge::row const & row_a) {
		if (!filter_error && matches (filter_error, row_a))
		{
			rows.push_back (row_a);
		}
	}));
	error = error || filter_error;
	if (!error)
	{
		if (!groups.empty () || !aggregates.empty ())
		{
			error = aggregate_rows (rows, result_a);
			if (!error)
			{
				error = sort (result_a);
			}
			if (!error && result_a.size () > maximum)
			{
				result_a.resize (maximum);
			}
		}
		else
		{
			error = sort (rows);
			if (!error)
			{
				if (rows.size () > maximum)
				{
					rows.resize (maximum);
				}
				error = project (rows);
				if (!error)
				{
					result_a = std::move (rows);
				}
			}
		}
	}
	if (error)
	{
		result_a.clear ();
	}
	return error;
}
