#include <gtest/gtest.h>

#include <forge/query.hpp>

#include <limits>

namespace
{
forge::row payment (std::string const & recipient_a, int64_t amount_a, int64_t type_a)
{
	forge::row result;
	result.put ("recipient_id", recipient_a);
	result.put ("amount", amount_a);
	result.put ("fee", 1);
	result.put ("type", type_a);
	return result;
}
}

TEST (row, get_types)
{
	forge::row row;
	row.put ("amount", 5);
	row.put ("name", "alice");
	int64_t amount;
	ASSERT_FALSE (row.get ("amount", amount));
	ASSERT_EQ (5, amount);
	std::string name;
	ASSERT_FALSE (row.get ("name", name));
	ASSERT_EQ ("alice", name);
	ASSERT_TRUE (row.get ("amount", name));
	ASSERT_TRUE (row.get ("name", amount));
	ASSERT_TRUE (row.get ("missing", amount));
	ASSERT_FALSE (row.exists ("missing"));
}

TEST (row, get_key)
{
	forge::row row;
	forge::uint256_union key (0x1234);
	row.put ("public_key", key.to_string ());
	row.put ("bad", "xyz");
	forge::uint256_union decoded;
	ASSERT_FALSE (row.get ("public_key", decoded));
	ASSERT_EQ (key, decoded);
	ASSERT_TRUE (row.get ("bad", decoded));
}

TEST (query, unknown_table)
{
	forge::memory_history history;
	std::vector<forge::row> rows;
	ASSERT_TRUE (forge::query (history).from ("accounts").all (rows));
}

TEST (query, where)
{
	forge::memory_history history;
	history.add ("transactions", payment ("a", 10, 0));
	history.add ("transactions", payment ("b", 20, 3));
	history.add ("transactions", payment ("c", 30, 0));
	std::vector<forge::row> rows;
	ASSERT_FALSE (forge::query (history).select ({ "recipient_id" }).from ("transactions").where ("type", int64_t (0)).all (rows));
	ASSERT_EQ (2, rows.size ());
	std::string recipient;
	ASSERT_FALSE (rows[1].get ("recipient_id", recipient));
	ASSERT_EQ ("c", recipient);
	ASSERT_FALSE (rows[1].exists ("amount"));
}

TEST (query, where_missing_column)
{
	forge::memory_history history;
	history.add ("transactions", payment ("a", 10, 0));
	std::vector<forge::row> rows;
	ASSERT_TRUE (forge::query (history).from ("transactions").where ("height", int64_t (1)).all (rows));
	ASSERT_TRUE (rows.empty ());
}

TEST (query, where_in)
{
	forge::memory_history history;
	history.add ("transactions", payment ("a", 10, 0));
	history.add ("transactions", payment ("b", 20, 0));
	history.add ("transactions", payment ("c", 30, 0));
	std::vector<forge::row> rows;
	ASSERT_FALSE (forge::query (history).from ("transactions").where_in ("recipient_id", { std::string ("c"), std::string ("a") }).all (rows));
	ASSERT_EQ (2, rows.size ());
	ASSERT_EQ (payment ("a", 10, 0), rows[0]);
	ASSERT_EQ (payment ("c", 30, 0), rows[1]);
}

TEST (query, where_in_empty)
{
	forge::memory_history history;
	history.add ("transactions", payment ("a", 10, 0));
	std::vector<forge::row> rows;
	ASSERT_FALSE (forge::query (history).from ("transactions").where_in ("recipient_id", {}).all (rows));
	ASSERT_TRUE (rows.empty ());
}

TEST (query, group_sum_first_appearance)
{
	forge::memory_history history;
	history.add ("transactions", payment ("b", 10, 0));
	history.add ("transactions", payment ("a", 20, 0));
	history.add ("transactions", payment ("b", 30, 0));
	std::vector<forge::row> rows;
	ASSERT_FALSE (forge::query (history).select ({ "recipient_id" }).sum ({ "amount" }, "amount").from ("transactions").group_by ({ "recipient_id" }).all (rows));
	ASSERT_EQ (2, rows.size ());
	std::string recipient;
	int64_t amount;
	ASSERT_FALSE (rows[0].get ("recipient_id", recipient));
	ASSERT_FALSE (rows[0].get ("amount", amount));
	ASSERT_EQ ("b", recipient);
	ASSERT_EQ (40, amount);
	ASSERT_FALSE (rows[1].get ("recipient_id", recipient));
	ASSERT_FALSE (rows[1].get ("amount", amount));
	ASSERT_EQ ("a", recipient);
	ASSERT_EQ (20, amount);
}

TEST (query, sum_several_columns)
{
	forge::memory_history history;
	history.add ("transactions", payment ("a", 10, 0));
	history.add ("transactions", payment ("a", 20, 0));
	std::vector<forge::row> rows;
	ASSERT_FALSE (forge::query (history).select ({ "recipient_id" }).sum ({ "amount", "fee" }, "total").count ("amount", "produced").from ("transactions").group_by ({ "recipient_id" }).all (rows));
	ASSERT_EQ (1, rows.size ());
	int64_t total;
	int64_t produced;
	ASSERT_FALSE (rows[0].get ("total", total));
	ASSERT_FALSE (rows[0].get ("produced", produced));
	ASSERT_EQ (32, total);
	ASSERT_EQ (2, produced);
}

TEST (query, sum_text_column)
{
	forge::memory_history history;
	history.add ("transactions", payment ("a", 10, 0));
	std::vector<forge::row> rows;
	ASSERT_TRUE (forge::query (history).sum ({ "recipient_id" }, "total").from ("transactions").group_by ({ "type" }).all (rows));
}

// A sum that does not fit in 64 bits is an error like a non integer column
TEST (query, sum_overflow)
{
	forge::memory_history history;
	history.add ("transactions", payment ("a", std::numeric_limits<int64_t>::max (), 0));
	history.add ("transactions", payment ("a", 1, 0));
	history.add ("transactions", payment ("b", 1, 0));
	std::vector<forge::row> rows;
	ASSERT_TRUE (forge::query (history).select ({ "recipient_id" }).sum ({ "amount" }, "amount").from ("transactions").group_by ({ "recipient_id" }).all (rows));
	ASSERT_TRUE (rows.empty ());
	history.tables["transactions"][1].put ("amount", -1);
	ASSERT_FALSE (forge::query (history).select ({ "recipient_id" }).sum ({ "amount" }, "amount").from ("transactions").group_by ({ "recipient_id" }).all (rows));
	ASSERT_EQ (2, rows.size ());
}

TEST (query, order_limit)
{
	forge::memory_history history;
	history.add ("transactions", payment ("a", 20, 0));
	history.add ("transactions", payment ("b", 10, 0));
	history.add ("transactions", payment ("c", 30, 0));
	history.add ("transactions", payment ("d", 20, 0));
	std::vector<forge::row> rows;
	ASSERT_FALSE (forge::query (history).select ({ "recipient_id" }).from ("transactions").order_by ("amount", forge::order::descending).limit (3).all (rows));
	ASSERT_EQ (3, rows.size ());
	std::vector<std::string> recipients;
	for (auto & i : rows)
	{
		std::string recipient;
		ASSERT_FALSE (i.get ("recipient_id", recipient));
		recipients.push_back (recipient);
	}
	// Ties keep their natural order
	ASSERT_EQ (std::vector<std::string> ({ "c", "a", "d" }), recipients);
}

TEST (query, order_secondary_key)
{
	forge::memory_history history;
	history.add ("transactions", payment ("d", 20, 0));
	history.add ("transactions", payment ("b", 10, 0));
	history.add ("transactions", payment ("a", 20, 0));
	std::vector<forge::row> rows;
	ASSERT_FALSE (forge::query (history).from ("transactions").order_by ("amount", forge::order::descending).order_by ("recipient_id", forge::order::ascending).all (rows));
	ASSERT_EQ (3, rows.size ());
	ASSERT_EQ (payment ("a", 20, 0), rows[0]);
	ASSERT_EQ (payment ("d", 20, 0), rows[1]);
	ASSERT_EQ (payment ("b", 10, 0), rows[2]);
}

TEST (query, order_missing_column)
{
	forge::memory_history history;
	history.add ("transactions", payment ("a", 20, 0));
	std::vector<forge::row> rows;
	ASSERT_TRUE (forge::query (history).from ("transactions").order_by ("created_at", forge::order::ascending).all (rows));
}

TEST (query, project_missing_column)
{
	forge::memory_history history;
	history.add ("transactions", payment ("a", 20, 0));
	std::vector<forge::row> rows;
	ASSERT_TRUE (forge::query (history).select ({ "serialized" }).from ("transactions").all (rows));
}
