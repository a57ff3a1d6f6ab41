#include "GroupBy.hpp"
#include "runtime/Tuple.hpp"
#include "testing/helpers.hpp"

#include "gtest/gtest.h"

using namespace lazyiter;
using namespace lazyiter::itertools;
using namespace lazyiter::test;

namespace {
std::pair<Value, std::shared_ptr<Iterator>> unpack(const Result<Value> &group)
{
	EXPECT_TRUE(group.is_ok());
	auto tuple = as<Tuple>(group.unwrap());
	EXPECT_TRUE(tuple);
	EXPECT_EQ(tuple->size(), size_t{ 2 });
	return { (*tuple)[0], as<Iterator>((*tuple)[1]) };
}
}// namespace

TEST(GroupBy, GroupsOnlyAdjacentKeys)
{
	auto groupby = GroupBy::create(int_list({ 1, 1, 2, 2, 1 }));
	ASSERT_TRUE(groupby.is_ok());

	std::vector<std::string> groups;
	auto group = groupby.unwrap()->next();
	while (group.is_ok()) {
		auto [key, grouper] = unpack(group);
		groups.push_back(fmt::format("{}: {}", key->to_string(), repr(collect(grouper))));
		group = groupby.unwrap()->next();
	}
	EXPECT_TRUE(is_stop_iteration(group.unwrap_err()));
	EXPECT_EQ(groups, (std::vector<std::string>{ "1: [1, 1]", "2: [2, 2]", "1: [1]" }));
}

TEST(GroupBy, KeyFunction)
{
	auto first_letter = function("first_letter", [](const std::vector<Value> &args) -> Result<Value> {
		return Ok(str(as<String>(args[0])->value().substr(0, 1)));
	});
	auto words = List::create(
		std::vector<Value>{ str("apple"), str("avocado"), str("banana"), str("cherry"), str("cake") });
	auto groupby = GroupBy::create(words, first_letter);
	ASSERT_TRUE(groupby.is_ok());

	std::vector<std::string> keys;
	auto group = groupby.unwrap()->next();
	while (group.is_ok()) {
		keys.push_back(unpack(group).first->to_string());
		group = groupby.unwrap()->next();
	}
	EXPECT_EQ(keys, (std::vector<std::string>{ "'a'", "'b'", "'c'" }));
}

TEST(GroupBy, AdvancingInvalidatesPreviousGrouper)
{
	auto groupby = GroupBy::create(int_list({ 1, 1, 1, 2, 3 }));
	ASSERT_TRUE(groupby.is_ok());

	auto [first_key, first_group] = unpack(groupby.unwrap()->next());
	EXPECT_EQ(first_key->to_string(), "1");
	EXPECT_EQ(to_ints(take(first_group, 1)), (std::vector<int64_t>{ 1 }));

	auto [second_key, second_group] = unpack(groupby.unwrap()->next());
	EXPECT_EQ(second_key->to_string(), "2");

	EXPECT_TRUE(is_exhausted(first_group));
	EXPECT_EQ(to_ints(collect(second_group)), (std::vector<int64_t>{ 2 }));
}

TEST(GroupBy, DrainedGrouperHandsOverNextGroup)
{
	auto source = CountingIterator::create(3);
	auto half = function("half", [](const std::vector<Value> &args) -> Result<Value> {
		return Ok(Integer::create(BigIntType{ as<Integer>(args[0])->as_big_int() / 2 }));
	});
	auto groupby = GroupBy::create(source, half);
	ASSERT_TRUE(groupby.is_ok());
	EXPECT_EQ(source->pulled(), 0);

	auto [first_key, first_group] = unpack(groupby.unwrap()->next());
	EXPECT_EQ(to_ints(collect(first_group)), (std::vector<int64_t>{ 0, 1 }));
	EXPECT_EQ(source->pulled(), 3);

	// the value that ended the first group starts the second one without another pull
	auto [second_key, second_group] = unpack(groupby.unwrap()->next());
	EXPECT_EQ(second_key->to_string(), "1");
	EXPECT_EQ(source->pulled(), 3);
	EXPECT_EQ(to_ints(collect(second_group)), (std::vector<int64_t>{ 2 }));
	EXPECT_TRUE(is_exhausted(groupby.unwrap()));
}

TEST(GroupBy, EmptySource)
{
	auto groupby = GroupBy::create(int_list({}));
	ASSERT_TRUE(groupby.is_ok());
	EXPECT_TRUE(is_exhausted(groupby.unwrap()));
}

TEST(GroupBy, KeyErrorsPropagate)
{
	auto failing = function("failing", [](const std::vector<Value> &) -> Result<Value> {
		return Err(value_error("no key"));
	});
	auto groupby = GroupBy::create(int_list({ 1 }), failing);
	ASSERT_TRUE(groupby.is_ok());
	auto group = groupby.unwrap()->next();
	ASSERT_TRUE(group.is_err());
	EXPECT_EQ(group.unwrap_err()->type_name(), "ValueError");
}
