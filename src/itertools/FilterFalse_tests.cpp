#include "FilterFalse.hpp"
#include "runtime/NoneType.hpp"
#include "testing/helpers.hpp"

#include "gtest/gtest.h"

using namespace lazyiter;
using namespace lazyiter::itertools;
using namespace lazyiter::test;

TEST(FilterFalse, KeepsValuesFailingPredicate)
{
	auto is_odd = function("is_odd", [](const std::vector<Value> &args) -> Result<Value> {
		return Ok(Integer::create(BigIntType{ as<Integer>(args[0])->as_big_int() % 2 }));
	});
	auto filterfalse = FilterFalse::create(is_odd, int_list({ 0, 1, 2, 3, 4, 5 }));
	ASSERT_TRUE(filterfalse.is_ok());
	EXPECT_EQ(to_ints(collect(filterfalse.unwrap())), (std::vector<int64_t>{ 0, 2, 4 }));
}

TEST(FilterFalse, NonePredicateUsesTruthiness)
{
	auto filterfalse = FilterFalse::create(none(), int_list({ 0, 1, 0, 2 }));
	ASSERT_TRUE(filterfalse.is_ok());
	EXPECT_EQ(to_ints(collect(filterfalse.unwrap())), (std::vector<int64_t>{ 0, 0 }));
}

TEST(FilterFalse, NonCallablePredicateFailsOnPull)
{
	auto filterfalse = FilterFalse::create(Integer::create(1), int_list({ 1 }));
	ASSERT_TRUE(filterfalse.is_ok());
	auto value = filterfalse.unwrap()->next();
	ASSERT_TRUE(value.is_err());
	EXPECT_EQ(value.unwrap_err()->type_name(), "TypeError");
}
