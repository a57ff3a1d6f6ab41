#include "StarMap.hpp"
#include "runtime/Tuple.hpp"
#include "testing/helpers.hpp"

#include "gtest/gtest.h"

using namespace lazyiter;
using namespace lazyiter::itertools;
using namespace lazyiter::test;

namespace {
std::shared_ptr<NativeFunction> sum_function()
{
	return function("sum", [](const std::vector<Value> &args) -> Result<Value> {
		Value total = Integer::create(0);
		for (const auto &arg : args) {
			auto result = lazyiter::add(total, arg);
			if (result.is_err()) { return result; }
			total = result.unwrap();
		}
		return Ok(total);
	});
}
}// namespace

TEST(StarMap, SpreadsEachItemAsArguments)
{
	auto items = List::create(std::vector<Value>{ Tuple::create(Integer::create(1), Integer::create(2)),
		int_list({ 3, 4, 5 }),
		Tuple::create() });
	auto starmap = StarMap::create(sum_function(), items);
	ASSERT_TRUE(starmap.is_ok());
	EXPECT_EQ(to_ints(collect(starmap.unwrap())), (std::vector<int64_t>{ 3, 12, 0 }));
}

TEST(StarMap, NonIterableItemIsAnError)
{
	auto starmap = StarMap::create(sum_function(), int_list({ 1 }));
	ASSERT_TRUE(starmap.is_ok());
	auto value = starmap.unwrap()->next();
	ASSERT_TRUE(value.is_err());
	EXPECT_EQ(value.unwrap_err()->type_name(), "TypeError");
}

TEST(StarMap, FunctionErrorsPropagate)
{
	auto failing = function("failing", [](const std::vector<Value> &) -> Result<Value> {
		return Err(value_error("bad value"));
	});
	auto items = List::create(std::vector<Value>{ Tuple::create(Integer::create(1)) });
	auto starmap = StarMap::create(failing, items);
	ASSERT_TRUE(starmap.is_ok());
	auto value = starmap.unwrap()->next();
	ASSERT_TRUE(value.is_err());
	EXPECT_EQ(value.unwrap_err()->what(), "ValueError: bad value");
}
