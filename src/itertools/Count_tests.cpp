#include "Count.hpp"
#include "testing/helpers.hpp"

#include "gtest/gtest.h"

#include <limits>

using namespace lazyiter;
using namespace lazyiter::itertools;
using namespace lazyiter::test;

TEST(Count, DefaultsToZeroAndOne)
{
	auto count = Count::create();
	ASSERT_TRUE(count.is_ok());
	EXPECT_EQ(to_ints(take(count.unwrap(), 4)), (std::vector<int64_t>{ 0, 1, 2, 3 }));
}

TEST(Count, StartAndNegativeStep)
{
	auto count = Count::create(10, -3);
	ASSERT_TRUE(count.is_ok());
	EXPECT_EQ(to_ints(take(count.unwrap(), 3)), (std::vector<int64_t>{ 10, 7, 4 }));
}

TEST(Count, DoesNotOverflow)
{
	BigIntType start{ std::numeric_limits<int64_t>::max() };
	auto count = Count::create(start);
	ASSERT_TRUE(count.is_ok());
	ASSERT_TRUE(count.unwrap()->next().is_ok());

	auto value = count.unwrap()->next();
	ASSERT_TRUE(value.is_ok());
	auto i = as<Integer>(value.unwrap());
	ASSERT_TRUE(i);
	EXPECT_EQ(i->as_big_int(), BigIntType{ start + 1 });
}

TEST(Count, Repr)
{
	auto count = Count::create(5);
	ASSERT_TRUE(count.is_ok());
	EXPECT_EQ(count.unwrap()->to_string(), "count(5)");
	ASSERT_TRUE(count.unwrap()->next().is_ok());
	EXPECT_EQ(count.unwrap()->to_string(), "count(6)");

	auto stepped = Count::create(0, 2);
	ASSERT_TRUE(stepped.is_ok());
	EXPECT_EQ(stepped.unwrap()->to_string(), "count(0, 2)");
}
