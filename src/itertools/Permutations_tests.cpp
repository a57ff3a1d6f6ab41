#include "Permutations.hpp"
#include "testing/helpers.hpp"

#include "gtest/gtest.h"

using namespace lazyiter;
using namespace lazyiter::itertools;
using namespace lazyiter::test;

TEST(Permutations, AllOrderingsInIndexOrder)
{
	auto permutations = Permutations::create(str("ABC"));
	ASSERT_TRUE(permutations.is_ok());
	EXPECT_EQ(repr(collect(permutations.unwrap())),
		"[('A', 'B', 'C'), ('A', 'C', 'B'), ('B', 'A', 'C'), ('B', 'C', 'A'), ('C', 'A', 'B'), "
		"('C', 'B', 'A')]");
	EXPECT_TRUE(is_exhausted(permutations.unwrap()));
}

TEST(Permutations, PartialLength)
{
	auto permutations = Permutations::create(int_list({ 0, 1, 2 }), BigIntType{ 2 });
	ASSERT_TRUE(permutations.is_ok());
	EXPECT_EQ(repr(collect(permutations.unwrap())),
		"[(0, 1), (0, 2), (1, 0), (1, 2), (2, 0), (2, 1)]");
}

TEST(Permutations, CountMatchesFactorial)
{
	auto permutations = Permutations::create(int_list({ 1, 2, 3, 4, 5 }));
	ASSERT_TRUE(permutations.is_ok());
	EXPECT_EQ(collect(permutations.unwrap()).size(), size_t{ 120 });
}

TEST(Permutations, EdgeLengths)
{
	auto zero = Permutations::create(int_list({ 1, 2 }), BigIntType{ 0 });
	ASSERT_TRUE(zero.is_ok());
	EXPECT_EQ(repr(collect(zero.unwrap())), "[()]");

	auto too_long = Permutations::create(int_list({ 1, 2 }), BigIntType{ 3 });
	ASSERT_TRUE(too_long.is_ok());
	EXPECT_TRUE(is_exhausted(too_long.unwrap()));

	auto empty_pool = Permutations::create(int_list({}));
	ASSERT_TRUE(empty_pool.is_ok());
	EXPECT_EQ(repr(collect(empty_pool.unwrap())), "[()]");
}

TEST(Permutations, InvalidLength)
{
	auto negative = Permutations::create(int_list({ 1 }), BigIntType{ -1 });
	ASSERT_TRUE(negative.is_err());
	EXPECT_EQ(negative.unwrap_err()->what(), "ValueError: r must be non-negative");
}
