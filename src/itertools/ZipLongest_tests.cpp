#include "ZipLongest.hpp"
#include "testing/helpers.hpp"

#include "gtest/gtest.h"

using namespace lazyiter;
using namespace lazyiter::itertools;
using namespace lazyiter::test;

TEST(ZipLongest, FillsExhaustedSources)
{
	auto zip = ZipLongest::create({ int_list({ 1, 2, 3 }), int_list({ 1 }) }, Integer::create(0));
	ASSERT_TRUE(zip.is_ok());
	EXPECT_EQ(repr(collect(zip.unwrap())), "[(1, 1), (2, 0), (3, 0)]");
}

TEST(ZipLongest, DefaultFillValueIsNone)
{
	auto zip = ZipLongest::create({ str("AB"), str("x") });
	ASSERT_TRUE(zip.is_ok());
	EXPECT_EQ(repr(collect(zip.unwrap())), "[('A', 'x'), ('B', None)]");
}

TEST(ZipLongest, ExhaustedSourcesAreNotPulledAgain)
{
	auto short_source = CountingIterator::create(1);
	auto zip = ZipLongest::create({ short_source, int_list({ 1, 2, 3 }) });
	ASSERT_TRUE(zip.is_ok());
	EXPECT_EQ(collect(zip.unwrap()).size(), size_t{ 3 });
	EXPECT_TRUE(is_exhausted(zip.unwrap()));
	EXPECT_EQ(short_source->pulled(), 1);
}

TEST(ZipLongest, NoSources)
{
	auto zip = ZipLongest::create({});
	ASSERT_TRUE(zip.is_ok());
	EXPECT_TRUE(is_exhausted(zip.unwrap()));
}

TEST(ZipLongest, ErrorsAbandonTheStep)
{
	auto zip = ZipLongest::create({ int_list({ 1, 2 }), CountingIterator::create(2, 1) });
	ASSERT_TRUE(zip.is_ok());
	EXPECT_EQ(repr(take(zip.unwrap(), 1)), "[(1, 0)]");

	auto value = zip.unwrap()->next();
	ASSERT_TRUE(value.is_err());
	EXPECT_EQ(value.unwrap_err()->type_name(), "ValueError");
}

TEST(ZipLongest, NonIterableFailsAtConstruction)
{
	auto zip = ZipLongest::create({ int_list({ 1 }), Integer::create(1) });
	ASSERT_TRUE(zip.is_err());
	EXPECT_EQ(zip.unwrap_err()->type_name(), "TypeError");
}
