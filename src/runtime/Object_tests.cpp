#include "Bool.hpp"
#include "Integer.hpp"
#include "List.hpp"
#include "NoneType.hpp"
#include "Range.hpp"
#include "String.hpp"
#include "Tuple.hpp"
#include "api.hpp"
#include "testing/helpers.hpp"

#include "gtest/gtest.h"

using namespace lazyiter;
using namespace lazyiter::test;

TEST(Integer, AddAndCompare)
{
	auto sum = add(Integer::create(40), Integer::create(2));
	ASSERT_TRUE(sum.is_ok());
	EXPECT_EQ(sum.unwrap()->to_string(), "42");

	auto same = equals(sum.unwrap(), Integer::create(42));
	ASSERT_TRUE(same.is_ok());
	EXPECT_TRUE(same.unwrap());

	auto with_bool = equals(Integer::create(1), true_value());
	ASSERT_TRUE(with_bool.is_ok());
	EXPECT_TRUE(with_bool.unwrap());
}

TEST(Integer, AddingUnrelatedTypeIsTypeError)
{
	auto sum = add(Integer::create(1), str("a"));
	ASSERT_TRUE(sum.is_err());
	EXPECT_EQ(sum.unwrap_err()->what(), "TypeError: unsupported operand type(s) for +: 'int' and 'str'");
}

TEST(Object, Truthiness)
{
	EXPECT_FALSE(truthy(none()).unwrap());
	EXPECT_FALSE(truthy(Integer::create(0)).unwrap());
	EXPECT_TRUE(truthy(Integer::create(-3)).unwrap());
	EXPECT_FALSE(truthy(str("")).unwrap());
	EXPECT_TRUE(truthy(int_list({ 0 })).unwrap());
	EXPECT_FALSE(truthy(Tuple::create()).unwrap());
}

TEST(Object, NotIterableOrCallable)
{
	auto iterator = iter(Integer::create(1));
	ASSERT_TRUE(iterator.is_err());
	EXPECT_EQ(iterator.unwrap_err()->what(), "TypeError: 'int' object is not iterable");

	auto result = call(str("f"), {});
	ASSERT_TRUE(result.is_err());
	EXPECT_EQ(result.unwrap_err()->type_name(), "TypeError");
}

TEST(Tuple, ReprAndEquality)
{
	EXPECT_EQ(Tuple::create()->to_string(), "()");
	EXPECT_EQ(Tuple::create(Integer::create(1))->to_string(), "(1,)");
	EXPECT_EQ(Tuple::create(str("a"), none())->to_string(), "('a', None)");

	auto lhs = Tuple::create(Integer::create(1), str("b"));
	auto rhs = Tuple::create(Integer::create(1), str("b"));
	auto same = equals(lhs, rhs);
	ASSERT_TRUE(same.is_ok());
	EXPECT_TRUE(same.unwrap());

	auto different = equals(lhs, Tuple::create(Integer::create(1)));
	ASSERT_TRUE(different.is_ok());
	EXPECT_FALSE(different.unwrap());
}

TEST(Range, IteratesWithStep)
{
	auto range = Range::create(10, 0, -3);
	ASSERT_TRUE(range.is_ok());
	auto iterator = iter(range.unwrap());
	ASSERT_TRUE(iterator.is_ok());
	EXPECT_EQ(to_ints(collect(iterator.unwrap())), (std::vector<int64_t>{ 10, 7, 4, 1 }));

	auto zero_step = Range::create(0, 10, 0);
	ASSERT_TRUE(zero_step.is_err());
	EXPECT_EQ(zero_step.unwrap_err()->type_name(), "ValueError");
}

TEST(Iterator, IterReturnsItself)
{
	auto iterator = iter(int_list({ 1 }));
	ASSERT_TRUE(iterator.is_ok());
	auto again = iter(iterator.unwrap());
	ASSERT_TRUE(again.is_ok());
	EXPECT_EQ(again.unwrap(), iterator.unwrap());
}

TEST(ExtractElements, ForwardsErrors)
{
	auto elements = extract_elements(str("abc"));
	ASSERT_TRUE(elements.is_ok());
	EXPECT_EQ(repr(elements.unwrap()), "['a', 'b', 'c']");

	auto failing = extract_elements(CountingIterator::create(5, 2));
	ASSERT_TRUE(failing.is_err());
	EXPECT_EQ(failing.unwrap_err()->what(), "ValueError: failed at 2");
}

TEST(NativeFunction, ForwardsArguments)
{
	auto first = function("first", [](const std::vector<Value> &args) -> Result<Value> {
		if (args.empty()) { return Ok(none()); }
		return Ok(args[0]);
	});
	auto result = call(first, { str("x"), str("y") });
	ASSERT_TRUE(result.is_ok());
	EXPECT_EQ(result.unwrap()->to_string(), "'x'");
}
