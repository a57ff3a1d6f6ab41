#pragma once

#include "Object.hpp"

namespace lazyiter {

class Range : public Object
{
	const BigIntType m_start{ 0 };
	const BigIntType m_stop;
	const BigIntType m_step{ 1 };

	Range(BigIntType start, BigIntType stop, BigIntType step);

  public:
	static Result<std::shared_ptr<Range>> create(BigIntType stop);
	static Result<std::shared_ptr<Range>> create(BigIntType start, BigIntType stop, BigIntType step);

	std::string type_name() const override { return "range"; }
	std::string to_string() const override;

	Result<bool> true_() const override;
	Result<std::shared_ptr<Iterator>> iter() override;

	const BigIntType &start() const { return m_start; }
	const BigIntType &stop() const { return m_stop; }
	const BigIntType &step() const { return m_step; }
};

class RangeIterator : public Iterator
{
	std::shared_ptr<const Range> m_range;
	BigIntType m_current;

	RangeIterator(std::shared_ptr<const Range> range);

  public:
	static std::shared_ptr<RangeIterator> create(std::shared_ptr<const Range> range);

	std::string type_name() const override { return "range_iterator"; }
	std::string to_string() const override;

	Result<Value> next() override;
};

}// namespace lazyiter
