#include "Range.hpp"
#include "Integer.hpp"
#include "StopIteration.hpp"
#include "ValueError.hpp"

namespace lazyiter {

Range::Range(BigIntType start, BigIntType stop, BigIntType step)
	: m_start(std::move(start)), m_stop(std::move(stop)), m_step(std::move(step))
{}

Result<std::shared_ptr<Range>> Range::create(BigIntType stop)
{
	return create(BigIntType{ 0 }, std::move(stop), BigIntType{ 1 });
}

Result<std::shared_ptr<Range>> Range::create(BigIntType start, BigIntType stop, BigIntType step)
{
	if (step == 0) { return Err(value_error("range() arg 3 must not be zero")); }
	return Ok(std::shared_ptr<Range>(new Range(std::move(start), std::move(stop), std::move(step))));
}

std::string Range::to_string() const
{
	if (m_step == 1) { return fmt::format("range({}, {})", m_start.get_str(), m_stop.get_str()); }
	return fmt::format(
		"range({}, {}, {})", m_start.get_str(), m_stop.get_str(), m_step.get_str());
}

Result<bool> Range::true_() const
{
	if (m_step > 0) { return Ok(m_start < m_stop); }
	return Ok(m_start > m_stop);
}

Result<std::shared_ptr<Iterator>> Range::iter()
{
	return Ok(RangeIterator::create(std::static_pointer_cast<const Range>(shared_from_this())));
}

RangeIterator::RangeIterator(std::shared_ptr<const Range> range)
	: m_range(std::move(range)), m_current(m_range->start())
{}

std::shared_ptr<RangeIterator> RangeIterator::create(std::shared_ptr<const Range> range)
{
	return std::shared_ptr<RangeIterator>(new RangeIterator(std::move(range)));
}

std::string RangeIterator::to_string() const
{
	return fmt::format("<range_iterator at {}>", static_cast<const void *>(this));
}

Result<Value> RangeIterator::next()
{
	const bool done =
		m_range->step() > 0 ? m_current >= m_range->stop() : m_current <= m_range->stop();
	if (done) { return Err(stop_iteration()); }
	auto result = Integer::create(m_current);
	m_current += m_range->step();
	return Ok(result);
}

}// namespace lazyiter
