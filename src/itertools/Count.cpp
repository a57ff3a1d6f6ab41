#include "Count.hpp"
#include "runtime/Integer.hpp"

namespace lazyiter {
namespace itertools {

	Count::Count(BigIntType start, BigIntType step)
		: m_current(std::move(start)), m_step(std::move(step))
	{}

	Result<std::shared_ptr<Count>> Count::create() { return create(BigIntType{ 0 }, BigIntType{ 1 }); }

	Result<std::shared_ptr<Count>> Count::create(BigIntType start)
	{
		return create(std::move(start), BigIntType{ 1 });
	}

	Result<std::shared_ptr<Count>> Count::create(BigIntType start, BigIntType step)
	{
		spdlog::trace("itertools.count: created start={} step={}", start.get_str(), step.get_str());
		return Ok(std::shared_ptr<Count>(new Count(std::move(start), std::move(step))));
	}

	std::string Count::to_string() const
	{
		std::scoped_lock lock{ m_mutex };
		if (m_step == 1) { return fmt::format("count({})", m_current.get_str()); }
		return fmt::format("count({}, {})", m_current.get_str(), m_step.get_str());
	}

	Result<Value> Count::next()
	{
		std::scoped_lock lock{ m_mutex };
		auto to_return = Integer::create(m_current);
		m_current += m_step;
		return Ok(to_return);
	}

}// namespace itertools
}// namespace lazyiter
