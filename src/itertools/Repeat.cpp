#include "Repeat.hpp"
#include "config.hpp"
#include "runtime/Integer.hpp"
#include "runtime/OverflowError.hpp"
#include "runtime/StopIteration.hpp"
#include "runtime/TypeError.hpp"

namespace lazyiter {
namespace itertools {

	Repeat::Repeat(Value object, std::optional<size_t> times)
		: m_object(std::move(object)), m_times_remaining(std::move(times))
	{}

	Result<std::shared_ptr<Repeat>> Repeat::create(Value object)
	{
		spdlog::trace("itertools.repeat: created unbounded");
		return Ok(std::shared_ptr<Repeat>(new Repeat(std::move(object), std::nullopt)));
	}

	Result<std::shared_ptr<Repeat>> Repeat::create(Value object, BigIntType times)
	{
		if (times > Config::the().max_index) {
			return Err(overflow_error("Cannot fit in isize."));
		}
		if (times < 0) { times = 0; }
		spdlog::trace("itertools.repeat: created with times={}", times.get_str());
		return Ok(std::shared_ptr<Repeat>(new Repeat(std::move(object), times.get_ui())));
	}

	std::string Repeat::to_string() const
	{
		std::scoped_lock lock{ m_mutex };
		if (m_times_remaining.has_value()) {
			return fmt::format("repeat({}, {})", m_object->to_string(), *m_times_remaining);
		}
		return fmt::format("repeat({})", m_object->to_string());
	}

	Result<Value> Repeat::next()
	{
		std::scoped_lock lock{ m_mutex };
		if (m_times_remaining.has_value()) {
			if (*m_times_remaining == 0) { return Err(stop_iteration()); }
			--(*m_times_remaining);
		}
		return Ok(m_object);
	}

	Result<size_t> Repeat::length_hint() const
	{
		std::scoped_lock lock{ m_mutex };
		if (!m_times_remaining.has_value()) {
			return Err(type_error("length of unsized object."));
		}
		return Ok(*m_times_remaining);
	}

	std::vector<Value> Repeat::reduce() const
	{
		std::scoped_lock lock{ m_mutex };
		if (m_times_remaining.has_value()) {
			return { m_object, Integer::create(BigIntType{ *m_times_remaining }) };
		}
		return { m_object };
	}

}// namespace itertools
}// namespace lazyiter
