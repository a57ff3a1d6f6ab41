#include "ISlice.hpp"
#include "config.hpp"
#include "runtime/Integer.hpp"
#include "runtime/NoneType.hpp"
#include "runtime/StopIteration.hpp"
#include "runtime/ValueError.hpp"
#include "runtime/api.hpp"

#include <string_view>

namespace lazyiter {
namespace itertools {

	namespace {
		// Restricts parameter to integers with 0 <= value <= max_index, std::nullopt for None.
		Result<std::optional<size_t>>
			get_index(const Value &parameter, std::string_view name, size_t max_index)
		{
			if (!parameter || parameter == none()) { return Ok(std::optional<size_t>{}); }
			if (auto n = as<Integer>(parameter)) {
				if (n->as_big_int() >= 0 && n->as_big_int() <= max_index) {
					return Ok(std::optional<size_t>{ n->as_size_t() });
				}
			}
			return Err(value_error(
				"{} argument for islice() must be None or an integer: 0 <= x <= sys.maxsize.",
				name));
		}
	}// namespace

	ISlice::ISlice(std::shared_ptr<Iterator> iterator,
		size_t start,
		std::optional<size_t> stop,
		size_t step,
		size_t max_index)
		: m_iterator(std::move(iterator)), m_next(start), m_stop(stop), m_step(step),
		  m_max_index(max_index)
	{}

	Result<std::shared_ptr<ISlice>> ISlice::create(const Value &iterable, const Value &stop)
	{
		return ISlice::create(iterable, none(), stop, none());
	}

	Result<std::shared_ptr<ISlice>>
		ISlice::create(const Value &iterable, const Value &start, const Value &stop, const Value &step)
	{
		const auto max_index = Config::the().max_index;

		auto step_ = get_index(step, "Step", max_index);
		if (step_.is_err()) { return Err(step_.unwrap_err()); }
		if (step_.unwrap().value_or(1) == 0) {
			return Err(value_error("Step for islice() must be a positive integer or None."));
		}
		auto start_ = get_index(start, "Start", max_index);
		if (start_.is_err()) { return Err(start_.unwrap_err()); }
		auto stop_ = get_index(stop, "Stop", max_index);
		if (stop_.is_err()) { return Err(stop_.unwrap_err()); }

		auto iterator = lazyiter::iter(iterable);
		if (iterator.is_err()) { return Err(iterator.unwrap_err()); }

		spdlog::trace("itertools.islice: created start={} stop={} step={}",
			start_.unwrap().value_or(0),
			stop_.unwrap().has_value() ? std::to_string(*stop_.unwrap()) : "None",
			step_.unwrap().value_or(1));
		return Ok(std::shared_ptr<ISlice>(new ISlice(iterator.unwrap(),
			start_.unwrap().value_or(0),
			stop_.unwrap(),
			step_.unwrap().value_or(1),
			max_index)));
	}

	std::string ISlice::to_string() const
	{
		return fmt::format("<itertools.islice object at {}>", static_cast<const void *>(this));
	}

	Result<Value> ISlice::next()
	{
		while (m_current.load() < m_next.load()) {
			auto skipped = m_iterator->next();
			if (skipped.is_err()) { return skipped; }
			m_current.fetch_add(1);
		}

		if (m_stop.has_value() && m_current.load() >= *m_stop) { return Err(stop_iteration()); }

		auto value = m_iterator->next();
		if (value.is_err()) { return value; }
		m_current.fetch_add(1);

		const auto next = m_next.load();
		if (next > m_max_index - m_step) {
			// saturate instead of wrapping around
			m_next.store(m_stop.value_or(m_max_index));
		} else {
			m_next.store(next + m_step);
		}

		return value;
	}

}// namespace itertools
}// namespace lazyiter
