#include "Cycle.hpp"
#include "runtime/StopIteration.hpp"
#include "runtime/api.hpp"

namespace lazyiter {
namespace itertools {

	Cycle::Cycle(std::shared_ptr<Iterator> iterator) : m_iterator(std::move(iterator)) {}

	Result<std::shared_ptr<Cycle>> Cycle::create(const Value &iterable)
	{
		return lazyiter::iter(iterable).and_then(
			[](std::shared_ptr<Iterator> iterator) -> Result<std::shared_ptr<Cycle>> {
				spdlog::trace("itertools.cycle: created");
				return Ok(std::shared_ptr<Cycle>(new Cycle(std::move(iterator))));
			});
	}

	std::string Cycle::to_string() const
	{
		return fmt::format("<itertools.cycle object at {}>", static_cast<const void *>(this));
	}

	Result<Value> Cycle::next()
	{
		bool replaying = false;
		{
			std::shared_lock lock{ m_mutex };
			replaying = m_replaying;
		}

		if (!replaying) {
			auto value = m_iterator->next();
			if (value.is_ok()) {
				std::unique_lock lock{ m_mutex };
				m_saved.push_back(value.unwrap());
				return value;
			}
			if (!is_stop_iteration(value.unwrap_err())) { return value; }

			std::unique_lock lock{ m_mutex };
			if (!m_replaying) {
				spdlog::debug("itertools.cycle: source exhausted, replaying {} saved values",
					m_saved.size());
				m_replaying = true;
			}
		}

		std::unique_lock lock{ m_mutex };
		if (m_saved.empty()) { return Err(stop_iteration()); }

		const auto last_index = m_index;
		if (last_index >= m_saved.size() - 1) {
			m_index = 0;
		} else {
			++m_index;
		}
		return Ok(m_saved[last_index]);
	}

}// namespace itertools
}// namespace lazyiter
